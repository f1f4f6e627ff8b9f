/*

Copyright (c) 2026, the swarmgate authors
All rights reserved.

Redistribution and use in source and binary forms, with or without
modification, are permitted provided that the following conditions
are met:

    * Redistributions of source code must retain the above copyright
      notice, this list of conditions and the following disclaimer.
    * Redistributions in binary form must reproduce the above copyright
      notice, this list of conditions and the following disclaimer in
      the documentation and/or other materials provided with the distribution.
    * Neither the name of the author nor the names of its
      contributors may be used to endorse or promote products derived
      from this software without specific prior written permission.

THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS "AS IS"
AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE
IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE
ARE DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT OWNER OR CONTRIBUTORS BE
LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR
CONSEQUENTIAL DAMAGES (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF
SUBSTITUTE GOODS OR SERVICES; LOSS OF USE, DATA, OR PROFITS; OR BUSINESS
INTERRUPTION) HOWEVER CAUSED AND ON ANY THEORY OF LIABILITY, WHETHER IN
CONTRACT, STRICT LIABILITY, OR TORT (INCLUDING NEGLIGENCE OR OTHERWISE)
ARISING IN ANY WAY OUT OF THE USE OF THIS SOFTWARE, EVEN IF ADVISED OF THE
POSSIBILITY OF SUCH DAMAGE.

*/

#include <boost/system/system_error.hpp>

#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <exception>
#include <set>
#include <string>

#include <unistd.h> // for dup() and dup2()

#include "test.hpp"
#include "swarmgate/random.hpp"

using namespace unit_test;

namespace {

// the output of the running test. It is only shown if the test fails, or
// the process dies while it runs
struct captured_output
{
	captured_output()
	{
		std::fflush(stdout);
		m_file = std::tmpfile();
		if (m_file == nullptr) return;
		m_saved_stdout = dup(fileno(stdout));
		if (m_saved_stdout == -1 || dup2(fileno(m_file), fileno(stdout)) == -1)
		{
			std::fclose(m_file);
			m_file = nullptr;
		}
	}

	~captured_output()
	{
		restore();
		if (m_file != nullptr) std::fclose(m_file);
	}

	captured_output(captured_output const&) = delete;
	captured_output& operator=(captured_output const&) = delete;

	// puts stdout back, and copies what was captured to it
	void dump(char const* name)
	{
		restore();
		if (m_file == nullptr) return;
		std::printf("\x1b[1m[%s]\x1b[0m\n\n", name);
		std::rewind(m_file);
		char buf[4096];
		std::size_t n;
		while ((n = std::fread(buf, 1, sizeof(buf), m_file)) > 0)
			std::fwrite(buf, 1, n, stdout);
		std::fflush(stdout);
	}

private:

	void restore()
	{
		if (m_saved_stdout == -1) return;
		std::fflush(stdout);
		dup2(m_saved_stdout, fileno(stdout));
		close(m_saved_stdout);
		m_saved_stdout = -1;
	}

	FILE* m_file = nullptr;
	int m_saved_stdout = -1;
};

captured_output* current_output = nullptr;
char const* current_name = "";

void dump_current_output()
{
	if (current_output != nullptr) current_output->dump(current_name);
}

[[noreturn]] void sig_handler(int const sig)
{
	std::fprintf(stderr, "signal %d (%s) caught in %s\n", sig
		, strsignal(sig), current_name);
	dump_current_output();
	std::_Exit(128 + sig);
}

[[noreturn]] void term_handler()
{
	std::fprintf(stderr, "terminate called in %s\n", current_name);
	dump_current_output();
	std::_Exit(1);
}

void print_usage(char const* executable)
{
	std::printf("%s [options] [tests...]\n"
		"\n"
		"OPTIONS:\n"
		"-h,--help            show this help\n"
		"-l,--list            list the tests in this executable\n"
		"-n,--no-redirect     print test output as it happens instead of\n"
		"                     only for failing tests\n"
		"\n"
		"tests are named as printed by -l. Without any, every test is run\n"
		, executable);
}

void run_one(unit_test_t& t)
{
	g_test_failures = 0;
	try
	{
		(*t.fun)();
	}
	catch (boost::system::system_error const& e)
	{
		std::string const msg = "TEST_ERROR: Terminated with system_error: ["
			+ std::string(e.code().category().name()) + ":"
			+ std::to_string(e.code().value()) + "] " + e.code().message();
		report_failure(msg.c_str(), __FILE__, __LINE__);
	}
	catch (std::exception const& e)
	{
		std::string const msg = std::string("TEST_ERROR: Terminated with exception: ")
			+ e.what();
		report_failure(msg.c_str(), __FILE__, __LINE__);
	}
	t.num_failures = g_test_failures;
	t.run = true;
}

} // anonymous namespace

int main(int argc, char const* argv[])
{
	char const* executable = argv[0];
	bool redirect = true;
	std::set<std::string> selected;

	for (int i = 1; i < argc; ++i)
	{
		std::string const arg = argv[i];
		if (arg == "-h" || arg == "--help")
		{
			print_usage(executable);
			return 0;
		}
		if (arg == "-l" || arg == "--list")
		{
			for (int k = 0; k < g_num_unit_tests; ++k)
				std::printf("%s\n", g_unit_tests[k].name);
			return 0;
		}
		if (arg == "-n" || arg == "--no-redirect")
		{
			redirect = false;
			continue;
		}
		if (arg[0] == '-')
		{
			print_usage(executable);
			return 1;
		}
		selected.insert(arg);
	}

	std::set_terminate(term_handler);
	for (int const sig : {SIGSEGV, SIGILL, SIGABRT, SIGFPE, SIGINT, SIGTERM})
		std::signal(sig, &sig_handler);
	// writes to closed sockets must surface as errors, not kill the test
	std::signal(SIGPIPE, SIG_IGN);

	std::printf("test: %s seed: %x\n", executable
		, unsigned(sg::aux::random(0xffffffff)));

	if (g_num_unit_tests == 0)
	{
		std::printf("\x1b[31mTEST_ERROR: no unit tests registered\x1b[0m\n");
		return 1;
	}

	bool const filter = !selected.empty();
	for (int i = 0; i < g_num_unit_tests; ++i)
	{
		unit_test_t& t = g_unit_tests[i];
		if (filter && selected.erase(t.name) == 0) continue;

		g_test_idx = i;
		current_name = t.name;

		if (!redirect)
		{
			run_one(t);
			continue;
		}

		captured_output out;
		current_output = &out;
		run_one(t);
		if (t.num_failures > 0) out.dump(t.name);
		current_output = nullptr;
	}

	for (auto const& name : selected)
	{
		std::printf("\x1b[31mTEST_ERROR: no test named \"%s\"\x1b[0m\n", name.c_str());
		return 1;
	}

	return print_failures() == 0 ? 0 : 1;
}
