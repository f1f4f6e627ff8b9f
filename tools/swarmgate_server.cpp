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

#include "swarmgate/ban_range.hpp"
#include "swarmgate/gateway.hpp"
#include "swarmgate/logger.hpp"
#include "swarmgate/settings_pack.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <string>
#include <thread>
#include <vector>

using sg::settings_pack;

namespace {

std::atomic<bool> quit(false);

void signal_handler(int)
{
	// make the main loop terminate
	quit = true;
}

void print_settings(int const start, int const num
	, char const* const fmt)
{
	for (int i = start; i < start + num; ++i)
	{
		char const* name = sg::name_for_setting(i);
		if (!name || name[0] == '\0') continue;
		std::printf(fmt, name);
	}
}

void assign_setting(settings_pack& settings, std::string const& key
	, std::string const& value)
{
	sg::error_code ec;
	sg::apply_setting(settings, key, value, ec);
	if (!ec) return;
	std::fprintf(stderr, "invalid setting \"%s=%s\": %s\n", key.c_str()
		, value.c_str(), ec.message().c_str());
	std::exit(1);
}

// the environment variables of earlier deployments, and the settings
// they map to
struct env_setting
{
	char const* env;
	char const* setting;
};

env_setting const legacy_env[] = {
	{"PORT", "http_port"},
	{"UDP", "enable_udp"},
	{"UDP_PORT", "udp_port"},
	{"WS", "enable_websocket"},
	{"WS_PORT", "websocket_port"},
	{"ANNOUNCE_INTERVAL", "announce_interval"},
	{"TRUST_PROXY", "trust_proxy"},
	{"STATS", "enable_stats"},
};

void load_environment(settings_pack& settings)
{
	for (auto const& e : legacy_env)
	{
		char const* value = std::getenv(e.env);
		if (value == nullptr || value[0] == '\0') continue;
		assign_setting(settings, e.setting, value);
	}
}

// reads one ban range per line. Empty lines and lines starting with #
// are ignored
bool load_ban_list(char const* path, std::vector<sg::ban_range>& out)
{
	std::ifstream f(path);
	if (!f)
	{
		std::fprintf(stderr, "failed to open ban list \"%s\"\n", path);
		return false;
	}

	std::string line;
	int line_number = 0;
	while (std::getline(f, line))
	{
		++line_number;
		if (line.empty() || line[0] == '#') continue;
		sg::error_code ec;
		sg::ban_range r = sg::parse_ban_range(line, ec);
		if (ec)
		{
			std::fprintf(stderr, "%s:%d: %s\n", path, line_number, ec.message().c_str());
			continue;
		}
		out.push_back(std::move(r));
	}
	return true;
}

[[noreturn]] void usage()
{
	std::fprintf(stderr, R"(usage: swarmgate_server [OPTIONS]
OPTIONS:
  -x <file>             loads ban ranges from the given file, one per line.
                        Each line is an IP, a range (a.b.c.d-e.f.g.h) or a
                        CIDR block, optionally followed by a reason
  -q                    don't log anything
  -h                    print this message

  --list-settings       print all settings and exit
  --<name>=<value>      set the setting <name> to <value>

ENVIRONMENT:
  PORT, UDP, UDP_PORT, WS, WS_PORT, ANNOUNCE_INTERVAL, TRUST_PROXY, STATS
  are read before the command line, which takes precedence
)");
	std::exit(1);
}

} // anonymous namespace

int main(int argc, char* argv[])
{
	settings_pack settings;
	load_environment(settings);

	std::vector<sg::ban_range> bans;
	bool quiet = false;

	for (int i = 1; i < argc; ++i)
	{
		if (argv[i][0] != '-') usage();

		if (std::strcmp(argv[i], "--list-settings") == 0)
		{
			print_settings(settings_pack::string_type_base
				, settings_pack::num_string_settings
				, "%s=<string>\n");
			print_settings(settings_pack::bool_type_base
				, settings_pack::num_bool_settings
				, "%s=<bool>\n");
			print_settings(settings_pack::int_type_base
				, settings_pack::num_int_settings
				, "%s=<int>\n");
			return 0;
		}

		// maybe this is an assignment of a setting
		if (argv[i][1] == '-' && std::strchr(argv[i], '=') != nullptr)
		{
			char const* equal = std::strchr(argv[i], '=');
			// +2 is to skip the --
			char const* start = argv[i] + 2;
			assign_setting(settings, std::string(start, std::size_t(equal - start)), equal + 1);
			continue;
		}

		switch (argv[i][1])
		{
			case 'q': quiet = true; break;
			case 'x':
				if (i + 1 >= argc) usage();
				if (!load_ban_list(argv[++i], bans)) return 1;
				break;
			default: usage();
		}
	}

#ifndef SWARMGATE_DISABLE_LOGGING
	sg::stderr_logger log;
#endif

	sg::gateway_params params(settings);
#ifndef SWARMGATE_DISABLE_LOGGING
	if (!quiet) params.logger = &log;
#else
	SWARMGATE_UNUSED(quiet);
#endif

	try
	{
		sg::gateway gw(std::move(params));

		if (!bans.empty())
		{
			int const added = gw.ban_ranges().bulk_create(bans);
			std::printf("loaded %d of %d ban ranges\n", added, int(bans.size()));
		}

		std::signal(SIGTERM, signal_handler);
		std::signal(SIGINT, signal_handler);

		gw.start();

		for (auto* t : gw.transports())
			std::printf("%s listening on port %d\n", t->name(), t->listen_port());
		std::fflush(stdout);

		while (!quit)
			std::this_thread::sleep_for(std::chrono::milliseconds(200));

		std::printf("shutting down\n");
		std::vector<sg::error_code> const errors = gw.stop();
		for (auto const& ec : errors)
			std::fprintf(stderr, "shutdown error: %s\n", ec.message().c_str());
		return errors.empty() ? 0 : 1;
	}
	catch (sg::system_error const& e)
	{
		std::fprintf(stderr, "%s\n", e.what());
		return 1;
	}
}
