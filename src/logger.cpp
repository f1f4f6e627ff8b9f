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

#include "swarmgate/logger.hpp"
#include "swarmgate/time.hpp"

#include <cstdarg>

namespace swarmgate {

	char const* module_name(log_module const m)
	{
		static char const* names[] =
		{
			"ban_list",
			"admission",
			"rate_limit",
			"http",
			"udp",
			"websocket",
			"swarm",
			"gateway",
		};
		static_assert(sizeof(names) / sizeof(names[0])
			== std::size_t(log_module::num_modules), "module name table out of sync");
		auto const idx = std::size_t(m);
		if (idx >= sizeof(names) / sizeof(names[0])) return "";
		return names[idx];
	}

#ifndef SWARMGATE_DISABLE_LOGGING

	stderr_logger::stderr_logger(FILE* out)
		: m_out(out)
		, m_enabled(0xffffffff)
	{}

	void stderr_logger::set_enabled(log_module const m, bool const enabled)
	{
		std::uint32_t const bit = 1u << std::uint32_t(m);
		if (enabled) m_enabled.fetch_or(bit);
		else m_enabled.fetch_and(~bit);
	}

	bool stderr_logger::should_log(log_module const m) const
	{
		return (m_enabled & (1u << std::uint32_t(m))) != 0;
	}

	void stderr_logger::log(log_module const m, char const* fmt, ...)
	{
		if (!should_log(m)) return;

		char buf[1024];
		va_list v;
		va_start(v, fmt);
		std::vsnprintf(buf, sizeof(buf), fmt, v);
		va_end(v);

		std::lock_guard<std::mutex> l(m_mutex);
		std::fprintf(m_out, "%s [%s] %s\n", time_now_string().c_str()
			, module_name(m), buf);
		std::fflush(m_out);
	}

#endif
}
