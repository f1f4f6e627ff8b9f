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

#ifndef SWARMGATE_LOGGER_HPP_INCLUDED
#define SWARMGATE_LOGGER_HPP_INCLUDED

#include "swarmgate/config.hpp"

#include <atomic>
#include <cstdint>
#include <cstdio>
#include <mutex>

namespace swarmgate {

	enum class log_module : std::uint8_t
	{
		ban_list,
		admission,
		rate_limit,
		http,
		udp,
		websocket,
		swarm,
		gateway,

		num_modules
	};

	SWARMGATE_EXPORT char const* module_name(log_module m);

	// the logging interface every component reports through. A null logger
	// pointer means nothing is logged. Implementations must be safe to call
	// from all network threads concurrently.
	struct SWARMGATE_EXPORT gateway_logger
	{
#ifndef SWARMGATE_DISABLE_LOGGING
		virtual bool should_log(log_module m) const = 0;
		virtual void log(log_module m, char const* fmt, ...) SWARMGATE_FORMAT(3,4) = 0;
#endif

	protected:
		~gateway_logger() = default;
	};

#ifndef SWARMGATE_DISABLE_LOGGING

	// writes one line per message to a FILE* (stderr by default), prefixed
	// with the time and the module name. Modules can be switched off
	// individually
	struct SWARMGATE_EXPORT stderr_logger final : gateway_logger
	{
		explicit stderr_logger(FILE* out = stderr);

		void set_enabled(log_module m, bool enabled);

		bool should_log(log_module m) const override;
		void log(log_module m, char const* fmt, ...) override SWARMGATE_FORMAT(3,4);

	private:
		FILE* m_out;
		std::atomic<std::uint32_t> m_enabled;
		std::mutex m_mutex;
	};

#endif
}

#endif
