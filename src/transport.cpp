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

#include "swarmgate/transport.hpp"

#include <cstdarg>
#include <cstdio>

namespace swarmgate {

	char const* state_name(transport_state const s)
	{
		switch (s)
		{
			case transport_state::not_started: return "not_started";
			case transport_state::running: return "running";
			case transport_state::stopped: return "stopped";
		}
		return "";
	}

namespace aux {

	transport_base::transport_base(transport_context const& ctx)
		: m_ctx(ctx)
	{}

	void transport_base::start(std::string const& listen_interface, int const port
		, error_code& ec)
	{
		std::lock_guard<std::mutex> l(m_mutex);
		switch (m_state.load())
		{
			case transport_state::running:
				ec = errors::transport_already_started;
				return;
			case transport_state::stopped:
				ec = errors::transport_stopped;
				return;
			case transport_state::not_started:
				break;
		}

		if (port < 0 || port > 0xffff)
		{
			ec = errors::invalid_setting_value;
			return;
		}

		boost::system::error_code e;
		address const bind_addr = make_address(listen_interface, e);
		if (e)
		{
			ec = errors::invalid_ip_address;
			return;
		}

		int const bound = open(bind_addr, port, ec);
		if (ec)
		{
#ifndef SWARMGATE_DISABLE_LOGGING
			log("failed to listen on %s:%d: %s", listen_interface.c_str(), port
				, ec.message().c_str());
#endif
			return;
		}

		m_listen_port = bound;
		m_state = transport_state::running;

#ifndef SWARMGATE_DISABLE_LOGGING
		log("%s transport listening on %s:%d", name(), listen_interface.c_str(), bound);
#endif
	}

	void transport_base::stop(error_code& ec)
	{
		std::lock_guard<std::mutex> l(m_mutex);
		if (m_state != transport_state::running) return;

		// the transport is stopped even if releasing its resources failed
		m_state = transport_state::stopped;
		m_listen_port = 0;
		close(ec);

#ifndef SWARMGATE_DISABLE_LOGGING
		if (ec) log("%s transport stopped with error: %s", name(), ec.message().c_str());
		else log("%s transport stopped", name());
#endif
	}

#ifndef SWARMGATE_DISABLE_LOGGING
	bool transport_base::should_log() const
	{
		return m_ctx.log && m_ctx.log->should_log(module());
	}

	void transport_base::log(char const* fmt, ...) const
	{
		if (!should_log()) return;
		char buf[1024];
		va_list v;
		va_start(v, fmt);
		std::vsnprintf(buf, sizeof(buf), fmt, v);
		va_end(v);
		m_ctx.log->log(module(), "%s", buf);
	}
#endif
}
}
