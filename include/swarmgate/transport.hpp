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

#ifndef SWARMGATE_TRANSPORT_HPP_INCLUDED
#define SWARMGATE_TRANSPORT_HPP_INCLUDED

#include "swarmgate/config.hpp"
#include "swarmgate/address.hpp"
#include "swarmgate/error_code.hpp"
#include "swarmgate/logger.hpp"

#include <atomic>
#include <cstdint>
#include <mutex>
#include <string>

namespace swarmgate {

	class rate_limit_chain;
	struct settings_pack;
	struct swarm_interface;

	// transports move through these states in order, and never back
	enum class transport_state : std::uint8_t
	{
		not_started,
		running,
		stopped
	};

	SWARMGATE_EXPORT char const* state_name(transport_state s);

	// A wire protocol front end. It owns its listen socket and translates
	// its framing into tracker_requests for the shared swarm engine.
	//
	// start() binds and begins accepting. It fails with
	// transport_already_started on a running transport and with
	// transport_stopped on a stopped one. stop() releases the listen socket
	// and closes open sessions. stop() on a transport that never started, or
	// that is already stopped, does nothing.
	struct SWARMGATE_EXPORT transport
	{
		virtual char const* name() const = 0;

		virtual void start(std::string const& listen_interface, int port
			, error_code& ec) = 0;
		virtual void stop(error_code& ec) = 0;

		virtual transport_state state() const = 0;

		// the bound port, which differs from the requested one when that
		// was 0. 0 when not running
		virtual int listen_port() const = 0;

		virtual ~transport() = default;
	};

	// the gateway components a transport forwards requests to. All
	// referenced objects outlive the transport
	struct transport_context
	{
		swarm_interface& swarm;
		rate_limit_chain& rate_limits;
		settings_pack const& settings;
		gateway_logger* log;
	};

namespace aux {

	// implements the state machine of transport. Subclasses implement
	// open() and close(), which are called with m_mutex held
	struct SWARMGATE_EXTRA_EXPORT transport_base : transport
	{
		explicit transport_base(transport_context const& ctx);

		void start(std::string const& listen_interface, int port
			, error_code& ec) final;
		void stop(error_code& ec) final;
		transport_state state() const final { return m_state; }
		int listen_port() const final { return m_listen_port; }

	protected:

		// binds the listen socket. Returns the bound port, or sets ec
		virtual int open(address const& bind_addr, int port, error_code& ec) = 0;
		virtual void close(error_code& ec) = 0;

		bool is_running() const { return m_state == transport_state::running; }

#ifndef SWARMGATE_DISABLE_LOGGING
		bool should_log() const;
		void log(char const* fmt, ...) const SWARMGATE_FORMAT(2,3);
		virtual log_module module() const = 0;
#endif

		transport_context m_ctx;

		// guards the listen socket and the state transitions. Completion
		// handlers take it before touching the listen socket
		mutable std::mutex m_mutex;

	private:
		std::atomic<transport_state> m_state{transport_state::not_started};
		std::atomic<int> m_listen_port{0};
	};
}
}

#endif
