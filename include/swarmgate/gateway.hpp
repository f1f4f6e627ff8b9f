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

#ifndef SWARMGATE_GATEWAY_HPP_INCLUDED
#define SWARMGATE_GATEWAY_HPP_INCLUDED

#include "swarmgate/config.hpp"
#include "swarmgate/admission_filter.hpp"
#include "swarmgate/ban_range_index.hpp"
#include "swarmgate/ban_range_store.hpp"
#include "swarmgate/error_code.hpp"
#include "swarmgate/logger.hpp"
#include "swarmgate/rate_limit.hpp"
#include "swarmgate/settings_pack.hpp"
#include "swarmgate/swarm.hpp"
#include "swarmgate/transport.hpp"

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/optional.hpp>

#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace swarmgate {

	// everything a gateway is constructed from
	struct SWARMGATE_EXPORT gateway_params
	{
		gateway_params() = default;
		explicit gateway_params(settings_pack s) : settings(std::move(s)) {}

		settings_pack settings;

		// where ban ranges are persisted. If null, ranges are kept in memory
		std::shared_ptr<ban_range_backend> backend;

		// builds the swarm engine. If empty, a memory_swarm is used
		swarm_factory swarm;

		// may be null. Must outlive the gateway
		gateway_logger* logger = nullptr;
	};

	// The ``gateway`` owns the ban list, the admission filter, the swarm
	// engine, the rate limit chain and the transports, and ties them
	// together. The admission filter is installed as the filter hook of the
	// swarm engine, and every transport forwards its requests to that
	// engine.
	//
	// The HTTP transport is always built. UDP and WebSocket are built when
	// enable_udp and enable_websocket are set.
	class SWARMGATE_EXPORT gateway
	{
	public:

		explicit gateway(gateway_params params);

		// stops the gateway if it is running
		~gateway();

		gateway(gateway const&) = delete;
		gateway& operator=(gateway const&) = delete;

		// starts the network threads and every transport. If a transport
		// fails to start, the ones already started are stopped again and
		// system_error(transport_startup_failed) is thrown
		void start();

		// stops the transports in the reverse order they were started, then
		// the network threads. Returns the errors of the transports that
		// failed to stop cleanly. Calling stop() on a gateway that is not
		// running does nothing. A stopped gateway cannot be started again
		std::vector<error_code> stop();

		bool is_running() const;

		// the administrative interface to the ban list
		ban_range_store& ban_ranges() { return m_store; }
		ban_range_index const& ban_index() const { return m_index; }

		admission_filter& filter() { return m_filter; }
		rate_limit_chain& rate_limits() { return m_rate_limits; }
		swarm_interface& swarm() { return *m_swarm; }
		settings_pack const& settings() const { return m_settings; }

		// returns nullptr if there is no transport by this name
		transport* find_transport(std::string const& name) const;

		// the transports, in start order
		std::vector<transport*> transports() const;

	private:

		struct transport_entry
		{
			std::shared_ptr<transport> t;
			int port;
		};

		void start_maintenance_timer();
		void on_maintenance(error_code const& ec);

		std::vector<error_code> stop_transports();
		void stop_threads();

#ifndef SWARMGATE_DISABLE_LOGGING
		bool should_log() const;
		void log(char const* fmt, ...) const SWARMGATE_FORMAT(2,3);
#endif

		settings_pack const m_settings;
		gateway_logger* m_log;

		ban_range_index m_index;
		ban_range_store m_store;
		admission_filter m_filter;
		rate_limit_chain m_rate_limits;
		std::unique_ptr<swarm_interface> m_swarm;

		boost::asio::io_context m_ioc;
		boost::optional<boost::asio::executor_work_guard<
			boost::asio::io_context::executor_type>> m_work;

		// runs on its own strand
		boost::asio::steady_timer m_maintenance_timer;

		std::vector<transport_entry> m_transports;
		std::vector<std::thread> m_threads;

		// serializes start() and stop()
		mutable std::mutex m_mutex;
		bool m_running = false;
	};
}

#endif
