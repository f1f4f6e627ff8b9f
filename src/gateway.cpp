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

#include "swarmgate/gateway.hpp"
#include "swarmgate/http_transport.hpp"
#include "swarmgate/udp_transport.hpp"
#include "swarmgate/websocket_transport.hpp"

#include <boost/asio/post.hpp>
#include <boost/asio/strand.hpp>

#include <algorithm>
#include <cstdarg>
#include <cstdio>
#include <functional>
#include <iterator>

namespace swarmgate {

using namespace std::placeholders;

namespace {

	swarm_factory default_swarm(swarm_factory f)
	{
		if (f) return f;
		return &make_memory_swarm;
	}
}

	gateway::gateway(gateway_params params)
		: m_settings(std::move(params.settings))
		, m_log(params.logger)
		, m_store(std::move(params.backend), m_index, params.logger)
		, m_filter(m_index, params.logger)
		, m_rate_limits(params.logger)
		, m_maintenance_timer(boost::asio::make_strand(m_ioc))
	{
		m_store.refresh();

		// the swarm engine asks the admission filter before it touches any
		// state
		admission_filter const& filter = m_filter;
		m_swarm = default_swarm(std::move(params.swarm))(m_settings
			, [&filter](std::string const& info_hash, tracker_request const& req
				, address const& client)
			{ return filter.evaluate(info_hash, req, client); }
			, m_log);
		if (!m_swarm)
			aux::throw_ex<system_error>(error_code(errors::transport_startup_failed)
				, "swarm factory returned no engine");

		add_default_policies(m_rate_limits, m_settings);

		transport_context const ctx{*m_swarm, m_rate_limits, m_settings, m_log};

		m_transports.push_back({std::make_shared<http_transport>(m_ioc, ctx)
			, m_settings.get_int(settings_pack::http_port)});
		if (m_settings.get_bool(settings_pack::enable_udp))
		{
			m_transports.push_back({std::make_shared<udp_transport>(m_ioc, ctx)
				, m_settings.get_int(settings_pack::udp_port)});
		}
		if (m_settings.get_bool(settings_pack::enable_websocket))
		{
			m_transports.push_back({std::make_shared<websocket_transport>(m_ioc, ctx)
				, m_settings.get_int(settings_pack::websocket_port)});
		}

#ifndef SWARMGATE_DISABLE_LOGGING
		log("gateway constructed with %d ban ranges and %d transports"
			, m_store.count(), int(m_transports.size()));
#endif
	}

	gateway::~gateway()
	{
		stop();
	}

	void gateway::start()
	{
		std::lock_guard<std::mutex> l(m_mutex);
		if (m_running)
			aux::throw_ex<system_error>(error_code(errors::transport_already_started));

		std::string const& iface = m_settings.get_str(settings_pack::listen_interface);

		for (auto i = m_transports.begin(); i != m_transports.end(); ++i)
		{
			error_code ec;
			i->t->start(iface, i->port, ec);
			if (!ec) continue;

#ifndef SWARMGATE_DISABLE_LOGGING
			log("failed to start %s transport on port %d: %s", i->t->name()
				, i->port, ec.message().c_str());
#endif
			// take down what was already started, newest first
			for (auto j = std::make_reverse_iterator(i); j != m_transports.rend(); ++j)
			{
				error_code ignore;
				j->t->stop(ignore);
			}
			aux::throw_ex<system_error>(error_code(errors::transport_startup_failed)
				, std::string(i->t->name()) + ": " + ec.message());
		}

		m_work.emplace(boost::asio::make_work_guard(m_ioc));
		int const num_threads = std::max(1, m_settings.get_int(settings_pack::network_threads));
		for (int k = 0; k < num_threads; ++k)
			m_threads.emplace_back([this] { m_ioc.run(); });

		boost::asio::post(m_maintenance_timer.get_executor()
			, std::bind(&gateway::start_maintenance_timer, this));

		m_running = true;

#ifndef SWARMGATE_DISABLE_LOGGING
		log("gateway started on %d network threads", num_threads);
#endif
	}

	std::vector<error_code> gateway::stop()
	{
		std::lock_guard<std::mutex> l(m_mutex);
		if (!m_running) return {};
		m_running = false;

		std::vector<error_code> ret = stop_transports();
		stop_threads();

#ifndef SWARMGATE_DISABLE_LOGGING
		log("gateway stopped (%d transport errors)", int(ret.size()));
#endif
		return ret;
	}

	std::vector<error_code> gateway::stop_transports()
	{
		std::vector<error_code> ret;
		for (auto i = m_transports.rbegin(); i != m_transports.rend(); ++i)
		{
			error_code ec;
			i->t->stop(ec);
			if (!ec) continue;
#ifndef SWARMGATE_DISABLE_LOGGING
			log("failed to stop %s transport: %s", i->t->name(), ec.message().c_str());
#endif
			ret.push_back(ec);
		}
		return ret;
	}

	void gateway::stop_threads()
	{
		// handlers still queued, including the maintenance timer, are
		// destroyed with the io_context
		m_work.reset();
		m_ioc.stop();
		for (auto& t : m_threads) t.join();
		m_threads.clear();
	}

	bool gateway::is_running() const
	{
		std::lock_guard<std::mutex> l(m_mutex);
		return m_running;
	}

	void gateway::start_maintenance_timer()
	{
		m_maintenance_timer.expires_after(seconds(std::max(1
			, m_settings.get_int(settings_pack::maintenance_interval))));
		m_maintenance_timer.async_wait(std::bind(&gateway::on_maintenance, this, _1));
	}

	void gateway::on_maintenance(error_code const& ec)
	{
		if (ec) return;

		time_point const now = clock_type::now();
		int const evicted = m_rate_limits.evict_expired(now);
		m_swarm->purge_stale(now);

#ifndef SWARMGATE_DISABLE_LOGGING
		if (evicted > 0) log("evicted %d rate limit windows", evicted);
#else
		SWARMGATE_UNUSED(evicted);
#endif
		start_maintenance_timer();
	}

	transport* gateway::find_transport(std::string const& name) const
	{
		for (auto const& e : m_transports)
			if (name == e.t->name()) return e.t.get();
		return nullptr;
	}

	std::vector<transport*> gateway::transports() const
	{
		std::vector<transport*> ret;
		for (auto const& e : m_transports) ret.push_back(e.t.get());
		return ret;
	}

#ifndef SWARMGATE_DISABLE_LOGGING
	bool gateway::should_log() const
	{
		return m_log && m_log->should_log(log_module::gateway);
	}

	void gateway::log(char const* fmt, ...) const
	{
		if (!should_log()) return;
		char buf[512];
		va_list v;
		va_start(v, fmt);
		std::vsnprintf(buf, sizeof(buf), fmt, v);
		va_end(v);
		m_log->log(log_module::gateway, "%s", buf);
	}
#endif
}
