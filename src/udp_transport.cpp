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

#include "swarmgate/udp_transport.hpp"
#include "swarmgate/random.hpp"
#include "swarmgate/rate_limit.hpp"
#include "swarmgate/settings_pack.hpp"
#include "swarmgate/swarm.hpp"
#include "swarmgate/aux_/escape_string.hpp"
#include "swarmgate/aux_/io.hpp"

#include <boost/asio/buffer.hpp>
#include <boost/asio/post.hpp>

#include <algorithm>
#include <functional>
#include <iterator>

namespace swarmgate {

using namespace std::placeholders;

	udp_transport::udp_transport(boost::asio::io_context& ioc
		, transport_context const& ctx)
		: aux::transport_base(ctx)
		, m_ioc(ioc)
		, m_socket(ioc)
		, m_sweep_timer(ioc)
	{}

	udp_transport::~udp_transport() = default;

	int udp_transport::open(address const& bind_addr, int const port, error_code& ec)
	{
		udp::endpoint const ep(bind_addr, std::uint16_t(port));
		m_socket.open(ep.protocol(), ec);
		if (ec) return 0;
		m_socket.bind(ep, ec);
		if (ec)
		{
			error_code ignore;
			m_socket.close(ignore);
			return 0;
		}
		int const ret = m_socket.local_endpoint(ec).port();
		if (ec) return 0;

		do_receive();
		start_sweep_timer();
		return ret;
	}

	void udp_transport::close(error_code& ec)
	{
		m_sweep_timer.cancel();
		m_socket.close(ec);
		if (ec) ec = errors::transport_shutdown_failed;

		std::lock_guard<std::mutex> l(m_connections_mutex);
		m_connections.clear();
	}

	void udp_transport::do_receive()
	{
		m_socket.async_receive_from(boost::asio::buffer(m_buffer), m_from
			, std::bind(&udp_transport::on_receive, shared_from_this(), _1, _2));
	}

	void udp_transport::on_receive(error_code const& ec, std::size_t const bytes_transferred)
	{
		if (ec == boost::asio::error::operation_aborted) return;

		if (ec)
		{
#ifndef SWARMGATE_DISABLE_LOGGING
			log("receive failed: %s", ec.message().c_str());
#endif
		}
		else if (bytes_transferred < std::size_t(udp_tracker::header_size))
		{
#ifndef SWARMGATE_DISABLE_LOGGING
			log("packet too short (%d bytes) from %s", int(bytes_transferred)
				, print_endpoint(m_from).c_str());
#endif
		}
		else
		{
			// the buffer and endpoint are reused by the next receive. The
			// packet is handled on the executor, so the socket keeps
			// receiving while the swarm engine works on it
			auto self = shared_from_this();
			std::string packet(m_buffer.data(), bytes_transferred);
			boost::asio::post(m_ioc, [self, p = std::move(packet), from = m_from]
			{ self->incoming_packet(p, from); });
		}

		std::lock_guard<std::mutex> l(m_mutex);
		if (!is_running()) return;
		do_receive();
	}

	void udp_transport::start_sweep_timer()
	{
		int const timeout = std::max(1, m_ctx.settings.get_int(
			settings_pack::udp_connection_timeout));
		m_sweep_timer.expires_after(seconds(std::max(1, timeout / 2)));
		m_sweep_timer.async_wait(std::bind(&udp_transport::on_sweep
			, shared_from_this(), _1));
	}

	void udp_transport::on_sweep(error_code const& ec)
	{
		if (ec) return;
		sweep_connection_ids(clock_type::now());

		std::lock_guard<std::mutex> l(m_mutex);
		if (!is_running()) return;
		start_sweep_timer();
	}

	int udp_transport::sweep_connection_ids(time_point const now)
	{
		std::lock_guard<std::mutex> l(m_connections_mutex);
		int ret = 0;
		for (auto i = m_connections.begin(); i != m_connections.end();)
		{
			if (i->second.expires <= now)
			{
				i = m_connections.erase(i);
				++ret;
			}
			else
			{
				++i;
			}
		}
		return ret;
	}

	int udp_transport::num_connection_ids() const
	{
		std::lock_guard<std::mutex> l(m_connections_mutex);
		return int(m_connections.size());
	}

	void udp_transport::incoming_packet(std::string const& packet
		, udp::endpoint const& from)
	{
		char const* ptr = packet.data();
		std::uint64_t const connection_id = aux::read_uint64(ptr);
		std::uint32_t const action = aux::read_uint32(ptr);
		std::uint32_t const transaction_id = aux::read_uint32(ptr);

		switch (action)
		{
			case udp_tracker::action_connect:
				if (connection_id != udp_tracker::protocol_id)
				{
#ifndef SWARMGATE_DISABLE_LOGGING
					log("connect with invalid protocol id from %s"
						, print_endpoint(from).c_str());
#endif
					return;
				}
				on_connect(transaction_id, from);
				break;
			case udp_tracker::action_announce:
			case udp_tracker::action_scrape:
				if (!verify_connection_id(connection_id, from))
				{
					send_error(transaction_id
						, errors::make_error_code(errors::invalid_connection_id).message(), from);
					return;
				}
				if (action == udp_tracker::action_announce) on_announce(packet, from);
				else on_scrape(packet, from);
				break;
			default:
#ifndef SWARMGATE_DISABLE_LOGGING
				log("unknown action %u from %s", action, print_endpoint(from).c_str());
#endif
				break;
		}
	}

	void udp_transport::on_connect(std::uint32_t const transaction_id
		, udp::endpoint const& from)
	{
		int const max_connections = m_ctx.settings.get_int(settings_pack::udp_max_connections);
		time_point const now = clock_type::now();

		std::uint64_t connection_id = 0;
		{
			std::lock_guard<std::mutex> l(m_connections_mutex);
			if (int(m_connections.size()) >= max_connections)
			{
				for (auto i = m_connections.begin(); i != m_connections.end();)
				{
					if (i->second.expires <= now) i = m_connections.erase(i);
					else ++i;
				}
			}
			if (int(m_connections.size()) >= max_connections)
			{
				connection_id = 0;
			}
			else
			{
				// 0 and the protocol id are never handed out
				do
				{
					connection_id = aux::crypto_random_uint64();
				} while (connection_id == 0
					|| connection_id == udp_tracker::protocol_id
					|| m_connections.count(connection_id) > 0);

				m_connections[connection_id] = connection_entry{from.address()
					, now + seconds(m_ctx.settings.get_int(settings_pack::udp_connection_timeout))};
			}
		}

		if (connection_id == 0)
		{
			send_error(transaction_id
				, errors::make_error_code(errors::too_many_connections).message(), from);
			return;
		}

		std::string buf;
		auto out = std::back_inserter(buf);
		aux::write_uint32(udp_tracker::action_connect, out);
		aux::write_uint32(transaction_id, out);
		aux::write_uint64(connection_id, out);
		send(buf, from);
	}

	bool udp_transport::verify_connection_id(std::uint64_t const id
		, udp::endpoint const& from)
	{
		std::lock_guard<std::mutex> l(m_connections_mutex);
		auto const i = m_connections.find(id);
		if (i == m_connections.end()) return false;
		if (i->second.expires <= clock_type::now())
		{
			m_connections.erase(i);
			return false;
		}
		return i->second.addr == from.address();
	}

	void udp_transport::on_announce(std::string const& packet, udp::endpoint const& from)
	{
		if (int(packet.size()) < udp_tracker::announce_size)
		{
#ifndef SWARMGATE_DISABLE_LOGGING
			log("invalid announce message: %d bytes, expected %d bytes"
				, int(packet.size()), udp_tracker::announce_size);
#endif
			return;
		}

		char const* ptr = packet.data() + 12;
		std::uint32_t const transaction_id = aux::read_uint32(ptr);

		tracker_request req;
		req.type = request_type::announce;
		req.protocol = transport_protocol::udp;
		req.info_hash.assign(ptr, 20);
		ptr += 20;
		req.peer_id.assign(ptr, 20);
		ptr += 20;
		req.downloaded = aux::read_int64(ptr);
		req.left = aux::read_int64(ptr);
		req.uploaded = aux::read_int64(ptr);
		std::uint32_t const event = aux::read_uint32(ptr);
		req.event = event <= 3 ? event_t(event) : event_t::none;
		// the ip field is ignored, the source address is used
		aux::read_uint32(ptr);
		req.key = aux::read_uint32(ptr);
		req.num_want = aux::read_int32(ptr);
		req.port = aux::read_uint16(ptr);
		req.client = from.address();

		if (req.port == 0)
		{
			req.malformed = true;
			req.malformed_reason = "invalid port";
		}

		submit(std::move(req), transaction_id, from);
	}

	void udp_transport::on_scrape(std::string const& packet, udp::endpoint const& from)
	{
		char const* ptr = packet.data() + 12;
		std::uint32_t const transaction_id = aux::read_uint32(ptr);

		tracker_request req;
		req.type = request_type::scrape;
		req.protocol = transport_protocol::udp;
		req.client = from.address();

		std::size_t const num_hashes = (packet.size() - udp_tracker::header_size) / 20;
		if (num_hashes == 0)
		{
			req.malformed = true;
			req.malformed_reason = "no info_hash";
		}
		for (std::size_t i = 0; i < num_hashes; ++i)
		{
			req.scrape_hashes.emplace_back(ptr, 20);
			ptr += 20;
		}
		if (num_hashes == 1) req.info_hash = req.scrape_hashes.front();

		submit(std::move(req), transaction_id, from);
	}

	void udp_transport::submit(tracker_request req, std::uint32_t const transaction_id
		, udp::endpoint const& from)
	{
		rate_limit_result const r = m_ctx.rate_limits.check(from.address()
			, route_class::tracker, clock_type::now());

		if (!r.allowed())
		{
			send_error(transaction_id, "rate limit exceeded", from);
			return;
		}

		if (r.delay > time_duration::zero())
		{
			auto self = shared_from_this();
			auto t = std::make_shared<boost::asio::steady_timer>(m_ioc);
			t->expires_after(r.delay);
			t->async_wait([self, t, req, transaction_id, from](error_code const& ec)
			{
				if (ec) return;
				self->process(req, transaction_id, from);
			});
			return;
		}

		process(req, transaction_id, from);
	}

	void udp_transport::process(tracker_request const& req
		, std::uint32_t const transaction_id, udp::endpoint const& from)
	{
		std::string buf;
		auto out = std::back_inserter(buf);

		if (req.type == request_type::announce)
		{
			announce_response const resp = m_ctx.swarm.announce(req);
			if (resp.ec)
			{
				send_error(transaction_id, resp.failure_reason, from);
				return;
			}

			bool const v4 = from.address().is_v4();
			aux::write_uint32(udp_tracker::action_announce, out);
			aux::write_uint32(transaction_id, out);
			aux::write_uint32(resp.interval, out);
			aux::write_uint32(resp.incomplete, out);
			aux::write_uint32(resp.complete, out);
			for (auto const& p : resp.peers)
			{
				// the peer list has the address family of the socket
				if (v4)
				{
					if (!has_ipv4_form(p.ip)) continue;
					aux::write_uint32(to_uint32(p.ip), out);
				}
				else
				{
					address_v6 const a6 = p.ip.is_v6() ? p.ip.to_v6()
						: boost::asio::ip::make_address_v6(boost::asio::ip::v4_mapped, p.ip.to_v4());
					auto const bytes = a6.to_bytes();
					buf.append(reinterpret_cast<char const*>(bytes.data()), bytes.size());
				}
				aux::write_uint16(p.port, out);
			}
		}
		else
		{
			scrape_response const resp = m_ctx.swarm.scrape(req);
			if (resp.ec)
			{
				send_error(transaction_id, resp.failure_reason, from);
				return;
			}

			aux::write_uint32(udp_tracker::action_scrape, out);
			aux::write_uint32(transaction_id, out);
			for (auto const& f : resp.files)
			{
				aux::write_uint32(f.complete, out);
				aux::write_uint32(f.downloaded, out);
				aux::write_uint32(f.incomplete, out);
			}
		}

		send(buf, from);
	}

	void udp_transport::send_error(std::uint32_t const transaction_id
		, std::string const& msg, udp::endpoint const& to)
	{
		std::string buf;
		auto out = std::back_inserter(buf);
		aux::write_uint32(udp_tracker::action_error, out);
		aux::write_uint32(transaction_id, out);
		buf += msg;
		send(buf, to);
	}

	void udp_transport::send(std::string const& buf, udp::endpoint const& to)
	{
		std::lock_guard<std::mutex> l(m_mutex);
		if (!is_running()) return;

		error_code ec;
		m_socket.send_to(boost::asio::buffer(buf), to, 0, ec);
#ifndef SWARMGATE_DISABLE_LOGGING
		if (ec) log("send_to %s failed: %s", print_endpoint(to).c_str(), ec.message().c_str());
#endif
	}
}
