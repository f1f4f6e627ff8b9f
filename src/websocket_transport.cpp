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

#include "swarmgate/websocket_transport.hpp"
#include "swarmgate/rate_limit.hpp"
#include "swarmgate/settings_pack.hpp"
#include "swarmgate/swarm.hpp"
#include "swarmgate/aux_/escape_string.hpp"
#include "swarmgate/aux_/utf8.hpp"

#include <boost/asio/dispatch.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/json.hpp>
#ifdef BOOST_JSON_HEADER_ONLY
#include <boost/json/src.hpp>
#endif

#include <algorithm>
#include <cmath>
#include <deque>
#include <exception>
#include <functional>
#include <stdexcept>
#include <vector>

namespace swarmgate {

using namespace std::placeholders;
namespace beast = boost::beast;
namespace http = boost::beast::http;
namespace websocket = boost::beast::websocket;
namespace json = boost::json;

namespace {

	std::string json_str(json::value const& v)
	{
		json::string const& s = v.as_string();
		return std::string(s.data(), s.size());
	}

	// accepts the one-byte-per-code-point form and 40 character hex
	std::string parse_hash(json::value const& v, char const* what)
	{
		std::string const str = json_str(v);
		if (str.size() == 40)
		{
			std::string raw;
			if (aux::from_hex(str, raw)) return raw;
		}
		error_code ec;
		std::string ret = aux::utf8_latin1(str, ec);
		if (ec || !valid_hash(ret))
			throw std::invalid_argument(std::string("invalid ") + what);
		return ret;
	}

	std::int64_t json_int(json::value const& v, char const* what)
	{
		if (v.is_int64()) return v.get_int64();
		if (v.is_uint64() && v.get_uint64() <= 0x7fffffffffffffffull)
			return std::int64_t(v.get_uint64());
		if (v.is_double())
		{
			// integral, and inside [-2^63, 2^63)
			double const d = v.get_double();
			if (std::isfinite(d) && d == std::trunc(d)
				&& d >= -9223372036854775808.0 && d < 9223372036854775808.0)
				return std::int64_t(d);
		}
		throw std::invalid_argument(std::string("invalid ") + what);
	}

	std::string parse_offer_id(json::value const& v)
	{
		error_code ec;
		std::string ret = aux::utf8_latin1(json_str(v), ec);
		if (ec || ret.empty()) throw std::invalid_argument("invalid offer_id");
		return ret;
	}

	std::string parse_sdp(json::value const& v)
	{
		json::object const& obj = v.as_object();
		auto const* sdp = obj.if_contains("sdp");
		if (sdp == nullptr) throw std::invalid_argument("missing sdp");
		return json_str(*sdp);
	}

	void parse_signals(json::object const& payload, tracker_request& req
		, websocket_signals& signals)
	{
		if (auto const* v = payload.if_contains("offers"))
		{
			for (auto const& o : v->as_array())
			{
				json::object const& obj = o.as_object();
				auto const* id = obj.if_contains("offer_id");
				auto const* offer = obj.if_contains("offer");
				if (id == nullptr || offer == nullptr)
					throw std::invalid_argument("invalid offer");
				rtc_offer ro;
				ro.offer_id = parse_offer_id(*id);
				ro.sdp = parse_sdp(*offer);
				signals.offers.push_back(std::move(ro));
			}
			if (!payload.contains("numwant"))
				req.num_want = int(signals.offers.size());
		}

		if (auto const* v = payload.if_contains("answer"))
		{
			auto const* id = payload.if_contains("offer_id");
			auto const* to = payload.if_contains("to_peer_id");
			if (id == nullptr || to == nullptr)
				throw std::invalid_argument("invalid answer");
			rtc_answer ra;
			ra.offer_id = parse_offer_id(*id);
			ra.to_peer_id = parse_hash(*to, "to_peer_id");
			ra.sdp = parse_sdp(*v);
			signals.answer = std::move(ra);
		}
	}

	std::string peer_key(std::string const& info_hash, std::string const& peer_id)
	{
		return info_hash + peer_id;
	}
}

	tracker_request parse_websocket_message(std::string const& msg
		, websocket_signals* signals)
	{
		tracker_request req;
		req.protocol = transport_protocol::websocket;
		// a missing left field means the peer is not a seed
		req.left = -1;

		try
		{
			json::value const root = json::parse(json::string_view(msg.data(), msg.size()));
			json::object const& payload = root.as_object();

			auto const it_action = payload.find("action");
			if (it_action == payload.end())
				throw std::invalid_argument("missing action");
			std::string const action = json_str(it_action->value());

			if (action == "scrape")
			{
				req.type = request_type::scrape;
				if (auto const* v = payload.if_contains("info_hash"))
				{
					if (v->is_array())
					{
						for (auto const& h : v->as_array())
							req.scrape_hashes.push_back(parse_hash(h, "info_hash"));
					}
					else
					{
						req.scrape_hashes.push_back(parse_hash(*v, "info_hash"));
					}
				}
				if (req.scrape_hashes.size() == 1) req.info_hash = req.scrape_hashes.front();
				return req;
			}

			if (action != "announce")
				throw std::invalid_argument("unknown action");

			req.type = request_type::announce;

			auto const* info_hash = payload.if_contains("info_hash");
			if (info_hash == nullptr) throw std::invalid_argument("missing info_hash");
			req.info_hash = parse_hash(*info_hash, "info_hash");

			auto const* peer_id = payload.if_contains("peer_id");
			if (peer_id == nullptr) throw std::invalid_argument("missing peer_id");
			req.peer_id = parse_hash(*peer_id, "peer_id");

			if (auto const* v = payload.if_contains("uploaded"))
				req.uploaded = json_int(*v, "uploaded");
			if (auto const* v = payload.if_contains("downloaded"))
				req.downloaded = json_int(*v, "downloaded");
			if (auto const* v = payload.if_contains("left"))
				req.left = json_int(*v, "left");
			if (auto const* v = payload.if_contains("numwant"))
				req.num_want = int(std::min(json_int(*v, "numwant"), std::int64_t(0x7fffffff)));
			if (auto const* v = payload.if_contains("event"))
				req.event = parse_event(json_str(*v));
			if (auto const* v = payload.if_contains("port"))
			{
				std::int64_t const port = json_int(*v, "port");
				if (port < 0 || port > 0xffff) throw std::invalid_argument("invalid port");
				req.port = std::uint16_t(port);
			}
			if (req.uploaded < 0 || req.downloaded < 0)
				throw std::invalid_argument("invalid transfer counter");

			websocket_signals sig;
			parse_signals(payload, req, sig);
			if (signals) *signals = std::move(sig);
		}
		catch (std::exception const& e)
		{
			req.malformed = true;
			req.malformed_reason = e.what();
		}
		return req;
	}

	std::string websocket_failure(std::string const& reason, std::string const& info_hash)
	{
		json::object payload;
		payload["failure reason"] = reason;
		if (!info_hash.empty()) payload["info_hash"] = aux::latin1_utf8(info_hash);
		return json::serialize(payload);
	}

	std::string websocket_announce_reply(tracker_request const& req
		, announce_response const& resp)
	{
		if (resp.ec) return websocket_failure(resp.failure_reason, req.info_hash);

		json::object payload;
		payload["action"] = "announce";
		payload["info_hash"] = aux::latin1_utf8(req.info_hash);
		payload["interval"] = resp.interval;
		payload["min interval"] = resp.min_interval;
		payload["complete"] = resp.complete;
		payload["incomplete"] = resp.incomplete;
		return json::serialize(payload);
	}

	std::string websocket_offer_message(std::string const& info_hash
		, std::string const& peer_id, rtc_offer const& offer)
	{
		json::object payload;
		payload["action"] = "announce";
		payload["info_hash"] = aux::latin1_utf8(info_hash);
		payload["peer_id"] = aux::latin1_utf8(peer_id);
		payload["offer_id"] = aux::latin1_utf8(offer.offer_id);
		json::object& obj = payload["offer"].emplace_object();
		obj["type"] = "offer";
		obj["sdp"] = offer.sdp;
		return json::serialize(payload);
	}

	std::string websocket_answer_message(std::string const& info_hash
		, std::string const& peer_id, rtc_answer const& answer)
	{
		json::object payload;
		payload["action"] = "announce";
		payload["info_hash"] = aux::latin1_utf8(info_hash);
		payload["peer_id"] = aux::latin1_utf8(peer_id);
		payload["offer_id"] = aux::latin1_utf8(answer.offer_id);
		json::object& obj = payload["answer"].emplace_object();
		obj["type"] = "answer";
		obj["sdp"] = answer.sdp;
		return json::serialize(payload);
	}

	std::string websocket_scrape_reply(scrape_response const& resp)
	{
		if (resp.ec) return websocket_failure(resp.failure_reason);

		json::object payload;
		payload["action"] = "scrape";
		json::object& files = payload["files"].emplace_object();
		for (auto const& f : resp.files)
		{
			json::object& obj = files[aux::latin1_utf8(f.info_hash)].emplace_object();
			obj["complete"] = f.complete;
			obj["incomplete"] = f.incomplete;
			obj["downloaded"] = f.downloaded;
		}
		return json::serialize(payload);
	}

namespace aux {

	// one client session. All handlers run on the session's strand
	struct websocket_session : std::enable_shared_from_this<websocket_session>
	{
		websocket_session(tcp::socket s, address const& remote
			, std::shared_ptr<websocket_transport> t)
			: m_transport(std::move(t))
			, m_ws(std::move(s))
			, m_delay_timer(m_ws.get_executor())
			, m_remote(remote)
			, m_client(remote)
		{}

		~websocket_session()
		{
			m_transport->remove_session(this, m_peer_keys);
		}

		void start()
		{
			boost::asio::dispatch(m_ws.get_executor()
				, std::bind(&websocket_session::do_read_upgrade, shared_from_this()));
		}

		// may be called from any thread
		void close()
		{
			boost::asio::post(m_ws.get_executor()
				, std::bind(&websocket_session::request_close, shared_from_this()
					, websocket::close_code::going_away));
		}

		// queues a message relayed from another session. May be called
		// from any thread
		void deliver(std::string msg)
		{
			boost::asio::post(m_ws.get_executor()
				, [self = shared_from_this(), m = std::move(msg)]() mutable
				{
					if (!self->m_open || self->m_close_pending) return;
					self->queue_message(std::move(m));
				});
		}

	private:

		settings_pack const& settings() const { return m_transport->m_ctx.settings; }

		// the upgrade request is read by hand so X-Forwarded-For can be
		// inspected
		void do_read_upgrade()
		{
			beast::get_lowest_layer(m_ws).expires_after(seconds(settings().get_int(
				settings_pack::websocket_handshake_timeout)));
			http::async_read(beast::get_lowest_layer(m_ws), m_buffer, m_upgrade
				, std::bind(&websocket_session::on_read_upgrade, shared_from_this(), _1, _2));
		}

		void on_read_upgrade(error_code const& ec, std::size_t)
		{
			if (ec)
			{
				teardown();
				return;
			}

			if (!websocket::is_upgrade(m_upgrade))
			{
#ifndef SWARMGATE_DISABLE_LOGGING
				if (m_transport->should_log())
					m_transport->log("%s sent a request without upgrade"
						, print_address(m_remote).c_str());
#endif
				teardown();
				return;
			}

			m_client = client_address();

			// the websocket stream has its own timeouts
			beast::get_lowest_layer(m_ws).expires_never();

			websocket::stream_base::timeout opt;
			opt.handshake_timeout = seconds(settings().get_int(
				settings_pack::websocket_handshake_timeout));
			opt.idle_timeout = seconds(settings().get_int(
				settings_pack::websocket_idle_timeout));
			opt.keep_alive_pings = true;
			m_ws.set_option(opt);
			m_ws.set_option(websocket::stream_base::decorator(
				[](websocket::response_type& res)
				{ res.set(http::field::server, "swarmgate"); }));
			m_ws.read_message_max(std::uint64_t(std::max(1, settings().get_int(
				settings_pack::websocket_max_message_size))));

			m_ws.async_accept(m_upgrade
				, std::bind(&websocket_session::on_accept, shared_from_this(), _1));
		}

		address client_address() const
		{
			if (!settings().get_bool(settings_pack::trust_proxy)) return m_remote;
			auto const i = m_upgrade.find("X-Forwarded-For");
			if (i == m_upgrade.end()) return m_remote;

			std::string const header(i->value().data(), i->value().size());
			std::string const first = aux::trim(header.substr(0, header.find(',')));
			boost::system::error_code e;
			address const ret = make_address(first, e);
			if (e) return m_remote;
			return ret;
		}

		void on_accept(error_code const& ec)
		{
			if (ec)
			{
#ifndef SWARMGATE_DISABLE_LOGGING
				if (m_transport->should_log())
					m_transport->log("handshake with %s failed: %s"
						, print_address(m_client).c_str(), ec.message().c_str());
#endif
				teardown();
				return;
			}
			m_open = true;
			m_ws.text(true);
			m_buffer.consume(m_buffer.size());
			do_read();
		}

		void do_read()
		{
			if (m_close_pending) return;
			m_ws.async_read(m_buffer
				, std::bind(&websocket_session::on_read, shared_from_this(), _1, _2));
		}

		void on_read(error_code const& ec, std::size_t)
		{
			if (ec)
			{
#ifndef SWARMGATE_DISABLE_LOGGING
				if (ec != websocket::error::closed
					&& ec != boost::asio::error::operation_aborted
					&& m_transport->should_log())
				{
					m_transport->log("read from %s failed: %s"
						, print_address(m_client).c_str(), ec.message().c_str());
				}
#endif
				return;
			}

			std::string const msg = beast::buffers_to_string(m_buffer.data());
			m_buffer.consume(m_buffer.size());

			if (!m_ws.got_text())
			{
				queue_message(websocket_failure("binary messages are not supported"));
				do_read();
				return;
			}

			m_signals = websocket_signals();
			m_req = parse_websocket_message(msg, &m_signals);
			m_req.client = m_client;

			rate_limit_result const r = m_transport->m_ctx.rate_limits.check(
				m_client, route_class::tracker, clock_type::now());
			if (!r.allowed())
			{
				queue_message(websocket_failure("rate limit exceeded", m_req.info_hash));
				do_read();
				return;
			}

			if (r.delay > time_duration::zero())
			{
				m_delay_timer.expires_after(r.delay);
				m_delay_timer.async_wait(std::bind(&websocket_session::on_delay
					, shared_from_this(), _1));
				return;
			}

			handle_request();
		}

		void on_delay(error_code const& ec)
		{
			if (ec) return;
			handle_request();
		}

		void handle_request()
		{
			if (m_close_pending) return;

			swarm_interface& swarm = m_transport->m_ctx.swarm;
			error_code result;
			if (m_req.type == request_type::announce)
			{
				announce_response const resp = swarm.announce(m_req);
				result = resp.ec;
				if (!resp.ec) relay_signals(resp);
				if (resp.ec || !m_signals.answer)
					queue_message(websocket_announce_reply(m_req, resp));
			}
			else
			{
				scrape_response const resp = swarm.scrape(m_req);
				result = resp.ec;
				queue_message(websocket_scrape_reply(resp));
			}

#ifndef SWARMGATE_DISABLE_LOGGING
			if (m_transport->should_log())
			{
				m_transport->log("%s %s -> %s", print_address(m_client).c_str()
					, m_req.type == request_type::announce ? "announce" : "scrape"
					, result ? result.message().c_str() : "ok");
			}
#endif

			// the ban may have been added after the session was opened
			if (result == errors::banned_address)
			{
				request_close(websocket::close_code::policy_error);
				return;
			}
			do_read();
		}

		void relay_signals(announce_response const& resp)
		{
			std::string const key = peer_key(m_req.info_hash, m_req.peer_id);
			auto const known = std::find(m_peer_keys.begin(), m_peer_keys.end(), key);
			if (m_req.event == event_t::stopped)
			{
				if (known != m_peer_keys.end())
				{
					m_peer_keys.erase(known);
					m_transport->remove_peer(key, this);
				}
				return;
			}
			if (known == m_peer_keys.end()) m_peer_keys.push_back(key);
			m_transport->add_peer(key, shared_from_this());

			// peers without a session of their own are skipped
			std::size_t next = 0;
			for (auto const& p : resp.peers)
			{
				if (next == m_signals.offers.size()) break;
				auto const s = m_transport->find_peer(peer_key(m_req.info_hash, p.peer_id));
				if (!s || s.get() == this) continue;
				s->deliver(websocket_offer_message(m_req.info_hash, m_req.peer_id
					, m_signals.offers[next]));
				++next;
			}

			if (m_signals.answer)
			{
				auto const s = m_transport->find_peer(peer_key(m_req.info_hash
					, m_signals.answer->to_peer_id));
				if (s)
				{
					s->deliver(websocket_answer_message(m_req.info_hash, m_req.peer_id
						, *m_signals.answer));
				}
#ifndef SWARMGATE_DISABLE_LOGGING
				else if (m_transport->should_log())
				{
					m_transport->log("%s answered an offer of an unknown peer [%s]"
						, print_address(m_client).c_str()
						, aux::to_hex(m_signals.answer->to_peer_id).c_str());
				}
#endif
			}

#ifndef SWARMGATE_DISABLE_LOGGING
			if (!m_signals.offers.empty() && m_transport->should_log())
			{
				m_transport->log("%s relayed %d of %d offers", print_address(m_client).c_str()
					, int(next), int(m_signals.offers.size()));
			}
#endif
		}

		void queue_message(std::string msg)
		{
			m_queue.push_back(std::move(msg));
			if (m_queue.size() > 1) return;
			do_write();
		}

		void do_write()
		{
			m_ws.async_write(boost::asio::buffer(m_queue.front())
				, std::bind(&websocket_session::on_write, shared_from_this(), _1, _2));
		}

		void on_write(error_code const& ec, std::size_t)
		{
			if (ec)
			{
				teardown();
				return;
			}
			m_queue.pop_front();
			if (!m_queue.empty())
			{
				do_write();
				return;
			}
			if (m_close_pending && !m_closing) do_close_frame();
		}

		// sends a close frame once every queued message is written
		void request_close(websocket::close_code const code)
		{
			if (m_close_pending) return;
			m_close_pending = true;
			m_close_code = code;
			m_delay_timer.cancel();

			if (!m_open)
			{
				// still in the handshake
				teardown();
				return;
			}
			if (m_queue.empty()) do_close_frame();
		}

		void do_close_frame()
		{
			m_closing = true;
			m_ws.async_close(m_close_code
				, std::bind(&websocket_session::on_close, shared_from_this(), _1));
		}

		void on_close(error_code const& ec)
		{
#ifndef SWARMGATE_DISABLE_LOGGING
			if (ec && m_transport->should_log())
				m_transport->log("close of %s failed: %s"
					, print_address(m_client).c_str(), ec.message().c_str());
#endif
			teardown();
		}

		void teardown()
		{
			// the session is going away, errors from shutdown are of no
			// interest
			error_code ignore;
			m_delay_timer.cancel();
			auto& sock = beast::get_lowest_layer(m_ws).socket();
			sock.shutdown(tcp::socket::shutdown_both, ignore);
			sock.close(ignore);
		}

		std::shared_ptr<websocket_transport> m_transport;
		websocket::stream<beast::tcp_stream> m_ws;
		beast::flat_buffer m_buffer;
		http::request<http::string_body> m_upgrade;
		boost::asio::steady_timer m_delay_timer;

		// outgoing messages. Only the front one is being written
		std::deque<std::string> m_queue;

		// the request held by the slow-down delay, and its offers and answer
		tracker_request m_req;
		websocket_signals m_signals;

		// the keys this session is reachable by, info-hash followed by
		// peer-id. Only touched on the strand, and by the destructor
		std::vector<std::string> m_peer_keys;

		address m_remote;
		address m_client;

		websocket::close_code m_close_code = websocket::close_code::normal;

		// the handshake completed
		bool m_open = false;
		// a close was requested, no more messages are read
		bool m_close_pending = false;
		// the close frame is being sent
		bool m_closing = false;
	};
}

	websocket_transport::websocket_transport(boost::asio::io_context& ioc
		, transport_context const& ctx)
		: aux::transport_base(ctx)
		, m_ioc(ioc)
		, m_acceptor(ioc)
	{}

	websocket_transport::~websocket_transport() = default;

	int websocket_transport::open(address const& bind_addr, int const port, error_code& ec)
	{
		tcp::endpoint const ep(bind_addr, std::uint16_t(port));
		m_acceptor.open(ep.protocol(), ec);
		if (ec) return 0;
		m_acceptor.set_option(tcp::acceptor::reuse_address(true), ec);
		if (ec) return 0;
		m_acceptor.bind(ep, ec);
		if (!ec) m_acceptor.listen(boost::asio::socket_base::max_listen_connections, ec);
		if (ec)
		{
			error_code ignore;
			m_acceptor.close(ignore);
			return 0;
		}
		int const ret = m_acceptor.local_endpoint(ec).port();
		if (ec) return 0;
		do_accept();
		return ret;
	}

	void websocket_transport::close(error_code& ec)
	{
		m_acceptor.close(ec);
		if (ec) ec = errors::transport_shutdown_failed;

		std::vector<std::shared_ptr<aux::websocket_session>> sessions;
		{
			std::lock_guard<std::mutex> l(m_sessions_mutex);
			for (auto const& s : m_sessions)
				if (auto p = s.second.lock()) sessions.push_back(std::move(p));
		}
		for (auto const& s : sessions) s->close();
	}

	void websocket_transport::do_accept()
	{
		m_acceptor.async_accept(boost::asio::make_strand(m_ioc)
			, std::bind(&websocket_transport::on_accept, shared_from_this(), _1, _2));
	}

	void websocket_transport::on_accept(error_code const& ec, tcp::socket s)
	{
		std::lock_guard<std::mutex> l(m_mutex);
		if (!is_running()) return;

		if (ec)
		{
			if (ec == boost::asio::error::operation_aborted) return;
#ifndef SWARMGATE_DISABLE_LOGGING
			log("accept failed: %s", ec.message().c_str());
#endif
			do_accept();
			return;
		}

		error_code e;
		tcp::endpoint const remote = s.remote_endpoint(e);
		if (!e)
		{
			auto session = std::make_shared<aux::websocket_session>(std::move(s)
				, remote.address(), shared_from_this());
			add_session(session);
			session->start();
		}
		do_accept();
	}

	void websocket_transport::add_session(std::shared_ptr<aux::websocket_session> const& s)
	{
		std::lock_guard<std::mutex> l(m_sessions_mutex);
		m_sessions[s.get()] = s;
	}

	void websocket_transport::remove_session(aux::websocket_session const* s
		, std::vector<std::string> const& peer_keys)
	{
		std::lock_guard<std::mutex> l(m_sessions_mutex);
		m_sessions.erase(s);
		for (auto const& k : peer_keys)
		{
			auto const i = m_peers.find(k);
			if (i != m_peers.end() && i->second.owner == s) m_peers.erase(i);
		}
	}

	void websocket_transport::add_peer(std::string const& key
		, std::shared_ptr<aux::websocket_session> const& s)
	{
		std::lock_guard<std::mutex> l(m_sessions_mutex);
		m_peers[key] = reachable_peer{s.get(), s};
	}

	void websocket_transport::remove_peer(std::string const& key
		, aux::websocket_session const* s)
	{
		std::lock_guard<std::mutex> l(m_sessions_mutex);
		auto const i = m_peers.find(key);
		if (i != m_peers.end() && i->second.owner == s) m_peers.erase(i);
	}

	std::shared_ptr<aux::websocket_session> websocket_transport::find_peer(
		std::string const& key) const
	{
		std::lock_guard<std::mutex> l(m_sessions_mutex);
		auto const i = m_peers.find(key);
		if (i == m_peers.end()) return {};
		return i->second.session.lock();
	}

	int websocket_transport::num_reachable_peers() const
	{
		std::lock_guard<std::mutex> l(m_sessions_mutex);
		return int(m_peers.size());
	}

	int websocket_transport::num_sessions() const
	{
		std::lock_guard<std::mutex> l(m_sessions_mutex);
		return int(m_sessions.size());
	}
}
