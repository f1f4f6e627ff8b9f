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

#include "swarmgate/http_transport.hpp"
#include "swarmgate/rate_limit.hpp"
#include "swarmgate/settings_pack.hpp"
#include "swarmgate/swarm.hpp"
#include "swarmgate/aux_/bencoder.hpp"
#include "swarmgate/aux_/escape_string.hpp"
#include "swarmgate/aux_/io.hpp"

#include <boost/asio/dispatch.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/json.hpp>

#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <functional>
#include <iterator>

namespace swarmgate {

using namespace std::placeholders;
namespace beast = boost::beast;
namespace http = boost::beast::http;
namespace json = boost::json;

namespace {

	bool parse_int64(std::string const& str, std::int64_t& out)
	{
		if (str.empty()) return false;
		char* end = nullptr;
		errno = 0;
		long long const v = std::strtoll(str.c_str(), &end, 10);
		if (*end != '\0' || errno == ERANGE) return false;
		out = std::int64_t(v);
		return true;
	}

	void set_malformed(tracker_request& req, char const* reason)
	{
		if (req.malformed) return;
		req.malformed = true;
		req.malformed_reason = reason;
	}

	void write_compact_peer(std::string& out, peer_entry const& p)
	{
		auto i = std::back_inserter(out);
		if (has_ipv4_form(p.ip))
		{
			aux::write_uint32(to_uint32(p.ip), i);
		}
		else
		{
			auto const bytes = p.ip.to_v6().to_bytes();
			out.append(reinterpret_cast<char const*>(bytes.data()), bytes.size());
		}
		aux::write_uint16(p.port, i);
	}
}

	tracker_request parse_http_announce(std::string const& target)
	{
		tracker_request req;
		req.type = request_type::announce;
		req.protocol = transport_protocol::http;
		// a missing left parameter means the peer is not a seed
		req.left = -1;

		error_code ec;
		auto const params = aux::parse_query_string(target, ec);
		if (ec)
		{
			set_malformed(req, "invalid url encoding");
			return req;
		}

		bool have_port = false;
		for (auto const& p : params)
		{
			std::string const& key = p.first;
			std::string const& val = p.second;
			std::int64_t num = 0;

			if (key == "info_hash") req.info_hash = val;
			else if (key == "peer_id") req.peer_id = val;
			else if (key == "port")
			{
				if (!parse_int64(val, num) || num < 1 || num > 0xffff)
				{
					set_malformed(req, "invalid port");
					continue;
				}
				req.port = std::uint16_t(num);
				have_port = true;
			}
			else if (key == "uploaded" || key == "downloaded" || key == "left")
			{
				if (!parse_int64(val, num) || num < 0)
				{
					set_malformed(req, "invalid transfer counter");
					continue;
				}
				if (key == "uploaded") req.uploaded = num;
				else if (key == "downloaded") req.downloaded = num;
				else req.left = num;
			}
			else if (key == "event") req.event = parse_event(val);
			else if (key == "numwant")
			{
				if (parse_int64(val, num) && num >= 0)
					req.num_want = int(std::min(num, std::int64_t(0x7fffffff)));
			}
			else if (key == "key")
			{
				req.key = std::uint32_t(std::strtoul(val.c_str(), nullptr, 16));
			}
			else if (key == "compact") req.compact = val != "0";
		}

		if (!valid_hash(req.info_hash)) set_malformed(req, "invalid info_hash");
		else if (!valid_hash(req.peer_id)) set_malformed(req, "invalid peer_id");
		else if (!have_port) set_malformed(req, "invalid port");
		return req;
	}

	tracker_request parse_http_scrape(std::string const& target)
	{
		tracker_request req;
		req.type = request_type::scrape;
		req.protocol = transport_protocol::http;

		error_code ec;
		auto const params = aux::parse_query_string(target, ec);
		if (ec)
		{
			set_malformed(req, "invalid url encoding");
			return req;
		}

		for (auto const& p : params)
		{
			if (p.first != "info_hash") continue;
			if (!valid_hash(p.second))
			{
				set_malformed(req, "invalid info_hash");
				continue;
			}
			req.scrape_hashes.push_back(p.second);
		}
		if (req.scrape_hashes.size() == 1) req.info_hash = req.scrape_hashes.front();
		return req;
	}

	std::string bencode_failure(std::string const& reason)
	{
		std::string ret;
		{
			aux::bencode::dict d(ret);
			d.add("failure reason", reason);
		}
		return ret;
	}

	std::string bencode_announce(announce_response const& resp, bool const compact)
	{
		if (resp.ec) return bencode_failure(resp.failure_reason);

		std::string ret;
		{
			aux::bencode::dict d(ret);
			d.add("complete", resp.complete);
			d.add("downloaded", resp.downloaded);
			d.add("incomplete", resp.incomplete);
			d.add("interval", resp.interval);
			d.add("min interval", resp.min_interval);

			if (compact)
			{
				std::string peers;
				std::string peers6;
				for (auto const& p : resp.peers)
					write_compact_peer(has_ipv4_form(p.ip) ? peers : peers6, p);
				d.add("peers", peers);
				if (!peers6.empty()) d.add("peers6", peers6);
			}
			else
			{
				d.add_key("peers");
				aux::bencode::list l(ret);
				for (auto const& p : resp.peers)
				{
					aux::bencode::dict pd(ret);
					pd.add("ip", p.ip.to_string());
					pd.add("peer id", p.peer_id);
					pd.add("port", p.port);
				}
			}
		}
		return ret;
	}

	std::string bencode_scrape(scrape_response const& resp)
	{
		if (resp.ec) return bencode_failure(resp.failure_reason);

		// dictionary keys must be sorted
		std::vector<scrape_entry const*> files;
		for (auto const& f : resp.files) files.push_back(&f);
		std::sort(files.begin(), files.end()
			, [](scrape_entry const* lhs, scrape_entry const* rhs)
			{ return lhs->info_hash < rhs->info_hash; });

		std::string ret;
		{
			aux::bencode::dict d(ret);
			d.add_key("files");
			aux::bencode::dict fd(ret);
			for (auto const* f : files)
			{
				fd.add_key(f->info_hash);
				aux::bencode::dict e(ret);
				e.add("complete", f->complete);
				e.add("downloaded", f->downloaded);
				e.add("incomplete", f->incomplete);
			}
		}
		return ret;
	}

	int http_status_for(error_code const& ec)
	{
		if (ec == errors::banned_address) return 403;
		if (ec == errors::admission_denied) return 403;
		if (ec == errors::malformed_request) return 400;
		if (ec == errors::rate_limit_exceeded) return 429;
		return 200;
	}

namespace aux {

	// one client connection. All handlers run on the connection's strand
	struct http_connection : std::enable_shared_from_this<http_connection>
	{
		http_connection(tcp::socket s, address const& remote
			, std::shared_ptr<http_transport> t)
			: m_transport(std::move(t))
			, m_stream(std::move(s))
			, m_delay_timer(m_stream.get_executor())
			, m_remote(remote)
		{}

		~http_connection()
		{
			m_transport->remove_connection(this);
		}

		void start()
		{
			boost::asio::dispatch(m_stream.get_executor()
				, std::bind(&http_connection::do_read, shared_from_this()));
		}

		// may be called from any thread
		void close()
		{
			boost::asio::post(m_stream.get_executor()
				, std::bind(&http_connection::do_close, shared_from_this()));
		}

	private:

		settings_pack const& settings() const { return m_transport->m_ctx.settings; }

		void do_read()
		{
			m_req = {};
			m_stream.expires_after(seconds(settings().get_int(
				settings_pack::http_request_timeout)));
			http::async_read(m_stream, m_buffer, m_req
				, std::bind(&http_connection::on_read, shared_from_this(), _1, _2));
		}

		void on_read(error_code const& ec, std::size_t)
		{
			if (ec == http::error::end_of_stream)
			{
				do_close();
				return;
			}
			if (ec)
			{
#ifndef SWARMGATE_DISABLE_LOGGING
				if (ec != boost::asio::error::operation_aborted
					&& ec != beast::error::timeout
					&& m_transport->should_log())
				{
					m_transport->log("read from %s failed: %s"
						, print_address(m_remote).c_str(), ec.message().c_str());
				}
#endif
				return;
			}
			m_stream.expires_never();
			handle_request();
		}

		address client_address() const
		{
			if (!settings().get_bool(settings_pack::trust_proxy)) return m_remote;
			auto const i = m_req.find("X-Forwarded-For");
			if (i == m_req.end()) return m_remote;

			std::string const header(i->value().data(), i->value().size());
			std::string const first = aux::trim(header.substr(0, header.find(',')));
			boost::system::error_code e;
			address const ret = make_address(first, e);
			if (e) return m_remote;
			return ret;
		}

		void handle_request()
		{
			m_target.assign(m_req.target().data(), m_req.target().size());
			m_client = client_address();

			std::string const path = aux::target_path(m_target);
			m_route = classify_route(path, settings().get_str(settings_pack::auth_route_prefix));

			rate_limit_result const r = m_transport->m_ctx.rate_limits.check(
				m_client, m_route, clock_type::now());

			if (!r.allowed())
			{
				std::int64_t const retry = std::max(std::int64_t(1)
					, (total_milliseconds(r.retry_after) + 999) / 1000);
				m_res = {};
				m_res.set(http::field::retry_after, std::to_string(retry));
				send(http::status::too_many_requests
					, m_route == route_class::tracker
						? bencode_failure("rate limit exceeded") : std::string("Too Many Requests\n")
					, "text/plain");
				return;
			}

			if (r.delay > time_duration::zero())
			{
				m_delay_timer.expires_after(r.delay);
				m_delay_timer.async_wait(std::bind(&http_connection::on_delay
					, shared_from_this(), _1));
				return;
			}

			dispatch_request();
		}

		void on_delay(error_code const& ec)
		{
			if (ec) return;
			dispatch_request();
		}

		void dispatch_request()
		{
			m_res = {};

			if (m_req.method() != http::verb::get && m_req.method() != http::verb::head)
			{
				send(http::status::method_not_allowed, "Method Not Allowed\n", "text/plain");
				return;
			}

			std::string const path = aux::target_path(m_target);
			swarm_interface& swarm = m_transport->m_ctx.swarm;

			if (path == "/announce")
			{
				tracker_request req = parse_http_announce(m_target);
				req.client = m_client;
				announce_response const resp = swarm.announce(req);
				send(http::status(http_status_for(resp.ec))
					, bencode_announce(resp, req.compact), "text/plain");
			}
			else if (path == "/scrape")
			{
				tracker_request req = parse_http_scrape(m_target);
				req.client = m_client;
				scrape_response const resp = swarm.scrape(req);
				send(http::status(http_status_for(resp.ec)), bencode_scrape(resp), "text/plain");
			}
			else if (path == "/stats" && settings().get_bool(settings_pack::enable_stats))
			{
				swarm_stats const st = swarm.stats();
				json::object o;
				o["torrents"] = st.torrents;
				o["peers"] = st.peers;
				o["seeders"] = st.seeds;
				o["leechers"] = st.leechers;
				o["announces"] = st.announces;
				o["scrapes"] = st.scrapes;
				o["denied"] = st.denied;
				send(http::status::ok, json::serialize(o), "application/json");
			}
			else
			{
				send(http::status::not_found, "Not Found\n", "text/plain");
			}

#ifndef SWARMGATE_DISABLE_LOGGING
			if (m_transport->should_log())
			{
				auto const method = m_req.method_string();
				m_transport->log("%s %s %s -> %d", print_address(m_client).c_str()
					, std::string(method.data(), method.size()).c_str(), path.c_str()
					, int(m_res.result_int()));
			}
#endif
		}

		void send(http::status const status, std::string body, char const* content_type)
		{
			m_res.version(m_req.version());
			m_res.result(status);
			m_res.set(http::field::server, "swarmgate");
			m_res.set(http::field::content_type, content_type);
			m_res.keep_alive(m_req.keep_alive());
			if (m_req.method() != http::verb::head) m_res.body() = std::move(body);
			m_res.prepare_payload();

			http::async_write(m_stream, m_res
				, std::bind(&http_connection::on_write, shared_from_this()
					, _1, _2, m_res.need_eof()));
		}

		void on_write(error_code const& ec, std::size_t, bool const close)
		{
			if (ec) return;
			if (close)
			{
				do_close();
				return;
			}
			do_read();
		}

		void do_close()
		{
			// the connection is going away, errors from shutdown are of no
			// interest
			error_code ignore;
			m_delay_timer.cancel();
			m_stream.socket().shutdown(tcp::socket::shutdown_both, ignore);
			m_stream.socket().close(ignore);
		}

		std::shared_ptr<http_transport> m_transport;
		beast::tcp_stream m_stream;
		beast::flat_buffer m_buffer;
		http::request<http::string_body> m_req;
		http::response<http::string_body> m_res;
		boost::asio::steady_timer m_delay_timer;

		// the socket's peer address, and the client address after
		// X-Forwarded-For resolution
		address m_remote;
		address m_client;
		std::string m_target;
		route_class m_route = route_class::api;
	};
}

	http_transport::http_transport(boost::asio::io_context& ioc
		, transport_context const& ctx)
		: aux::transport_base(ctx)
		, m_ioc(ioc)
		, m_acceptor(ioc)
	{}

	http_transport::~http_transport() = default;

	int http_transport::open(address const& bind_addr, int const port, error_code& ec)
	{
		tcp::endpoint const ep(bind_addr, std::uint16_t(port));
		m_acceptor.open(ep.protocol(), ec);
		if (ec) return 0;
		m_acceptor.set_option(tcp::acceptor::reuse_address(true), ec);
		if (ec) return 0;
		m_acceptor.bind(ep, ec);
		if (ec)
		{
			error_code ignore;
			m_acceptor.close(ignore);
			return 0;
		}
		m_acceptor.listen(boost::asio::socket_base::max_listen_connections, ec);
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

	void http_transport::close(error_code& ec)
	{
		m_acceptor.close(ec);
		if (ec) ec = errors::transport_shutdown_failed;

		std::vector<std::shared_ptr<aux::http_connection>> conns;
		{
			std::lock_guard<std::mutex> l(m_connections_mutex);
			for (auto const& c : m_connections)
				if (auto p = c.second.lock()) conns.push_back(std::move(p));
		}
		for (auto const& c : conns) c->close();
	}

	void http_transport::do_accept()
	{
		m_acceptor.async_accept(boost::asio::make_strand(m_ioc)
			, std::bind(&http_transport::on_accept, shared_from_this(), _1, _2));
	}

	void http_transport::on_accept(error_code const& ec, tcp::socket s)
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
			auto c = std::make_shared<aux::http_connection>(std::move(s)
				, remote.address(), shared_from_this());
			add_connection(c);
			c->start();
		}
		do_accept();
	}

	void http_transport::add_connection(std::shared_ptr<aux::http_connection> const& c)
	{
		std::lock_guard<std::mutex> l(m_connections_mutex);
		m_connections[c.get()] = c;
	}

	void http_transport::remove_connection(aux::http_connection const* c)
	{
		std::lock_guard<std::mutex> l(m_connections_mutex);
		m_connections.erase(c);
	}

	int http_transport::num_connections() const
	{
		std::lock_guard<std::mutex> l(m_connections_mutex);
		return int(m_connections.size());
	}
}
