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

#ifndef SWARMGATE_HTTP_TRANSPORT_HPP_INCLUDED
#define SWARMGATE_HTTP_TRANSPORT_HPP_INCLUDED

#include "swarmgate/config.hpp"
#include "swarmgate/transport.hpp"
#include "swarmgate/tracker_request.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>

#include <memory>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace swarmgate {

namespace aux {
	struct http_connection;
}

	// parses the query string of an HTTP announce. Missing or invalid
	// parameters set ``malformed`` on the returned request rather than
	// failing
	SWARMGATE_EXTRA_EXPORT tracker_request parse_http_announce(std::string const& target);

	// parses the query string of an HTTP scrape. Every info_hash parameter
	// is one hash to scrape
	SWARMGATE_EXTRA_EXPORT tracker_request parse_http_scrape(std::string const& target);

	// bencodes responses the way BitTorrent clients expect them. Peers with
	// an IPv4 address go in ``peers``, others in ``peers6``
	SWARMGATE_EXTRA_EXPORT std::string bencode_announce(announce_response const& resp
		, bool compact);
	SWARMGATE_EXTRA_EXPORT std::string bencode_scrape(scrape_response const& resp);
	SWARMGATE_EXTRA_EXPORT std::string bencode_failure(std::string const& reason);

	// the HTTP status a denied request is answered with
	SWARMGATE_EXTRA_EXPORT int http_status_for(error_code const& ec);

	// serves GET /announce and GET /scrape over HTTP/1.1, and GET /stats when
	// enable_stats is set. Every request passes the rate limit chain first,
	// requests outside /announce and /scrape are counted against the api
	// or auth quotas and answered with 404.
	class SWARMGATE_EXPORT http_transport final
		: public aux::transport_base
		, public std::enable_shared_from_this<http_transport>
	{
	public:

		http_transport(boost::asio::io_context& ioc, transport_context const& ctx);
		~http_transport() override;

		char const* name() const override { return "http"; }

		// the number of open client connections
		int num_connections() const;

	private:

		friend struct aux::http_connection;

		int open(address const& bind_addr, int port, error_code& ec) override;
		void close(error_code& ec) override;
#ifndef SWARMGATE_DISABLE_LOGGING
		log_module module() const override { return log_module::http; }
#endif

		void do_accept();
		void on_accept(error_code const& ec, tcp::socket s);

		void add_connection(std::shared_ptr<aux::http_connection> const& c);
		void remove_connection(aux::http_connection const* c);

		boost::asio::io_context& m_ioc;
		tcp::acceptor m_acceptor;

		mutable std::mutex m_connections_mutex;
		std::unordered_map<aux::http_connection const*
			, std::weak_ptr<aux::http_connection>> m_connections;
	};
}

#endif
