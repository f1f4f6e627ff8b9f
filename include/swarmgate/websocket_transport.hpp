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

#ifndef SWARMGATE_WEBSOCKET_TRANSPORT_HPP_INCLUDED
#define SWARMGATE_WEBSOCKET_TRANSPORT_HPP_INCLUDED

#include "swarmgate/config.hpp"
#include "swarmgate/transport.hpp"
#include "swarmgate/tracker_request.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/optional.hpp>

#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace swarmgate {

namespace aux {
	struct websocket_session;
}

	// a WebRTC offer carried by an announce. Each one is relayed to a
	// different peer of the swarm
	struct rtc_offer
	{
		// raw bytes, chosen by the offering peer
		std::string offer_id;
		std::string sdp;
	};

	// the answer to a relayed offer, routed back to the peer that made it
	struct rtc_answer
	{
		std::string offer_id;
		// the peer-id of the offering peer, 20 raw bytes
		std::string to_peer_id;
		std::string sdp;
	};

	// the WebRTC signalling fields of an announce
	struct websocket_signals
	{
		std::vector<rtc_offer> offers;
		boost::optional<rtc_answer> answer;
	};

	// parses one WebTorrent style JSON message. info_hash and peer_id are
	// expected as strings with one code point per byte, 40 character hex
	// strings are accepted too. A message that is not a JSON object, or
	// that lacks required fields, yields a request with ``malformed`` set.
	// ``info_hash`` of a scrape may be a string or an array of strings.
	//
	// The offers and answer of an announce are stored in ``signals``, if
	// set. An announce with offers and no numwant asks for one peer per
	// offer
	SWARMGATE_EXTRA_EXPORT tracker_request parse_websocket_message(std::string const& msg
		, websocket_signals* signals = nullptr);

	// the JSON replies to the messages above
	SWARMGATE_EXTRA_EXPORT std::string websocket_announce_reply(tracker_request const& req
		, announce_response const& resp);
	SWARMGATE_EXTRA_EXPORT std::string websocket_scrape_reply(scrape_response const& resp);
	SWARMGATE_EXTRA_EXPORT std::string websocket_failure(std::string const& reason
		, std::string const& info_hash = std::string());

	// the messages relayed between peers. ``peer_id`` is the peer the offer
	// or answer comes from
	SWARMGATE_EXTRA_EXPORT std::string websocket_offer_message(std::string const& info_hash
		, std::string const& peer_id, rtc_offer const& offer);
	SWARMGATE_EXTRA_EXPORT std::string websocket_answer_message(std::string const& info_hash
		, std::string const& peer_id, rtc_answer const& answer);

	// A persistent signalling channel. Every text message is one announce or
	// scrape, and is rate limited and admission checked on its own, so a
	// session can be denied after a ban is added while it is open.
	//
	// A session that announced is reachable by its info-hash and peer-id
	// until it closes or announces stopped. The offers of an announce are
	// handed to reachable peers the swarm engine picked, one offer each,
	// and an answer is routed to the session named by ``to_peer_id``.
	// Answers are not acknowledged.
	//
	// A banned client is sent a failure reason, after which the session is
	// closed with a policy violation close frame. Rate limited and
	// malformed messages are answered with a failure reason and the session
	// stays open.
	class SWARMGATE_EXPORT websocket_transport final
		: public aux::transport_base
		, public std::enable_shared_from_this<websocket_transport>
	{
	public:

		websocket_transport(boost::asio::io_context& ioc, transport_context const& ctx);
		~websocket_transport() override;

		char const* name() const override { return "websocket"; }

		// the number of sessions, including ones still in the handshake
		int num_sessions() const;

		// the number of (info-hash, peer-id) pairs offers can be relayed to
		int num_reachable_peers() const;

	private:

		friend struct aux::websocket_session;

		int open(address const& bind_addr, int port, error_code& ec) override;
		void close(error_code& ec) override;
#ifndef SWARMGATE_DISABLE_LOGGING
		log_module module() const override { return log_module::websocket; }
#endif

		void do_accept();
		void on_accept(error_code const& ec, tcp::socket s);

		void add_session(std::shared_ptr<aux::websocket_session> const& s);

		// drops the session and every peer key it is still reachable by
		void remove_session(aux::websocket_session const* s
			, std::vector<std::string> const& peer_keys);

		// ``key`` is the info-hash followed by the peer-id. A newer session
		// announcing the same key replaces the old one
		void add_peer(std::string const& key
			, std::shared_ptr<aux::websocket_session> const& s);
		void remove_peer(std::string const& key, aux::websocket_session const* s);
		std::shared_ptr<aux::websocket_session> find_peer(std::string const& key) const;

		struct reachable_peer
		{
			aux::websocket_session const* owner;
			std::weak_ptr<aux::websocket_session> session;
		};

		boost::asio::io_context& m_ioc;
		tcp::acceptor m_acceptor;

		// guards both maps
		mutable std::mutex m_sessions_mutex;
		std::unordered_map<aux::websocket_session const*
			, std::weak_ptr<aux::websocket_session>> m_sessions;
		std::unordered_map<std::string, reachable_peer> m_peers;
	};
}

#endif
