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

#ifndef SWARMGATE_UDP_TRANSPORT_HPP_INCLUDED
#define SWARMGATE_UDP_TRANSPORT_HPP_INCLUDED

#include "swarmgate/config.hpp"
#include "swarmgate/time.hpp"
#include "swarmgate/transport.hpp"
#include "swarmgate/tracker_request.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/udp.hpp>
#include <boost/asio/steady_timer.hpp>

#include <array>
#include <cstdint>
#include <memory>
#include <string>
#include <unordered_map>

namespace swarmgate {

	// the BEP 15 wire constants
	namespace udp_tracker {
		constexpr std::uint64_t protocol_id = 0x41727101980ull;

		enum action_t : std::uint32_t
		{
			action_connect = 0,
			action_announce = 1,
			action_scrape = 2,
			action_error = 3
		};

		constexpr int header_size = 16;
		constexpr int announce_size = 98;
		constexpr int max_packet_size = 1500;
	}

	// The BEP 15 UDP tracker protocol. A client first sends a connect
	// request and is handed a random 64 bit connection id, which is valid
	// for udp_connection_timeout seconds and only from the address that
	// requested it. Announce and scrape requests must carry a valid id.
	//
	// Announces and scrapes are rate limited per datagram, by source
	// address. Connect requests are bounded by udp_max_connections
	// instead. Denials and rate limit rejections are answered with error
	// packets.
	class SWARMGATE_EXPORT udp_transport final
		: public aux::transport_base
		, public std::enable_shared_from_this<udp_transport>
	{
	public:

		udp_transport(boost::asio::io_context& ioc, transport_context const& ctx);
		~udp_transport() override;

		char const* name() const override { return "udp"; }

		// the number of live connection ids
		int num_connection_ids() const;

		// removes expired connection ids. Returns the number removed
		int sweep_connection_ids(time_point now);

	private:

		int open(address const& bind_addr, int port, error_code& ec) override;
		void close(error_code& ec) override;
#ifndef SWARMGATE_DISABLE_LOGGING
		log_module module() const override { return log_module::udp; }
#endif

		void do_receive();
		void on_receive(error_code const& ec, std::size_t bytes_transferred);
		void start_sweep_timer();
		void on_sweep(error_code const& ec);

		void incoming_packet(std::string const& packet, udp::endpoint const& from);
		void on_connect(std::uint32_t transaction_id, udp::endpoint const& from);
		void on_announce(std::string const& packet, udp::endpoint const& from);
		void on_scrape(std::string const& packet, udp::endpoint const& from);

		// rate limits the request, then hands it to process() either
		// immediately or after the slow-down delay
		void submit(tracker_request req, std::uint32_t transaction_id
			, udp::endpoint const& from);
		void process(tracker_request const& req, std::uint32_t transaction_id
			, udp::endpoint const& from);

		bool verify_connection_id(std::uint64_t id, udp::endpoint const& from);

		void send_error(std::uint32_t transaction_id, std::string const& msg
			, udp::endpoint const& to);
		void send(std::string const& buf, udp::endpoint const& to);

		struct connection_entry
		{
			address addr;
			time_point expires;
		};

		boost::asio::io_context& m_ioc;
		udp::socket m_socket;
		boost::asio::steady_timer m_sweep_timer;

		// only one receive is outstanding at a time. Packets are copied out
		// before they are handled
		std::array<char, udp_tracker::max_packet_size> m_buffer;
		udp::endpoint m_from;

		mutable std::mutex m_connections_mutex;
		std::unordered_map<std::uint64_t, connection_entry> m_connections;
	};
}

#endif
