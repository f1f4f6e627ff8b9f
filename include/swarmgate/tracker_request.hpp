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

#ifndef SWARMGATE_TRACKER_REQUEST_HPP_INCLUDED
#define SWARMGATE_TRACKER_REQUEST_HPP_INCLUDED

#include "swarmgate/config.hpp"
#include "swarmgate/address.hpp"
#include "swarmgate/error_code.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace swarmgate {

	enum class request_type : std::uint8_t { announce, scrape };

	// the announce event, with the values of the BEP 15 wire encoding
	enum class event_t : std::uint8_t
	{
		none = 0,
		completed = 1,
		started = 2,
		stopped = 3,
		paused = 4
	};

	enum class transport_protocol : std::uint8_t { http, udp, websocket };

	SWARMGATE_EXPORT char const* event_name(event_t e);

	// maps the event parameter of HTTP and WebSocket announces. Unknown
	// and empty strings are event_t::none
	SWARMGATE_EXPORT event_t parse_event(std::string const& e);

	// The transport independent form of an announce or scrape. Every
	// transport parses its framing into one of these. A request the
	// transport could not make sense of is still produced, with
	// ``malformed`` set, so the admission filter can reject it uniformly.
	struct SWARMGATE_EXPORT tracker_request
	{
		request_type type = request_type::announce;
		transport_protocol protocol = transport_protocol::http;

		// 20 raw bytes. Empty for a scrape of all swarms
		std::string info_hash;

		// the info-hashes of a scrape, 20 raw bytes each
		std::vector<std::string> scrape_hashes;

		// 20 raw bytes
		std::string peer_id;

		// the address the request came from, after proxy resolution
		address client;
		std::uint16_t port = 0;

		std::int64_t uploaded = 0;
		std::int64_t downloaded = 0;
		std::int64_t left = 0;
		event_t event = event_t::none;

		// -1 means not specified
		int num_want = -1;
		std::uint32_t key = 0;
		bool compact = true;

		bool malformed = false;
		std::string malformed_reason;
	};

	// returns true if ``s`` has the length of a binary info-hash or peer-id
	inline bool valid_hash(std::string const& s) { return s.size() == 20; }

	struct peer_entry
	{
		std::string peer_id;
		address ip;
		std::uint16_t port = 0;
	};

	struct SWARMGATE_EXPORT announce_response
	{
		// set when the request was denied or failed. failure_reason is the
		// text reported to the client
		error_code ec;
		std::string failure_reason;

		int interval = 0;
		int min_interval = 0;
		int complete = 0;
		int incomplete = 0;
		int downloaded = 0;
		std::vector<peer_entry> peers;
	};

	struct scrape_entry
	{
		std::string info_hash;
		int complete = 0;
		int incomplete = 0;
		int downloaded = 0;
	};

	struct SWARMGATE_EXPORT scrape_response
	{
		error_code ec;
		std::string failure_reason;
		std::vector<scrape_entry> files;
	};
}

#endif
