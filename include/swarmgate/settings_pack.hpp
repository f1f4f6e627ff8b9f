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

#ifndef SWARMGATE_SETTINGS_PACK_HPP_INCLUDED
#define SWARMGATE_SETTINGS_PACK_HPP_INCLUDED

#include "swarmgate/config.hpp"
#include "swarmgate/error_code.hpp"

#include <array>
#include <string>

namespace swarmgate {

	// The ``settings_pack`` holds every configuration option of the gateway.
	// A default constructed pack has every setting at its default value.
	// Settings are addressed by the enum values of string_types, int_types
	// and bool_types, and the type of the accessor must match the type of
	// the setting.
	//
	// The gateway reads the pack once, at construction.
	struct SWARMGATE_EXPORT settings_pack
	{
		settings_pack();

		void set_str(int name, std::string val);
		void set_int(int name, int val);
		void set_bool(int name, bool val);

		std::string const& get_str(int name) const;
		int get_int(int name) const;
		bool get_bool(int name) const;

		// setting names (indices) are 16 bits. The two most significant
		// bits indicate what type the setting has. (string, int, bool)
		enum type_bases
		{
			string_type_base = 0x0000,
			int_type_base =    0x4000,
			bool_type_base =   0x8000,
			type_mask =        0xc000,
			index_mask =       0x3fff
		};

		enum string_types
		{
			// the interface all transports bind to. Defaults to all IPv4
			// interfaces
			listen_interface = string_type_base,

			// HTTP paths starting with this prefix are rate limited as
			// authentication routes
			auth_route_prefix,

			max_string_setting_internal
		};

		enum int_types
		{
			// the TCP port of the HTTP announce/scrape transport. 0 picks an
			// ephemeral port
			http_port = int_type_base,

			// the UDP port of the BEP 15 transport
			udp_port,

			// the TCP port of the WebSocket signalling transport
			websocket_port,

			// the number of threads running the network io_context
			network_threads,

			// the announce interval, in seconds, handed to peers
			announce_interval,

			// the minimum announce interval, in seconds, handed to peers
			min_announce_interval,

			// the number of peers returned when a request does not specify
			// numwant, and the upper bound on numwant
			default_numwant,
			max_numwant,

			// peers that have not announced for this many seconds are
			// removed from the swarm
			peer_timeout,

			// the maximum number of info-hashes in one scrape request
			max_scrape_hashes,

			// seconds an HTTP client has to send a complete request
			http_request_timeout,

			// seconds a UDP connection id stays valid after the connect
			// handshake
			udp_connection_timeout,

			// the max number of outstanding UDP connection ids
			udp_max_connections,

			// seconds a WebSocket client has to complete the opening
			// handshake
			websocket_handshake_timeout,

			// seconds of silence after which a WebSocket session is closed
			websocket_idle_timeout,

			// the largest WebSocket message accepted, in bytes
			websocket_max_message_size,

			// the slow-down policy. After ``slow_down_after`` requests within
			// ``slow_down_window`` seconds, each further request from the same
			// IP is delayed by ``slow_down_delay`` milliseconds, never more
			// than ``slow_down_max_delay`` milliseconds
			slow_down_window,
			slow_down_after,
			slow_down_delay,
			slow_down_max_delay,

			// quota applied to every route
			global_quota_window,
			global_quota_limit,

			// quota applied to announce and scrape on every transport
			announce_quota_window,
			announce_quota_limit,

			// quota applied to HTTP routes other than announce and scrape
			api_quota_window,
			api_quota_limit,

			// quota applied to HTTP routes under auth_route_prefix
			auth_quota_window,
			auth_quota_limit,

			// seconds between maintenance passes (rate limit eviction, swarm
			// purging)
			maintenance_interval,

			max_int_setting_internal
		};

		enum bool_types
		{
			// start the BEP 15 UDP transport. The HTTP transport is always
			// started
			enable_udp = bool_type_base,

			// start the WebSocket transport
			enable_websocket,

			// take the client address from the first X-Forwarded-For entry
			// of HTTP requests. Only enable behind a reverse proxy
			trust_proxy,

			// serve swarm statistics as JSON at /stats on the HTTP transport
			enable_stats,

			max_bool_setting_internal
		};

		constexpr static int num_string_settings = int(max_string_setting_internal) - int(string_type_base);
		constexpr static int num_int_settings = int(max_int_setting_internal) - int(int_type_base);
		constexpr static int num_bool_settings = int(max_bool_setting_internal) - int(bool_type_base);

	private:

		std::array<std::string, num_string_settings> m_strings;
		std::array<int, num_int_settings> m_ints;
		std::array<bool, num_bool_settings> m_bools;
	};

	// converts a setting name (as used in the enums above) to its enum
	// value. Returns -1 for unknown names
	SWARMGATE_EXPORT int setting_by_name(std::string const& name);

	// returns the name of a setting, or an empty string for invalid values
	SWARMGATE_EXPORT char const* name_for_setting(int s);

	// assigns the setting called ``name`` from its textual form. Booleans
	// accept 1/0, true/false and on/off. Sets ``ec`` to unknown_setting or
	// invalid_setting_value on failure and leaves the pack unchanged
	SWARMGATE_EXPORT void apply_setting(settings_pack& p, std::string const& name
		, std::string const& value, error_code& ec);
}

#endif
