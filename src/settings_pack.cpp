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

#include "swarmgate/config.hpp"
#include "swarmgate/assert.hpp"
#include "swarmgate/settings_pack.hpp"

#include <cerrno>
#include <climits>
#include <cstdlib>

namespace swarmgate {

	struct str_setting_entry_t
	{
		// the name of this setting. used for the command line and lookups
		char const* name;
		char const* default_value;
	};

	struct int_setting_entry_t
	{
		// the name of this setting. used for the command line and lookups
		char const* name;
		int default_value;
	};

	struct bool_setting_entry_t
	{
		// the name of this setting. used for the command line and lookups
		char const* name;
		bool default_value;
	};

#define SET(name, default_value) { #name, default_value }

	namespace {

	std::array<str_setting_entry_t, settings_pack::num_string_settings> const str_settings
	{{
		SET(listen_interface, "0.0.0.0"),
		SET(auth_route_prefix, "/api/auth"),
	}};

	std::array<int_setting_entry_t, settings_pack::num_int_settings> const int_settings
	{{
		SET(http_port, 3000),
		SET(udp_port, 6969),
		SET(websocket_port, 3001),
		SET(network_threads, 1),
		SET(announce_interval, 300),
		SET(min_announce_interval, 60),
		SET(default_numwant, 50),
		SET(max_numwant, 200),
		SET(peer_timeout, 20 * 60),
		SET(max_scrape_hashes, 64),
		SET(http_request_timeout, 30),
		SET(udp_connection_timeout, 120),
		SET(udp_max_connections, 100000),
		SET(websocket_handshake_timeout, 10),
		SET(websocket_idle_timeout, 10 * 60),
		SET(websocket_max_message_size, 64 * 1024),
		SET(slow_down_window, 15 * 60),
		SET(slow_down_after, 100),
		SET(slow_down_delay, 500),
		SET(slow_down_max_delay, 20000),
		SET(global_quota_window, 15 * 60),
		SET(global_quota_limit, 1000),
		SET(announce_quota_window, 60),
		SET(announce_quota_limit, 100),
		SET(api_quota_window, 15 * 60),
		SET(api_quota_limit, 100),
		SET(auth_quota_window, 15 * 60),
		SET(auth_quota_limit, 5),
		SET(maintenance_interval, 30),
	}};

	std::array<bool_setting_entry_t, settings_pack::num_bool_settings> const bool_settings
	{{
		SET(enable_udp, false),
		SET(enable_websocket, false),
		SET(trust_proxy, false),
		SET(enable_stats, false),
	}};

	} // anonymous namespace

#undef SET

	settings_pack::settings_pack()
	{
		for (int i = 0; i < num_string_settings; ++i)
			m_strings[std::size_t(i)] = str_settings[std::size_t(i)].default_value;
		for (int i = 0; i < num_int_settings; ++i)
			m_ints[std::size_t(i)] = int_settings[std::size_t(i)].default_value;
		for (int i = 0; i < num_bool_settings; ++i)
			m_bools[std::size_t(i)] = bool_settings[std::size_t(i)].default_value;
	}

	void settings_pack::set_str(int const name, std::string val)
	{
		SWARMGATE_ASSERT((name & type_mask) == string_type_base);
		if ((name & type_mask) != string_type_base) return;
		int const idx = name & index_mask;
		if (idx >= num_string_settings) return;
		m_strings[std::size_t(idx)] = std::move(val);
	}

	void settings_pack::set_int(int const name, int const val)
	{
		SWARMGATE_ASSERT((name & type_mask) == int_type_base);
		if ((name & type_mask) != int_type_base) return;
		int const idx = name & index_mask;
		if (idx >= num_int_settings) return;
		m_ints[std::size_t(idx)] = val;
	}

	void settings_pack::set_bool(int const name, bool const val)
	{
		SWARMGATE_ASSERT((name & type_mask) == bool_type_base);
		if ((name & type_mask) != bool_type_base) return;
		int const idx = name & index_mask;
		if (idx >= num_bool_settings) return;
		m_bools[std::size_t(idx)] = val;
	}

	std::string const& settings_pack::get_str(int const name) const
	{
		static std::string const empty;
		SWARMGATE_ASSERT((name & type_mask) == string_type_base);
		if ((name & type_mask) != string_type_base) return empty;
		int const idx = name & index_mask;
		if (idx >= num_string_settings) return empty;
		return m_strings[std::size_t(idx)];
	}

	int settings_pack::get_int(int const name) const
	{
		SWARMGATE_ASSERT((name & type_mask) == int_type_base);
		if ((name & type_mask) != int_type_base) return 0;
		int const idx = name & index_mask;
		if (idx >= num_int_settings) return 0;
		return m_ints[std::size_t(idx)];
	}

	bool settings_pack::get_bool(int const name) const
	{
		SWARMGATE_ASSERT((name & type_mask) == bool_type_base);
		if ((name & type_mask) != bool_type_base) return false;
		int const idx = name & index_mask;
		if (idx >= num_bool_settings) return false;
		return m_bools[std::size_t(idx)];
	}

	int setting_by_name(std::string const& key)
	{
		for (int k = 0; k < settings_pack::num_string_settings; ++k)
		{
			if (key != str_settings[std::size_t(k)].name) continue;
			return settings_pack::string_type_base + k;
		}
		for (int k = 0; k < settings_pack::num_int_settings; ++k)
		{
			if (key != int_settings[std::size_t(k)].name) continue;
			return settings_pack::int_type_base + k;
		}
		for (int k = 0; k < settings_pack::num_bool_settings; ++k)
		{
			if (key != bool_settings[std::size_t(k)].name) continue;
			return settings_pack::bool_type_base + k;
		}
		return -1;
	}

	char const* name_for_setting(int const s)
	{
		if (s < 0) return "";
		int const idx = s & settings_pack::index_mask;
		switch (s & settings_pack::type_mask)
		{
			case settings_pack::string_type_base:
				if (idx >= settings_pack::num_string_settings) break;
				return str_settings[std::size_t(idx)].name;
			case settings_pack::int_type_base:
				if (idx >= settings_pack::num_int_settings) break;
				return int_settings[std::size_t(idx)].name;
			case settings_pack::bool_type_base:
				if (idx >= settings_pack::num_bool_settings) break;
				return bool_settings[std::size_t(idx)].name;
		}
		return "";
	}

	void apply_setting(settings_pack& p, std::string const& key
		, std::string const& value, error_code& ec)
	{
		int const sett_name = setting_by_name(key);
		if (sett_name < 0)
		{
			ec = errors::unknown_setting;
			return;
		}

		switch (sett_name & settings_pack::type_mask)
		{
			case settings_pack::string_type_base:
				p.set_str(sett_name, value);
				break;
			case settings_pack::bool_type_base:
				if (value == "1" || value == "on" || value == "true")
				{
					p.set_bool(sett_name, true);
				}
				else if (value == "0" || value == "off" || value == "false")
				{
					p.set_bool(sett_name, false);
				}
				else
				{
					ec = errors::invalid_setting_value;
				}
				break;
			case settings_pack::int_type_base:
			{
				if (value.empty())
				{
					ec = errors::invalid_setting_value;
					return;
				}
				char* end = nullptr;
				errno = 0;
				long const v = std::strtol(value.c_str(), &end, 10);
				if (*end != '\0' || errno == ERANGE || v < INT_MIN || v > INT_MAX)
				{
					ec = errors::invalid_setting_value;
					return;
				}
				p.set_int(sett_name, int(v));
				break;
			}
		}
	}
}
