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

#ifndef SWARMGATE_BAN_RANGE_HPP_INCLUDED
#define SWARMGATE_BAN_RANGE_HPP_INCLUDED

#include "swarmgate/config.hpp"
#include "swarmgate/error_code.hpp"

#include <boost/optional.hpp>

#include <cstdint>
#include <ctime>
#include <string>

namespace swarmgate {

	// the width of the persisted reason column
	constexpr std::size_t max_ban_reason_length = 255;

	// an inclusive range of IPv4 addresses, in host byte order integer
	// form, that is denied admission. ``id`` and ``created`` are assigned by
	// the store on insert
	struct SWARMGATE_EXPORT ban_range
	{
		ban_range() = default;
		ban_range(std::uint32_t first, std::uint32_t last, std::string r = std::string())
			: from_ip(first), to_ip(last), reason(std::move(r)) {}

		int id = 0;
		std::uint32_t from_ip = 0;
		std::uint32_t to_ip = 0;
		std::string reason;
		std::time_t created = 0;

		bool contains(std::uint32_t const addr) const
		{ return from_ip <= addr && addr <= to_ip; }

		friend bool operator==(ban_range const& lhs, ban_range const& rhs)
		{
			return lhs.id == rhs.id
				&& lhs.from_ip == rhs.from_ip
				&& lhs.to_ip == rhs.to_ip
				&& lhs.reason == rhs.reason
				&& lhs.created == rhs.created;
		}
	};

	// the fields of an update. Fields left unset keep their stored value
	struct ban_range_patch
	{
		boost::optional<std::uint32_t> from_ip;
		boost::optional<std::uint32_t> to_ip;
		boost::optional<std::string> reason;
	};

	// returns invalid_ban_range or ban_reason_too_long if the range cannot
	// be stored, otherwise a cleared error_code
	SWARMGATE_EXPORT error_code validate_ban_range(ban_range const& r);

	// parses one line of administrator input into a ban range. Accepted
	// forms are a single address (``10.0.0.1``), an inclusive range
	// (``10.0.0.0-10.0.0.255``) and a CIDR block (``10.0.0.0/8``), optionally
	// followed by whitespace and a free text reason. Sets ``ec`` to
	// invalid_ip_address or invalid_ban_range on failure
	SWARMGATE_EXPORT ban_range parse_ban_range(std::string const& line, error_code& ec);

	// the range as text, e.g. "192.168.1.0-192.168.1.255"
	SWARMGATE_EXPORT std::string print_ban_range(ban_range const& r);
}

#endif
