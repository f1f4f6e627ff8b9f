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

#include "swarmgate/ban_range.hpp"
#include "swarmgate/address.hpp"
#include "swarmgate/aux_/escape_string.hpp"

#include <cstdlib>

namespace swarmgate {

	error_code validate_ban_range(ban_range const& r)
	{
		if (r.from_ip > r.to_ip) return errors::invalid_ban_range;
		if (r.reason.size() > max_ban_reason_length) return errors::ban_reason_too_long;
		return error_code();
	}

	ban_range parse_ban_range(std::string const& line, error_code& ec)
	{
		ban_range ret;
		std::string const in = aux::trim(line);

		std::string::size_type const sp = in.find_first_of(" \t");
		std::string const range_str = in.substr(0, sp);
		if (sp != std::string::npos) ret.reason = aux::trim(in.substr(sp));

		std::string::size_type const slash = range_str.find('/');
		std::string::size_type const dash = range_str.find('-');

		if (slash != std::string::npos)
		{
			std::uint32_t const base = parse_ipv4(range_str.substr(0, slash), ec);
			if (ec) return ret;
			std::string const bits_str = range_str.substr(slash + 1);
			char* end = nullptr;
			long const bits = std::strtol(bits_str.c_str(), &end, 10);
			if (bits_str.empty() || *end != '\0' || bits < 0 || bits > 32)
			{
				ec = errors::invalid_ip_address;
				return ret;
			}
			std::uint32_t const mask = bits == 0 ? 0 : ~std::uint32_t(0) << (32 - bits);
			ret.from_ip = base & mask;
			ret.to_ip = ret.from_ip | ~mask;
		}
		else if (dash != std::string::npos)
		{
			ret.from_ip = parse_ipv4(range_str.substr(0, dash), ec);
			if (ec) return ret;
			ret.to_ip = parse_ipv4(range_str.substr(dash + 1), ec);
			if (ec) return ret;
		}
		else
		{
			ret.from_ip = parse_ipv4(range_str, ec);
			if (ec) return ret;
			ret.to_ip = ret.from_ip;
		}

		ec = validate_ban_range(ret);
		return ret;
	}

	std::string print_ban_range(ban_range const& r)
	{
		return print_ipv4(r.from_ip) + "-" + print_ipv4(r.to_ip);
	}
}
