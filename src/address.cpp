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

#include "swarmgate/address.hpp"

#include <cstdio> // for snprintf

namespace swarmgate {

	bool has_ipv4_form(address const& addr)
	{
		if (addr.is_v4()) return true;
		return addr.is_v6() && addr.to_v6().is_v4_mapped();
	}

	std::uint32_t to_uint32(address const& addr)
	{
		if (addr.is_v4()) return addr.to_v4().to_uint();
		address_v6 const v6 = addr.to_v6();
		if (!v6.is_v4_mapped()) return 0;
		return boost::asio::ip::make_address_v4(boost::asio::ip::v4_mapped, v6).to_uint();
	}

	std::uint32_t parse_ipv4(std::string const& str, error_code& ec)
	{
		boost::system::error_code e;
		address_v4 const a = boost::asio::ip::make_address_v4(str, e);
		if (e)
		{
			ec = errors::invalid_ip_address;
			return 0;
		}
		return a.to_uint();
	}

	std::string print_ipv4(std::uint32_t const addr)
	{
		return address_v4(addr).to_string();
	}

	std::string print_address(address const& addr)
	{
		return addr.to_string();
	}

	namespace {

	std::string print_endpoint(address const& addr, int const port)
	{
		char buf[200];
		if (addr.is_v6())
			std::snprintf(buf, sizeof(buf), "[%s]:%d", addr.to_string().c_str(), port);
		else
			std::snprintf(buf, sizeof(buf), "%s:%d", addr.to_string().c_str(), port);
		return buf;
	}

	}

	std::string print_endpoint(tcp::endpoint const& ep)
	{
		return print_endpoint(ep.address(), ep.port());
	}

	std::string print_endpoint(udp::endpoint const& ep)
	{
		return print_endpoint(ep.address(), ep.port());
	}
}
