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

#ifndef SWARMGATE_ADDRESS_HPP_INCLUDED
#define SWARMGATE_ADDRESS_HPP_INCLUDED

#include "swarmgate/config.hpp"
#include "swarmgate/error_code.hpp"

#include <boost/asio/ip/address.hpp>
#include <boost/asio/ip/address_v4.hpp>
#include <boost/asio/ip/address_v6.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ip/udp.hpp>

#include <cstdint>
#include <string>

namespace swarmgate {

	using boost::asio::ip::address;
	using boost::asio::ip::address_v4;
	using boost::asio::ip::address_v6;
	using boost::asio::ip::make_address;
	using tcp = boost::asio::ip::tcp;
	using udp = boost::asio::ip::udp;

	// returns true if ``addr`` can be represented as a 32 bit IPv4 integer,
	// i.e. it is an IPv4 address or an IPv4-mapped IPv6 address
	SWARMGATE_EXPORT bool has_ipv4_form(address const& addr);

	// the unsigned 32 bit (host byte order) form of an IPv4 address.
	// IPv4-mapped IPv6 addresses are unwrapped first. The return value is
	// undefined for addresses where has_ipv4_form() is false
	SWARMGATE_EXPORT std::uint32_t to_uint32(address const& addr);

	// parses a dotted-quad IPv4 address into its 32 bit form
	SWARMGATE_EXPORT std::uint32_t parse_ipv4(std::string const& str, error_code& ec);

	// prints the 32 bit form of an IPv4 address as a dotted quad
	SWARMGATE_EXPORT std::string print_ipv4(std::uint32_t addr);

	SWARMGATE_EXPORT std::string print_address(address const& addr);
	SWARMGATE_EXPORT std::string print_endpoint(tcp::endpoint const& ep);
	SWARMGATE_EXPORT std::string print_endpoint(udp::endpoint const& ep);
}

#endif
