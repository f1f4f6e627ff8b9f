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

#include "swarmgate/aux_/utf8.hpp"

#include <cstdint>

namespace swarmgate { namespace aux {

	std::string latin1_utf8(std::string const& s)
	{
		std::string ret;
		ret.reserve(s.size() * 2);
		for (char const ch : s)
		{
			std::uint8_t const c = std::uint8_t(ch);
			if (c < 0x80)
			{
				ret += char(c);
			}
			else
			{
				ret += char(0xc0 | (c >> 6));
				ret += char(0x80 | (c & 0x3f));
			}
		}
		return ret;
	}

	std::string utf8_latin1(std::string const& s, error_code& ec)
	{
		std::string ret;
		ret.reserve(s.size());
		for (std::size_t i = 0; i < s.size(); ++i)
		{
			std::uint8_t const c = std::uint8_t(s[i]);
			if (c < 0x80)
			{
				ret += char(c);
				continue;
			}
			// only two byte sequences encode code points up to U+00FF
			if ((c & 0xfe) != 0xc2 || i + 1 == s.size()
				|| (std::uint8_t(s[i + 1]) & 0xc0) != 0x80)
			{
				ec = errors::malformed_request;
				return ret;
			}
			ret += char(((c & 0x1f) << 6) | (std::uint8_t(s[i + 1]) & 0x3f));
			++i;
		}
		return ret;
	}
}}
