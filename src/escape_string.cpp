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

#include "swarmgate/aux_/escape_string.hpp"

namespace swarmgate { namespace aux {

	namespace {

	int hex_to_int(char const in)
	{
		if (in >= '0' && in <= '9') return int(in) - '0';
		if (in >= 'A' && in <= 'F') return int(in) - 'A' + 10;
		if (in >= 'a' && in <= 'f') return int(in) - 'a' + 10;
		return -1;
	}

	bool is_space(char const c)
	{
		return c == ' ' || c == '\t' || c == '\n' || c == '\r'
			|| c == '\f' || c == '\v';
	}

	char const hex_chars[] = "0123456789abcdef";

	}

	std::string unescape_string(std::string const& s, error_code& ec)
	{
		std::string ret;
		ret.reserve(s.size());
		for (auto i = s.begin(); i != s.end(); ++i)
		{
			if (*i == '+')
			{
				ret += ' ';
			}
			else if (*i != '%')
			{
				ret += *i;
			}
			else
			{
				++i;
				if (i == s.end())
				{
					ec = errors::invalid_escaped_string;
					return ret;
				}
				int const high = hex_to_int(*i);
				if (high < 0)
				{
					ec = errors::invalid_escaped_string;
					return ret;
				}

				++i;
				if (i == s.end())
				{
					ec = errors::invalid_escaped_string;
					return ret;
				}
				int const low = hex_to_int(*i);
				if (low < 0)
				{
					ec = errors::invalid_escaped_string;
					return ret;
				}

				ret += char(high * 16 + low);
			}
		}
		return ret;
	}

	std::vector<std::pair<std::string, std::string>>
	parse_query_string(std::string const& target, error_code& ec)
	{
		std::vector<std::pair<std::string, std::string>> ret;

		std::string::size_type pos = target.find('?');
		pos = (pos == std::string::npos) ? 0 : pos + 1;

		while (pos < target.size())
		{
			std::string::size_type end = target.find('&', pos);
			if (end == std::string::npos) end = target.size();

			std::string const item = target.substr(pos, end - pos);
			pos = end + 1;
			if (item.empty()) continue;

			std::string::size_type const eq = item.find('=');
			std::string key = unescape_string(item.substr(0, eq), ec);
			if (ec) return ret;
			std::string val;
			if (eq != std::string::npos)
			{
				val = unescape_string(item.substr(eq + 1), ec);
				if (ec) return ret;
			}
			ret.emplace_back(std::move(key), std::move(val));
		}
		return ret;
	}

	std::string target_path(std::string const& target)
	{
		return target.substr(0, target.find('?'));
	}

	std::string trim(std::string const& s)
	{
		std::string::size_type start = 0;
		while (start < s.size() && is_space(s[start])) ++start;
		std::string::size_type end = s.size();
		while (end > start && is_space(s[end - 1])) --end;
		return s.substr(start, end - start);
	}

	std::string to_hex(std::string const& s)
	{
		std::string ret;
		ret.reserve(s.size() * 2);
		for (char const c : s)
		{
			ret += hex_chars[std::uint8_t(c) >> 4];
			ret += hex_chars[std::uint8_t(c) & 0xf];
		}
		return ret;
	}

	bool from_hex(std::string const& in, std::string& out)
	{
		if (in.size() % 2 != 0) return false;
		std::string ret;
		ret.reserve(in.size() / 2);
		for (std::size_t i = 0; i < in.size(); i += 2)
		{
			int const t1 = hex_to_int(in[i]);
			int const t2 = hex_to_int(in[i + 1]);
			if (t1 < 0 || t2 < 0) return false;
			ret += char((t1 << 4) | t2);
		}
		out = std::move(ret);
		return true;
	}

}}
