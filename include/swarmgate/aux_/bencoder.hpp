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

#ifndef SWARMGATE_BENCODER_HPP_INCLUDED
#define SWARMGATE_BENCODER_HPP_INCLUDED

#include <cstdint>
#include <string>

namespace swarmgate { namespace aux { namespace bencode {

	// streaming bencode writer. Structures are opened by constructing a
	// list or dict on the buffer and closed by their destructor. Dict keys
	// must be added in sorted order by the caller
	using buffer = std::string;

	inline void write_string(buffer& out, std::string const& val)
	{
		out += std::to_string(val.size());
		out += ':';
		out += val;
	}

	inline void write_int(buffer& out, std::int64_t const val)
	{
		out += 'i';
		out += std::to_string(val);
		out += 'e';
	}

	struct list
	{
		explicit list(buffer& o): m_out(o) { m_out += 'l'; }
		list(list const&) = delete;
		list& operator=(list const&) = delete;
		void add(std::string const& val) { write_string(m_out, val); }
		void add(std::int64_t val) { write_int(m_out, val); }
		~list() { m_out += 'e'; }
	private:
		buffer& m_out;
	};

	struct dict
	{
		explicit dict(buffer& o): m_out(o) { m_out += 'd'; }
		dict(dict const&) = delete;
		dict& operator=(dict const&) = delete;

		void add(std::string const& key, std::int64_t val)
		{
			add_key(key);
			add_value(val);
		}

		void add(std::string const& key, std::string const& val)
		{
			add_key(key);
			add_value(val);
		}

		void add(std::string const& key, char const* val)
		{
			add_key(key);
			add_value(std::string(val));
		}

		void add_key(std::string const& key) { write_string(m_out, key); }
		void add_value(std::string const& val) { write_string(m_out, val); }
		void add_value(std::int64_t val) { write_int(m_out, val); }
		~dict() { m_out += 'e'; }
	private:
		buffer& m_out;
	};
}}}

#endif
