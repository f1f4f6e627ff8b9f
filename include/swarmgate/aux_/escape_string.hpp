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

#ifndef SWARMGATE_ESCAPE_STRING_HPP_INCLUDED
#define SWARMGATE_ESCAPE_STRING_HPP_INCLUDED

#include "swarmgate/config.hpp"
#include "swarmgate/error_code.hpp"

#include <string>
#include <utility>
#include <vector>

namespace swarmgate { namespace aux {

	// decodes %-escapes and '+' in a url component. Sets ``ec`` to
	// invalid_escaped_string on a truncated or non-hex escape
	SWARMGATE_EXTRA_EXPORT std::string unescape_string(std::string const& s, error_code& ec);

	// splits the query part of a request target (everything after '?', or
	// the whole string if there is no '?') into its key/value pairs. Keys
	// and values are unescaped. Keys may repeat, as the info_hash key of a
	// scrape does
	SWARMGATE_EXTRA_EXPORT std::vector<std::pair<std::string, std::string>>
	parse_query_string(std::string const& target, error_code& ec);

	// the path part of a request target, without the query string
	SWARMGATE_EXTRA_EXPORT std::string target_path(std::string const& target);

	// strips leading and trailing whitespace
	SWARMGATE_EXTRA_EXPORT std::string trim(std::string const& s);

	SWARMGATE_EXTRA_EXPORT std::string to_hex(std::string const& s);

	// converts a hex string to binary. Returns false if ``in`` has odd length
	// or contains non-hex characters
	SWARMGATE_EXTRA_EXPORT bool from_hex(std::string const& in, std::string& out);

}}

#endif // SWARMGATE_ESCAPE_STRING_HPP_INCLUDED
