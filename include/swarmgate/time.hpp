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

#ifndef SWARMGATE_TIME_HPP_INCLUDED
#define SWARMGATE_TIME_HPP_INCLUDED

#include "swarmgate/config.hpp"

#include <chrono>
#include <cstdint>
#include <string>

namespace swarmgate {

	using clock_type = std::chrono::steady_clock;

	using time_point = clock_type::time_point;
	using time_duration = clock_type::duration;

	// 32 bit versions of duration, with second resolution
	using seconds32 = std::chrono::duration<std::int32_t>;

	using seconds = std::chrono::seconds;
	using milliseconds = std::chrono::milliseconds;
	using minutes = std::chrono::minutes;
	using std::chrono::duration_cast;

	template<class T>
	std::int64_t total_seconds(T td)
	{ return duration_cast<seconds>(td).count(); }

	template<class T>
	std::int64_t total_milliseconds(T td)
	{ return duration_cast<milliseconds>(td).count(); }

	// returns the time elapsed since the first call, formatted as
	// HH:MM:SS.mmm. Used as the prefix of log lines
	SWARMGATE_EXPORT std::string time_now_string();
	SWARMGATE_EXPORT std::string time_to_string(time_point tp);
}

#endif // SWARMGATE_TIME_HPP_INCLUDED
