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

#ifndef SWARMGATE_ASSERT_HPP_INCLUDED
#define SWARMGATE_ASSERT_HPP_INCLUDED

#include "swarmgate/config.hpp"

namespace swarmgate {

// internal
SWARMGATE_EXPORT void assert_fail(char const* expr, int line
	, char const* file, char const* function);

}

#if SWARMGATE_USE_ASSERTS

#define SWARMGATE_ASSERT(x) \
	do { if (x) {} else sg::assert_fail(#x, __LINE__, __FILE__, __func__); } while (false)

#define SWARMGATE_ASSERT_FAIL() \
	sg::assert_fail("<unconditional>", __LINE__, __FILE__, __func__)

#else

#define SWARMGATE_ASSERT(x) do {} while (false)
#define SWARMGATE_ASSERT_FAIL() do {} while (false)

#endif

#endif // SWARMGATE_ASSERT_HPP_INCLUDED
