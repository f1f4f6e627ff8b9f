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

#ifndef SWARMGATE_RANDOM_HPP_INCLUDED
#define SWARMGATE_RANDOM_HPP_INCLUDED

#include "swarmgate/config.hpp"

#include <cstddef>
#include <cstdint>
#include <random>

namespace swarmgate { namespace aux {

	SWARMGATE_EXTRA_EXPORT std::mt19937& random_engine();

	// returns a uniformly distributed number in the closed range [0, max]
	SWARMGATE_EXTRA_EXPORT std::uint32_t random(std::uint32_t max);

	// Fills the buffer with random bytes from a strong entropy source
	// (libcrypto's RAND_bytes). Throws system_error(no_entropy) if the
	// generator fails. Used for UDP connection ids, which must not be
	// guessable.
	SWARMGATE_EXTRA_EXPORT void crypto_random_bytes(char* buffer, std::size_t len);

	// a 64 bit value filled by crypto_random_bytes()
	SWARMGATE_EXTRA_EXPORT std::uint64_t crypto_random_uint64();
}}

#endif // SWARMGATE_RANDOM_HPP_INCLUDED
