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

#include "swarmgate/config.hpp"
#include "swarmgate/random.hpp"
#include "swarmgate/error_code.hpp"

extern "C" {
#include <openssl/rand.h>
}

#include <cstring>

namespace swarmgate { namespace aux {

	std::mt19937& random_engine()
	{
		static std::random_device dev;
		thread_local static std::seed_seq seed({dev(), dev(), dev(), dev()});
		thread_local static std::mt19937 rng(seed);
		return rng;
	}

	std::uint32_t random(std::uint32_t const max)
	{
		return std::uniform_int_distribution<std::uint32_t>(0, max)(random_engine());
	}

	void crypto_random_bytes(char* buffer, std::size_t const len)
	{
		int const r = RAND_bytes(reinterpret_cast<unsigned char*>(buffer), int(len));
		if (r != 1) aux::throw_ex<system_error>(errors::no_entropy);
	}

	std::uint64_t crypto_random_uint64()
	{
		char buf[8];
		crypto_random_bytes(buf, sizeof(buf));
		std::uint64_t ret;
		std::memcpy(&ret, buf, sizeof(ret));
		return ret;
	}
}}
