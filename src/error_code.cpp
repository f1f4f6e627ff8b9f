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
#include "swarmgate/error_code.hpp"

namespace swarmgate {

	struct swarmgate_error_category final : boost::system::error_category
	{
		const char* name() const BOOST_SYSTEM_NOEXCEPT override;
		std::string message(int ev) const override;
		boost::system::error_condition default_error_condition(int ev) const BOOST_SYSTEM_NOEXCEPT override
		{ return {ev, *this}; }
	};

	const char* swarmgate_error_category::name() const BOOST_SYSTEM_NOEXCEPT
	{
		return "swarmgate";
	}

	std::string swarmgate_error_category::message(int ev) const
	{
		static char const* msgs[] =
		{
			"no error",

			"invalid ban range, first address is greater than last",
			"ban reason is too long",
			"a ban range with these addresses already exists",
			"ban range not found",

			"rate limit exceeded",
			"request denied",
			"client address is banned",
			"malformed request",

			"transport is already started",
			"transport has been stopped",
			"transport failed to start",
			"transport failed to shut down cleanly",

			"invalid connection id",
			"too many connections",

			"unknown setting",
			"invalid setting value",
			"invalid escaped string",
			"invalid IP address",
			"no entropy available",
		};
		static_assert(sizeof(msgs) / sizeof(msgs[0]) == errors::error_code_max
			, "error message table out of sync with error_code_enum");
		if (ev < 0 || ev >= int(sizeof(msgs) / sizeof(msgs[0])))
			return "Unknown error";
		return msgs[ev];
	}

	boost::system::error_category& swarmgate_category()
	{
		static swarmgate_error_category swarmgate_category;
		return swarmgate_category;
	}

	bool is_validation_error(error_code const& ec)
	{
		if (ec.category() != swarmgate_category()) return false;
		return ec == errors::invalid_ban_range
			|| ec == errors::ban_reason_too_long
			|| ec == errors::duplicate_ban_range;
	}

	bool is_admission_error(error_code const& ec)
	{
		if (ec.category() != swarmgate_category()) return false;
		return ec == errors::admission_denied
			|| ec == errors::banned_address
			|| ec == errors::malformed_request;
	}

	namespace errors
	{
		boost::system::error_code make_error_code(error_code_enum e)
		{
			return {e, swarmgate_category()};
		}
	}

}
