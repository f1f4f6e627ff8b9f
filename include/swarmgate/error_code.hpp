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

#ifndef SWARMGATE_ERROR_CODE_HPP_INCLUDED
#define SWARMGATE_ERROR_CODE_HPP_INCLUDED

#include "swarmgate/config.hpp"

#include <boost/system/error_code.hpp>
#include <boost/system/system_error.hpp>
#include <boost/asio/error.hpp>

#include <string>

namespace swarmgate {

	namespace errors
	{
		// swarmgate uses boost.system's ``error_code`` class to represent
		// errors. swarmgate has its own error category swarmgate_category()
		// with the error codes defined by error_code_enum.
		enum error_code_enum
		{
			// Not an error
			no_error = 0,

			// a ban range whose first address is greater than its last
			invalid_ban_range,
			// the reason string of a ban range exceeds 255 bytes
			ban_reason_too_long,
			// a ban range with the same first and last address already exists
			duplicate_ban_range,
			// there is no ban range with the specified id
			ban_range_not_found,

			// the request was rejected by one of the rate limit policies
			rate_limit_exceeded,
			// the request was rejected by an admission extension
			admission_denied,
			// the client address is inside a banned range
			banned_address,
			// the request is missing required parameters or could not be parsed
			malformed_request,

			// start() was called on a transport that is already running
			transport_already_started,
			// start() was called on a transport that has been stopped
			transport_stopped,
			// a transport failed to open or bind its listen socket
			transport_startup_failed,
			// a transport failed to release its listen socket cleanly
			transport_shutdown_failed,

			// a UDP tracker request carried an unknown or expired connection id
			invalid_connection_id,
			// the UDP connection table is full
			too_many_connections,

			// there is no setting with the specified name
			unknown_setting,
			// the value could not be converted to the type of the setting
			invalid_setting_value,
			// the string was not properly url-encoded as expected
			invalid_escaped_string,
			// the string is not a valid IPv4 address, range or CIDR block
			invalid_ip_address,
			// the random number generator failed to produce entropy
			no_entropy,

			// the number of error codes
			error_code_max
		};

		// hidden
		SWARMGATE_EXPORT boost::system::error_code make_error_code(error_code_enum e);

	} // namespace errors

	// return the instance of the swarmgate_error_category which
	// maps swarmgate error codes to human readable error messages.
	SWARMGATE_EXPORT boost::system::error_category& swarmgate_category();

	using boost::system::error_code;
	using boost::system::error_condition;
	using boost::system::system_error;

	// internal
	using boost::system::generic_category;
	using boost::system::system_category;

	// returns true for errors the administrative caller can correct by
	// changing its input (invalid, too long or duplicate ban ranges)
	SWARMGATE_EXPORT bool is_validation_error(error_code const& ec);

	// returns true for the errors an admission filter produces when it
	// denies a request
	SWARMGATE_EXPORT bool is_admission_error(error_code const& ec);

namespace aux {

	template <class E, class... Args>
	[[noreturn]] void throw_ex(Args&&... args)
	{
		throw E(std::forward<Args>(args)...);
	}

}

}

namespace boost { namespace system {

	template<> struct is_error_code_enum<swarmgate::errors::error_code_enum>
	{ static const bool value = true; };

} }

#endif
