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

#ifndef SWARMGATE_ADMISSION_FILTER_HPP_INCLUDED
#define SWARMGATE_ADMISSION_FILTER_HPP_INCLUDED

#include "swarmgate/config.hpp"
#include "swarmgate/address.hpp"
#include "swarmgate/error_code.hpp"
#include "swarmgate/logger.hpp"
#include "swarmgate/tracker_request.hpp"

#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace swarmgate {

	class ban_range_index;

	// the outcome of an admission check. A default constructed result
	// allows the request
	struct SWARMGATE_EXPORT admission_result
	{
		admission_result() = default;
		admission_result(error_code e, std::string msg)
			: ec(e), message(std::move(msg)) {}

		bool allowed() const { return !ec; }

		static admission_result allow() { return admission_result(); }

		// banned_address, malformed_request or admission_denied
		error_code ec;

		// the failure reason handed back to the client
		std::string message;
	};

	// an additional admission check. Called with the info-hash being
	// announced or scraped, the request and the client address. Must not
	// block and must be safe to call from several threads at once
	using admission_predicate = std::function<admission_result(std::string const&
		, tracker_request const&, address const&)>;

	// The ``admission_filter`` decides whether a request may reach the
	// swarm. The checks are, in order: the request must not be malformed,
	// the client address must not be inside a banned range, and every
	// registered extension must allow it. The first denial is returned.
	//
	// evaluate() takes no locks. The ban index and the extension list are
	// read through immutable snapshots.
	class SWARMGATE_EXPORT admission_filter
	{
	public:

		explicit admission_filter(ban_range_index const& bans
			, gateway_logger* log = nullptr);

		admission_result evaluate(std::string const& info_hash
			, tracker_request const& req, address const& client) const;

		// registers ``pred`` under ``name``. If an extension by that name
		// exists, it is replaced and keeps its position in the order
		void add_extension(std::string const& name, admission_predicate pred);

		// returns false if there was no extension by that name
		bool remove_extension(std::string const& name);

		// the names of the registered extensions, in evaluation order
		std::vector<std::string> extension_names() const;

	private:

		using extension_list = std::vector<std::pair<std::string, admission_predicate>>;

		ban_range_index const& m_bans;
		gateway_logger* m_log;

		// serializes writers. Readers use std::atomic_load on m_extensions
		std::mutex m_mutex;
		std::shared_ptr<extension_list const> m_extensions;
	};
}

#endif
