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

#ifndef SWARMGATE_BAN_RANGE_STORE_HPP_INCLUDED
#define SWARMGATE_BAN_RANGE_STORE_HPP_INCLUDED

#include "swarmgate/config.hpp"
#include "swarmgate/ban_range.hpp"
#include "swarmgate/ban_range_index.hpp"
#include "swarmgate/error_code.hpp"
#include "swarmgate/logger.hpp"

#include <boost/optional.hpp>

#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <utility>
#include <vector>

namespace swarmgate {

	// the persistence layer behind the ban_range_store. A deployment backed
	// by a database implements this interface. Every call is made with the
	// store's writer lock held, implementations do not need to be thread safe
	// on their own.
	struct SWARMGATE_EXPORT ban_range_backend
	{
		// every stored range, in any order
		virtual std::vector<ban_range> load_all() = 0;

		virtual boost::optional<ban_range> find(int id) = 0;

		// true if a range with the same (from_ip, to_ip) is stored. A range
		// with id ``except`` is not considered
		virtual bool contains_key(std::uint32_t from_ip, std::uint32_t to_ip
			, int except = 0) = 0;

		// stores a new range, assigning its id. ``created`` is already set.
		// Fails with duplicate_ban_range when the key is taken
		virtual ban_range insert(ban_range r, error_code& ec) = 0;

		// replaces the stored range with the same id
		virtual void replace(ban_range const& r, error_code& ec) = 0;

		// returns false if there is no range with this id
		virtual bool erase(int id) = 0;

		virtual ~ban_range_backend() = default;
	};

	// keeps ban ranges in memory. Ids are assigned from 1 and never reused
	class SWARMGATE_EXPORT memory_ban_range_backend final : public ban_range_backend
	{
	public:
		memory_ban_range_backend() = default;

		std::vector<ban_range> load_all() override;
		boost::optional<ban_range> find(int id) override;
		bool contains_key(std::uint32_t from_ip, std::uint32_t to_ip
			, int except = 0) override;
		ban_range insert(ban_range r, error_code& ec) override;
		void replace(ban_range const& r, error_code& ec) override;
		bool erase(int id) override;

	private:
		std::map<int, ban_range> m_ranges;
		std::map<std::pair<std::uint32_t, std::uint32_t>, int> m_keys;
		int m_next_id = 1;
	};

	// one page of the listing, most recently created first
	struct ban_range_page
	{
		std::vector<ban_range> ranges;
		int page = 1;
		int limit = 20;
		int total = 0;
		int pages = 0;
	};

	// The ``ban_range_store`` is the only component that mutates the stored
	// ban ranges. Every successful mutation rebuilds the ban_range_index
	// before returning, so a ban is enforced as soon as the call that
	// created it returns.
	//
	// Errors are reported by throwing system_error with one of
	// invalid_ban_range, ban_reason_too_long, duplicate_ban_range or
	// ban_range_not_found.
	class SWARMGATE_EXPORT ban_range_store
	{
	public:

		static constexpr int default_page_size = 20;

		ban_range_store(std::shared_ptr<ban_range_backend> backend
			, ban_range_index& index, gateway_logger* log = nullptr);

		// reloads the index from the backend
		void refresh();

		// ``page`` is 1-based. Values below 1 select the first page, limits
		// below 1 the default page size
		ban_range_page list(int page = 1, int limit = default_page_size) const;

		ban_range get(int id) const;

		ban_range create(ban_range r);

		// inserts every valid range of the batch, skipping invalid ranges
		// and ranges whose (from_ip, to_ip) is already stored or appears
		// earlier in the batch. Returns the number of ranges inserted. The
		// index is rebuilt once, after the batch
		int bulk_create(std::vector<ban_range> const& ranges);

		ban_range update(int id, ban_range_patch const& patch);

		// returns the range that was removed
		ban_range remove(int id);

		// the total number of stored ranges
		int count() const;

	private:

		void rebuild_index();

#ifndef SWARMGATE_DISABLE_LOGGING
		bool should_log() const;
		void log(char const* fmt, ...) const SWARMGATE_FORMAT(2,3);
#endif

		// serializes writers, and readers against writers. The index has
		// its own lock free snapshot and is not covered
		mutable std::mutex m_mutex;
		std::shared_ptr<ban_range_backend> m_backend;
		ban_range_index& m_index;
		gateway_logger* m_log;
	};
}

#endif
