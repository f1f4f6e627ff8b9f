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

#ifndef SWARMGATE_BAN_RANGE_INDEX_HPP_INCLUDED
#define SWARMGATE_BAN_RANGE_INDEX_HPP_INCLUDED

#include "swarmgate/config.hpp"
#include "swarmgate/address.hpp"
#include "swarmgate/ban_range.hpp"

#include <cstdint>
#include <memory>
#include <vector>

namespace swarmgate {

	// an inclusive interval of banned IPv4 addresses, as stored in the index
	struct ip_interval
	{
		std::uint32_t first;
		std::uint32_t last;

		friend bool operator==(ip_interval const& lhs, ip_interval const& rhs)
		{ return lhs.first == rhs.first && lhs.last == rhs.last; }
	};

	// The ``ban_range_index`` answers whether an address is inside any banned
	// range. The ranges are held as an immutable, sorted vector of disjoint
	// intervals. rebuild() builds a new vector and publishes it with an atomic
	// pointer swap, so a query sees either the old or the new set of ranges,
	// and never blocks.
	//
	// Overlapping and adjacent input ranges are merged at rebuild time, which
	// makes a query a single binary search. The complexity of query() is
	// O(log n) where n is the number of merged intervals.
	class SWARMGATE_EXPORT ban_range_index
	{
	public:

		ban_range_index();

		// replaces the entire contents of the index. Ranges where
		// from_ip > to_ip are ignored
		void rebuild(std::vector<ban_range> const& ranges);

		// returns true if ``addr`` is inside one of the banned ranges
		bool query(std::uint32_t addr) const;

		// IPv4 and IPv4-mapped IPv6 addresses are looked up by their 32 bit
		// form. Other IPv6 addresses are never banned
		bool query(address const& addr) const;

		// the number of disjoint intervals after merging
		int size() const;
		bool empty() const;

		// the merged intervals, sorted by address
		std::vector<ip_interval> export_ranges() const;

	private:

		using snapshot = std::vector<ip_interval>;

		std::shared_ptr<snapshot const> load() const;

		// never null. Accessed with std::atomic_load/std::atomic_store
		std::shared_ptr<snapshot const> m_ranges;
	};
}

#endif
