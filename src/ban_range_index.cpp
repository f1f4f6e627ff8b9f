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

#include "swarmgate/ban_range_index.hpp"

#include <algorithm>

namespace swarmgate {

	ban_range_index::ban_range_index()
		: m_ranges(std::make_shared<snapshot const>())
	{}

	void ban_range_index::rebuild(std::vector<ban_range> const& ranges)
	{
		snapshot input;
		input.reserve(ranges.size());
		for (auto const& r : ranges)
		{
			if (r.from_ip > r.to_ip) continue;
			input.push_back({r.from_ip, r.to_ip});
		}

		std::sort(input.begin(), input.end()
			, [](ip_interval const& lhs, ip_interval const& rhs)
			{ return lhs.first < rhs.first; });

		auto merged = std::make_shared<snapshot>();
		for (auto const& i : input)
		{
			// merge with the previous interval if they overlap or touch. The
			// second condition avoids overflow when last is the max address
			if (!merged->empty()
				&& (merged->back().last == 0xffffffff
					|| i.first <= merged->back().last + 1))
			{
				merged->back().last = std::max(merged->back().last, i.last);
				continue;
			}
			merged->push_back(i);
		}

		std::shared_ptr<snapshot const> next = std::move(merged);
		std::atomic_store(&m_ranges, next);
	}

	std::shared_ptr<ban_range_index::snapshot const> ban_range_index::load() const
	{
		return std::atomic_load(&m_ranges);
	}

	bool ban_range_index::query(std::uint32_t const addr) const
	{
		auto const ranges = load();

		// find the first interval starting after addr. The interval before
		// it is the only one that can contain addr
		auto i = std::upper_bound(ranges->begin(), ranges->end(), addr
			, [](std::uint32_t const a, ip_interval const& r) { return a < r.first; });
		if (i == ranges->begin()) return false;
		--i;
		return addr <= i->last;
	}

	bool ban_range_index::query(address const& addr) const
	{
		if (!has_ipv4_form(addr)) return false;
		return query(to_uint32(addr));
	}

	int ban_range_index::size() const
	{
		return int(load()->size());
	}

	bool ban_range_index::empty() const
	{
		return load()->empty();
	}

	std::vector<ip_interval> ban_range_index::export_ranges() const
	{
		return *load();
	}
}
