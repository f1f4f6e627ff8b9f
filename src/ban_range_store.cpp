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

#include "swarmgate/ban_range_store.hpp"
#include "swarmgate/address.hpp"

#include <algorithm>
#include <cstdarg>
#include <cstdio>
#include <ctime>

namespace swarmgate {

	std::vector<ban_range> memory_ban_range_backend::load_all()
	{
		std::vector<ban_range> ret;
		ret.reserve(m_ranges.size());
		for (auto const& r : m_ranges) ret.push_back(r.second);
		return ret;
	}

	boost::optional<ban_range> memory_ban_range_backend::find(int const id)
	{
		auto const i = m_ranges.find(id);
		if (i == m_ranges.end()) return boost::none;
		return i->second;
	}

	bool memory_ban_range_backend::contains_key(std::uint32_t const from_ip
		, std::uint32_t const to_ip, int const except)
	{
		auto const i = m_keys.find({from_ip, to_ip});
		return i != m_keys.end() && i->second != except;
	}

	ban_range memory_ban_range_backend::insert(ban_range r, error_code& ec)
	{
		if (!m_keys.emplace(std::make_pair(r.from_ip, r.to_ip), m_next_id).second)
		{
			ec = errors::duplicate_ban_range;
			return r;
		}
		r.id = m_next_id++;
		m_ranges[r.id] = r;
		return r;
	}

	void memory_ban_range_backend::replace(ban_range const& r, error_code& ec)
	{
		auto const i = m_ranges.find(r.id);
		if (i == m_ranges.end())
		{
			ec = errors::ban_range_not_found;
			return;
		}
		if (contains_key(r.from_ip, r.to_ip, r.id))
		{
			ec = errors::duplicate_ban_range;
			return;
		}
		m_keys.erase({i->second.from_ip, i->second.to_ip});
		m_keys[{r.from_ip, r.to_ip}] = r.id;
		i->second = r;
	}

	bool memory_ban_range_backend::erase(int const id)
	{
		auto const i = m_ranges.find(id);
		if (i == m_ranges.end()) return false;
		m_keys.erase({i->second.from_ip, i->second.to_ip});
		m_ranges.erase(i);
		return true;
	}

	ban_range_store::ban_range_store(std::shared_ptr<ban_range_backend> backend
		, ban_range_index& index, gateway_logger* log)
		: m_backend(std::move(backend))
		, m_index(index)
		, m_log(log)
	{
		if (!m_backend) m_backend = std::make_shared<memory_ban_range_backend>();
	}

#ifndef SWARMGATE_DISABLE_LOGGING
	bool ban_range_store::should_log() const
	{
		return m_log && m_log->should_log(log_module::ban_list);
	}

	void ban_range_store::log(char const* fmt, ...) const
	{
		if (!should_log()) return;
		char buf[512];
		va_list v;
		va_start(v, fmt);
		std::vsnprintf(buf, sizeof(buf), fmt, v);
		va_end(v);
		m_log->log(log_module::ban_list, "%s", buf);
	}
#endif

	void ban_range_store::rebuild_index()
	{
		m_index.rebuild(m_backend->load_all());
	}

	void ban_range_store::refresh()
	{
		std::lock_guard<std::mutex> l(m_mutex);
		rebuild_index();
#ifndef SWARMGATE_DISABLE_LOGGING
		log("index loaded: %d intervals", m_index.size());
#endif
	}

	ban_range_page ban_range_store::list(int page, int limit) const
	{
		if (page < 1) page = 1;
		if (limit < 1) limit = default_page_size;

		std::vector<ban_range> all;
		{
			std::lock_guard<std::mutex> l(m_mutex);
			all = m_backend->load_all();
		}

		std::sort(all.begin(), all.end(), [](ban_range const& lhs, ban_range const& rhs)
		{
			if (lhs.created != rhs.created) return lhs.created > rhs.created;
			return lhs.id > rhs.id;
		});

		ban_range_page ret;
		ret.page = page;
		ret.limit = limit;
		ret.total = int(all.size());
		ret.pages = (ret.total + limit - 1) / limit;

		std::size_t const skip = std::size_t(page - 1) * std::size_t(limit);
		if (skip < all.size())
		{
			auto const first = all.begin() + std::ptrdiff_t(skip);
			auto const last = all.size() - skip > std::size_t(limit)
				? first + limit : all.end();
			ret.ranges.assign(first, last);
		}
		return ret;
	}

	ban_range ban_range_store::get(int const id) const
	{
		std::lock_guard<std::mutex> l(m_mutex);
		auto r = m_backend->find(id);
		if (!r) aux::throw_ex<system_error>(errors::ban_range_not_found);
		return *r;
	}

	ban_range ban_range_store::create(ban_range r)
	{
		error_code ec = validate_ban_range(r);
		if (ec) aux::throw_ex<system_error>(ec);

		std::lock_guard<std::mutex> l(m_mutex);
		r.created = std::time(nullptr);
		ban_range const ret = m_backend->insert(std::move(r), ec);
		if (ec) aux::throw_ex<system_error>(ec);
		rebuild_index();

#ifndef SWARMGATE_DISABLE_LOGGING
		log("ban created: [%d] %s \"%s\"", ret.id, print_ban_range(ret).c_str()
			, ret.reason.c_str());
#endif
		return ret;
	}

	int ban_range_store::bulk_create(std::vector<ban_range> const& ranges)
	{
		std::lock_guard<std::mutex> l(m_mutex);
		std::time_t const now = std::time(nullptr);
		int inserted = 0;
		int skipped = 0;
		for (ban_range r : ranges)
		{
			if (validate_ban_range(r)
				|| m_backend->contains_key(r.from_ip, r.to_ip))
			{
				++skipped;
				continue;
			}
			error_code ec;
			r.created = now;
			m_backend->insert(std::move(r), ec);
			if (ec)
			{
				++skipped;
				continue;
			}
			++inserted;
		}
		if (inserted > 0) rebuild_index();

#ifndef SWARMGATE_DISABLE_LOGGING
		log("bulk insert: %d inserted, %d skipped", inserted, skipped);
#endif
		return inserted;
	}

	ban_range ban_range_store::update(int const id, ban_range_patch const& patch)
	{
		std::lock_guard<std::mutex> l(m_mutex);
		auto stored = m_backend->find(id);
		if (!stored) aux::throw_ex<system_error>(errors::ban_range_not_found);

		ban_range r = *stored;
		if (patch.from_ip) r.from_ip = *patch.from_ip;
		if (patch.to_ip) r.to_ip = *patch.to_ip;
		if (patch.reason) r.reason = *patch.reason;

		error_code ec = validate_ban_range(r);
		if (ec) aux::throw_ex<system_error>(ec);

		m_backend->replace(r, ec);
		if (ec) aux::throw_ex<system_error>(ec);
		rebuild_index();

#ifndef SWARMGATE_DISABLE_LOGGING
		log("ban updated: [%d] %s", r.id, print_ban_range(r).c_str());
#endif
		return r;
	}

	ban_range ban_range_store::remove(int const id)
	{
		std::lock_guard<std::mutex> l(m_mutex);
		auto stored = m_backend->find(id);
		if (!stored || !m_backend->erase(id))
			aux::throw_ex<system_error>(errors::ban_range_not_found);
		rebuild_index();

#ifndef SWARMGATE_DISABLE_LOGGING
		log("ban removed: [%d] %s", id, print_ban_range(*stored).c_str());
#endif
		return *stored;
	}

	int ban_range_store::count() const
	{
		std::lock_guard<std::mutex> l(m_mutex);
		return int(m_backend->load_all().size());
	}
}
