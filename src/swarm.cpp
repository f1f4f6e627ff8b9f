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

#include "swarmgate/swarm.hpp"
#include "swarmgate/settings_pack.hpp"
#include "swarmgate/random.hpp"
#include "swarmgate/aux_/escape_string.hpp"

#include <algorithm>

namespace swarmgate {

	memory_swarm::memory_swarm(settings_pack const& sett, filter_hook filter
		, gateway_logger* log)
		: m_filter(std::move(filter))
		, m_log(log)
		, m_interval(sett.get_int(settings_pack::announce_interval))
		, m_min_interval(sett.get_int(settings_pack::min_announce_interval))
		, m_default_numwant(sett.get_int(settings_pack::default_numwant))
		, m_max_numwant(sett.get_int(settings_pack::max_numwant))
		, m_max_scrape_hashes(sett.get_int(settings_pack::max_scrape_hashes))
		, m_peer_timeout(seconds(sett.get_int(settings_pack::peer_timeout)))
	{}

	announce_response memory_swarm::announce(tracker_request const& req)
	{
		announce_response ret;

		if (m_filter)
		{
			admission_result const r = m_filter(req.info_hash, req, req.client);
			if (!r.allowed())
			{
				std::lock_guard<std::mutex> l(m_mutex);
				++m_denied;
				ret.ec = r.ec;
				ret.failure_reason = r.message;
				return ret;
			}
		}

		if (!valid_hash(req.info_hash) || !valid_hash(req.peer_id))
		{
			ret.ec = errors::malformed_request;
			ret.failure_reason = "invalid info_hash or peer_id";
			return ret;
		}

		ret.interval = m_interval;
		ret.min_interval = m_min_interval;

		int num_want = req.num_want < 0 ? m_default_numwant : req.num_want;
		num_want = std::min(num_want, m_max_numwant);

		time_point const now = clock_type::now();

		std::lock_guard<std::mutex> l(m_mutex);
		++m_announces;

		auto t = m_torrents.find(req.info_hash);
		if (req.event == event_t::stopped)
		{
			if (t != m_torrents.end())
			{
				auto const p = t->second.peers.find(req.peer_id);
				if (p != t->second.peers.end())
				{
					if (p->second.seed) --t->second.seeds;
					t->second.peers.erase(p);
				}
				ret.complete = t->second.seeds;
				ret.incomplete = int(t->second.peers.size()) - t->second.seeds;
				ret.downloaded = t->second.downloaded;
			}
			return ret;
		}

		if (t == m_torrents.end())
			t = m_torrents.emplace(req.info_hash, torrent()).first;
		torrent& tor = t->second;

		bool const is_seed = req.left == 0;
		auto p = tor.peers.find(req.peer_id);
		if (p == tor.peers.end())
		{
			p = tor.peers.emplace(req.peer_id, peer()).first;
			if (is_seed) ++tor.seeds;
			if (req.event == event_t::completed) ++tor.downloaded;
		}
		else
		{
			// a leecher turning into a seed has completed the download
			if (is_seed && !p->second.seed)
			{
				++tor.seeds;
				if (req.event == event_t::completed) ++tor.downloaded;
			}
			else if (!is_seed && p->second.seed)
			{
				--tor.seeds;
			}
		}
		p->second.ip = req.client;
		p->second.port = req.port;
		p->second.seed = is_seed;
		p->second.last_seen = now;

		ret.complete = tor.seeds;
		ret.incomplete = int(tor.peers.size()) - tor.seeds;
		ret.downloaded = tor.downloaded;

		// seeds are not interested in other seeds
		std::vector<peer_entry> candidates;
		for (auto const& e : tor.peers)
		{
			if (e.first == req.peer_id) continue;
			if (is_seed && e.second.seed) continue;
			peer_entry pe;
			pe.peer_id = e.first;
			pe.ip = e.second.ip;
			pe.port = e.second.port;
			candidates.push_back(std::move(pe));
		}
		if (int(candidates.size()) > num_want)
		{
			std::shuffle(candidates.begin(), candidates.end(), aux::random_engine());
			candidates.resize(std::size_t(std::max(num_want, 0)));
		}
		ret.peers = std::move(candidates);

#ifndef SWARMGATE_DISABLE_LOGGING
		if (m_log && m_log->should_log(log_module::swarm))
		{
			m_log->log(log_module::swarm, "announce [%s] %s:%d event: %s left: %d peers: %d"
				, aux::to_hex(req.info_hash).c_str(), print_address(req.client).c_str()
				, int(req.port), event_name(req.event), int(std::min(req.left
					, std::int64_t(0x7fffffff))), int(ret.peers.size()));
		}
#endif
		return ret;
	}

	scrape_entry memory_swarm::scrape_torrent(std::string const& info_hash) const
	{
		scrape_entry ret;
		ret.info_hash = info_hash;
		auto const t = m_torrents.find(info_hash);
		if (t == m_torrents.end()) return ret;
		ret.complete = t->second.seeds;
		ret.incomplete = int(t->second.peers.size()) - t->second.seeds;
		ret.downloaded = t->second.downloaded;
		return ret;
	}

	scrape_response memory_swarm::scrape(tracker_request const& req)
	{
		scrape_response ret;

		std::vector<std::string> hashes = req.scrape_hashes;
		if (int(hashes.size()) > m_max_scrape_hashes)
			hashes.resize(std::size_t(m_max_scrape_hashes));

		if (m_filter)
		{
			// a scrape of all swarms is checked once, with an empty hash
			if (hashes.empty())
			{
				admission_result const r = m_filter(std::string(), req, req.client);
				if (!r.allowed())
				{
					std::lock_guard<std::mutex> l(m_mutex);
					++m_denied;
					ret.ec = r.ec;
					ret.failure_reason = r.message;
					return ret;
				}
			}
			for (auto const& h : hashes)
			{
				admission_result const r = m_filter(h, req, req.client);
				if (r.allowed()) continue;
				std::lock_guard<std::mutex> l(m_mutex);
				++m_denied;
				ret.ec = r.ec;
				ret.failure_reason = r.message;
				return ret;
			}
		}

		std::lock_guard<std::mutex> l(m_mutex);
		++m_scrapes;
		if (hashes.empty())
		{
			for (auto const& t : m_torrents)
				ret.files.push_back(scrape_torrent(t.first));
		}
		else
		{
			for (auto const& h : hashes)
				ret.files.push_back(scrape_torrent(h));
		}
		return ret;
	}

	void memory_swarm::purge_stale(time_point const now)
	{
		std::lock_guard<std::mutex> l(m_mutex);
		int purged = 0;
		for (auto t = m_torrents.begin(); t != m_torrents.end();)
		{
			torrent& tor = t->second;
			for (auto p = tor.peers.begin(); p != tor.peers.end();)
			{
				if (now - p->second.last_seen < m_peer_timeout)
				{
					++p;
					continue;
				}
				if (p->second.seed) --tor.seeds;
				p = tor.peers.erase(p);
				++purged;
			}
			if (tor.peers.empty() && tor.downloaded == 0) t = m_torrents.erase(t);
			else ++t;
		}

#ifndef SWARMGATE_DISABLE_LOGGING
		if (purged > 0 && m_log && m_log->should_log(log_module::swarm))
			m_log->log(log_module::swarm, "purged %d stale peers", purged);
#else
		SWARMGATE_UNUSED(purged);
#endif
	}

	swarm_stats memory_swarm::stats() const
	{
		swarm_stats ret;
		std::lock_guard<std::mutex> l(m_mutex);
		ret.torrents = int(m_torrents.size());
		for (auto const& t : m_torrents)
		{
			ret.peers += int(t.second.peers.size());
			ret.seeds += t.second.seeds;
		}
		ret.leechers = ret.peers - ret.seeds;
		ret.announces = m_announces;
		ret.scrapes = m_scrapes;
		ret.denied = m_denied;
		return ret;
	}

	std::unique_ptr<swarm_interface> make_memory_swarm(settings_pack const& sett
		, filter_hook filter, gateway_logger* log)
	{
		return std::unique_ptr<swarm_interface>(
			new memory_swarm(sett, std::move(filter), log));
	}
}
