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

#ifndef SWARMGATE_SWARM_HPP_INCLUDED
#define SWARMGATE_SWARM_HPP_INCLUDED

#include "swarmgate/config.hpp"
#include "swarmgate/admission_filter.hpp"
#include "swarmgate/logger.hpp"
#include "swarmgate/time.hpp"
#include "swarmgate/tracker_request.hpp"

#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace swarmgate {

	struct settings_pack;

	// called by the swarm engine before it touches any state, for every
	// announce and for every info-hash of a scrape. A denial is returned to
	// the client as the failure reason
	using filter_hook = admission_predicate;

	struct swarm_stats
	{
		int torrents = 0;
		int peers = 0;
		int seeds = 0;
		int leechers = 0;
		std::int64_t announces = 0;
		std::int64_t scrapes = 0;
		std::int64_t denied = 0;
	};

	// the contract of the swarm-state engine the transports talk to.
	// Implementations must be safe to call from several threads at once
	struct SWARMGATE_EXPORT swarm_interface
	{
		virtual announce_response announce(tracker_request const& req) = 0;
		virtual scrape_response scrape(tracker_request const& req) = 0;

		// drops peers that have not announced within the peer timeout
		virtual void purge_stale(time_point now) = 0;

		virtual swarm_stats stats() const = 0;

		virtual ~swarm_interface() = default;
	};

	// constructs the swarm engine, with the admission filter as its hook
	using swarm_factory = std::function<std::unique_ptr<swarm_interface>(
		settings_pack const&, filter_hook, gateway_logger*)>;

	// An in-memory swarm engine. Peers are kept per info-hash and keyed by
	// peer-id. All state is guarded by a single mutex
	class SWARMGATE_EXPORT memory_swarm final : public swarm_interface
	{
	public:

		memory_swarm(settings_pack const& sett, filter_hook filter
			, gateway_logger* log = nullptr);

		announce_response announce(tracker_request const& req) override;
		scrape_response scrape(tracker_request const& req) override;
		void purge_stale(time_point now) override;
		swarm_stats stats() const override;

	private:

		struct peer
		{
			address ip;
			std::uint16_t port = 0;
			bool seed = false;
			time_point last_seen;
		};

		struct torrent
		{
			std::unordered_map<std::string, peer> peers;
			int seeds = 0;
			int downloaded = 0;
		};

		scrape_entry scrape_torrent(std::string const& info_hash) const;

		filter_hook m_filter;
		gateway_logger* m_log;

		int const m_interval;
		int const m_min_interval;
		int const m_default_numwant;
		int const m_max_numwant;
		int const m_max_scrape_hashes;
		time_duration const m_peer_timeout;

		mutable std::mutex m_mutex;
		std::unordered_map<std::string, torrent> m_torrents;
		std::int64_t m_announces = 0;
		std::int64_t m_scrapes = 0;
		std::int64_t m_denied = 0;
	};

	// the default swarm_factory
	SWARMGATE_EXPORT std::unique_ptr<swarm_interface> make_memory_swarm(
		settings_pack const& sett, filter_hook filter, gateway_logger* log);
}

#endif
