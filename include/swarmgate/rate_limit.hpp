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

#ifndef SWARMGATE_RATE_LIMIT_HPP_INCLUDED
#define SWARMGATE_RATE_LIMIT_HPP_INCLUDED

#include "swarmgate/config.hpp"
#include "swarmgate/address.hpp"
#include "swarmgate/error_code.hpp"
#include "swarmgate/logger.hpp"
#include "swarmgate/time.hpp"

#include <array>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace swarmgate {

	struct settings_pack;

	// the route buckets rate limit policies apply to
	enum class route_class : std::uint8_t
	{
		// announce and scrape, on every transport
		tracker,
		// any other HTTP path
		api,
		// HTTP paths under the authentication prefix
		auth
	};

	SWARMGATE_EXPORT char const* route_class_name(route_class r);

	// maps an HTTP request path to its route class
	SWARMGATE_EXPORT route_class classify_route(std::string const& path
		, std::string const& auth_prefix);

	// bitmask of route classes
	using route_mask = std::uint8_t;
	constexpr route_mask route_bit(route_class const r)
	{ return route_mask(1u << std::uint8_t(r)); }
	constexpr route_mask all_routes = 0x7;

	struct SWARMGATE_EXPORT rate_limit_policy_params
	{
		enum action_t : std::uint8_t
		{
			// requests above the limit are rejected
			reject,
			// requests above the limit are delayed, never rejected
			slow_down
		};

		enum scope_t : std::uint8_t
		{
			// one counter per client address
			client_ip,
			// one counter per client address and route class
			client_ip_and_route
		};

		std::string name;
		action_t action = reject;
		scope_t scope = client_ip;
		route_mask routes = all_routes;

		time_duration window = seconds(60);

		// for reject policies, the number of requests allowed per window. For
		// delay policies, the number of requests per window served without
		// delay
		int limit = 100;

		// delay policies only. The delay added to every request past the
		// limit, and its upper bound
		time_duration delay = milliseconds(500);
		time_duration max_delay = milliseconds(20000);
	};

	struct SWARMGATE_EXPORT rate_limit_result
	{
		bool allowed() const { return !ec; }

		// rate_limit_exceeded if a policy rejected the request
		error_code ec;

		// the name of the rejecting policy
		std::string policy;

		// the time the request must be held before it is processed. Only
		// set by delay policies
		time_duration delay = time_duration::zero();

		// for rejected requests, the time until the rejecting window resets
		time_duration retry_after = time_duration::zero();
	};

	// One independent fixed-window limiter. State is kept per scope key in
	// a map split into shards, each with its own mutex, so concurrent
	// requests from different clients rarely contend. A window that has
	// elapsed is reset the next time its key is seen, and dropped by
	// evict_expired().
	class SWARMGATE_EXPORT rate_limit_policy
	{
	public:

		explicit rate_limit_policy(rate_limit_policy_params p);

		rate_limit_policy_params const& params() const { return m_params; }

		bool applies_to(route_class r) const
		{ return (m_params.routes & route_bit(r)) != 0; }

		// counts the request against the window of ``key``
		rate_limit_result incoming(std::string const& key, time_point now);

		// removes every window that has elapsed. Returns the number removed
		int evict_expired(time_point now);

		// the number of keys with state
		int num_keys() const;

		static constexpr int num_shards = 16;

	private:

		struct window
		{
			time_point start;
			int count;
		};

		struct shard
		{
			mutable std::mutex mutex;
			std::unordered_map<std::string, window> windows;
		};

		shard& shard_for(std::string const& key);

		rate_limit_policy_params const m_params;
		std::array<shard, num_shards> m_shards;
	};

	// The ``rate_limit_chain`` runs a request through its policies in the
	// order they were added. A rejection short-circuits the rest of the
	// chain. Delays of all passed delay policies are added up.
	//
	// Policies must be added before the chain is shared between threads.
	class SWARMGATE_EXPORT rate_limit_chain
	{
	public:

		explicit rate_limit_chain(gateway_logger* log = nullptr);

		void add_policy(rate_limit_policy_params p);

		rate_limit_result check(address const& client, route_class route
			, time_point now);

		int evict_expired(time_point now);

		std::vector<std::string> policy_names() const;

		// returns nullptr if there is no policy by this name
		rate_limit_policy const* find_policy(std::string const& name) const;

	private:

		std::vector<std::unique_ptr<rate_limit_policy>> m_policies;
		gateway_logger* m_log;
	};

	// adds slow_down, global_quota, announce_quota, api_quota and
	// auth_quota, configured from ``sett``
	SWARMGATE_EXPORT void add_default_policies(rate_limit_chain& chain
		, settings_pack const& sett);
}

#endif
