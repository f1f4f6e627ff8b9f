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

#include "swarmgate/rate_limit.hpp"
#include "swarmgate/settings_pack.hpp"

#include <algorithm>
#include <functional>

namespace swarmgate {

	char const* route_class_name(route_class const r)
	{
		switch (r)
		{
			case route_class::tracker: return "tracker";
			case route_class::api: return "api";
			case route_class::auth: return "auth";
		}
		return "";
	}

	route_class classify_route(std::string const& path
		, std::string const& auth_prefix)
	{
		if (path == "/announce" || path == "/scrape") return route_class::tracker;
		if (!auth_prefix.empty()
			&& path.compare(0, auth_prefix.size(), auth_prefix) == 0
			&& (path.size() == auth_prefix.size()
				|| path[auth_prefix.size()] == '/'
				|| auth_prefix.back() == '/'))
			return route_class::auth;
		return route_class::api;
	}

	rate_limit_policy::rate_limit_policy(rate_limit_policy_params p)
		: m_params(std::move(p))
	{}

	rate_limit_policy::shard& rate_limit_policy::shard_for(std::string const& key)
	{
		return m_shards[std::hash<std::string>()(key) % num_shards];
	}

	rate_limit_result rate_limit_policy::incoming(std::string const& key
		, time_point const now)
	{
		rate_limit_result ret;
		shard& s = shard_for(key);
		std::lock_guard<std::mutex> l(s.mutex);

		auto i = s.windows.find(key);
		if (i == s.windows.end())
		{
			i = s.windows.emplace(key, window{now, 0}).first;
		}
		else if (now - i->second.start >= m_params.window)
		{
			i->second.start = now;
			i->second.count = 0;
		}

		window& w = i->second;

		if (m_params.action == rate_limit_policy_params::slow_down)
		{
			// the counter saturates one past the limit, which is all the
			// information a fixed delay needs
			if (w.count <= m_params.limit) ++w.count;
			if (w.count > m_params.limit)
				ret.delay = std::min(m_params.delay, m_params.max_delay);
			return ret;
		}

		if (w.count >= m_params.limit)
		{
			ret.ec = errors::rate_limit_exceeded;
			ret.policy = m_params.name;
			ret.retry_after = w.start + m_params.window - now;
			return ret;
		}
		++w.count;
		return ret;
	}

	int rate_limit_policy::evict_expired(time_point const now)
	{
		int ret = 0;
		for (auto& s : m_shards)
		{
			std::lock_guard<std::mutex> l(s.mutex);
			for (auto i = s.windows.begin(); i != s.windows.end();)
			{
				if (now - i->second.start >= m_params.window)
				{
					i = s.windows.erase(i);
					++ret;
				}
				else
				{
					++i;
				}
			}
		}
		return ret;
	}

	int rate_limit_policy::num_keys() const
	{
		int ret = 0;
		for (auto const& s : m_shards)
		{
			std::lock_guard<std::mutex> l(s.mutex);
			ret += int(s.windows.size());
		}
		return ret;
	}

	rate_limit_chain::rate_limit_chain(gateway_logger* log)
		: m_log(log)
	{}

	void rate_limit_chain::add_policy(rate_limit_policy_params p)
	{
		m_policies.push_back(std::make_unique<rate_limit_policy>(std::move(p)));
	}

	rate_limit_result rate_limit_chain::check(address const& client
		, route_class const route, time_point const now)
	{
		rate_limit_result ret;
		// IPv4-mapped clients share the counters of their IPv4 form, the same
		// way the ban index looks them up
		std::string const ip_key = has_ipv4_form(client)
			? print_ipv4(to_uint32(client)) : client.to_string();

		for (auto const& p : m_policies)
		{
			if (!p->applies_to(route)) continue;

			rate_limit_result const r = p->params().scope
				== rate_limit_policy_params::client_ip_and_route
				? p->incoming(ip_key + "|" + route_class_name(route), now)
				: p->incoming(ip_key, now);

			if (!r.allowed())
			{
#ifndef SWARMGATE_DISABLE_LOGGING
				if (m_log && m_log->should_log(log_module::rate_limit))
				{
					m_log->log(log_module::rate_limit, "%s rejected %s (%s route), retry in %d s"
						, r.policy.c_str(), ip_key.c_str(), route_class_name(route)
						, int(total_seconds(r.retry_after)));
				}
#endif
				return r;
			}
			ret.delay += r.delay;
		}

#ifndef SWARMGATE_DISABLE_LOGGING
		if (ret.delay > time_duration::zero()
			&& m_log && m_log->should_log(log_module::rate_limit))
		{
			m_log->log(log_module::rate_limit, "slowing down %s by %d ms"
				, ip_key.c_str(), int(total_milliseconds(ret.delay)));
		}
#endif
		return ret;
	}

	int rate_limit_chain::evict_expired(time_point const now)
	{
		int ret = 0;
		for (auto const& p : m_policies) ret += p->evict_expired(now);
		return ret;
	}

	std::vector<std::string> rate_limit_chain::policy_names() const
	{
		std::vector<std::string> ret;
		for (auto const& p : m_policies) ret.push_back(p->params().name);
		return ret;
	}

	rate_limit_policy const* rate_limit_chain::find_policy(std::string const& name) const
	{
		for (auto const& p : m_policies)
			if (p->params().name == name) return p.get();
		return nullptr;
	}

	void add_default_policies(rate_limit_chain& chain, settings_pack const& sett)
	{
		using sp = settings_pack;
		using params = rate_limit_policy_params;

		params slow;
		slow.name = "slow_down";
		slow.action = params::slow_down;
		slow.window = seconds(sett.get_int(sp::slow_down_window));
		slow.limit = sett.get_int(sp::slow_down_after);
		slow.delay = milliseconds(sett.get_int(sp::slow_down_delay));
		slow.max_delay = milliseconds(sett.get_int(sp::slow_down_max_delay));
		chain.add_policy(std::move(slow));

		params global;
		global.name = "global_quota";
		global.window = seconds(sett.get_int(sp::global_quota_window));
		global.limit = sett.get_int(sp::global_quota_limit);
		chain.add_policy(std::move(global));

		params announce;
		announce.name = "announce_quota";
		announce.routes = route_bit(route_class::tracker);
		announce.window = seconds(sett.get_int(sp::announce_quota_window));
		announce.limit = sett.get_int(sp::announce_quota_limit);
		chain.add_policy(std::move(announce));

		params api;
		api.name = "api_quota";
		api.routes = route_bit(route_class::api);
		api.window = seconds(sett.get_int(sp::api_quota_window));
		api.limit = sett.get_int(sp::api_quota_limit);
		chain.add_policy(std::move(api));

		params auth;
		auth.name = "auth_quota";
		auth.routes = route_bit(route_class::auth);
		auth.window = seconds(sett.get_int(sp::auth_quota_window));
		auth.limit = sett.get_int(sp::auth_quota_limit);
		chain.add_policy(std::move(auth));
	}
}
