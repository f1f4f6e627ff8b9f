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

#include "test.hpp"
#include "test_utils.hpp"

#include "swarmgate/swarm.hpp"
#include "swarmgate/settings_pack.hpp"

#include <set>
#include <string>

using namespace sg;

namespace {

	std::string peer_id(int const i)
	{
		std::string ret = make_hash('p');
		ret[19] = char(i);
		return ret;
	}

	std::unique_ptr<swarm_interface> make_swarm(settings_pack const& s = settings_pack()
		, filter_hook filter = filter_hook())
	{
		return make_memory_swarm(s, std::move(filter), nullptr);
	}
}

SWARMGATE_TEST(first_announce)
{
	auto swarm = make_swarm();
	announce_response const r = swarm->announce(make_announce(make_hash('a')
		, peer_id(1), "10.0.0.1"));
	TEST_CHECK(!r.ec);
	TEST_EQUAL(r.interval, 300);
	TEST_EQUAL(r.min_interval, 60);
	TEST_EQUAL(r.complete, 0);
	TEST_EQUAL(r.incomplete, 1);
	// a peer is never handed back to itself
	TEST_CHECK(r.peers.empty());
}

SWARMGATE_TEST(peers_returned)
{
	auto swarm = make_swarm();
	swarm->announce(make_announce(make_hash('a'), peer_id(1), "10.0.0.1", 100
		, event_t::started, 1000));
	swarm->announce(make_announce(make_hash('a'), peer_id(2), "10.0.0.2", 0
		, event_t::started, 2000));
	// a different swarm
	swarm->announce(make_announce(make_hash('b'), peer_id(3), "10.0.0.3"));

	announce_response const r = swarm->announce(make_announce(make_hash('a')
		, peer_id(4), "10.0.0.4"));
	TEST_EQUAL(r.complete, 1);
	TEST_EQUAL(r.incomplete, 2);
	TEST_EQUAL(r.peers.size(), 2);

	std::set<std::uint16_t> ports;
	for (auto const& p : r.peers)
	{
		ports.insert(p.port);
		TEST_CHECK(p.peer_id != peer_id(4));
	}
	TEST_CHECK(ports.count(1000) == 1);
	TEST_CHECK(ports.count(2000) == 1);
}

SWARMGATE_TEST(seeds_get_no_seeds)
{
	auto swarm = make_swarm();
	swarm->announce(make_announce(make_hash('a'), peer_id(1), "10.0.0.1", 0));
	swarm->announce(make_announce(make_hash('a'), peer_id(2), "10.0.0.2", 50));

	announce_response const r = swarm->announce(make_announce(make_hash('a')
		, peer_id(3), "10.0.0.3", 0));
	TEST_EQUAL(r.complete, 2);
	TEST_EQUAL(r.incomplete, 1);
	TEST_EQUAL(r.peers.size(), 1);
	TEST_EQUAL(r.peers.front().peer_id, peer_id(2));
}

SWARMGATE_TEST(numwant)
{
	settings_pack s;
	s.set_int(settings_pack::default_numwant, 5);
	s.set_int(settings_pack::max_numwant, 8);
	auto swarm = make_swarm(s);
	for (int i = 0; i < 20; ++i)
		swarm->announce(make_announce(make_hash('a'), peer_id(i), "10.0.0.1"));

	tracker_request req = make_announce(make_hash('a'), peer_id(100), "10.0.0.2");
	TEST_EQUAL(swarm->announce(req).peers.size(), 5);

	req.num_want = 3;
	TEST_EQUAL(swarm->announce(req).peers.size(), 3);

	req.num_want = 1000;
	TEST_EQUAL(swarm->announce(req).peers.size(), 8);

	req.num_want = 0;
	announce_response const r = swarm->announce(req);
	TEST_CHECK(r.peers.empty());
	TEST_EQUAL(r.incomplete, 21);
}

SWARMGATE_TEST(stopped_event)
{
	auto swarm = make_swarm();
	swarm->announce(make_announce(make_hash('a'), peer_id(1), "10.0.0.1", 0));
	swarm->announce(make_announce(make_hash('a'), peer_id(2), "10.0.0.2"));

	announce_response const r = swarm->announce(make_announce(make_hash('a')
		, peer_id(1), "10.0.0.1", 0, event_t::stopped));
	TEST_CHECK(!r.ec);
	TEST_EQUAL(r.complete, 0);
	TEST_EQUAL(r.incomplete, 1);
	TEST_CHECK(r.peers.empty());

	// stopping an unknown peer of an unknown swarm is harmless
	announce_response const r2 = swarm->announce(make_announce(make_hash('z')
		, peer_id(1), "10.0.0.1", 0, event_t::stopped));
	TEST_CHECK(!r2.ec);
	TEST_EQUAL(swarm->stats().torrents, 1);
}

SWARMGATE_TEST(completed_event)
{
	auto swarm = make_swarm();
	swarm->announce(make_announce(make_hash('a'), peer_id(1), "10.0.0.1", 100
		, event_t::started));
	announce_response r = swarm->announce(make_announce(make_hash('a')
		, peer_id(1), "10.0.0.1", 0, event_t::completed));
	TEST_EQUAL(r.complete, 1);
	TEST_EQUAL(r.incomplete, 0);
	TEST_EQUAL(r.downloaded, 1);

	// a repeated completed event from a seed is not counted again
	r = swarm->announce(make_announce(make_hash('a'), peer_id(1), "10.0.0.1", 0
		, event_t::completed));
	TEST_EQUAL(r.downloaded, 1);

	// a seed going back to leeching
	r = swarm->announce(make_announce(make_hash('a'), peer_id(1), "10.0.0.1", 10));
	TEST_EQUAL(r.complete, 0);
	TEST_EQUAL(r.incomplete, 1);
}

SWARMGATE_TEST(invalid_hashes)
{
	auto swarm = make_swarm();
	tracker_request req = make_announce("short", peer_id(1), "10.0.0.1");
	announce_response r = swarm->announce(req);
	TEST_EQUAL(r.ec, error_code(errors::malformed_request));
	TEST_CHECK(!r.failure_reason.empty());

	req = make_announce(make_hash('a'), "short", "10.0.0.1");
	r = swarm->announce(req);
	TEST_EQUAL(r.ec, error_code(errors::malformed_request));
	TEST_EQUAL(swarm->stats().torrents, 0);
}

SWARMGATE_TEST(scrape)
{
	auto swarm = make_swarm();
	swarm->announce(make_announce(make_hash('a'), peer_id(1), "10.0.0.1", 0));
	swarm->announce(make_announce(make_hash('a'), peer_id(2), "10.0.0.2"));
	swarm->announce(make_announce(make_hash('b'), peer_id(3), "10.0.0.3"));

	scrape_response r = swarm->scrape(make_scrape({make_hash('a'), make_hash('c')}, "10.0.0.9"));
	TEST_CHECK(!r.ec);
	TEST_EQUAL(r.files.size(), 2);
	TEST_EQUAL(r.files[0].info_hash, make_hash('a'));
	TEST_EQUAL(r.files[0].complete, 1);
	TEST_EQUAL(r.files[0].incomplete, 1);
	// unknown swarms are reported as empty
	TEST_EQUAL(r.files[1].info_hash, make_hash('c'));
	TEST_EQUAL(r.files[1].complete, 0);
	TEST_EQUAL(r.files[1].incomplete, 0);

	// a scrape without hashes covers every swarm
	r = swarm->scrape(make_scrape({}, "10.0.0.9"));
	TEST_EQUAL(r.files.size(), 2);

	TEST_EQUAL(swarm->stats().scrapes, 2);
}

SWARMGATE_TEST(scrape_truncated)
{
	settings_pack s;
	s.set_int(settings_pack::max_scrape_hashes, 3);
	auto swarm = make_swarm(s);
	std::vector<std::string> hashes;
	for (char c = 'a'; c < 'k'; ++c) hashes.push_back(make_hash(c));
	scrape_response const r = swarm->scrape(make_scrape(hashes, "10.0.0.1"));
	TEST_EQUAL(r.files.size(), 3);
}

SWARMGATE_TEST(filter_denial)
{
	int calls = 0;
	std::string const blocked = make_hash('x');
	auto swarm = make_swarm(settings_pack()
		, [&calls, blocked](std::string const& h, tracker_request const&, address const&)
	{
		++calls;
		if (h == blocked) return admission_result(errors::admission_denied, "blocked");
		return admission_result::allow();
	});

	announce_response const r = swarm->announce(make_announce(blocked
		, peer_id(1), "10.0.0.1"));
	TEST_EQUAL(r.ec, error_code(errors::admission_denied));
	TEST_EQUAL(r.failure_reason, "blocked");
	TEST_EQUAL(calls, 1);

	// the denied announce never reached the swarm state
	swarm_stats st = swarm->stats();
	TEST_EQUAL(st.torrents, 0);
	TEST_EQUAL(st.announces, 0);
	TEST_EQUAL(st.denied, 1);

	// every hash of a scrape is checked, one denial fails the whole scrape
	scrape_response const s = swarm->scrape(make_scrape({make_hash('a'), blocked}, "10.0.0.1"));
	TEST_EQUAL(s.ec, error_code(errors::admission_denied));
	TEST_CHECK(s.files.empty());
	TEST_EQUAL(calls, 3);
	TEST_EQUAL(swarm->stats().denied, 2);
}

SWARMGATE_TEST(filter_runs_on_malformed)
{
	ban_range_index bans;
	admission_filter f(bans);
	auto swarm = make_swarm(settings_pack()
		, [&f](std::string const& h, tracker_request const& req, address const& a)
		{ return f.evaluate(h, req, a); });

	tracker_request req = make_announce(make_hash('a'), peer_id(1), "10.0.0.1");
	req.malformed = true;
	req.malformed_reason = "missing port";
	announce_response const r = swarm->announce(req);
	TEST_EQUAL(r.ec, error_code(errors::malformed_request));
	TEST_EQUAL(r.failure_reason, "missing port");
}

SWARMGATE_TEST(purge_stale)
{
	settings_pack s;
	s.set_int(settings_pack::peer_timeout, 60);
	auto swarm = make_swarm(s);
	swarm->announce(make_announce(make_hash('a'), peer_id(1), "10.0.0.1", 0));
	swarm->announce(make_announce(make_hash('b'), peer_id(2), "10.0.0.2", 100
		, event_t::started));
	swarm->announce(make_announce(make_hash('b'), peer_id(3), "10.0.0.3", 0
		, event_t::completed));

	swarm_stats st = swarm->stats();
	TEST_EQUAL(st.torrents, 2);
	TEST_EQUAL(st.peers, 3);
	TEST_EQUAL(st.seeds, 2);
	TEST_EQUAL(st.leechers, 1);

	swarm->purge_stale(clock_type::now());
	TEST_EQUAL(swarm->stats().peers, 3);

	swarm->purge_stale(clock_type::now() + seconds(61));
	st = swarm->stats();
	TEST_EQUAL(st.peers, 0);
	TEST_EQUAL(st.seeds, 0);
	// a swarm with completed downloads is kept for its scrape counters
	TEST_EQUAL(st.torrents, 1);

	scrape_response const r = swarm->scrape(make_scrape({make_hash('b')}, "10.0.0.1"));
	TEST_EQUAL(r.files.front().downloaded, 1);
}

SWARMGATE_TEST(peer_address_updated)
{
	auto swarm = make_swarm();
	swarm->announce(make_announce(make_hash('a'), peer_id(1), "10.0.0.1", 100
		, event_t::started, 1000));
	swarm->announce(make_announce(make_hash('a'), peer_id(1), "10.0.0.7", 100
		, event_t::none, 1001));

	announce_response const r = swarm->announce(make_announce(make_hash('a')
		, peer_id(2), "10.0.0.2"));
	TEST_EQUAL(r.peers.size(), 1);
	TEST_EQUAL(r.peers.front().ip, addr("10.0.0.7"));
	TEST_EQUAL(r.peers.front().port, 1001);
}
