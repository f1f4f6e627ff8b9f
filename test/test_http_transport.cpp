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

#include "swarmgate/http_transport.hpp"

#include <cstdlib>
#include <memory>
#include <string>

using namespace sg;

namespace {

	std::shared_ptr<http_transport> start_http(transport_fixture& f)
	{
		auto t = std::make_shared<http_transport>(f.ioc, f.context());
		error_code ec;
		t->start("127.0.0.1", 0, ec);
		TEST_CHECK(!ec);
		TEST_CHECK(t->listen_port() != 0);
		return t;
	}

	std::string announce_target(std::string const& info_hash, std::string const& peer_id
		, int const port, std::string const& extra = std::string())
	{
		return "/announce?info_hash=" + url_escape(info_hash)
			+ "&peer_id=" + url_escape(peer_id)
			+ "&port=" + std::to_string(port) + extra;
	}

	void stop(std::shared_ptr<http_transport> const& t)
	{
		error_code ec;
		t->stop(ec);
		TEST_CHECK(!ec);
	}
}

SWARMGATE_TEST(parse_announce)
{
	tracker_request req = parse_http_announce(announce_target(make_hash('a')
		, make_hash('p'), 6881, "&uploaded=10&downloaded=20&left=30&event=started&numwant=5&compact=0&key=ff"));
	TEST_CHECK(!req.malformed);
	TEST_CHECK(req.type == request_type::announce);
	TEST_EQUAL(req.info_hash, make_hash('a'));
	TEST_EQUAL(req.peer_id, make_hash('p'));
	TEST_EQUAL(req.port, 6881);
	TEST_EQUAL(req.uploaded, 10);
	TEST_EQUAL(req.downloaded, 20);
	TEST_EQUAL(req.left, 30);
	TEST_CHECK(req.event == event_t::started);
	TEST_EQUAL(req.num_want, 5);
	TEST_EQUAL(req.compact, false);
	TEST_EQUAL(req.key, 0xff);

	// without left the peer is not a seed
	req = parse_http_announce(announce_target(make_hash('a'), make_hash('p'), 1));
	TEST_CHECK(!req.malformed);
	TEST_EQUAL(req.left, -1);
	TEST_EQUAL(req.num_want, -1);
}

SWARMGATE_TEST(parse_announce_malformed)
{
	tracker_request req = parse_http_announce("/announce?info_hash=abc&peer_id="
		+ url_escape(make_hash('p')) + "&port=1");
	TEST_CHECK(req.malformed);
	TEST_EQUAL(req.malformed_reason, "invalid info_hash");

	req = parse_http_announce("/announce?info_hash=" + url_escape(make_hash('a'))
		+ "&peer_id=" + url_escape(make_hash('p')));
	TEST_CHECK(req.malformed);
	TEST_EQUAL(req.malformed_reason, "invalid port");

	req = parse_http_announce(announce_target(make_hash('a'), make_hash('p'), 70000));
	TEST_CHECK(req.malformed);

	req = parse_http_announce(announce_target(make_hash('a'), make_hash('p'), 1, "&left=-1"));
	TEST_CHECK(req.malformed);
	TEST_EQUAL(req.malformed_reason, "invalid transfer counter");

	req = parse_http_announce("/announce?info_hash=%zz");
	TEST_CHECK(req.malformed);
	TEST_EQUAL(req.malformed_reason, "invalid url encoding");
}

SWARMGATE_TEST(parse_scrape)
{
	tracker_request req = parse_http_scrape("/scrape?info_hash=" + url_escape(make_hash('a'))
		+ "&info_hash=" + url_escape(make_hash('b')));
	TEST_CHECK(!req.malformed);
	TEST_CHECK(req.type == request_type::scrape);
	TEST_EQUAL(req.scrape_hashes.size(), 2);
	TEST_CHECK(req.info_hash.empty());

	req = parse_http_scrape("/scrape");
	TEST_CHECK(!req.malformed);
	TEST_CHECK(req.scrape_hashes.empty());

	req = parse_http_scrape("/scrape?info_hash=short");
	TEST_CHECK(req.malformed);
}

SWARMGATE_TEST(bencoding)
{
	announce_response resp;
	resp.interval = 300;
	resp.min_interval = 60;
	resp.complete = 1;
	resp.incomplete = 2;
	peer_entry p;
	p.peer_id = make_hash('p');
	p.ip = addr("1.2.3.4");
	p.port = 0x1a2b;
	resp.peers.push_back(p);

	TEST_EQUAL(bencode_announce(resp, true), "d8:completei1e10:downloadedi0e"
		"10:incompletei2e8:intervali300e12:min intervali60e"
		"5:peers6:\x01\x02\x03\x04\x1a\x2b" "e");

	TEST_EQUAL(bencode_announce(resp, false), "d8:completei1e10:downloadedi0e"
		"10:incompletei2e8:intervali300e12:min intervali60e"
		"5:peersld2:ip7:1.2.3.47:peer id20:pppppppppppppppppppp4:porti6699eeee");

	resp.ec = errors::banned_address;
	resp.failure_reason = "IP address is banned";
	TEST_EQUAL(bencode_announce(resp, true), "d14:failure reason20:IP address is bannede");

	scrape_response sr;
	scrape_entry e;
	e.info_hash = make_hash('b');
	e.complete = 3;
	sr.files.push_back(e);
	e.info_hash = make_hash('a');
	e.complete = 1;
	sr.files.push_back(e);
	// files are sorted by info-hash
	TEST_EQUAL(bencode_scrape(sr), "d5:filesd20:" + make_hash('a')
		+ "d8:completei1e10:downloadedi0e10:incompletei0ee20:" + make_hash('b')
		+ "d8:completei3e10:downloadedi0e10:incompletei0eeee");
}

SWARMGATE_TEST(status_codes)
{
	TEST_EQUAL(http_status_for(error_code()), 200);
	TEST_EQUAL(http_status_for(errors::banned_address), 403);
	TEST_EQUAL(http_status_for(errors::admission_denied), 403);
	TEST_EQUAL(http_status_for(errors::malformed_request), 400);
	TEST_EQUAL(http_status_for(errors::rate_limit_exceeded), 429);
}

SWARMGATE_TEST(announce)
{
	transport_fixture f;
	auto t = start_http(f);

	http_response r = http_get(t->listen_port(), announce_target(make_hash('a')
		, make_hash('p'), 6881, "&left=0"));
	TEST_EQUAL(r.status, 200);
	TEST_EQUAL(r.content_type, "text/plain");
	TEST_EQUAL(r.body, "d8:completei1e10:downloadedi0e10:incompletei0e"
		"8:intervali300e12:min intervali60e5:peers0:e");

	// the second peer gets the first one, at its socket address
	r = http_get(t->listen_port(), announce_target(make_hash('a')
		, make_hash('q'), 6882, "&left=10"));
	TEST_EQUAL(r.status, 200);
	TEST_CHECK(r.body.find(std::string("5:peers6:\x7f\x00\x00\x01\x1a\xe1", 15)) != std::string::npos);

	stop(t);
}

SWARMGATE_TEST(announce_malformed)
{
	transport_fixture f;
	auto t = start_http(f);

	http_response const r = http_get(t->listen_port(), "/announce?info_hash="
		+ url_escape(make_hash('a')) + "&peer_id=" + url_escape(make_hash('p')));
	TEST_EQUAL(r.status, 400);
	TEST_EQUAL(r.body, "d14:failure reason12:invalid porte");

	stop(t);
}

SWARMGATE_TEST(announce_banned)
{
	transport_fixture f;
	f.store.create(ban_range(ip("127.0.0.0"), ip("127.255.255.255")));
	auto t = start_http(f);

	http_response const r = http_get(t->listen_port(), announce_target(make_hash('a')
		, make_hash('p'), 6881));
	TEST_EQUAL(r.status, 403);
	TEST_EQUAL(r.body, "d14:failure reason20:IP address is bannede");
	TEST_EQUAL(f.swarm->stats().torrents, 0);

	stop(t);
}

SWARMGATE_TEST(scrape)
{
	transport_fixture f;
	f.swarm->announce(make_announce(make_hash('a'), make_hash('p'), "10.0.0.1", 0));
	auto t = start_http(f);

	http_response const r = http_get(t->listen_port(), "/scrape?info_hash="
		+ url_escape(make_hash('a')));
	TEST_EQUAL(r.status, 200);
	TEST_EQUAL(r.body, "d5:filesd20:" + make_hash('a')
		+ "d8:completei1e10:downloadedi0e10:incompletei0eeee");

	stop(t);
}

SWARMGATE_TEST(rate_limited)
{
	settings_pack s = test_settings();
	s.set_int(settings_pack::announce_quota_limit, 2);
	s.set_int(settings_pack::announce_quota_window, 60);
	transport_fixture f(s);
	auto t = start_http(f);
	std::string const target = announce_target(make_hash('a'), make_hash('p'), 6881);

	TEST_EQUAL(http_get(t->listen_port(), target).status, 200);
	TEST_EQUAL(http_get(t->listen_port(), target).status, 200);
	http_response const r = http_get(t->listen_port(), target);
	TEST_EQUAL(r.status, 429);
	TEST_CHECK(!r.retry_after.empty());
	int const retry = std::atoi(r.retry_after.c_str());
	TEST_CHECK(retry >= 1 && retry <= 60);
	TEST_EQUAL(r.body, "d14:failure reason19:rate limit exceedede");

	// other routes have their own quota
	TEST_EQUAL(http_get(t->listen_port(), "/nothing").status, 404);

	stop(t);
}

SWARMGATE_TEST(auth_routes_rate_limited)
{
	settings_pack s = test_settings();
	s.set_int(settings_pack::auth_quota_limit, 1);
	transport_fixture f(s);
	auto t = start_http(f);

	TEST_EQUAL(http_get(t->listen_port(), "/api/auth/login").status, 404);
	http_response const r = http_get(t->listen_port(), "/api/auth/login");
	TEST_EQUAL(r.status, 429);
	TEST_EQUAL(r.body, "Too Many Requests\n");
	// the tracker routes are not affected
	TEST_EQUAL(http_get(t->listen_port(), announce_target(make_hash('a')
		, make_hash('p'), 6881)).status, 200);

	stop(t);
}

SWARMGATE_TEST(slow_down)
{
	settings_pack s = test_settings();
	s.set_int(settings_pack::slow_down_after, 1);
	s.set_int(settings_pack::slow_down_delay, 300);
	transport_fixture f(s);
	auto t = start_http(f);
	std::string const target = announce_target(make_hash('a'), make_hash('p'), 6881);

	TEST_EQUAL(http_get(t->listen_port(), target).status, 200);
	time_point const start = clock_type::now();
	TEST_EQUAL(http_get(t->listen_port(), target).status, 200);
	// delayed, not rejected
	TEST_CHECK(clock_type::now() - start >= milliseconds(300));

	stop(t);
}

SWARMGATE_TEST(stats)
{
	transport_fixture f;
	f.swarm->announce(make_announce(make_hash('a'), make_hash('p'), "10.0.0.1", 0));
	auto t = start_http(f);

	http_response const r = http_get(t->listen_port(), "/stats");
	TEST_EQUAL(r.status, 200);
	TEST_EQUAL(r.content_type, "application/json");
	TEST_CHECK(r.body.find("\"torrents\":1") != std::string::npos);
	TEST_CHECK(r.body.find("\"seeders\":1") != std::string::npos);

	stop(t);
}

SWARMGATE_TEST(stats_disabled)
{
	settings_pack s = test_settings();
	s.set_bool(settings_pack::enable_stats, false);
	transport_fixture f(s);
	auto t = start_http(f);
	TEST_EQUAL(http_get(t->listen_port(), "/stats").status, 404);
	stop(t);
}

SWARMGATE_TEST(forwarded_for)
{
	settings_pack s = test_settings();
	s.set_bool(settings_pack::trust_proxy, true);
	transport_fixture f(s);
	f.store.create(ban_range(ip("10.9.9.0"), ip("10.9.9.255")));
	auto t = start_http(f);
	std::string const target = announce_target(make_hash('a'), make_hash('p'), 6881);

	// the first entry is the client
	http_response r = http_get(t->listen_port(), target
		, {{"X-Forwarded-For", "10.9.9.9, 127.0.0.1"}});
	TEST_EQUAL(r.status, 403);

	r = http_get(t->listen_port(), target, {{"X-Forwarded-For", "10.1.1.1, 10.9.9.9"}});
	TEST_EQUAL(r.status, 200);

	// unparsable entries fall back to the socket address
	r = http_get(t->listen_port(), target, {{"X-Forwarded-For", "garbage"}});
	TEST_EQUAL(r.status, 200);

	stop(t);
}

SWARMGATE_TEST(forwarded_for_untrusted)
{
	transport_fixture f;
	f.store.create(ban_range(ip("10.9.9.0"), ip("10.9.9.255")));
	auto t = start_http(f);

	http_response const r = http_get(t->listen_port(), announce_target(make_hash('a')
		, make_hash('p'), 6881), {{"X-Forwarded-For", "10.9.9.9"}});
	TEST_EQUAL(r.status, 200);

	stop(t);
}

SWARMGATE_TEST(stop_closes_listener)
{
	transport_fixture f;
	auto t = start_http(f);
	int const port = t->listen_port();
	TEST_EQUAL(http_get(port, "/nothing").status, 404);
	stop(t);
	TEST_CHECK(t->state() == transport_state::stopped);
	TEST_EQUAL(http_get(port, "/nothing").status, 0);
}
