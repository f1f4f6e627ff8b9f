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

#include "swarmgate/gateway.hpp"
#include "swarmgate/udp_transport.hpp"
#include "swarmgate/aux_/escape_string.hpp"
#include "swarmgate/aux_/io.hpp"

#include <boost/asio/ip/udp.hpp>

#include <iterator>
#include <string>

using namespace sg;

namespace {

	settings_pack all_transports()
	{
		settings_pack s = test_settings();
		s.set_bool(settings_pack::enable_udp, true);
		s.set_bool(settings_pack::enable_websocket, true);
		return s;
	}

	std::string announce_target(char const h, char const p)
	{
		return "/announce?info_hash=" + url_escape(make_hash(h))
			+ "&peer_id=" + url_escape(make_hash(p)) + "&port=6881";
	}
}

SWARMGATE_TEST(http_only_by_default)
{
	gateway g{gateway_params(test_settings())};
	std::vector<transport*> const t = g.transports();
	TEST_EQUAL(t.size(), 1);
	TEST_EQUAL(std::string(t[0]->name()), "http");
	TEST_CHECK(g.find_transport("udp") == nullptr);
	TEST_CHECK(g.find_transport("websocket") == nullptr);
	TEST_CHECK(!g.is_running());
}

SWARMGATE_TEST(start_and_stop)
{
	gateway_params p(all_transports());
#ifndef SWARMGATE_DISABLE_LOGGING
	recording_logger log;
	p.logger = &log;
#endif
	gateway g(std::move(p));

	std::vector<transport*> const t = g.transports();
	TEST_EQUAL(t.size(), 3);
	TEST_EQUAL(std::string(t[0]->name()), "http");
	TEST_EQUAL(std::string(t[1]->name()), "udp");
	TEST_EQUAL(std::string(t[2]->name()), "websocket");

	g.start();
	TEST_CHECK(g.is_running());
	for (auto const* tr : t)
	{
		TEST_CHECK(tr->state() == transport_state::running);
		TEST_CHECK(tr->listen_port() != 0);
	}

	// every transport reaches the same swarm
	int const http_port = g.find_transport("http")->listen_port();
	TEST_EQUAL(http_get(http_port, announce_target('a', 'p')).status, 200);

	websocket_client c(g.find_transport("websocket")->listen_port());
	TEST_CHECK(c.send("{\"action\":\"scrape\",\"info_hash\":\""
		+ aux::to_hex(make_hash('a')) + "\"}"));
	std::string reply;
	TEST_CHECK(c.read(reply));
	TEST_CHECK(reply.find("\"incomplete\":1") != std::string::npos);

	TEST_THROW_CODE(g.start(), errors::transport_already_started);

	std::vector<error_code> const errors = g.stop();
	TEST_CHECK(errors.empty());
	TEST_CHECK(!g.is_running());
	for (auto const* tr : t)
		TEST_CHECK(tr->state() == transport_state::stopped);

#ifndef SWARMGATE_DISABLE_LOGGING
	// transports are stopped newest first
	int const ws = log.find("websocket transport stopped");
	int const udp = log.find("udp transport stopped");
	int const http = log.find("http transport stopped");
	TEST_CHECK(ws >= 0);
	TEST_CHECK(ws < udp);
	TEST_CHECK(udp < http);
#endif

	// stop is idempotent
	TEST_CHECK(g.stop().empty());
}

SWARMGATE_TEST(startup_failure)
{
	// occupy a UDP port, so the second transport fails to bind
	boost::asio::io_context ioc;
	udp::socket blocker(ioc, udp::endpoint(make_address("127.0.0.1"), 0));
	int const taken = blocker.local_endpoint().port();

	settings_pack s = all_transports();
	s.set_int(settings_pack::udp_port, taken);
	gateway g{gateway_params(s)};

	TEST_THROW_CODE(g.start(), errors::transport_startup_failed);
	TEST_CHECK(!g.is_running());

	// the HTTP transport was started first, and stopped again
	TEST_CHECK(g.find_transport("http")->state() == transport_state::stopped);
	TEST_CHECK(g.find_transport("udp")->state() == transport_state::not_started);
	TEST_CHECK(g.find_transport("websocket")->state() == transport_state::not_started);

	// the stopped HTTP transport cannot be started again, and is named in
	// the error
	bool thrown = false;
	try
	{
		g.start();
	}
	catch (system_error const& e)
	{
		thrown = true;
		TEST_EQUAL(e.code(), error_code(errors::transport_startup_failed));
		TEST_CHECK(std::string(e.what()).find("http") != std::string::npos);
	}
	TEST_CHECK(thrown);

	TEST_CHECK(g.stop().empty());
}

SWARMGATE_TEST(bans_enforced)
{
	gateway g{gateway_params(test_settings())};
	g.start();
	int const port = g.find_transport("http")->listen_port();

	TEST_EQUAL(http_get(port, announce_target('a', 'p')).status, 200);

	ban_range const r = g.ban_ranges().create(ban_range(ip("127.0.0.1"), ip("127.0.0.1")));
	TEST_CHECK(g.ban_index().query(addr("127.0.0.1")));
	TEST_EQUAL(http_get(port, announce_target('a', 'p')).status, 403);

	g.ban_ranges().remove(r.id);
	TEST_EQUAL(http_get(port, announce_target('a', 'p')).status, 200);

	g.stop();
}

SWARMGATE_TEST(extensions)
{
	gateway g{gateway_params(test_settings())};
	g.filter().add_extension("no_b", [](std::string const& h, tracker_request const&, address const&)
	{
		if (h == make_hash('b')) return admission_result(errors::admission_denied, "not here");
		return admission_result::allow();
	});
	g.start();
	int const port = g.find_transport("http")->listen_port();

	TEST_EQUAL(http_get(port, announce_target('a', 'p')).status, 200);
	http_response const r = http_get(port, announce_target('b', 'p'));
	TEST_EQUAL(r.status, 403);
	TEST_EQUAL(r.body, "d14:failure reason8:not heree");
	TEST_EQUAL(g.swarm().stats().denied, 1);

	g.stop();
}

SWARMGATE_TEST(persisted_bans_loaded)
{
	auto backend = std::make_shared<memory_ban_range_backend>();
	error_code ec;
	backend->insert(ban_range(ip("192.168.0.0"), ip("192.168.255.255")), ec);
	TEST_CHECK(!ec);

	gateway_params p(test_settings());
	p.backend = backend;
	gateway g(std::move(p));
	TEST_CHECK(g.ban_index().query(addr("192.168.4.4")));
	TEST_EQUAL(g.ban_ranges().count(), 1);
}

SWARMGATE_TEST(custom_swarm)
{
	int built = 0;
	gateway_params p(test_settings());
	p.swarm = [&built](settings_pack const& s, filter_hook f, gateway_logger* l)
	{
		++built;
		return make_memory_swarm(s, std::move(f), l);
	};
	gateway g(std::move(p));
	TEST_EQUAL(built, 1);

	// the engine was handed the admission filter as its hook
	g.ban_ranges().create(ban_range(ip("10.0.0.0"), ip("10.0.0.255")));
	announce_response const r = g.swarm().announce(make_announce(make_hash('a')
		, make_hash('p'), "10.0.0.3"));
	TEST_EQUAL(r.ec, error_code(errors::banned_address));
}

SWARMGATE_TEST(null_swarm)
{
	gateway_params p(test_settings());
	p.swarm = [](settings_pack const&, filter_hook, gateway_logger*)
	{ return std::unique_ptr<swarm_interface>(); };
	TEST_THROW(gateway g(std::move(p)));
}

SWARMGATE_TEST(udp_through_gateway)
{
	settings_pack s = test_settings();
	s.set_bool(settings_pack::enable_udp, true);
	gateway g{gateway_params(s)};
	g.start();

	std::string buf;
	auto out = std::back_inserter(buf);
	aux::write_uint64(udp_tracker::protocol_id, out);
	aux::write_uint32(udp_tracker::action_connect, out);
	aux::write_uint32(1, out);
	std::string const reply = udp_request(g.find_transport("udp")->listen_port(), buf);
	TEST_EQUAL(reply.size(), 16);

	g.stop();
}

SWARMGATE_TEST(destructor_stops)
{
	int port = 0;
	{
		gateway g{gateway_params(test_settings())};
		g.start();
		port = g.find_transport("http")->listen_port();
		TEST_EQUAL(http_get(port, "/stats").status, 200);
	}
	TEST_EQUAL(http_get(port, "/stats").status, 0);
}
