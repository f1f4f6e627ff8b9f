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

#include "swarmgate/ban_range.hpp"
#include "swarmgate/ban_range_index.hpp"

#include <atomic>
#include <thread>
#include <vector>

using namespace sg;

namespace {

	ban_range make_range(char const* first, char const* last)
	{
		return ban_range(ip(first), ip(last));
	}
}

SWARMGATE_TEST(empty_index)
{
	ban_range_index idx;
	TEST_CHECK(idx.empty());
	TEST_EQUAL(idx.size(), 0);
	TEST_CHECK(!idx.query(ip("0.0.0.0")));
	TEST_CHECK(!idx.query(ip("255.255.255.255")));
	TEST_CHECK(!idx.query(addr("10.0.0.1")));
}

SWARMGATE_TEST(range_boundaries)
{
	ban_range_index idx;
	idx.rebuild({make_range("192.168.1.0", "192.168.1.255")});

	TEST_CHECK(!idx.query(addr("192.168.0.255")));
	TEST_CHECK(idx.query(addr("192.168.1.0")));
	TEST_CHECK(idx.query(addr("192.168.1.100")));
	TEST_CHECK(idx.query(addr("192.168.1.255")));
	TEST_CHECK(!idx.query(addr("192.168.2.0")));
}

SWARMGATE_TEST(single_address)
{
	ban_range_index idx;
	idx.rebuild({make_range("10.0.0.5", "10.0.0.5")});
	TEST_CHECK(!idx.query(addr("10.0.0.4")));
	TEST_CHECK(idx.query(addr("10.0.0.5")));
	TEST_CHECK(!idx.query(addr("10.0.0.6")));
}

SWARMGATE_TEST(overlapping_ranges)
{
	ban_range_index idx;
	idx.rebuild({
		make_range("10.0.0.0", "10.0.0.100")
		, make_range("10.0.0.50", "10.0.0.200")
		, make_range("10.0.0.20", "10.0.0.30")
	});

	// all three collapse into one interval
	TEST_EQUAL(idx.size(), 1);
	auto const ranges = idx.export_ranges();
	TEST_EQUAL(ranges.size(), 1);
	TEST_EQUAL(ranges.front().first, ip("10.0.0.0"));
	TEST_EQUAL(ranges.front().last, ip("10.0.0.200"));

	TEST_CHECK(idx.query(addr("10.0.0.150")));
	TEST_CHECK(!idx.query(addr("10.0.0.201")));
}

SWARMGATE_TEST(adjacent_ranges)
{
	ban_range_index idx;
	idx.rebuild({
		make_range("1.0.0.0", "1.0.0.255")
		, make_range("1.0.1.0", "1.0.1.255")
		, make_range("1.0.3.0", "1.0.3.255")
	});

	TEST_EQUAL(idx.size(), 2);
	TEST_CHECK(idx.query(addr("1.0.0.255")));
	TEST_CHECK(idx.query(addr("1.0.1.0")));
	TEST_CHECK(!idx.query(addr("1.0.2.0")));
	TEST_CHECK(idx.query(addr("1.0.3.7")));
}

SWARMGATE_TEST(full_address_space)
{
	ban_range_index idx;
	idx.rebuild({
		make_range("0.0.0.0", "127.255.255.255")
		, make_range("128.0.0.0", "255.255.255.255")
	});
	TEST_EQUAL(idx.size(), 1);
	TEST_CHECK(idx.query(ip("0.0.0.0")));
	TEST_CHECK(idx.query(ip("255.255.255.255")));
}

SWARMGATE_TEST(inverted_range_ignored)
{
	ban_range_index idx;
	idx.rebuild({make_range("10.0.0.10", "10.0.0.1")});
	TEST_CHECK(idx.empty());
	TEST_CHECK(!idx.query(addr("10.0.0.5")));
}

SWARMGATE_TEST(ipv6_addresses)
{
	ban_range_index idx;
	idx.rebuild({make_range("10.0.0.0", "10.255.255.255")});

	// v4-mapped addresses are looked up by their IPv4 form
	TEST_CHECK(idx.query(addr("::ffff:10.1.2.3")));
	TEST_CHECK(!idx.query(addr("::ffff:11.1.2.3")));
	TEST_CHECK(!idx.query(addr("2001:db8::1")));
}

SWARMGATE_TEST(rebuild_replaces_contents)
{
	ban_range_index idx;
	idx.rebuild({make_range("10.0.0.0", "10.0.0.255")});
	TEST_CHECK(idx.query(addr("10.0.0.1")));

	idx.rebuild({make_range("20.0.0.0", "20.0.0.255")});
	TEST_CHECK(!idx.query(addr("10.0.0.1")));
	TEST_CHECK(idx.query(addr("20.0.0.1")));

	idx.rebuild({});
	TEST_CHECK(idx.empty());
}

SWARMGATE_TEST(many_ranges)
{
	// every other /24 in 10.0.0.0/16 is banned
	std::vector<ban_range> ranges;
	for (std::uint32_t i = 0; i < 256; i += 2)
	{
		std::uint32_t const base = ip("10.0.0.0") | (i << 8);
		ranges.emplace_back(base, base | 0xff);
	}
	ban_range_index idx;
	idx.rebuild(ranges);
	TEST_EQUAL(idx.size(), 128);

	for (std::uint32_t i = 0; i < 256; ++i)
	{
		std::uint32_t const a = ip("10.0.0.0") | (i << 8) | 7;
		TEST_EQUAL(idx.query(a), (i % 2) == 0);
	}
}

SWARMGATE_TEST(concurrent_readers)
{
	ban_range_index idx;
	idx.rebuild({make_range("10.0.0.0", "10.0.0.255")});

	std::atomic<bool> done(false);
	std::atomic<int> wrong(0);

	// 10.0.0.1 is banned in every version of the index the writer
	// publishes, so no reader may ever see it unbanned
	std::vector<std::thread> readers;
	for (int i = 0; i < 4; ++i)
	{
		readers.emplace_back([&]
		{
			while (!done)
				if (!idx.query(ip("10.0.0.1"))) ++wrong;
		});
	}

	for (int i = 0; i < 1000; ++i)
	{
		std::vector<ban_range> ranges{make_range("10.0.0.0", "10.0.0.255")};
		for (int k = 0; k < i % 17; ++k)
			ranges.emplace_back(ip("20.0.0.0") + std::uint32_t(k * 256)
				, ip("20.0.0.0") + std::uint32_t(k * 256 + 10));
		idx.rebuild(ranges);
	}
	done = true;
	for (auto& t : readers) t.join();

	TEST_EQUAL(wrong.load(), 0);
}

SWARMGATE_TEST(parse_ban_range_forms)
{
	error_code ec;
	ban_range r = parse_ban_range("10.0.0.1", ec);
	TEST_CHECK(!ec);
	TEST_EQUAL(r.from_ip, ip("10.0.0.1"));
	TEST_EQUAL(r.to_ip, ip("10.0.0.1"));

	r = parse_ban_range("10.0.0.0-10.0.0.255 abusive client", ec);
	TEST_CHECK(!ec);
	TEST_EQUAL(r.from_ip, ip("10.0.0.0"));
	TEST_EQUAL(r.to_ip, ip("10.0.0.255"));
	TEST_EQUAL(r.reason, "abusive client");

	r = parse_ban_range("  192.168.5.77/16\tscanner ", ec);
	TEST_CHECK(!ec);
	TEST_EQUAL(r.from_ip, ip("192.168.0.0"));
	TEST_EQUAL(r.to_ip, ip("192.168.255.255"));
	TEST_EQUAL(r.reason, "scanner");

	r = parse_ban_range("0.0.0.0/0", ec);
	TEST_CHECK(!ec);
	TEST_EQUAL(r.from_ip, 0);
	TEST_EQUAL(r.to_ip, 0xffffffff);

	ec.clear();
	parse_ban_range("10.0.0.10-10.0.0.1", ec);
	TEST_EQUAL(ec, error_code(errors::invalid_ban_range));

	ec.clear();
	parse_ban_range("10.0.0/8", ec);
	TEST_EQUAL(ec, error_code(errors::invalid_ip_address));

	ec.clear();
	parse_ban_range("10.0.0.0/33", ec);
	TEST_EQUAL(ec, error_code(errors::invalid_ip_address));

	ec.clear();
	parse_ban_range("example.com", ec);
	TEST_EQUAL(ec, error_code(errors::invalid_ip_address));
}

SWARMGATE_TEST(print_range)
{
	TEST_EQUAL(print_ban_range(make_range("1.2.3.4", "5.6.7.8")), "1.2.3.4-5.6.7.8");
}
