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
#include "swarmgate/ban_range_store.hpp"

#include <algorithm>
#include <memory>
#include <set>
#include <string>
#include <vector>

using namespace sg;

namespace {

	ban_range make_range(char const* first, char const* last
		, std::string reason = std::string())
	{
		return ban_range(ip(first), ip(last), std::move(reason));
	}
}

SWARMGATE_TEST(create_and_get)
{
	ban_range_index idx;
	ban_range_store store(nullptr, idx);

	ban_range const r = store.create(make_range("10.0.0.0", "10.0.0.255", "spam"));
	TEST_CHECK(r.id > 0);
	TEST_CHECK(r.created > 0);
	TEST_EQUAL(r.reason, "spam");

	ban_range const g = store.get(r.id);
	TEST_CHECK(g == r);
	TEST_EQUAL(store.count(), 1);

	// the index is updated before create() returns
	TEST_CHECK(idx.query(addr("10.0.0.17")));
	TEST_CHECK(!idx.query(addr("10.0.1.17")));
}

SWARMGATE_TEST(ids_are_not_reused)
{
	ban_range_index idx;
	ban_range_store store(nullptr, idx);

	int const a = store.create(make_range("1.0.0.0", "1.0.0.1")).id;
	int const b = store.create(make_range("1.0.0.2", "1.0.0.3")).id;
	TEST_NE(a, b);
	store.remove(b);
	int const c = store.create(make_range("1.0.0.2", "1.0.0.3")).id;
	TEST_NE(c, b);
	TEST_NE(c, a);
}

SWARMGATE_TEST(create_validation)
{
	ban_range_index idx;
	ban_range_store store(nullptr, idx);

	TEST_THROW_CODE(store.create(make_range("10.0.0.2", "10.0.0.1"))
		, errors::invalid_ban_range);

	// the reason column holds at most 255 bytes
	TEST_NOTHROW(store.create(make_range("10.0.0.1", "10.0.0.1"
		, std::string(max_ban_reason_length, 'x'))));
	TEST_THROW_CODE(store.create(make_range("10.0.0.2", "10.0.0.2"
		, std::string(max_ban_reason_length + 1, 'x')))
		, errors::ban_reason_too_long);

	TEST_THROW_CODE(store.create(make_range("10.0.0.1", "10.0.0.1", "again"))
		, errors::duplicate_ban_range);

	TEST_EQUAL(store.count(), 1);
	TEST_CHECK(!idx.query(addr("10.0.0.2")));
}

SWARMGATE_TEST(validation_error_classification)
{
	TEST_CHECK(is_validation_error(errors::invalid_ban_range));
	TEST_CHECK(is_validation_error(errors::ban_reason_too_long));
	TEST_CHECK(is_validation_error(errors::duplicate_ban_range));
	TEST_CHECK(!is_validation_error(errors::ban_range_not_found));
	TEST_CHECK(!is_validation_error(errors::banned_address));
}

SWARMGATE_TEST(get_missing)
{
	ban_range_index idx;
	ban_range_store store(nullptr, idx);
	TEST_THROW_CODE(store.get(1), errors::ban_range_not_found);
	TEST_THROW_CODE(store.remove(1), errors::ban_range_not_found);
	TEST_THROW_CODE(store.update(1, ban_range_patch()), errors::ban_range_not_found);
}

SWARMGATE_TEST(remove_missing_keeps_index)
{
	ban_range_index idx;
	ban_range_store store(nullptr, idx);
	ban_range const a = store.create(make_range("10.0.0.0", "10.0.0.255"));
	ban_range const b = store.create(make_range("192.168.1.0", "192.168.1.9"));
	auto const before = idx.export_ranges();
	TEST_EQUAL(before.size(), 2);

	int const missing = std::max(a.id, b.id) + 1;
	TEST_THROW_CODE(store.remove(missing), errors::ban_range_not_found);

	auto const after = idx.export_ranges();
	TEST_EQUAL(after.size(), before.size());
	for (std::size_t i = 0; i < after.size() && i < before.size(); ++i)
	{
		TEST_EQUAL(after[i].first, before[i].first);
		TEST_EQUAL(after[i].last, before[i].last);
	}
	TEST_EQUAL(store.count(), 2);
	TEST_CHECK(idx.query(addr("10.0.0.17")));
	TEST_CHECK(idx.query(addr("192.168.1.5")));
}

SWARMGATE_TEST(update_partial)
{
	ban_range_index idx;
	ban_range_store store(nullptr, idx);
	ban_range const r = store.create(make_range("10.0.0.0", "10.0.0.255", "old"));

	ban_range_patch p;
	p.reason = std::string("new");
	ban_range u = store.update(r.id, p);
	TEST_EQUAL(u.reason, "new");
	TEST_EQUAL(u.from_ip, r.from_ip);
	TEST_EQUAL(u.to_ip, r.to_ip);
	TEST_EQUAL(u.created, r.created);

	p = ban_range_patch();
	p.to_ip = ip("10.0.1.255");
	u = store.update(r.id, p);
	TEST_EQUAL(u.to_ip, ip("10.0.1.255"));
	TEST_EQUAL(u.reason, "new");
	TEST_CHECK(idx.query(addr("10.0.1.10")));

	TEST_CHECK(store.get(r.id) == u);
}

SWARMGATE_TEST(update_validation)
{
	ban_range_index idx;
	ban_range_store store(nullptr, idx);
	ban_range const a = store.create(make_range("10.0.0.0", "10.0.0.255"));
	ban_range const b = store.create(make_range("20.0.0.0", "20.0.0.255"));

	ban_range_patch p;
	p.from_ip = ip("10.0.1.0");
	TEST_THROW_CODE(store.update(a.id, p), errors::invalid_ban_range);

	p = ban_range_patch();
	p.from_ip = a.from_ip;
	p.to_ip = a.to_ip;
	TEST_THROW_CODE(store.update(b.id, p), errors::duplicate_ban_range);

	// updating a range to its own key is not a conflict
	p.reason = std::string("same");
	TEST_NOTHROW(store.update(a.id, p));

	p = ban_range_patch();
	p.reason = std::string(max_ban_reason_length + 1, 'x');
	TEST_THROW_CODE(store.update(a.id, p), errors::ban_reason_too_long);

	// failed updates leave the stored range untouched
	TEST_EQUAL(store.get(b.id).from_ip, ip("20.0.0.0"));
	TEST_EQUAL(store.get(a.id).reason, "same");
	TEST_CHECK(idx.query(addr("20.0.0.1")));
}

SWARMGATE_TEST(remove_unbans)
{
	ban_range_index idx;
	ban_range_store store(nullptr, idx);
	ban_range const r = store.create(make_range("10.0.0.0", "10.0.0.255", "x"));
	TEST_CHECK(idx.query(addr("10.0.0.1")));

	ban_range const removed = store.remove(r.id);
	TEST_CHECK(removed == r);
	TEST_CHECK(!idx.query(addr("10.0.0.1")));
	TEST_EQUAL(store.count(), 0);
	TEST_THROW_CODE(store.get(r.id), errors::ban_range_not_found);
}

SWARMGATE_TEST(bulk_create_dedupe)
{
	ban_range_index idx;
	ban_range_store store(nullptr, idx);
	store.create(make_range("10.0.0.0", "10.0.0.255"));

	std::vector<ban_range> batch{
		make_range("10.0.0.0", "10.0.0.255") // already stored
		, make_range("20.0.0.0", "20.0.0.255")
		, make_range("20.0.0.0", "20.0.0.255") // repeated within the batch
		, make_range("30.0.0.9", "30.0.0.1") // invalid
		, make_range("40.0.0.0", "40.0.0.0", std::string(300, 'x')) // invalid
		, make_range("50.0.0.0", "50.0.0.255")
	};
	TEST_EQUAL(store.bulk_create(batch), 2);
	TEST_EQUAL(store.count(), 3);
	TEST_CHECK(idx.query(addr("20.0.0.1")));
	TEST_CHECK(idx.query(addr("50.0.0.1")));
	TEST_CHECK(!idx.query(addr("30.0.0.5")));
	TEST_CHECK(!idx.query(addr("40.0.0.0")));

	TEST_EQUAL(store.bulk_create({}), 0);
}

SWARMGATE_TEST(list_paging)
{
	ban_range_index idx;
	ban_range_store store(nullptr, idx);
	std::vector<ban_range> batch;
	for (std::uint32_t i = 0; i < 45; ++i)
		batch.emplace_back(ip("10.0.0.0") + i * 256, ip("10.0.0.0") + i * 256 + 255);
	TEST_EQUAL(store.bulk_create(batch), 45);

	ban_range_page p = store.list();
	TEST_EQUAL(p.page, 1);
	TEST_EQUAL(p.limit, ban_range_store::default_page_size);
	TEST_EQUAL(p.total, 45);
	TEST_EQUAL(p.pages, 3);
	TEST_EQUAL(p.ranges.size(), 20);

	// same creation time, so newest id first
	TEST_EQUAL(p.ranges.front().id, 45);

	p = store.list(3);
	TEST_EQUAL(p.ranges.size(), 5);
	TEST_EQUAL(p.ranges.back().id, 1);

	p = store.list(4);
	TEST_CHECK(p.ranges.empty());
	TEST_EQUAL(p.total, 45);

	p = store.list(0, 0);
	TEST_EQUAL(p.page, 1);
	TEST_EQUAL(p.limit, ban_range_store::default_page_size);

	std::set<int> ids;
	for (int page = 1; page <= 5; ++page)
		for (auto const& r : store.list(page, 10).ranges)
			ids.insert(r.id);
	TEST_EQUAL(ids.size(), 45);
}

SWARMGATE_TEST(refresh_from_backend)
{
	// a backend that already holds ranges, as after a restart
	auto backend = std::make_shared<memory_ban_range_backend>();
	error_code ec;
	backend->insert(make_range("10.0.0.0", "10.0.0.255"), ec);
	TEST_CHECK(!ec);

	ban_range_index idx;
	ban_range_store store(backend, idx);
	TEST_CHECK(!idx.query(addr("10.0.0.1")));
	store.refresh();
	TEST_CHECK(idx.query(addr("10.0.0.1")));
	TEST_EQUAL(store.count(), 1);
}

SWARMGATE_TEST(memory_backend)
{
	memory_ban_range_backend b;
	error_code ec;
	ban_range const r = b.insert(make_range("1.1.1.1", "1.1.1.2"), ec);
	TEST_CHECK(!ec);
	TEST_EQUAL(r.id, 1);
	TEST_CHECK(b.contains_key(ip("1.1.1.1"), ip("1.1.1.2")));
	TEST_CHECK(!b.contains_key(ip("1.1.1.1"), ip("1.1.1.2"), r.id));

	b.insert(make_range("1.1.1.1", "1.1.1.2"), ec);
	TEST_EQUAL(ec, error_code(errors::duplicate_ban_range));

	ec.clear();
	ban_range moved = r;
	moved.id = 7;
	b.replace(moved, ec);
	TEST_EQUAL(ec, error_code(errors::ban_range_not_found));

	TEST_CHECK(b.erase(r.id));
	TEST_CHECK(!b.erase(r.id));
	TEST_CHECK(!b.contains_key(ip("1.1.1.1"), ip("1.1.1.2")));
	TEST_CHECK(!b.find(r.id));
}
