/*
    Sandgate - sandbox egress gateway with TLS inspection and credential injection.
    Copyright (c) 2014, Ales Stibal <astib@mag0.net>, All rights reserved.

    Sandgate is free software: you can redistribute it and/or modify
    it under the terms of the GNU General Public License as published by
    the Free Software Foundation, either version 3 of the License, or
    (at your option) any later version.

    Sandgate is distributed in the hope that it will be useful,
    but WITHOUT ANY WARRANTY; without even the implied warranty of
    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
    GNU General Public License for more details.

    You should have received a copy of the GNU General Public License
    along with Sandgate.  If not, see <http://www.gnu.org/licenses/>.

    Linking Sandgate statically or dynamically with other modules is
    making a combined work based on Sandgate. Thus, the terms and
    conditions of the GNU General Public License cover the whole combination.

    In addition, as a special exception, the copyright holders of Sandgate
    give you permission to combine Sandgate with free software programs
    or libraries that are released under the GNU LGPL and with code
    included in the standard release of OpenSSL under the OpenSSL's license
    (or modified versions of such code, with unchanged license).
    You may copy and distribute such a system following the terms
    of the GNU GPL for Sandgate and the licenses of the other code
    concerned, provided that you include the source code of that other code
    when and as the GNU GPL requires distribution of source code.

    Note that people who make modified versions of Sandgate are not
    obligated to grant this special exception for their modified versions;
    it is their choice whether to do so. The GNU General Public License
    gives permission to release a modified version without this exception;
    this exception also makes it possible to release a modified version
    which carries forward this exception.
*/

#include <thread>
#include <vector>

#include <ca/leafstore.hpp>

#include <gtest/gtest.h>

using namespace sg::ca;

class LeafStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        AuthorityManager::options_t o;
        o.persist = false;
        o.validity = 86400;
        o.safety_margin = 7200;

        authority = std::make_unique<AuthorityManager>(o, [this]() { return now; });
        ASSERT_TRUE(authority->ensure_authority());
    }

    std::unique_ptr<LeafStore> store(std::size_t capacity = 1024) {
        LeafStore::options_t lo;
        lo.capacity = capacity;
        return std::make_unique<LeafStore>(*authority, lo);
    }

    time_t now = ::time(nullptr);
    std::unique_ptr<AuthorityManager> authority;
};


TEST_F(LeafStoreTest, issues_valid_leaf) {
    auto ls = store();

    auto leaf = ls->get("api.example.com");
    ASSERT_NE(leaf, nullptr);
    ASSERT_NE(leaf->ctx, nullptr);
    ASSERT_EQ(leaf->generation, 1U);
    ASSERT_EQ(leaf->not_after, now + 6 * 3600);

    auto signer = authority->active();
    ASSERT_EQ(X509_verify(leaf->cert.get(), signer->key.get()), 1);
    ASSERT_EQ(X509_check_host(leaf->cert.get(), "api.example.com", 0, 0, nullptr), 1);
    ASSERT_NE(X509_check_host(leaf->cert.get(), "www.example.com", 0, 0, nullptr), 1);
    ASSERT_EQ(X509_check_ca(leaf->cert.get()), 0);
}

TEST_F(LeafStoreTest, cached_per_host) {
    auto ls = store();

    auto a = ls->get("api.example.com");
    auto b = ls->get("API.Example.com");

    ASSERT_EQ(a, b);
    ASSERT_EQ(ls->issued_count(), 1U);
    ASSERT_EQ(ls->size(), 1U);
    ASSERT_EQ(ls->peek("api.example.com"), a);
    ASSERT_EQ(ls->peek("other.example.com"), nullptr);
}

TEST_F(LeafStoreTest, address_names_in_san) {
    auto ls = store();

    auto leaf = ls->get("10.0.0.5");
    ASSERT_EQ(X509_check_ip_asc(leaf->cert.get(), "10.0.0.5", 0), 1);
}

TEST_F(LeafStoreTest, bounded_by_authority) {
    // authority has only two hours left
    now += 86400 - 7200 - 1;
    auto ls = store();

    auto leaf = ls->get("api.example.com");
    ASSERT_EQ(leaf->not_after, authority->active()->not_after);
}

TEST_F(LeafStoreTest, reissued_after_rotation) {
    auto ls = store();
    auto old_leaf = ls->get("api.example.com");

    now += 86400 - 7200;
    ASSERT_TRUE(authority->ensure_authority());
    ASSERT_EQ(authority->active()->generation, 2U);

    auto new_leaf = ls->get("api.example.com");
    ASSERT_NE(new_leaf, old_leaf);
    ASSERT_EQ(new_leaf->generation, 2U);

    // old signer remains referenced by the leaf in use
    ASSERT_EQ(old_leaf->issuer->generation, 1U);
    ASSERT_FALSE(old_leaf->usable(authority->now(), 2));
}

TEST_F(LeafStoreTest, purge_stale) {
    auto ls = store();
    ls->get("a.example.com");
    ls->get("b.example.com");

    ASSERT_EQ(ls->purge(), 0U);

    now += 86400 - 7200;
    ASSERT_TRUE(authority->ensure_authority());
    ls->get("a.example.com");

    // b still belongs to the previous generation
    ASSERT_EQ(ls->purge(), 1U);
    ASSERT_EQ(ls->size(), 1U);
}

TEST_F(LeafStoreTest, capacity_evicts_soonest_expiring) {
    auto ls = store(2);

    ls->get("a.example.com");
    now += 10;
    ls->get("b.example.com");
    now += 10;
    ls->get("c.example.com");

    ASSERT_EQ(ls->size(), 2U);
    ASSERT_EQ(ls->peek("a.example.com"), nullptr);
    ASSERT_NE(ls->peek("c.example.com"), nullptr);
}

TEST_F(LeafStoreTest, single_flight) {
    auto ls = store();

    std::vector<leaf_ptr> results(8);
    std::vector<std::thread> threads;

    for(std::size_t i = 0; i < results.size(); i++) {
        threads.emplace_back([&ls, &results, i]() {
            results[i] = ls->get("concurrent.example.com");
        });
    }
    for(auto& t: threads) t.join();

    ASSERT_EQ(ls->issued_count(), 1U);
    for(auto const& r: results) {
        ASSERT_EQ(r, results[0]);
    }
}

TEST_F(LeafStoreTest, refuses_bad_names) {
    auto ls = store();

    ASSERT_THROW(ls->get("bad host"), leaf_error);
    ASSERT_THROW(ls->get("x/../y"), leaf_error);
    ASSERT_EQ(ls->issued_count(), 0U);
    ASSERT_EQ(ls->failures(), 4U);
}

TEST_F(LeafStoreTest, no_authority) {
    AuthorityManager::options_t o;
    o.persist = false;
    AuthorityManager empty(o);

    LeafStore ls(empty, LeafStore::options_t());
    ASSERT_THROW(ls.get("api.example.com"), leaf_error);
}
