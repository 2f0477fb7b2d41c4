#include "test_util.hpp"
#include "sig_test_fixture.hpp"
#include "core/config.hpp"
#include "core/errors.hpp"
#include "sketch/minhash.hpp"
#include "sketch/signature.hpp"

#include <cstdint>
#include <cstdio>

using namespace sigindex;
using sig_fixture::hash_range;

static void test_scaled_conversion() {
    std::fprintf(stderr, "-- test_scaled_conversion\n");

    CHECK_EQ(max_hash_for_scaled(1), UINT64_MAX);
    CHECK_EQ(scaled_for_max_hash(UINT64_MAX), 1u);
    CHECK_EQ(scaled_for_max_hash(0), 0u);

    for (uint64_t s : {2ull, 10ull, 1000ull, 65536ull}) {
        CHECK_EQ(scaled_for_max_hash(max_hash_for_scaled(s)), s);
    }
}

static void test_construction_rules() {
    std::fprintf(stderr, "-- test_construction_rules\n");

    CHECK_THROWS(MinHash(31, 10, 1000), ConfigurationError);
    CHECK_THROWS(MinHash(31, 0, 0), ConfigurationError);
    CHECK_THROWS(MinHash(0, 10, 0), ConfigurationError);
    CHECK_THROWS(MinHash::make_scaled(31, 0), ConfigurationError);

    MinHash s = MinHash::make_scaled(21, 1000);
    CHECK_EQ(s.ksize(), 21u);
    CHECK_EQ(s.num(), 0u);
    CHECK_EQ(s.scaled(), 1000u);
    CHECK(s.moltype() == "DNA");
    CHECK_EQ(s.seed(), DEFAULT_SEED);

    MinHash n = MinHash::make_num(21, 500);
    CHECK_EQ(n.num(), 500u);
    CHECK_EQ(n.max_hash(), 0u);
}

static void test_add_hash_scaled() {
    std::fprintf(stderr, "-- test_add_hash_scaled\n");

    MinHash mh = MinHash::make_scaled(31, 4);
    uint64_t cutoff = mh.max_hash();
    mh.add_hash(50);
    mh.add_hash(10);
    mh.add_hash(30);
    mh.add_hash(10);            // duplicate
    mh.add_hash(cutoff + 1);    // above max_hash, dropped
    CHECK_EQ(mh.size(), 3u);
    CHECK_EQ(mh.hashes()[0], 10u);
    CHECK_EQ(mh.hashes()[1], 30u);
    CHECK_EQ(mh.hashes()[2], 50u);
}

static void test_add_hash_num() {
    std::fprintf(stderr, "-- test_add_hash_num\n");

    MinHash mh = MinHash::make_num(31, 3);
    mh.add_many({90, 10, 70, 40, 20});
    CHECK_EQ(mh.size(), 3u);
    CHECK_EQ(mh.hashes()[0], 10u);
    CHECK_EQ(mh.hashes()[1], 20u);
    CHECK_EQ(mh.hashes()[2], 40u);

    mh.add_hash(100);           // larger than every kept hash
    CHECK_EQ(mh.hashes()[2], 40u);
    mh.add_hash(5);
    CHECK_EQ(mh.hashes()[0], 5u);
    CHECK_EQ(mh.hashes()[2], 20u);
}

static void test_abundance() {
    std::fprintf(stderr, "-- test_abundance\n");

    MinHash mh = MinHash::make_scaled(31, 1, true);
    mh.add_hash(7, 2);
    mh.add_hash(3);
    mh.add_hash(7, 5);
    CHECK_EQ(mh.size(), 2u);
    CHECK_EQ(mh.abundances().size(), 2u);
    CHECK_EQ(mh.abundances()[0], 1u);
    CHECK_EQ(mh.abundances()[1], 7u);
}

static void test_overlap_measures() {
    std::fprintf(stderr, "-- test_overlap_measures\n");

    MinHash a = MinHash::make_scaled(31, 1);
    MinHash b = MinHash::make_scaled(31, 1);
    a.add_many(hash_range(0, 10));      // 10 hashes
    b.add_many(hash_range(5, 25));      // 20 hashes, 5 shared

    CHECK_EQ(a.count_common(b), 5u);
    CHECK_NEAR(a.jaccard(b), 5.0 / 25.0, 1e-12);
    CHECK_NEAR(a.contained_by(b), 5.0 / 10.0, 1e-12);
    CHECK_NEAR(a.containment(b), 5.0 / 20.0, 1e-12);
    CHECK_NEAR(b.contained_by(a), 5.0 / 20.0, 1e-12);
    CHECK_NEAR(a.max_containment(b), 5.0 / 10.0, 1e-12);
    CHECK_NEAR(a.similarity(b), a.jaccard(b), 1e-12);

    MinHash empty = MinHash::make_scaled(31, 1);
    CHECK_NEAR(empty.contained_by(a), 0.0, 1e-12);
    CHECK_NEAR(empty.jaccard(a), 0.0, 1e-12);
}

static void test_num_jaccard_truncates_union() {
    std::fprintf(stderr, "-- test_num_jaccard_truncates_union\n");

    MinHash a = MinHash::make_num(31, 4);
    MinHash b = MinHash::make_num(31, 4);
    a.add_many({1, 2, 3, 4});
    b.add_many({1, 3, 5, 6});
    // union truncated to 4 smallest: {1,2,3,4}; shared among them: {1,3}
    CHECK_NEAR(a.jaccard(b), 0.5, 1e-12);
}

static void test_angular_similarity() {
    std::fprintf(stderr, "-- test_angular_similarity\n");

    MinHash a = MinHash::make_scaled(31, 1, true);
    MinHash b = MinHash::make_scaled(31, 1, true);
    a.add_hash(1, 3);
    a.add_hash(2, 4);
    b.add_hash(1, 6);
    b.add_hash(2, 8);
    CHECK_NEAR(a.similarity(b), 1.0, 1e-9);

    MinHash c = MinHash::make_scaled(31, 1, true);
    c.add_hash(3, 1);
    CHECK_NEAR(a.similarity(c), 0.0, 1e-9);

    // ignore_abundance falls back to Jaccard
    MinHash d = MinHash::make_scaled(31, 1, true);
    d.add_hash(1, 100);
    CHECK_NEAR(a.similarity(d, false, true), 0.5, 1e-12);

    MinHash flat = MinHash::make_scaled(31, 1);
    CHECK_THROWS(a.angular_similarity(flat), ConfigurationError);
}

static void test_incompatible_sketches() {
    std::fprintf(stderr, "-- test_incompatible_sketches\n");

    MinHash k21 = MinHash::make_scaled(21, 1);
    MinHash k31 = MinHash::make_scaled(31, 1);
    MinHash prot = MinHash::make_scaled(31, 1, false, "protein");
    MinHash num = MinHash::make_num(31, 10);
    MinHash other_seed = MinHash::make_scaled(31, 1, false, "DNA", 7);

    CHECK_THROWS(k21.jaccard(k31), ConfigurationError);
    CHECK_THROWS(k31.jaccard(prot), ConfigurationError);
    CHECK_THROWS(k31.contained_by(num), ConfigurationError);
    CHECK_THROWS(k31.count_common(other_seed), ConfigurationError);
}

static void test_downsample() {
    std::fprintf(stderr, "-- test_downsample\n");

    MinHash fine = MinHash::make_scaled(31, 1);
    MinHash coarse = MinHash::make_scaled(31, 2);
    uint64_t half = coarse.max_hash();
    fine.add_many({1, 2, half - 1, half + 10});
    coarse.add_many({1, 2, half - 1});

    CHECK_THROWS(fine.jaccard(coarse), ConfigurationError);
    CHECK_NEAR(fine.jaccard(coarse, true), 1.0, 1e-12);
    CHECK_EQ(fine.count_common(coarse, true), 3u);

    MinHash down = fine.downsample_scaled(2);
    CHECK_EQ(down.scaled(), 2u);
    CHECK_EQ(down.size(), 3u);
    CHECK_THROWS(coarse.downsample_scaled(1), ConfigurationError);

    MinHash n = MinHash::make_num(31, 5);
    n.add_many({5, 4, 3, 2, 1});
    MinHash n3 = n.downsample_num(3);
    CHECK_EQ(n3.num(), 3u);
    CHECK_EQ(n3.size(), 3u);
    CHECK_EQ(n3.hashes()[2], 3u);
    CHECK_THROWS(n.downsample_num(10), ConfigurationError);
    CHECK_THROWS(n.downsample_scaled(2), ConfigurationError);
}

static void test_md5_and_display_name() {
    std::fprintf(stderr, "-- test_md5_and_display_name\n");

    MinHash a = MinHash::make_scaled(31, 1);
    a.add_many({1, 2, 3});
    MinHash b = MinHash::make_scaled(31, 1);
    b.add_many({3, 2, 1});
    MinHash c = MinHash::make_scaled(21, 1);
    c.add_many({1, 2, 3});

    CHECK_EQ(a.md5sum().size(), 32u);
    CHECK(a.md5sum() == b.md5sum());
    CHECK(a.md5sum() != c.md5sum());
    CHECK(a == b);

    Signature named(a, "genome-1", "g1.fa");
    CHECK(named.display_name() == "genome-1");
    Signature file_only(a, "", "g1.fa");
    CHECK(file_only.display_name() == "g1.fa");
    Signature bare(a);
    CHECK(bare.display_name() == a.md5sum().substr(0, 8));
    CHECK(bare.md5sum() == a.md5sum());
    CHECK(named != bare);
}

int main() {
    test_scaled_conversion();
    test_construction_rules();
    test_add_hash_scaled();
    test_add_hash_num();
    test_abundance();
    test_overlap_measures();
    test_num_jaccard_truncates_union();
    test_angular_similarity();
    test_incompatible_sketches();
    test_downsample();
    test_md5_and_display_name();

    TEST_SUMMARY();
    return g_fail_count > 0 ? 1 : 0;
}
