#include "test_util.hpp"
#include "sig_test_fixture.hpp"
#include "core/config.hpp"
#include "core/errors.hpp"
#include "index/linear_index.hpp"
#include "search/index_search.hpp"

#include <cstdio>
#include <string>
#include <vector>

using namespace sigindex;
using sig_fixture::hash_range;
using sig_fixture::num_sig;
using sig_fixture::scaled_sig;

namespace {

// Counts enumeration passes.
class CountingIndex : public LinearIndex {
public:
    using LinearIndex::LinearIndex;
    void signatures(const SignatureVisitor& visit) const override {
        passes++;
        LinearIndex::signatures(visit);
    }
    mutable size_t passes = 0;
};

SearchOptions with_threshold(double t) {
    SearchOptions opts;
    opts.threshold = t;
    return opts;
}

} // namespace

static void test_option_errors_before_scan() {
    std::fprintf(stderr, "-- test_option_errors_before_scan\n");

    CountingIndex idx({scaled_sig("a", hash_range(0, 10))});
    auto query = scaled_sig("q", hash_range(0, 10));

    SearchOptions no_threshold;
    CHECK_THROWS(idx.search(*query, no_threshold), ConfigurationError);

    SearchOptions both = with_threshold(0.1);
    both.do_containment = true;
    both.do_max_containment = true;
    CHECK_THROWS(idx.search(*query, both), ConfigurationError);

    CHECK_EQ(idx.passes, 0u);
}

static void test_similarity_ranking() {
    std::fprintf(stderr, "-- test_similarity_ranking\n");

    // Jaccard with q = [0,100): a=1.0, b=50/150, c=10/100, d=0
    LinearIndex idx({scaled_sig("c", hash_range(90, 100)),
                     scaled_sig("a", hash_range(0, 100)),
                     scaled_sig("d", hash_range(500, 510)),
                     scaled_sig("b", hash_range(50, 150))});
    auto query = scaled_sig("q", hash_range(0, 100));

    auto results = idx.search(*query, with_threshold(0.1));
    CHECK_EQ(results.size(), 3u);
    if (results.size() != 3) return;
    CHECK(results[0].signature->name() == "a");
    CHECK_NEAR(results[0].score, 1.0, 1e-12);
    CHECK(results[1].signature->name() == "b");
    CHECK_NEAR(results[1].score, 50.0 / 150.0, 1e-12);
    CHECK(results[2].signature->name() == "c");
    CHECK_NEAR(results[2].score, 0.1, 1e-12);

    for (size_t i = 0; i < results.size(); i++) {
        CHECK(results[i].score >= 0.1);
        if (i > 0) CHECK(results[i - 1].score >= results[i].score);
    }
}

static void test_containment_direction() {
    std::fprintf(stderr, "-- test_containment_direction\n");

    // q is a 10-hash fragment of the 100-hash genome
    LinearIndex idx({scaled_sig("genome", hash_range(0, 100))});
    auto query = scaled_sig("fragment", hash_range(0, 10));

    SearchOptions cont = with_threshold(0.5);
    cont.do_containment = true;
    auto r = idx.search(*query, cont);
    CHECK_EQ(r.size(), 1u);
    if (!r.empty()) CHECK_NEAR(r[0].score, 1.0, 1e-12);

    // plain similarity is 0.1 and falls below the threshold
    CHECK_EQ(idx.search(*query, with_threshold(0.5)).size(), 0u);

    SearchOptions maxc = with_threshold(0.5);
    maxc.do_max_containment = true;
    LinearIndex reversed({scaled_sig("fragment", hash_range(0, 10))});
    auto big_query = scaled_sig("genome", hash_range(0, 100));
    auto m = reversed.search(*big_query, maxc);
    CHECK_EQ(m.size(), 1u);
    if (!m.empty()) CHECK_NEAR(m[0].score, 1.0, 1e-12);

    SearchOptions reverse_cont = with_threshold(0.5);
    reverse_cont.do_containment = true;
    CHECK_EQ(reversed.search(*big_query, reverse_cont).size(), 0u);
}

static void test_downsampled_comparison() {
    std::fprintf(stderr, "-- test_downsampled_comparison\n");

    // Hashes small enough to survive scaled=1000
    LinearIndex idx({scaled_sig("coarse", hash_range(0, 20), 1000)});
    auto query = scaled_sig("fine", hash_range(0, 20), 1);

    auto r = idx.search(*query, with_threshold(0.9));
    CHECK_EQ(r.size(), 1u);
    if (!r.empty()) CHECK_NEAR(r[0].score, 1.0, 1e-12);
}

static void test_incompatible_sketch_raises() {
    std::fprintf(stderr, "-- test_incompatible_sketch_raises\n");

    LinearIndex idx({num_sig("n", hash_range(0, 10))});
    auto query = scaled_sig("q", hash_range(0, 10));
    CHECK_THROWS(idx.search(*query, with_threshold(0.1)), ConfigurationError);
}

static void test_deterministic_across_batches() {
    std::fprintf(stderr, "-- test_deterministic_across_batches\n");

    // More signatures than one scoring batch, many of them tied
    std::vector<SignaturePtr> sigs;
    size_t n = SCORE_BATCH_SIZE * 2 + 17;
    for (size_t i = 0; i < n; i++) {
        uint64_t start = i % 7;
        sigs.push_back(scaled_sig("s" + std::to_string(i), hash_range(start, start + 20)));
    }
    LinearIndex idx(sigs);
    auto query = scaled_sig("q", hash_range(0, 20));

    auto first = idx.search(*query, with_threshold(0.0));
    auto second = idx.search(*query, with_threshold(0.0));
    CHECK_EQ(first.size(), n);
    CHECK_EQ(second.size(), n);

    bool same = first.size() == second.size();
    for (size_t i = 0; same && i < first.size(); i++) {
        same = first[i].signature == second[i].signature &&
               first[i].score == second[i].score;
    }
    CHECK(same);

    // ties keep scan order: the top scorers are s0, s7, s14, ...
    if (first.size() >= 3) {
        CHECK(first[0].signature->name() == "s0");
        CHECK(first[1].signature->name() == "s7");
        CHECK(first[2].signature->name() == "s14");
    }
}

int main() {
    test_option_errors_before_scan();
    test_similarity_ranking();
    test_containment_direction();
    test_downsampled_comparison();
    test_incompatible_sketch_raises();
    test_deterministic_across_batches();

    TEST_SUMMARY();
    return g_fail_count > 0 ? 1 : 0;
}
