#include "test_util.hpp"
#include "sig_test_fixture.hpp"
#include "core/errors.hpp"
#include "index/linear_index.hpp"

#include <cstdio>
#include <filesystem>
#include <string>
#include <vector>

using namespace sigindex;
using sig_fixture::hash_range;
using sig_fixture::make_test_dir;
using sig_fixture::scaled_sig;

static void test_insert_and_enumerate() {
    std::fprintf(stderr, "-- test_insert_and_enumerate\n");

    LinearIndex idx;
    CHECK_EQ(idx.size(), 0u);
    CHECK(!idx.location().has_value());

    idx.insert(scaled_sig("a", hash_range(0, 10)));
    idx.insert(scaled_sig("b", hash_range(5, 15)));
    idx.insert(scaled_sig("c", hash_range(100, 110)));
    CHECK_EQ(idx.size(), 3u);

    std::vector<std::string> names;
    idx.signatures([&](const SignaturePtr& sig) { names.push_back(sig->name()); });
    CHECK_EQ(names.size(), 3u);
    CHECK(names[0] == "a");
    CHECK(names[2] == "c");

    size_t located = 0;
    idx.signatures_with_location([&](const SignaturePtr&, const Location& loc) {
        if (!loc) located++;
    });
    CHECK_EQ(located, 3u);
}

static void test_find_and_filter() {
    std::fprintf(stderr, "-- test_find_and_filter\n");

    LinearIndex idx({scaled_sig("a", hash_range(0, 10)),
                     scaled_sig("b", hash_range(5, 15)),
                     scaled_sig("c", hash_range(100, 110))});

    auto query = scaled_sig("q", hash_range(0, 8));
    auto overlapping = idx.find(
        [](const Signature& sig, const Signature& q) {
            return q.minhash().count_common(sig.minhash()) > 0;
        },
        *query);
    CHECK_EQ(overlapping.size(), 2u);
    if (overlapping.size() == 2) {
        CHECK(overlapping[0]->name() == "a");
        CHECK(overlapping[1]->name() == "b");
    }

    auto only_c = idx.filter([](const Signature& sig) { return sig.name() == "c"; });
    CHECK_EQ(only_c->size(), 1u);
    CHECK_EQ(idx.size(), 3u);
}

static void test_save_and_load() {
    std::fprintf(stderr, "-- test_save_and_load\n");

    std::string dir = make_test_dir("linear");
    std::string path = dir + "/db.sig";

    LinearIndex idx({scaled_sig("a", hash_range(0, 10)),
                     scaled_sig("b", hash_range(5, 15), 1, 21)});
    CHECK(idx.save(path));

    auto loaded = LinearIndex::load(path);
    CHECK_EQ(loaded->size(), 2u);
    CHECK(loaded->location() == path);

    auto orig = idx.signature_list();
    auto back = loaded->signature_list();
    CHECK_EQ(back.size(), orig.size());
    for (size_t i = 0; i < back.size() && i < orig.size(); i++) {
        CHECK(*back[i] == *orig[i]);
        CHECK(back[i]->minhash() == orig[i]->minhash());
    }

    size_t tagged = 0;
    loaded->signatures_with_location([&](const SignaturePtr&, const Location& loc) {
        if (loc && *loc == path) tagged++;
    });
    CHECK_EQ(tagged, 2u);

    CHECK_THROWS(LinearIndex::load(dir + "/missing.sig"), LoadError);
    std::filesystem::remove_all(dir);
}

int main() {
    test_insert_and_enumerate();
    test_find_and_filter();
    test_save_and_load();

    TEST_SUMMARY();
    return g_fail_count > 0 ? 1 : 0;
}
