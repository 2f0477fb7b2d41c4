#include "test_util.hpp"
#include "sig_test_fixture.hpp"
#include "core/errors.hpp"
#include "index/zip_index.hpp"
#include "io/signature_codec.hpp"
#include "io/zip_writer.hpp"

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <vector>

using namespace sigindex;
using sig_fixture::hash_range;
using sig_fixture::make_test_dir;
using sig_fixture::num_sig;
using sig_fixture::scaled_sig;

namespace {

// Archive with two good signature members, one malformed member,
// a directory and a non-signature member carrying a valid document.
std::string build_archive(const std::string& dir) {
    std::string path = dir + "/collection.zip";

    ZipWriter writer;
    writer.add_entry("signatures/", "");
    writer.add_entry("signatures/a.sig",
                     encode_signatures({scaled_sig("a", hash_range(0, 10))}));
    writer.add_entry("signatures/broken.sig", "{ this is not json", false);
    writer.add_entry("signatures/b.sig",
                     encode_signatures({scaled_sig("b", hash_range(5, 15), 1, 21)}),
                     false);
    writer.add_entry("notes/readme.txt",
                     encode_signatures({num_sig("hidden", hash_range(0, 10))}));
    writer.write(path);
    return path;
}

std::vector<std::string> names_of(const Index& idx) {
    std::vector<std::string> names;
    idx.signatures([&](const SignaturePtr& sig) { names.push_back(sig->name()); });
    return names;
}

} // namespace

static void test_malformed_member_skipped() {
    std::fprintf(stderr, "-- test_malformed_member_skipped\n");

    std::string dir = make_test_dir("zipidx");
    std::string path = build_archive(dir);

    auto idx = ZipIndex::load(path);
    auto names = names_of(*idx);
    CHECK_EQ(names.size(), 2u);
    if (names.size() == 2) {
        CHECK(names[0] == "a");
        CHECK(names[1] == "b");
    }
    CHECK_EQ(idx->size(), 2u);
    CHECK(idx->location() == path);

    // every member is tried; the malformed one still yields nothing
    auto all = ZipIndex::load(path, true);
    CHECK(all->traverse_yield_all());
    CHECK_EQ(all->size(), 3u);

    std::filesystem::remove_all(dir);
}

// Overwrite the central-directory uncompressed size of the named member.
static bool patch_declared_size(const std::string& path, const std::string& member,
                                uint32_t size) {
    std::string bytes;
    {
        std::ifstream in(path, std::ios::binary);
        bytes.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    }
    const std::string central_sig("PK\x01\x02", 4);
    for (size_t pos = bytes.find(central_sig); pos != std::string::npos;
         pos = bytes.find(central_sig, pos + 4)) {
        if (bytes.compare(pos + 46, member.size(), member) != 0) continue;
        for (int i = 0; i < 4; i++) {
            bytes[pos + 0x18 + i] = static_cast<char>((size >> (8 * i)) & 0xFF);
        }
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
        return static_cast<bool>(out);
    }
    return false;
}

static void test_bogus_member_size_skipped() {
    std::fprintf(stderr, "-- test_bogus_member_size_skipped\n");

    std::string dir = make_test_dir("zipidx_size");
    std::string path = dir + "/sizes.zip";
    std::string big_doc = encode_signatures({scaled_sig("big", hash_range(0, 50))});

    ZipWriter writer;
    CHECK(writer.add_entry("a.sig", encode_signatures({scaled_sig("a", hash_range(0, 10))})));
    CHECK(writer.add_entry("big.sig", big_doc));
    CHECK(writer.add_entry("small.sig", big_doc));
    CHECK(writer.write(path));

    CHECK(patch_declared_size(path, "big.sig", 0xFFFFFF00u));
    CHECK(patch_declared_size(path, "small.sig", 16));

    auto idx = ZipIndex::load(path);
    auto names = names_of(*idx);
    CHECK_EQ(names.size(), 1u);
    if (!names.empty()) CHECK(names[0] == "a");

    std::filesystem::remove_all(dir);
}

static void test_enumeration_is_repeatable() {
    std::fprintf(stderr, "-- test_enumeration_is_repeatable\n");

    std::string dir = make_test_dir("zipidx_rep");
    auto idx = ZipIndex::load(build_archive(dir));

    // nested passes over the same archive handle
    size_t pairs = 0;
    idx->signatures([&](const SignaturePtr&) {
        idx->signatures([&](const SignaturePtr&) { pairs++; });
    });
    CHECK_EQ(pairs, 4u);
    CHECK(names_of(*idx) == names_of(*idx));

    std::filesystem::remove_all(dir);
}

static void test_select_and_filter_push_down() {
    std::fprintf(stderr, "-- test_select_and_filter_push_down\n");

    std::string dir = make_test_dir("zipidx_sel");
    auto idx = ZipIndex::load(build_archive(dir), true);

    SelectionCriteria k31;
    k31.ksize = 31;
    auto sel = idx->select(k31);
    CHECK_EQ(sel->size(), 2u);          // a and hidden
    CHECK(sel->location() == idx->location());

    SelectionCriteria scaled;
    scaled.scaled = 1;
    auto narrowed = sel->select(scaled);
    auto names = names_of(*narrowed);
    CHECK_EQ(names.size(), 1u);
    if (!names.empty()) CHECK(names[0] == "a");

    auto filtered = idx->filter([](const Signature& s) { return s.name() != "a"; });
    CHECK_EQ(filtered->size(), 2u);

    // the receiver is unchanged
    CHECK_EQ(idx->size(), 3u);

    SelectionCriteria bad;
    bad.containment = true;
    CHECK_THROWS(idx->select(bad), ConfigurationError);

    std::filesystem::remove_all(dir);
}

static void test_search_over_archive() {
    std::fprintf(stderr, "-- test_search_over_archive\n");

    std::string dir = make_test_dir("zipidx_search");
    std::string path = build_archive(dir);
    auto idx = ZipIndex::load(path);

    SelectionCriteria k31;
    k31.ksize = 31;
    auto query = scaled_sig("q", hash_range(0, 10));

    SearchOptions opts;
    opts.threshold = 0.5;
    auto results = idx->select(k31)->search(*query, opts);
    CHECK_EQ(results.size(), 1u);
    if (!results.empty()) {
        CHECK(results[0].signature->name() == "a");
        CHECK(results[0].location == path);
    }

    auto gathered = idx->select(k31)->counter_gather(*query);
    CHECK_EQ(gathered.size(), 1u);
    if (!gathered.empty()) CHECK(gathered[0].location == path);

    std::filesystem::remove_all(dir);
}

static void test_read_only() {
    std::fprintf(stderr, "-- test_read_only\n");

    std::string dir = make_test_dir("zipidx_ro");
    auto idx = ZipIndex::load(build_archive(dir));

    CHECK_THROWS(idx->insert(scaled_sig("x", hash_range(0, 3))),
                 UnsupportedOperationError);
    CHECK_THROWS(idx->save(dir + "/out.sig"), UnsupportedOperationError);
    CHECK_THROWS(ZipIndex::load(dir + "/missing.zip"), LoadError);

    std::filesystem::remove_all(dir);
}

int main() {
    test_malformed_member_skipped();
    test_bogus_member_size_skipped();
    test_enumeration_is_repeatable();
    test_select_and_filter_push_down();
    test_search_over_archive();
    test_read_only();

    TEST_SUMMARY();
    return g_fail_count > 0 ? 1 : 0;
}
