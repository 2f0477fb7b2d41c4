#include "io/signature_codec.hpp"
#include "io/compression.hpp"
#include "core/config.hpp"
#include "core/errors.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <fstream>
#include <iterator>
#include <memory>
#include <sstream>

#include <json/json.h>

namespace sigindex {

static std::string normalize_moltype(const std::string& molecule) {
    std::string lower = molecule;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "dna") return "DNA";
    return lower;
}

static bool read_uint64_array(const Json::Value& arr, std::vector<uint64_t>& out) {
    if (!arr.isArray()) return false;
    out.clear();
    out.reserve(arr.size());
    for (const auto& v : arr) {
        if (!v.isUInt64()) return false;
        out.push_back(v.asUInt64());
    }
    return true;
}

// Build the MinHash of one "signatures" entry.
static bool parse_sketch(const Json::Value& sk, std::unique_ptr<MinHash>& out,
                         std::string& error) {
    if (!sk.isObject()) {
        error = "sketch entry is not an object";
        return false;
    }
    if (!sk["ksize"].isUInt() || !sk["mins"].isArray()) {
        error = "sketch entry lacks 'ksize' or 'mins'";
        return false;
    }

    uint32_t ksize = sk["ksize"].asUInt();
    uint32_t num = sk.get("num", 0).isUInt() ? sk.get("num", 0).asUInt() : 0;
    uint64_t max_hash = sk.get("max_hash", 0).isUInt64()
        ? sk.get("max_hash", 0).asUInt64() : 0;
    uint32_t seed = sk.get("seed", DEFAULT_SEED).isUInt()
        ? sk.get("seed", DEFAULT_SEED).asUInt() : DEFAULT_SEED;
    std::string moltype = normalize_moltype(
        sk.get("molecule", DEFAULT_MOLTYPE).asString());

    std::vector<uint64_t> mins;
    if (!read_uint64_array(sk["mins"], mins)) {
        error = "'mins' is not an array of unsigned integers";
        return false;
    }

    std::vector<uint64_t> abunds;
    bool track_abundance = sk.isMember("abundances");
    if (track_abundance) {
        if (!read_uint64_array(sk["abundances"], abunds) ||
            abunds.size() != mins.size()) {
            error = "'abundances' does not match 'mins'";
            return false;
        }
    }

    if (ksize == 0 || (num != 0 && max_hash != 0) || (num == 0 && max_hash == 0)) {
        error = "invalid sketch parameters (ksize=" + std::to_string(ksize) +
                ", num=" + std::to_string(num) +
                ", max_hash=" + std::to_string(max_hash) + ")";
        return false;
    }

    out = std::make_unique<MinHash>(ksize, num, max_hash, track_abundance, moltype, seed);
    for (size_t i = 0; i < mins.size(); i++) {
        out->add_hash(mins[i], track_abundance ? abunds[i] : 1);
    }
    return true;
}

static bool parse_record(const Json::Value& rec, std::vector<SignaturePtr>& out,
                         std::string& error) {
    if (!rec.isObject() || !rec["signatures"].isArray()) {
        error = "record lacks a 'signatures' array";
        return false;
    }

    std::string name = rec.get("name", "").asString();
    std::string filename = rec.get("filename", "").asString();
    std::string license = rec.get("license", DEFAULT_LICENSE).asString();
    std::string email = rec.get("email", "").asString();
    std::string hash_function = rec.get("hash_function", DEFAULT_HASH_FUNCTION).asString();

    for (const auto& sk : rec["signatures"]) {
        std::unique_ptr<MinHash> mh;
        if (!parse_sketch(sk, mh, error)) return false;
        out.push_back(std::make_shared<const Signature>(
            std::move(*mh), name, filename, license, email, hash_function));
    }
    return true;
}

bool parse_signatures(const uint8_t* data, size_t size,
                      std::vector<SignaturePtr>& out, std::string& error) {
    out.clear();

    std::string inflated;
    if (is_gzip(data, size)) {
        if (!gunzip(data, size, inflated)) {
            error = "corrupt gzip stream";
            return false;
        }
        data = reinterpret_cast<const uint8_t*>(inflated.data());
        size = inflated.size();
    }

    Json::CharReaderBuilder reader_builder;
    std::unique_ptr<Json::CharReader> reader(reader_builder.newCharReader());

    Json::Value root;
    std::string parse_errors;
    const char* begin = reinterpret_cast<const char*>(data);
    if (!reader->parse(begin, begin + size, &root, &parse_errors)) {
        error = "invalid JSON: " + parse_errors;
        return false;
    }

    std::vector<SignaturePtr> sigs;
    if (root.isArray()) {
        for (const auto& rec : root) {
            if (!parse_record(rec, sigs, error)) return false;
        }
    } else if (root.isObject()) {
        if (!parse_record(root, sigs, error)) return false;
    } else {
        error = "document is neither an array nor an object";
        return false;
    }

    out = std::move(sigs);
    return true;
}

std::vector<SignaturePtr> decode_signatures(const uint8_t* data, size_t size) {
    std::vector<SignaturePtr> sigs;
    std::string error;
    // MinHash construction errors are already screened by parse_sketch;
    // jsoncpp accessor errors are the remaining way malformed input can throw.
    try {
        if (!parse_signatures(data, size, sigs, error)) sigs.clear();
    } catch (const Json::Exception&) {
        sigs.clear();
    }
    return sigs;
}

std::vector<SignaturePtr> decode_signatures(const std::string& data) {
    return decode_signatures(reinterpret_cast<const uint8_t*>(data.data()),
                             data.size());
}

std::vector<SignaturePtr> load_signatures_from_file(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        throw LoadError("cannot open signature file '" + path + "'");
    }
    std::string data((std::istreambuf_iterator<char>(in)),
                     std::istreambuf_iterator<char>());
    if (in.bad()) {
        throw LoadError("error reading signature file '" + path + "'");
    }

    std::vector<SignaturePtr> sigs;
    std::string error;
    bool ok = false;
    try {
        ok = parse_signatures(reinterpret_cast<const uint8_t*>(data.data()),
                              data.size(), sigs, error);
    } catch (const Json::Exception& e) {
        error = e.what();
    }
    if (!ok) {
        throw LoadError("cannot parse signature file '" + path + "': " + error);
    }
    if (sigs.empty()) {
        throw LoadError("no signatures in '" + path + "'");
    }
    return sigs;
}

static Json::Value sketch_to_json(const MinHash& mh, const std::string& md5) {
    Json::Value sk;
    sk["num"] = mh.num();
    sk["ksize"] = mh.ksize();
    sk["seed"] = mh.seed();
    sk["max_hash"] = Json::UInt64(mh.max_hash());
    sk["md5sum"] = md5;
    sk["molecule"] = mh.moltype() == "DNA" ? std::string("dna") : mh.moltype();

    Json::Value mins(Json::arrayValue);
    for (uint64_t h : mh.hashes()) mins.append(Json::UInt64(h));
    sk["mins"] = std::move(mins);

    if (mh.track_abundance()) {
        Json::Value abunds(Json::arrayValue);
        for (uint64_t a : mh.abundances()) abunds.append(Json::UInt64(a));
        sk["abundances"] = std::move(abunds);
    }
    return sk;
}

void encode_signatures(const std::vector<SignaturePtr>& sigs, std::ostream& out) {
    Json::Value root(Json::arrayValue);
    for (const auto& sig : sigs) {
        Json::Value rec;
        rec["class"] = "sourmash_signature";
        rec["email"] = sig->email();
        rec["hash_function"] = sig->hash_function();
        rec["filename"] = sig->filename();
        if (!sig->name().empty()) rec["name"] = sig->name();
        rec["license"] = sig->license();

        Json::Value sketches(Json::arrayValue);
        sketches.append(sketch_to_json(sig->minhash(), sig->md5sum()));
        rec["signatures"] = std::move(sketches);
        rec["version"] = SIGNATURE_FORMAT_VERSION;
        root.append(std::move(rec));
    }

    Json::StreamWriterBuilder writer;
    writer["indentation"] = "";
    std::unique_ptr<Json::StreamWriter> sw(writer.newStreamWriter());
    sw->write(root, &out);
}

std::string encode_signatures(const std::vector<SignaturePtr>& sigs) {
    std::ostringstream oss;
    encode_signatures(sigs, oss);
    return oss.str();
}

static bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool save_signatures_to_file(const std::vector<SignaturePtr>& sigs,
                             const std::string& path) {
    std::string data = encode_signatures(sigs);
    if (ends_with(path, ".gz")) {
        std::string compressed;
        if (!gzip(data, compressed)) {
            std::fprintf(stderr, "save_signatures: compression failed for %s\n",
                         path.c_str());
            return false;
        }
        data.swap(compressed);
    }

    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        std::fprintf(stderr, "save_signatures: cannot open %s for writing\n",
                     path.c_str());
        return false;
    }
    out.write(data.data(), static_cast<std::streamsize>(data.size()));
    if (!out.good()) {
        std::fprintf(stderr, "save_signatures: write failed for %s\n", path.c_str());
        return false;
    }
    return true;
}

} // namespace sigindex
