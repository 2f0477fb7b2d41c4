#include "io/result_writer.hpp"

#include <memory>

#include <json/json.h>

namespace sigindex {

bool parse_output_format(const std::string& str, OutputFormat& out,
                         std::string& error_msg) {
    if (str == "tab") {
        out = OutputFormat::kTab;
    } else if (str == "json") {
        out = OutputFormat::kJson;
    } else {
        error_msg = "Error: unknown output format '" + str + "'";
        return false;
    }
    return true;
}

static OutputHit make_hit(double score, const SignaturePtr& sig, const Location& loc) {
    OutputHit h;
    h.score = score;
    h.name = sig->display_name();
    h.md5 = sig->md5sum();
    h.source = loc.value_or("");
    h.ksize = sig->minhash().ksize();
    h.scaled = sig->minhash().scaled();
    h.num = sig->minhash().num();
    return h;
}

std::vector<OutputHit> to_output_hits(const std::vector<SearchResult>& results) {
    std::vector<OutputHit> hits;
    hits.reserve(results.size());
    for (const auto& r : results) hits.push_back(make_hit(r.score, r.signature, r.location));
    return hits;
}

std::vector<OutputHit> to_output_hits(const std::vector<GatherResult>& results) {
    std::vector<OutputHit> hits;
    hits.reserve(results.size());
    for (const auto& r : results) {
        hits.push_back(make_hit(r.containment, r.signature, r.location));
    }
    return hits;
}

void write_results_tab(std::ostream& out, const std::vector<OutputHit>& hits,
                       const std::string& score_name) {
    out << "# " << score_name << "\tname\tmd5\tksize\tscaled\tnum\tsource\n";
    for (const auto& h : hits) {
        out << h.score << '\t'
            << h.name << '\t'
            << h.md5 << '\t'
            << h.ksize << '\t'
            << h.scaled << '\t'
            << h.num << '\t'
            << h.source << '\n';
    }
}

void write_results_json(std::ostream& out, const std::vector<OutputHit>& hits,
                        const std::string& score_name) {
    Json::Value root(Json::arrayValue);
    for (const auto& h : hits) {
        Json::Value obj;
        obj[score_name] = h.score;
        obj["name"] = h.name;
        obj["md5"] = h.md5;
        obj["ksize"] = h.ksize;
        obj["scaled"] = Json::UInt64(h.scaled);
        obj["num"] = h.num;
        if (h.source.empty()) {
            obj["source"] = Json::Value(Json::nullValue);
        } else {
            obj["source"] = h.source;
        }
        root.append(std::move(obj));
    }

    Json::StreamWriterBuilder writer;
    writer["indentation"] = "  ";
    std::unique_ptr<Json::StreamWriter> sw(writer.newStreamWriter());
    sw->write(root, &out);
    out << '\n';
}

bool write_results(std::ostream& out, const std::vector<OutputHit>& hits,
                   OutputFormat fmt, const std::string& score_name) {
    switch (fmt) {
        case OutputFormat::kTab:
            write_results_tab(out, hits, score_name);
            break;
        case OutputFormat::kJson:
            write_results_json(out, hits, score_name);
            break;
    }
    out.flush();
    return static_cast<bool>(out);
}

} // namespace sigindex
