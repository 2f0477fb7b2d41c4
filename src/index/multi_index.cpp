#include "index/multi_index.hpp"
#include "index/index_loader.hpp"
#include "index/linear_index.hpp"
#include "io/pathlist_reader.hpp"
#include "io/signature_discovery.hpp"
#include "search/index_search.hpp"
#include "core/errors.hpp"
#include "util/logger.hpp"

#include <filesystem>
#include <system_error>
#include <utility>

namespace sigindex {

// A recorded source wins over whatever the sub-index reported.
static Location best_source(const Location& source, const Location& reported) {
    if (source && !source->empty()) return source;
    return reported;
}

MultiIndex::MultiIndex(std::vector<IndexPtr> indexes, std::vector<Location> sources)
    : indexes_(std::move(indexes)), sources_(std::move(sources)) {
    if (indexes_.size() != sources_.size()) {
        throw ConfigurationError("MultiIndex: " + std::to_string(indexes_.size()) +
                                 " indexes but " + std::to_string(sources_.size()) +
                                 " sources");
    }
}

std::shared_ptr<MultiIndex> MultiIndex::load_from_path(const std::string& path,
                                                       bool force,
                                                       const Logger& logger) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        throw ConfigurationError("'" + path + "' does not exist");
    }

    std::vector<IndexPtr> indexes;
    std::vector<Location> sources;
    for (const auto& file : find_signature_files({path}, force)) {
        try {
            indexes.push_back(LinearIndex::load(file));
            sources.push_back(file);
        } catch (const LoadError& e) {
            if (!force) throw;
            logger.warn("Skipping %s: %s", file.c_str(), e.what());
        }
    }

    if (indexes.empty()) {
        throw ConfigurationError("no signatures to load under '" + path + "'");
    }
    logger.debug("Loaded %zu signature file(s) from %s", indexes.size(), path.c_str());
    return std::make_shared<MultiIndex>(std::move(indexes), std::move(sources));
}

std::shared_ptr<MultiIndex> MultiIndex::load_from_pathlist(const std::string& path,
                                                           const Logger& logger) {
    std::vector<IndexPtr> indexes;
    std::vector<Location> sources;
    for (const auto& entry : read_pathlist(path)) {
        indexes.push_back(load_file_as_index(entry, false, logger));
        sources.push_back(entry);
    }
    logger.debug("Loaded %zu index(es) listed in %s", indexes.size(), path.c_str());
    return std::make_shared<MultiIndex>(std::move(indexes), std::move(sources));
}

std::shared_ptr<MultiIndex> MultiIndex::load(const std::string&) {
    throw UnsupportedOperationError(
        "MultiIndex cannot be loaded directly; use load_from_path or load_from_pathlist");
}

void MultiIndex::signatures(const SignatureVisitor& visit) const {
    for (const auto& idx : indexes_) {
        idx->signatures(visit);
    }
}

void MultiIndex::signatures_with_location(const LocatedSignatureVisitor& visit) const {
    for (size_t i = 0; i < indexes_.size(); i++) {
        const Location& source = sources_[i];
        indexes_[i]->signatures_with_location(
            [&](const SignaturePtr& sig, const Location& reported) {
                visit(sig, best_source(source, reported));
            });
    }
}

size_t MultiIndex::size() const {
    size_t n = 0;
    for (const auto& idx : indexes_) n += idx->size();
    return n;
}

void MultiIndex::insert(SignaturePtr) {
    throw UnsupportedOperationError("MultiIndex does not support insert");
}

bool MultiIndex::save(const std::string&) const {
    throw UnsupportedOperationError("MultiIndex does not support save");
}

IndexPtr MultiIndex::select(const SelectionCriteria& sel) const {
    validate_selection(sel);

    std::vector<IndexPtr> selected;
    selected.reserve(indexes_.size());
    for (const auto& idx : indexes_) {
        selected.push_back(idx->select(sel));
    }
    return std::make_shared<MultiIndex>(std::move(selected), sources_);
}

IndexPtr MultiIndex::filter(const SignaturePredicate& pred) const {
    std::vector<IndexPtr> filtered;
    filtered.reserve(indexes_.size());
    for (const auto& idx : indexes_) {
        filtered.push_back(idx->filter(pred));
    }
    return std::make_shared<MultiIndex>(std::move(filtered), sources_);
}

std::vector<SearchResult> MultiIndex::search(const Signature& query,
                                             const SearchOptions& opts) const {
    validate_search_options(opts);

    std::vector<SearchResult> matches;
    for (size_t i = 0; i < indexes_.size(); i++) {
        for (auto& r : indexes_[i]->search(query, opts)) {
            r.location = best_source(sources_[i], r.location);
            matches.push_back(std::move(r));
        }
    }

    sort_search_results(matches);
    return matches;
}

std::vector<GatherResult> MultiIndex::gather(const Signature& query,
                                             const GatherOptions& opts) const {
    if (query.minhash().empty()) return {};
    resolve_gather_threshold(query, opts.threshold_bp);  // rejects num queries up front

    std::vector<GatherResult> results;
    for (size_t i = 0; i < indexes_.size(); i++) {
        for (auto& r : indexes_[i]->gather(query, opts)) {
            r.location = best_source(sources_[i], r.location);
            results.push_back(std::move(r));
        }
    }

    sort_gather_results(results);
    return results;
}

} // namespace sigindex
