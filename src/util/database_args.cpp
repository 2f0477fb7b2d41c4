#include "util/database_args.hpp"
#include "index/index_loader.hpp"
#include "index/multi_index.hpp"
#include "io/signature_codec.hpp"
#include "util/cli_parser.hpp"
#include "util/logger.hpp"
#include "core/errors.hpp"

namespace sigindex {

SelectionCriteria selection_from_cli(const CliParser& cli) {
    SelectionCriteria sel;
    sel.ksize = static_cast<uint32_t>(cli.get_int("-k", 0));
    sel.moltype = cli.get_string("-moltype");
    sel.scaled = cli.get_uint64("-scaled", 0);
    sel.num = static_cast<uint32_t>(cli.get_int("-num", 0));
    return sel;
}

IndexPtr load_databases(const std::vector<std::string>& paths, bool pathlist,
                        bool force, const Logger& logger) {
    std::vector<IndexPtr> indexes;
    std::vector<Location> sources;
    for (const auto& path : paths) {
        IndexPtr idx;
        if (pathlist) {
            idx = MultiIndex::load_from_pathlist(path, logger);
        } else {
            idx = load_file_as_index(path, force, logger);
        }
        logger.info("Loaded %s", path.c_str());
        indexes.push_back(std::move(idx));
        // sub-indexes already know their own locations
        sources.push_back(std::nullopt);
    }
    return std::make_shared<MultiIndex>(std::move(indexes), std::move(sources));
}

SignaturePtr load_query_signature(const std::string& path,
                                  const SelectionCriteria& sel) {
    validate_selection(sel);

    std::vector<SignaturePtr> matching;
    for (const auto& sig : load_signatures_from_file(path)) {
        if (select_signature(*sig, sel)) matching.push_back(sig);
    }
    if (matching.size() != 1) {
        throw ConfigurationError("query file '" + path + "' has " +
                                 std::to_string(matching.size()) +
                                 " matching signatures; exactly one is required"
                                 " (use -k / -moltype / -scaled / -num)");
    }
    return matching.front();
}

SelectionCriteria selection_for_query(const Signature& query, bool containment) {
    const MinHash& mh = query.minhash();
    SelectionCriteria sel;
    sel.ksize = mh.ksize();
    sel.moltype = mh.moltype();
    if (mh.scaled() != 0) {
        sel.scaled = mh.scaled();
        sel.containment = containment;
    } else {
        sel.num = mh.num();
    }
    return sel;
}

} // namespace sigindex
