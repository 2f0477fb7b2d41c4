#include "index/zip_index.hpp"
#include "io/signature_codec.hpp"
#include "io/signature_discovery.hpp"
#include "io/zip_reader.hpp"
#include "core/errors.hpp"

#include <utility>

namespace sigindex {

ZipIndex::ZipIndex(std::shared_ptr<const ZipReader> zip, bool traverse_yield_all,
                   std::vector<SelectionCriteria> selections,
                   std::vector<SignaturePredicate> filters)
    : zip_(std::move(zip)), traverse_yield_all_(traverse_yield_all),
      selections_(std::move(selections)), filters_(std::move(filters)) {}

std::shared_ptr<ZipIndex> ZipIndex::load(const std::string& path,
                                         bool traverse_yield_all) {
    auto zip = std::make_shared<ZipReader>();
    if (!zip->open(path)) {
        throw LoadError("cannot open zip archive '" + path + "'");
    }
    return std::make_shared<ZipIndex>(std::move(zip), traverse_yield_all);
}

bool ZipIndex::accepts(const Signature& sig) const {
    for (const auto& sel : selections_) {
        if (!select_signature(sig, sel)) return false;
    }
    for (const auto& pred : filters_) {
        if (!pred(sig)) return false;
    }
    return true;
}

void ZipIndex::signatures(const SignatureVisitor& visit) const {
    std::string data;
    for (size_t i = 0; i < zip_->num_entries(); i++) {
        const ZipEntry& entry = zip_->entry(i);
        if (entry.is_directory()) continue;
        if (!traverse_yield_all_ && !has_signature_suffix(entry.name)) continue;

        // Unreadable or non-signature members contribute nothing
        if (!zip_->read_entry(i, data)) continue;
        for (const auto& sig : decode_signatures(data)) {
            if (accepts(*sig)) visit(sig);
        }
    }
}

Location ZipIndex::location() const {
    return zip_->path();
}

void ZipIndex::insert(SignaturePtr) {
    throw UnsupportedOperationError("ZipIndex is read-only: insert is not supported");
}

bool ZipIndex::save(const std::string&) const {
    throw UnsupportedOperationError("ZipIndex is read-only: save is not supported");
}

IndexPtr ZipIndex::select(const SelectionCriteria& sel) const {
    validate_selection(sel);

    auto selections = selections_;
    selections.push_back(sel);
    return std::make_shared<ZipIndex>(zip_, traverse_yield_all_,
                                      std::move(selections), filters_);
}

IndexPtr ZipIndex::filter(const SignaturePredicate& pred) const {
    auto filters = filters_;
    filters.push_back(pred);
    return std::make_shared<ZipIndex>(zip_, traverse_yield_all_,
                                      selections_, std::move(filters));
}

} // namespace sigindex
