#include "index/linear_index.hpp"
#include "io/signature_codec.hpp"

#include <utility>

namespace sigindex {

LinearIndex::LinearIndex(std::vector<SignaturePtr> sigs, Location location)
    : sigs_(std::move(sigs)), location_(std::move(location)) {}

std::shared_ptr<LinearIndex> LinearIndex::load(const std::string& path) {
    return std::make_shared<LinearIndex>(load_signatures_from_file(path), path);
}

void LinearIndex::signatures(const SignatureVisitor& visit) const {
    for (const auto& sig : sigs_) visit(sig);
}

void LinearIndex::insert(SignaturePtr sig) {
    sigs_.push_back(std::move(sig));
}

bool LinearIndex::save(const std::string& path) const {
    return save_signatures_to_file(sigs_, path);
}

IndexPtr LinearIndex::select(const SelectionCriteria& sel) const {
    validate_selection(sel);

    std::vector<SignaturePtr> selected;
    for (const auto& sig : sigs_) {
        if (select_signature(*sig, sel)) selected.push_back(sig);
    }
    return std::make_shared<LinearIndex>(std::move(selected), location_);
}

IndexPtr LinearIndex::filter(const SignaturePredicate& pred) const {
    std::vector<SignaturePtr> kept;
    for (const auto& sig : sigs_) {
        if (pred(*sig)) kept.push_back(sig);
    }
    return std::make_shared<LinearIndex>(std::move(kept), location_);
}

} // namespace sigindex
