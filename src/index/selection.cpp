#include "index/selection.hpp"
#include "sketch/signature.hpp"
#include "core/errors.hpp"

namespace sigindex {

void validate_selection(const SelectionCriteria& sel) {
    if (sel.containment && sel.scaled == 0) {
        throw ConfigurationError("'containment' requires 'scaled' in select");
    }
    if (sel.scaled != 0 && sel.num != 0) {
        throw ConfigurationError("'scaled' and 'num' are incompatible in select");
    }
}

bool select_signature(const Signature& sig, const SelectionCriteria& sel) {
    const MinHash& mh = sig.minhash();

    if (sel.ksize != 0 && sel.ksize != mh.ksize()) return false;
    if (!sel.moltype.empty() && sel.moltype != mh.moltype()) return false;

    if (sel.containment) {
        if (sel.scaled == 0) {
            throw ConfigurationError("'containment' requires 'scaled' in select");
        }
        if (mh.scaled() == 0) return false;
    }

    if (sel.scaled != 0 && mh.num() != 0) return false;

    // exact match on num, not a lower bound
    if (sel.num != 0 && (mh.scaled() != 0 || sel.num != mh.num())) return false;

    return true;
}

} // namespace sigindex
