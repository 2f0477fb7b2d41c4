#pragma once

#include <cstdint>
#include <string>

namespace sigindex {

class Signature;

// Constraints for Index::select. Zero / empty fields are unconstrained.
struct SelectionCriteria {
    uint32_t ksize = 0;
    std::string moltype;
    uint64_t scaled = 0;
    uint32_t num = 0;
    bool containment = false;   // caller intends containment search; needs scaled

    bool empty() const {
        return ksize == 0 && moltype.empty() && scaled == 0 && num == 0 &&
               !containment;
    }
};

// Throw ConfigurationError for constraint combinations no signature can
// satisfy meaningfully: containment without scaled, or both scaled and num.
void validate_selection(const SelectionCriteria& sel);

// Does the signature satisfy the constraints?
// Rules, all of which must pass:
//   ksize / moltype must match when given;
//   containment requires a scaled sketch;
//   scaled rejects num sketches;
//   num requires a num sketch of exactly that size.
// Throws ConfigurationError if containment is requested without scaled.
bool select_signature(const Signature& sig, const SelectionCriteria& sel);

} // namespace sigindex
