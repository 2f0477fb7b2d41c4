#pragma once

#include <cstddef>
#include <cstdint>
#include <ostream>
#include <string>
#include <vector>

#include "sketch/signature.hpp"

namespace sigindex {

// Signature JSON codec (sourmash signature layout).
//
// A document is an array of records (a bare object is one record):
//   { "class": "sourmash_signature", "email", "hash_function", "filename",
//     "name", "license", "version": 0.4,
//     "signatures": [ { "num", "ksize", "seed", "max_hash", "mins",
//                       "abundances"?, "md5sum", "molecule" } ] }
// Each entry of "signatures" becomes one Signature carrying the record's
// metadata. Gzip-compressed documents are inflated transparently.

// Parse a document. Returns false and sets error on malformed input;
// out is left empty in that case.
bool parse_signatures(const uint8_t* data, size_t size,
                      std::vector<SignaturePtr>& out, std::string& error);

// Decode a document, never throwing. Malformed input yields nothing.
std::vector<SignaturePtr> decode_signatures(const uint8_t* data, size_t size);
std::vector<SignaturePtr> decode_signatures(const std::string& data);

// Read and decode a signature file.
// Throws LoadError if the file cannot be read or is malformed.
std::vector<SignaturePtr> load_signatures_from_file(const std::string& path);

// Encode one record per signature.
void encode_signatures(const std::vector<SignaturePtr>& sigs, std::ostream& out);
std::string encode_signatures(const std::vector<SignaturePtr>& sigs);

// Write a signature file; a ".gz" suffix writes gzip-compressed output.
// Returns false on I/O failure.
bool save_signatures_to_file(const std::vector<SignaturePtr>& sigs,
                             const std::string& path);

} // namespace sigindex
