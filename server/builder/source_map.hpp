#pragma once

#include <cstdint>
#include <string>

namespace server::builder {

// One Base64 VLQ field as used in Source Map v3 "mappings".
std::string encode_vlq(std::int64_t value);

// Identity Source Map v3 for `source`, describing game.wasm built from game.ts:
// every non-blank line maps to column 0 of itself; blank lines carry no segment.
std::string generate_source_map(const std::string& source);

} // namespace server::builder
