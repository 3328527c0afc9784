#pragma once

#include <cstdint>
#include <span>
#include <string>

namespace server::builder {

// SHA-256 of the artifact as 64 lowercase hex characters.
// Throws std::runtime_error if the digest cannot be computed.
std::string hash_wasm(std::span<const std::uint8_t> bytes);

// Tamper check: true iff hash_wasm(bytes) == expectedHash (exact, case-sensitive).
bool verify_hash(std::span<const std::uint8_t> bytes, const std::string& expectedHash);

} // namespace server::builder
