#pragma once

#include "sandbox_types.hpp"

#include <cstdint>
#include <span>

namespace server::sandbox {

// Gatekeeper for untrusted bytes: magic number, size limit, then a full
// decode and validation by fizzy. Never throws; every problem becomes an
// error string.
class ModuleValidator {
public:
    explicit ModuleValidator(std::size_t maxBytes) : maxBytes_(maxBytes) {}

    ValidationResult validate(std::span<const std::uint8_t> bytes) const;

    std::size_t max_bytes() const { return maxBytes_; }

private:
    std::size_t maxBytes_;
};

} // namespace server::sandbox
