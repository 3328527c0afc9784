#include "module_validator.hpp"

#include "wasm_runtime.hpp"

#include <algorithm>
#include <array>
#include <string>

namespace server::sandbox {

namespace {

constexpr std::array<std::uint8_t, 4> kWasmMagic = {0x00, 0x61, 0x73, 0x6d};
constexpr std::size_t kWasmHeaderSize = 8;

} // namespace

ValidationResult ModuleValidator::validate(std::span<const std::uint8_t> bytes) const {
    ValidationResult result;

    if (bytes.size() < kWasmHeaderSize || !std::equal(kWasmMagic.begin(), kWasmMagic.end(), bytes.begin())) {
        result.errors.push_back("Invalid WASM module: missing magic number");
        result.valid = false;
        return result;
    }

    if (bytes.size() > maxBytes_) {
        result.errors.push_back("WASM module too large: " + std::to_string(bytes.size()) +
                                " bytes exceeds " + std::to_string(maxBytes_) + " byte limit");
    }

    std::string error;
    const ModulePtr module = parse_module(bytes, &error);
    if (!module) {
        result.errors.push_back("WASM compilation failed: " + error);
    } else if (!has_function_export(module.get(), "render")) {
        result.warnings.push_back("WASM module does not export render; it cannot be drawn on clients");
    }

    result.valid = result.errors.empty();
    return result;
}

} // namespace server::sandbox
