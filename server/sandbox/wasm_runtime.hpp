#pragma once

#include <fizzy/fizzy.h>

#include <cstdint>
#include <memory>
#include <span>
#include <string>

namespace server::sandbox {

struct FizzyModuleDeleter {
    void operator()(const FizzyModule* module) const { fizzy_free_module(module); }
};

struct FizzyInstanceDeleter {
    void operator()(FizzyInstance* instance) const { fizzy_free_instance(instance); }
};

using ModulePtr = std::unique_ptr<const FizzyModule, FizzyModuleDeleter>;
using InstancePtr = std::unique_ptr<FizzyInstance, FizzyInstanceDeleter>;

// Decodes and validates a binary. Null on failure, with fizzy's message in `error`.
inline ModulePtr parse_module(std::span<const std::uint8_t> bytes, std::string* error) {
    FizzyError err{};
    ModulePtr module(fizzy_parse(bytes.data(), bytes.size(), &err));
    if (!module && error) {
        *error = err.message;
    }
    return module;
}

inline bool has_function_export(const FizzyModule* module, const char* name) {
    std::uint32_t index = 0;
    return fizzy_find_exported_function_index(module, name, &index);
}

} // namespace server::sandbox
