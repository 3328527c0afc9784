#pragma once

#include "build_types.hpp"
#include "static_analyzer.hpp"

#include <array>
#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace server::builder {

// Turns analyzed game source into a content-addressed WASM artifact.
//
// The artifact is a fixed stub module: every export is an empty () -> ()
// function, independent of the submitted logic. Given the same config,
// compile() is a pure function of its input.
class ModuleAssembler {
public:
    // Export order of the stub module.
    static constexpr std::array<const char*, 6> kStubExports = {
        "init", "update", "render", "handleInput", "getState", "destroy",
    };

    explicit ModuleAssembler(CompilerConfig config = {});

    const CompilerConfig& config() const { return config_; }

    StaticAnalysisResult analyze(const std::string& source) const { return analyzer_.analyze(source); }

    CompilationResult compile(const std::string& source) const;

    bool verify_hash(std::span<const std::uint8_t> bytes, const std::string& expectedHash) const;

    // The 107-byte stub binary.
    static std::vector<std::uint8_t> assemble_stub();

private:
    CompilerConfig config_;
    StaticAnalyzer analyzer_;
};

} // namespace server::builder
