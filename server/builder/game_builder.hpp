#pragma once

#include "build_types.hpp"
#include "module_assembler.hpp"

#include <sandbox/wasm_sandbox.hpp>

#include <optional>
#include <string>
#include <vector>

namespace server::builder {

struct BuildResult {
    bool success{false};

    // <gameType>_<first 8 hex chars of wasmHash>
    std::optional<std::string> gameId;
    std::optional<std::string> wasmHash;
    std::optional<std::vector<std::uint8_t>> wasmBytes;
    std::optional<std::string> sourceMap;

    std::vector<std::string> errors;
    std::vector<std::string> warnings;

    explicit operator bool() const { return success; }
};

// Analyze -> compile -> validate pipeline, plus loading through the owned sandbox.
class GameBuilder {
public:
    explicit GameBuilder(CompilerConfig compilerConfig = {}, sandbox::SandboxConfig sandboxConfig = {});

    BuildResult build(const std::string& code, const std::string& gameType);

    sandbox::GameInstance load_game(std::span<const std::uint8_t> bytes, const std::string& gameType) {
        return sandbox_.load_game(bytes, gameType);
    }

    sandbox::WasmSandbox& sandbox() { return sandbox_; }
    const ModuleAssembler& compiler() const { return compiler_; }

private:
    ModuleAssembler compiler_;
    sandbox::WasmSandbox sandbox_;
};

} // namespace server::builder
