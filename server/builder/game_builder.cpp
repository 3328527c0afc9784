#include "game_builder.hpp"

#include <core/log.hpp>

namespace server::builder {

GameBuilder::GameBuilder(CompilerConfig compilerConfig, sandbox::SandboxConfig sandboxConfig)
    : compiler_(compilerConfig), sandbox_(sandboxConfig) {}

BuildResult GameBuilder::build(const std::string& code, const std::string& gameType) {
    BuildResult result;

    const StaticAnalysisResult analysis = compiler_.analyze(code);
    if (!analysis.safe) {
        result.errors = analysis.messages(Severity::Error);
        result.warnings = analysis.messages(Severity::Warning);
        core::logf("build", "%s: analysis failed (%zu errors)", gameType.c_str(), result.errors.size());
        return result;
    }

    CompilationResult compilation = compiler_.compile(code);
    if (!compilation.success || !compilation.wasmBytes) {
        result.errors = std::move(compilation.errors);
        core::logf("build", "%s: compilation failed", gameType.c_str());
        return result;
    }

    const sandbox::ValidationResult validation = sandbox_.validate_module(*compilation.wasmBytes);
    if (!validation.valid) {
        result.errors = validation.errors;
        result.warnings = validation.warnings;
        core::logf("build", "%s: produced module failed validation", gameType.c_str());
        return result;
    }

    result.success = true;
    result.gameId = gameType + "_" + compilation.wasmHash->substr(0, 8);
    result.wasmHash = std::move(compilation.wasmHash);
    result.wasmBytes = std::move(compilation.wasmBytes);
    result.sourceMap = std::move(compilation.sourceMap);

    result.warnings = analysis.messages(Severity::Warning);
    result.warnings.insert(result.warnings.end(), validation.warnings.begin(), validation.warnings.end());

    core::logf("build", "built %s (%zu warnings)", result.gameId->c_str(), result.warnings.size());
    return result;
}

} // namespace server::builder
