#pragma once

#include "build_types.hpp"

#include <string>

namespace server::builder {

// Pattern-based inspection of submitted game source. Pure and deterministic:
// the same text always yields the same issues in the same order.
//
// Checks run in order: size limit, forbidden APIs, interface conformance,
// metrics (with a complexity warning above kMaxComplexity). An oversized
// source stops after the size check.
class StaticAnalyzer {
public:
    static constexpr std::size_t kMaxComplexity = 100;

    explicit StaticAnalyzer(CompilerConfig config = {}) : config_(config) {}

    StaticAnalysisResult analyze(const std::string& source) const;

    static CodeMetrics compute_metrics(const std::string& source);

    const CompilerConfig& config() const { return config_; }

private:
    CompilerConfig config_;
};

} // namespace server::builder
