#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace server::builder {

struct CompilerConfig {
    // Carried for callers; the stub assembler emits identical bytes either way.
    bool optimize{true};

    bool sourceMap{false};

    // Source size limit in bytes (1 MiB).
    std::size_t maxCodeSize{1024 * 1024};

    // Treat analyzer warnings as errors.
    bool strict{true};
};

enum class Severity : std::uint8_t {
    Error,
    Warning,
    Info,
};

enum class IssueCategory : std::uint8_t {
    Size,
    Security,
    Interface,
    Complexity,
};

inline const char* severity_name(Severity s) {
    switch (s) {
        case Severity::Error: return "error";
        case Severity::Warning: return "warning";
        case Severity::Info: return "info";
        default: return "unknown";
    }
}

inline const char* category_name(IssueCategory c) {
    switch (c) {
        case IssueCategory::Size: return "size";
        case IssueCategory::Security: return "security";
        case IssueCategory::Interface: return "interface";
        case IssueCategory::Complexity: return "complexity";
        default: return "unknown";
    }
}

struct AnalysisIssue {
    Severity severity{Severity::Error};
    IssueCategory category{IssueCategory::Security};
    std::string message;

    // 1-based position of the first offending match, when there is one.
    std::optional<std::size_t> line;
    std::optional<std::size_t> column;
};

struct CodeMetrics {
    std::size_t lineCount{0};
    std::size_t functionCount{0};
    std::size_t classCount{0};
    std::size_t complexity{1};
    std::size_t estimatedMemory{0};
};

struct StaticAnalysisResult {
    bool safe{false};
    std::vector<AnalysisIssue> issues;
    CodeMetrics metrics{};

    bool has(Severity s) const {
        for (const auto& issue : issues) {
            if (issue.severity == s) return true;
        }
        return false;
    }

    // Messages of the given severity, in issue order.
    std::vector<std::string> messages(Severity s) const {
        std::vector<std::string> out;
        for (const auto& issue : issues) {
            if (issue.severity == s) out.push_back(issue.message);
        }
        return out;
    }
};

struct CompilationResult {
    bool success{false};
    std::optional<std::vector<std::uint8_t>> wasmBytes;
    std::optional<std::string> wasmHash;
    std::optional<std::string> sourceMap;
    std::vector<std::string> errors;

    explicit operator bool() const { return success; }
};

} // namespace server::builder
