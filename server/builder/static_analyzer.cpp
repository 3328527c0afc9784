#include "static_analyzer.hpp"

#include <core/log.hpp>

#include <re2/re2.h>

#include <span>

namespace server::builder {

namespace {

// RE2 matches in linear time without recursing per character; a single
// minified line of any length is safe to scan.
struct ForbiddenRule {
    re2::RE2 pattern;
    const char* message;
};

struct RequiredProperty {
    const char* name;
    const char* type;
};

struct RequiredMethod {
    const char* name;
    const char* params;
};

std::span<const ForbiddenRule> forbidden_rules() {
    static const ForbiddenRule rules[] = {
        // Network
        {R"(fetch\s*\()", "Network access (fetch) is forbidden"},
        {R"(XMLHttpRequest)", "Network access (XMLHttpRequest) is forbidden"},
        {R"(WebSocket)", "WebSocket is forbidden"},

        // Dynamic code
        {R"(eval\s*\()", "eval() is forbidden"},
        {R"(new\s+Function\s*\()", "new Function() is forbidden"},
        {R"(Function\s*\(\s*['"])", "Function constructor is forbidden"},

        // File system
        {R"(require\s*\(\s*['"]fs['"]\s*\))", "File system access is forbidden"},
        {R"(import\s+.*from\s+['"]fs['"])", "File system access is forbidden"},

        // Processes
        {R"(require\s*\(\s*['"]child_process['"]\s*\))", "Child process is forbidden"},
        {R"(process\.)", "Process access is forbidden"},

        // Non-deterministic time
        {R"(setTimeout\s*\()", "setTimeout is forbidden - use tick()"},
        {R"(setInterval\s*\()", "setInterval is forbidden - use tick()"},
        {R"(Date\.now\s*\(\s*\))", "Date.now() is forbidden - use provided tick"},
        {R"(new\s+Date\s*\()", "new Date() is forbidden - use provided tick"},

        // Randomness must come from the host
        {R"(Math\.random\s*\(\s*\))", "Math.random() is forbidden - use provided random"},

        // Global mutation
        {R"(globalThis\s*\[)", "Global mutation is forbidden"},
        {R"(window\s*\[)", "Window access is forbidden"},
    };
    return rules;
}

constexpr RequiredProperty kRequiredProperties[] = {
    {"gameType", "string"},
    {"maxPlayers", "number"},
    {"turnBased", "boolean"},
    {"tickRate", "number"},
};

constexpr RequiredMethod kRequiredMethods[] = {
    {"initialize", "playerIds, seed?"},
    {"reset", ""},
    {"destroy", ""},
    {"getState", ""},
    {"getStateForPlayer", "playerId"},
    {"getValidActions", "playerId"},
    {"validateAction", "playerId, action"},
    {"applyAction", "playerId, action"},
    {"tick", "deltaTime"},
    {"isTerminal", ""},
    {"getResult", ""},
    {"serialize", ""},
    {"deserialize", "data"},
};

// Non-overlapping matches, left to right. None of the patterns can match
// the empty string, so every round consumes input.
std::size_t count_matches(const std::string& text, const re2::RE2& re) {
    re2::StringPiece input(text);
    std::size_t count = 0;
    while (re2::RE2::FindAndConsume(&input, re)) {
        ++count;
    }
    return count;
}

// 1-based line/column of a byte offset.
void locate(const std::string& text, std::size_t offset, AnalysisIssue& issue) {
    std::size_t line = 1;
    std::size_t lineStart = 0;
    for (std::size_t i = 0; i < offset && i < text.size(); ++i) {
        if (text[i] == '\n') {
            ++line;
            lineStart = i + 1;
        }
    }
    issue.line = line;
    issue.column = offset - lineStart + 1;
}

void check_interface(const std::string& source, std::vector<AnalysisIssue>& issues) {
    static const re2::RE2 baseGame(R"(extends\s+BaseGame)");
    static const re2::RE2 gameInterface(R"(implements\s+UnifiedGameInterface)");

    if (!re2::RE2::PartialMatch(source, baseGame) && !re2::RE2::PartialMatch(source, gameInterface)) {
        issues.push_back({Severity::Warning, IssueCategory::Interface,
                          "Game should extend BaseGame or implement UnifiedGameInterface", {}, {}});
    }

    for (const auto& prop : kRequiredProperties) {
        const re2::RE2 re(std::string(R"((?:readonly\s+)?)") + prop.name + R"(\s*[:=])");
        if (!re2::RE2::PartialMatch(source, re)) {
            issues.push_back({Severity::Error, IssueCategory::Interface,
                              std::string("Missing required property: ") + prop.name + " (" + prop.type + ")",
                              {}, {}});
        }
    }

    for (const auto& method : kRequiredMethods) {
        const re2::RE2 re(std::string(method.name) + R"(\s*\()");
        if (!re2::RE2::PartialMatch(source, re)) {
            issues.push_back({Severity::Error, IssueCategory::Interface,
                              std::string("Missing required method: ") + method.name + "(" + method.params + ")",
                              {}, {}});
        }
    }
}

} // namespace

CodeMetrics StaticAnalyzer::compute_metrics(const std::string& source) {
    static const re2::RE2 functionRe(R"(function\s+\w+|=>\s*\{|\w+\s*\([^)]*\)\s*\{)");
    static const re2::RE2 classRe(R"(class\s+\w+)");
    static const re2::RE2 ifRe(R"(if\s*\()");
    static const re2::RE2 forRe(R"(for\s*\()");
    static const re2::RE2 whileRe(R"(while\s*\()");
    static const re2::RE2 caseRe(R"(case\s+)");
    static const re2::RE2 catchRe(R"(catch\s*\()");
    static const re2::RE2 ternaryRe(R"(\?.*:)");

    CodeMetrics m;

    m.lineCount = 1;
    for (char c : source) {
        if (c == '\n') ++m.lineCount;
    }

    m.functionCount = count_matches(source, functionRe);
    m.classCount = count_matches(source, classRe);

    m.complexity = 1 + count_matches(source, ifRe) + count_matches(source, forRe) +
                   count_matches(source, whileRe) + count_matches(source, caseRe) +
                   count_matches(source, catchRe) + count_matches(source, ternaryRe);

    m.estimatedMemory = source.size() * 2 + m.functionCount * 1000;
    return m;
}

StaticAnalysisResult StaticAnalyzer::analyze(const std::string& source) const {
    StaticAnalysisResult result;

    if (source.size() > config_.maxCodeSize) {
        result.issues.push_back({Severity::Error, IssueCategory::Size,
                                 "Code exceeds maximum size (" + std::to_string(source.size()) + " > " +
                                     std::to_string(config_.maxCodeSize) + ")",
                                 {}, {}});
        // Nothing else is scanned; metrics keep their defaults.
        core::logf("analyze", "%zu bytes exceeds limit %zu, skipped scan", source.size(), config_.maxCodeSize);
        return result;
    }

    const re2::StringPiece text(source);
    for (const auto& rule : forbidden_rules()) {
        re2::StringPiece match;
        if (rule.pattern.Match(text, 0, text.size(), re2::RE2::UNANCHORED, &match, 1)) {
            AnalysisIssue issue{Severity::Error, IssueCategory::Security,
                                std::string("Security violation: ") + rule.message, {}, {}};
            locate(source, static_cast<std::size_t>(match.data() - text.data()), issue);
            result.issues.push_back(std::move(issue));
        }
    }

    check_interface(source, result.issues);

    result.metrics = compute_metrics(source);
    if (result.metrics.complexity > kMaxComplexity) {
        result.issues.push_back({Severity::Warning, IssueCategory::Complexity,
                                 "High complexity score (" + std::to_string(result.metrics.complexity) +
                                     "). Consider simplifying.",
                                 {}, {}});
    }

    result.safe = !result.has(Severity::Error);

    core::logf("analyze", "%zu bytes, %zu issues, complexity=%zu safe=%d",
               source.size(), result.issues.size(), result.metrics.complexity, result.safe ? 1 : 0);
    return result;
}

} // namespace server::builder
