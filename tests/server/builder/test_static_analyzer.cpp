/**
 * @file test_static_analyzer.cpp
 * @brief Forbidden API detection, interface checks and code metrics.
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include "helpers/test_utils.hpp"

#include <builder/static_analyzer.hpp>

#include <algorithm>

using namespace server::builder;
using Catch::Matchers::ContainsSubstring;
using test_helpers::game_source_with;
using test_helpers::kValidGameSource;

namespace {

const AnalysisIssue* find_issue(const StaticAnalysisResult& result, const std::string& text) {
    for (const auto& issue : result.issues) {
        if (issue.message.find(text) != std::string::npos) return &issue;
    }
    return nullptr;
}

std::size_t count_severity(const StaticAnalysisResult& result, Severity s) {
    return static_cast<std::size_t>(std::count_if(result.issues.begin(), result.issues.end(),
                                                  [s](const AnalysisIssue& i) { return i.severity == s; }));
}

} // namespace

// =============================================================================
// Clean source
// =============================================================================

TEST_CASE("Conforming game is safe with no issues", "[analyzer]") {
    StaticAnalyzer analyzer;
    const auto result = analyzer.analyze(kValidGameSource);

    REQUIRE(result.safe);
    REQUIRE(result.issues.empty());
}

TEST_CASE("Analysis is deterministic", "[analyzer]") {
    StaticAnalyzer analyzer;
    const std::string source = game_source_with("eval('1'); fetch('/x');");

    const auto a = analyzer.analyze(source);
    const auto b = analyzer.analyze(source);

    REQUIRE(a.safe == b.safe);
    REQUIRE(a.messages(Severity::Error) == b.messages(Severity::Error));
    REQUIRE(a.metrics.complexity == b.metrics.complexity);
}

// =============================================================================
// Forbidden APIs
// =============================================================================

TEST_CASE("Each forbidden construct is reported", "[analyzer][security]") {
    struct Case {
        const char* statement;
        const char* message;
    };
    const Case cases[] = {
        {"fetch('/api');", "Network access (fetch) is forbidden"},
        {"const x = new XMLHttpRequest();", "Network access (XMLHttpRequest) is forbidden"},
        {"const s = new WebSocket('ws://x');", "WebSocket is forbidden"},
        {"eval('1 + 1');", "eval() is forbidden"},
        {"const f = new Function('return 1');", "new Function() is forbidden"},
        {"const fs = require('fs');", "File system access is forbidden"},
        {"require('child_process');", "Child process is forbidden"},
        {"const env = process.env;", "Process access is forbidden"},
        {"setTimeout(() => {}, 10);", "setTimeout is forbidden - use tick()"},
        {"setInterval(() => {}, 10);", "setInterval is forbidden - use tick()"},
        {"const t = Date.now();", "Date.now() is forbidden - use provided tick"},
        {"const d = new Date();", "new Date() is forbidden - use provided tick"},
        {"const r = Math.random();", "Math.random() is forbidden - use provided random"},
        {"globalThis['x'] = 1;", "Global mutation is forbidden"},
        {"window['x'] = 1;", "Window access is forbidden"},
    };

    StaticAnalyzer analyzer;
    for (const auto& c : cases) {
        INFO(c.statement);
        const auto result = analyzer.analyze(game_source_with(c.statement));
        REQUIRE_FALSE(result.safe);

        const AnalysisIssue* issue = find_issue(result, c.message);
        REQUIRE(issue != nullptr);
        REQUIRE(issue->severity == Severity::Error);
        REQUIRE(issue->category == IssueCategory::Security);
        REQUIRE(issue->message == std::string("Security violation: ") + c.message);
    }
}

TEST_CASE("fs import statement is forbidden", "[analyzer][security]") {
    StaticAnalyzer analyzer;
    const auto result = analyzer.analyze("import { readFileSync } from 'fs';\n" + kValidGameSource);

    REQUIRE_FALSE(result.safe);
    REQUIRE(find_issue(result, "File system access is forbidden") != nullptr);
}

TEST_CASE("Security issues carry the position of the first match", "[analyzer][security]") {
    StaticAnalyzer analyzer;
    const auto result = analyzer.analyze("const a = 1;\n  eval('x');\neval('y');\n");

    const AnalysisIssue* issue = find_issue(result, "eval() is forbidden");
    REQUIRE(issue != nullptr);
    REQUIRE(issue->line == 2u);
    REQUIRE(issue->column == 3u);
}

TEST_CASE("A rule is reported once regardless of match count", "[analyzer][security]") {
    StaticAnalyzer analyzer;
    const auto result = analyzer.analyze(game_source_with("eval('a'); eval('b'); eval('c');"));

    REQUIRE(result.messages(Severity::Error) ==
            std::vector<std::string>{"Security violation: eval() is forbidden"});
}

TEST_CASE("Matching is purely textual", "[analyzer][security]") {
    StaticAnalyzer analyzer;
    const auto result = analyzer.analyze(game_source_with("// never call eval(x) here"));
    REQUIRE(find_issue(result, "eval() is forbidden") != nullptr);
}

// =============================================================================
// Interface
// =============================================================================

TEST_CASE("Missing base class is a warning only", "[analyzer][interface]") {
    StaticAnalyzer analyzer;
    const auto source = test_helpers::replace_once(kValidGameSource, "extends BaseGame", "");
    const auto result = analyzer.analyze(source);

    REQUIRE(result.safe);
    REQUIRE(result.issues.size() == 1);
    REQUIRE(result.issues[0].severity == Severity::Warning);
    REQUIRE(result.issues[0].message == "Game should extend BaseGame or implement UnifiedGameInterface");
}

TEST_CASE("implements UnifiedGameInterface satisfies the base check", "[analyzer][interface]") {
    StaticAnalyzer analyzer;
    const auto source = test_helpers::replace_once(kValidGameSource, "extends BaseGame",
                                                   "implements UnifiedGameInterface");
    REQUIRE(analyzer.analyze(source).issues.empty());
}

TEST_CASE("One missing method yields exactly one issue", "[analyzer][interface]") {
    StaticAnalyzer analyzer;
    const auto source = test_helpers::replace_once(kValidGameSource, "reset(): void {", "clear(): void {");
    const auto result = analyzer.analyze(source);

    REQUIRE_FALSE(result.safe);
    REQUIRE(result.issues.size() == 1);
    REQUIRE(result.issues[0].message == "Missing required method: reset()");
    REQUIRE(result.issues[0].category == IssueCategory::Interface);
}

TEST_CASE("Missing property names its type", "[analyzer][interface]") {
    StaticAnalyzer analyzer;
    const auto source = test_helpers::replace_once(kValidGameSource, "readonly tickRate = 0;", "");
    const auto result = analyzer.analyze(source);

    REQUIRE(result.messages(Severity::Error) ==
            std::vector<std::string>{"Missing required property: tickRate (number)"});
}

TEST_CASE("Skeleton class reports every missing member", "[analyzer][interface]") {
    StaticAnalyzer analyzer;
    const auto result = analyzer.analyze("class Empty { gameType = 'x'; }");

    REQUIRE_FALSE(result.safe);
    REQUIRE(count_severity(result, Severity::Error) == 16);
    REQUIRE(count_severity(result, Severity::Warning) == 1);

    const auto errors = result.messages(Severity::Error);
    REQUIRE(errors.front() == "Missing required property: maxPlayers (number)");
    REQUIRE(errors[3] == "Missing required method: initialize(playerIds, seed?)");
    REQUIRE(errors.back() == "Missing required method: deserialize(data)");
}

// =============================================================================
// Size and metrics
// =============================================================================

TEST_CASE("Oversized source is rejected first", "[analyzer][size]") {
    CompilerConfig config;
    config.maxCodeSize = 16;
    StaticAnalyzer analyzer(config);

    const auto result = analyzer.analyze(kValidGameSource);
    REQUIRE_FALSE(result.safe);
    REQUIRE(result.issues.front().category == IssueCategory::Size);
    REQUIRE(result.issues.front().message ==
            "Code exceeds maximum size (" + std::to_string(kValidGameSource.size()) + " > 16)");
}

TEST_CASE("Multi-megabyte source stops at the size check", "[analyzer][size]") {
    // Far above the 1 MiB default, with violations that would otherwise be reported.
    std::string source = kValidGameSource;
    while (source.size() < 10 * 1024 * 1024) {
        source += "const v = a ? eval('1') : Math.random(); fetch('/x');\n";
    }

    StaticAnalyzer analyzer;
    const auto result = analyzer.analyze(source);

    REQUIRE_FALSE(result.safe);
    REQUIRE(result.issues.size() == 1);
    REQUIRE(result.issues.front().category == IssueCategory::Size);
    REQUIRE(result.issues.front().message ==
            "Code exceeds maximum size (" + std::to_string(source.size()) + " > 1048576)");
    REQUIRE(result.metrics.lineCount == 0);
    REQUIRE(result.metrics.functionCount == 0);
}

TEST_CASE("Long minified line is scanned", "[analyzer][size]") {
    StaticAnalyzer analyzer;
    const auto baseline = analyzer.analyze(kValidGameSource).metrics;

    std::string line;
    for (int i = 0; i < 3000; ++i) {
        line += "x=c?1:2;this.s.a=1;";
    }
    REQUIRE(line.size() > 55000);

    const auto result = analyzer.analyze(game_source_with(line));

    REQUIRE(result.safe);
    REQUIRE(result.issues.empty());
    // A ternary match runs to the last ':' of its line, so the whole line counts once.
    REQUIRE(result.metrics.complexity == baseline.complexity + 1);
    REQUIRE(result.metrics.lineCount == baseline.lineCount + 2);
}

TEST_CASE("Long array literal and long ternary are scanned", "[analyzer][size]") {
    StaticAnalyzer analyzer;
    const auto baseline = analyzer.analyze(kValidGameSource).metrics;

    std::string data = "const DATA = load([1";
    for (int i = 0; i < 20000; ++i) {
        data += ",1";
    }
    data += "]);";

    const auto arrays = analyzer.analyze(game_source_with(data));
    REQUIRE(arrays.safe);
    REQUIRE(arrays.metrics.functionCount == baseline.functionCount);
    REQUIRE(arrays.metrics.complexity == baseline.complexity);

    const auto ternary = analyzer.analyze(game_source_with("a ? " + std::string(50000, 'y') + " : b;"));
    REQUIRE(ternary.safe);
    REQUIRE(ternary.metrics.complexity == baseline.complexity + 1);
}

TEST_CASE("Violation at the end of a long line is located", "[analyzer][size]") {
    const std::string source = game_source_with("const pad = '" + std::string(60000, 'y') + "'; eval('1');");

    StaticAnalyzer analyzer;
    const auto result = analyzer.analyze(source);

    const auto pos = source.find("eval(");
    const auto lineStart = source.rfind('\n', pos) + 1;
    const auto expectedLine = static_cast<std::size_t>(std::count(source.begin(), source.begin() + pos, '\n')) + 1;

    const AnalysisIssue* issue = find_issue(result, "eval()");
    REQUIRE(issue != nullptr);
    REQUIRE(issue->line == expectedLine);
    REQUIRE(issue->column == pos - lineStart + 1);
}

TEST_CASE("Source exactly at the limit is accepted", "[analyzer][size]") {
    CompilerConfig config;
    config.maxCodeSize = kValidGameSource.size();
    StaticAnalyzer analyzer(config);

    REQUIRE(analyzer.analyze(kValidGameSource).safe);
}

TEST_CASE("Metrics for a small snippet", "[analyzer][metrics]") {
    const std::string source = "const f = () => {\n  return 1;\n};\n";
    const auto m = StaticAnalyzer::compute_metrics(source);

    REQUIRE(m.lineCount == 4);
    REQUIRE(m.functionCount == 1);
    REQUIRE(m.classCount == 0);
    REQUIRE(m.complexity == 1);
    REQUIRE(m.estimatedMemory == source.size() * 2 + 1000);
}

TEST_CASE("Empty source metrics", "[analyzer][metrics]") {
    const auto m = StaticAnalyzer::compute_metrics("");
    REQUIRE(m.lineCount == 1);
    REQUIRE(m.functionCount == 0);
    REQUIRE(m.complexity == 1);
    REQUIRE(m.estimatedMemory == 0);
}

TEST_CASE("Branching constructs raise complexity", "[analyzer][metrics]") {
    const std::string source =
        "if (a) {}\nfor (;;) {}\nwhile (b) {}\nswitch (c) { case 1: break; case 2: break; }\n"
        "try {} catch (e) {}\nconst v = a ? 1 : 2;\nclass A {}\nclass B {}\n";
    const auto m = StaticAnalyzer::compute_metrics(source);

    // 1 + if + for + while + 2 case + catch + ternary
    REQUIRE(m.complexity == 8);
    REQUIRE(m.classCount == 2);
}

TEST_CASE("Complexity above the threshold warns", "[analyzer][metrics]") {
    std::string branches;
    for (int i = 0; i < 100; ++i) {
        branches += "if (deltaTime) {}\n    ";
    }

    StaticAnalyzer analyzer;
    const auto result = analyzer.analyze(game_source_with(branches));

    REQUIRE(result.metrics.complexity > StaticAnalyzer::kMaxComplexity);
    REQUIRE(result.safe);

    const AnalysisIssue& last = result.issues.back();
    REQUIRE(last.severity == Severity::Warning);
    REQUIRE(last.category == IssueCategory::Complexity);
    REQUIRE(last.message == "High complexity score (" + std::to_string(result.metrics.complexity) +
                                "). Consider simplifying.");
}
