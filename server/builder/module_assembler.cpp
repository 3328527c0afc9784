#include "module_assembler.hpp"

#include "artifact_hasher.hpp"
#include "source_map.hpp"

#include <core/log.hpp>
#include <engine/core/byte_buffer.hpp>

#include <stdexcept>

namespace server::builder {

namespace {

constexpr std::uint8_t kWasmHeader[] = {0x00, 0x61, 0x73, 0x6d, 0x01, 0x00, 0x00, 0x00};

constexpr std::uint8_t kSectionType = 0x01;
constexpr std::uint8_t kSectionFunction = 0x03;
constexpr std::uint8_t kSectionExport = 0x07;
constexpr std::uint8_t kSectionCode = 0x0a;

constexpr std::uint8_t kFuncTypeForm = 0x60;
constexpr std::uint8_t kExportKindFunction = 0x00;
constexpr std::uint8_t kOpEnd = 0x0b;

// [id][LEB128 payload size][payload]
void write_section(engine::ByteWriter& out, std::uint8_t id, engine::ByteWriter& payload) {
    const std::vector<std::uint8_t> bytes = payload.take();
    out.write_u8(id);
    out.write_uleb(bytes.size());
    out.write_bytes(bytes);
}

} // namespace

ModuleAssembler::ModuleAssembler(CompilerConfig config)
    : config_(config), analyzer_(config) {}

std::vector<std::uint8_t> ModuleAssembler::assemble_stub() {
    const std::uint32_t count = static_cast<std::uint32_t>(kStubExports.size());

    engine::ByteWriter out;
    out.write_bytes(kWasmHeader);

    // One () -> () signature shared by every function.
    engine::ByteWriter types;
    types.write_uleb(1);
    types.write_u8(kFuncTypeForm);
    types.write_uleb(0);
    types.write_uleb(0);
    write_section(out, kSectionType, types);

    engine::ByteWriter functions;
    functions.write_uleb(count);
    for (std::uint32_t i = 0; i < count; ++i) {
        functions.write_uleb(0);
    }
    write_section(out, kSectionFunction, functions);

    engine::ByteWriter exports;
    exports.write_uleb(count);
    for (std::uint32_t i = 0; i < count; ++i) {
        exports.write_name(kStubExports[i]);
        exports.write_u8(kExportKindFunction);
        exports.write_uleb(i);
    }
    write_section(out, kSectionExport, exports);

    // body_size=2: zero local groups, `end`
    engine::ByteWriter code;
    code.write_uleb(count);
    for (std::uint32_t i = 0; i < count; ++i) {
        code.write_uleb(2);
        code.write_uleb(0);
        code.write_u8(kOpEnd);
    }
    write_section(out, kSectionCode, code);

    return out.take();
}

CompilationResult ModuleAssembler::compile(const std::string& source) const {
    CompilationResult result;

    const StaticAnalysisResult analysis = analyzer_.analyze(source);

    if (!analysis.safe) {
        result.errors = analysis.messages(Severity::Error);
        core::logf("build", "rejected: %zu errors", result.errors.size());
        return result;
    }

    if (config_.strict && analysis.has(Severity::Warning)) {
        for (const auto& issue : analysis.issues) {
            if (issue.severity == Severity::Error || issue.severity == Severity::Warning) {
                result.errors.push_back(issue.message);
            }
        }
        core::logf("build", "rejected in strict mode: %zu warnings", result.errors.size());
        return result;
    }

    try {
        std::vector<std::uint8_t> bytes = assemble_stub();
        result.wasmHash = hash_wasm(bytes);
        result.wasmBytes = std::move(bytes);
        if (config_.sourceMap) {
            result.sourceMap = generate_source_map(source);
        }
        result.success = true;
    } catch (const std::exception& e) {
        result.success = false;
        result.wasmBytes.reset();
        result.wasmHash.reset();
        result.sourceMap.reset();
        result.errors = {e.what()};
        core::logf("build", "assembly failed: %s", e.what());
        return result;
    }

    core::logf("build", "compiled %zu bytes -> %zu byte module sha256=%s",
               source.size(), result.wasmBytes->size(), result.wasmHash->c_str());
    return result;
}

bool ModuleAssembler::verify_hash(std::span<const std::uint8_t> bytes, const std::string& expectedHash) const {
    return builder::verify_hash(bytes, expectedHash);
}

} // namespace server::builder
