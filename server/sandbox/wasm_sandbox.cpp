#include "wasm_sandbox.hpp"

#include "seeded_random.hpp"
#include "wasm_runtime.hpp"

#include <core/log.hpp>
#include <engine/core/byte_buffer.hpp>

#include <array>
#include <chrono>
#include <cstdio>
#include <map>

namespace server::sandbox {

using Clock = std::chrono::steady_clock;

namespace detail {

// State reached from the host import callbacks of one instance.
struct HostState {
    bool debug{false};
    Clock::time_point origin;
    SeededRandom rng;

    HostState(bool debugEnabled, Clock::time_point start, std::uint32_t seed)
        : debug(debugEnabled), origin(start), rng(seed) {}
};

// Member order matters: the game instance is released before the memory
// host it imports from, and both before the host state their imports point to.
struct LiveInstance {
    std::string id;
    std::unique_ptr<HostState> host;
    InstancePtr memoryHost;
    InstancePtr instance;
};

struct Registry {
    SandboxConfig config;
    Clock::time_point origin;
    std::uint64_t nextHandle{1};
    std::map<std::uint64_t, std::unique_ptr<LiveInstance>> live;
};

} // namespace detail

namespace {

std::string join(const std::vector<std::string>& parts, const char* sep) {
    std::string out;
    for (std::size_t i = 0; i < parts.size(); ++i) {
        if (i) out += sep;
        out += parts[i];
    }
    return out;
}

// JS-style number rendering for the budget message ("16", "0.5").
std::string format_limit(double ms) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%g", ms);
    return buf;
}

std::int64_t now_millis() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

// =============================================================================
// Host imports ("env")
// =============================================================================

FizzyExecutionResult value_result(FizzyValue value) {
    FizzyExecutionResult result;
    result.trapped = false;
    result.has_value = true;
    result.value = value;
    return result;
}

FizzyExecutionResult void_result() {
    FizzyExecutionResult result;
    result.trapped = false;
    result.has_value = false;
    result.value.i64 = 0;
    return result;
}

FizzyExecutionResult i32_result(std::int32_t v) {
    FizzyValue value;
    value.i64 = 0;
    value.i32 = static_cast<std::uint32_t>(v);
    return value_result(value);
}

FizzyExecutionResult f64_result(double v) {
    FizzyValue value;
    value.f64 = v;
    return value_result(value);
}

FizzyExecutionResult canvas_width(void*, FizzyInstance*, const FizzyValue*, FizzyExecutionContext*) noexcept {
    return i32_result(kCanvasWidth);
}

FizzyExecutionResult canvas_height(void*, FizzyInstance*, const FizzyValue*, FizzyExecutionContext*) noexcept {
    return i32_result(kCanvasHeight);
}

// The pointer/length pair is logged raw; the string is not read from memory.
FizzyExecutionResult console_log(void* context, FizzyInstance*, const FizzyValue* args,
                                 FizzyExecutionContext*) noexcept {
    const auto* host = static_cast<const detail::HostState*>(context);
    if (host->debug) {
        core::logf("sandbox", "console_log ptr=%u len=%u", args[0].i32, args[1].i32);
    }
    return void_result();
}

FizzyExecutionResult math_random(void* context, FizzyInstance*, const FizzyValue*, FizzyExecutionContext*) noexcept {
    auto* host = static_cast<detail::HostState*>(context);
    return f64_result(host->rng.next());
}

FizzyExecutionResult performance_now(void* context, FizzyInstance*, const FizzyValue*,
                                     FizzyExecutionContext*) noexcept {
    const auto* host = static_cast<const detail::HostState*>(context);
    return f64_result(std::chrono::duration<double, std::milli>(Clock::now() - host->origin).count());
}

constexpr std::array<FizzyValueType, 2> kConsoleLogArgs = {FizzyValueTypeI32, FizzyValueTypeI32};

constexpr std::size_t kHostFunctionCount = 5;

std::array<FizzyImportedFunction, kHostFunctionCount> host_functions(detail::HostState* host) {
    const FizzyExternalFunction widthFn = {{FizzyValueTypeI32, nullptr, 0}, canvas_width, host};
    const FizzyExternalFunction heightFn = {{FizzyValueTypeI32, nullptr, 0}, canvas_height, host};
    const FizzyExternalFunction logFn = {
        {FizzyValueTypeVoid, kConsoleLogArgs.data(), kConsoleLogArgs.size()}, console_log, host};
    const FizzyExternalFunction randomFn = {{FizzyValueTypeF64, nullptr, 0}, math_random, host};
    const FizzyExternalFunction nowFn = {{FizzyValueTypeF64, nullptr, 0}, performance_now, host};

    return {
        FizzyImportedFunction{kImportModule, "canvas_width", widthFn},
        FizzyImportedFunction{kImportModule, "canvas_height", heightFn},
        FizzyImportedFunction{kImportModule, "console_log", logFn},
        FizzyImportedFunction{kImportModule, "math_random", randomFn},
        FizzyImportedFunction{kImportModule, "performance_now", nowFn},
    };
}

// =============================================================================
// Shared memory ("env.memory")
// =============================================================================

// Binary of a module that only defines and exports "memory" with 1 initial
// page and `maxPages` maximum. Its instance supplies env.memory to games.
std::vector<std::uint8_t> memory_host_binary(std::uint32_t maxPages) {
    constexpr std::uint8_t kHeader[] = {0x00, 0x61, 0x73, 0x6d, 0x01, 0x00, 0x00, 0x00};
    constexpr std::uint8_t kSectionMemory = 0x05;
    constexpr std::uint8_t kSectionExport = 0x07;
    constexpr std::uint8_t kLimitsWithMax = 0x01;
    constexpr std::uint8_t kExportKindMemory = 0x02;

    engine::ByteWriter memory;
    memory.write_uleb(1);
    memory.write_u8(kLimitsWithMax);
    memory.write_uleb(1);
    memory.write_uleb(maxPages);

    engine::ByteWriter exports;
    exports.write_uleb(1);
    exports.write_name("memory");
    exports.write_u8(kExportKindMemory);
    exports.write_uleb(0);

    engine::ByteWriter out;
    out.write_bytes(kHeader);
    out.write_u8(kSectionMemory);
    out.write_uleb(memory.size());
    out.write_bytes(memory.data());
    out.write_u8(kSectionExport);
    out.write_uleb(exports.size());
    out.write_bytes(exports.data());
    return out.take();
}

bool imports_memory(const FizzyModule* module) {
    const std::uint32_t count = fizzy_get_import_count(module);
    for (std::uint32_t i = 0; i < count; ++i) {
        const FizzyImportDescription import = fizzy_get_import_description(module, i);
        if (import.kind == FizzyExternalKindMemory) {
            return true;
        }
    }
    return false;
}

// Instantiates the memory host. Throws SandboxError on failure.
InstancePtr make_memory_host(std::uint32_t maxPages) {
    const std::vector<std::uint8_t> bytes = memory_host_binary(maxPages);

    std::string error;
    ModulePtr module = parse_module(bytes, &error);
    if (!module) {
        throw SandboxError("WASM instantiation failed: " + error);
    }

    FizzyError err{};
    InstancePtr instance(fizzy_resolve_instantiate(module.release(), nullptr, 0, nullptr, nullptr, nullptr, 0,
                                                   maxPages, &err));
    if (!instance) {
        throw SandboxError(std::string("WASM instantiation failed: ") + err.message);
    }
    return instance;
}

} // namespace

// GameInstance

GameInstance::GameInstance(std::weak_ptr<detail::Registry> registry, std::uint64_t handle,
                           std::string id, std::string gameType, std::uint32_t seed)
    : registry_(std::move(registry)),
      handle_(handle),
      id_(std::move(id)),
      gameType_(std::move(gameType)),
      seed_(seed) {}

std::optional<FizzyValue> GameInstance::call(const std::string& funcName, std::span<const FizzyValue> args) {
    auto registry = registry_.lock();
    if (!registry) {
        throw DestroyedInstanceError();
    }
    auto it = registry->live.find(handle_);
    if (it == registry->live.end()) {
        throw DestroyedInstanceError();
    }
    FizzyInstance* instance = it->second->instance.get();
    const FizzyModule* module = fizzy_get_instance_module(instance);

    std::uint32_t index = 0;
    if (!fizzy_find_exported_function_index(module, funcName.c_str(), &index)) {
        throw ExportNotCallableError(funcName);
    }

    const FizzyFunctionType type = fizzy_get_function_type(module, index);
    if (args.size() != type.inputs_size) {
        throw SandboxError("WASM call \"" + funcName + "\" expects " + std::to_string(type.inputs_size) +
                           " arguments, got " + std::to_string(args.size()));
    }

    // Post-hoc budget check: the call always runs to completion (or traps).
    const auto start = Clock::now();
    const FizzyExecutionResult result = fizzy_execute(instance, index, args.data(), nullptr);
    const double elapsed = std::chrono::duration<double, std::milli>(Clock::now() - start).count();

    if (result.trapped) {
        core::logf("sandbox", "%s: \"%s\" trapped after %.3fms", id_.c_str(), funcName.c_str(), elapsed);
        throw TrapError(funcName);
    }

    const double limit = registry->config.maxTickTime;

    if (registry->config.debug) {
        core::logf("debug", "%s: \"%s\" took %.3fms", id_.c_str(), funcName.c_str(), elapsed);
    }

    if (elapsed > limit) {
        char elapsedText[32];
        std::snprintf(elapsedText, sizeof(elapsedText), "%.2f", elapsed);
        const std::string msg = "WASM call \"" + funcName + "\" exceeded CPU budget: " + elapsedText +
                                "ms > " + format_limit(limit) + "ms limit";
        core::logf("sandbox", "%s: %s", id_.c_str(), msg.c_str());
        throw BudgetExceededError(msg, elapsed, limit);
    }

    if (!result.has_value) {
        return std::nullopt;
    }
    return result.value;
}

void GameInstance::destroy() {
    auto registry = registry_.lock();
    if (!registry) return;

    if (registry->live.erase(handle_) > 0) {
        core::logf("sandbox", "destroyed %s (%zu live)", id_.c_str(), registry->live.size());
    }
}

bool GameInstance::destroyed() const {
    auto registry = registry_.lock();
    return !registry || registry->live.find(handle_) == registry->live.end();
}

// WasmSandbox

WasmSandbox::WasmSandbox(SandboxConfig config)
    : config_(config), validator_(config.maxMemory), registry_(std::make_shared<detail::Registry>()) {
    registry_->config = config_;
    registry_->origin = Clock::now();
}

WasmSandbox::~WasmSandbox() {
    destroy_all();
}

GameInstance WasmSandbox::load_game(std::span<const std::uint8_t> bytes, const std::string& gameType) {
    const ValidationResult validation = validator_.validate(bytes);
    if (!validation.valid) {
        core::logf("sandbox", "rejected %s module: %s", gameType.c_str(), join(validation.errors, ", ").c_str());
        throw InvalidModuleError("Invalid WASM module: " + join(validation.errors, ", "));
    }

    std::string error;
    ModulePtr module = parse_module(bytes, &error);
    if (!module) {
        throw SandboxError("WASM instantiation failed: " + error);
    }

    const std::uint32_t maxPages = config_.max_pages();
    const std::uint32_t seed = generate_seed();

    auto live = std::make_unique<detail::LiveInstance>();
    live->host = std::make_unique<detail::HostState>(config_.debug, registry_->origin, seed);

    // A module either imports env.memory or defines its own; both are held
    // to maxPages by the instantiation limit.
    FizzyExternalMemory sharedMemory{};
    const FizzyExternalMemory* importedMemory = nullptr;
    if (imports_memory(module.get())) {
        live->memoryHost = make_memory_host(maxPages);
        if (!fizzy_find_exported_memory(live->memoryHost.get(), "memory", &sharedMemory)) {
            throw SandboxError("WASM instantiation failed: memory host exports no memory");
        }
        importedMemory = &sharedMemory;
    }

    const auto imports = host_functions(live->host.get());

    // fizzy takes ownership of the module whether or not instantiation succeeds.
    FizzyError err{};
    live->instance.reset(fizzy_resolve_instantiate(module.release(), imports.data(), imports.size(), nullptr,
                                                   importedMemory, nullptr, 0, maxPages, &err));
    if (!live->instance) {
        core::logf("sandbox", "failed to instantiate %s module: %s", gameType.c_str(), err.message);
        throw SandboxError(std::string("WASM instantiation failed: ") + err.message);
    }

    const FizzyModule* instanceModule = fizzy_get_instance_module(live->instance.get());
    std::vector<std::string> missing;
    for (const char* name : kRequiredExports) {
        if (!has_function_export(instanceModule, name)) {
            missing.emplace_back(name);
        }
    }
    if (!missing.empty()) {
        core::logf("sandbox", "%s module is missing exports: %s", gameType.c_str(), join(missing, ", ").c_str());
        throw MissingExportError(std::move(missing));
    }

    live->id = gameType + "_" + std::to_string(now_millis());

    const std::uint64_t handle = registry_->nextHandle++;
    GameInstance handleOut(registry_, handle, live->id, gameType, seed);
    registry_->live.emplace(handle, std::move(live));

    core::logf("sandbox", "loaded %s seed=%u pages<=%u (%zu live)",
               handleOut.id().c_str(), seed, maxPages, registry_->live.size());
    return handleOut;
}

void WasmSandbox::destroy_all() {
    if (!registry_ || registry_->live.empty()) return;

    const std::size_t count = registry_->live.size();
    registry_->live.clear();
    core::logf("sandbox", "destroyed all instances (%zu)", count);
}

std::size_t WasmSandbox::instance_count() const {
    return registry_->live.size();
}

std::vector<std::string> WasmSandbox::instance_ids() const {
    std::vector<std::string> ids;
    ids.reserve(registry_->live.size());
    for (const auto& [handle, live] : registry_->live) {
        ids.push_back(live->id);
    }
    return ids;
}

} // namespace server::sandbox
