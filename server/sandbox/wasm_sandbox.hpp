#pragma once

#include "module_validator.hpp"
#include "sandbox_errors.hpp"
#include "sandbox_types.hpp"

#include <fizzy/fizzy.h>

#include <cstdint>
#include <initializer_list>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace server::sandbox {

namespace detail {
struct Registry;
}

// Handle to one live module instantiation owned by a WasmSandbox.
//
// Copies refer to the same instance. After destroy() (through any copy, or
// via WasmSandbox::destroy_all / the sandbox going away) every call() throws
// DestroyedInstanceError.
class GameInstance {
public:
    const std::string& id() const { return id_; }
    const std::string& game_type() const { return gameType_; }

    // Seed of the instance's math_random stream.
    std::uint32_t seed() const { return seed_; }

    // Invokes an exported function; empty result for void functions. Throws:
    //   DestroyedInstanceError   - the instance is gone
    //   ExportNotCallableError   - no function export with that name
    //   SandboxError             - argument count differs from the signature
    //   TrapError                - module code trapped
    //   BudgetExceededError      - the call finished but took longer than maxTickTime
    std::optional<FizzyValue> call(const std::string& funcName, std::span<const FizzyValue> args = {});
    std::optional<FizzyValue> call(const std::string& funcName, std::initializer_list<FizzyValue> args) {
        return call(funcName, std::span<const FizzyValue>(args.begin(), args.size()));
    }

    // Releases the instantiation; safe to call repeatedly.
    void destroy();

    bool destroyed() const;

private:
    friend class WasmSandbox;

    GameInstance(std::weak_ptr<detail::Registry> registry, std::uint64_t handle,
                 std::string id, std::string gameType, std::uint32_t seed);

    std::weak_ptr<detail::Registry> registry_;
    std::uint64_t handle_;
    std::string id_;
    std::string gameType_;
    std::uint32_t seed_;
};

// Execution host for validated game modules: bounded memory, deterministic
// host imports and a per-call CPU budget. Single-threaded.
class WasmSandbox {
public:
    explicit WasmSandbox(SandboxConfig config = {});
    ~WasmSandbox();

    WasmSandbox(const WasmSandbox&) = delete;
    WasmSandbox& operator=(const WasmSandbox&) = delete;

    const SandboxConfig& config() const { return config_; }

    ValidationResult validate_module(std::span<const std::uint8_t> bytes) const {
        return validator_.validate(bytes);
    }

    // Validates, links against the "env" imports and registers a new instance.
    // Throws InvalidModuleError, MissingExportError or SandboxError.
    GameInstance load_game(std::span<const std::uint8_t> bytes, const std::string& gameType);

    void destroy_all();

    std::size_t instance_count() const;
    std::vector<std::string> instance_ids() const;

private:
    SandboxConfig config_;
    ModuleValidator validator_;
    std::shared_ptr<detail::Registry> registry_;
};

} // namespace server::sandbox
