#pragma once

#include <stdexcept>
#include <string>
#include <vector>

namespace server::sandbox {

class SandboxError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Bytes failed validation; message is "Invalid WASM module: <errors>".
class InvalidModuleError : public SandboxError {
public:
    using SandboxError::SandboxError;
};

class MissingExportError : public SandboxError {
public:
    explicit MissingExportError(std::vector<std::string> missing)
        : SandboxError(format(missing)), missing_(std::move(missing)) {}

    const std::vector<std::string>& missing() const { return missing_; }

private:
    static std::string format(const std::vector<std::string>& missing) {
        std::string msg = "WASM module is missing required exports: ";
        for (std::size_t i = 0; i < missing.size(); ++i) {
            if (i) msg += ", ";
            msg += missing[i];
        }
        return msg;
    }

    std::vector<std::string> missing_;
};

class ExportNotCallableError : public SandboxError {
public:
    explicit ExportNotCallableError(const std::string& name)
        : SandboxError("Export \"" + name + "\" is not a function") {}
};

// Module code hit unreachable, an out-of-bounds access or another trap.
// The instance stays usable.
class TrapError : public SandboxError {
public:
    explicit TrapError(const std::string& name)
        : SandboxError("WASM call \"" + name + "\" trapped") {}
};

// Raised after the call has already completed; the instance stays usable.
class BudgetExceededError : public SandboxError {
public:
    BudgetExceededError(const std::string& message, double elapsedMs, double limitMs)
        : SandboxError(message), elapsedMs_(elapsedMs), limitMs_(limitMs) {}

    double elapsed_ms() const { return elapsedMs_; }
    double limit_ms() const { return limitMs_; }

private:
    double elapsedMs_;
    double limitMs_;
};

class DestroyedInstanceError : public SandboxError {
public:
    DestroyedInstanceError() : SandboxError("GameInstance has been destroyed") {}
};

} // namespace server::sandbox
