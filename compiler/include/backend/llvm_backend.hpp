//! # LLVM Backend
//!
//! Compiles the LLVM IR text produced by `codegen::IrCodegen` to native
//! object code through the LLVM C API, without spawning external tools.
//!
//! ## Usage
//!
//! ```cpp
//! LLVMBackend backend;
//! if (!backend.initialize()) {
//!     // backend.get_last_error()
//! }
//!
//! LLVMCompileOptions opts;
//! opts.optimization_level = 2;
//! auto result = backend.compile_ir_to_object(ir_text, "out.o", opts);
//! ```

#pragma once

#include "common.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace spark::backend {

/// Options for LLVM IR compilation.
struct LLVMCompileOptions {
    /// Optimization level (0-3).
    int optimization_level = CompilerOptions::optimization_level;

    /// Target triple. Empty means the host.
    std::string target_triple = CompilerOptions::target_triple;

    /// CPU name; "native" picks the host CPU.
    std::string cpu = "native";

    /// CPU features (e.g., "+avx2,+fma"). Empty picks the host's.
    std::string features;

    /// Generate position-independent code.
    bool position_independent = false;
};

/// Result of LLVM IR compilation or verification.
struct LLVMCompileResult {
    bool success = false;

    /// Path to the generated object file (compile_ir_to_object).
    fs::path object_file;

    /// In-memory object data (compile_ir_to_buffer).
    std::vector<uint8_t> object_data;

    std::string error_message;
    std::vector<std::string> warnings;
};

/// LLVM Backend for direct IR compilation.
///
/// Owns one LLVM context; modules parsed from IR text live only for the
/// duration of a single call.
class LLVMBackend {
public:
    LLVMBackend();
    ~LLVMBackend();

    LLVMBackend(const LLVMBackend&) = delete;
    LLVMBackend& operator=(const LLVMBackend&) = delete;

    /// Initializes the native target and creates the LLVM context.
    ///
    /// @return true if initialization succeeded
    [[nodiscard]] auto initialize() -> bool;

    [[nodiscard]] auto is_initialized() const -> bool {
        return initialized_;
    }

    /// Parses and verifies LLVM IR text without generating code.
    [[nodiscard]] auto verify_ir(const std::string& ir_content) -> LLVMCompileResult;

    /// Compiles LLVM IR text to an object file at `output_path`.
    [[nodiscard]] auto compile_ir_to_object(const std::string& ir_content,
                                            const fs::path& output_path,
                                            const LLVMCompileOptions& options) -> LLVMCompileResult;

    /// Compiles LLVM IR text to an in-memory object; see `object_data`.
    [[nodiscard]] auto compile_ir_to_buffer(const std::string& ir_content,
                                            const LLVMCompileOptions& options) -> LLVMCompileResult;

    /// Default target triple for the host.
    [[nodiscard]] auto get_default_target_triple() const -> std::string;

    [[nodiscard]] auto get_last_error() const -> const std::string& {
        return last_error_;
    }

private:
    bool initialized_ = false;
    std::string last_error_;

    // LLVMContextRef, kept opaque so callers need no LLVM headers.
    void* context_ = nullptr;

    /// Parses `ir_content` into a module owned by the caller, or records the
    /// failure in `result` and returns null.
    auto parse_module(const std::string& ir_content, LLVMCompileResult& result) -> void*;

    /// Compiles to a file when `output_path` is non-empty, else to memory.
    auto compile(const std::string& ir_content, const fs::path& output_path,
                 const LLVMCompileOptions& options) -> LLVMCompileResult;
};

/// Check if the LLVM backend can be initialized on this system.
[[nodiscard]] auto is_llvm_backend_available() -> bool;

/// The LLVM version linked in, as "major.minor.patch".
[[nodiscard]] auto get_llvm_version() -> std::string;

} // namespace spark::backend
