//! # LLVM Backend Implementation
//!
//! Uses the LLVM C API: parse IR text, verify, run the optimization
//! pipeline, emit an object file or buffer.

#include "backend/llvm_backend.hpp"

#include "log/log.hpp"

#include <llvm-c/Analysis.h>
#include <llvm-c/Core.h>
#include <llvm-c/Error.h>
#include <llvm-c/IRReader.h>
#include <llvm-c/Target.h>
#include <llvm-c/TargetMachine.h>
#include <llvm-c/Transforms/PassBuilder.h>
#include <llvm/Config/llvm-config.h>

namespace spark::backend {

// ============================================================================
// Helper Functions
// ============================================================================

/// Convert LLVM error message to string and dispose it.
static auto consume_error_message(char* error) -> std::string {
    if (error == nullptr) {
        return "";
    }
    std::string msg(error);
    LLVMDisposeMessage(error);
    return msg;
}

static auto get_opt_level_string(int level) -> const char* {
    switch (level) {
    case 0:
        return "default<O0>";
    case 1:
        return "default<O1>";
    case 2:
        return "default<O2>";
    case 3:
        return "default<O3>";
    default:
        return "default<O2>";
    }
}

static auto get_codegen_level(int level) -> LLVMCodeGenOptLevel {
    switch (level) {
    case 0:
        return LLVMCodeGenLevelNone;
    case 1:
        return LLVMCodeGenLevelLess;
    case 2:
        return LLVMCodeGenLevelDefault;
    default:
        return LLVMCodeGenLevelAggressive;
    }
}

// ============================================================================
// LLVMBackend Implementation
// ============================================================================

LLVMBackend::LLVMBackend() = default;

LLVMBackend::~LLVMBackend() {
    if (context_) {
        LLVMContextDispose(static_cast<LLVMContextRef>(context_));
        context_ = nullptr;
    }
}

auto LLVMBackend::initialize() -> bool {
    if (initialized_) {
        return true;
    }

    if (LLVMInitializeNativeTarget() != 0 || LLVMInitializeNativeAsmPrinter() != 0) {
        last_error_ = "Failed to initialize the native target";
        SPARK_LOG_ERROR("backend", last_error_);
        return false;
    }

    context_ = LLVMContextCreate();
    if (!context_) {
        last_error_ = "Failed to create LLVM context";
        SPARK_LOG_ERROR("backend", last_error_);
        return false;
    }

    SPARK_LOG_DEBUG("backend", "LLVM " << get_llvm_version() << " initialized for "
                                       << get_default_target_triple());
    initialized_ = true;
    return true;
}

auto LLVMBackend::get_default_target_triple() const -> std::string {
    char* triple = LLVMGetDefaultTargetTriple();
    std::string result(triple);
    LLVMDisposeMessage(triple);
    return result;
}

auto LLVMBackend::parse_module(const std::string& ir_content, LLVMCompileResult& result)
    -> void* {
    if (!initialized_) {
        result.error_message = "LLVM backend not initialized";
        return nullptr;
    }

    // The parser takes ownership of the buffer.
    LLVMMemoryBufferRef buffer =
        LLVMCreateMemoryBufferWithMemoryRangeCopy(ir_content.c_str(), ir_content.size(), "ir");
    if (!buffer) {
        result.error_message = "Failed to create memory buffer for IR";
        return nullptr;
    }

    LLVMModuleRef module = nullptr;
    char* error = nullptr;
    if (LLVMParseIRInContext(static_cast<LLVMContextRef>(context_), buffer, &module, &error) !=
        0) {
        result.error_message = "Failed to parse LLVM IR: " + consume_error_message(error);
        SPARK_LOG_ERROR("backend", result.error_message);
        return nullptr;
    }

    error = nullptr;
    if (LLVMVerifyModule(module, LLVMReturnStatusAction, &error) != 0) {
        result.error_message = "Module verification failed: " + consume_error_message(error);
        SPARK_LOG_ERROR("backend", result.error_message);
        LLVMDisposeModule(module);
        return nullptr;
    }
    consume_error_message(error);

    return module;
}

auto LLVMBackend::verify_ir(const std::string& ir_content) -> LLVMCompileResult {
    LLVMCompileResult result;
    auto module = static_cast<LLVMModuleRef>(parse_module(ir_content, result));
    if (!module) {
        return result;
    }
    LLVMDisposeModule(module);
    result.success = true;
    return result;
}

auto LLVMBackend::compile(const std::string& ir_content, const fs::path& output_path,
                          const LLVMCompileOptions& options) -> LLVMCompileResult {
    LLVMCompileResult result;
    auto module = static_cast<LLVMModuleRef>(parse_module(ir_content, result));
    if (!module) {
        return result;
    }

    std::string target_triple = options.target_triple;
    if (target_triple.empty()) {
        target_triple = get_default_target_triple();
    }
    LLVMSetTarget(module, target_triple.c_str());

    LLVMTargetRef target = nullptr;
    char* error = nullptr;
    if (LLVMGetTargetFromTriple(target_triple.c_str(), &target, &error) != 0) {
        result.error_message = "Failed to get target: " + consume_error_message(error);
        SPARK_LOG_ERROR("backend", result.error_message);
        LLVMDisposeModule(module);
        return result;
    }

    std::string cpu = options.cpu;
    if (cpu.empty() || cpu == "native") {
        char* host_cpu = LLVMGetHostCPUName();
        cpu = host_cpu;
        LLVMDisposeMessage(host_cpu);
    }

    std::string features = options.features;
    if (features.empty()) {
        char* host_features = LLVMGetHostCPUFeatures();
        features = host_features;
        LLVMDisposeMessage(host_features);
    }

    LLVMRelocMode reloc_mode = options.position_independent ? LLVMRelocPIC : LLVMRelocDefault;
    LLVMTargetMachineRef target_machine = LLVMCreateTargetMachine(
        target, target_triple.c_str(), cpu.c_str(), features.c_str(),
        get_codegen_level(options.optimization_level), reloc_mode, LLVMCodeModelDefault);
    if (!target_machine) {
        result.error_message = "Failed to create target machine";
        SPARK_LOG_ERROR("backend", result.error_message);
        LLVMDisposeModule(module);
        return result;
    }

    LLVMTargetDataRef data_layout = LLVMCreateTargetDataLayout(target_machine);
    char* data_layout_str = LLVMCopyStringRepOfTargetData(data_layout);
    LLVMSetDataLayout(module, data_layout_str);
    LLVMDisposeMessage(data_layout_str);
    LLVMDisposeTargetData(data_layout);

    if (options.optimization_level > 0) {
        LLVMPassBuilderOptionsRef pass_opts = LLVMCreatePassBuilderOptions();
        const char* passes = get_opt_level_string(options.optimization_level);
        LLVMErrorRef pass_error = LLVMRunPasses(module, passes, target_machine, pass_opts);
        if (pass_error) {
            char* pass_msg = LLVMGetErrorMessage(pass_error);
            result.warnings.push_back(std::string("Optimization pipeline failed: ") + pass_msg);
            LLVMDisposeErrorMessage(pass_msg);
            SPARK_LOG_WARN("backend", result.warnings.back());
        }
        LLVMDisposePassBuilderOptions(pass_opts);
    }

    error = nullptr;
    bool emitted = false;
    if (!output_path.empty()) {
        std::string output_str = output_path.string();
        emitted = LLVMTargetMachineEmitToFile(target_machine, module, output_str.data(),
                                              LLVMObjectFile, &error) == 0;
    } else {
        LLVMMemoryBufferRef out_buffer = nullptr;
        emitted = LLVMTargetMachineEmitToMemoryBuffer(target_machine, module, LLVMObjectFile,
                                                      &error, &out_buffer) == 0;
        if (emitted) {
            const auto* start = reinterpret_cast<const uint8_t*>(LLVMGetBufferStart(out_buffer));
            result.object_data.assign(start, start + LLVMGetBufferSize(out_buffer));
            LLVMDisposeMemoryBuffer(out_buffer);
        }
    }

    LLVMDisposeTargetMachine(target_machine);
    LLVMDisposeModule(module);

    if (!emitted) {
        result.error_message = "Failed to emit object code: " + consume_error_message(error);
        SPARK_LOG_ERROR("backend", result.error_message);
        return result;
    }

    if (!output_path.empty()) {
        result.object_file = output_path;
        SPARK_LOG_INFO("backend", "Compiled to: " << output_path.string());
    } else {
        SPARK_LOG_DEBUG("backend", "Compiled to buffer of " << result.object_data.size()
                                                            << " bytes");
    }
    result.success = true;
    return result;
}

auto LLVMBackend::compile_ir_to_object(const std::string& ir_content, const fs::path& output_path,
                                       const LLVMCompileOptions& options) -> LLVMCompileResult {
    if (output_path.empty()) {
        LLVMCompileResult result;
        result.error_message = "No output path given";
        return result;
    }
    return compile(ir_content, output_path, options);
}

auto LLVMBackend::compile_ir_to_buffer(const std::string& ir_content,
                                       const LLVMCompileOptions& options) -> LLVMCompileResult {
    return compile(ir_content, fs::path{}, options);
}

// ============================================================================
// Module-level Functions
// ============================================================================

auto is_llvm_backend_available() -> bool {
    LLVMBackend backend;
    return backend.initialize();
}

auto get_llvm_version() -> std::string {
    return std::to_string(LLVM_VERSION_MAJOR) + "." + std::to_string(LLVM_VERSION_MINOR) + "." +
           std::to_string(LLVM_VERSION_PATCH);
}

} // namespace spark::backend
