//! # IR Codegen Module Structure
//!
//! - generate: preamble, named types, then every function
//! - emit_function: `define` with the synthetic entry block holding allocas
//! - emit_function_declaration: `declare` for functions without a body
//! - emit_block / emit_stmt: block labels, variable stores

#include "codegen/ir_codegen.hpp"

#include "ir/verify.hpp"
#include "log/log.hpp"

namespace spark::codegen {

IrCodegen::IrCodegen(const ir::IrContext& ctx, IrCodegenOptions options)
    : ctx_(ctx), options_(std::move(options)) {}

auto IrCodegen::generate(const std::string& module_name) -> std::string {
    output_.str("");
    output_.clear();

    emit_preamble(module_name);
    emit_type_defs();

    for (ir::FunId fun : ctx_.fun_ids()) {
        if (ctx_.fun(fun).body) {
            emit_function(fun);
        } else {
            emit_function_declaration(fun);
        }
    }

    SPARK_LOG_DEBUG("codegen", "generated module " << module_name << " with "
                                                   << ctx_.num_funs() << " functions");
    return output_.str();
}

// ============================================================================
// Emit Helpers
// ============================================================================

void IrCodegen::emitln(const std::string& s) {
    body_ << s << "\n";
}

void IrCodegen::emit_comment(const std::string& s) {
    if (options_.emit_comments) {
        body_ << "    ; " << s << "\n";
    }
}

auto IrCodegen::new_temp() -> std::string {
    return "%t" + std::to_string(temp_counter_++);
}

auto IrCodegen::block_label(ir::BBId bb) -> std::string {
    return "bb" + std::to_string(bb.raw());
}

auto IrCodegen::fun_symbol(ir::FunId fun) const -> std::string {
    return "@\"" + ctx_.fun(fun).name + "\"";
}

auto IrCodegen::var_slot(ir::VarId var) -> std::string {
    std::string slot = "%var" + std::to_string(var.raw());
    if (slots_.insert(var).second) {
        const ir::IrVar& v = ctx_.var(var);
        entry_ << "    " << slot << " = alloca " << llvm_type(v.ty);
        if (options_.emit_comments) {
            entry_ << " ; " << v.name;
        }
        entry_ << "\n";
    }
    return slot;
}

// ============================================================================
// Module Structure
// ============================================================================

void IrCodegen::emit_preamble(const std::string& module_name) {
    output_ << "; ModuleID = '" << module_name << "'\n";
    output_ << "source_filename = \"" << module_name << "\"\n";
    if (!options_.target_triple.empty()) {
        output_ << "target triple = \"" << options_.target_triple << "\"\n";
    }
    output_ << "\n";
}

void IrCodegen::emit_type_defs() {
    bool any = false;
    for (uint32_t raw = 0; raw < ctx_.num_types(); ++raw) {
        auto ty = ir::TypeId::from_raw(raw);
        if (!is_named_aggregate(ty)) {
            continue;
        }
        const auto& alias = ctx_.type(ty).as<ir::IrAliasType>();
        output_ << "%\"" << alias.name << "\" = type "
                << aggregate_literal(ctx_.unwrap_alias(ty)) << "\n";
        any = true;
    }
    if (any) {
        output_ << "\n";
    }
}

void IrCodegen::emit_function_declaration(ir::FunId fun) {
    const ir::IrFun& f = ctx_.fun(fun);
    output_ << "declare " << llvm_type(f.ty.return_ty) << " " << fun_symbol(fun) << "(";
    for (size_t i = 0; i < f.ty.args.size(); ++i) {
        if (i > 0)
            output_ << ", ";
        output_ << llvm_type(f.ty.args[i].ty);
    }
    output_ << ")\n\n";
}

void IrCodegen::emit_function(ir::FunId fun) {
    const ir::IrFun& f = ctx_.fun(fun);

    entry_.str("");
    entry_.clear();
    body_.str("");
    body_.clear();
    temp_counter_ = 0;
    slots_.clear();

    for (ir::BBId bb : ir::reachable_blocks(ctx_, fun)) {
        emit_block(bb);
    }

    std::string linkage = ast::has_flag(f.flags, ast::FunFlags::Inline) ? " inlinehint" : "";
    output_ << "define " << llvm_type(f.ty.return_ty) << " " << fun_symbol(fun) << "(";
    for (size_t i = 0; i < f.ty.args.size(); ++i) {
        if (i > 0)
            output_ << ", ";
        output_ << llvm_type(f.ty.args[i].ty) << " %arg" << i;
    }
    output_ << ")" << linkage << " {\n";
    output_ << "entry:\n" << entry_.str();
    output_ << "    br label %" << block_label(f.body->entry) << "\n";
    output_ << body_.str();
    output_ << "}\n\n";
}

void IrCodegen::emit_block(ir::BBId bb) {
    const ir::IrBB& block = ctx_.bb(bb);

    emitln();
    emitln(block_label(bb) + ":");
    for (const auto& stmt : block.stmts) {
        emit_stmt(stmt);
    }
    if (!block.terminator) {
        internal_error("codegen", "block " + block_label(bb) + " has no terminator");
    }
    emit_terminator(*block.terminator);
}

void IrCodegen::emit_stmt(const ir::IrStmt& stmt) {
    if (const auto* live = std::get_if<ir::IrVarLive>(&stmt.kind)) {
        (void)var_slot(live->var);
        emit_comment("live " + ctx_.var(live->var).name);
        return;
    }

    const auto& store = std::get<ir::IrStore>(stmt.kind);
    std::string value = emit_expr(store.value);
    std::string slot = var_slot(store.var);
    std::string ty = llvm_type(ctx_.var(store.var).ty);
    emitln("    store " + ty + " " + value + ", " + ty + "* " + slot);
}

} // namespace spark::codegen
