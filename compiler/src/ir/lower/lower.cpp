//! # Module Lowering
//!
//! Declarations, type resolution, function bodies, scopes and diagnostic
//! collection.

#include "ir/lower.hpp"

#include "ir/printer.hpp"
#include "ir/verify.hpp"
#include "log/log.hpp"

#include <sstream>
#include <unordered_set>

namespace spark::ir {

IrLowerer::IrLowerer(IrContext& ctx) : ctx_(ctx) {}

// ============================================================================
// Scopes and Diagnostics
// ============================================================================

void IrLowerer::push_scope() {
    scopes_.emplace_back();
}

void IrLowerer::pop_scope() {
    if (scopes_.empty()) {
        internal_error("lower", "scope stack underflow");
    }
    scopes_.pop_back();
}

void IrLowerer::bind(const std::string& name, VarId var) {
    if (scopes_.empty()) {
        internal_error("lower", "binding " + name + " outside of any scope");
    }
    scopes_.back().insert_or_assign(name, var);
}

auto IrLowerer::lookup(const std::string& name) const -> std::optional<VarId> {
    for (auto it = scopes_.rbegin(); it != scopes_.rend(); ++it) {
        auto found = it->find(name);
        if (found != it->end()) {
            return found->second;
        }
    }
    return std::nullopt;
}

auto IrLowerer::visible_names() const -> std::vector<std::string> {
    std::vector<std::string> names;
    for (const auto& scope : scopes_) {
        for (const auto& [name, var] : scope) {
            names.push_back(name);
        }
    }
    for (const auto& [name, fun] : funs_by_name_) {
        names.push_back(name);
    }
    return names;
}

void IrLowerer::report(diag::Diagnostic diag) {
    if (diag.is_error()) {
        ++error_count_;
    }
    SPARK_LOG_DEBUG("lower", severity_name(diag.severity) << "[" << diag.code
                                                          << "]: " << diag.message);
    diags_.push_back(std::move(diag));
}

auto IrLowerer::limit_reached() const -> bool {
    return CompilerOptions::max_errors != 0 && error_count_ >= CompilerOptions::max_errors;
}

// ============================================================================
// Types
// ============================================================================

auto IrLowerer::resolve_type(FileId file, const ast::Type& ty) -> Result<TypeId, diag::Diagnostic> {
    return std::visit(
        [&](const auto& t) -> Result<TypeId, diag::Diagnostic> {
            using T = std::decay_t<decltype(t)>;

            if constexpr (std::is_same_v<T, ast::IntegerTypeExpr>) {
                return IrContext::itype(t.is_signed, ast::integer_width_bits(t.width));
            } else if constexpr (std::is_same_v<T, ast::FloatTypeExpr>) {
                return t.doublewide ? IrContext::F64 : IrContext::F32;
            } else if constexpr (std::is_same_v<T, ast::BoolTypeExpr>) {
                return IrContext::BOOL;
            } else if constexpr (std::is_same_v<T, ast::UnitTypeExpr>) {
                return IrContext::UNIT;
            } else if constexpr (std::is_same_v<T, ast::PointerTypeExpr>) {
                auto pointee = resolve_type(file, *t.pointee);
                if (is_err(pointee)) {
                    return pointee;
                }
                return ctx_.insert_type(IrType{IrPtrType{unwrap(pointee)}});
            } else if constexpr (std::is_same_v<T, ast::ArrayTypeExpr>) {
                auto element = resolve_type(file, *t.element);
                if (is_err(element)) {
                    return element;
                }
                return ctx_.insert_type(IrType{IrArrayType{unwrap(element), t.len}});
            } else if constexpr (std::is_same_v<T, ast::StructTypeExpr>) {
                IrStructType st;
                std::unordered_set<std::string> seen;
                for (const auto& field : t.fields) {
                    auto field_ty = resolve_type(file, *field.ty);
                    if (is_err(field_ty)) {
                        return field_ty;
                    }
                    if (!seen.insert(field.name).second) {
                        auto diag = diag::Diagnostic::error(
                            diag::ErrorCodes::DUPLICATE_DEF,
                            "Field " + field.name + " is declared more than once");
                        diag.with_label(diag::Label::primary(file, field.ty->span));
                        return diag;
                    }
                    st.fields.push_back(IrStructField{unwrap(field_ty), field.name});
                }
                return ctx_.insert_type(IrType{std::move(st)});
            } else if constexpr (std::is_same_v<T, ast::SumTypeExpr>) {
                IrSumType sum;
                for (const auto& variant : t.variants) {
                    auto variant_ty = resolve_type(file, *variant);
                    if (is_err(variant_ty)) {
                        return variant_ty;
                    }
                    if (sum.discriminant(unwrap(variant_ty))) {
                        std::ostringstream msg;
                        msg << "Variant " << ctx_.typename_of(unwrap(variant_ty))
                            << " is listed more than once";
                        auto diag =
                            diag::Diagnostic::error(diag::ErrorCodes::DUPLICATE_DEF, msg.str());
                        diag.with_label(diag::Label::primary(file, variant->span));
                        return diag;
                    }
                    sum.variants.push_back(unwrap(variant_ty));
                }
                return ctx_.insert_type(IrType{std::move(sum)});
            } else if constexpr (std::is_same_v<T, ast::FunTypeExpr>) {
                auto return_ty = resolve_type(file, *t.return_ty);
                if (is_err(return_ty)) {
                    return return_ty;
                }
                IrFunType fun_ty{{}, unwrap(return_ty)};
                for (const auto& arg : t.args) {
                    auto arg_ty = resolve_type(file, *arg.ty);
                    if (is_err(arg_ty)) {
                        return arg_ty;
                    }
                    fun_ty.args.push_back(IrFunArg{unwrap(arg_ty), arg.name});
                }
                return ctx_.insert_type(IrType{std::move(fun_ty)});
            } else if constexpr (std::is_same_v<T, ast::NamedTypeExpr>) {
                if (auto alias = ctx_.find_alias(t.name)) {
                    return *alias;
                }
                auto diag = diag::Diagnostic::error(diag::ErrorCodes::TYPE_UNKNOWN,
                                                    "Unknown type " + t.name);
                diag.with_label(diag::Label::primary(file, ty.span));
                return diag;
            }
        },
        ty.kind);
}

auto IrLowerer::is_cyclic_alias(TypeId alias) const -> bool {
    // Walks everything stored by value; pointers and functions end the walk.
    std::vector<TypeId> pending{ctx_.type(alias).as<IrAliasType>().underlying};
    std::unordered_set<TypeId> seen;

    while (!pending.empty()) {
        TypeId current = pending.back();
        pending.pop_back();
        if (current == alias) {
            return true;
        }
        if (!seen.insert(current).second) {
            continue;
        }

        const IrType& ty = ctx_.type(current);
        if (const auto* a = ty.get_if<IrAliasType>()) {
            pending.push_back(a->underlying);
        } else if (const auto* st = ty.get_if<IrStructType>()) {
            for (const auto& field : st->fields) {
                pending.push_back(field.ty);
            }
        } else if (const auto* arr = ty.get_if<IrArrayType>()) {
            pending.push_back(arr->element);
        } else if (const auto* sum = ty.get_if<IrSumType>()) {
            pending.insert(pending.end(), sum->variants.begin(), sum->variants.end());
        }
    }
    return false;
}

void IrLowerer::lower_type_defs(const ast::Module& module) {
    std::vector<std::pair<TypeId, const ast::TypeDef*>> declared;

    for (const auto& def : module.types) {
        if (ctx_.find_alias(def.name)) {
            auto diag = diag::Diagnostic::error(diag::ErrorCodes::DUPLICATE_DEF,
                                                "Type " + def.name + " is defined more than once");
            diag.with_label(diag::Label::primary(module.file, def.span));
            report(std::move(diag));
            continue;
        }
        declared.emplace_back(ctx_.declare_alias(def.name), &def);
    }

    for (const auto& [alias, def] : declared) {
        auto underlying = resolve_type(module.file, def->ty);
        if (is_err(underlying)) {
            report(std::move(unwrap_err(underlying)));
            continue;
        }
        ctx_.define_alias(alias, unwrap(underlying));
    }

    for (const auto& [alias, def] : declared) {
        if (is_cyclic_alias(alias)) {
            auto diag = diag::Diagnostic::error(diag::ErrorCodes::TYPE_UNKNOWN,
                                                "Type " + def->name +
                                                    " is defined in terms of itself");
            diag.with_label(diag::Label::primary(module.file, def->span))
                .with_note("wrap the recursive reference in a pointer");
            report(std::move(diag));
        }
    }
}

// ============================================================================
// Functions
// ============================================================================

auto IrLowerer::declare_fun(FileId file, const ast::FunDecl& decl)
    -> Result<FunId, diag::Diagnostic> {
    const ast::FunProto& proto = decl.proto;

    if (funs_by_name_.count(proto.name) != 0) {
        const IrFun& first = ctx_.fun(funs_by_name_.at(proto.name));
        auto diag = diag::Diagnostic::error(diag::ErrorCodes::DUPLICATE_DEF,
                                            "Function " + proto.name +
                                                " is defined more than once");
        diag.with_label(diag::Label::primary(file, decl.span))
            .with_label(diag::Label::secondary(first.file, first.span, "first defined here"));
        return diag;
    }

    auto return_ty = resolve_type(file, proto.return_ty);
    if (is_err(return_ty)) {
        return std::move(unwrap_err(return_ty));
    }

    IrFunType fun_ty{{}, unwrap(return_ty)};
    for (const auto& param : proto.args) {
        auto arg_ty = resolve_type(file, param.ty);
        if (is_err(arg_ty)) {
            return std::move(unwrap_err(arg_ty));
        }
        fun_ty.args.push_back(IrFunArg{unwrap(arg_ty), param.name});
    }

    ast::FunFlags flags = proto.flags;
    if (!decl.body) {
        flags = flags | ast::FunFlags::Extern;
    }

    FunId id = ctx_.insert_fun(IrFun{proto.name, std::move(fun_ty), file, decl.span,
                                     std::nullopt, flags});
    funs_by_name_.emplace(proto.name, id);
    SPARK_LOG_TRACE("lower", "declared fun " << proto.name << ": "
                                             << ctx_.typename_of(ctx_.fun_type(id)));
    return id;
}

void IrLowerer::lower_fun_body(FunId fun, const std::vector<ast::Stmt>& body) {
    size_t errors_before = error_count_;
    FileId file = ctx_.fun(fun).file;

    BBId entry = ctx_.insert_bb();
    ctx_.fun_mut(fun).body = IrBody{entry, fun};

    // Named arguments become ordinary variables initialised from the
    // incoming values.
    push_scope();
    const auto args = ctx_.fun(fun).ty.args;
    for (uint32_t i = 0; i < args.size(); ++i) {
        if (!args[i].name) {
            continue;
        }
        VarId var = ctx_.insert_var(IrVar{args[i].ty, *args[i].name});
        emit(entry, IrStmt{IrVarLive{var}});
        emit(entry, IrStmt{IrStore{var, IrExpr{ctx_.fun(fun).span, args[i].ty, IrArgRef{i}}}});
        bind(*args[i].name, var);
    }

    auto end = lower_block(file, fun, body, entry);
    pop_scope();

    if (end) {
        const IrFun& f = ctx_.fun(fun);
        if (f.ty.return_ty == IrContext::UNIT) {
            Span at{f.span.to, f.span.to};
            terminate(*end, IrTerminator{IrReturn{IrExpr{at, IrContext::UNIT, IrUnitLiteral{}}}});
        } else if (!limit_reached()) {
            std::ostringstream msg;
            msg << "Function " << f.name << " must return a value of type "
                << ctx_.typename_of(f.ty.return_ty) << " on every path";
            auto diag = diag::Diagnostic::error(diag::ErrorCodes::MISSING_RETURN, msg.str());
            diag.with_label(diag::Label::primary(file, f.span));
            report(std::move(diag));
        }
    }

    // Blocks of a function with errors may be left open; only clean bodies
    // are held to the structural invariants.
    if (error_count_ == errors_before) {
        verify_fun(ctx_, fun);
        if (CompilerOptions::dump_ir) {
            SPARK_LOG_DEBUG("ir", "\n" << IrPrinter(ctx_).print_fun(fun));
        }
    }
}

// ============================================================================
// Module
// ============================================================================

auto IrLowerer::lower_module(const ast::Module& module)
    -> Result<std::vector<FunId>, std::vector<diag::Diagnostic>> {
    SPARK_LOG_INFO("lower", "lowering module " << module.name << " (" << module.types.size()
                                               << " types, " << module.funs.size()
                                               << " functions)");

    lower_type_defs(module);

    std::vector<std::pair<FunId, const ast::FunDecl*>> declared;
    for (const auto& decl : module.funs) {
        auto result = declare_fun(module.file, decl);
        if (is_err(result)) {
            report(std::move(unwrap_err(result)));
            continue;
        }
        declared.emplace_back(unwrap(result), &decl);
    }

    for (const auto& [fun, decl] : declared) {
        if (limit_reached()) {
            SPARK_LOG_WARN("lower", "stopping after " << error_count_ << " errors");
            break;
        }
        if (decl->body) {
            lower_fun_body(fun, *decl->body);
        }
    }

    if (error_count_ > 0) {
        return diags_;
    }

    std::vector<FunId> funs;
    funs.reserve(declared.size());
    for (const auto& [fun, decl] : declared) {
        funs.push_back(fun);
    }
    return funs;
}

} // namespace spark::ir
