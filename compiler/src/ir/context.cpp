//! # IR Context
//!
//! Type interning with fixed primitive handles, nominal aliases, and the
//! function / block / variable arenas.

#include "ir/ir.hpp"

#include "log/log.hpp"

namespace spark::ir {

IrContext::IrContext() {
    // Order must match the handle constants in the header.
    const IrType primitives[] = {
        IrType{IrIntegerType{true, 8}},   IrType{IrIntegerType{true, 16}},
        IrType{IrIntegerType{true, 32}},  IrType{IrIntegerType{true, 64}},
        IrType{IrIntegerType{false, 8}},  IrType{IrIntegerType{false, 16}},
        IrType{IrIntegerType{false, 32}}, IrType{IrIntegerType{false, 64}},
        IrType{IrBoolType{}},             IrType{IrUnitType{}},
        IrType{IrFloatType{false}},       IrType{IrFloatType{true}},
        IrType{IrInvalidType{}},
    };
    for (const auto& ty : primitives) {
        (void)types_.insert(ty);
    }
    if (types_.size() != INVALID.raw() + 1) {
        internal_error("ir", "primitive type table is not in canonical order");
    }
}

// ============================================================================
// Types
// ============================================================================

auto IrContext::insert_type(IrType ty) -> TypeId {
    return types_.insert(std::move(ty));
}

auto IrContext::type(TypeId id) const -> const IrType& {
    return types_.index(id);
}

auto IrContext::declare_alias(const std::string& name) -> TypeId {
    TypeId id = types_.insert(IrType{IrAliasType{name, INVALID}});
    SPARK_LOG_TRACE("ir", "declared alias " << name << " as type " << id.raw());
    return id;
}

auto IrContext::find_alias(const std::string& name) const -> std::optional<TypeId> {
    return types_.find(IrType{IrAliasType{name, INVALID}});
}

void IrContext::define_alias(TypeId alias, TypeId underlying) {
    const auto* current = type(alias).get_if<IrAliasType>();
    if (!current) {
        internal_error("ir", "type " + std::to_string(alias.raw()) + " is not an alias");
    }
    if (current->underlying != INVALID) {
        internal_error("ir", "alias " + current->name + " is already defined");
    }
    types_.refine(alias, IrType{IrAliasType{current->name, underlying}});
}

auto IrContext::unwrap_alias(TypeId id) const -> TypeId {
    // A chain longer than the number of types must revisit an alias.
    for (size_t steps = 0; steps <= types_.size(); ++steps) {
        const auto* alias = type(id).get_if<IrAliasType>();
        if (!alias) {
            return id;
        }
        id = alias->underlying;
    }
    return INVALID;
}

auto IrContext::discriminant(TypeId sum, TypeId variant) const -> std::optional<DiscriminantId> {
    const auto* sum_ty = type(unwrap_alias(sum)).get_if<IrSumType>();
    if (!sum_ty) {
        return std::nullopt;
    }
    return sum_ty->discriminant(variant);
}

auto IrContext::variant_type(TypeId sum, DiscriminantId disc) const -> TypeId {
    const auto* sum_ty = type(unwrap_alias(sum)).get_if<IrSumType>();
    if (!sum_ty || disc.raw() >= sum_ty->variants.size()) {
        internal_error("ir", "discriminant " + std::to_string(disc.raw()) +
                                 " does not name a variant of " + type_name(sum));
    }
    return sum_ty->variants[disc.raw()];
}

auto IrContext::typename_of(TypeId id) const -> TypenameFormatter {
    return TypenameFormatter(*this, id);
}

// ============================================================================
// Functions, Blocks, Variables
// ============================================================================

auto IrContext::insert_fun(IrFun fun) -> FunId {
    return funs_.insert(std::move(fun));
}

auto IrContext::fun(FunId id) const -> const IrFun& {
    return funs_.index(id);
}

auto IrContext::fun_mut(FunId id) -> IrFun& {
    return funs_.index_mut(id);
}

auto IrContext::fun_type(FunId id) -> TypeId {
    return insert_type(IrType{fun(id).ty});
}

auto IrContext::insert_bb(IrBB bb) -> BBId {
    return bbs_.insert(std::move(bb));
}

auto IrContext::bb(BBId id) const -> const IrBB& {
    return bbs_.index(id);
}

auto IrContext::bb_mut(BBId id) -> IrBB& {
    return bbs_.index_mut(id);
}

auto IrContext::insert_var(IrVar var) -> VarId {
    return vars_.insert(std::move(var));
}

auto IrContext::var(VarId id) const -> const IrVar& {
    return vars_.index(id);
}

} // namespace spark::ir
