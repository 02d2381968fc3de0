//! # IR Codegen Values
//!
//! Every IR expression produces one SSA value. Places (variables, fields of
//! places, dereferenced pointers) can also produce an address, which `&`
//! and sum payload reads use to avoid copying the whole aggregate.
//!
//! Comparison results take the type of the left operand: `1` or `0` as an
//! integer, `1.0` or `0.0` as a float.

#include "codegen/ir_codegen.hpp"

#include <cstdio>
#include <cstring>

namespace spark::codegen {

using ast::Op;
using ir::IrContext;
using ir::IrExpr;
using ir::TypeId;

namespace {

auto int_width(const std::string& llvm_ty) -> uint32_t {
    return static_cast<uint32_t>(std::stoul(llvm_ty.substr(1)));
}

auto float_constant(double value, bool doublewide) -> std::string {
    // LLVM spells float constants as the bits of the equivalent double.
    double widened = doublewide ? value : static_cast<double>(static_cast<float>(value));
    uint64_t bits = 0;
    std::memcpy(&bits, &widened, sizeof(bits));
    char buf[24];
    std::snprintf(buf, sizeof(buf), "0x%016llX", static_cast<unsigned long long>(bits));
    return buf;
}

} // namespace

auto IrCodegen::emit_expr(const IrExpr& expr) -> std::string {
    if (expr.ty == IrContext::INVALID) {
        internal_error("codegen", "expression of type INVALID reached code generation");
    }

    return std::visit(
        [this, &expr](const auto& e) -> std::string {
            using T = std::decay_t<decltype(e)>;

            if constexpr (std::is_same_v<T, ir::IrIntLiteral> ||
                          std::is_same_v<T, ir::IrFloatLiteral> ||
                          std::is_same_v<T, ir::IrBoolLiteral> ||
                          std::is_same_v<T, ir::IrUnitLiteral>) {
                return emit_literal(expr);
            } else if constexpr (std::is_same_v<T, ir::IrVarRef>) {
                std::string slot = var_slot(e.var);
                std::string ty = llvm_type(expr.ty);
                std::string result = new_temp();
                emitln("    " + result + " = load " + ty + ", " + ty + "* " + slot);
                return result;
            } else if constexpr (std::is_same_v<T, ir::IrArgRef>) {
                return "%arg" + std::to_string(e.index);
            } else if constexpr (std::is_same_v<T, ir::IrFunRef>) {
                return fun_symbol(e.fun);
            } else if constexpr (std::is_same_v<T, ir::IrBinary>) {
                return emit_binary(e);
            } else if constexpr (std::is_same_v<T, ir::IrUnary>) {
                return emit_unary(expr, e);
            } else if constexpr (std::is_same_v<T, ir::IrCast>) {
                return emit_cast(expr, e);
            } else if constexpr (std::is_same_v<T, ir::IrMember>) {
                std::string base = emit_expr(*e.base);
                std::string result = new_temp();
                emitln("    " + result + " = extractvalue " + llvm_type(e.base->ty) + " " + base +
                       ", " + std::to_string(e.field));
                return result;
            } else if constexpr (std::is_same_v<T, ir::IrCall>) {
                return emit_call(expr, e);
            } else if constexpr (std::is_same_v<T, ir::IrMakeVariant>) {
                return emit_make_variant(expr, e);
            } else {
                return emit_variant_payload(expr, e);
            }
        },
        expr.kind);
}

auto IrCodegen::emit_literal(const IrExpr& expr) -> std::string {
    if (const auto* i = std::get_if<ir::IrIntLiteral>(&expr.kind)) {
        uint32_t width = int_width(llvm_type(expr.ty));
        uint64_t value = i->value;
        if (width < 64) {
            uint64_t mask = (uint64_t{1} << width) - 1;
            value &= mask;
            // Sign-extend so the constant always fits the type as printed.
            if (value & (uint64_t{1} << (width - 1))) {
                value |= ~mask;
            }
        }
        return std::to_string(static_cast<int64_t>(value));
    }
    if (const auto* f = std::get_if<ir::IrFloatLiteral>(&expr.kind)) {
        const auto& ft = ctx_.type(ctx_.unwrap_alias(expr.ty)).as<ir::IrFloatType>();
        return float_constant(f->value, ft.doublewide);
    }
    if (const auto* b = std::get_if<ir::IrBoolLiteral>(&expr.kind)) {
        return b->value ? "true" : "false";
    }
    return "zeroinitializer";
}

auto IrCodegen::coerce_int(const std::string& value, TypeId from, const std::string& to_llvm)
    -> std::string {
    std::string from_llvm = llvm_type(from);
    uint32_t from_width = int_width(from_llvm);
    uint32_t to_width = int_width(to_llvm);
    if (from_width == to_width) {
        return value;
    }

    std::string inst = "trunc";
    if (from_width < to_width) {
        inst = is_signed(from) ? "sext" : "zext";
    }
    std::string result = new_temp();
    emitln("    " + result + " = " + inst + " " + from_llvm + " " + value + " to " + to_llvm);
    return result;
}

auto IrCodegen::spill(const std::string& value, const std::string& llvm_ty) -> std::string {
    std::string slot = "%spill" + std::to_string(temp_counter_++);
    entry_ << "    " << slot << " = alloca " << llvm_ty << "\n";
    emitln("    store " + llvm_ty + " " + value + ", " + llvm_ty + "* " + slot);
    return slot;
}

auto IrCodegen::emit_address(const IrExpr& expr) -> std::optional<std::string> {
    if (const auto* ref = std::get_if<ir::IrVarRef>(&expr.kind)) {
        return var_slot(ref->var);
    }

    if (const auto* member = std::get_if<ir::IrMember>(&expr.kind)) {
        auto base = emit_address(*member->base);
        if (!base) {
            return std::nullopt;
        }
        std::string base_ty = llvm_type(member->base->ty);
        std::string result = new_temp();
        emitln("    " + result + " = getelementptr inbounds " + base_ty + ", " + base_ty + "* " +
               *base + ", i32 0, i32 " + std::to_string(member->field));
        return result;
    }

    if (const auto* un = std::get_if<ir::IrUnary>(&expr.kind)) {
        if (un->op == Op::Star) {
            return emit_expr(*un->operand);
        }
    }

    return std::nullopt;
}

// ============================================================================
// Operators
// ============================================================================

auto IrCodegen::emit_binary(const ir::IrBinary& bin) -> std::string {
    const ir::IrType& lt = ctx_.type(bin.lhs->ty);
    const ir::IrType& rt = ctx_.type(bin.rhs->ty);
    std::string ty = llvm_type(bin.lhs->ty);
    std::string lhs = emit_expr(*bin.lhs);
    std::string rhs = emit_expr(*bin.rhs);
    std::string result = new_temp();

    if (lt.is<ir::IrBoolType>()) {
        std::string inst;
        switch (bin.op) {
        case Op::LogicalAnd:
            inst = "and";
            break;
        case Op::LogicalOr:
            inst = "or";
            break;
        case Op::LogicalNot:
            inst = "xor";
            break;
        default:
            inst = "icmp eq";
            break;
        }
        emitln("    " + result + " = " + inst + " i1 " + lhs + ", " + rhs);
        return result;
    }

    if (const auto* it = lt.get_if<ir::IrIntegerType>()) {
        bool sign = it->is_signed;

        std::string pred;
        switch (bin.op) {
        case Op::Eq:
            pred = "eq";
            break;
        case Op::Greater:
            pred = sign ? "sgt" : "ugt";
            break;
        case Op::GreaterEq:
            pred = sign ? "sge" : "uge";
            break;
        case Op::Less:
            pred = sign ? "slt" : "ult";
            break;
        case Op::LessEq:
            pred = sign ? "sle" : "ule";
            break;
        default:
            break;
        }
        if (!pred.empty()) {
            std::string cmp = new_temp();
            emitln("    " + cmp + " = icmp " + pred + " " + ty + " " + lhs + ", " + rhs);
            emitln("    " + result + " = zext i1 " + cmp + " to " + ty);
            return result;
        }

        std::string inst;
        switch (bin.op) {
        case Op::Add:
            inst = "add";
            break;
        case Op::Sub:
            inst = "sub";
            break;
        case Op::Star:
            inst = "mul";
            break;
        case Op::Div:
            inst = sign ? "sdiv" : "udiv";
            break;
        case Op::ShLeft:
            inst = "shl";
            break;
        case Op::ShRight:
            inst = sign ? "ashr" : "lshr";
            break;
        default:
            internal_error("codegen", "unsupported integer operator");
        }
        emitln("    " + result + " = " + inst + " " + ty + " " + lhs + ", " + rhs);
        return result;
    }

    if (lt.is<ir::IrFloatType>()) {
        std::string pred;
        switch (bin.op) {
        case Op::Eq:
            pred = "oeq";
            break;
        case Op::Greater:
            pred = "ogt";
            break;
        case Op::GreaterEq:
            pred = "oge";
            break;
        case Op::Less:
            pred = "olt";
            break;
        case Op::LessEq:
            pred = "ole";
            break;
        default:
            break;
        }
        if (!pred.empty()) {
            std::string cmp = new_temp();
            emitln("    " + cmp + " = fcmp " + pred + " " + ty + " " + lhs + ", " + rhs);
            emitln("    " + result + " = uitofp i1 " + cmp + " to " + ty);
            return result;
        }

        std::string inst;
        switch (bin.op) {
        case Op::Add:
            inst = "fadd";
            break;
        case Op::Sub:
            inst = "fsub";
            break;
        case Op::Star:
            inst = "fmul";
            break;
        case Op::Div:
            inst = "fdiv";
            break;
        default:
            internal_error("codegen", "unsupported float operator");
        }
        emitln("    " + result + " = " + inst + " " + ty + " " + lhs + ", " + rhs);
        return result;
    }

    // Pointers. `ptr +/- int` steps by elements, `==` compares addresses, and
    // everything else works on the address as a 64-bit integer.
    const auto& ptr = lt.as<ir::IrPtrType>();
    bool offset = rt.is<ir::IrIntegerType>() && (bin.op == Op::Add || bin.op == Op::Sub);
    if (offset) {
        std::string index = coerce_int(rhs, bin.rhs->ty, "i64");
        if (bin.op == Op::Sub) {
            std::string negated = new_temp();
            emitln("    " + negated + " = sub i64 0, " + index);
            index = negated;
        }
        std::string elem = llvm_type(ptr.pointee);
        emitln("    " + result + " = getelementptr " + elem + ", " + ty + " " + lhs + ", i64 " +
               index);
        return result;
    }

    if (bin.op == Op::Eq) {
        std::string rhs_ty = llvm_type(bin.rhs->ty);
        if (rhs_ty != ty) {
            std::string cast = new_temp();
            emitln("    " + cast + " = bitcast " + rhs_ty + " " + rhs + " to " + ty);
            rhs = cast;
        }
        emitln("    " + result + " = icmp eq " + ty + " " + lhs + ", " + rhs);
        return result;
    }

    std::string lhs_int = new_temp();
    emitln("    " + lhs_int + " = ptrtoint " + ty + " " + lhs + " to i64");
    std::string rhs_int;
    if (rt.is<ir::IrPtrType>()) {
        rhs_int = new_temp();
        emitln("    " + rhs_int + " = ptrtoint " + llvm_type(bin.rhs->ty) + " " + rhs + " to i64");
    } else {
        rhs_int = coerce_int(rhs, bin.rhs->ty, "i64");
    }

    std::string inst;
    switch (bin.op) {
    case Op::Add:
        inst = "add";
        break;
    case Op::Sub:
        inst = "sub";
        break;
    case Op::ShLeft:
        inst = "shl";
        break;
    case Op::ShRight:
        inst = "lshr";
        break;
    default:
        internal_error("codegen", "unsupported pointer operator");
    }
    std::string combined = new_temp();
    emitln("    " + combined + " = " + inst + " i64 " + lhs_int + ", " + rhs_int);
    emitln("    " + result + " = inttoptr i64 " + combined + " to " + ty);
    return result;
}

auto IrCodegen::emit_unary(const IrExpr& expr, const ir::IrUnary& un) -> std::string {
    std::string ty = llvm_type(expr.ty);

    switch (un.op) {
    case Op::Star: {
        std::string ptr = emit_expr(*un.operand);
        std::string result = new_temp();
        emitln("    " + result + " = load " + ty + ", " + llvm_type(un.operand->ty) + " " + ptr);
        return result;
    }
    case Op::AND: {
        if (auto addr = emit_address(*un.operand)) {
            return *addr;
        }
        // Temporaries get a fresh slot holding a copy.
        return spill(emit_expr(*un.operand), llvm_type(un.operand->ty));
    }
    case Op::Sub: {
        std::string value = emit_expr(*un.operand);
        std::string result = new_temp();
        if (ctx_.type(un.operand->ty).is<ir::IrFloatType>()) {
            emitln("    " + result + " = fneg " + ty + " " + value);
        } else {
            emitln("    " + result + " = sub " + ty + " 0, " + value);
        }
        return result;
    }
    case Op::NOT: {
        std::string value = emit_expr(*un.operand);
        std::string result = new_temp();
        if (ctx_.type(un.operand->ty).is<ir::IrPtrType>()) {
            std::string as_int = new_temp();
            std::string flipped = new_temp();
            emitln("    " + as_int + " = ptrtoint " + ty + " " + value + " to i64");
            emitln("    " + flipped + " = xor i64 " + as_int + ", -1");
            emitln("    " + result + " = inttoptr i64 " + flipped + " to " + ty);
        } else {
            emitln("    " + result + " = xor " + ty + " " + value + ", -1");
        }
        return result;
    }
    default:
        internal_error("codegen", "unsupported unary operator");
    }
}

// ============================================================================
// Casts, Calls, Variants
// ============================================================================

auto IrCodegen::emit_cast(const IrExpr& expr, const ir::IrCast& cast) -> std::string {
    std::string value = emit_expr(*cast.expr);
    std::string from_llvm = llvm_type(cast.expr->ty);
    std::string to_llvm = llvm_type(expr.ty);
    if (from_llvm == to_llvm) {
        return value;
    }

    TypeId from = ctx_.unwrap_alias(cast.expr->ty);
    TypeId to = ctx_.unwrap_alias(expr.ty);
    const ir::IrType& f = ctx_.type(from);
    const ir::IrType& t = ctx_.type(to);
    std::string result = new_temp();

    auto convert = [&](const std::string& inst) {
        emitln("    " + result + " = " + inst + " " + from_llvm + " " + value + " to " + to_llvm);
        return result;
    };

    if (from == to) {
        // Same layout spelled once by name and once literally.
        std::string slot = spill(value, from_llvm);
        std::string cast_ptr = new_temp();
        emitln("    " + cast_ptr + " = bitcast " + from_llvm + "* " + slot + " to " + to_llvm +
               "*");
        emitln("    " + result + " = load " + to_llvm + ", " + to_llvm + "* " + cast_ptr);
        return result;
    }

    const auto* fi = f.get_if<ir::IrIntegerType>();
    const auto* ff = f.get_if<ir::IrFloatType>();
    const auto* ti = t.get_if<ir::IrIntegerType>();
    const auto* tf = t.get_if<ir::IrFloatType>();

    if (fi && ti) {
        return coerce_int(value, cast.expr->ty, to_llvm);
    }
    if (fi && tf) {
        return convert(fi->is_signed ? "sitofp" : "uitofp");
    }
    if (ff && ti) {
        return convert(ti->is_signed ? "fptosi" : "fptoui");
    }
    if (ff && tf) {
        return convert(tf->doublewide ? "fpext" : "fptrunc");
    }
    if (f.is<ir::IrBoolType>() && ti) {
        return convert("zext");
    }
    if (f.is<ir::IrPtrType>() && t.is<ir::IrPtrType>()) {
        return convert("bitcast");
    }
    if (f.is<ir::IrPtrType>() && ti) {
        return convert("ptrtoint");
    }
    if (fi && t.is<ir::IrPtrType>()) {
        return convert("inttoptr");
    }

    internal_error("codegen", "no conversion from " + from_llvm + " to " + to_llvm);
}

auto IrCodegen::emit_call(const IrExpr& expr, const ir::IrCall& call) -> std::string {
    std::string callee = emit_expr(*call.callee);

    std::vector<std::string> args;
    args.reserve(call.args.size());
    for (const auto& arg : call.args) {
        args.push_back(llvm_type(arg.ty) + " " + emit_expr(arg));
    }

    std::string result = new_temp();
    std::string line = "    " + result + " = call " + llvm_type(expr.ty) + " " + callee + "(";
    for (size_t i = 0; i < args.size(); ++i) {
        if (i > 0) {
            line += ", ";
        }
        line += args[i];
    }
    line += ")";
    emitln(line);
    return result;
}

auto IrCodegen::sum_payload_ptr(const std::string& sum_addr, TypeId sum_ty, TypeId payload_ty)
    -> std::string {
    std::string sum_llvm = llvm_type(sum_ty);
    const auto& sum = ctx_.type(ctx_.unwrap_alias(sum_ty)).as<ir::IrSumType>();
    std::string words = "[" + std::to_string(sum_payload_words(sum)) + " x i64]";

    std::string field = new_temp();
    emitln("    " + field + " = getelementptr inbounds " + sum_llvm + ", " + sum_llvm + "* " +
           sum_addr + ", i32 0, i32 1");
    std::string payload = new_temp();
    emitln("    " + payload + " = bitcast " + words + "* " + field + " to " +
           llvm_type(payload_ty) + "*");
    return payload;
}

auto IrCodegen::emit_make_variant(const IrExpr& expr, const ir::IrMakeVariant& mv) -> std::string {
    std::string value = emit_expr(*mv.value);
    std::string sum_llvm = llvm_type(expr.ty);

    std::string slot = "%spill" + std::to_string(temp_counter_++);
    entry_ << "    " << slot << " = alloca " << sum_llvm << "\n";

    std::string tag = new_temp();
    emitln("    " + tag + " = getelementptr inbounds " + sum_llvm + ", " + sum_llvm + "* " + slot +
           ", i32 0, i32 0");
    emitln("    store i32 " + std::to_string(mv.disc.raw()) + ", i32* " + tag);

    std::string payload = sum_payload_ptr(slot, expr.ty, mv.value->ty);
    std::string payload_llvm = llvm_type(mv.value->ty);
    emitln("    store " + payload_llvm + " " + value + ", " + payload_llvm + "* " + payload);

    std::string result = new_temp();
    emitln("    " + result + " = load " + sum_llvm + ", " + sum_llvm + "* " + slot);
    return result;
}

auto IrCodegen::emit_variant_payload(const IrExpr& expr, const ir::IrVariantPayload& vp)
    -> std::string {
    std::string addr;
    if (auto place = emit_address(*vp.sum)) {
        addr = *place;
    } else {
        addr = spill(emit_expr(*vp.sum), llvm_type(vp.sum->ty));
    }

    std::string payload = sum_payload_ptr(addr, vp.sum->ty, expr.ty);
    std::string ty = llvm_type(expr.ty);
    std::string result = new_temp();
    emitln("    " + result + " = load " + ty + ", " + ty + "* " + payload);
    return result;
}

} // namespace spark::codegen
