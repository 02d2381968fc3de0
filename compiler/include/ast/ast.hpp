//! # Abstract Syntax Tree
//!
//! The parser's output, as consumed by the IR lowerer. Every node carries the
//! byte-offset span it was parsed from; type annotations are kept unresolved
//! (`ast::Type`) until the lowerer interns them.
//!
//! ## Node Families
//!
//! | Family | Root    | Variants                                                  |
//! |--------|---------|-----------------------------------------------------------|
//! | Types  | `Type`  | integer, float, bool, unit, pointer, array, struct, sum,  |
//! |        |         | function, named                                           |
//! | Exprs  | `Expr`  | literals, access, binary, unary, cast, member, call       |
//! | Stmts  | `Stmt`  | let, assign, return, if, while, match, block, expression  |
//! | Decls  | `Module`| type definitions, function declarations/definitions       |
//!
//! Nodes own their children through `Box<T>`; the tree is move-only.

#pragma once

#include "common.hpp"

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace spark::ast {

// ============================================================================
// Operators and Flags
// ============================================================================

/// Bit width of an integer type.
enum class IntegerWidth : uint8_t {
    Eight,
    Sixteen,
    ThirtyTwo,
    SixtyFour,
};

[[nodiscard]] auto integer_width_bits(IntegerWidth width) -> uint32_t;

/// Operator tokens, as tagged by the parser.
enum class Op : uint8_t {
    Add,        // +
    Sub,        // -
    Star,       // *
    Div,        // /
    Mod,        // %
    Eq,         // ==
    Greater,    // >
    GreaterEq,  // >=
    Less,       // <
    LessEq,     // <=
    ShLeft,     // <<
    ShRight,    // >>
    LogicalAnd, // &&
    LogicalOr,  // ||
    LogicalNot, // !
    AND,        // &
    OR,         // |
    XOR,        // ^
    NOT,        // ~
    Assign,     // =
};

/// Source spelling of an operator.
[[nodiscard]] auto op_to_string(Op op) -> std::string_view;

auto operator<<(std::ostream& os, Op op) -> std::ostream&;

/// Extra properties of a function declaration.
enum class FunFlags : uint8_t {
    None = 0,
    Extern = 1 << 0, ///< Defined outside this compilation unit
    Inline = 1 << 1, ///< Hint for the backend
};

[[nodiscard]] constexpr auto operator|(FunFlags a, FunFlags b) -> FunFlags {
    return static_cast<FunFlags>(static_cast<uint8_t>(a) | static_cast<uint8_t>(b));
}

[[nodiscard]] constexpr auto has_flag(FunFlags flags, FunFlags flag) -> bool {
    return (static_cast<uint8_t>(flags) & static_cast<uint8_t>(flag)) != 0;
}

// ============================================================================
// Types
// ============================================================================

struct Type;

struct IntegerTypeExpr {
    bool is_signed;
    IntegerWidth width;
};

struct FloatTypeExpr {
    bool doublewide;
};

struct BoolTypeExpr {};
struct UnitTypeExpr {};

struct PointerTypeExpr {
    Box<Type> pointee;
};

struct ArrayTypeExpr {
    Box<Type> element;
    uint64_t len;
};

struct StructFieldExpr {
    Box<Type> ty;
    std::string name;
};

struct StructTypeExpr {
    std::vector<StructFieldExpr> fields;
};

struct SumTypeExpr {
    std::vector<Box<Type>> variants;
};

struct FunTypeArgExpr {
    Box<Type> ty;
    std::optional<std::string> name;
};

struct FunTypeExpr {
    std::vector<FunTypeArgExpr> args;
    Box<Type> return_ty;
};

/// A reference to a user-defined type by name.
struct NamedTypeExpr {
    std::string name;
};

/// An unresolved type annotation.
struct Type {
    Span span;
    std::variant<IntegerTypeExpr, FloatTypeExpr, BoolTypeExpr, UnitTypeExpr, PointerTypeExpr,
                 ArrayTypeExpr, StructTypeExpr, SumTypeExpr, FunTypeExpr, NamedTypeExpr>
        kind;
};

/// Deep copy of a type annotation.
[[nodiscard]] auto clone(const Type& ty) -> Type;

// ============================================================================
// Expressions
// ============================================================================

struct Expr;

struct IntLiteral {
    uint64_t value;
    std::optional<IntegerTypeExpr> suffix; ///< `10u8`; no suffix means i32
};

struct FloatLiteral {
    double value;
    bool doublewide = true; ///< false for an `f32` suffix
};

struct BoolLiteral {
    bool value;
};

struct UnitLiteral {};

/// A variable or function referenced by name.
struct AccessExpr {
    std::string name;
};

struct BinaryExpr {
    Box<Expr> lhs;
    Op op;
    Box<Expr> rhs;
};

struct UnaryExpr {
    Op op;
    Box<Expr> operand;
};

/// `expr as T`
struct CastExpr {
    Box<Expr> expr;
    Type target;
};

/// `base.field`
struct MemberExpr {
    Box<Expr> base;
    std::string field;
};

struct CallExpr {
    Box<Expr> callee;
    std::vector<Expr> args;
};

struct Expr {
    Span span;
    std::variant<IntLiteral, FloatLiteral, BoolLiteral, UnitLiteral, AccessExpr, BinaryExpr,
                 UnaryExpr, CastExpr, MemberExpr, CallExpr>
        kind;
};

// ============================================================================
// Statements
// ============================================================================

struct Stmt;

/// `let name [: ty] [= init]`
struct LetStmt {
    std::string name;
    std::optional<Type> ty;
    std::optional<Expr> init;
};

/// `name = value`
struct AssignStmt {
    std::string name;
    Span name_span;
    Expr value;
};

struct ReturnStmt {
    std::optional<Expr> value;
};

struct IfStmt {
    Expr condition;
    std::vector<Stmt> then_body;
    std::optional<std::vector<Stmt>> else_body;
};

struct WhileStmt {
    Expr condition;
    std::vector<Stmt> body;
};

/// `T [binding] => { body }`
struct MatchArm {
    Type variant;
    std::optional<std::string> binding;
    std::vector<Stmt> body;
    Span span;
};

/// `match value { arms..., _ => { default_body } }`
struct MatchStmt {
    Expr value;
    std::vector<MatchArm> arms;
    std::optional<std::vector<Stmt>> default_body;
};

struct BlockStmt {
    std::vector<Stmt> body;
};

struct ExprStmt {
    Expr expr;
};

struct Stmt {
    Span span;
    std::variant<LetStmt, AssignStmt, ReturnStmt, IfStmt, WhileStmt, MatchStmt, BlockStmt,
                 ExprStmt>
        kind;
};

// ============================================================================
// Declarations
// ============================================================================

struct FunParam {
    Type ty;
    std::optional<std::string> name;
};

struct FunProto {
    std::string name;
    std::vector<FunParam> args;
    Type return_ty;
    FunFlags flags = FunFlags::None;
};

/// A function declaration; `body` is empty for declarations without a
/// definition (extern functions).
struct FunDecl {
    FunProto proto;
    std::optional<std::vector<Stmt>> body;
    Span span;
};

/// `type name = ty`
struct TypeDef {
    std::string name;
    Type ty;
    Span span;
};

/// One parsed source file.
struct Module {
    std::string name;
    FileId file = 0;
    std::vector<TypeDef> types;
    std::vector<FunDecl> funs;
};

// ============================================================================
// Construction Helpers
// ============================================================================

[[nodiscard]] auto int_type(bool is_signed, IntegerWidth width, Span span = {}) -> Type;
[[nodiscard]] auto float_type(bool doublewide, Span span = {}) -> Type;
[[nodiscard]] auto bool_type(Span span = {}) -> Type;
[[nodiscard]] auto unit_type(Span span = {}) -> Type;
[[nodiscard]] auto ptr_type(Type pointee, Span span = {}) -> Type;
[[nodiscard]] auto array_type(Type element, uint64_t len, Span span = {}) -> Type;
[[nodiscard]] auto named_type(std::string name, Span span = {}) -> Type;

[[nodiscard]] auto int_lit(uint64_t value, Span span,
                           std::optional<IntegerTypeExpr> suffix = std::nullopt) -> Expr;
[[nodiscard]] auto float_lit(double value, Span span, bool doublewide = true) -> Expr;
[[nodiscard]] auto bool_lit(bool value, Span span) -> Expr;
[[nodiscard]] auto access(std::string name, Span span) -> Expr;
/// Binary expression spanning from the start of `lhs` to the end of `rhs`.
[[nodiscard]] auto binary(Expr lhs, Op op, Expr rhs) -> Expr;
[[nodiscard]] auto unary(Op op, Expr operand, Span span) -> Expr;
[[nodiscard]] auto cast(Expr expr, Type target, Span span) -> Expr;
[[nodiscard]] auto member(Expr base, std::string field, Span span) -> Expr;
[[nodiscard]] auto call(Expr callee, std::vector<Expr> args, Span span) -> Expr;

} // namespace spark::ast
