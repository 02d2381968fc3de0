//! # Operator Typing Tests
//!
//! Binary and unary operator acceptance, result types, spans, and the
//! diagnostics produced for rejected operand types.

#include "test_util.hpp"

using namespace spark;
using namespace spark::ir;
using namespace spark::test;
using ast::Op;

class LowerOpTest : public LowerFixture {
protected:
    void SetUp() override {
        LowerFixture::SetUp();
        local("i", IrContext::I32);
        local("k", IrContext::I32);
        local("j", IrContext::I64);
        local("b", IrContext::U8);
        local("c", IrContext::U8);
        local("t", IrContext::BOOL);
        local("u", IrContext::BOOL);
        local("f", IrContext::F32);
        local("g", IrContext::F32);
        local("d", IrContext::F64);
        local("p", ptr(IrContext::I32));
        local("q", ptr(IrContext::I32));
        local("bad", IrContext::INVALID);
        local("unit", IrContext::UNIT);

        TypeId pair = ctx.insert_type(IrType{IrStructType{
            {IrStructField{IrContext::I32, "x"}, IrStructField{IrContext::I32, "y"}}}});
        local("s", pair);
        local("r", pair);
    }

    /// Result type of `lhs op rhs`, or INVALID with the diagnostic kept.
    auto bin(const std::string& lhs, Op op, const std::string& rhs) -> std::optional<TypeId> {
        auto result = lower(ast::binary(ast::access(lhs, sp(0, 1)), op,
                                        ast::access(rhs, sp(4, 5))));
        if (is_err(result)) {
            last_error = std::move(unwrap_err(result));
            return std::nullopt;
        }
        return unwrap(result).ty;
    }

    auto un(Op op, const std::string& operand) -> std::optional<TypeId> {
        auto result = lower(ast::unary(op, ast::access(operand, sp(1, 2)), sp(0, 2)));
        if (is_err(result)) {
            last_error = std::move(unwrap_err(result));
            return std::nullopt;
        }
        return unwrap(result).ty;
    }

    std::optional<diag::Diagnostic> last_error;
};

// ============================================================================
// Binary Operators
// ============================================================================

TEST_F(LowerOpTest, BoolOperators) {
    EXPECT_EQ(bin("t", Op::LogicalAnd, "u"), IrContext::BOOL);
    EXPECT_EQ(bin("t", Op::LogicalOr, "u"), IrContext::BOOL);
    EXPECT_EQ(bin("t", Op::LogicalNot, "u"), IrContext::BOOL);
    EXPECT_EQ(bin("t", Op::Eq, "u"), IrContext::BOOL);

    EXPECT_FALSE(bin("t", Op::Add, "u"));
    EXPECT_FALSE(bin("t", Op::Less, "u"));
    EXPECT_FALSE(bin("t", Op::LogicalAnd, "i"));
}

TEST_F(LowerOpTest, IntegerOperatorsTakeLhsType) {
    for (Op op : {Op::Eq, Op::Greater, Op::GreaterEq, Op::Less, Op::LessEq, Op::Star, Op::Div,
                  Op::Add, Op::Sub, Op::ShLeft, Op::ShRight}) {
        EXPECT_EQ(bin("i", op, "k"), IrContext::I32) << "op " << op;
        EXPECT_EQ(bin("b", op, "c"), IrContext::U8) << "op " << op;
    }
}

TEST_F(LowerOpTest, IntegerOperandsMustAgree) {
    for (Op op : {Op::Eq, Op::Less, Op::Add, Op::Star, Op::ShLeft, Op::ShRight}) {
        EXPECT_FALSE(bin("i", op, "j")) << "op " << op;
        EXPECT_FALSE(bin("j", op, "i")) << "op " << op;
        EXPECT_FALSE(bin("b", op, "j")) << "op " << op;
    }

    // Same width, different signedness.
    local("w", IrContext::U32);
    EXPECT_FALSE(bin("i", Op::Add, "w"));

    ASSERT_TRUE(last_error);
    EXPECT_EQ(last_error->code, diag::ErrorCodes::TYPE_MISMATCH);
    EXPECT_EQ(last_error->message, "Cannot apply binary operator + to operand types i32 and u32");
}

TEST_F(LowerOpTest, IntegerOperatorsOutsideTheTable) {
    for (Op op : {Op::Mod, Op::AND, Op::OR, Op::XOR, Op::LogicalAnd, Op::LogicalOr,
                  Op::LogicalNot, Op::Assign, Op::NOT}) {
        EXPECT_FALSE(bin("i", op, "i")) << "op " << op;
    }
}

TEST_F(LowerOpTest, FloatOperators) {
    EXPECT_EQ(bin("f", Op::Star, "g"), IrContext::F32);
    EXPECT_EQ(bin("g", Op::Less, "f"), IrContext::F32);
    EXPECT_EQ(bin("d", Op::Sub, "d"), IrContext::F64);

    EXPECT_FALSE(bin("d", Op::ShLeft, "d"));
    EXPECT_FALSE(bin("d", Op::Mod, "d"));
}

TEST_F(LowerOpTest, FloatOperandsMustAgree) {
    EXPECT_FALSE(bin("f", Op::Add, "d"));
    EXPECT_FALSE(bin("d", Op::Star, "f"));
    EXPECT_FALSE(bin("d", Op::Eq, "g"));
}

TEST_F(LowerOpTest, MixedIntegerAndFloatRejected) {
    EXPECT_FALSE(bin("i", Op::Add, "f"));
    EXPECT_FALSE(bin("d", Op::Add, "j"));
}

TEST_F(LowerOpTest, PointerArithmetic) {
    TypeId p_ty = ptr(IrContext::I32);
    EXPECT_EQ(bin("p", Op::Add, "i"), p_ty);
    EXPECT_EQ(bin("p", Op::Sub, "b"), p_ty);
    EXPECT_EQ(bin("p", Op::Sub, "q"), p_ty);
    EXPECT_EQ(bin("p", Op::Add, "q"), p_ty);
    EXPECT_EQ(bin("p", Op::ShLeft, "b"), p_ty);
    EXPECT_EQ(bin("p", Op::ShRight, "j"), p_ty);

    EXPECT_FALSE(bin("p", Op::ShLeft, "q"));
    EXPECT_FALSE(bin("p", Op::Star, "i"));
    EXPECT_FALSE(bin("p", Op::Eq, "i"));
    EXPECT_FALSE(bin("p", Op::Greater, "q"));
    EXPECT_FALSE(bin("i", Op::Add, "p"));
    EXPECT_FALSE(bin("p", Op::Add, "f"));
}

TEST_F(LowerOpTest, PointerEqualityYieldsBool) {
    EXPECT_EQ(bin("p", Op::Eq, "q"), IrContext::BOOL);
    EXPECT_EQ(bin("p", Op::Eq, "p"), IrContext::BOOL);
}

TEST_F(LowerOpTest, AliasesAreNotLookedThrough) {
    TypeId meters = ctx.declare_alias("Meters");
    ctx.define_alias(meters, IrContext::I32);
    local("m", meters);

    EXPECT_FALSE(bin("m", Op::Add, "i"));
    EXPECT_FALSE(bin("i", Op::Add, "m"));
}

TEST_F(LowerOpTest, InvalidOperandsStaySilent) {
    EXPECT_EQ(bin("bad", Op::Add, "i"), IrContext::INVALID);
    EXPECT_EQ(bin("t", Op::Star, "bad"), IrContext::INVALID);
    EXPECT_EQ(lowerer.diagnostics().size(), 0u);
}

TEST_F(LowerOpTest, UnitOperandsRejected) {
    EXPECT_FALSE(bin("unit", Op::Eq, "unit"));
}

TEST_F(LowerOpTest, StructOperandsRejected) {
    EXPECT_FALSE(bin("s", Op::Add, "r"));
    EXPECT_FALSE(bin("s", Op::Eq, "s"));
    EXPECT_FALSE(bin("s", Op::Add, "i"));
    EXPECT_FALSE(bin("i", Op::Add, "s"));
    EXPECT_FALSE(bin("p", Op::Add, "s"));
    EXPECT_FALSE(bin("t", Op::LogicalAnd, "s"));

    ASSERT_TRUE(last_error);
    EXPECT_EQ(last_error->message,
              "Cannot apply binary operator && to operand types bool and {i32 x,i32 y,}");
}

TEST_F(LowerOpTest, BinarySpanCoversBothOperands) {
    auto result = lower(ast::binary(ast::access("i", sp(10, 11)), Op::Add,
                                    ast::access("k", sp(14, 15))));
    ASSERT_TRUE(is_ok(result));
    const IrExpr& expr = unwrap(result);
    EXPECT_EQ(expr.span, sp(10, 15));

    const auto& node = std::get<IrBinary>(expr.kind);
    EXPECT_EQ(node.op, Op::Add);
    EXPECT_EQ(node.lhs->span, sp(10, 11));
    EXPECT_EQ(node.rhs->span, sp(14, 15));
    EXPECT_EQ(node.lhs->ty, IrContext::I32);
    EXPECT_EQ(node.rhs->ty, IrContext::I32);
}

TEST_F(LowerOpTest, BinaryDiagnosticIsComplete) {
    auto result = lower(ast::binary(ast::access("t", sp(10, 11)), Op::Add,
                                    ast::access("d", sp(14, 15))));
    ASSERT_TRUE(is_err(result));
    const diag::Diagnostic& d = unwrap_err(result);

    EXPECT_TRUE(d.is_error());
    EXPECT_EQ(d.code, diag::ErrorCodes::TYPE_MISMATCH);
    EXPECT_EQ(d.message, "Cannot apply binary operator + to operand types bool and f64");
    ASSERT_EQ(d.labels.size(), 3u);

    EXPECT_TRUE(d.labels[0].is_primary());
    EXPECT_EQ(d.labels[0].span, sp(10, 15));
    EXPECT_EQ(d.labels[0].file, file);

    EXPECT_FALSE(d.labels[1].is_primary());
    EXPECT_EQ(d.labels[1].span, sp(10, 11));
    EXPECT_EQ(d.labels[1].message, "LHS of type bool appears here");

    EXPECT_FALSE(d.labels[2].is_primary());
    EXPECT_EQ(d.labels[2].span, sp(14, 15));
    EXPECT_EQ(d.labels[2].message, "RHS of type f64 appears here");
}

TEST_F(LowerOpTest, OperandErrorsPropagate) {
    auto result = lower(ast::binary(ast::access("missing", sp(0, 7)), Op::Add,
                                    ast::access("i", sp(10, 11))));
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).code, diag::ErrorCodes::UNDECLARED_IDENT);
}

TEST_F(LowerOpTest, LoweringAnExpressionAddsNoStatements) {
    (void)bin("i", Op::Add, "i");
    (void)bin("t", Op::Add, "t");
    EXPECT_TRUE(ctx.bb(entry).stmts.empty());
    EXPECT_FALSE(ctx.bb(entry).terminator.has_value());
}

// ============================================================================
// Unary Operators
// ============================================================================

TEST_F(LowerOpTest, DereferenceYieldsPointee) {
    EXPECT_EQ(un(Op::Star, "p"), IrContext::I32);
    EXPECT_FALSE(un(Op::Star, "i"));
}

TEST_F(LowerOpTest, AddressOfReusesInternedPointer) {
    TypeId existing = ptr(IrContext::F64);
    size_t types_before = ctx.num_types();

    EXPECT_EQ(un(Op::AND, "d"), existing);
    EXPECT_EQ(ctx.num_types(), types_before);

    // Any operand type is accepted, including pointers.
    EXPECT_EQ(un(Op::AND, "p"), ptr(ptr(IrContext::I32)));
    EXPECT_EQ(un(Op::AND, "unit"), ptr(IrContext::UNIT));
}

TEST_F(LowerOpTest, NegationOnNumbersOnly) {
    EXPECT_EQ(un(Op::Sub, "i"), IrContext::I32);
    EXPECT_EQ(un(Op::Sub, "f"), IrContext::F32);
    EXPECT_FALSE(un(Op::Sub, "t"));
    EXPECT_FALSE(un(Op::Sub, "p"));
}

TEST_F(LowerOpTest, BitwiseNotOnIntegersAndPointers) {
    EXPECT_EQ(un(Op::NOT, "b"), IrContext::U8);
    EXPECT_EQ(un(Op::NOT, "p"), ptr(IrContext::I32));
    EXPECT_FALSE(un(Op::NOT, "d"));
    EXPECT_FALSE(un(Op::NOT, "t"));
}

TEST_F(LowerOpTest, OtherUnaryOperatorsRejected) {
    EXPECT_FALSE(un(Op::LogicalNot, "t"));
    EXPECT_FALSE(un(Op::Add, "i"));
}

TEST_F(LowerOpTest, UnarySpanIsOperandSpan) {
    auto result = lower(ast::unary(Op::Sub, ast::access("i", sp(21, 22)), sp(20, 22)));
    ASSERT_TRUE(is_ok(result));
    EXPECT_EQ(unwrap(result).span, sp(21, 22));
}

TEST_F(LowerOpTest, UnaryDiagnosticIsComplete) {
    auto result = lower(ast::unary(Op::Sub, ast::access("t", sp(31, 32)), sp(30, 32)));
    ASSERT_TRUE(is_err(result));
    const diag::Diagnostic& d = unwrap_err(result);

    EXPECT_EQ(d.code, diag::ErrorCodes::TYPE_MISMATCH);
    EXPECT_EQ(d.message, "Cannot apply unary operator - to expression of type bool");
    ASSERT_EQ(d.labels.size(), 1u);
    EXPECT_TRUE(d.labels[0].is_primary());
    EXPECT_EQ(d.labels[0].span, sp(31, 32));
}

TEST_F(LowerOpTest, UnaryOnInvalidStaysSilent) {
    EXPECT_EQ(un(Op::Star, "bad"), IrContext::INVALID);
    EXPECT_EQ(un(Op::AND, "bad"), IrContext::INVALID);
}
