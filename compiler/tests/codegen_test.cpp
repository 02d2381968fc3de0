//! # IR Codegen Tests
//!
//! Lowers small modules and checks the LLVM IR text produced for them.

#include "codegen/ir_codegen.hpp"
#include "test_util.hpp"

using namespace spark;
using namespace spark::ir;
using namespace spark::test;
using ast::Op;

class CodegenTest : public ::testing::Test {
protected:
    IrContext ctx;
    IrLowerer lowerer{ctx};
    ast::Module module;
    codegen::IrCodegenOptions options;

    void SetUp() override {
        module.name = "test";
    }

    auto generate() -> std::string {
        auto result = lowerer.lower_module(module);
        if (is_err(result)) {
            for (const auto& d : unwrap_err(result)) {
                ADD_FAILURE() << d.code << ": " << d.message;
            }
            return {};
        }
        codegen::IrCodegen gen(ctx, options);
        return gen.generate(module.name);
    }

    void add_fun(ast::FunDecl decl) {
        module.funs.push_back(std::move(decl));
    }

    void define_number() {
        module.types.push_back(type_def("Number", sum_type(i32_type(), ast::float_type(true))));
    }
};

static auto contains(const std::string& haystack, const std::string& needle) -> bool {
    return haystack.find(needle) != std::string::npos;
}

// ============================================================================
// Module Layout
// ============================================================================

TEST_F(CodegenTest, StraightLineFunction) {
    module.name = "add";
    auto sum = ast::binary(ast::access("a", sp(0, 1)), Op::Add, ast::access("b", sp(4, 5)));
    add_fun(fun_decl("add", i32_type(), stmts(return_stmt(std::move(sum))),
                     param(i32_type(), "a"), param(i32_type(), "b")));

    EXPECT_EQ(generate(), "; ModuleID = 'add'\n"
                          "source_filename = \"add\"\n"
                          "\n"
                          "define i32 @\"add\"(i32 %arg0, i32 %arg1) {\n"
                          "entry:\n"
                          "    %var0 = alloca i32 ; a\n"
                          "    %var1 = alloca i32 ; b\n"
                          "    br label %bb0\n"
                          "\n"
                          "bb0:\n"
                          "    ; live a\n"
                          "    store i32 %arg0, i32* %var0\n"
                          "    ; live b\n"
                          "    store i32 %arg1, i32* %var1\n"
                          "    %t0 = load i32, i32* %var0\n"
                          "    %t1 = load i32, i32* %var1\n"
                          "    %t2 = add i32 %t0, %t1\n"
                          "    ret i32 %t2\n"
                          "}\n"
                          "\n");
}

TEST_F(CodegenTest, TargetTripleAndNoComments) {
    options.target_triple = "x86_64-pc-linux-gnu";
    options.emit_comments = false;
    add_fun(fun_decl("main", ast::unit_type(),
                     stmts(let_stmt("x", std::nullopt, ast::int_lit(1, sp(0, 1))))));

    std::string ir = generate();
    EXPECT_TRUE(contains(ir, "target triple = \"x86_64-pc-linux-gnu\"\n"));
    EXPECT_TRUE(contains(ir, "    %var0 = alloca i32\n"));
    EXPECT_FALSE(contains(ir, "; x"));
    EXPECT_FALSE(contains(ir, "; live"));
}

TEST_F(CodegenTest, ExternFunctionIsDeclared) {
    add_fun(fun_decl("puts", i32_type(), std::nullopt, param(ast::ptr_type(u8_type()), "s")));
    EXPECT_TRUE(contains(generate(), "declare i32 @\"puts\"(i8*)\n"));
}

TEST_F(CodegenTest, InlineHint) {
    auto decl = fun_decl("tiny", ast::unit_type(), stmts());
    decl.proto.flags = ast::FunFlags::Inline;
    add_fun(std::move(decl));
    EXPECT_TRUE(contains(generate(), "define {} @\"tiny\"() inlinehint {\n"));
}

TEST_F(CodegenTest, UnitReturn) {
    add_fun(fun_decl("noop", ast::unit_type(), stmts()));
    EXPECT_TRUE(contains(generate(), "    ret {} zeroinitializer\n"));
}

// ============================================================================
// Types
// ============================================================================

TEST_F(CodegenTest, RecursiveStructIsNamed) {
    module.types.push_back(type_def(
        "Node", struct_type(field(i32_type(), "value"),
                            field(ast::ptr_type(ast::named_type("Node")), "next"))));
    add_fun(fun_decl("first", i32_type(), std::nullopt,
                     param(ast::ptr_type(ast::named_type("Node")), "n")));

    std::string ir = generate();
    EXPECT_TRUE(contains(ir, "%\"Node\" = type { i32, %\"Node\"* }\n"));
    EXPECT_TRUE(contains(ir, "declare i32 @\"first\"(%\"Node\"*)\n"));
}

TEST_F(CodegenTest, SumLayout) {
    define_number();
    (void)generate();

    codegen::IrCodegen gen(ctx);
    TypeId number = *ctx.find_alias("Number");
    EXPECT_EQ(gen.llvm_type(number), "%\"Number\"");
    EXPECT_EQ(gen.llvm_type(ctx.unwrap_alias(number)), "{ i32, [1 x i64] }");
    EXPECT_EQ(gen.type_size(number), 16u);
}

TEST_F(CodegenTest, PrimitiveSpellingsAndSizes) {
    codegen::IrCodegen gen(ctx);
    EXPECT_EQ(gen.llvm_type(IrContext::BOOL), "i1");
    EXPECT_EQ(gen.llvm_type(IrContext::U16), "i16");
    EXPECT_EQ(gen.llvm_type(IrContext::F32), "float");
    EXPECT_EQ(gen.llvm_type(IrContext::UNIT), "{}");

    TypeId arr = ctx.insert_type(IrType{IrArrayType{IrContext::I64, 3}});
    EXPECT_EQ(gen.llvm_type(arr), "[3 x i64]");
    EXPECT_EQ(gen.type_size(arr), 24u);

    TypeId padded = ctx.insert_type(IrType{IrStructType{
        {IrStructField{IrContext::U8, "tag"}, IrStructField{IrContext::I64, "value"}}}});
    EXPECT_EQ(gen.type_size(padded), 16u);
    EXPECT_EQ(gen.type_align(padded), 8u);

    TypeId fn = ctx.insert_type(IrType{IrFunType{{IrFunArg{IrContext::I32, std::nullopt}},
                                                 IrContext::BOOL}});
    EXPECT_EQ(gen.llvm_type(fn), "i1 (i32)*");
}

TEST_F(CodegenTest, InvalidTypeIsInternalError) {
    codegen::IrCodegen gen(ctx);
    EXPECT_THROW((void)gen.llvm_type(IrContext::INVALID), InternalError);
}

// ============================================================================
// Literals and Operators
// ============================================================================

TEST_F(CodegenTest, IntegerLiteralsFitTheirWidth) {
    auto lit = ast::int_lit(255, sp(0, 5), ast::IntegerTypeExpr{false, ast::IntegerWidth::Eight});
    add_fun(fun_decl("max", u8_type(), stmts(return_stmt(std::move(lit)))));
    EXPECT_TRUE(contains(generate(), "    ret i8 -1\n"));
}

TEST_F(CodegenTest, FloatLiteralsAreHexBits) {
    add_fun(fun_decl("half", ast::float_type(true),
                     stmts(return_stmt(ast::float_lit(1.5, sp(0, 3))))));
    add_fun(fun_decl("tenth", ast::float_type(false),
                     stmts(return_stmt(ast::float_lit(0.1, sp(0, 3), false)))));

    std::string ir = generate();
    EXPECT_TRUE(contains(ir, "    ret double 0x3FF8000000000000\n"));
    EXPECT_TRUE(contains(ir, "    ret float 0x3FB99999A0000000\n"));
}

TEST_F(CodegenTest, UnsignedComparisonWidensToOperandType) {
    auto cmp = ast::binary(ast::access("a", sp(0, 1)), Op::Less, ast::access("b", sp(4, 5)));
    add_fun(fun_decl("lt", u8_type(), stmts(return_stmt(std::move(cmp))), param(u8_type(), "a"),
                     param(u8_type(), "b")));

    std::string ir = generate();
    EXPECT_TRUE(contains(ir, "    %t3 = icmp ult i8 %t0, %t1\n"));
    EXPECT_TRUE(contains(ir, "    %t2 = zext i1 %t3 to i8\n"));
}

TEST_F(CodegenTest, SignedShiftUsesOperandsAsIs) {
    auto shr = ast::binary(ast::access("a", sp(0, 1)), Op::ShRight, ast::access("b", sp(4, 5)));
    add_fun(fun_decl("shift", i64_type(), stmts(return_stmt(std::move(shr))),
                     param(i64_type(), "a"), param(i64_type(), "b")));

    std::string ir = generate();
    EXPECT_TRUE(contains(ir, "    %t2 = ashr i64 %t0, %t1\n"));
    EXPECT_FALSE(contains(ir, "sext"));
    EXPECT_FALSE(contains(ir, "zext"));
}

TEST_F(CodegenTest, FloatComparisonYieldsOperandType) {
    auto cmp = ast::binary(ast::access("a", sp(0, 1)), Op::GreaterEq, ast::access("b", sp(4, 5)));
    add_fun(fun_decl("ge", ast::float_type(true), stmts(return_stmt(std::move(cmp))),
                     param(ast::float_type(true), "a"), param(ast::float_type(true), "b")));

    std::string ir = generate();
    EXPECT_TRUE(contains(ir, "    %t3 = fcmp oge double %t0, %t1\n"));
    EXPECT_TRUE(contains(ir, "    %t2 = uitofp i1 %t3 to double\n"));
    EXPECT_FALSE(contains(ir, "fpext"));
}

TEST_F(CodegenTest, PointerOffsetStepsByElement) {
    auto step = ast::binary(ast::access("p", sp(0, 1)), Op::Sub, ast::access("i", sp(4, 5)));
    add_fun(fun_decl("back", ast::ptr_type(i32_type()), stmts(return_stmt(std::move(step))),
                     param(ast::ptr_type(i32_type()), "p"), param(i32_type(), "i")));

    std::string ir = generate();
    EXPECT_TRUE(contains(ir, "sext i32 %t1 to i64\n"));
    EXPECT_TRUE(contains(ir, "= sub i64 0, %t3\n"));
    EXPECT_TRUE(contains(ir, "= getelementptr i32, i32* %t0, i64 %t4\n"));
}

TEST_F(CodegenTest, PointerEqualityComparesAddresses) {
    auto same = ast::binary(ast::access("p", sp(0, 1)), Op::Eq, ast::access("q", sp(5, 6)));
    add_fun(fun_decl("same", ast::bool_type(), stmts(return_stmt(std::move(same))),
                     param(ast::ptr_type(i32_type()), "p"), param(ast::ptr_type(u8_type()), "q")));

    std::string ir = generate();
    EXPECT_TRUE(contains(ir, "%t3 = bitcast i8* %t1 to i32*\n"));
    EXPECT_TRUE(contains(ir, "%t2 = icmp eq i32* %t0, %t3\n"));
    EXPECT_TRUE(contains(ir, "ret i1 %t2\n"));
}

TEST_F(CodegenTest, IntegerConditionTestsNonZero) {
    auto cond = ast::binary(ast::access("n", sp(0, 1)), Op::Greater, ast::int_lit(0, sp(4, 5)));
    auto dec = ast::binary(ast::access("n", sp(10, 11)), Op::Sub, ast::int_lit(1, sp(14, 15)));
    add_fun(fun_decl("countdown", ast::unit_type(),
                     stmts(while_stmt(std::move(cond), stmts(assign_stmt("n", std::move(dec))))),
                     param(i32_type(), "n")));

    std::string ir = generate();
    EXPECT_TRUE(contains(ir, "bb1:\n"
                             "    %t0 = load i32, i32* %var0\n"
                             "    %t2 = icmp sgt i32 %t0, 0\n"
                             "    %t1 = zext i1 %t2 to i32\n"
                             "    %t3 = icmp ne i32 %t1, 0\n"
                             "    br i1 %t3, label %bb2, label %bb3\n"))
        << ir;
}

TEST_F(CodegenTest, FloatConditionTestsNonZero) {
    add_fun(fun_decl("truthy", i32_type(),
                     stmts(if_stmt(ast::access("d", sp(3, 4)),
                                   stmts(return_stmt(ast::int_lit(1, sp(7, 8))))),
                           return_stmt(ast::int_lit(0, sp(10, 11)))),
                     param(ast::float_type(true), "d")));

    std::string ir = generate();
    EXPECT_TRUE(contains(ir, "    %t1 = fcmp une double %t0, 0.0\n"
                             "    br i1 %t1, label %bb1, label %bb2\n"))
        << ir;
}

TEST_F(CodegenTest, BoolConditionBranchesDirectly) {
    add_fun(fun_decl("pick", i32_type(),
                     stmts(if_stmt(ast::access("b", sp(3, 4)),
                                   stmts(return_stmt(ast::int_lit(1, sp(7, 8))))),
                           return_stmt(ast::int_lit(0, sp(10, 11)))),
                     param(ast::bool_type(), "b")));

    std::string ir = generate();
    EXPECT_TRUE(contains(ir, "    br i1 %t0, label %bb1, label %bb2\n")) << ir;
    EXPECT_FALSE(contains(ir, "icmp ne"));
}

TEST_F(CodegenTest, BoolOperators) {
    auto both = ast::binary(ast::access("a", sp(0, 1)), Op::LogicalAnd, ast::access("b", sp(4, 5)));
    add_fun(fun_decl("both", ast::bool_type(), stmts(return_stmt(std::move(both))),
                     param(ast::bool_type(), "a"), param(ast::bool_type(), "b")));
    EXPECT_TRUE(contains(generate(), "= and i1 %t0, %t1\n"));
}

TEST_F(CodegenTest, UnaryOperators) {
    auto neg = ast::unary(Op::Sub, ast::access("d", sp(1, 2)), sp(0, 2));
    add_fun(fun_decl("neg", ast::float_type(true), stmts(return_stmt(std::move(neg))),
                     param(ast::float_type(true), "d")));
    auto flip = ast::unary(Op::NOT, ast::access("x", sp(1, 2)), sp(0, 2));
    add_fun(fun_decl("flip", i32_type(), stmts(return_stmt(std::move(flip))),
                     param(i32_type(), "x")));
    auto addr = ast::unary(Op::AND, ast::access("x", sp(1, 2)), sp(0, 2));
    add_fun(fun_decl("addr", ast::ptr_type(i32_type()), stmts(return_stmt(std::move(addr))),
                     param(i32_type(), "x")));

    std::string ir = generate();
    EXPECT_TRUE(contains(ir, "= fneg double %t0\n"));
    EXPECT_TRUE(contains(ir, "= xor i32 %t0, -1\n"));
    EXPECT_TRUE(contains(ir, "    ret i32* %var2\n"));
}

// ============================================================================
// Casts, Calls, Variants
// ============================================================================

TEST_F(CodegenTest, NumericCasts) {
    auto to_f = ast::cast(ast::access("x", sp(0, 1)), ast::float_type(true), sp(0, 8));
    add_fun(fun_decl("to_f", ast::float_type(true), stmts(return_stmt(std::move(to_f))),
                     param(i32_type(), "x")));
    auto to_u = ast::cast(ast::access("b", sp(0, 1)), u8_type(), sp(0, 8));
    add_fun(fun_decl("to_u", u8_type(), stmts(return_stmt(std::move(to_u))),
                     param(ast::bool_type(), "b")));

    std::string ir = generate();
    EXPECT_TRUE(contains(ir, "= sitofp i32 %t0 to double\n"));
    EXPECT_TRUE(contains(ir, "= zext i1 %t0 to i8\n"));
}

TEST_F(CodegenTest, CallPassesTypedArguments) {
    add_fun(fun_decl("add", i32_type(), std::nullopt, param(i32_type(), "a"),
                     param(i32_type(), "b")));
    auto c = ast::call(ast::access("add", sp(0, 3)),
                       exprs(ast::int_lit(1, sp(4, 5)), ast::int_lit(2, sp(7, 8))), sp(0, 9));
    add_fun(fun_decl("three", i32_type(), stmts(return_stmt(std::move(c)))));

    EXPECT_TRUE(contains(generate(), "    %t0 = call i32 @\"add\"(i32 1, i32 2)\n"));
}

TEST_F(CodegenTest, MakeVariantWritesTagAndPayload) {
    define_number();
    auto wrap = ast::cast(ast::float_lit(2.0, sp(0, 3)), ast::named_type("Number"), sp(0, 13));
    add_fun(fun_decl("wrap", ast::named_type("Number"), stmts(return_stmt(std::move(wrap)))));

    std::string ir = generate();
    EXPECT_TRUE(contains(ir, "    %spill0 = alloca %\"Number\"\n"));
    EXPECT_TRUE(contains(ir, "store i32 1, i32* %t1\n"));
    EXPECT_TRUE(contains(ir, "bitcast [1 x i64]* %t2 to double*\n"));
    EXPECT_TRUE(contains(ir, "load %\"Number\", %\"Number\"* %spill0\n"));
}

TEST_F(CodegenTest, MatchSwitchesOnTag) {
    define_number();
    std::vector<ast::MatchArm> arms;
    arms.push_back(arm(i32_type(), "n", stmts(return_stmt(ast::access("n", sp(0, 1))))));
    arms.push_back(
        arm(ast::float_type(true), std::nullopt, stmts(return_stmt(ast::int_lit(0, sp(2, 3))))));
    ast::Stmt match{Span{}, ast::MatchStmt{ast::access("v", sp(4, 5)), std::move(arms),
                                           std::nullopt}};
    add_fun(fun_decl("classify", i32_type(),
                     stmts(std::move(match), return_stmt(ast::int_lit(1, sp(6, 7)))),
                     param(ast::named_type("Number"), "v")));

    std::string ir = generate();
    EXPECT_TRUE(contains(ir, "extractvalue %\"Number\" %t1, 0\n"));
    EXPECT_TRUE(contains(ir, "switch i32 %t2, label %bb1 [ i32 0, label %bb2 i32 1, label %bb3 ]\n"));
    EXPECT_TRUE(contains(ir, "getelementptr inbounds %\"Number\", %\"Number\"* %var1, i32 0, i32 1\n"));
    EXPECT_TRUE(contains(ir, "bitcast [1 x i64]* %t3 to i32*\n"));
}

TEST_F(CodegenTest, BranchesUseBlockLabels) {
    auto body = stmts(assign_stmt("n", ast::int_lit(0, sp(0, 1))));
    add_fun(fun_decl("loop", ast::unit_type(),
                     stmts(while_stmt(ast::access("go", sp(0, 2)), std::move(body))),
                     param(ast::bool_type(), "go"), param(i32_type(), "n")));

    std::string ir = generate();
    EXPECT_TRUE(contains(ir, "    br label %bb0\n"));
    EXPECT_TRUE(contains(ir, "    br i1 %t0, label %bb2, label %bb3\n"));
    EXPECT_TRUE(contains(ir, "\nbb2:\n"));
}

// ============================================================================
// Internal Errors
// ============================================================================

TEST_F(CodegenTest, OpenBlockIsInternalError) {
    FunId fun = ctx.insert_fun(IrFun{"open", IrFunType{{}, IrContext::UNIT}, 0, Span{},
                                     std::nullopt, ast::FunFlags::None});
    BBId bb = ctx.insert_bb();
    ctx.fun_mut(fun).body = IrBody{bb, fun};

    codegen::IrCodegen gen(ctx);
    EXPECT_THROW((void)gen.generate("broken"), InternalError);
}

TEST_F(CodegenTest, InvalidExpressionIsInternalError) {
    FunId fun = ctx.insert_fun(IrFun{"poisoned", IrFunType{{}, IrContext::UNIT}, 0, Span{},
                                     std::nullopt, ast::FunFlags::None});
    BBId bb = ctx.insert_bb(IrBB{
        {}, IrTerminator{IrReturn{IrExpr{Span{}, IrContext::INVALID, IrUnitLiteral{}}}}});
    ctx.fun_mut(fun).body = IrBody{bb, fun};

    codegen::IrCodegen gen(ctx);
    EXPECT_THROW((void)gen.generate("broken"), InternalError);
}
