//! # IR Printer Tests
//!
//! Lowers small modules and checks their textual dump.

#include "ir/printer.hpp"
#include "test_util.hpp"

using namespace spark;
using namespace spark::ir;
using namespace spark::test;
using ast::Op;

class IrPrinterTest : public ::testing::Test {
protected:
    IrContext ctx;
    IrLowerer lowerer{ctx};
    ast::Module module;

    auto lower() -> std::vector<FunId> {
        auto result = lowerer.lower_module(module);
        if (is_err(result)) {
            for (const auto& d : unwrap_err(result)) {
                ADD_FAILURE() << d.code << ": " << d.message;
            }
            return {};
        }
        return unwrap(result);
    }
};

TEST_F(IrPrinterTest, StraightLineFunction) {
    auto sum = ast::binary(ast::access("a", sp(0, 1)), Op::Add, ast::access("b", sp(4, 5)));
    module.funs.push_back(fun_decl("add", i32_type(), stmts(return_stmt(std::move(sum))),
                                   param(i32_type(), "a"), param(i32_type(), "b")));

    auto funs = lower();
    ASSERT_EQ(funs.size(), 1u);
    EXPECT_EQ(IrPrinter(ctx).print_fun(funs[0]), "fun add(i32 a, i32 b) -> i32 {\n"
                                                 "bb0:\n"
                                                 "    live %0 a: i32\n"
                                                 "    %0 = arg0\n"
                                                 "    live %1 b: i32\n"
                                                 "    %1 = arg1\n"
                                                 "    return (%0 + %1)\n"
                                                 "}\n");
}

TEST_F(IrPrinterTest, WhileLoop) {
    auto cond = ast::binary(ast::access("n", sp(0, 1)), Op::Greater, ast::int_lit(0, sp(4, 5)));
    auto dec = ast::binary(ast::access("n", sp(10, 11)), Op::Sub, ast::int_lit(1, sp(14, 15)));
    module.funs.push_back(
        fun_decl("countdown", ast::unit_type(),
                 stmts(while_stmt(std::move(cond), stmts(assign_stmt("n", std::move(dec))))),
                 param(i32_type(), "n")));

    auto funs = lower();
    ASSERT_EQ(funs.size(), 1u);
    EXPECT_EQ(IrPrinter(ctx).print_fun(funs[0]), "fun countdown(i32 n) -> () {\n"
                                                 "bb0:\n"
                                                 "    live %0 n: i32\n"
                                                 "    %0 = arg0\n"
                                                 "    jmp bb1\n"
                                                 "bb1:\n"
                                                 "    jmpif (%0 > 0), bb2, bb3\n"
                                                 "bb2:\n"
                                                 "    %0 = (%0 - 1)\n"
                                                 "    jmp bb1\n"
                                                 "bb3:\n"
                                                 "    return ()\n"
                                                 "}\n");
}

TEST_F(IrPrinterTest, MatchOnSumAlias) {
    module.types.push_back(type_def("Number", sum_type(i32_type(), ast::float_type(true))));

    std::vector<ast::MatchArm> arms;
    arms.push_back(arm(i32_type(), "n", stmts(return_stmt(ast::access("n", sp(0, 1))))));
    arms.push_back(
        arm(ast::float_type(true), std::nullopt, stmts(return_stmt(ast::int_lit(0, sp(2, 3))))));
    ast::Stmt match{Span{}, ast::MatchStmt{ast::access("v", sp(4, 5)), std::move(arms),
                                           std::nullopt}};

    module.funs.push_back(fun_decl("classify", i32_type(),
                                   stmts(std::move(match), return_stmt(ast::int_lit(1, sp(6, 7)))),
                                   param(ast::named_type("Number"), "v")));

    auto funs = lower();
    ASSERT_EQ(funs.size(), 1u);
    EXPECT_EQ(IrPrinter(ctx).print_fun(funs[0]),
              "fun classify(Number v) -> i32 {\n"
              "bb0:\n"
              "    live %0 v: Number\n"
              "    %0 = arg0\n"
              "    live %1 match: Number\n"
              "    %1 = %0\n"
              "    match %1 [i32 -> bb2, f64 -> bb3], default bb1\n"
              "bb2:\n"
              "    live %2 n: i32\n"
              "    %2 = payload0(%1)\n"
              "    return %2\n"
              "bb3:\n"
              "    return 0\n"
              "bb1:\n"
              "    return 1\n"
              "}\n");
}

TEST_F(IrPrinterTest, ContextListsExternsOnOneLine) {
    module.types.push_back(
        type_def("Pair", struct_type(field(i32_type(), "a"), field(i32_type(), "b"))));
    module.funs.push_back(fun_decl("add", i32_type(), std::nullopt, param(i32_type(), "a"),
                                   param(i32_type(), "b")));

    auto second = ast::member(ast::unary(Op::Star, ast::access("p", sp(0, 1)), sp(0, 1)), "b",
                              sp(0, 4));
    auto neg = ast::unary(Op::Sub, ast::int_lit(1, sp(6, 7)), sp(5, 7));
    auto c = ast::call(ast::access("add", sp(8, 11)), exprs(std::move(second), std::move(neg)),
                       sp(8, 20));
    auto widened = ast::cast(std::move(c), i64_type(), sp(8, 27));
    module.funs.push_back(fun_decl("misc", i64_type(), stmts(return_stmt(std::move(widened))),
                                   param(ast::ptr_type(ast::named_type("Pair")), "p")));

    ASSERT_EQ(lower().size(), 2u);
    EXPECT_EQ(IrPrinter(ctx).print_context(), "extern fun add(i32 a, i32 b) -> i32\n"
                                              "\n"
                                              "fun misc(*Pair p) -> i64 {\n"
                                              "bb0:\n"
                                              "    live %0 p: *Pair\n"
                                              "    %0 = arg0\n"
                                              "    return (@add((*%0).1, (-1)) as i64)\n"
                                              "}\n"
                                              "\n");
}

TEST_F(IrPrinterTest, OpenBlockIsMarked) {
    FunId fun = ctx.insert_fun(IrFun{"open", IrFunType{{}, IrContext::UNIT}, 0, Span{},
                                     std::nullopt, ast::FunFlags::None});
    BBId bb = ctx.insert_bb();
    ctx.fun_mut(fun).body = IrBody{bb, fun};

    EXPECT_EQ(IrPrinter(ctx).print_block(bb), "bb0:\n    ; no terminator\n");
}
