//! # IR Verifier Tests

#include "ir/verify.hpp"

#include <gtest/gtest.h>

using namespace spark;
using namespace spark::ir;

class IrVerifyTest : public ::testing::Test {
protected:
    IrContext ctx;
    FunId fun = FunId::from_raw(0);
    BBId entry = BBId::from_raw(0);

    void SetUp() override {
        IrFunType sig{{IrFunArg{IrContext::I32, "a"}}, IrContext::UNIT};
        fun = ctx.insert_fun(IrFun{"f", sig, 0, Span{0, 10}, std::nullopt, ast::FunFlags::None});
        entry = ctx.insert_bb();
        ctx.fun_mut(fun).body = IrBody{entry, fun};
    }

    static auto unit() -> IrExpr {
        return IrExpr{Span{}, IrContext::UNIT, IrUnitLiteral{}};
    }

    static auto ret() -> IrTerminator {
        return IrTerminator{IrReturn{unit()}};
    }

    void close(BBId bb, IrTerminator term) {
        ctx.bb_mut(bb).terminator = std::move(term);
    }
};

TEST_F(IrVerifyTest, WellFormedFunctionPasses) {
    VarId v = ctx.insert_var(IrVar{IrContext::I32, "a"});
    ctx.bb_mut(entry).stmts.push_back(IrStmt{IrVarLive{v}});
    ctx.bb_mut(entry).stmts.push_back(
        IrStmt{IrStore{v, IrExpr{Span{}, IrContext::I32, IrArgRef{0}}}});
    close(entry, ret());

    EXPECT_NO_THROW(verify_fun(ctx, fun));
}

TEST_F(IrVerifyTest, ReachableBlockWithoutTerminator) {
    EXPECT_THROW(verify_fun(ctx, fun), InternalError);
}

TEST_F(IrVerifyTest, UnreachableOpenBlockIsIgnored) {
    close(entry, ret());
    (void)ctx.insert_bb();
    EXPECT_NO_THROW(verify_fun(ctx, fun));
}

TEST_F(IrVerifyTest, JumpToUnknownBlock) {
    close(entry, IrTerminator{IrJmp{BBId::from_raw(42)}});
    EXPECT_THROW(verify_fun(ctx, fun), InternalError);
}

TEST_F(IrVerifyTest, UnknownVariable) {
    ctx.bb_mut(entry).stmts.push_back(IrStmt{IrVarLive{VarId::from_raw(9)}});
    close(entry, ret());
    EXPECT_THROW(verify_fun(ctx, fun), InternalError);
}

TEST_F(IrVerifyTest, ArgumentIndexOutOfRange) {
    close(entry, IrTerminator{IrReturn{IrExpr{Span{}, IrContext::I32, IrArgRef{1}}}});
    EXPECT_THROW(verify_fun(ctx, fun), InternalError);
}

TEST_F(IrVerifyTest, UnknownTypeInsideExpression) {
    auto bad = IrExpr{Span{}, TypeId::from_raw(500), IrIntLiteral{1}};
    close(entry, IrTerminator{IrReturn{std::move(bad)}});
    EXPECT_THROW(verify_fun(ctx, fun), InternalError);
}

TEST_F(IrVerifyTest, MatchOnMissingVariant) {
    TypeId sum = ctx.insert_type(IrType{IrSumType{{IrContext::I32}}});
    VarId v = ctx.insert_var(IrVar{sum, "s"});
    BBId arm = ctx.insert_bb();
    close(arm, ret());

    std::vector<std::pair<DiscriminantId, BBId>> targets{{DiscriminantId::from_raw(3), arm}};
    close(entry, IrTerminator{IrJmpMatch{IrExpr{Span{}, sum, IrVarRef{v}}, targets, arm}});
    EXPECT_THROW(verify_fun(ctx, fun), InternalError);
}

TEST_F(IrVerifyTest, BodyMustPointBackToItsFunction) {
    close(entry, ret());
    ctx.fun_mut(fun).body->parent = FunId::from_raw(7);
    EXPECT_THROW(verify_fun(ctx, fun), InternalError);
}

TEST_F(IrVerifyTest, ReachableBlocksAreBreadthFirst) {
    BBId then_bb = ctx.insert_bb();
    BBId else_bb = ctx.insert_bb();
    BBId join = ctx.insert_bb();
    (void)ctx.insert_bb(); // never jumped to

    close(entry, IrTerminator{IrJmpIf{IrExpr{Span{}, IrContext::BOOL, IrBoolLiteral{true}},
                                      then_bb, else_bb}});
    close(then_bb, IrTerminator{IrJmp{join}});
    close(else_bb, IrTerminator{IrJmp{join}});
    close(join, ret());

    std::vector<BBId> expected{entry, then_bb, else_bb, join};
    EXPECT_EQ(reachable_blocks(ctx, fun), expected);
    EXPECT_NO_THROW(verify_fun(ctx, fun));
}

TEST_F(IrVerifyTest, LoopsAreVisitedOnce) {
    BBId head = ctx.insert_bb();
    close(entry, IrTerminator{IrJmp{head}});
    close(head, IrTerminator{IrJmp{head}});

    EXPECT_EQ(reachable_blocks(ctx, fun).size(), 2u);
}

TEST_F(IrVerifyTest, DeclaredFunctionHasNoBlocks) {
    FunId ext = ctx.insert_fun(IrFun{"ext", IrFunType{{}, IrContext::I32}, 0, Span{},
                                     std::nullopt, ast::FunFlags::Extern});
    EXPECT_TRUE(reachable_blocks(ctx, ext).empty());
    EXPECT_NO_THROW(verify_fun(ctx, ext));
}
