//! # Closure Capture Analysis Unit Tests

#include "borrowck/borrow/borrows.hpp"
#include "borrowck/borrow/closure.hpp"
#include "test_util.hpp"

using namespace borrowck;
using namespace borrowck::test;
using borrowck::borrow::CallableKind;
using borrowck::borrow::CaptureMode;

// ============================================================================
// 1 — Callable Kind Ordering
// ============================================================================

TEST(CallableKindTest, SatisfiesTable) {
    using borrow::satisfies;
    EXPECT_TRUE(satisfies(CallableKind::ReadOnly, CallableKind::ReadOnly));
    EXPECT_TRUE(satisfies(CallableKind::ReadOnly, CallableKind::Mutable));
    EXPECT_TRUE(satisfies(CallableKind::ReadOnly, CallableKind::OneShot));

    EXPECT_FALSE(satisfies(CallableKind::Mutable, CallableKind::ReadOnly));
    EXPECT_TRUE(satisfies(CallableKind::Mutable, CallableKind::Mutable));
    EXPECT_TRUE(satisfies(CallableKind::Mutable, CallableKind::OneShot));

    EXPECT_FALSE(satisfies(CallableKind::OneShot, CallableKind::ReadOnly));
    EXPECT_FALSE(satisfies(CallableKind::OneShot, CallableKind::Mutable));
    EXPECT_TRUE(satisfies(CallableKind::OneShot, CallableKind::OneShot));
}

TEST(CallableKindTest, Names) {
    EXPECT_STREQ(borrow::callable_kind_name(CallableKind::ReadOnly), "read-only");
    EXPECT_STREQ(borrow::callable_kind_name(CallableKind::OneShot), "one-shot");
    EXPECT_STREQ(borrow::capture_mode_name(CaptureMode::Move), "move");
    EXPECT_STREQ(borrow::capture_mode_name(CaptureMode::Immutable), "immutable");
}

// ============================================================================
// 2 — Capture Inference
// ============================================================================

class ClosureTest : public ModuleTest {
protected:
    void SetUp() override {
        ModuleTest::SetUp();
        env = borrow::ModuleEnv::from_module(module);
        env.install_globals(scopes);
        (void)scopes.enter_scope(borrow::ScopeKind::Function);
        a = scopes.declare_binding("a", true, buffer_type(), at(1));
        b = scopes.declare_binding("b", true, buffer_type(), at(2));
        n = scopes.declare_binding("n", true, types::make_i32(), at(3));
    }

    auto analyze(const ExprPtr& closure) -> borrow::ClosureInfo {
        return borrow::analyze_closure(closure->as<ClosureExpr>(), closure->span, scopes, env,
                                       oracle);
    }

    borrow::ModuleEnv env;
    borrow::ScopeTable scopes;
    borrow::BindingId a = 0;
    borrow::BindingId b = 0;
    borrow::BindingId n = 0;
};

TEST_F(ClosureTest, SharedUseIsReadOnly) {
    auto closure = make_closure({}, call("inspect", list_of<ExprPtr>(make_ref(ident("b")))));
    auto info = analyze(closure);

    ASSERT_EQ(info.captures.size(), 1u);
    EXPECT_EQ(info.captures[0].binding, b);
    EXPECT_EQ(info.captures[0].name, "b");
    EXPECT_EQ(info.captures[0].mode, CaptureMode::Immutable);
    EXPECT_FALSE(info.captures[0].consumed);
    EXPECT_EQ(info.kind, CallableKind::ReadOnly);
    EXPECT_FALSE(info.is_move);
}

TEST_F(ClosureTest, MutatingUseIsMutable) {
    auto closure = make_closure({}, push(ident("b"), make_int(1)));
    auto info = analyze(closure);

    ASSERT_NE(info.find("b"), nullptr);
    EXPECT_EQ(info.find("b")->mode, CaptureMode::Mutable);
    EXPECT_EQ(info.kind, CallableKind::Mutable);
}

TEST_F(ClosureTest, CompoundAssignIsMutable) {
    auto body = make_block(list_of<StmtPtr>(
        stmt(make_binary(BinaryOp::AddAssign, ident("n"), make_int(1)))));
    auto info = analyze(make_closure({}, std::move(body)));

    ASSERT_NE(info.find("n"), nullptr);
    EXPECT_EQ(info.find("n")->mode, CaptureMode::Mutable);
    EXPECT_EQ(info.kind, CallableKind::Mutable);
}

TEST_F(ClosureTest, ConsumingUseIsOneShot) {
    auto closure = make_closure({}, call("consume", list_of<ExprPtr>(ident("b"))));
    auto info = analyze(closure);

    ASSERT_EQ(info.captures.size(), 1u);
    EXPECT_EQ(info.captures[0].mode, CaptureMode::Move);
    EXPECT_TRUE(info.captures[0].consumed);
    EXPECT_EQ(info.kind, CallableKind::OneShot);
}

TEST_F(ClosureTest, MoveClosureThatOnlyReads) {
    auto info = analyze(make_closure({}, len(ident("b")), true));

    ASSERT_EQ(info.captures.size(), 1u);
    EXPECT_EQ(info.captures[0].mode, CaptureMode::Move);
    EXPECT_FALSE(info.captures[0].consumed);
    EXPECT_EQ(info.kind, CallableKind::ReadOnly);
    EXPECT_TRUE(info.is_move);
}

TEST_F(ClosureTest, CopyCaptureOfMoveClosureStaysImmutable) {
    auto info = analyze(make_closure({}, ident("n"), true));

    ASSERT_EQ(info.captures.size(), 1u);
    EXPECT_EQ(info.captures[0].binding, n);
    EXPECT_EQ(info.captures[0].mode, CaptureMode::Immutable);
    EXPECT_EQ(info.kind, CallableKind::ReadOnly);
}

TEST_F(ClosureTest, ParamsAndLocalsAreNotCaptured) {
    std::vector<ClosureParam> params;
    params.push_back(ClosureParam{"x", false, buffer_type()});
    auto body = make_block(list_of<StmtPtr>(make_let("local", false, new_buffer()),
                                            stmt(call("consume", list_of<ExprPtr>(ident("x"))))),
                           call("consume", list_of<ExprPtr>(ident("local"))));
    auto info = analyze(make_closure(std::move(params), std::move(body)));

    EXPECT_TRUE(info.captures.empty());
    EXPECT_EQ(info.kind, CallableKind::ReadOnly);
}

TEST_F(ClosureTest, CapturesKeepFirstUseOrderAndUpgrade) {
    auto body = make_block(list_of<StmtPtr>(stmt(len(ident("a", 5))), stmt(len(ident("b", 6))),
                                            stmt(push(ident("a", 7), make_int(1)))));
    auto info = analyze(make_closure({}, std::move(body)));

    ASSERT_EQ(info.captures.size(), 2u);
    EXPECT_EQ(info.captures[0].name, "a");
    EXPECT_EQ(info.captures[0].mode, CaptureMode::Mutable);
    EXPECT_EQ(info.captures[0].span.start.line, 5u);
    EXPECT_EQ(info.captures[1].name, "b");
    EXPECT_EQ(info.captures[1].mode, CaptureMode::Immutable);
    EXPECT_EQ(info.kind, CallableKind::Mutable);
}

TEST_F(ClosureTest, GlobalsAreNotCaptured) {
    module.decls.push_back(make_const_decl("DEFAULT", buffer_type(), new_buffer()));
    borrow::ScopeTable table;
    env = borrow::ModuleEnv::from_module(module);
    env.install_globals(table);
    (void)table.enter_scope(borrow::ScopeKind::Function);

    auto closure = make_closure({}, call("consume", list_of<ExprPtr>(ident("DEFAULT"))));
    auto info = borrow::analyze_closure(closure->as<ClosureExpr>(), closure->span, table, env,
                                        oracle);
    EXPECT_TRUE(info.captures.empty());
}

TEST_F(ClosureTest, ScopeTableStaysBalanced) {
    auto before = scopes.current_scope();
    auto body = make_block(list_of<StmtPtr>(make_let("x", false, new_buffer())),
                           make_if(make_bool_lit(true),
                                   make_block({}, call("consume", list_of<ExprPtr>(ident("b"))))));
    (void)analyze(make_closure({}, std::move(body)));

    EXPECT_EQ(scopes.current_scope(), before);
    EXPECT_FALSE(scopes.lookup("x").has_value());
}

// ============================================================================
// 3 — Closure Table
// ============================================================================

TEST_F(ClosureTest, TableAnswersBoundQueries) {
    auto reader = make_closure({}, len(ident("b")));
    auto mutator = make_closure({}, push(ident("b"), make_int(1)));
    auto consumer = make_closure({}, call("consume", list_of<ExprPtr>(ident("b"))));
    const auto* reader_node = &reader->as<ClosureExpr>();
    const auto* mutator_node = &mutator->as<ClosureExpr>();
    const auto* consumer_node = &consumer->as<ClosureExpr>();

    add_fn("f", list_of<StmtPtr>(make_let("b", true, new_buffer()),
                                 make_let("r", false, std::move(reader)),
                                 make_let("m", true, std::move(mutator)),
                                 make_let("c", false, std::move(consumer))));

    env = borrow::ModuleEnv::from_module(module);
    borrow::BorrowChecker checker(env, oracle, options);
    diag::DiagnosticBuffer sink;
    for (const auto& unit : borrow::collect_units(module)) {
        checker.check(unit, sink);
    }

    const auto& table = checker.closures();
    EXPECT_EQ(table.size(), 3u);
    EXPECT_TRUE(table.satisfies(reader_node, CallableKind::ReadOnly));
    EXPECT_FALSE(table.satisfies(mutator_node, CallableKind::ReadOnly));
    EXPECT_TRUE(table.satisfies(mutator_node, CallableKind::Mutable));
    EXPECT_FALSE(table.satisfies(consumer_node, CallableKind::Mutable));
    EXPECT_TRUE(table.satisfies(consumer_node, CallableKind::OneShot));
    ASSERT_NE(table.lookup(consumer_node), nullptr);
    EXPECT_EQ(table.lookup(consumer_node)->kind, CallableKind::OneShot);
}

TEST_F(ClosureTest, UnknownNodeSatisfiesNothing) {
    borrow::ClosureTable table;
    auto closure = make_closure({}, make_unit_lit());
    EXPECT_TRUE(table.empty());
    EXPECT_EQ(table.lookup(&closure->as<ClosureExpr>()), nullptr);
    EXPECT_FALSE(table.satisfies(&closure->as<ClosureExpr>(), CallableKind::OneShot));
}

TEST_F(ClosureTest, MergeCopiesEntries) {
    auto closure = make_closure({}, len(ident("b")));
    const auto* node = &closure->as<ClosureExpr>();

    borrow::ClosureTable first;
    first.record(node, analyze(closure));
    borrow::ClosureTable merged;
    merged.merge(first);

    EXPECT_EQ(merged.size(), 1u);
    EXPECT_TRUE(merged.satisfies(node, CallableKind::ReadOnly));
}
