//! # Borrow Checker Unit Tests
//!
//! Phase 3: exclusivity of live borrows, mutation and moves of borrowed
//! places, borrow ends, joins, loops and closure captures.

#include "borrowck/borrow/borrows.hpp"
#include "test_util.hpp"

using namespace borrowck;
using namespace borrowck::test;
using borrowck::diag::ErrorKind;

class BorrowsTest : public ModuleTest {
protected:
    auto check() -> diag::DiagnosticBuffer {
        return check_with<borrow::BorrowChecker>(oracle, options);
    }

    auto inspect(ExprPtr arg) -> ExprPtr {
        return call("inspect", list_of<ExprPtr>(std::move(arg)));
    }
};

// ============================================================================
// 1 — Exclusivity
// ============================================================================

TEST_F(BorrowsTest, SharedBorrowsCoexist) {
    add_fn("f", list_of<StmtPtr>(make_let("b", false, new_buffer()),
                                 make_let("r1", false, make_ref(ident("b"))),
                                 make_let("r2", false, make_ref(ident("b"))),
                                 stmt(inspect(make_ref(ident("b")))),
                                 stmt(len(ident("b")))));

    EXPECT_EQ(check().error_count(), 0u);
}

TEST_F(BorrowsTest, MutableWhileImmutablyBorrowed) {
    add_fn("f", list_of<StmtPtr>(make_let("b", true, new_buffer()),
                                 make_let("r", false, make_ref(ident("b"), at(2, 13))),
                                 make_let("m", false, make_ref_mut(ident("b"), at(3, 13)))));

    auto diags = check();
    ASSERT_EQ(diags.error_count(), 1u);
    const auto& d = diags.diagnostics()[0];
    EXPECT_EQ(d.kind, ErrorKind::BorrowConflict);
    EXPECT_EQ(d.conflict, diag::ConflictKind::MutableWhileImmutablyBorrowed);
    EXPECT_EQ(d.code, "B007");
    EXPECT_EQ(d.phase, diag::Phase::Borrows);
    ASSERT_TRUE(d.span.has_value());
    EXPECT_EQ(d.span->start.line, 3u);
    ASSERT_TRUE(d.related_span.has_value());
    EXPECT_EQ(d.related_span->start.line, 2u);
}

TEST_F(BorrowsTest, ImmutableWhileMutablyBorrowed) {
    add_fn("f", list_of<StmtPtr>(make_let("b", true, new_buffer()),
                                 make_let("m", false, make_ref_mut(ident("b"))),
                                 make_let("r", false, make_ref(ident("b")))));

    auto diags = check();
    ASSERT_EQ(codes(diags), std::vector<std::string>{"B009"});
    EXPECT_EQ(diags.diagnostics()[0].conflict, diag::ConflictKind::ImmutableWhileMutablyBorrowed);
}

TEST_F(BorrowsTest, MutableWhileMutablyBorrowed) {
    add_fn("f", list_of<StmtPtr>(make_let("b", true, new_buffer()),
                                 make_let("m", false, make_ref_mut(ident("b"))),
                                 make_let("n", false, make_ref_mut(ident("b")))));

    auto diags = check();
    ASSERT_EQ(codes(diags), std::vector<std::string>{"B008"});
    EXPECT_EQ(diags.diagnostics()[0].message,
              "cannot borrow `b` as mutable more than once at a time");
}

TEST_F(BorrowsTest, ConflictingBorrowIsNotRecorded) {
    add_fn("f", list_of<StmtPtr>(make_let("b", true, new_buffer()),
                                 make_let("m1", false, make_ref_mut(ident("b"))),
                                 make_let("m2", false, make_ref_mut(ident("b"))),
                                 make_let("m3", false, make_ref_mut(ident("b")))));

    auto diags = check();
    EXPECT_EQ(codes(diags), (std::vector<std::string>{"B008", "B008"}));
}

TEST_F(BorrowsTest, AutoBorrowedReceiverConflicts) {
    add_fn("f", list_of<StmtPtr>(make_let("b", true, new_buffer()),
                                 make_let("m", false, make_ref_mut(ident("b"))),
                                 stmt(len(ident("b")))));

    EXPECT_EQ(codes(check()), std::vector<std::string>{"B009"});
}

// ============================================================================
// 2 — Mutation and Moves of Borrowed Places
// ============================================================================

TEST_F(BorrowsTest, AssignWhileBorrowed) {
    add_fn("f", list_of<StmtPtr>(make_let("b", true, new_buffer()),
                                 make_let("r", false, make_ref(ident("b"))),
                                 stmt(make_assign(ident("b"), new_buffer(), at(3)))));

    auto diags = check();
    ASSERT_EQ(diags.error_count(), 1u);
    EXPECT_EQ(diags.diagnostics()[0].kind, ErrorKind::MutationWhileBorrowed);
    EXPECT_EQ(diags.diagnostics()[0].code, "B004");
}

TEST_F(BorrowsTest, MutatingCallWhileBorrowed) {
    add_fn("f", list_of<StmtPtr>(make_let("b", true, new_buffer()),
                                 make_let("r", false, make_ref(ident("b"))),
                                 stmt(push(ident("b"), make_int(1)))));

    EXPECT_EQ(codes(check()), std::vector<std::string>{"B004"});
}

TEST_F(BorrowsTest, FieldAssignWhileWholeBorrowed) {
    add_fn("f", list_of<StmtPtr>(
                    make_let("b", true, new_buffer()),
                    make_let("r", false, make_ref(ident("b"))),
                    stmt(make_assign(make_field(ident("b"), "size"), make_int(2)))));

    EXPECT_EQ(codes(check()), std::vector<std::string>{"B004"});
}

TEST_F(BorrowsTest, MoveWhileBorrowed) {
    add_fn("f", list_of<StmtPtr>(make_let("b", false, new_buffer()),
                                 make_let("r", false, make_ref(ident("b"))),
                                 stmt(call("consume", list_of<ExprPtr>(ident("b", 3))))));

    auto diags = check();
    ASSERT_EQ(diags.error_count(), 1u);
    EXPECT_EQ(diags.diagnostics()[0].kind, ErrorKind::MoveWhileBorrowed);
    EXPECT_EQ(diags.diagnostics()[0].code, "B002");
    EXPECT_EQ(diags.diagnostics()[0].message, "cannot move out of `b` because it is borrowed");
}

TEST_F(BorrowsTest, CopyReadOfBorrowedPlaceIsFine) {
    add_fn("f", list_of<StmtPtr>(make_let("b", false, new_buffer()),
                                 make_let("m", false, make_ref(ident("b"))),
                                 make_let("n", false, make_field(ident("b"), "size"))));

    EXPECT_EQ(check().error_count(), 0u);
}

// ============================================================================
// 3 — Borrow Ends
// ============================================================================

TEST_F(BorrowsTest, HeldBorrowEndsWithItsScope) {
    add_fn("f", list_of<StmtPtr>(
                    make_let("b", true, new_buffer()),
                    stmt(make_block(list_of<StmtPtr>(make_let("r", false, make_ref(ident("b")))))),
                    stmt(push(ident("b"), make_int(1)))));

    EXPECT_EQ(check().error_count(), 0u);
}

TEST_F(BorrowsTest, ArgumentBorrowEndsWithTheCall) {
    add_fn("f", list_of<StmtPtr>(make_let("b", true, new_buffer()),
                                 stmt(call("fill", list_of<ExprPtr>(make_ref_mut(ident("b"))))),
                                 stmt(inspect(make_ref(ident("b")))),
                                 stmt(push(ident("b"), make_int(1)))));

    EXPECT_EQ(check().error_count(), 0u);
}

TEST_F(BorrowsTest, ResultCarryingTheArgumentBorrow) {
    add_fn("f", list_of<StmtPtr>(
                    make_let("b", false, new_buffer()),
                    make_let("n", false,
                             call("first", list_of<ExprPtr>(make_ref(ident("b"))))),
                    stmt(call("consume", list_of<ExprPtr>(ident("b"))))));

    EXPECT_EQ(codes(check()), std::vector<std::string>{"B002"});
}

TEST_F(BorrowsTest, ReceiverBorrowStartsAfterArguments) {
    add_fn("f", list_of<StmtPtr>(make_let("b", true, new_buffer()),
                                 stmt(push(ident("b"), len(ident("b"))))));

    EXPECT_EQ(check().error_count(), 0u);
}

TEST_F(BorrowsTest, ArgumentBorrowOfMutatedReceiver) {
    auto absorb = [](ExprPtr receiver, ExprPtr other) {
        return make_method_call(std::move(receiver), "absorb",
                                list_of<ExprPtr>(std::move(other)),
                                make_sig("absorb", {types::make_ref(buffer_type())},
                                         types::make_unit(), true, types::ReceiverKind::MutRef),
                                true);
    };
    add_fn("f", list_of<StmtPtr>(make_let("b", true, new_buffer()),
                                 make_let("other", false, new_buffer()),
                                 stmt(absorb(ident("b"), make_ref(ident("other")))),
                                 stmt(absorb(ident("b"), make_ref(ident("b"))))));

    auto diags = check();
    ASSERT_EQ(diags.error_count(), 1u);
    EXPECT_EQ(diags.diagnostics()[0].conflict, diag::ConflictKind::MutableWhileImmutablyBorrowed);
    EXPECT_EQ(diags.diagnostics()[0].code, "B007");
}

TEST_F(BorrowsTest, PlainResultEndsArgumentBorrow) {
    declare("count", {types::make_ref(buffer_type())}, types::make_i32());
    add_fn("f", list_of<StmtPtr>(
                    make_let("n", true, make_int(0)), make_let("b", true, new_buffer()),
                    stmt(make_assign(ident("n"),
                                     call("count", list_of<ExprPtr>(make_ref(ident("b")))))),
                    stmt(push(ident("b"), ident("n")))));

    EXPECT_EQ(check().error_count(), 0u);
}

TEST_F(BorrowsTest, CustomBorrowEndPolicy) {
    class NeverEnds : public borrow::BorrowEndPolicy {
    public:
        auto ends_at_scope_exit(const borrow::Borrow&, const borrow::Scope&) const
            -> bool override {
            return false;
        }
        auto ends_at_statement_end(const borrow::Borrow&, borrow::ScopeId,
                                   const borrow::ScopeTable&) const -> bool override {
            return false;
        }
    };

    add_fn("f", list_of<StmtPtr>(
                    make_let("b", true, new_buffer()),
                    stmt(make_block(list_of<StmtPtr>(make_let("r", false, make_ref(ident("b")))))),
                    stmt(push(ident("b"), make_int(1)))));

    EXPECT_EQ(check().error_count(), 0u);
    auto diags = check_with<borrow::BorrowChecker>(
        oracle, std::unique_ptr<borrow::BorrowEndPolicy>(std::make_unique<NeverEnds>()));
    EXPECT_EQ(codes(diags), std::vector<std::string>{"B004"});
}

// ============================================================================
// 4 — Joins and Loops
// ============================================================================

TEST_F(BorrowsTest, BorrowFromOneBranchIsLiveAfterTheJoin) {
    add_fn("f", list_of<StmtPtr>(
                    make_let("c", false, make_bool_lit(true)),
                    make_let("a", false, new_buffer()), make_let("b", true, new_buffer()),
                    make_let("r", true, make_ref(ident("a"))),
                    stmt(make_if(ident("c"), make_block(list_of<StmtPtr>(stmt(
                                                 make_assign(ident("r"), make_ref(ident("b")))))))),
                    stmt(push(ident("b"), make_int(1)))));

    EXPECT_EQ(codes(check()), std::vector<std::string>{"B004"});
}

TEST_F(BorrowsTest, ReassigningHolderReleasesOldBorrow) {
    add_fn("f", list_of<StmtPtr>(make_let("a", true, new_buffer()),
                                 make_let("b", false, new_buffer()),
                                 make_let("r", true, make_ref(ident("a"))),
                                 stmt(make_assign(ident("r"), make_ref(ident("b")))),
                                 stmt(push(ident("a"), make_int(1)))));

    EXPECT_EQ(check().error_count(), 0u);
}

TEST_F(BorrowsTest, BorrowCarriedAcrossIterations) {
    add_fn("f", list_of<StmtPtr>(
                    make_let("c", false, make_bool_lit(true)),
                    make_let("a", false, new_buffer()), make_let("b", true, new_buffer()),
                    make_let("r", true, make_ref(ident("a"))),
                    stmt(make_while(ident("c"),
                                    make_block(list_of<StmtPtr>(
                                        stmt(push(ident("b"), make_int(1))),
                                        stmt(make_assign(ident("r"), make_ref(ident("b"))))))))));

    EXPECT_EQ(codes(check()), std::vector<std::string>{"B004"});
}

// ============================================================================
// 5 — Places and Closures
// ============================================================================

TEST_F(BorrowsTest, DisjointFieldBorrows) {
    add_fn("f", list_of<StmtPtr>(
                    make_let("p", true, new_pair()),
                    make_let("l", false, make_ref_mut(make_field(ident("p"), "left"))),
                    make_let("r", false, make_ref_mut(make_field(ident("p"), "right"))),
                    make_let("w", false, make_ref(ident("p")))));

    auto diags = check();
    ASSERT_EQ(codes(diags), std::vector<std::string>{"B009"});
    EXPECT_NE(diags.diagnostics()[0].message.find("`p`"), std::string::npos);
}

TEST_F(BorrowsTest, ClosureMutableCaptureHoldsExclusiveBorrow) {
    auto body = make_block(list_of<StmtPtr>(
        stmt(make_binary(BinaryOp::AddAssign, ident("count"), make_int(1)))));
    add_fn("f", list_of<StmtPtr>(make_let("count", true, make_int(0)),
                                 make_let("inc", true, make_closure({}, std::move(body))),
                                 make_let("r", false, make_ref(ident("count")))));

    EXPECT_EQ(codes(check()), std::vector<std::string>{"B009"});
}

TEST_F(BorrowsTest, MoveClosureOfBorrowedValue) {
    add_fn("f", list_of<StmtPtr>(
                    make_let("b", false, new_buffer()),
                    make_let("r", false, make_ref(ident("b"))),
                    make_let("g", false, make_closure({}, len(ident("b")), true))));

    EXPECT_EQ(codes(check()), std::vector<std::string>{"B002"});
}

TEST_F(BorrowsTest, ClosureTableRecordsEveryClosure) {
    add_fn("f", list_of<StmtPtr>(
                    make_let("b", true, new_buffer()),
                    make_let("g", false, make_closure({}, len(ident("b")))),
                    make_let("h", false, make_closure({}, call("consume", list_of<ExprPtr>(
                                                                             ident("b")))))));

    auto env = borrow::ModuleEnv::from_module(module);
    borrow::BorrowChecker checker(env, oracle, options);
    diag::DiagnosticBuffer sink;
    for (const auto& unit : borrow::collect_units(module)) {
        checker.check(unit, sink);
    }

    EXPECT_EQ(checker.closures().size(), 2u);
    // Moving `b` into `h` while `g` still borrows it.
    EXPECT_EQ(codes(sink), std::vector<std::string>{"B002"});
}
