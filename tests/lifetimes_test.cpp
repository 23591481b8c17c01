//! # Lifetime Checker Unit Tests
//!
//! Phase 4: dangling returns, stores that outlive their referent, block
//! escapes, closures returned from their frame and raw pointer casts.

#include "borrowck/borrow/lifetimes.hpp"
#include "test_util.hpp"

using namespace borrowck;
using namespace borrowck::test;
using borrowck::diag::ErrorKind;

class LifetimesTest : public ModuleTest {
protected:
    auto check() -> diag::DiagnosticBuffer {
        return check_with<borrow::LifetimeChecker>(oracle);
    }

    static auto ref_i32() -> TypePtr {
        return types::make_ref(types::make_i32());
    }

    static auto params(FuncParam param) -> std::vector<FuncParam> {
        std::vector<FuncParam> out;
        out.push_back(std::move(param));
        return out;
    }
};

// ============================================================================
// 1 — Returned References
// ============================================================================

TEST_F(LifetimesTest, ReturnReferenceToLocal) {
    add_fn("f", list_of<StmtPtr>(make_let("b", false, make_int(1), nullptr, at(2, 5))),
           make_ref(ident("b"), at(3, 5)), ref_i32());

    auto diags = check();
    ASSERT_EQ(diags.error_count(), 1u);
    const auto& d = diags.diagnostics()[0];
    EXPECT_EQ(d.kind, ErrorKind::ReturnDanglingReference);
    EXPECT_EQ(d.code, "B010");
    EXPECT_EQ(d.phase, diag::Phase::Lifetimes);
    EXPECT_EQ(d.message, "cannot return reference to local variable `b`");
    ASSERT_TRUE(d.span.has_value());
    EXPECT_EQ(d.span->start.line, 3u);
    ASSERT_TRUE(d.related_span.has_value());
    EXPECT_EQ(d.related_span->start.line, 2u);
}

TEST_F(LifetimesTest, ReturnReferenceToParameter) {
    add_fn("f", {}, make_ref(ident("b")), types::make_ref(buffer_type()),
           params(make_param("b", buffer_type())));
    add_fn("g", {}, ident("r"), ref_i32(), params(make_param("r", ref_i32())));

    EXPECT_EQ(check().error_count(), 0u);
}

TEST_F(LifetimesTest, ExplicitReturnOfLocalReference) {
    add_fn("f", list_of<StmtPtr>(make_let("b", false, new_buffer()),
                                 stmt(make_return(make_ref(ident("b")), at(3)))),
           nullptr, types::make_ref(buffer_type()));

    EXPECT_EQ(codes(check()), std::vector<std::string>{"B010"});
}

TEST_F(LifetimesTest, CallResultCarriesArgumentRegion) {
    add_fn("ok", {}, call("first", list_of<ExprPtr>(ident("b"))), ref_i32(),
           params(make_param("b", types::make_ref(buffer_type()))));
    add_fn("bad", list_of<StmtPtr>(make_let("b", false, new_buffer())),
           call("first", list_of<ExprPtr>(make_ref(ident("b")))), ref_i32());

    auto diags = check();
    ASSERT_EQ(codes(diags), std::vector<std::string>{"B010"});
    EXPECT_NE(diags.diagnostics()[0].message.find("`b`"), std::string::npos);
}

TEST_F(LifetimesTest, ValueResultCarriesNoRegion) {
    add_fn("f", list_of<StmtPtr>(make_let("b", false, new_buffer())), len(ident("b")),
           types::make_i32());

    EXPECT_EQ(check().error_count(), 0u);
}

// ============================================================================
// 2 — Stores and Block Escapes
// ============================================================================

TEST_F(LifetimesTest, BlockTailEscapesItsScope) {
    auto inner = make_block(list_of<StmtPtr>(make_let("b", false, make_int(1))),
                            make_ref(ident("b")));
    add_fn("f", list_of<StmtPtr>(make_let("r", false, std::move(inner))));

    auto diags = check();
    ASSERT_EQ(diags.error_count(), 1u);
    EXPECT_EQ(diags.diagnostics()[0].kind, ErrorKind::ReferenceOutlivesReferent);
    EXPECT_EQ(diags.diagnostics()[0].code, "B012");
    EXPECT_EQ(diags.diagnostics()[0].message, "`b` does not live long enough");
}

TEST_F(LifetimesTest, StoreIntoOuterBinding) {
    auto inner = make_block(list_of<StmtPtr>(make_let("b", false, make_int(1)),
                                             stmt(make_assign(ident("r"), make_ref(ident("b"))))));
    add_fn("f", list_of<StmtPtr>(make_let("a", false, make_int(0)),
                                 make_let("r", true, make_ref(ident("a")), ref_i32()),
                                 stmt(std::move(inner))));

    EXPECT_EQ(codes(check()), std::vector<std::string>{"B012"});
}

TEST_F(LifetimesTest, StoreIntoSameScopeBinding) {
    add_fn("f", list_of<StmtPtr>(make_let("a", false, make_int(0)),
                                 make_let("b", false, make_int(1)),
                                 make_let("r", true, make_ref(ident("a")), ref_i32()),
                                 stmt(make_assign(ident("r"), make_ref(ident("b"))))));

    EXPECT_EQ(check().error_count(), 0u);
}

TEST_F(LifetimesTest, StoreThroughOutParameter) {
    auto out_type = types::make_ref(ref_i32(), true);
    add_fn("bad",
           list_of<StmtPtr>(make_let("n", false, make_int(1)),
                            stmt(make_assign(make_deref(ident("out")), make_ref(ident("n"))))),
           nullptr, nullptr, params(make_param("out", out_type)));

    std::vector<FuncParam> ok_params;
    ok_params.push_back(make_param("out", out_type));
    ok_params.push_back(make_param("src", ref_i32()));
    add_fn("ok", list_of<StmtPtr>(stmt(make_assign(make_deref(ident("out")), ident("src")))),
           nullptr, nullptr, std::move(ok_params));

    auto diags = check();
    ASSERT_EQ(codes(diags), std::vector<std::string>{"B012"});
    EXPECT_EQ(diags.diagnostics()[0].message, "`n` does not live long enough");
}

TEST_F(LifetimesTest, BranchTailEscapesItsBranch) {
    auto then_branch = make_block(list_of<StmtPtr>(make_let("b", false, make_int(1))),
                                  make_ref(ident("b")));
    auto else_branch = make_block({}, make_ref(ident("a")));
    add_fn("f", list_of<StmtPtr>(
                    make_let("c", false, make_bool_lit(true)), make_let("a", false, make_int(0)),
                    make_let("r", false,
                             make_if(ident("c"), std::move(then_branch), std::move(else_branch)))));

    EXPECT_EQ(codes(check()), std::vector<std::string>{"B012"});
}

// ============================================================================
// 3 — Closures and Raw Pointers
// ============================================================================

TEST_F(LifetimesTest, ReturnedClosureBorrowsLocal) {
    add_fn("f", list_of<StmtPtr>(make_let("b", false, new_buffer())),
           make_closure({}, len(ident("b"))));

    auto diags = check();
    ASSERT_EQ(codes(diags), std::vector<std::string>{"B010"});
    EXPECT_NE(diags.diagnostics()[0].message.find("`b`"), std::string::npos);
}

TEST_F(LifetimesTest, ReturnedMoveClosureOwnsCapture) {
    add_fn("f", list_of<StmtPtr>(make_let("b", false, new_buffer())),
           make_closure({}, len(ident("b")), true));

    EXPECT_EQ(check().error_count(), 0u);
}

TEST_F(LifetimesTest, RawPointerCastDropsRegion) {
    add_fn("f", list_of<StmtPtr>(make_let("n", false, make_int(1))),
           make_cast(make_ref(ident("n")), types::make_ptr(types::make_i32())),
           types::make_ptr(types::make_i32()));

    EXPECT_EQ(check().error_count(), 0u);
}

TEST_F(LifetimesTest, AggregateWithShortLivedField) {
    module.decls.push_back(
        make_struct_decl("Holder", {StructField{"p", ref_i32()}}));
    auto holder = [](ExprPtr value) {
        return make_struct("Holder", list_of<FieldInit>(make_field_init("p", std::move(value))));
    };
    auto inner = make_block(list_of<StmtPtr>(
        make_let("n", false, make_int(1)),
        stmt(make_assign(ident("h"), holder(make_ref(ident("n")))))));
    add_fn("f", list_of<StmtPtr>(make_let("a", false, make_int(0)),
                                 make_let("h", true, holder(make_ref(ident("a")))),
                                 stmt(std::move(inner))));

    EXPECT_EQ(codes(check()), std::vector<std::string>{"B012"});
}
