//! # Scope Table and Place Unit Tests

#include "borrowck/ast/builder.hpp"
#include "borrowck/borrow/place.hpp"
#include "borrowck/borrow/scope.hpp"

#include <gtest/gtest.h>

using namespace borrowck;
using namespace borrowck::borrow;

// ============================================================================
// 1 — Scope Nesting
// ============================================================================

TEST(ScopeTableTest, StartsAtModuleScope) {
    ScopeTable table;
    EXPECT_EQ(table.current_scope(), 0u);
    EXPECT_EQ(table.current_depth(), 0u);
    EXPECT_EQ(table.scope_count(), 1u);
    EXPECT_EQ(table.scope(0).kind, ScopeKind::Module);
    EXPECT_TRUE(table.scope(0).live);
}

TEST(ScopeTableTest, DepthGrowsWithNesting) {
    ScopeTable table;
    auto fn = table.enter_scope(ScopeKind::Function);
    auto body = table.enter_scope(ScopeKind::Block);
    auto branch = table.enter_scope(ScopeKind::Branch);

    EXPECT_EQ(table.scope(fn).depth, 1u);
    EXPECT_EQ(table.scope(body).depth, 2u);
    EXPECT_EQ(table.scope(branch).depth, 3u);
    EXPECT_EQ(table.scope(branch).parent, body);
    EXPECT_EQ(table.current_scope(), branch);
}

TEST(ScopeTableTest, ExitMarksScopeDead) {
    ScopeTable table;
    auto fn = table.enter_scope(ScopeKind::Function);
    auto inner = table.enter_scope(ScopeKind::Block);

    table.exit_scope(inner);
    EXPECT_FALSE(table.scope(inner).live);
    EXPECT_EQ(table.current_scope(), fn);
    EXPECT_EQ(table.current_depth(), 1u);
}

TEST(ScopeTableTest, ExitOfNonCurrentScopeThrows) {
    ScopeTable table;
    auto fn = table.enter_scope(ScopeKind::Function);
    (void)table.enter_scope(ScopeKind::Block);

    EXPECT_THROW(table.exit_scope(fn), InvariantViolation);
}

TEST(ScopeTableTest, ModuleScopeCannotBeExited) {
    ScopeTable table;
    EXPECT_THROW(table.exit_scope(0), InvariantViolation);
}

TEST(ScopeTableTest, UnknownIdsThrow) {
    ScopeTable table;
    EXPECT_THROW((void)table.scope(7), InvariantViolation);
    EXPECT_THROW((void)table.binding(0), InvariantViolation);
}

TEST(ScopeTableTest, ExitHooksSeeTheClosingScope) {
    ScopeTable table;
    std::vector<ScopeKind> closed;
    table.add_exit_hook([&](const Scope& scope) {
        EXPECT_TRUE(scope.live);
        closed.push_back(scope.kind);
    });

    auto fn = table.enter_scope(ScopeKind::Function);
    auto loop = table.enter_scope(ScopeKind::Loop);
    table.exit_scope(loop);
    table.exit_scope(fn);

    EXPECT_EQ(closed, (std::vector<ScopeKind>{ScopeKind::Loop, ScopeKind::Function}));
}

TEST(ScopeTableTest, NearestAndWithin) {
    ScopeTable table;
    auto fn = table.enter_scope(ScopeKind::Function);
    auto unsafe_scope = table.enter_scope(ScopeKind::Unsafe);
    (void)table.enter_scope(ScopeKind::Block);

    EXPECT_EQ(table.nearest(ScopeKind::Unsafe), unsafe_scope);
    EXPECT_EQ(table.nearest(ScopeKind::Function), fn);
    EXPECT_FALSE(table.nearest(ScopeKind::Loop).has_value());
    EXPECT_TRUE(table.within(ScopeKind::Unsafe));
    EXPECT_FALSE(table.within(ScopeKind::Closure));
}

TEST(ScopeTableTest, KindNames) {
    EXPECT_STREQ(scope_kind_name(ScopeKind::Module), "module");
    EXPECT_STREQ(scope_kind_name(ScopeKind::Closure), "closure");
    EXPECT_STREQ(scope_kind_name(ScopeKind::Unsafe), "unsafe");
}

// ============================================================================
// 2 — Bindings
// ============================================================================

TEST(ScopeTableTest, DeclareAndLookup) {
    ScopeTable table;
    (void)table.enter_scope(ScopeKind::Function);
    auto id = table.declare_binding("x", true, types::make_i32(), SourceSpan::at(4, 9),
                                    BindingKind::Param);

    const auto& b = table.binding(id);
    EXPECT_EQ(b.name, "x");
    EXPECT_TRUE(b.is_mut);
    EXPECT_EQ(b.depth, 1u);
    EXPECT_EQ(b.kind, BindingKind::Param);
    EXPECT_EQ(b.span.start.line, 4u);
    EXPECT_EQ(table.lookup("x"), id);
    EXPECT_EQ(table.resolve("x"), id);
    EXPECT_EQ(table.region_depth(id), 1u);
}

TEST(ScopeTableTest, ResolveUnknownNameThrows) {
    ScopeTable table;
    EXPECT_FALSE(table.lookup("ghost").has_value());
    try {
        (void)table.resolve("ghost");
        FAIL() << "expected InvariantViolation";
    } catch (const InvariantViolation& e) {
        EXPECT_NE(std::string(e.what()).find("`ghost`"), std::string::npos);
    }
}

TEST(ScopeTableTest, ShadowingCreatesNewBinding) {
    ScopeTable table;
    (void)table.enter_scope(ScopeKind::Function);
    auto outer = table.declare_binding("x", false, types::make_i32(), {});
    auto same_scope = table.declare_binding("x", true, types::make_i32(), {});
    EXPECT_NE(outer, same_scope);
    EXPECT_EQ(table.lookup("x"), same_scope);

    auto block = table.enter_scope(ScopeKind::Block);
    auto inner = table.declare_binding("x", false, types::make_bool(), {});
    EXPECT_EQ(table.lookup("x"), inner);
    EXPECT_EQ(table.region_depth(inner), 2u);

    table.exit_scope(block);
    EXPECT_EQ(table.lookup("x"), same_scope);
    EXPECT_EQ(table.binding(outer).name, "x");
}

TEST(ScopeTableTest, DeadScopeBindingsAreInvisible) {
    ScopeTable table;
    (void)table.enter_scope(ScopeKind::Function);
    auto block = table.enter_scope(ScopeKind::Block);
    auto y = table.declare_binding("y", false, types::make_i32(), {});
    table.exit_scope(block);

    EXPECT_FALSE(table.lookup("y").has_value());
    // Ids stay valid after the scope closes.
    EXPECT_EQ(table.binding(y).scope, block);
    EXPECT_EQ(table.binding_count(), 1u);
}

TEST(ScopeTableTest, DeclaredWithin) {
    ScopeTable table;
    auto fn = table.enter_scope(ScopeKind::Function);
    auto a = table.declare_binding("a", false, types::make_i32(), {});
    auto closure = table.enter_scope(ScopeKind::Closure);
    (void)table.enter_scope(ScopeKind::Block);
    auto b = table.declare_binding("b", false, types::make_i32(), {});

    EXPECT_TRUE(table.declared_within(b, closure));
    EXPECT_TRUE(table.declared_within(b, fn));
    EXPECT_FALSE(table.declared_within(a, closure));
    EXPECT_TRUE(table.declared_within(a, fn));
}

// ============================================================================
// 3 — Places
// ============================================================================

class PlaceTest : public ::testing::Test {
protected:
    void SetUp() override {
        (void)table.enter_scope(ScopeKind::Function);
        s = table.declare_binding("s", true, types::make_named("Pair"), {});
        v = table.declare_binding("v", true, types::make_named("Vec"), {});
        r = table.declare_binding("r", false, types::make_ref(types::make_named("Pair")), {});
    }

    auto place_of(const ast::ExprPtr& expr) -> Place {
        auto place = extract_place(*expr, table);
        EXPECT_TRUE(place.has_value());
        return place.value_or(Place{});
    }

    ScopeTable table;
    BindingId s = 0;
    BindingId v = 0;
    BindingId r = 0;
};

TEST_F(PlaceTest, IdentIsWholePlace) {
    auto place = place_of(ast::make_ident("s"));
    EXPECT_EQ(place.root, s);
    EXPECT_TRUE(place.is_whole());
    EXPECT_EQ(place.to_string(table), "s");
}

TEST_F(PlaceTest, FieldPath) {
    auto place = place_of(ast::make_field(ast::make_field(ast::make_ident("s"), "left"), "size"));
    EXPECT_EQ(place.root, s);
    EXPECT_EQ(place.fields, (std::vector<std::string>{"left", "size"}));
    EXPECT_FALSE(place.is_whole());
    EXPECT_EQ(place.to_string(table), "s.left.size");
}

TEST_F(PlaceTest, IndexStopsFieldPath) {
    auto place = place_of(ast::make_field(
        ast::make_index(ast::make_ident("v"), ast::make_int(0)), "x"));
    EXPECT_EQ(place.root, v);
    EXPECT_TRUE(place.fields.empty());
    EXPECT_TRUE(place.through_index);
    EXPECT_EQ(place.to_string(table), "v[..]");
}

TEST_F(PlaceTest, DerefStopsFieldPath) {
    auto place = place_of(ast::make_field(ast::make_deref(ast::make_ident("r")), "left"));
    EXPECT_EQ(place.root, r);
    EXPECT_TRUE(place.fields.empty());
    EXPECT_TRUE(place.through_deref);
    EXPECT_EQ(place.to_string(table), "*r");
}

TEST_F(PlaceTest, ValueExpressionsHaveNoPlace) {
    EXPECT_FALSE(extract_place(*ast::make_int(3), table).has_value());
    EXPECT_FALSE(extract_place(*ast::make_ref(ast::make_ident("s")), table).has_value());
}

TEST_F(PlaceTest, UnresolvedRootThrows) {
    EXPECT_THROW((void)extract_place(*ast::make_ident("ghost"), table), InvariantViolation);
}

TEST_F(PlaceTest, Overlap) {
    Place whole{s, {}, false, false};
    Place left{s, {"left"}, false, false};
    Place left_size{s, {"left", "size"}, false, false};
    Place right{s, {"right"}, false, false};
    Place other{v, {}, false, false};

    EXPECT_TRUE(whole.overlaps(left));
    EXPECT_TRUE(left_size.overlaps(left));
    EXPECT_TRUE(left.is_prefix_of(left_size));
    EXPECT_FALSE(left_size.is_prefix_of(left));
    EXPECT_FALSE(left.overlaps(right));
    EXPECT_FALSE(whole.overlaps(other));
}
