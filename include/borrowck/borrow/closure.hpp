//! # Closure Capture Analysis
//!
//! Infers how a closure captures each outer binding from the way its body
//! uses it, and classifies the closure's call capability.
//!
//! ## Capture Modes
//!
//! | Use in the body                               | Mode        |
//! |-----------------------------------------------|-------------|
//! | read only                                     | `Immutable` |
//! | assigned, `mut ref` taken, mutating method    | `Mutable`   |
//! | consumed (moved) and not Copy                 | `Move`      |
//! | any non-Copy capture of a `move` closure      | `Move`      |
//!
//! ## Callable Kinds
//!
//! A closure that consumes a capture can only run once (`OneShot`); one
//! that mutates a capture needs exclusive access (`Mutable`); anything else
//! is `ReadOnly`. A `move` closure that only reads is still `ReadOnly`.
//!
//! `satisfies(kind, bound)` answers whether a closure of `kind` may be used
//! where a callable of `bound` is required:
//!
//! | kind \ bound | ReadOnly | Mutable | OneShot |
//! |--------------|----------|---------|---------|
//! | ReadOnly     | yes      | yes     | yes     |
//! | Mutable      | no       | yes     | yes     |
//! | OneShot      | no       | no      | yes     |

#ifndef BORROWCK_BORROW_CLOSURE_HPP
#define BORROWCK_BORROW_CLOSURE_HPP

#include "borrowck/borrow/env.hpp"
#include "borrowck/types/oracle.hpp"

#include <map>
#include <string>
#include <vector>

namespace borrowck::borrow {

enum class CaptureMode {
    Immutable,
    Mutable,
    Move,
};

enum class CallableKind {
    ReadOnly,
    Mutable,
    OneShot,
};

[[nodiscard]] auto capture_mode_name(CaptureMode mode) -> const char*;
[[nodiscard]] auto callable_kind_name(CallableKind kind) -> const char*;

/// Whether a closure of `kind` can be used where `bound` is required.
[[nodiscard]] auto satisfies(CallableKind kind, CallableKind bound) -> bool;

struct Capture {
    BindingId binding;
    std::string name;
    CaptureMode mode;
    bool consumed;   ///< The body moves the captured value.
    SourceSpan span; ///< First use inside the body.
};

struct ClosureInfo {
    std::vector<Capture> captures; ///< In order of first use.
    CallableKind kind = CallableKind::ReadOnly;
    bool is_move = false;
    SourceSpan span;

    [[nodiscard]] auto find(std::string_view name) const -> const Capture*;
};

/// Capture analysis results, keyed by closure node.
class ClosureTable {
public:
    void record(const ast::ClosureExpr* node, ClosureInfo info);

    [[nodiscard]] auto lookup(const ast::ClosureExpr* node) const -> const ClosureInfo*;

    /// `satisfies(lookup(node)->kind, bound)`; false for unknown nodes.
    [[nodiscard]] auto satisfies(const ast::ClosureExpr* node, CallableKind bound) const -> bool;

    /// Copies every entry of `other` into this table.
    void merge(const ClosureTable& other);

    [[nodiscard]] auto size() const -> size_t {
        return entries_.size();
    }

    [[nodiscard]] auto empty() const -> bool {
        return entries_.empty();
    }

private:
    std::map<const ast::ClosureExpr*, ClosureInfo> entries_;
};

/// Runs capture analysis for `closure`, created in the current scope of
/// `scopes`. Scopes entered for the body are exited again before returning.
[[nodiscard]] auto analyze_closure(const ast::ClosureExpr& closure, SourceSpan span,
                                   ScopeTable& scopes, const ModuleEnv& env,
                                   const types::CopyOracle& oracle) -> ClosureInfo;

} // namespace borrowck::borrow

#endif // BORROWCK_BORROW_CLOSURE_HPP
