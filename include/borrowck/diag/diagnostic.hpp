//! # Diagnostics
//!
//! User-facing findings of the four phases and the sinks they are reported
//! into. Rendering for humans is left to the embedding compiler; a
//! diagnostic here is plain data with a stable code.
//!
//! ## Error Codes
//!
//! | Code | Kind                                  | Phase        |
//! |------|---------------------------------------|--------------|
//! | B001 | use after move                        | moves        |
//! | B002 | move while borrowed                   | borrows      |
//! | B003 | assignment to immutable binding       | immutability |
//! | B004 | mutation while borrowed               | borrows      |
//! | B007 | mutable borrow while immutably borrowed | borrows    |
//! | B008 | mutable borrow while mutably borrowed | borrows      |
//! | B009 | immutable borrow while mutably borrowed | borrows    |
//! | B010 | return of dangling reference          | lifetimes    |
//! | B011 | use of partially moved value          | moves        |
//! | B012 | reference outlives referent           | lifetimes    |
//! | B013 | missing mutation marker               | immutability |
//! | B014 | spurious mutation marker              | immutability |
//! | B015 | mutable self in immutable method      | immutability |
//! | B016 | mutability contract mismatch          | immutability |
//! | B017 | unsafe operation outside unsafe block | immutability |

#ifndef BORROWCK_DIAG_DIAGNOSTIC_HPP
#define BORROWCK_DIAG_DIAGNOSTIC_HPP

#include "borrowck/common.hpp"

#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace borrowck::diag {

enum class ErrorKind {
    ImmutableAssignment,
    MissingMutationMarker,
    SpuriousMutationMarker,
    MutableSelfInImmutableMethod,
    MutabilityContractMismatch,
    UnsafeOperationOutsideUnsafeBlock,
    UseAfterMove,
    UseOfPartiallyMovedValue,
    BorrowConflict,
    MutationWhileBorrowed,
    MoveWhileBorrowed,
    ReturnDanglingReference,
    ReferenceOutlivesReferent,
};

/// Refines `ErrorKind::BorrowConflict`.
enum class ConflictKind {
    MutableWhileImmutablyBorrowed,
    ImmutableWhileMutablyBorrowed,
    MutableWhileMutablyBorrowed,
};

/// The phase that produced a diagnostic, in execution order.
enum class Phase {
    Immutability = 0,
    Moves = 1,
    Borrows = 2,
    Lifetimes = 3,
};

inline constexpr size_t PHASE_COUNT = 4;

[[nodiscard]] auto phase_name(Phase phase) -> const char*;
[[nodiscard]] auto kind_name(ErrorKind kind) -> const char*;

/// The phase responsible for a kind.
[[nodiscard]] auto phase_of(ErrorKind kind) -> Phase;

/// The stable `B0xx` code for a kind.
[[nodiscard]] auto error_code(ErrorKind kind, std::optional<ConflictKind> conflict = std::nullopt)
    -> const char*;

/// A single finding.
struct Diagnostic {
    ErrorKind kind = ErrorKind::ImmutableAssignment;
    std::optional<ConflictKind> conflict;
    std::string code;
    std::string message;
    std::optional<SourceSpan> span;
    std::optional<std::string> suggestion;
    std::vector<std::string> notes;
    std::optional<SourceSpan> related_span;
    std::string related_message;
    Phase phase = Phase::Immutability;

    [[nodiscard]] auto operator==(const Diagnostic& other) const -> bool = default;

    /// One-line rendering: `error[B001]: use of moved value: `a` (main.src:3:9)`.
    [[nodiscard]] auto to_string() const -> std::string;

    // Phase 1
    static auto immutable_assignment(const std::string& name, SourceSpan span,
                                     SourceSpan decl_span) -> Diagnostic;
    static auto immutable_borrow_mut(const std::string& name, SourceSpan span,
                                     SourceSpan decl_span) -> Diagnostic;
    static auto immutable_receiver(const std::string& name, const std::string& method,
                                   SourceSpan span) -> Diagnostic;
    static auto missing_mutation_marker(const std::string& callee, SourceSpan span) -> Diagnostic;
    static auto spurious_mutation_marker(const std::string& callee, SourceSpan span) -> Diagnostic;
    static auto mutable_self_in_immutable_method(const std::string& method, SourceSpan span)
        -> Diagnostic;
    static auto contract_mismatch(const std::string& contract, const std::string& method,
                                  bool declared_mutating, SourceSpan span) -> Diagnostic;
    static auto unsafe_operation(const std::string& operation, SourceSpan span) -> Diagnostic;

    // Phase 2
    static auto use_after_move(const std::string& name, SourceSpan use_span,
                               std::optional<SourceSpan> move_span) -> Diagnostic;
    static auto use_of_uninitialized(const std::string& name, SourceSpan use_span) -> Diagnostic;
    static auto use_of_partially_moved(const std::string& name, SourceSpan use_span,
                                       const std::vector<std::string>& moved_fields,
                                       std::optional<SourceSpan> move_span) -> Diagnostic;

    // Phase 3
    static auto borrow_conflict(ConflictKind conflict, const std::string& place, SourceSpan span,
                                SourceSpan existing_span) -> Diagnostic;
    static auto mutation_while_borrowed(const std::string& place, SourceSpan span,
                                        SourceSpan borrow_span) -> Diagnostic;
    static auto move_while_borrowed(const std::string& place, SourceSpan span,
                                    SourceSpan borrow_span) -> Diagnostic;

    // Phase 4
    static auto return_dangling(const std::string& name, SourceSpan span, SourceSpan decl_span)
        -> Diagnostic;
    static auto outlives_referent(const std::string& name, SourceSpan span, SourceSpan decl_span)
        -> Diagnostic;
};

// ============================================================================
// Sinks
// ============================================================================

/// Append-only collector the phases report into.
class DiagnosticSink {
public:
    virtual ~DiagnosticSink() = default;

    virtual void report(Diagnostic diagnostic) = 0;

    [[nodiscard]] virtual auto error_count() const -> size_t = 0;
};

/// In-memory, ordered sink.
class DiagnosticBuffer : public DiagnosticSink {
public:
    void report(Diagnostic diagnostic) override;

    [[nodiscard]] auto error_count() const -> size_t override {
        return diagnostics_.size();
    }

    [[nodiscard]] auto diagnostics() const -> const std::vector<Diagnostic>& {
        return diagnostics_;
    }

    /// Number of diagnostics of the given kind.
    [[nodiscard]] auto count(ErrorKind kind) const -> size_t;

    [[nodiscard]] auto has(ErrorKind kind) const -> bool {
        return count(kind) > 0;
    }

    /// Forwards every buffered diagnostic to `sink`, in order.
    void append_to(DiagnosticSink& sink) const;

    void clear() {
        diagnostics_.clear();
    }

private:
    std::vector<Diagnostic> diagnostics_;
};

/// Mutex-guarded wrapper for sinks shared between threads.
class SynchronizedSink : public DiagnosticSink {
public:
    explicit SynchronizedSink(DiagnosticSink& inner) : inner_(inner) {}

    void report(Diagnostic diagnostic) override;
    [[nodiscard]] auto error_count() const -> size_t override;

private:
    DiagnosticSink& inner_;
    mutable std::mutex mutex_;
};

} // namespace borrowck::diag

#endif // BORROWCK_DIAG_DIAGNOSTIC_HPP
