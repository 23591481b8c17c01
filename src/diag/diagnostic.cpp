//! # Diagnostics
//!
//! Kind metadata, the `Diagnostic` factories, and the sink implementations.
//!
//! Each factory fills in the code, the phase, a primary message, and where it
//! helps, a related span and a suggestion. Messages name the offending
//! binding or place in backticks.

#include "borrowck/diag/diagnostic.hpp"

#include <sstream>

namespace borrowck::diag {

auto phase_name(Phase phase) -> const char* {
    switch (phase) {
    case Phase::Immutability:
        return "immutability";
    case Phase::Moves:
        return "moves";
    case Phase::Borrows:
        return "borrows";
    case Phase::Lifetimes:
        return "lifetimes";
    }
    return "?";
}

auto kind_name(ErrorKind kind) -> const char* {
    switch (kind) {
    case ErrorKind::ImmutableAssignment:
        return "ImmutableAssignment";
    case ErrorKind::MissingMutationMarker:
        return "MissingMutationMarker";
    case ErrorKind::SpuriousMutationMarker:
        return "SpuriousMutationMarker";
    case ErrorKind::MutableSelfInImmutableMethod:
        return "MutableSelfInImmutableMethod";
    case ErrorKind::MutabilityContractMismatch:
        return "MutabilityContractMismatch";
    case ErrorKind::UnsafeOperationOutsideUnsafeBlock:
        return "UnsafeOperationOutsideUnsafeBlock";
    case ErrorKind::UseAfterMove:
        return "UseAfterMove";
    case ErrorKind::UseOfPartiallyMovedValue:
        return "UseOfPartiallyMovedValue";
    case ErrorKind::BorrowConflict:
        return "BorrowConflict";
    case ErrorKind::MutationWhileBorrowed:
        return "MutationWhileBorrowed";
    case ErrorKind::MoveWhileBorrowed:
        return "MoveWhileBorrowed";
    case ErrorKind::ReturnDanglingReference:
        return "ReturnDanglingReference";
    case ErrorKind::ReferenceOutlivesReferent:
        return "ReferenceOutlivesReferent";
    }
    return "?";
}

auto phase_of(ErrorKind kind) -> Phase {
    switch (kind) {
    case ErrorKind::ImmutableAssignment:
    case ErrorKind::MissingMutationMarker:
    case ErrorKind::SpuriousMutationMarker:
    case ErrorKind::MutableSelfInImmutableMethod:
    case ErrorKind::MutabilityContractMismatch:
    case ErrorKind::UnsafeOperationOutsideUnsafeBlock:
        return Phase::Immutability;
    case ErrorKind::UseAfterMove:
    case ErrorKind::UseOfPartiallyMovedValue:
        return Phase::Moves;
    case ErrorKind::BorrowConflict:
    case ErrorKind::MutationWhileBorrowed:
    case ErrorKind::MoveWhileBorrowed:
        return Phase::Borrows;
    case ErrorKind::ReturnDanglingReference:
    case ErrorKind::ReferenceOutlivesReferent:
        return Phase::Lifetimes;
    }
    return Phase::Immutability;
}

auto error_code(ErrorKind kind, std::optional<ConflictKind> conflict) -> const char* {
    switch (kind) {
    case ErrorKind::UseAfterMove:
        return "B001";
    case ErrorKind::MoveWhileBorrowed:
        return "B002";
    case ErrorKind::ImmutableAssignment:
        return "B003";
    case ErrorKind::MutationWhileBorrowed:
        return "B004";
    case ErrorKind::BorrowConflict:
        if (conflict == ConflictKind::MutableWhileMutablyBorrowed)
            return "B008";
        if (conflict == ConflictKind::ImmutableWhileMutablyBorrowed)
            return "B009";
        return "B007";
    case ErrorKind::ReturnDanglingReference:
        return "B010";
    case ErrorKind::UseOfPartiallyMovedValue:
        return "B011";
    case ErrorKind::ReferenceOutlivesReferent:
        return "B012";
    case ErrorKind::MissingMutationMarker:
        return "B013";
    case ErrorKind::SpuriousMutationMarker:
        return "B014";
    case ErrorKind::MutableSelfInImmutableMethod:
        return "B015";
    case ErrorKind::MutabilityContractMismatch:
        return "B016";
    case ErrorKind::UnsafeOperationOutsideUnsafeBlock:
        return "B017";
    }
    return "B000";
}

namespace {

auto make(ErrorKind kind, std::string message, SourceSpan span) -> Diagnostic {
    Diagnostic diag;
    diag.kind = kind;
    diag.code = error_code(kind);
    diag.message = std::move(message);
    if (span.is_known()) {
        diag.span = span;
    }
    diag.phase = phase_of(kind);
    return diag;
}

void relate(Diagnostic& diag, std::optional<SourceSpan> span, std::string message) {
    if (span && span->is_known()) {
        diag.related_span = *span;
        diag.related_message = std::move(message);
    }
}

auto quoted(const std::string& name) -> std::string {
    return "`" + name + "`";
}

} // namespace

auto Diagnostic::to_string() const -> std::string {
    std::ostringstream oss;
    oss << "error[" << code << "]: " << message;
    if (span) {
        oss << " (" << span_to_string(*span) << ")";
    }
    return oss.str();
}

// ============================================================================
// Phase 1 factories
// ============================================================================

auto Diagnostic::immutable_assignment(const std::string& name, SourceSpan span,
                                      SourceSpan decl_span) -> Diagnostic {
    auto diag = make(ErrorKind::ImmutableAssignment,
                     "cannot assign to immutable variable " + quoted(name), span);
    relate(diag, decl_span, quoted(name) + " is declared here");
    diag.suggestion = "consider making this binding mutable: `mut " + name + "`";
    return diag;
}

auto Diagnostic::immutable_borrow_mut(const std::string& name, SourceSpan span,
                                      SourceSpan decl_span) -> Diagnostic {
    auto diag = make(ErrorKind::ImmutableAssignment,
                     "cannot borrow immutable variable " + quoted(name) + " as mutable", span);
    relate(diag, decl_span, quoted(name) + " is declared here");
    diag.suggestion = "consider making this binding mutable: `mut " + name + "`";
    return diag;
}

auto Diagnostic::immutable_receiver(const std::string& name, const std::string& method,
                                    SourceSpan span) -> Diagnostic {
    auto diag = make(ErrorKind::ImmutableAssignment,
                     "cannot call mutating method " + quoted(method) + " on immutable variable " +
                         quoted(name),
                     span);
    diag.suggestion = "consider making this binding mutable: `mut " + name + "`";
    return diag;
}

auto Diagnostic::missing_mutation_marker(const std::string& callee, SourceSpan span)
    -> Diagnostic {
    auto diag = make(ErrorKind::MissingMutationMarker,
                     "mutable method " + quoted(callee) + " requires '!'", span);
    diag.suggestion = "call it as `" + callee + "!(...)`";
    return diag;
}

auto Diagnostic::spurious_mutation_marker(const std::string& callee, SourceSpan span)
    -> Diagnostic {
    auto diag = make(ErrorKind::SpuriousMutationMarker,
                     "method " + quoted(callee) + " is immutable, cannot use '!'", span);
    diag.suggestion = "remove the '!' marker";
    return diag;
}

auto Diagnostic::mutable_self_in_immutable_method(const std::string& method, SourceSpan span)
    -> Diagnostic {
    auto diag = make(ErrorKind::MutableSelfInImmutableMethod,
                     "cannot mutate `self` in immutable method " + quoted(method), span);
    diag.notes.push_back("the method is not declared mutating");
    diag.suggestion = "declare the method as mutating: `" + method + "!`";
    return diag;
}

auto Diagnostic::contract_mismatch(const std::string& contract, const std::string& method,
                                   bool declared_mutating, SourceSpan span) -> Diagnostic {
    std::string expected = declared_mutating ? "mutating" : "non-mutating";
    std::string actual = declared_mutating ? "non-mutating" : "mutating";
    auto diag = make(ErrorKind::MutabilityContractMismatch,
                     "method " + quoted(method) + " is " + actual + " but contract " +
                         quoted(contract) + " declares it " + expected,
                     span);
    diag.notes.push_back("implementations must keep the mutability of the contract method");
    return diag;
}

auto Diagnostic::unsafe_operation(const std::string& operation, SourceSpan span) -> Diagnostic {
    auto diag = make(ErrorKind::UnsafeOperationOutsideUnsafeBlock,
                     "unsafe operation " + quoted(operation) + " requires unsafe block", span);
    diag.suggestion = "wrap the operation in a `unsafe { ... }` block";
    return diag;
}

// ============================================================================
// Phase 2 factories
// ============================================================================

auto Diagnostic::use_after_move(const std::string& name, SourceSpan use_span,
                                std::optional<SourceSpan> move_span) -> Diagnostic {
    auto diag = make(ErrorKind::UseAfterMove, "use of moved value: " + quoted(name), use_span);
    relate(diag, move_span, "value moved here");
    diag.notes.push_back("move occurs because " + quoted(name) +
                         " has a type that does not implement Copy");
    diag.suggestion = "consider cloning the value before the move";
    return diag;
}

auto Diagnostic::use_of_uninitialized(const std::string& name, SourceSpan use_span)
    -> Diagnostic {
    auto diag = make(ErrorKind::UseAfterMove,
                     "use of possibly-uninitialized variable: " + quoted(name), use_span);
    diag.notes.push_back(quoted(name) + " is not assigned on every path reaching this use");
    return diag;
}

auto Diagnostic::use_of_partially_moved(const std::string& name, SourceSpan use_span,
                                        const std::vector<std::string>& moved_fields,
                                        std::optional<SourceSpan> move_span) -> Diagnostic {
    auto diag = make(ErrorKind::UseOfPartiallyMovedValue,
                     "use of partially moved value: " + quoted(name), use_span);
    relate(diag, move_span, "field moved here");
    for (const auto& field : moved_fields) {
        diag.notes.push_back("field " + quoted(name + "." + field) + " was moved");
    }
    return diag;
}

// ============================================================================
// Phase 3 factories
// ============================================================================

auto Diagnostic::borrow_conflict(ConflictKind conflict, const std::string& place, SourceSpan span,
                                 SourceSpan existing_span) -> Diagnostic {
    std::string message;
    std::string related;
    switch (conflict) {
    case ConflictKind::MutableWhileImmutablyBorrowed:
        message = "cannot borrow " + quoted(place) +
                  " as mutable because it is also borrowed as immutable";
        related = "immutable borrow occurs here";
        break;
    case ConflictKind::ImmutableWhileMutablyBorrowed:
        message = "cannot borrow " + quoted(place) +
                  " as immutable because it is also borrowed as mutable";
        related = "mutable borrow occurs here";
        break;
    case ConflictKind::MutableWhileMutablyBorrowed:
        message = "cannot borrow " + quoted(place) + " as mutable more than once at a time";
        related = "first mutable borrow occurs here";
        break;
    }
    auto diag = make(ErrorKind::BorrowConflict, std::move(message), span);
    diag.conflict = conflict;
    diag.code = error_code(ErrorKind::BorrowConflict, conflict);
    relate(diag, existing_span, std::move(related));
    diag.notes.push_back("the earlier borrow is live until the end of its scope");
    return diag;
}

auto Diagnostic::mutation_while_borrowed(const std::string& place, SourceSpan span,
                                         SourceSpan borrow_span) -> Diagnostic {
    auto diag = make(ErrorKind::MutationWhileBorrowed,
                     "cannot assign to " + quoted(place) + " because it is borrowed", span);
    relate(diag, borrow_span, "borrow of " + quoted(place) + " occurs here");
    return diag;
}

auto Diagnostic::move_while_borrowed(const std::string& place, SourceSpan span,
                                     SourceSpan borrow_span) -> Diagnostic {
    auto diag = make(ErrorKind::MoveWhileBorrowed,
                     "cannot move out of " + quoted(place) + " because it is borrowed", span);
    relate(diag, borrow_span, "borrow of " + quoted(place) + " occurs here");
    return diag;
}

// ============================================================================
// Phase 4 factories
// ============================================================================

auto Diagnostic::return_dangling(const std::string& name, SourceSpan span, SourceSpan decl_span)
    -> Diagnostic {
    auto diag = make(ErrorKind::ReturnDanglingReference,
                     "cannot return reference to local variable " + quoted(name), span);
    relate(diag, decl_span, quoted(name) + " is declared here");
    diag.notes.push_back("returns a reference to data owned by the current function");
    diag.suggestion = "consider returning an owned value instead";
    return diag;
}

auto Diagnostic::outlives_referent(const std::string& name, SourceSpan span, SourceSpan decl_span)
    -> Diagnostic {
    auto diag = make(ErrorKind::ReferenceOutlivesReferent,
                     quoted(name) + " does not live long enough", span);
    relate(diag, decl_span, quoted(name) + " is declared here");
    diag.notes.push_back("the reference is stored somewhere that outlives " + quoted(name));
    return diag;
}

// ============================================================================
// Sinks
// ============================================================================

void DiagnosticBuffer::report(Diagnostic diagnostic) {
    diagnostics_.push_back(std::move(diagnostic));
}

auto DiagnosticBuffer::count(ErrorKind kind) const -> size_t {
    size_t n = 0;
    for (const auto& diag : diagnostics_) {
        if (diag.kind == kind) {
            ++n;
        }
    }
    return n;
}

void DiagnosticBuffer::append_to(DiagnosticSink& sink) const {
    for (const auto& diag : diagnostics_) {
        sink.report(diag);
    }
}

void SynchronizedSink::report(Diagnostic diagnostic) {
    std::lock_guard<std::mutex> lock(mutex_);
    inner_.report(std::move(diagnostic));
}

auto SynchronizedSink::error_count() const -> size_t {
    std::lock_guard<std::mutex> lock(mutex_);
    return inner_.error_count();
}

} // namespace borrowck::diag
