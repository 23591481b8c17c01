//! # Verifier
//!
//! Runs the four phases over a module and decides whether it may proceed to
//! code generation.
//!
//! ## Pipeline
//!
//! ```text
//! Module ─> collect_units ─┬─> Phase 1: Immutability ─┐
//!                          ├─> Phase 2: Moves         │  every unit, in
//!                          ├─> Phase 3: Borrows       │  declaration order
//!                          └─> Phase 4: Lifetimes ────┘
//!                                        │
//!                                        v
//!                      DiagnosticSink + VerificationResult
//! ```
//!
//! Phases run phase-major: all units through Phase 1, then all through
//! Phase 2, and so on. Later phases run even when earlier ones reported
//! errors. A phase that hits an internal invariant violation on a unit is
//! recorded as an `InternalError` and the walk continues.
//!
//! ## Fail-Fast
//!
//! With `CheckerOptions::max_errors` set, checking stops before the next
//! unit once that many errors were reported, and the result is marked
//! `cancelled`.
//!
//! ## Parallel Checking
//!
//! `verify_parallel` checks `(unit, phase)` pairs on worker threads, each
//! into its own buffer, and merges the buffers in sequential order. The sink
//! sees exactly what `verify` would have reported.
//!
//! ## Logging
//!
//! The verifier logs through `borrowck::log`. An embedding driver configures
//! it once from its own command line before checking:
//!
//! ```cpp
//! log::Logger::init(log::parse_log_options(argc, argv));  // -v, --log-filter=moves=trace
//! Verifier verifier(oracle, contracts, options);
//! auto result = verifier.verify(module, sink);
//! ```

#ifndef BORROWCK_BORROW_VERIFIER_HPP
#define BORROWCK_BORROW_VERIFIER_HPP

#include "borrowck/borrow/closure.hpp"
#include "borrowck/borrow/env.hpp"
#include "borrowck/diag/diagnostic.hpp"
#include "borrowck/types/oracle.hpp"

#include <array>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace borrowck::borrow {

/// A phase aborted on a unit because the tree broke an upstream guarantee.
struct InternalError {
    diag::Phase phase;
    std::string unit;
    std::string message;
};

struct VerificationResult {
    /// True when no phase reported an error and nothing went wrong internally.
    bool pass = false;

    std::array<size_t, diag::PHASE_COUNT> phase_errors{};
    std::vector<InternalError> internal_errors;

    /// Checking stopped early because `max_errors` was reached.
    bool cancelled = false;

    /// Capture analysis of every closure in the module.
    ClosureTable closures;

    [[nodiscard]] auto error_count() const -> size_t;

    [[nodiscard]] auto errors_in(diag::Phase phase) const -> size_t {
        return phase_errors[static_cast<size_t>(phase)];
    }
};

class Verifier {
public:
    Verifier(const types::CopyOracle& oracle, const types::ContractTable& contracts,
             CheckerOptions options = {});

    /// Verifies every unit of `module`, reporting into `sink`.
    auto verify(const ast::Module& module, diag::DiagnosticSink& sink) -> VerificationResult;

    /// Like `verify`, with units checked on `jobs` threads (0 = `options().jobs`,
    /// then hardware concurrency). Reports the same diagnostics in the same order.
    auto verify_parallel(const ast::Module& module, diag::DiagnosticSink& sink, unsigned jobs = 0)
        -> VerificationResult;

    /// Runs all four phases on the unit named `name` (`function` or
    /// `Type::method`) and returns its diagnostics.
    ///
    /// Fails if no such unit exists or a phase hit an internal error.
    [[nodiscard]] auto verify_unit(const ast::Module& module, std::string_view name) const
        -> Result<std::vector<diag::Diagnostic>, std::string>;

    [[nodiscard]] auto options() const -> const CheckerOptions& {
        return options_;
    }

private:
    /// Outcome of one phase on one unit.
    struct PhaseRun {
        diag::DiagnosticBuffer diagnostics;
        std::optional<InternalError> internal;
        ClosureTable closures;
    };

    [[nodiscard]] auto run_phase(diag::Phase phase, const ModuleEnv& env,
                                 const CheckUnit& unit) const -> PhaseRun;

    /// Yields the run of `(phase index, unit index)`, or nullopt if it was
    /// never checked.
    using RunSource = std::function<std::optional<PhaseRun>(size_t, size_t)>;

    /// Folds the runs of `unit_count` units into `sink` in phase-major order,
    /// stopping once `max_errors` is reached.
    auto merge(size_t unit_count, const RunSource& source, diag::DiagnosticSink& sink) const
        -> VerificationResult;

    const types::CopyOracle& oracle_;
    const types::ContractTable& contracts_;
    CheckerOptions options_;
};

} // namespace borrowck::borrow

#endif // BORROWCK_BORROW_VERIFIER_HPP
