//! # Verifier Implementation
//!
//! Every `(phase, unit)` pair is checked by a fresh phase checker into its
//! own `DiagnosticBuffer`. The sequential and parallel drivers differ only in
//! who runs the pairs; both fold the buffers through `merge`, which applies
//! the fail-fast rule and forwards diagnostics in phase-major order.

#include "borrowck/borrow/verifier.hpp"

#include "borrowck/borrow/borrows.hpp"
#include "borrowck/borrow/immutability.hpp"
#include "borrowck/borrow/lifetimes.hpp"
#include "borrowck/borrow/moves.hpp"
#include "borrowck/log/log.hpp"

#include <algorithm>
#include <atomic>
#include <numeric>
#include <thread>

namespace borrowck::borrow {

namespace {

constexpr std::array<diag::Phase, diag::PHASE_COUNT> PHASES = {
    diag::Phase::Immutability,
    diag::Phase::Moves,
    diag::Phase::Borrows,
    diag::Phase::Lifetimes,
};

} // namespace

auto VerificationResult::error_count() const -> size_t {
    return std::accumulate(phase_errors.begin(), phase_errors.end(), size_t{0});
}

Verifier::Verifier(const types::CopyOracle& oracle, const types::ContractTable& contracts,
                   CheckerOptions options)
    : oracle_(oracle), contracts_(contracts), options_(std::move(options)) {}

// ============================================================================
// Single phase
// ============================================================================

auto Verifier::run_phase(diag::Phase phase, const ModuleEnv& env, const CheckUnit& unit) const
    -> PhaseRun {
    PhaseRun run;
    try {
        switch (phase) {
        case diag::Phase::Immutability: {
            ImmutabilityChecker checker(env, contracts_, options_);
            checker.check(unit, run.diagnostics);
            break;
        }
        case diag::Phase::Moves: {
            MoveChecker checker(env, oracle_);
            checker.check(unit, run.diagnostics);
            break;
        }
        case diag::Phase::Borrows: {
            BorrowChecker checker(env, oracle_, options_);
            checker.check(unit, run.diagnostics);
            run.closures = checker.closures();
            break;
        }
        case diag::Phase::Lifetimes: {
            LifetimeChecker checker(env, oracle_);
            checker.check(unit, run.diagnostics);
            break;
        }
        }
    } catch (const InvariantViolation& e) {
        BORROWCK_LOG_ERROR("verify", diag::phase_name(phase) << " aborted on "
                                                            << unit.qualified_name() << ": "
                                                            << e.what());
        // Diagnostics from a half-finished walk are not trustworthy.
        run.diagnostics.clear();
        run.internal = InternalError{phase, unit.qualified_name(), e.what()};
    }
    return run;
}

// ============================================================================
// Merging
// ============================================================================

auto Verifier::merge(size_t unit_count, const RunSource& source,
                     diag::DiagnosticSink& sink) const -> VerificationResult {
    VerificationResult result;
    size_t reported = 0;

    for (size_t p = 0; p < PHASES.size() && !result.cancelled; ++p) {
        BORROWCK_LOG_DEBUG("verify", "phase " << diag::phase_name(PHASES[p]));
        for (size_t u = 0; u < unit_count; ++u) {
            if (options_.max_errors > 0 && reported >= options_.max_errors) {
                result.cancelled = true;
                break;
            }
            auto run = source(p, u);
            if (!run) {
                result.cancelled = true;
                break;
            }
            run->diagnostics.append_to(sink);
            reported += run->diagnostics.error_count();
            result.phase_errors[p] += run->diagnostics.error_count();
            if (run->internal) {
                result.internal_errors.push_back(std::move(*run->internal));
            }
            result.closures.merge(run->closures);
        }
        BORROWCK_LOG_DEBUG("verify", diag::phase_name(PHASES[p])
                                         << ": " << result.phase_errors[p] << " error(s)");
    }

    if (result.cancelled) {
        BORROWCK_LOG_INFO("verify", "stopped after " << reported << " error(s)");
    }
    result.pass = result.error_count() == 0 && result.internal_errors.empty() && !result.cancelled;
    return result;
}

// ============================================================================
// Drivers
// ============================================================================

auto Verifier::verify(const ast::Module& module, diag::DiagnosticSink& sink)
    -> VerificationResult {
    auto env = ModuleEnv::from_module(module);
    auto units = collect_units(module);
    BORROWCK_LOG_DEBUG("verify", "verifying " << units.size() << " unit(s)");

    // Runs on demand, so fail-fast skips the remaining work.
    return merge(
        units.size(),
        [&](size_t p, size_t u) -> std::optional<PhaseRun> {
            return run_phase(PHASES[p], env, units[u]);
        },
        sink);
}

auto Verifier::verify_parallel(const ast::Module& module, diag::DiagnosticSink& sink,
                               unsigned jobs) -> VerificationResult {
    auto env = ModuleEnv::from_module(module);
    auto units = collect_units(module);

    if (jobs == 0) {
        jobs = options_.jobs;
    }
    if (jobs == 0) {
        jobs = std::max(1U, std::thread::hardware_concurrency());
    }

    size_t total = units.size() * PHASES.size();
    jobs = static_cast<unsigned>(std::min<size_t>(jobs, std::max<size_t>(total, 1)));
    BORROWCK_LOG_DEBUG("verify", "verifying " << units.size() << " unit(s) on " << jobs
                                              << " thread(s)");

    std::vector<std::vector<std::optional<PhaseRun>>> runs(PHASES.size());
    for (auto& phase_runs : runs) {
        phase_runs.resize(units.size());
    }

    // Tasks are taken in phase-major order, so with fail-fast the work left
    // undone is always a suffix of the sequential order.
    std::atomic<size_t> next{0};
    std::atomic<size_t> reported{0};
    auto worker = [&]() {
        for (;;) {
            if (options_.max_errors > 0 && reported.load() >= options_.max_errors) {
                return;
            }
            size_t task = next.fetch_add(1);
            if (task >= total) {
                return;
            }
            size_t p = task / units.size();
            size_t u = task % units.size();
            auto run = run_phase(PHASES[p], env, units[u]);
            reported.fetch_add(run.diagnostics.error_count());
            runs[p][u] = std::move(run);
        }
    };

    std::vector<std::thread> threads;
    threads.reserve(jobs);
    for (unsigned i = 0; i < jobs; ++i) {
        threads.emplace_back(worker);
    }
    for (auto& thread : threads) {
        thread.join();
    }

    return merge(
        units.size(),
        [&](size_t p, size_t u) { return std::move(runs[p][u]); },
        sink);
}

auto Verifier::verify_unit(const ast::Module& module, std::string_view name) const
    -> Result<std::vector<diag::Diagnostic>, std::string> {
    auto units = collect_units(module);
    auto it = std::find_if(units.begin(), units.end(), [&](const CheckUnit& unit) {
        return unit.qualified_name() == name;
    });
    if (it == units.end()) {
        return "no function named `" + std::string(name) + "`";
    }

    auto env = ModuleEnv::from_module(module);
    std::vector<diag::Diagnostic> diagnostics;
    for (auto phase : PHASES) {
        auto run = run_phase(phase, env, *it);
        if (run.internal) {
            return std::string(diag::phase_name(phase)) + ": " + run.internal->message;
        }
        const auto& found = run.diagnostics.diagnostics();
        diagnostics.insert(diagnostics.end(), found.begin(), found.end());
    }
    return diagnostics;
}

} // namespace borrowck::borrow
