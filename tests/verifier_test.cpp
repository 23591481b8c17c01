//! # Verifier Unit Tests
//!
//! Phase ordering, fail-fast, the parallel driver, internal errors and
//! single-unit checks.

#include "borrowck/borrow/verifier.hpp"
#include "borrowck/log/log.hpp"
#include "test_util.hpp"

#include <thread>
#include <vector>

using namespace borrowck;
using namespace borrowck::test;
using borrowck::diag::Phase;

class VerifierTest : public ModuleTest {
protected:
    auto verify(diag::DiagnosticBuffer& sink) -> borrow::VerificationResult {
        contracts = types::ContractTable::from_module(module);
        borrow::Verifier verifier(oracle, contracts, options);
        return verifier.verify(module, sink);
    }

    auto verify_parallel(diag::DiagnosticBuffer& sink, unsigned jobs)
        -> borrow::VerificationResult {
        contracts = types::ContractTable::from_module(module);
        borrow::Verifier verifier(oracle, contracts, options);
        return verifier.verify_parallel(module, sink, jobs);
    }

    /// Four units, each with one error from a different phase, declared in
    /// reverse phase order.
    void add_one_error_per_phase() {
        add_fn("d", list_of<StmtPtr>(make_let("x", false, make_int(1)),
                                     stmt(make_assign(ident("x"), make_int(2)))));
        add_fn("c", list_of<StmtPtr>(make_let("b", false, new_buffer()),
                                     stmt(call("consume", list_of<ExprPtr>(ident("b")))),
                                     stmt(call("consume", list_of<ExprPtr>(ident("b"))))));
        add_fn("b", list_of<StmtPtr>(make_let("b", true, new_buffer()),
                                     make_let("r", false, make_ref(ident("b"))),
                                     make_let("m", false, make_ref_mut(ident("b")))));
        add_fn("a", list_of<StmtPtr>(make_let("n", false, make_int(1))), make_ref(ident("n")),
               types::make_ref(types::make_i32()));
    }

    void add_clean_fn(const std::string& name) {
        add_fn(name, list_of<StmtPtr>(make_let("b", true, new_buffer()),
                                      stmt(push(ident("b"), len(ident("b")))),
                                      stmt(call("inspect", list_of<ExprPtr>(make_ref(ident("b"))))),
                                      stmt(call("consume", list_of<ExprPtr>(ident("b"))))));
    }

    void add_broken_fn(const std::string& name) {
        add_fn(name, list_of<StmtPtr>(stmt(make_assign(ident("ghost"), make_int(1)))));
    }
};

// ============================================================================
// 1 — Sequential Verification
// ============================================================================

TEST_F(VerifierTest, CleanModulePasses) {
    add_clean_fn("f");
    add_clean_fn("g");

    diag::DiagnosticBuffer sink;
    auto result = verify(sink);

    EXPECT_TRUE(result.pass);
    EXPECT_EQ(result.error_count(), 0u);
    EXPECT_TRUE(result.internal_errors.empty());
    EXPECT_FALSE(result.cancelled);
    EXPECT_EQ(sink.error_count(), 0u);
}

TEST_F(VerifierTest, DiagnosticsArePhaseMajor) {
    add_one_error_per_phase();

    diag::DiagnosticBuffer sink;
    auto result = verify(sink);

    EXPECT_FALSE(result.pass);
    EXPECT_EQ(codes(sink), (std::vector<std::string>{"B003", "B001", "B007", "B010"}));
    EXPECT_EQ(result.errors_in(Phase::Immutability), 1u);
    EXPECT_EQ(result.errors_in(Phase::Moves), 1u);
    EXPECT_EQ(result.errors_in(Phase::Borrows), 1u);
    EXPECT_EQ(result.errors_in(Phase::Lifetimes), 1u);
    EXPECT_EQ(result.error_count(), 4u);
}

TEST_F(VerifierTest, FailFastStopsAtMaxErrors) {
    add_one_error_per_phase();
    options.max_errors = 1;

    diag::DiagnosticBuffer sink;
    auto result = verify(sink);

    EXPECT_TRUE(result.cancelled);
    EXPECT_FALSE(result.pass);
    EXPECT_EQ(result.error_count(), 1u);
    EXPECT_EQ(codes(sink), std::vector<std::string>{"B003"});
}

TEST_F(VerifierTest, MaxErrorsAboveTotalDoesNotCancel) {
    add_one_error_per_phase();
    options.max_errors = 10;

    diag::DiagnosticBuffer sink;
    auto result = verify(sink);

    EXPECT_FALSE(result.cancelled);
    EXPECT_EQ(result.error_count(), 4u);
}

TEST_F(VerifierTest, InternalErrorDoesNotStopOtherUnits) {
    add_broken_fn("broken");
    add_one_error_per_phase();

    diag::DiagnosticBuffer sink;
    auto result = verify(sink);

    EXPECT_FALSE(result.pass);
    ASSERT_EQ(result.internal_errors.size(), 4u);
    EXPECT_EQ(result.internal_errors[0].phase, Phase::Immutability);
    EXPECT_EQ(result.internal_errors[0].unit, "broken");
    EXPECT_NE(result.internal_errors[0].message.find("`ghost`"), std::string::npos);
    EXPECT_EQ(result.internal_errors[3].phase, Phase::Lifetimes);
    EXPECT_EQ(codes(sink), (std::vector<std::string>{"B003", "B001", "B007", "B010"}));
}

TEST_F(VerifierTest, VerificationIsRepeatable) {
    add_one_error_per_phase();

    diag::DiagnosticBuffer first;
    diag::DiagnosticBuffer second;
    (void)verify(first);
    (void)verify(second);

    EXPECT_EQ(first.diagnostics(), second.diagnostics());
}

TEST_F(VerifierTest, ResultCollectsClosures) {
    add_fn("f", list_of<StmtPtr>(make_let("b", false, new_buffer()),
                                 make_let("g", false, make_closure({}, len(ident("b"))))));
    add_fn("h", list_of<StmtPtr>(make_let("b", false, new_buffer()),
                                 make_let("k", false, make_closure({}, call("consume",
                                                                            list_of<ExprPtr>(
                                                                                ident("b")))))));

    diag::DiagnosticBuffer sink;
    auto result = verify(sink);

    EXPECT_TRUE(result.pass);
    EXPECT_EQ(result.closures.size(), 2u);
}

// ============================================================================
// 2 — Parallel Verification
// ============================================================================

TEST_F(VerifierTest, ParallelMatchesSequential) {
    add_broken_fn("broken");
    add_one_error_per_phase();
    add_clean_fn("e");
    add_one_error_per_phase();

    diag::DiagnosticBuffer sequential;
    auto seq = verify(sequential);
    diag::DiagnosticBuffer parallel;
    auto par = verify_parallel(parallel, 4);

    EXPECT_EQ(sequential.diagnostics(), parallel.diagnostics());
    EXPECT_EQ(seq.phase_errors, par.phase_errors);
    EXPECT_EQ(seq.internal_errors.size(), par.internal_errors.size());
    EXPECT_EQ(seq.pass, par.pass);
}

TEST_F(VerifierTest, ParallelFailFastReportsPrefix) {
    add_one_error_per_phase();
    options.max_errors = 2;

    diag::DiagnosticBuffer sink;
    auto result = verify_parallel(sink, 3);

    EXPECT_TRUE(result.cancelled);
    EXPECT_EQ(codes(sink), (std::vector<std::string>{"B003", "B001"}));
}

TEST_F(VerifierTest, ParallelSingleThread) {
    add_one_error_per_phase();

    diag::DiagnosticBuffer sink;
    auto result = verify_parallel(sink, 1);

    EXPECT_EQ(result.error_count(), 4u);
    EXPECT_EQ(codes(sink), (std::vector<std::string>{"B003", "B001", "B007", "B010"}));
}

// ============================================================================
// 3 — Single Unit
// ============================================================================

TEST_F(VerifierTest, VerifyUnitRunsAllPhases) {
    add_one_error_per_phase();
    contracts = types::ContractTable::from_module(module);
    borrow::Verifier verifier(oracle, contracts, options);

    auto result = verifier.verify_unit(module, "c");
    ASSERT_TRUE(is_ok(result));
    const auto& diags = unwrap(result);
    ASSERT_EQ(diags.size(), 1u);
    EXPECT_EQ(diags[0].code, "B001");
}

TEST_F(VerifierTest, VerifyUnitFindsMethods) {
    auto peek = make_method("peek", types::ReceiverKind::Ref, false, {}, types::make_i32(),
                            make_block({}, make_int(0)));
    module.decls.push_back(make_impl_decl("", "Buffer", list_of<FuncDecl>(std::move(peek))));
    contracts = types::ContractTable::from_module(module);
    borrow::Verifier verifier(oracle, contracts, options);

    auto result = verifier.verify_unit(module, "Buffer::peek");
    ASSERT_TRUE(is_ok(result));
    EXPECT_TRUE(unwrap(result).empty());
}

TEST_F(VerifierTest, VerifyUnitMissing) {
    add_clean_fn("f");
    borrow::Verifier verifier(oracle, contracts, options);

    auto result = verifier.verify_unit(module, "nope");
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result), "no function named `nope`");
}

TEST_F(VerifierTest, VerifyUnitInternalError) {
    add_broken_fn("broken");
    borrow::Verifier verifier(oracle, contracts, options);

    auto result = verifier.verify_unit(module, "broken");
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).rfind("immutability: ", 0), 0u);
    EXPECT_NE(unwrap_err(result).find("`ghost`"), std::string::npos);
}

// ============================================================================
// 4 — Diagnostic Sinks
// ============================================================================

TEST(DiagnosticSinkTest, BufferCountsByKind) {
    diag::DiagnosticBuffer buffer;
    buffer.report(diag::Diagnostic::use_after_move("a", at(3, 9), at(2, 5)));
    buffer.report(diag::Diagnostic::use_after_move("b", at(4, 9), std::nullopt));
    buffer.report(diag::Diagnostic::return_dangling("c", at(5, 1), at(1, 1)));

    EXPECT_EQ(buffer.error_count(), 3u);
    EXPECT_EQ(buffer.count(diag::ErrorKind::UseAfterMove), 2u);
    EXPECT_TRUE(buffer.has(diag::ErrorKind::ReturnDanglingReference));
    EXPECT_FALSE(buffer.has(diag::ErrorKind::ImmutableAssignment));
    EXPECT_EQ(diag::phase_of(diag::ErrorKind::ReturnDanglingReference), Phase::Lifetimes);

    diag::DiagnosticBuffer target;
    buffer.append_to(target);
    EXPECT_EQ(target.diagnostics(), buffer.diagnostics());

    buffer.clear();
    EXPECT_EQ(buffer.error_count(), 0u);
}

TEST(DiagnosticSinkTest, OneLineRendering) {
    auto d = diag::Diagnostic::use_after_move("a", at(3, 9), at(2, 5));
    EXPECT_EQ(d.to_string(), "error[B001]: use of moved value: `a` (<input>:3:9)");

    auto unplaced = diag::Diagnostic::use_after_move("a", SourceSpan{}, std::nullopt);
    EXPECT_FALSE(unplaced.span.has_value());
    EXPECT_EQ(unplaced.to_string(), "error[B001]: use of moved value: `a`");
}

TEST(DiagnosticSinkTest, SynchronizedSinkFromManyThreads) {
    diag::DiagnosticBuffer buffer;
    diag::SynchronizedSink shared(buffer);

    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&shared, t]() {
            for (int i = 0; i < 50; ++i) {
                shared.report(diag::Diagnostic::use_after_move(
                    "v" + std::to_string(t), at(static_cast<uint32_t>(i + 1)), std::nullopt));
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(shared.error_count(), 400u);
    EXPECT_EQ(buffer.count(diag::ErrorKind::UseAfterMove), 400u);
}

// ============================================================================
// 5 — Logging
// ============================================================================

TEST_F(VerifierTest, LogsPhasesAtDebug) {
    log::LogConfig config;
    config.level = log::LogLevel::Debug;
    config.console = false;
    log::Logger::init(config);
    auto sink_ptr = std::make_unique<log::MemorySink>();
    auto* memory = sink_ptr.get();
    log::Logger::instance().add_sink(std::move(sink_ptr));

    add_broken_fn("broken");
    diag::DiagnosticBuffer sink;
    (void)verify(sink);

    EXPECT_TRUE(memory->contains("phase immutability"));
    EXPECT_TRUE(memory->contains("phase lifetimes"));
    EXPECT_TRUE(memory->contains("aborted on broken"));

    log::Logger::init(log::LogConfig{});
}
