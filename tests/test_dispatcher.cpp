/**
 * Dispatcher Tests
 *
 * Driver threads, stop propagation, batch retry and checkpoint resume,
 * exercised against a scripted in-memory oracle.
 */

#include "../src/search/dispatcher.hpp"
#include "../src/core/errors.hpp"
#include <atomic>
#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <thread>

using namespace seedhound;

namespace fs = std::filesystem;

namespace {

// Matches one exact text. Can fail batches, sleep per batch, or raise a
// stop request after a number of batches.
class FakeOracle : public VerificationOracle {
public:
    explicit FakeOracle(std::string target) : target_(std::move(target)) {}

    VerificationResult verify(const VerificationRequest& request) override {
        int call = calls_.fetch_add(1) + 1;
        if (delay_.count() > 0) std::this_thread::sleep_for(delay_);
        if (fail_always_) throw BatchFailure("device lost");
        if (failures_left_.fetch_sub(1) > 0) throw BatchFailure("transient");
        if (stop_after_ > 0 && call >= stop_after_ && stop_) stop_->request(StopReason::INTERRUPTED);

        VerificationResult result;
        for (size_t i = 0; i < request.size(); i++) {
            if (request.candidates[i] == target_) result.matches.push_back(OracleMatch{i, "fake"});
        }
        return result;
    }

    double cost_hint() const override { return 1.0; }
    std::string name() const override { return "fake"; }

    std::atomic<int> calls_{0};
    std::atomic<int> failures_left_{0};
    bool fail_always_ = false;
    std::chrono::milliseconds delay_{0};
    int stop_after_ = 0;
    StopToken* stop_ = nullptr;

private:
    std::string target_;
};

TokenModel tokens(const std::string& text) {
    return TokenListParser().parse_string(text);
}

std::vector<WorkerRange> ranges_for(const CandidateSpace& space, uint32_t devices = 1) {
    return plan_ranges(space.cardinality(), space.fingerprint(), WorkerSelector::single(), devices);
}

DispatchConfig small_batches(size_t batch) {
    DispatchConfig config;
    config.batch_size = batch;
    config.progress_interval = std::chrono::milliseconds(5);
    return config;
}

fs::path temp_dir() {
    fs::path dir = fs::temp_directory_path() / "seedhound_dispatcher_test";
    fs::create_directories(dir);
    return dir;
}

}  // namespace

void test_stop_token() {
    StopToken stop;
    assert(!stop.stop_requested());
    assert(stop.request(StopReason::MATCH_FOUND));
    assert(!stop.request(StopReason::INTERRUPTED));
    assert(stop.reason() == StopReason::MATCH_FOUND);
    stop.reset();
    assert(stop.reason() == StopReason::NONE);

    std::cout << "[PASS] Stop token keeps the first reason\n";
}

void test_match_found() {
    CandidateSpace space(tokens("%2d\n"));
    FakeOracle oracle("42");
    StopToken stop;
    Dispatcher dispatcher(space, oracle, small_batches(8), stop);

    RunOutcome outcome = dispatcher.run(ranges_for(space));
    assert(outcome.status == RunStatus::MATCH_FOUND);
    assert(outcome.match.has_value());
    assert(outcome.match->text == "42");
    assert(outcome.match->ordinal == 42);
    assert(outcome.match->identifier == "fake");
    assert(outcome.drivers.size() == 1);
    assert(outcome.drivers[0].state == WorkerState::MATCH_FOUND);
    assert(outcome.drivers[0].cursor == 43);
    assert(outcome.tested == 43);
    assert(stop.reason() == StopReason::MATCH_FOUND);

    std::cout << "[PASS] Match found\n";
}

void test_exhausted() {
    CandidateSpace space(tokens("%2d\n"));
    FakeOracle oracle("nope");
    StopToken stop;
    Dispatcher dispatcher(space, oracle, small_batches(7), stop);

    ProgressSnapshot last;
    int callbacks = 0;
    dispatcher.set_progress_callback([&](const ProgressSnapshot& snap) {
        last = snap;
        callbacks++;
    });

    RunOutcome outcome = dispatcher.run(ranges_for(space, 3));
    assert(outcome.status == RunStatus::EXHAUSTED);
    assert(!outcome.match.has_value());
    assert(outcome.tested == 100);
    for (const auto& report : outcome.drivers) {
        assert(report.state == WorkerState::EXHAUSTED);
        assert(report.cursor == report.end);
    }
    assert(callbacks >= 1);
    assert(last.covered == 100);
    assert(last.total == 100);
    assert(last.percent() == 100.0);

    std::cout << "[PASS] Exhausted search\n";
}

void test_match_stops_siblings() {
    CandidateSpace space(tokens("%3d\n"));
    FakeOracle oracle("005");
    oracle.delay_ = std::chrono::milliseconds(5);
    StopToken stop;
    Dispatcher dispatcher(space, oracle, small_batches(4), stop);

    RunOutcome outcome = dispatcher.run(ranges_for(space, 4));
    assert(outcome.status == RunStatus::MATCH_FOUND);
    assert(outcome.match->driver == 0);
    assert(outcome.match->text == "005");
    assert(outcome.tested < 1000);
    for (size_t i = 1; i < outcome.drivers.size(); i++) {
        assert(outcome.drivers[i].state == WorkerState::PAUSED);
        assert(outcome.drivers[i].cursor < outcome.drivers[i].end);
    }

    std::cout << "[PASS] Match stops sibling drivers\n";
}

void test_batch_retry() {
    CandidateSpace space(tokens("%2d\n"));
    FakeOracle oracle("13");
    oracle.failures_left_ = 1;
    StopToken stop;
    Dispatcher dispatcher(space, oracle, small_batches(8), stop);

    RunOutcome outcome = dispatcher.run(ranges_for(space));
    assert(outcome.status == RunStatus::MATCH_FOUND);
    assert(outcome.match->ordinal == 13);
    assert(outcome.match->text == "13");

    std::cout << "[PASS] Failed batch retried at half size\n";
}

void test_persistent_failure() {
    CandidateSpace space(tokens("%2d\n"));
    FakeOracle oracle("13");
    oracle.fail_always_ = true;
    StopToken stop;
    Dispatcher dispatcher(space, oracle, small_batches(8), stop);

    bool threw = false;
    try {
        dispatcher.run(ranges_for(space, 2));
    } catch (const OracleError&) {
        threw = true;
    }
    assert(threw);
    assert(stop.reason() == StopReason::FAILED);

    std::cout << "[PASS] Persistent failure raises OracleError\n";
}

void test_interrupt_and_resume() {
    const std::string path = (temp_dir() / "resume.ckpt").string();
    CheckpointManager(path).clear();

    CandidateSpace space(tokens("%3d\n"));
    StopToken stop;

    DispatchConfig config = small_batches(10);
    config.autosave_path = path;

    {
        FakeOracle oracle("700");
        oracle.stop_after_ = 5;
        oracle.stop_ = &stop;
        Dispatcher dispatcher(space, oracle, config, stop);

        RunOutcome outcome = dispatcher.run(ranges_for(space));
        assert(outcome.status == RunStatus::INTERRUPTED);
        assert(outcome.drivers[0].state == WorkerState::PAUSED);
        assert(outcome.drivers[0].cursor == 50);
    }

    auto saved = CheckpointManager(path).load();
    assert(saved.has_value());
    assert(saved->cursor == 50);
    assert(saved->state == WorkerState::PAUSED);

    stop.reset();
    config.restore = true;
    {
        FakeOracle oracle("700");
        Dispatcher dispatcher(space, oracle, config, stop);

        RunOutcome outcome = dispatcher.run(ranges_for(space));
        assert(outcome.status == RunStatus::MATCH_FOUND);
        assert(outcome.drivers[0].restored);
        assert(outcome.match->ordinal == 700);
        assert(outcome.tested == 651);
    }

    // A third run only reports the stored match
    stop.reset();
    {
        FakeOracle oracle("700");
        Dispatcher dispatcher(space, oracle, config, stop);

        RunOutcome outcome = dispatcher.run(ranges_for(space));
        assert(outcome.status == RunStatus::MATCH_FOUND);
        assert(outcome.match->text == "700");
        assert(outcome.tested == 0);
        assert(oracle.calls_ == 0);
    }

    // The checkpoint belongs to another search space
    stop.reset();
    {
        CandidateSpace other(tokens("%2d\n"));
        FakeOracle oracle("700");
        Dispatcher dispatcher(other, oracle, config, stop);

        bool threw = false;
        try {
            dispatcher.run(ranges_for(other));
        } catch (const CheckpointMismatchError&) {
            threw = true;
        }
        assert(threw);
    }

    CheckpointManager(path).clear();
    std::cout << "[PASS] Interrupt and resume\n";
}

void test_autosave_failure_keeps_running() {
    fs::path blocker = temp_dir() / "blocker";
    std::ofstream(blocker) << "x";

    CandidateSpace space(tokens("%2d\n"));
    DispatchConfig config = small_batches(5);
    config.autosave_path = (blocker / "run.ckpt").string();
    config.autosave_interval_candidates = 5;
    config.retry.retries = 1;
    config.retry.initial_backoff = std::chrono::milliseconds(1);

    {
        FakeOracle oracle("77");
        StopToken stop;
        Dispatcher dispatcher(space, oracle, config, stop);

        RunOutcome outcome = dispatcher.run(ranges_for(space));
        assert(outcome.status == RunStatus::MATCH_FOUND);
        assert(outcome.match->ordinal == 77);
        assert(outcome.tested == 78);
    }
    {
        FakeOracle oracle("none");
        StopToken stop;
        Dispatcher dispatcher(space, oracle, config, stop);

        RunOutcome outcome = dispatcher.run(ranges_for(space, 2));
        assert(outcome.status == RunStatus::EXHAUSTED);
        assert(outcome.tested == 100);
    }
    std::error_code ec;
    assert(!fs::exists(config.autosave_path, ec));

    std::cout << "[PASS] Failed autosaves do not stop the run\n";
}

void test_list_candidates() {
    CandidateSpace space(tokens("a b\nx y\n"));
    StopToken stop;
    std::ostringstream out;

    Ordinal printed = list_candidates(space, ranges_for(space, 2), out, stop);
    assert(printed == 4);
    assert(out.str() == "ax\nay\nbx\nby\n");

    stop.request(StopReason::INTERRUPTED);
    std::ostringstream none;
    assert(list_candidates(space, ranges_for(space), none, stop) == 0);

    std::cout << "[PASS] Candidate listing\n";
}

void test_performance() {
    CandidateSpace space(tokens("%2d\n"));
    FakeOracle oracle("42");
    StopToken stop;

    PerformanceResult result = measure_performance(space, oracle, stop, 0.05, 16);
    assert(result.tested > 100);
    assert(result.elapsed_seconds >= 0.05);
    assert(result.rate() > 0.0);

    std::cout << "[PASS] Performance measurement\n";
}

void test_invalid_config() {
    CandidateSpace space(tokens("a\n"));
    FakeOracle oracle("a");
    StopToken stop;

    bool threw = false;
    try {
        Dispatcher dispatcher(space, oracle, small_batches(0), stop);
    } catch (const ConfigurationError&) {
        threw = true;
    }
    assert(threw);

    std::cout << "[PASS] Invalid configuration\n";
}

int main() {
    std::cout << "=== Dispatcher Tests ===\n\n";

    test_stop_token();
    test_match_found();
    test_exhausted();
    test_match_stops_siblings();
    test_batch_retry();
    test_persistent_failure();
    test_interrupt_and_resume();
    test_autosave_failure_keeps_running();
    test_list_candidates();
    test_performance();
    test_invalid_config();

    fs::remove_all(temp_dir());

    std::cout << "\n=== All Tests Passed ===\n";
    return 0;
}
