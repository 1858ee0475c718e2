/**
 * Seedhound Verification Dispatcher
 *
 * Runs one driver thread per WorkerRange. Each driver pulls batches of
 * ordinals from its cursor, decodes them through the CandidateSpace and
 * hands them to the oracle. The first match stops every driver of the
 * process at its next batch boundary.
 *
 * Shared mutable state is limited to the StopToken, the match slot and the
 * progress counters; ranges and checkpoints belong to their driver.
 */

#pragma once

#include "../core/types.hpp"
#include "../generators/candidate_space.hpp"
#include "../oracle/oracle.hpp"
#include "checkpoint.hpp"
#include "partition.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <iosfwd>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace seedhound {

enum class StopReason : uint8_t {
    NONE = 0,
    MATCH_FOUND = 1,
    INTERRUPTED = 2,
    FAILED = 3,
};

const char* stop_reason_name(StopReason reason);

/**
 * Global stop flag. Lock-free, so request() may be called from a signal
 * handler. The first reason set wins.
 */
class StopToken {
public:
    bool request(StopReason reason) noexcept {
        uint8_t expected = static_cast<uint8_t>(StopReason::NONE);
        return reason_.compare_exchange_strong(expected, static_cast<uint8_t>(reason),
                                               std::memory_order_release,
                                               std::memory_order_acquire);
    }

    bool stop_requested() const noexcept {
        return reason_.load(std::memory_order_acquire) != static_cast<uint8_t>(StopReason::NONE);
    }

    StopReason reason() const noexcept {
        return static_cast<StopReason>(reason_.load(std::memory_order_acquire));
    }

    void reset() noexcept { reason_.store(static_cast<uint8_t>(StopReason::NONE), std::memory_order_release); }

private:
    std::atomic<uint8_t> reason_{static_cast<uint8_t>(StopReason::NONE)};
};

struct FoundCandidate {
    uint32_t driver = 0;
    Ordinal ordinal;
    std::string text;
    std::string identifier;      // oracle supplied (address, path, digest)
};

struct DispatchConfig {
    size_t batch_size = 4096;
    double autosave_interval_seconds = 300.0;
    uint64_t autosave_interval_candidates = 0;   // 0 = time based only
    std::string autosave_path;                   // empty = no checkpoints
    bool restore = false;
    std::chrono::milliseconds progress_interval{1000};
    RetryPolicy retry;
};

struct DriverReport {
    uint32_t driver = 0;
    WorkerState state = WorkerState::IDLE;
    Ordinal start;
    Ordinal end;
    Ordinal cursor;
    uint64_t tested = 0;         // in this run, excluding restored progress
    bool restored = false;
};

enum class RunStatus : uint8_t {
    MATCH_FOUND = 0,
    EXHAUSTED = 1,
    INTERRUPTED = 2,
};

const char* run_status_name(RunStatus status);

struct RunOutcome {
    RunStatus status = RunStatus::EXHAUSTED;
    std::optional<FoundCandidate> match;
    std::vector<DriverReport> drivers;
    uint64_t tested = 0;
    double elapsed_seconds = 0.0;
};

struct ProgressSnapshot {
    uint64_t tested = 0;         // this run
    Ordinal covered;             // including restored progress
    Ordinal total;               // sum of all driver ranges
    double elapsed_seconds = 0.0;

    double rate() const { return elapsed_seconds > 0 ? tested / elapsed_seconds : 0.0; }
    double percent() const;
    /** Seconds to finish at the current rate, or a negative value if unknown. */
    double eta_seconds() const;
};

using ProgressCallback = std::function<void(const ProgressSnapshot&)>;

class Dispatcher {
public:
    Dispatcher(const CandidateSpace& space, VerificationOracle& oracle, DispatchConfig config,
               StopToken& stop);

    void set_progress_callback(ProgressCallback callback) { progress_ = std::move(callback); }

    /**
     * Run every range to a terminal or paused state.
     *
     * @throws CheckpointMismatchError when a restored checkpoint does not
     *         belong to its range
     * @throws OracleError when verification fails for good; every driver is
     *         stopped (and checkpointed) first
     */
    RunOutcome run(std::vector<WorkerRange> ranges);

private:
    void drive(WorkerRange& range, DriverReport& report);
    bool restore(WorkerRange& range, DriverReport& report, const CheckpointManager& checkpoints,
                 double& elapsed_before);
    VerificationResult verify_with_retry(const VerificationRequest& request);
    VerificationResult call_oracle(const VerificationRequest& request);
    void offer_match(FoundCandidate found);
    void add_progress(uint64_t tested, const Ordinal& covered);
    ProgressSnapshot snapshot() const;

    const CandidateSpace& space_;
    VerificationOracle& oracle_;
    DispatchConfig config_;
    StopToken& stop_;
    ProgressCallback progress_;

    std::mutex match_mutex_;
    std::optional<FoundCandidate> match_;

    mutable std::mutex progress_mutex_;
    uint64_t tested_ = 0;
    Ordinal covered_;
    Ordinal total_;
    std::chrono::steady_clock::time_point started_;
};

/**
 * Print every candidate of `ranges` in ordinal order, one per line.
 * Returns the number printed; stops early when `stop` is set.
 */
Ordinal list_candidates(const CandidateSpace& space, const std::vector<WorkerRange>& ranges,
                        std::ostream& out, const StopToken& stop);

struct PerformanceResult {
    uint64_t tested = 0;
    double elapsed_seconds = 0.0;
    double rate() const { return elapsed_seconds > 0 ? tested / elapsed_seconds : 0.0; }
};

/**
 * Verify batches from the start of the space (wrapping around) for
 * `seconds`, ignoring matches. Used with an empty target set to measure
 * candidates per second.
 */
PerformanceResult measure_performance(const CandidateSpace& space, VerificationOracle& oracle,
                                      const StopToken& stop, double seconds, size_t batch_size);

}  // namespace seedhound
