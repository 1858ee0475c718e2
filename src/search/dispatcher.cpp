/**
 * Seedhound Verification Dispatcher
 */

#include "dispatcher.hpp"
#include "../core/errors.hpp"
#include "../core/logger.hpp"

#include <algorithm>
#include <condition_variable>
#include <exception>
#include <ostream>
#include <thread>

namespace seedhound {

const char* stop_reason_name(StopReason reason) {
    switch (reason) {
        case StopReason::NONE: return "none";
        case StopReason::MATCH_FOUND: return "match_found";
        case StopReason::INTERRUPTED: return "interrupted";
        case StopReason::FAILED: return "failed";
    }
    return "unknown";
}

const char* run_status_name(RunStatus status) {
    switch (status) {
        case RunStatus::MATCH_FOUND: return "match_found";
        case RunStatus::EXHAUSTED: return "exhausted";
        case RunStatus::INTERRUPTED: return "interrupted";
    }
    return "unknown";
}

double ProgressSnapshot::percent() const {
    if (total == 0) return 100.0;
    mpq_class ratio(covered, total);
    ratio.canonicalize();
    return ratio.get_d() * 100.0;
}

double ProgressSnapshot::eta_seconds() const {
    double r = rate();
    if (r <= 0.0) return -1.0;
    Ordinal left = total > covered ? Ordinal(total - covered) : Ordinal(0);
    return left.get_d() / r;
}

namespace {

double seconds_since(std::chrono::steady_clock::time_point t) {
    return std::chrono::duration<double>(std::chrono::steady_clock::now() - t).count();
}

size_t next_batch(const WorkerRange& range, size_t batch_size) {
    Ordinal left = range.remaining();
    if (left < static_cast<unsigned long>(batch_size)) return static_cast<size_t>(left.get_ui());
    return batch_size;
}

VerificationRequest build_request(const CandidateSpace& space, const Ordinal& first, size_t count) {
    VerificationRequest request;
    request.candidates.reserve(count);
    request.ordinals.reserve(count);
    Ordinal ordinal = first;
    for (size_t i = 0; i < count; i++) {
        request.candidates.push_back(space.text_at(ordinal));
        request.ordinals.push_back(ordinal);
        ++ordinal;
    }
    return request;
}

VerificationRequest slice(const VerificationRequest& request, size_t begin, size_t end) {
    VerificationRequest part;
    part.candidates.assign(request.candidates.begin() + begin, request.candidates.begin() + end);
    part.ordinals.assign(request.ordinals.begin() + begin, request.ordinals.begin() + end);
    return part;
}

}  // namespace

Dispatcher::Dispatcher(const CandidateSpace& space, VerificationOracle& oracle,
                       DispatchConfig config, StopToken& stop)
    : space_(space), oracle_(oracle), config_(std::move(config)), stop_(stop) {
    if (config_.batch_size == 0) {
        throw ConfigurationError("batch size must be at least 1");
    }
}

RunOutcome Dispatcher::run(std::vector<WorkerRange> ranges) {
    started_ = std::chrono::steady_clock::now();
    tested_ = 0;
    covered_ = 0;
    total_ = 0;
    match_.reset();
    for (const auto& range : ranges) {
        total_ += range.end - range.start;
        covered_ += range.cursor - range.start;
    }

    std::vector<DriverReport> reports(ranges.size());
    std::vector<std::thread> threads;
    std::mutex done_mutex;
    std::condition_variable done_cv;
    size_t running = ranges.size();
    std::exception_ptr failure;

    for (size_t i = 0; i < ranges.size(); i++) {
        threads.emplace_back([&, i] {
            try {
                drive(ranges[i], reports[i]);
            } catch (...) {
                // Stop every sibling, then hand the error to the caller
                stop_.request(StopReason::FAILED);
                std::lock_guard<std::mutex> lock(done_mutex);
                if (!failure) failure = std::current_exception();
            }
            std::lock_guard<std::mutex> lock(done_mutex);
            running--;
            done_cv.notify_all();
        });
    }

    {
        std::unique_lock<std::mutex> lock(done_mutex);
        while (running > 0) {
            done_cv.wait_for(lock, config_.progress_interval);
            if (running > 0 && progress_) {
                lock.unlock();
                progress_(snapshot());
                lock.lock();
            }
        }
    }
    for (auto& t : threads) t.join();

    if (failure) std::rethrow_exception(failure);

    RunOutcome outcome;
    outcome.drivers = std::move(reports);
    outcome.elapsed_seconds = seconds_since(started_);
    for (const auto& report : outcome.drivers) outcome.tested += report.tested;

    outcome.match = match_;
    if (outcome.match) {
        outcome.status = RunStatus::MATCH_FOUND;
    } else if (std::all_of(outcome.drivers.begin(), outcome.drivers.end(),
                           [](const DriverReport& r) { return r.state == WorkerState::EXHAUSTED; })) {
        outcome.status = RunStatus::EXHAUSTED;
    } else {
        outcome.status = RunStatus::INTERRUPTED;
    }

    if (progress_) progress_(snapshot());
    Logger::instance().log_shutdown(run_status_name(outcome.status),
                                    std::to_string(outcome.tested), outcome.elapsed_seconds);
    return outcome;
}

bool Dispatcher::restore(WorkerRange& range, DriverReport& report,
                         const CheckpointManager& checkpoints, double& elapsed_before) {
    std::optional<Checkpoint> cp = checkpoints.load();
    if (!cp) {
        LOG_INFO("No checkpoint at " + checkpoints.path() + ", starting driver " +
                 std::to_string(range.driver + 1) + " fresh");
        return false;
    }
    CheckpointManager::verify_against(*cp, range);

    Ordinal before = range.cursor;
    range.cursor = cp->cursor;
    elapsed_before = cp->elapsed_seconds;
    report.restored = true;
    add_progress(0, range.cursor - before);

    LOG_INFO("Resumed driver " + std::to_string(range.driver + 1) + " at " +
             range.cursor.get_str() + " (" + state_name(cp->state) + ")");

    if (cp->found) {
        range.state = WorkerState::MATCH_FOUND;
        offer_match(FoundCandidate{range.driver, cp->found_ordinal, cp->found_text,
                                   "restored from checkpoint"});
        stop_.request(StopReason::MATCH_FOUND);
        return true;
    }
    if (cp->state == WorkerState::EXHAUSTED || range.done()) {
        range.state = WorkerState::EXHAUSTED;
        return true;
    }
    return false;
}

void Dispatcher::drive(WorkerRange& range, DriverReport& report) {
    report.driver = range.driver;
    report.start = range.start;
    report.end = range.end;

    std::optional<CheckpointManager> checkpoints;
    if (!config_.autosave_path.empty()) {
        checkpoints.emplace(CheckpointManager::path_for(config_.autosave_path, range.driver,
                                                        range.driver_count),
                            config_.retry);
    }

    const auto started = std::chrono::steady_clock::now();
    double elapsed_before = 0.0;
    std::optional<FoundCandidate> found;

    auto save = [&] {
        if (!checkpoints) return;
        Checkpoint cp = Checkpoint::from_range(range, elapsed_before + seconds_since(started));
        if (found) {
            cp.found = true;
            cp.found_ordinal = found->ordinal;
            cp.found_text = found->text;
        }
        checkpoints->save(cp);
    };

    auto finish = [&] {
        report.state = range.state;
        report.cursor = range.cursor;
    };

    if (checkpoints && config_.restore && restore(range, report, *checkpoints, elapsed_before)) {
        finish();
        return;
    }

    Logger::instance().log_worker_range(range.driver, range.start.get_str(), range.end.get_str(),
                                        range.cursor.get_str());
    range.state = WorkerState::RUNNING;

    auto last_save = std::chrono::steady_clock::now();
    uint64_t since_save = 0;

    try {
        while (true) {
            if (stop_.stop_requested()) {
                range.state = WorkerState::PAUSED;
                break;
            }
            if (range.done()) {
                range.state = WorkerState::EXHAUSTED;
                break;
            }

            const size_t count = next_batch(range, config_.batch_size);
            VerificationRequest request = build_request(space_, range.cursor, count);
            VerificationResult result = verify_with_retry(request);

            if (!result.matches.empty()) {
                const OracleMatch& m = result.matches.front();
                found = FoundCandidate{range.driver, request.ordinals[m.index],
                                       request.candidates[m.index], m.identifier};
                // Everything up to and including the match has been tested
                range.advance(Ordinal(m.index + 1));
                report.tested += m.index + 1;
                add_progress(m.index + 1, Ordinal(m.index + 1));
                range.state = WorkerState::MATCH_FOUND;
                Logger::instance().log_found(range.driver, found->ordinal.get_str());
                offer_match(*found);
                stop_.request(StopReason::MATCH_FOUND);
                break;
            }

            range.advance(Ordinal(static_cast<unsigned long>(count)));
            report.tested += count;
            since_save += count;
            add_progress(count, Ordinal(static_cast<unsigned long>(count)));

            bool due = seconds_since(last_save) >= config_.autosave_interval_seconds ||
                       (config_.autosave_interval_candidates > 0 &&
                        since_save >= config_.autosave_interval_candidates);
            if (due && !range.done()) {
                save();
                last_save = std::chrono::steady_clock::now();
                since_save = 0;
            }
        }
    } catch (const std::exception& e) {
        // Keep the progress made so far, then let run() report the failure
        range.state = WorkerState::PAUSED;
        save();
        finish();
        Logger::instance().log_error("driver " + std::to_string(range.driver + 1) + ": " + e.what());
        throw;
    }

    save();
    finish();
}

VerificationResult Dispatcher::call_oracle(const VerificationRequest& request) {
    try {
        return oracle_.verify(request);
    } catch (const Error&) {
        throw;
    } catch (const std::exception& e) {
        throw OracleError(oracle_.name() + " oracle failed: " + e.what());
    }
}

VerificationResult Dispatcher::verify_with_retry(const VerificationRequest& request) {
    try {
        return call_oracle(request);
    } catch (const BatchFailure& first) {
        LOG_WARN("Batch of " + std::to_string(request.size()) + " at ordinal " +
                 request.ordinals.front().get_str() + " failed (" + first.what() +
                 "), retrying with half size");
    }

    VerificationResult merged;
    const size_t half = std::max<size_t>(1, request.size() / 2);
    for (size_t begin = 0; begin < request.size(); begin += half) {
        size_t end = std::min(request.size(), begin + half);
        VerificationRequest part = slice(request, begin, end);
        VerificationResult result;
        try {
            result = call_oracle(part);
        } catch (const BatchFailure& second) {
            throw OracleError("batch at ordinal " + part.ordinals.front().get_str() +
                              " failed twice: " + second.what());
        }
        for (auto& m : result.matches) {
            merged.matches.push_back(OracleMatch{m.index + begin, std::move(m.identifier)});
        }
        if (!merged.matches.empty()) break;
    }
    return merged;
}

void Dispatcher::offer_match(FoundCandidate found) {
    std::lock_guard<std::mutex> lock(match_mutex_);
    if (!match_) match_ = std::move(found);
}

void Dispatcher::add_progress(uint64_t tested, const Ordinal& covered) {
    std::lock_guard<std::mutex> lock(progress_mutex_);
    tested_ += tested;
    covered_ += covered;
}

ProgressSnapshot Dispatcher::snapshot() const {
    ProgressSnapshot snap;
    {
        std::lock_guard<std::mutex> lock(progress_mutex_);
        snap.tested = tested_;
        snap.covered = covered_;
        snap.total = total_;
    }
    snap.elapsed_seconds = seconds_since(started_);
    return snap;
}

Ordinal list_candidates(const CandidateSpace& space, const std::vector<WorkerRange>& ranges,
                        std::ostream& out, const StopToken& stop) {
    Ordinal printed = 0;
    for (const auto& range : ranges) {
        for (Ordinal ordinal = range.cursor; ordinal < range.end; ++ordinal) {
            if (stop.stop_requested()) return printed;
            out << space.text_at(ordinal) << '\n';
            ++printed;
        }
    }
    out.flush();
    return printed;
}

PerformanceResult measure_performance(const CandidateSpace& space, VerificationOracle& oracle,
                                      const StopToken& stop, double seconds, size_t batch_size) {
    if (batch_size == 0) {
        throw ConfigurationError("batch size must be at least 1");
    }
    PerformanceResult result;
    const auto started = std::chrono::steady_clock::now();
    Ordinal cursor = 0;

    while (!stop.stop_requested() && seconds_since(started) < seconds) {
        Ordinal left = space.cardinality() - cursor;
        size_t count = left < static_cast<unsigned long>(batch_size)
                           ? static_cast<size_t>(left.get_ui())
                           : batch_size;
        VerificationRequest request = build_request(space, cursor, count);
        oracle.verify(request);
        result.tested += count;
        cursor += static_cast<unsigned long>(count);
        if (cursor >= space.cardinality()) cursor = 0;
    }
    result.elapsed_seconds = seconds_since(started);
    return result;
}

}  // namespace seedhound
