/**
 * Checkpoint Tests
 *
 * Round trips, corruption detection and search-space validation of
 * checkpoint files.
 */

#include "../src/search/checkpoint.hpp"
#include "../src/core/errors.hpp"
#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>

using namespace seedhound;

namespace fs = std::filesystem;

static const std::string FP = "0123456789abcdef0123456789abcdef";

static fs::path temp_path(const std::string& name) {
    fs::path dir = fs::temp_directory_path() / "seedhound_checkpoint_test";
    fs::create_directories(dir);
    return dir / name;
}

static WorkerRange sample_range() {
    WorkerRange r;
    r.fingerprint = FP;
    r.driver = 1;
    r.driver_count = 2;
    r.start = Ordinal("100000000000000000000000");
    r.end = Ordinal("200000000000000000000000");
    r.cursor = Ordinal("150000000000000000000123");
    r.state = WorkerState::PAUSED;
    return r;
}

static bool load_rejected(const CheckpointManager& mgr) {
    try {
        mgr.load();
    } catch (const CheckpointMismatchError&) {
        return true;
    }
    return false;
}

void test_round_trip() {
    CheckpointManager mgr(temp_path("round_trip.ckpt").string());
    mgr.clear();
    assert(!mgr.load().has_value());

    Checkpoint cp = Checkpoint::from_range(sample_range(), 12.5);
    assert(mgr.save(cp));
    assert(mgr.exists());
    assert(!fs::exists(mgr.path() + ".tmp"));

    auto loaded = mgr.load();
    assert(loaded.has_value());
    assert(loaded->fingerprint == FP);
    assert(loaded->worker_id == 1 && loaded->worker_count == 2);
    assert(loaded->start == cp.start);
    assert(loaded->end == cp.end);
    assert(loaded->cursor == cp.cursor);
    assert(loaded->elapsed_seconds == 12.5);
    assert(loaded->state == WorkerState::PAUSED);
    assert(!loaded->found);
    assert(!loaded->timestamp.empty());

    mgr.clear();
    assert(!mgr.exists());

    std::cout << "[PASS] Save/load round trip\n";
}

void test_found_record() {
    CheckpointManager mgr(temp_path("found.ckpt").string());
    Checkpoint cp = Checkpoint::from_range(sample_range(), 1.0);
    cp.state = WorkerState::MATCH_FOUND;
    cp.found = true;
    cp.found_ordinal = cp.cursor;
    cp.found_text = "pass word=#1\n";
    assert(mgr.save(cp));

    auto loaded = mgr.load();
    assert(loaded->found);
    assert(loaded->found_ordinal == cp.cursor);
    assert(loaded->found_text == "pass word=#1\n");
    mgr.clear();

    std::cout << "[PASS] Found candidate persisted\n";
}

void test_corruption_detected() {
    CheckpointManager mgr(temp_path("corrupt.ckpt").string());
    assert(mgr.save(Checkpoint::from_range(sample_range(), 3.0)));

    std::string text;
    {
        std::ifstream in(mgr.path());
        std::stringstream ss;
        ss << in.rdbuf();
        text = ss.str();
    }

    // Cursor moved by hand: checksum no longer matches
    std::string tampered = text;
    size_t pos = tampered.find("cursor=1");
    assert(pos != std::string::npos);
    tampered.replace(pos, 8, "cursor=2");
    {
        std::ofstream out(mgr.path(), std::ios::trunc);
        out << tampered;
    }
    assert(load_rejected(mgr));

    // Truncated file
    {
        std::ofstream out(mgr.path(), std::ios::trunc);
        out << text.substr(0, text.size() / 2);
    }
    assert(load_rejected(mgr));

    // Garbage
    {
        std::ofstream out(mgr.path(), std::ios::trunc);
        out << "not a checkpoint\n";
    }
    assert(load_rejected(mgr));

    // The corrupt file is left in place
    assert(mgr.exists());
    mgr.clear();

    std::cout << "[PASS] Corruption detected\n";
}

void test_validate() {
    Checkpoint cp = Checkpoint::from_range(sample_range(), 0.0);
    assert(CheckpointManager::validate(cp).empty());

    Checkpoint bad_fp = cp;
    bad_fp.fingerprint = "xyz";
    assert(!CheckpointManager::validate(bad_fp).empty());

    Checkpoint bad_cursor = cp;
    bad_cursor.cursor = cp.end + 1;
    assert(!CheckpointManager::validate(bad_cursor).empty());

    Checkpoint bad_worker = cp;
    bad_worker.worker_id = 2;
    assert(!CheckpointManager::validate(bad_worker).empty());

    assert(CheckpointManager::compute_checksum(cp) != CheckpointManager::compute_checksum(bad_cursor));

    std::cout << "[PASS] Record validation\n";
}

void test_verify_against() {
    WorkerRange range = sample_range();
    Checkpoint cp = Checkpoint::from_range(range, 0.0);
    CheckpointManager::verify_against(cp, range);

    auto rejected = [&cp](const WorkerRange& other) {
        try {
            CheckpointManager::verify_against(cp, other);
        } catch (const CheckpointMismatchError&) {
            return true;
        }
        return false;
    };

    WorkerRange other_space = range;
    other_space.fingerprint = "ffffffffffffffffffffffffffffffff";
    assert(rejected(other_space));

    WorkerRange other_slice = range;
    other_slice.end += 1;
    assert(rejected(other_slice));

    WorkerRange other_driver = range;
    other_driver.driver = 0;
    assert(rejected(other_driver));

    std::cout << "[PASS] Search space validation\n";
}

void test_path_for() {
    assert(CheckpointManager::path_for("run.ckpt", 0, 1) == "run.ckpt");
    assert(CheckpointManager::path_for("run.ckpt", 0, 3) == "run.ckpt.1");
    assert(CheckpointManager::path_for("run.ckpt", 2, 3) == "run.ckpt.3");

    std::cout << "[PASS] Per-driver paths\n";
}

void test_write_failure() {
    // A regular file where the checkpoint directory should be
    fs::path blocker = temp_path("not_a_directory");
    std::ofstream(blocker) << "x";

    RetryPolicy retry;
    retry.retries = 3;
    retry.initial_backoff = std::chrono::milliseconds(1);
    CheckpointManager mgr((blocker / "run.ckpt").string(), retry);

    Checkpoint cp = Checkpoint::from_range(sample_range(), 1.0);
    cp.fingerprint = FP;

    auto before = std::chrono::steady_clock::now();
    assert(!mgr.save(cp));
    auto waited = std::chrono::steady_clock::now() - before;

    // Three backoffs of 1, 2 and 4 ms between the four attempts
    assert(waited >= std::chrono::milliseconds(7));
    assert(!mgr.exists());
    assert(!mgr.load().has_value());

    std::cout << "[PASS] Failed writes retried and reported\n";
}

int main() {
    std::cout << "=== Checkpoint Tests ===\n\n";

    test_round_trip();
    test_found_record();
    test_corruption_detected();
    test_validate();
    test_verify_against();
    test_path_for();
    test_write_failure();

    fs::remove_all(fs::temp_directory_path() / "seedhound_checkpoint_test");

    std::cout << "\n=== All Tests Passed ===\n";
    return 0;
}
