/**
 * Checkpoint Persistence
 *
 * Saves and restores one driver's progress so a run survives interruption.
 *
 * SAFETY FEATURES:
 * - Atomic saves: write to temp file, fsync, then rename (survives Ctrl+C)
 * - Checksum validation: detects file corruption
 * - Fingerprint validation: a checkpoint is only resumed against the exact
 *   search space (and slice) that wrote it
 * - Transient write failures are retried with exponential backoff
 */

#pragma once

#include "../core/types.hpp"
#include "partition.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace seedhound {

struct Checkpoint {
    std::string fingerprint;
    uint32_t worker_id = 0;           // driver index inside this process
    uint32_t worker_count = 1;
    Ordinal start;
    Ordinal end;
    Ordinal cursor;
    double elapsed_seconds = 0.0;
    WorkerState state = WorkerState::IDLE;

    bool found = false;
    Ordinal found_ordinal;
    std::string found_text;

    std::string timestamp;            // informational, not checksummed

    static Checkpoint from_range(const WorkerRange& range, double elapsed_seconds);
};

struct RetryPolicy {
    int retries = 3;
    std::chrono::milliseconds initial_backoff{50};
};

class CheckpointManager {
public:
    explicit CheckpointManager(std::string path, RetryPolicy retry = {});

    const std::string& path() const { return path_; }
    bool exists() const;

    /**
     * Write atomically. I/O failures are retried; returns false (and logs)
     * when every attempt failed. Never throws for I/O errors.
     */
    bool save(const Checkpoint& checkpoint) const;

    /**
     * @return nullopt when no checkpoint file exists
     * @throws CheckpointMismatchError if the file is corrupt or fails
     *         validation; a corrupt file is never repaired or ignored
     */
    std::optional<Checkpoint> load() const;

    /** Remove the checkpoint and any leftover temp file. */
    void clear() const;

    /** FNV-1a over every persisted field except timestamp and checksum. */
    static uint32_t compute_checksum(const Checkpoint& checkpoint);

    /** Returns an error message, or an empty string if the record is sane. */
    static std::string validate(const Checkpoint& checkpoint);

    /**
     * @throws CheckpointMismatchError when the checkpoint belongs to another
     *         search space or covers a different slice than `range`
     */
    static void verify_against(const Checkpoint& checkpoint, const WorkerRange& range);

    /** `base` for a single driver, `base.<n>` (1-based) otherwise. */
    static std::string path_for(const std::string& base, uint32_t driver, uint32_t driver_count);

private:
    bool write_once(const Checkpoint& checkpoint) const;

    std::string path_;
    RetryPolicy retry_;
};

}  // namespace seedhound
