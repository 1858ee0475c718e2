/**
 * Seedhound Partitioning
 *
 * Deterministic split of the ordinal space [0, N) into worker slices:
 * worker `id` of `count` owns [ceil(id*N/count), ceil((id+1)*N/count)).
 * Slices are disjoint, cover [0, N) and differ in size by at most one.
 * Each selected slice can be split again among in-process drivers
 * (devices) with the same formula.
 */

#pragma once

#include "../core/types.hpp"

#include <string>
#include <vector>

namespace seedhound {

enum class WorkerState : uint8_t {
    IDLE = 0,
    RUNNING = 1,
    EXHAUSTED = 2,
    MATCH_FOUND = 3,
    PAUSED = 4,
};

const char* state_name(WorkerState state);

/** @throws std::invalid_argument for an unknown name */
WorkerState parse_worker_state(const std::string& name);

inline bool is_terminal(WorkerState state) {
    return state == WorkerState::EXHAUSTED || state == WorkerState::MATCH_FOUND;
}

struct OrdinalRange {
    Ordinal start;
    Ordinal end;   // exclusive
};

/** @throws PartitionBoundsError if count == 0 or id >= count */
OrdinalRange partition(const Ordinal& total, uint32_t id, uint32_t count);

/**
 * Which slices of a multi-process split this process owns, parsed from the
 * command line form "i/M" or "i,j,k/M" (1-based). Ids are stored 0-based.
 */
struct WorkerSelector {
    std::vector<uint32_t> ids;
    uint32_t count = 1;

    static WorkerSelector single() { return WorkerSelector{{0}, 1}; }

    /** @throws PartitionBoundsError on syntax errors or out-of-range ids */
    static WorkerSelector parse(const std::string& text);

    std::string to_string() const;
};

/**
 * A contiguous slice of one search space owned by one driver thread.
 * Only the owning driver mutates it.
 */
struct WorkerRange {
    std::string fingerprint;
    uint32_t driver = 0;          // index among all drivers of this process
    uint32_t driver_count = 1;
    Ordinal start;
    Ordinal end;
    Ordinal cursor;               // next ordinal to test
    WorkerState state = WorkerState::IDLE;

    Ordinal remaining() const { return cursor < end ? Ordinal(end - cursor) : Ordinal(0); }
    bool done() const { return cursor >= end; }

    /** Move the cursor forward; it never moves back or past `end`. */
    void advance(const Ordinal& tested) {
        if (tested <= 0) return;
        cursor += tested;
        if (cursor > end) cursor = end;
    }
};

/**
 * Ranges for every driver of this process: each selected worker slice is
 * split into `devices` drivers.
 */
std::vector<WorkerRange> plan_ranges(const Ordinal& total, const std::string& fingerprint,
                                     const WorkerSelector& selector, uint32_t devices);

}  // namespace seedhound
