/**
 * Worker slices and selector parsing.
 */

#include "partition.hpp"
#include "../core/errors.hpp"

#include <algorithm>
#include <sstream>
#include <stdexcept>

namespace seedhound {

const char* state_name(WorkerState state) {
    switch (state) {
        case WorkerState::IDLE:        return "idle";
        case WorkerState::RUNNING:     return "running";
        case WorkerState::EXHAUSTED:   return "exhausted";
        case WorkerState::MATCH_FOUND: return "match_found";
        case WorkerState::PAUSED:      return "paused";
    }
    return "unknown";
}

WorkerState parse_worker_state(const std::string& name) {
    if (name == "idle") return WorkerState::IDLE;
    if (name == "running") return WorkerState::RUNNING;
    if (name == "exhausted") return WorkerState::EXHAUSTED;
    if (name == "match_found") return WorkerState::MATCH_FOUND;
    if (name == "paused") return WorkerState::PAUSED;
    throw std::invalid_argument("unknown worker state: " + name);
}

OrdinalRange partition(const Ordinal& total, uint32_t id, uint32_t count) {
    if (count == 0) {
        throw PartitionBoundsError("worker count must be at least 1");
    }
    if (id >= count) {
        throw PartitionBoundsError("worker id " + std::to_string(id + 1) +
                                   " exceeds worker count " + std::to_string(count));
    }

    // Boundaries round up, so earlier slices take the remainder:
    // N = 100, M = 3 gives [0,34) [34,67) [67,100)
    OrdinalRange range;
    Ordinal lo = total * id;
    Ordinal hi = total * (id + 1);
    Ordinal d = count;
    mpz_cdiv_q(range.start.get_mpz_t(), lo.get_mpz_t(), d.get_mpz_t());
    mpz_cdiv_q(range.end.get_mpz_t(), hi.get_mpz_t(), d.get_mpz_t());
    return range;
}

WorkerSelector WorkerSelector::parse(const std::string& text) {
    size_t slash = text.find('/');
    if (slash == std::string::npos || slash == 0 || slash + 1 >= text.size()) {
        throw PartitionBoundsError("worker selector '" + text + "' must look like i/M or i,j/M");
    }

    auto parse_number = [&text](const std::string& s) -> uint32_t {
        if (s.empty() || s.size() > 9 || s.find_first_not_of("0123456789") != std::string::npos) {
            throw PartitionBoundsError("worker selector '" + text + "': '" + s +
                                       "' is not a number");
        }
        return static_cast<uint32_t>(std::stoul(s));
    };

    WorkerSelector selector;
    selector.count = parse_number(text.substr(slash + 1));
    if (selector.count == 0) {
        throw PartitionBoundsError("worker selector '" + text + "': worker count must be at least 1");
    }

    std::stringstream ids(text.substr(0, slash));
    std::string item;
    while (std::getline(ids, item, ',')) {
        uint32_t id = parse_number(item);
        if (id == 0 || id > selector.count) {
            throw PartitionBoundsError("worker selector '" + text + "': worker " +
                                       std::to_string(id) + " is outside 1.." +
                                       std::to_string(selector.count));
        }
        if (std::find(selector.ids.begin(), selector.ids.end(), id - 1) != selector.ids.end()) {
            throw PartitionBoundsError("worker selector '" + text + "': worker " +
                                       std::to_string(id) + " listed twice");
        }
        selector.ids.push_back(id - 1);
    }
    if (selector.ids.empty()) {
        throw PartitionBoundsError("worker selector '" + text + "' names no worker");
    }

    std::sort(selector.ids.begin(), selector.ids.end());
    return selector;
}

std::string WorkerSelector::to_string() const {
    std::string out;
    for (size_t i = 0; i < ids.size(); i++) {
        if (i) out += ',';
        out += std::to_string(ids[i] + 1);
    }
    return out + "/" + std::to_string(count);
}

std::vector<WorkerRange> plan_ranges(const Ordinal& total, const std::string& fingerprint,
                                     const WorkerSelector& selector, uint32_t devices) {
    if (devices == 0) {
        throw PartitionBoundsError("device count must be at least 1");
    }

    std::vector<WorkerRange> ranges;
    const uint32_t driver_count = static_cast<uint32_t>(selector.ids.size()) * devices;

    for (uint32_t id : selector.ids) {
        OrdinalRange slice = partition(total, id, selector.count);
        Ordinal length = slice.end - slice.start;

        for (uint32_t d = 0; d < devices; d++) {
            OrdinalRange sub = partition(length, d, devices);

            WorkerRange range;
            range.fingerprint = fingerprint;
            range.driver = static_cast<uint32_t>(ranges.size());
            range.driver_count = driver_count;
            range.start = slice.start + sub.start;
            range.end = slice.start + sub.end;
            range.cursor = range.start;
            ranges.push_back(std::move(range));
        }
    }
    return ranges;
}

}  // namespace seedhound
