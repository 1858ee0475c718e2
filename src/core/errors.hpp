/**
 * Seedhound Error Types
 *
 * Fatal conditions are reported by exception. Messages name the element that
 * caused them (slot, anchor, line, file, worker) rather than a generic failure.
 *
 *   ConfigurationError      - bad token list, anchors, budgets, empty space
 *   CheckpointMismatchError - checkpoint does not belong to this search space
 *   OracleError             - verification failed, run cannot continue
 *   PartitionBoundsError    - invalid worker id / worker count
 *   BatchFailure            - recoverable batch failure (retried once)
 */

#pragma once

#include <stdexcept>
#include <string>

namespace seedhound {

class Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class ConfigurationError : public Error {
public:
    using Error::Error;
};

class CheckpointMismatchError : public Error {
public:
    using Error::Error;
};

class OracleError : public Error {
public:
    using Error::Error;
};

class PartitionBoundsError : public Error {
public:
    using Error::Error;
};

/**
 * Thrown by an oracle when a whole batch could not be processed (device
 * launch failure, out of memory). The dispatcher retries once with a smaller
 * batch before escalating to OracleError.
 */
class BatchFailure : public Error {
public:
    using Error::Error;
};

}  // namespace seedhound
