/**
 * Checkpoint file I/O.
 */

#include "checkpoint.hpp"
#include "../core/errors.hpp"
#include "../core/logger.hpp"

#include <cmath>
#include <cstdio>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <map>
#include <sstream>
#include <thread>

#include <unistd.h>

namespace seedhound {

namespace {

constexpr int CHECKPOINT_VERSION = 1;

std::string timestamp_now() {
    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    std::tm tm_buf{};
    localtime_r(&time, &tm_buf);
    std::ostringstream ss;
    ss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
    return ss.str();
}

uint64_t elapsed_ms(const Checkpoint& cp) {
    return cp.elapsed_seconds <= 0 ? 0 : static_cast<uint64_t>(std::llround(cp.elapsed_seconds * 1000.0));
}

std::string to_hex(const std::string& s) {
    static const char* digits = "0123456789abcdef";
    std::string out;
    out.reserve(s.size() * 2);
    for (unsigned char c : s) {
        out += digits[c >> 4];
        out += digits[c & 0x0f];
    }
    return out;
}

std::string from_hex(const std::string& hex) {
    if (hex.size() % 2 != 0) throw std::invalid_argument("odd hex length");
    auto nibble = [](char c) -> int {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        throw std::invalid_argument("bad hex digit");
    };
    std::string out;
    for (size_t i = 0; i < hex.size(); i += 2) {
        out += static_cast<char>((nibble(hex[i]) << 4) | nibble(hex[i + 1]));
    }
    return out;
}

Ordinal parse_ordinal(const std::string& value) {
    Ordinal o;
    if (value.empty() || o.set_str(value, 10) != 0) {
        throw std::invalid_argument("bad number '" + value + "'");
    }
    return o;
}

}  // namespace

Checkpoint Checkpoint::from_range(const WorkerRange& range, double elapsed_seconds) {
    Checkpoint cp;
    cp.fingerprint = range.fingerprint;
    cp.worker_id = range.driver;
    cp.worker_count = range.driver_count;
    cp.start = range.start;
    cp.end = range.end;
    cp.cursor = range.cursor;
    cp.elapsed_seconds = elapsed_seconds;
    cp.state = range.state;
    return cp;
}

CheckpointManager::CheckpointManager(std::string path, RetryPolicy retry)
    : path_(std::move(path)), retry_(retry) {}

bool CheckpointManager::exists() const {
    std::error_code ec;
    return std::filesystem::exists(path_, ec);
}

std::string CheckpointManager::path_for(const std::string& base, uint32_t driver,
                                        uint32_t driver_count) {
    if (driver_count <= 1) return base;
    return base + "." + std::to_string(driver + 1);
}

uint32_t CheckpointManager::compute_checksum(const Checkpoint& cp) {
    uint32_t hash = 2166136261u;  // FNV offset basis
    auto mix_bytes = [&hash](const std::string& s) {
        for (unsigned char c : s) {
            hash ^= c;
            hash *= 16777619u;  // FNV prime
        }
        hash ^= 0xff;  // field separator
        hash *= 16777619u;
    };
    auto mix = [&hash](uint64_t val) {
        for (int i = 0; i < 8; i++) {
            hash ^= static_cast<uint8_t>(val >> (i * 8));
            hash *= 16777619u;
        }
    };

    mix(CHECKPOINT_VERSION);
    mix_bytes(cp.fingerprint);
    mix(cp.worker_id);
    mix(cp.worker_count);
    mix_bytes(cp.start.get_str());
    mix_bytes(cp.end.get_str());
    mix_bytes(cp.cursor.get_str());
    mix(elapsed_ms(cp));
    mix(static_cast<uint64_t>(cp.state));
    mix(cp.found ? 1 : 0);
    if (cp.found) {
        mix_bytes(cp.found_ordinal.get_str());
        mix_bytes(cp.found_text);
    }
    return hash;
}

std::string CheckpointManager::validate(const Checkpoint& cp) {
    if (cp.fingerprint.size() != 32 ||
        cp.fingerprint.find_first_not_of("0123456789abcdef") != std::string::npos) {
        return "Invalid fingerprint: '" + cp.fingerprint + "'";
    }
    if (cp.worker_count == 0 || cp.worker_id >= cp.worker_count) {
        return "Invalid worker " + std::to_string(cp.worker_id) + " of " +
               std::to_string(cp.worker_count);
    }
    if (cp.start < 0 || cp.start > cp.end) {
        return "Invalid range [" + cp.start.get_str() + ", " + cp.end.get_str() + ")";
    }
    if (cp.cursor < cp.start || cp.cursor > cp.end) {
        return "Cursor " + cp.cursor.get_str() + " outside [" + cp.start.get_str() + ", " +
               cp.end.get_str() + "]";
    }
    if (cp.found && (cp.found_ordinal < cp.start || cp.found_ordinal >= cp.end)) {
        return "Found ordinal " + cp.found_ordinal.get_str() + " outside the range";
    }
    return "";
}

bool CheckpointManager::write_once(const Checkpoint& cp) const {
    std::error_code ec;
    std::filesystem::path parent = std::filesystem::path(path_).parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            LOG_WARN("Cannot create checkpoint directory " + parent.string() + ": " + ec.message());
            return false;
        }
    }

    const std::string temp_path = path_ + ".tmp";
    const uint32_t checksum = compute_checksum(cp);

    {
        std::ofstream file(temp_path, std::ios::out | std::ios::trunc);
        if (!file.is_open()) {
            LOG_WARN("Cannot create temp checkpoint file: " + temp_path);
            return false;
        }

        file << "# Seedhound checkpoint v" << CHECKPOINT_VERSION << "\n";
        file << "# Do not modify manually - checksum protected\n\n";
        file << "version=" << CHECKPOINT_VERSION << "\n";
        file << "fingerprint=" << cp.fingerprint << "\n";
        file << "worker_id=" << cp.worker_id << "\n";
        file << "worker_count=" << cp.worker_count << "\n";
        file << "start=" << cp.start.get_str() << "\n";
        file << "end=" << cp.end.get_str() << "\n";
        file << "cursor=" << cp.cursor.get_str() << "\n";
        file << "elapsed_ms=" << elapsed_ms(cp) << "\n";
        file << "state=" << state_name(cp.state) << "\n";
        file << "found=" << (cp.found ? 1 : 0) << "\n";
        if (cp.found) {
            file << "found_ordinal=" << cp.found_ordinal.get_str() << "\n";
            file << "found_text_hex=" << to_hex(cp.found_text) << "\n";
        }
        file << "timestamp=" << timestamp_now() << "\n";
        file << "checksum=" << checksum << "\n";

        file.flush();
        if (!file) {
            LOG_WARN("Write to temp checkpoint file failed: " + temp_path);
            return false;
        }
    }

    // Force the data to disk before the rename makes it visible
    FILE* f = std::fopen(temp_path.c_str(), "r");
    if (f) {
        fsync(fileno(f));
        std::fclose(f);
    }

    std::filesystem::rename(temp_path, path_, ec);
    if (ec) {
        LOG_WARN("Cannot rename checkpoint into place: " + ec.message());
        std::filesystem::remove(temp_path, ec);
        return false;
    }
    return true;
}

bool CheckpointManager::save(const Checkpoint& checkpoint) const {
    auto backoff = retry_.initial_backoff;
    for (int attempt = 0; attempt <= retry_.retries; attempt++) {
        if (write_once(checkpoint)) {
            Logger::instance().log_checkpoint_save(path_, checkpoint.cursor.get_str());
            return true;
        }
        if (attempt == retry_.retries) break;
        std::this_thread::sleep_for(backoff);
        backoff *= 2;
    }

    LOG_ERROR("Checkpoint save failed after " + std::to_string(retry_.retries + 1) +
              " attempts: " + path_);
    return false;
}

std::optional<Checkpoint> CheckpointManager::load() const {
    std::ifstream file(path_);
    if (!file.is_open()) {
        if (exists()) {
            throw CheckpointMismatchError("checkpoint " + path_ + " exists but cannot be read");
        }
        return std::nullopt;
    }

    auto corrupt = [this](const std::string& why) {
        return CheckpointMismatchError("checkpoint " + path_ + " is corrupt: " + why);
    };

    std::map<std::string, std::string> fields;
    std::string line;
    while (std::getline(file, line)) {
        if (line.empty() || line[0] == '#') continue;
        auto pos = line.find('=');
        if (pos == std::string::npos) throw corrupt("malformed line '" + line + "'");
        fields[line.substr(0, pos)] = line.substr(pos + 1);
    }

    auto require = [&](const std::string& key) -> const std::string& {
        auto it = fields.find(key);
        if (it == fields.end()) throw corrupt("missing '" + key + "'");
        return it->second;
    };

    Checkpoint cp;
    uint32_t stored_checksum = 0;
    try {
        if (std::stoi(require("version")) != CHECKPOINT_VERSION) {
            throw corrupt("unsupported version " + require("version"));
        }
        cp.fingerprint = require("fingerprint");
        cp.worker_id = static_cast<uint32_t>(std::stoul(require("worker_id")));
        cp.worker_count = static_cast<uint32_t>(std::stoul(require("worker_count")));
        cp.start = parse_ordinal(require("start"));
        cp.end = parse_ordinal(require("end"));
        cp.cursor = parse_ordinal(require("cursor"));
        cp.elapsed_seconds = static_cast<double>(std::stoull(require("elapsed_ms"))) / 1000.0;
        cp.state = parse_worker_state(require("state"));
        cp.found = require("found") == "1";
        if (cp.found) {
            cp.found_ordinal = parse_ordinal(require("found_ordinal"));
            cp.found_text = from_hex(require("found_text_hex"));
        }
        if (fields.count("timestamp")) cp.timestamp = fields["timestamp"];
        stored_checksum = static_cast<uint32_t>(std::stoul(require("checksum")));
    } catch (const CheckpointMismatchError&) {
        throw;
    } catch (const std::exception& e) {
        throw corrupt(e.what());
    }

    uint32_t computed = compute_checksum(cp);
    if (computed != stored_checksum) {
        throw corrupt("checksum mismatch (stored " + std::to_string(stored_checksum) +
                      ", computed " + std::to_string(computed) + ")");
    }

    std::string error = validate(cp);
    if (!error.empty()) throw corrupt(error);

    return cp;
}

void CheckpointManager::clear() const {
    std::error_code ec;
    std::filesystem::remove(path_, ec);
    std::filesystem::remove(path_ + ".tmp", ec);
}

void CheckpointManager::verify_against(const Checkpoint& cp, const WorkerRange& range) {
    if (cp.fingerprint != range.fingerprint) {
        throw CheckpointMismatchError("checkpoint fingerprint " + cp.fingerprint +
                                      " does not match search space " + range.fingerprint);
    }
    if (cp.worker_id != range.driver || cp.worker_count != range.driver_count ||
        cp.start != range.start || cp.end != range.end) {
        throw CheckpointMismatchError(
            "checkpoint covers driver " + std::to_string(cp.worker_id + 1) + "/" +
            std::to_string(cp.worker_count) + " [" + cp.start.get_str() + ", " +
            cp.end.get_str() + ") but driver " + std::to_string(range.driver + 1) + "/" +
            std::to_string(range.driver_count) + " owns [" + range.start.get_str() + ", " +
            range.end.get_str() + ")");
    }
}

}  // namespace seedhound
