#pragma once

#include <string>
#include <chrono>
#include <cstdint>
#include "common/types.hpp"

namespace pmsim {
namespace time_utils {

/**
 * UTC microseconds since epoch, the storage format for ledger timestamps.
 */
int64_t to_micros(WallClock t);
WallClock from_micros(int64_t micros);

/**
 * "YYYY-mm-dd HH:MM:SS" in local time, used for CSV rows.
 */
std::string format_local(WallClock t);

/**
 * "YYYYmmdd_HHMMSS" in local time, used in generated file names.
 */
std::string format_file_stamp(WallClock t);

/**
 * Format duration for display.
 */
std::string format_duration_ms(int64_t ms);

/**
 * High resolution timer for subscriber latency measurement.
 */
class LatencyTimer {
public:
    LatencyTimer();

    void start();
    void stop();

    Duration elapsed() const;
    int64_t elapsed_ms() const;

private:
    Timestamp start_;
    Timestamp end_;
    bool running_{false};
};

} // namespace time_utils
} // namespace pmsim
