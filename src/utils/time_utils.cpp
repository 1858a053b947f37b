#include "utils/time_utils.hpp"
#include <sstream>
#include <iomanip>
#include <ctime>

namespace pmsim {
namespace time_utils {

namespace {

std::string format_with(WallClock t, const char* pattern) {
    auto time_t = std::chrono::system_clock::to_time_t(t);
    std::tm tm{};
    localtime_r(&time_t, &tm);

    std::ostringstream ss;
    ss << std::put_time(&tm, pattern);
    return ss.str();
}

} // namespace

int64_t to_micros(WallClock t) {
    return std::chrono::duration_cast<std::chrono::microseconds>(
        t.time_since_epoch()
    ).count();
}

WallClock from_micros(int64_t micros) {
    return WallClock(std::chrono::duration_cast<WallClock::duration>(
        std::chrono::microseconds(micros)));
}

std::string format_local(WallClock t) {
    return format_with(t, "%Y-%m-%d %H:%M:%S");
}

std::string format_file_stamp(WallClock t) {
    return format_with(t, "%Y%m%d_%H%M%S");
}

std::string format_duration_ms(int64_t ms) {
    if (ms < 1000) {
        return std::to_string(ms) + "ms";
    } else if (ms < 60000) {
        double sec = ms / 1000.0;
        std::ostringstream ss;
        ss << std::fixed << std::setprecision(1) << sec << "s";
        return ss.str();
    } else {
        int64_t min = ms / 60000;
        int64_t sec = (ms % 60000) / 1000;
        return std::to_string(min) + "m" + std::to_string(sec) + "s";
    }
}

// LatencyTimer implementation

LatencyTimer::LatencyTimer()
    : start_(now())
    , end_(start_)
{
}

void LatencyTimer::start() {
    start_ = now();
    running_ = true;
}

void LatencyTimer::stop() {
    end_ = now();
    running_ = false;
}

Duration LatencyTimer::elapsed() const {
    if (running_) {
        return now() - start_;
    }
    return end_ - start_;
}

int64_t LatencyTimer::elapsed_ms() const {
    return std::chrono::duration_cast<std::chrono::milliseconds>(elapsed()).count();
}

} // namespace time_utils
} // namespace pmsim
