#include "utils/uuid.hpp"
#include <random>
#include <mutex>
#include <sstream>
#include <iomanip>
#include <cstdint>

namespace pmsim {

std::string generate_uuid() {
    static std::mutex mutex;
    static std::random_device rd;
    static std::mt19937_64 gen(rd());
    static std::uniform_int_distribution<uint64_t> dis;

    uint64_t a;
    uint64_t b;
    {
        std::lock_guard<std::mutex> lock(mutex);
        a = dis(gen);
        b = dis(gen);
    }

    std::ostringstream ss;
    ss << std::hex << std::setfill('0');
    ss << std::setw(8) << ((a >> 32) & 0xFFFFFFFF);
    ss << "-";
    ss << std::setw(4) << ((a >> 16) & 0xFFFF);
    ss << "-";
    ss << std::setw(4) << (((a & 0xFFFF) & 0x0FFF) | 0x4000);  // Version 4
    ss << "-";
    ss << std::setw(4) << (((b >> 48) & 0x3FFF) | 0x8000);  // Variant
    ss << "-";
    ss << std::setw(12) << (b & 0xFFFFFFFFFFFF);

    return ss.str();
}

} // namespace pmsim
