#include "simulation/price_exporter.hpp"
#include "utils/time_utils.hpp"
#include <filesystem>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace pmsim {

PriceExporter::~PriceExporter() {
    close();
}

bool PriceExporter::open(const std::string& path) {
    if (file_.is_open()) {
        spdlog::warn("Price export already open: {}", path_);
        return false;
    }

    std::filesystem::path fs_path(path);
    if (fs_path.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(fs_path.parent_path(), ec);
        if (ec) {
            spdlog::error("Cannot create export directory {}: {}",
                          fs_path.parent_path().string(), ec.message());
            return false;
        }
    }

    file_.open(path, std::ios::out | std::ios::trunc);
    if (!file_.is_open()) {
        spdlog::error("Cannot open price export file: {}", path);
        return false;
    }

    path_ = path;
    rows_written_ = 0;
    file_ << header() << "\n";
    file_.flush();

    spdlog::info("Price export file created: {}", path);
    return true;
}

void PriceExporter::write(const PricePoint& point, Outcome resolution) {
    if (!file_.is_open()) return;

    file_ << format_row(point, resolution) << "\n";
    file_.flush();

    if (!file_.good()) {
        spdlog::error("Write to price export {} failed, closing it", path_);
        file_.close();
        return;
    }
    rows_written_++;
}

bool PriceExporter::close() {
    if (!file_.is_open()) return false;

    file_.flush();
    file_.close();
    spdlog::info("Price export closed: {} ({} rows)", path_, rows_written_);
    return true;
}

std::string PriceExporter::header() {
    return "timestamp,price,movement,volume,bid_ask_spread,market_resolution";
}

std::string PriceExporter::format_row(const PricePoint& point, Outcome resolution) {
    return fmt::format("{},{:.2f},{:.3f},{},{:.2f},{}",
        time_utils::format_local(point.timestamp),
        point.price,
        point.movement,
        point.volume,
        point.bid_ask_spread,
        outcome_to_string(resolution));
}

std::string PriceExporter::default_file_name(Outcome resolution, int total_points, WallClock created) {
    return fmt::format("LIVE_market_{}_{}_T{}.csv",
        outcome_to_string(resolution),
        time_utils::format_file_stamp(created),
        total_points);
}

} // namespace pmsim
