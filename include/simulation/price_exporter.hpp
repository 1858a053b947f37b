#pragma once

#include <string>
#include <fstream>
#include <cstdint>
#include "common/types.hpp"

namespace pmsim {

/**
 * Incremental CSV export of a simulated price path.
 *
 * Columns: timestamp,price,movement,volume,bid_ask_spread,market_resolution
 * Each row is flushed as it is written. close() finalizes the file once;
 * later calls are no-ops.
 */
class PriceExporter {
public:
    PriceExporter() = default;
    ~PriceExporter();

    PriceExporter(const PriceExporter&) = delete;
    PriceExporter& operator=(const PriceExporter&) = delete;

    // Creates parent directories and writes the header
    bool open(const std::string& path);

    void write(const PricePoint& point, Outcome resolution);

    // Returns true only for the call that actually closed the file
    bool close();

    bool is_open() const { return file_.is_open(); }
    const std::string& path() const { return path_; }
    int64_t rows_written() const { return rows_written_; }

    static std::string header();
    static std::string format_row(const PricePoint& point, Outcome resolution);

    // LIVE_market_<YES|NO>_<YYYYmmdd_HHMMSS>_T<total>.csv
    static std::string default_file_name(Outcome resolution, int total_points, WallClock created);

private:
    std::ofstream file_;
    std::string path_;
    int64_t rows_written_{0};
};

} // namespace pmsim
