#pragma once

#include "fidasrelay/instrument/instrument_reader.hpp"

#include <cstdint>
#include <deque>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace fidasrelay {

/// Reading names as they appear in the export header, in emission order
inline constexpr std::string_view FIDAS_METRICS[] = {"PM1", "PM2.5", "PM10", "rH", "T", "p"};

/**
 * @brief Parsed export file name DUSTMONITOR_<id>_<YYYY>_<MM>.txt
 */
struct FidasExportFile {
    std::string path;
    std::string sensor_id;      ///< "DUSTMONITOR_<id>"
    int year{0};
    int month{0};
};

/**
 * @brief Match a file name against the export naming scheme (case-insensitive)
 */
std::optional<FidasExportFile> parse_export_filename(const std::string& filename);

/**
 * @brief Combine "MM/DD/YYYY" and "hh:mm:ss AM|PM" into a UTC timestamp
 */
std::optional<Timestamp> parse_fidas_timestamp(std::string_view date,
                                               std::string_view time,
                                               int utc_offset_hours);

/**
 * @brief Parse one numeric cell
 *
 * Empty and NaN cells are "no value" (outer optional engaged, inner empty);
 * anything else that is not a number fails (outer optional empty).
 */
std::optional<std::optional<double>> parse_fidas_number(std::string_view cell);

/**
 * @brief Reads measurements from the dust monitor's monthly text exports
 *
 * The instrument writes one tab-separated file per month into a directory.
 * Every read() returns the oldest row newer than the cursor; the cursor
 * starts at the newest acquisition time already in the store, so a restart
 * continues where it stopped instead of re-sending whole files.
 *
 * Files are walked oldest first and a scan stops at the first file that
 * yields new rows, holding at most max_buffered_rows of them. A station
 * with years of exports therefore catches up file by file with bounded
 * memory; has_more() stays true until the backlog on disk is consumed.
 */
class FidasExportReader : public InstrumentReader {
public:
    struct Options {
        std::string export_dir;
        std::string sensor_id;          ///< Empty: derive from the file name
        int utc_offset_hours{0};        ///< Offset of the instrument clock
        std::size_t max_buffered_rows{1000};
    };

    /**
     * @param options Reader configuration
     * @param last_sequence Highest sequence number already issued
     * @param cursor_wall_ns Rows at or before this UTC time are skipped
     */
    FidasExportReader(Options options, uint64_t last_sequence, Timestamp cursor_wall_ns);

    ReadResult read() override;

    bool has_more() const override { return !ready_.empty() || rescan_; }

    Timestamp cursor() const { return cursor_; }
    std::size_t buffered() const { return ready_.size(); }

private:
    struct FileState {
        uint64_t size{0};
        int64_t mtime_ns{0};
        std::size_t rows_examined{0};   ///< Data rows already checked for errors
        bool failed{false};             ///< Header unusable, skip until the file changes
    };

    std::optional<ReadError> scan();
    /// @return true if rows newer than the kept ones were dropped to stay within the limit
    bool parse_file(const FidasExportFile& file, FileState& state, std::vector<Measurement>& rows);

    Options options_;
    uint64_t next_sequence_;
    Timestamp cursor_;

    std::map<std::string, FileState> files_;
    std::deque<Measurement> ready_;     ///< Parsed rows newer than cursor_, oldest first
    std::size_t protocol_errors_{0};    ///< Not yet reported through read()
    bool rescan_{false};                ///< Last scan stopped early, more rows may be on disk
};

} // namespace fidasrelay
