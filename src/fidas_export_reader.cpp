#include "fidasrelay/instrument/fidas_export_reader.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cerrno>
#include <charconv>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <regex>
#include <sstream>

#include <sys/stat.h>

namespace fidasrelay {

namespace fs = std::filesystem;

namespace {

constexpr std::string_view COLUMN_DATE = "date";
constexpr std::string_view COLUMN_TIME = "time";
constexpr std::size_t MAX_SENSOR_ID = 31;     // fixed_string<32> keeps a terminator

std::string_view trim(std::string_view s) {
    while (!s.empty() && (std::isspace(static_cast<unsigned char>(s.front())) || s.front() == '"')) {
        s.remove_prefix(1);
    }
    while (!s.empty() && (std::isspace(static_cast<unsigned char>(s.back())) || s.back() == '"')) {
        s.remove_suffix(1);
    }
    return s;
}

std::vector<std::string_view> split_tabs(std::string_view line) {
    std::vector<std::string_view> cells;
    std::size_t start = 0;
    while (true) {
        std::size_t tab = line.find('\t', start);
        cells.push_back(trim(line.substr(start, tab == std::string_view::npos ? std::string_view::npos
                                                                              : tab - start)));
        if (tab == std::string_view::npos) {
            break;
        }
        start = tab + 1;
    }
    return cells;
}

bool iequals(std::string_view a, std::string_view b) {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
               return std::tolower(static_cast<unsigned char>(x)) ==
                      std::tolower(static_cast<unsigned char>(y));
           });
}

std::optional<int> parse_int(std::string_view s, std::size_t min_digits, std::size_t max_digits) {
    if (s.size() < min_digits || s.size() > max_digits) {
        return std::nullopt;
    }
    int value = 0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
    if (ec != std::errc{} || ptr != s.data() + s.size()) {
        return std::nullopt;
    }
    return value;
}

/// Split on sep into exactly N parts
template<std::size_t N>
std::optional<std::array<std::string_view, N>> split_exact(std::string_view s, char sep) {
    std::array<std::string_view, N> parts;
    for (std::size_t i = 0; i < N; ++i) {
        std::size_t pos = (i + 1 < N) ? s.find(sep) : std::string_view::npos;
        if (i + 1 < N && pos == std::string_view::npos) {
            return std::nullopt;
        }
        parts[i] = s.substr(0, pos);
        s = (pos == std::string_view::npos) ? std::string_view{} : s.substr(pos + 1);
    }
    if (parts[N - 1].find(sep) != std::string_view::npos) {
        return std::nullopt;
    }
    return parts;
}

int days_in_month(int year, int month) {
    static constexpr int DAYS[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    bool leap = (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
    return (month == 2 && leap) ? 29 : DAYS[month - 1];
}

bool stat_file(const std::string& path, uint64_t& size, int64_t& mtime_ns) {
    struct stat st;
    if (::stat(path.c_str(), &st) != 0) {
        return false;
    }
    size = static_cast<uint64_t>(st.st_size);
    mtime_ns = static_cast<int64_t>(st.st_mtim.tv_sec) * 1'000'000'000 + st.st_mtim.tv_nsec;
    return true;
}

} // namespace

// ============================================================================
// Parsing helpers
// ============================================================================

std::optional<FidasExportFile> parse_export_filename(const std::string& filename) {
    static const std::regex pattern(R"(^DUSTMONITOR_(.+)_(\d{4})_(\d{2})\.txt$)",
                                    std::regex::ECMAScript | std::regex::icase);
    std::smatch match;
    if (!std::regex_match(filename, match, pattern)) {
        return std::nullopt;
    }
    FidasExportFile file;
    file.path = filename;
    file.sensor_id = "DUSTMONITOR_" + match[1].str();
    file.year = std::stoi(match[2].str());
    file.month = std::stoi(match[3].str());
    if (file.month < 1 || file.month > 12) {
        return std::nullopt;
    }
    return file;
}

std::optional<Timestamp> parse_fidas_timestamp(std::string_view date,
                                               std::string_view time,
                                               int utc_offset_hours) {
    auto date_parts = split_exact<3>(trim(date), '/');
    if (!date_parts) {
        return std::nullopt;
    }
    auto month = parse_int((*date_parts)[0], 1, 2);
    auto day = parse_int((*date_parts)[1], 1, 2);
    auto year = parse_int((*date_parts)[2], 4, 4);
    if (!month || !day || !year || *month < 1 || *month > 12 ||
        *day < 1 || *day > days_in_month(*year, *month)) {
        return std::nullopt;
    }

    time = trim(time);
    std::size_t space = time.rfind(' ');
    if (space == std::string_view::npos) {
        return std::nullopt;
    }
    std::string_view meridiem = time.substr(space + 1);
    bool pm = iequals(meridiem, "PM");
    if (!pm && !iequals(meridiem, "AM")) {
        return std::nullopt;
    }
    auto clock = split_exact<3>(trim(time.substr(0, space)), ':');
    if (!clock) {
        return std::nullopt;
    }
    auto hour = parse_int((*clock)[0], 1, 2);
    auto minute = parse_int((*clock)[1], 2, 2);
    auto second = parse_int((*clock)[2], 2, 2);
    if (!hour || !minute || !second || *hour < 1 || *hour > 12 ||
        *minute > 59 || *second > 59) {
        return std::nullopt;
    }

    // 12 AM is midnight, 12 PM is noon
    int hour24 = (*hour % 12) + (pm ? 12 : 0);
    CivilTime local{.year = *year, .month = *month, .day = *day,
                    .hour = hour24, .minute = *minute, .second = *second};
    return Time::from_civil(local, utc_offset_hours);
}

std::optional<std::optional<double>> parse_fidas_number(std::string_view cell) {
    cell = trim(cell);
    if (cell.empty() || iequals(cell, "nan")) {
        return std::optional<double>{};
    }
    std::string text(cell);
    char* end = nullptr;
    errno = 0;
    double value = std::strtod(text.c_str(), &end);
    if (end != text.c_str() + text.size() || errno == ERANGE) {
        return std::nullopt;
    }
    if (value != value) {
        return std::optional<double>{};
    }
    return std::optional<double>{value};
}

// ============================================================================
// FidasExportReader
// ============================================================================

FidasExportReader::FidasExportReader(Options options, uint64_t last_sequence, Timestamp cursor_wall_ns)
    : options_(std::move(options))
    , next_sequence_(last_sequence + 1)
    , cursor_(cursor_wall_ns) {
}

ReadResult FidasExportReader::read() {
    if (ready_.empty() && protocol_errors_ == 0) {
        if (auto error = scan()) {
            return *error;
        }
    }
    if (protocol_errors_ > 0) {
        --protocol_errors_;
        return ReadError::ProtocolError;
    }
    if (ready_.empty()) {
        return ReadError::NoNewData;
    }

    Measurement m = ready_.front();
    ready_.pop_front();
    m.sequence_number = next_sequence_++;
    m.monotonic_ns = Time::monotonic_now();
    cursor_ = m.wall_time_ns;
    return m;
}

std::optional<ReadError> FidasExportReader::scan() {
    std::error_code ec;
    if (!fs::is_directory(options_.export_dir, ec)) {
        return ReadError::TransientUnavailable;
    }

    std::vector<FidasExportFile> exports;
    fs::directory_iterator it(options_.export_dir, ec);
    if (ec) {
        std::cerr << "[FidasReader] Cannot list " << options_.export_dir << ": " << ec.message() << "\n";
        return ReadError::TransientUnavailable;
    }
    for (const auto& entry : it) {
        if (!entry.is_regular_file(ec)) {
            continue;
        }
        if (auto file = parse_export_filename(entry.path().filename().string())) {
            file->path = entry.path().string();
            exports.push_back(std::move(*file));
        }
    }
    std::sort(exports.begin(), exports.end(), [](const auto& a, const auto& b) {
        if (a.year != b.year) return a.year < b.year;
        if (a.month != b.month) return a.month < b.month;
        return a.path < b.path;
    });

    rescan_ = false;
    const std::size_t limit = std::max<std::size_t>(options_.max_buffered_rows, 1);
    for (std::size_t i = 0; i < exports.size(); ++i) {
        const FidasExportFile& file = exports[i];
        uint64_t size = 0;
        int64_t mtime_ns = 0;
        if (!stat_file(file.path, size, mtime_ns)) {
            continue;   // Vanished between listing and stat
        }
        FileState& state = files_[file.path];
        if (state.size == size && state.mtime_ns == mtime_ns) {
            continue;
        }
        if (size < state.size) {
            state.rows_examined = 0;    // Rewritten
        }
        state.size = size;
        state.mtime_ns = mtime_ns;

        std::vector<Measurement> rows;
        bool truncated = parse_file(file, state, rows);

        std::stable_sort(rows.begin(), rows.end(), [](const Measurement& a, const Measurement& b) {
            return a.wall_time_ns < b.wall_time_ns;
        });
        Timestamp newest = cursor_;
        for (auto& row : rows) {
            if (row.wall_time_ns <= newest) {
                continue;   // Duplicate timestamp
            }
            if (ready_.size() == limit) {
                truncated = true;
                break;
            }
            newest = row.wall_time_ns;
            ready_.push_back(std::move(row));
        }
        if (truncated) {
            // Parse this file again once the cursor has moved past the buffered rows
            state.size = 0;
            state.mtime_ns = 0;
        }
        if (!ready_.empty()) {
            // Later files wait for a later scan
            rescan_ = state.size == 0 || i + 1 < exports.size();
            break;
        }
    }
    return std::nullopt;
}

bool FidasExportReader::parse_file(const FidasExportFile& file, FileState& state,
                                   std::vector<Measurement>& rows) {
    std::ifstream in(file.path, std::ios::binary);
    if (!in) {
        std::cerr << "[FidasReader] Cannot open " << file.path << "\n";
        state.size = 0;
        state.mtime_ns = 0;
        return false;
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    std::string content = buffer.str();

    // The instrument may be mid-write; leave an unterminated last line for later
    std::size_t last_newline = content.rfind('\n');
    content.resize(last_newline == std::string::npos ? 0 : last_newline + 1);
    if (content.starts_with("\xEF\xBB\xBF")) {
        content.erase(0, 3);
    }

    std::string_view text(content);
    std::size_t eol = text.find('\n');
    if (eol == std::string_view::npos) {
        return false;   // Header not complete yet
    }
    std::string_view header = text.substr(0, eol);
    if (header.ends_with('\r')) {
        header.remove_suffix(1);
    }
    text.remove_prefix(eol + 1);

    auto columns = split_tabs(header);
    auto column_index = [&columns](std::string_view name) -> std::optional<std::size_t> {
        for (std::size_t i = 0; i < columns.size(); ++i) {
            if (columns[i] == name) {
                return i;
            }
        }
        return std::nullopt;
    };

    auto date_col = column_index(COLUMN_DATE);
    auto time_col = column_index(COLUMN_TIME);
    std::array<std::optional<std::size_t>, std::size(FIDAS_METRICS)> metric_cols;
    std::string missing;
    if (!date_col) missing = COLUMN_DATE;
    if (!time_col) missing = COLUMN_TIME;
    for (std::size_t i = 0; i < metric_cols.size(); ++i) {
        metric_cols[i] = column_index(FIDAS_METRICS[i]);
        if (!metric_cols[i]) {
            missing = FIDAS_METRICS[i];
        }
    }
    if (!missing.empty()) {
        if (!state.failed) {
            std::cerr << "[FidasReader] Missing required column '" << missing << "' in "
                      << file.path << ", skipping file until it changes\n";
            ++protocol_errors_;
        }
        state.failed = true;
        return false;
    }
    state.failed = false;

    const std::string sensor_id = options_.sensor_id.empty() ? file.sensor_id : options_.sensor_id;
    const std::size_t limit = std::max<std::size_t>(options_.max_buffered_rows, 1);
    auto by_time = [](const Measurement& a, const Measurement& b) {
        return a.wall_time_ns < b.wall_time_ns;
    };
    bool truncated = false;
    std::size_t row_index = 0;
    while (!text.empty()) {
        eol = text.find('\n');
        std::string_view line = text.substr(0, eol);
        text.remove_prefix(eol == std::string_view::npos ? text.size() : eol + 1);
        if (line.ends_with('\r')) {
            line.remove_suffix(1);
        }
        if (trim(line).empty()) {
            continue;
        }
        const bool fresh = row_index >= state.rows_examined;
        ++row_index;

        auto cells = split_tabs(line);
        auto cell = [&cells](std::size_t index) {
            return index < cells.size() ? cells[index] : std::string_view{};
        };

        auto ts = parse_fidas_timestamp(cell(*date_col), cell(*time_col), options_.utc_offset_hours);
        if (!ts) {
            if (fresh) {
                std::cerr << "[FidasReader] Unparsable timestamp '" << cell(*date_col) << " "
                          << cell(*time_col) << "' in " << file.path << " row " << row_index << "\n";
                ++protocol_errors_;
            }
            continue;
        }
        if (*ts <= cursor_) {
            continue;
        }

        Measurement m{};
        m.wall_time_ns = *ts;
        m.sensor_id = sertial::fixed_string<32>(std::string_view(sensor_id).substr(0, MAX_SENSOR_ID));
        bool valid = true;
        for (std::size_t i = 0; i < metric_cols.size(); ++i) {
            auto number = parse_fidas_number(cell(*metric_cols[i]));
            if (!number) {
                valid = false;
                if (fresh) {
                    std::cerr << "[FidasReader] Bad " << FIDAS_METRICS[i] << " value '"
                              << cell(*metric_cols[i]) << "' in " << file.path
                              << " row " << row_index << "\n";
                    ++protocol_errors_;
                }
                break;
            }
            set_value(m, FIDAS_METRICS[i], *number);
        }
        if (valid) {
            rows.push_back(std::move(m));
            if (rows.size() >= 2 * limit) {
                // Keep only the oldest rows; the rest are read again later
                std::stable_sort(rows.begin(), rows.end(), by_time);
                rows.resize(limit);
                truncated = true;
            }
        }
    }
    state.rows_examined = std::max(state.rows_examined, row_index);
    return truncated;
}

} // namespace fidasrelay
