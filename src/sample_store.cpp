#include "fidasrelay/store/sample_store.hpp"

#include <rfl.hpp>
#include <rfl/json.hpp>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <iostream>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace fidasrelay {

namespace {

// Journal frame: [magic:4][length:4][SeRTial payload][checksum:4], host byte order
constexpr uint32_t FRAME_MAGIC = 0x31534446;  // "FDS1"
constexpr std::size_t FRAME_HEADER_SIZE = 8;
constexpr std::size_t FRAME_TRAILER_SIZE = 4;
constexpr uint32_t MAX_FRAME_PAYLOAD = 64 * 1024;

// FNV-1a, enough to tell a torn write from a complete one
uint32_t checksum(const std::byte* data, std::size_t size) {
    uint32_t hash = 2166136261u;
    for (std::size_t i = 0; i < size; ++i) {
        hash ^= static_cast<uint32_t>(data[i]);
        hash *= 16777619u;
    }
    return hash;
}

bool write_all(int fd, const void* data, std::size_t size) {
    const auto* p = static_cast<const char*>(data);
    while (size > 0) {
        ssize_t n = ::write(fd, p, size);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            return false;
        }
        p += n;
        size -= static_cast<std::size_t>(n);
    }
    return true;
}

bool read_file(const std::string& path, std::vector<std::byte>& out) {
    int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        return false;
    }
    std::byte chunk[8192];
    while (true) {
        ssize_t n = ::read(fd, chunk, sizeof(chunk));
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            ::close(fd);
            return false;
        }
        if (n == 0) {
            break;
        }
        out.insert(out.end(), chunk, chunk + n);
    }
    ::close(fd);
    return true;
}

bool fsync_directory(const std::string& dir) {
    int fd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
    if (fd < 0) {
        return false;
    }
    bool ok = ::fsync(fd) == 0;
    ::close(fd);
    return ok;
}

/**
 * @brief Write content to path via temp file + fsync + rename + dir fsync
 */
bool replace_file_atomically(const std::string& dir, const std::string& path,
                             const void* data, std::size_t size) {
    const std::string tmp = path + ".tmp";
    int fd = ::open(tmp.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (fd < 0) {
        return false;
    }
    bool ok = write_all(fd, data, size) && ::fsync(fd) == 0;
    ::close(fd);
    if (!ok || ::rename(tmp.c_str(), path.c_str()) != 0) {
        ::unlink(tmp.c_str());
        return false;
    }
    return fsync_directory(dir);
}

void encode_frame(const Measurement& measurement, std::vector<std::byte>& out) {
    Measurement copy = measurement;
    auto result = sertial::Message<Measurement>::serialize(copy);
    auto view = result.view();
    const auto* bytes = reinterpret_cast<const std::byte*>(view.data());

    const uint32_t length = static_cast<uint32_t>(view.size());
    const uint32_t sum = checksum(bytes, length);

    const std::size_t offset = out.size();
    out.resize(offset + FRAME_HEADER_SIZE + length + FRAME_TRAILER_SIZE);
    std::memcpy(out.data() + offset, &FRAME_MAGIC, 4);
    std::memcpy(out.data() + offset + 4, &length, 4);
    std::memcpy(out.data() + offset + FRAME_HEADER_SIZE, bytes, length);
    std::memcpy(out.data() + offset + FRAME_HEADER_SIZE + length, &sum, 4);
}

} // namespace

SampleStore::SampleStore(Options options)
    : options_(std::move(options)) {
}

SampleStore::~SampleStore() {
    if (is_open()) {
        auto result = close();
        if (!result) {
            std::cerr << "[SampleStore] close failed: " << to_string(result.error()) << "\n";
        }
    }
}

std::string SampleStore::journal_path() const {
    return options_.directory + "/pending.log";
}

std::string SampleStore::meta_path() const {
    return options_.directory + "/meta.json";
}

std::string SampleStore::rejected_path() const {
    return options_.directory + "/rejected.jsonl";
}

Result<void, StoreError> SampleStore::open() {
    if (is_open()) {
        return Result<void, StoreError>::ok();
    }

    std::error_code ec;
    std::filesystem::create_directories(options_.directory, ec);
    if (ec) {
        std::cerr << "[SampleStore] Cannot create " << options_.directory << ": " << ec.message() << "\n";
        return StoreError::IOFailure;
    }

    pending_.clear();
    acked_frames_ = 0;

    if (auto result = load_meta(); !result) {
        return result;
    }
    if (auto result = replay(); !result) {
        return result;
    }
    if (!open_journal()) {
        std::cerr << "[SampleStore] Cannot open " << journal_path() << ": " << std::strerror(errno) << "\n";
        return StoreError::IOFailure;
    }

    std::cout << "[SampleStore] Opened " << options_.directory
              << " (pending=" << pending_.size()
              << ", last_sequence=" << meta_.last_sequence
              << ", last_acknowledged=" << meta_.last_acknowledged << ")\n";
    return Result<void, StoreError>::ok();
}

Result<void, StoreError> SampleStore::close() {
    if (!is_open()) {
        return Result<void, StoreError>::ok();
    }

    auto meta_result = write_meta(meta_);
    Result<void, StoreError> compact_result;
    if (meta_result && acked_frames_ > 0) {
        compact_result = compact();
    }

    ::close(journal_fd_);
    journal_fd_ = -1;

    if (!meta_result) {
        return meta_result;
    }
    return compact_result;
}

Result<void, StoreError> SampleStore::load_meta() {
    std::vector<std::byte> raw;
    if (!read_file(meta_path(), raw)) {
        if (errno == ENOENT) {
            meta_ = StoreMeta{};
            return Result<void, StoreError>::ok();
        }
        std::cerr << "[SampleStore] Cannot read " << meta_path() << ": " << std::strerror(errno) << "\n";
        return StoreError::IOFailure;
    }

    std::string text(reinterpret_cast<const char*>(raw.data()), raw.size());
    try {
        meta_ = rfl::json::read<StoreMeta>(text).value();
    } catch (const std::exception& e) {
        std::cerr << "[SampleStore] Corrupt " << meta_path() << ": " << e.what() << "\n";
        return StoreError::IOFailure;
    }
    return Result<void, StoreError>::ok();
}

Result<void, StoreError> SampleStore::write_meta(const StoreMeta& meta) {
    const std::string json = rfl::json::write(meta);
    if (!replace_file_atomically(options_.directory, meta_path(), json.data(), json.size())) {
        std::cerr << "[SampleStore] Cannot write " << meta_path() << ": " << std::strerror(errno) << "\n";
        return StoreError::IOFailure;
    }
    return Result<void, StoreError>::ok();
}

Result<void, StoreError> SampleStore::replay() {
    std::vector<std::byte> raw;
    if (!read_file(journal_path(), raw)) {
        if (errno == ENOENT) {
            journal_size_ = 0;
            return Result<void, StoreError>::ok();
        }
        std::cerr << "[SampleStore] Cannot read " << journal_path() << ": " << std::strerror(errno) << "\n";
        return StoreError::IOFailure;
    }

    std::size_t offset = 0;
    while (offset < raw.size()) {
        if (raw.size() - offset < FRAME_HEADER_SIZE) {
            break;
        }
        uint32_t magic = 0;
        uint32_t length = 0;
        std::memcpy(&magic, raw.data() + offset, 4);
        std::memcpy(&length, raw.data() + offset + 4, 4);
        if (magic != FRAME_MAGIC || length > MAX_FRAME_PAYLOAD ||
            raw.size() - offset < FRAME_HEADER_SIZE + length + FRAME_TRAILER_SIZE) {
            break;
        }

        const std::byte* payload = raw.data() + offset + FRAME_HEADER_SIZE;
        uint32_t stored_sum = 0;
        std::memcpy(&stored_sum, payload + length, 4);
        if (stored_sum != checksum(payload, length)) {
            break;
        }

        auto result = sertial::Message<Measurement>::deserialize(
            std::span<const std::byte>(payload, length));
        if (!result) {
            break;
        }
        Measurement m = std::move(*result);
        offset += FRAME_HEADER_SIZE + length + FRAME_TRAILER_SIZE;

        meta_.last_sequence = std::max(meta_.last_sequence, m.sequence_number);
        meta_.last_wall_time_ns = std::max(meta_.last_wall_time_ns, m.wall_time_ns);

        if (m.sequence_number <= meta_.last_acknowledged) {
            ++acked_frames_;
            continue;
        }
        if (!pending_.empty() && m.sequence_number <= pending_.back().sequence_number) {
            std::cerr << "[SampleStore] Skipping out-of-order frame seq=" << m.sequence_number << "\n";
            ++acked_frames_;
            continue;
        }
        pending_.push_back(std::move(m));
    }

    if (offset < raw.size()) {
        std::cerr << "[SampleStore] Truncating " << (raw.size() - offset)
                  << " bytes of incomplete journal tail\n";
        if (::truncate(journal_path().c_str(), static_cast<off_t>(offset)) != 0) {
            std::cerr << "[SampleStore] Cannot truncate journal: " << std::strerror(errno) << "\n";
            return StoreError::IOFailure;
        }
    }
    journal_size_ = offset;
    return Result<void, StoreError>::ok();
}

bool SampleStore::open_journal() {
    journal_fd_ = ::open(journal_path().c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, 0644);
    if (journal_fd_ < 0) {
        return false;
    }
    // Make a freshly created journal's directory entry durable
    return ::fsync(journal_fd_) == 0 && fsync_directory(options_.directory);
}

Result<void, StoreError> SampleStore::append(const Measurement& measurement) {
    if (!is_open()) {
        return StoreError::IOFailure;
    }
    if (measurement.sequence_number <= meta_.last_sequence) {
        return StoreError::OutOfOrder;
    }
    if (pending_.size() >= options_.capacity) {
        return StoreError::StoreFull;
    }

    std::vector<std::byte> frame;
    encode_frame(measurement, frame);

    if (!write_all(journal_fd_, frame.data(), frame.size()) || ::fdatasync(journal_fd_) != 0) {
        std::cerr << "[SampleStore] Journal append failed: " << std::strerror(errno) << "\n";
        // Roll back a partial frame so the journal stays parseable
        if (::ftruncate(journal_fd_, static_cast<off_t>(journal_size_)) != 0) {
            std::cerr << "[SampleStore] Journal rollback failed: " << std::strerror(errno) << "\n";
        }
        return StoreError::IOFailure;
    }

    journal_size_ += frame.size();
    pending_.push_back(measurement);
    meta_.last_sequence = measurement.sequence_number;
    meta_.last_wall_time_ns = std::max(meta_.last_wall_time_ns, measurement.wall_time_ns);
    return Result<void, StoreError>::ok();
}

Batch SampleStore::peek_batch(std::size_t max_count) const {
    const std::size_t count = std::min(max_count, pending_.size());
    return Batch(pending_.begin(), pending_.begin() + static_cast<std::ptrdiff_t>(count));
}

Result<void, StoreError> SampleStore::acknowledge(uint64_t up_to_sequence_number) {
    if (!is_open()) {
        return StoreError::IOFailure;
    }

    // Never acknowledge beyond what was appended, or future appends would be
    // skipped on replay
    const uint64_t up_to = std::min(up_to_sequence_number, meta_.last_sequence);
    if (up_to <= meta_.last_acknowledged) {
        return Result<void, StoreError>::ok();
    }

    StoreMeta next = meta_;
    next.last_acknowledged = up_to;
    if (auto result = write_meta(next); !result) {
        return result;
    }
    meta_ = next;

    while (!pending_.empty() && pending_.front().sequence_number <= up_to) {
        pending_.pop_front();
        ++acked_frames_;
    }

    if (pending_.empty() || acked_frames_ >= options_.compact_threshold) {
        return compact();
    }
    return Result<void, StoreError>::ok();
}

Result<void, StoreError> SampleStore::compact() {
    if (pending_.empty()) {
        if (::ftruncate(journal_fd_, 0) != 0 || ::fsync(journal_fd_) != 0) {
            std::cerr << "[SampleStore] Journal truncate failed: " << std::strerror(errno) << "\n";
            return StoreError::IOFailure;
        }
        journal_size_ = 0;
        acked_frames_ = 0;
        return Result<void, StoreError>::ok();
    }

    std::vector<std::byte> content;
    for (const auto& m : pending_) {
        encode_frame(m, content);
    }
    if (!replace_file_atomically(options_.directory, journal_path(), content.data(), content.size())) {
        std::cerr << "[SampleStore] Journal compaction failed: " << std::strerror(errno) << "\n";
        return StoreError::IOFailure;
    }

    // The old descriptor still points at the replaced inode
    ::close(journal_fd_);
    if (!open_journal()) {
        std::cerr << "[SampleStore] Cannot reopen journal: " << std::strerror(errno) << "\n";
        journal_fd_ = -1;
        return StoreError::IOFailure;
    }
    journal_size_ = content.size();
    acked_frames_ = 0;
    return Result<void, StoreError>::ok();
}

Result<void, StoreError> SampleStore::quarantine(std::span<const Measurement> batch,
                                                 UploadError cause,
                                                 const std::string& detail) {
    if (batch.empty()) {
        return Result<void, StoreError>::ok();
    }

    const std::string rejected_at = Time::to_iso8601(Time::wall_now(), 0);
    std::string lines;
    for (const auto& m : batch) {
        RejectedRecord record{
            .sequence_number = m.sequence_number,
            .sensor_id = std::string(std::string_view(m.sensor_id)),
            .ts = Time::to_iso8601(m.wall_time_ns, 0),
            .cause = to_string(cause),
            .detail = detail,
            .rejected_at = rejected_at,
            .readings = {}
        };
        for (std::size_t i = 0; i < m.values.size(); ++i) {
            const auto& v = m.values[i];
            record.readings[std::string(std::string_view(v.name))] = v.has_value ? std::optional<double>(v.value) : std::nullopt;
        }
        lines += rfl::json::write(record);
        lines += '\n';
    }

    int fd = ::open(rejected_path().c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, 0644);
    if (fd < 0) {
        std::cerr << "[SampleStore] Cannot open " << rejected_path() << ": " << std::strerror(errno) << "\n";
        return StoreError::IOFailure;
    }
    bool ok = write_all(fd, lines.data(), lines.size()) && ::fsync(fd) == 0;
    ::close(fd);
    if (!ok) {
        std::cerr << "[SampleStore] Dead-letter write failed: " << std::strerror(errno) << "\n";
        return StoreError::IOFailure;
    }

    std::cerr << "[SampleStore] Quarantined " << batch.size() << " measurement(s) seq "
              << batch.front().sequence_number << ".." << batch.back().sequence_number
              << " (" << to_string(cause) << ")\n";
    return Result<void, StoreError>::ok();
}

} // namespace fidasrelay
