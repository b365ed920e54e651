/**
 * @file DiagnosticLog.hpp
 * @brief Append-only memory forensics log that survives OOM kills
 *
 * The file is opened, appended and closed on every write so no descriptor is
 * held between writes and nothing sits in a user-space buffer when the
 * container is killed. Writes are gated on memory: only elevated states and
 * explicitly forced records reach the disk.
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#pragma once

#include "Logger.hpp"
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

namespace relay {

/**
 * @brief Gated, append-only diagnostic log
 */
class DiagnosticLog {
public:
    enum class StartState {
        Fresh,      ///< File created with a header
        Restarted,  ///< File existed; restart marker appended
        Failed      ///< File could not be written
    };

    /**
     * @param path Log file location
     * @param record_floor_bytes Minimum memory_to_check for an unforced write
     */
    DiagnosticLog(std::string path, std::uint64_t record_floor_bytes);

    /**
     * @brief Write the header, or a restart marker if the file already exists
     *
     * An existing file means the previous process did not clean up, which in
     * a memory-limited container usually means it was killed.
     */
    StartState open_session();

    /**
     * @brief Append lines if memory_to_check reaches the record floor
     * @return true if the lines were written
     */
    bool record(const std::vector<std::string>& lines, std::uint64_t memory_to_check);

    /**
     * @brief Append lines regardless of memory
     * @return true if the lines were written
     */
    bool record_forced(const std::vector<std::string>& lines);

    bool should_record(std::uint64_t memory_to_check) const {
        return memory_to_check >= record_floor_bytes_;
    }

    const std::string& path() const { return path_; }
    std::size_t failed_writes() const;
    std::size_t records_written() const;

    /// 80-character section separator
    static std::string rule();

    /// "YYYY-MM-DD HH:MM:SS" in local time
    static std::string timestamp();

private:
    std::string path_;
    std::uint64_t record_floor_bytes_;
    mutable std::mutex write_mutex_;
    std::size_t failed_writes_ = 0;
    std::size_t records_written_ = 0;
    Logger logger_{"DiagnosticLog"};

    bool append_lines(const std::vector<std::string>& lines);
};

} // namespace relay
