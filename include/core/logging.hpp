// BSD 3-Clause License
//
// Copyright (c) 2021-2025, 🍀☀🌕🌥 🌊
//
// Redistribution and use in source and binary forms, with or without
// modification, are permitted provided that the following conditions are met:
//
// 1. Redistributions of source code must retain the above copyright notice, this
//    list of conditions and the following disclaimer.
//
// 2. Redistributions in binary form must reproduce the above copyright notice,
//    this list of conditions and the following disclaimer in the documentation
//    and/or other materials provided with the distribution.
//
// 3. Neither the name of the copyright holder nor the names of its
//    contributors may be used to endorse or promote products derived from
//    this software without specific prior written permission.
//
// THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS "AS IS"
// AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE
// IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE ARE
// DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT HOLDER OR CONTRIBUTORS BE LIABLE
// FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR CONSEQUENTIAL
// DAMAGES (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF SUBSTITUTE GOODS OR
// SERVICES; LOSS OF USE, DATA, OR PROFITS; OR BUSINESS INTERRUPTION) HOWEVER
// CAUSED AND ON ANY THEORY OF LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY,
// OR TORT (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE
// OF THIS SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.

/**
 * @file logging.hpp
 * @brief spdlog-backed logger factory shared by all pipeline components
 * @details Every component obtains a named logger through LoggerFactory so
 *          that console and rotating file sinks, level and pattern are
 *          configured once per process (typically from AnalysisConfig).
 *
 * @author kcenon
 * @since 1.0.0
 */

#pragma once

#include <filesystem>
#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace dentescope::logging {

enum class LogLevel {
    Trace = spdlog::level::trace,
    Debug = spdlog::level::debug,
    Info = spdlog::level::info,
    Warning = spdlog::level::warn,
    Error = spdlog::level::err,
    Critical = spdlog::level::critical,
    Off = spdlog::level::off
};

/**
 * @brief Sink settings shared by every pipeline logger
 *
 * All loggers write to stderr, keeping stdout free for result JSON. When
 * file logging is enabled they additionally share one rotating file,
 * `<logDirectory>/<fileName>.log`, so batch workers interleave into a single
 * ordered log.
 */
struct LogConfig {
    LogLevel level = LogLevel::Info;
    bool enableFileLogging = false;
    std::filesystem::path logDirectory;
    std::string fileName = "dentescope";
    std::string pattern = "[%Y-%m-%d %H:%M:%S.%e] [%n] [%t] [%^%l%$] %v";
    LogLevel flushLevel = LogLevel::Warning;
    size_t maxFileSize = 5 * 1024 * 1024;  // 5 MB
    size_t maxFiles = 3;
};

/**
 * @brief Parse a textual log level ("trace", "debug", "info", "warning",
 *        "error", "critical", "off")
 *
 * Unknown strings map to LogLevel::Info.
 */
[[nodiscard]] LogLevel parseLogLevel(const std::string& text);

[[nodiscard]] std::string toString(LogLevel level);

class LoggerFactory {
public:
    /// Return the registered logger @p name, creating it on the shared sinks
    static std::shared_ptr<spdlog::logger> create(const std::string& name);

    /**
     * @brief Rebuild the shared sinks and move existing loggers onto them
     *
     * Falls back to console-only output when the log file cannot be opened.
     */
    static void configure(const LogConfig& config);

    static void setGlobalLevel(LogLevel level);

    static LogLevel getGlobalLevel();

    /// Path of the active log file, empty when file logging is off
    static std::filesystem::path activeLogFile();

    static void shutdown();
};

}  // namespace dentescope::logging
