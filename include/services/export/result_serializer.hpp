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

#pragma once

#include "core/analysis_error.hpp"
#include "services/analysis/analysis_result.hpp"
#include "services/analysis/batch_analyzer.hpp"

#include <nlohmann/json.hpp>

#include <expected>
#include <filesystem>
#include <string>

namespace dentescope::services {

/**
 * @brief Error information for serialization operations
 */
struct SerializationError {
    enum class Code {
        Success,
        FileAccessDenied,
        InternalError
    };

    Code code = Code::Success;
    std::string message;

    [[nodiscard]] bool isSuccess() const noexcept {
        return code == Code::Success;
    }

    [[nodiscard]] std::string toString() const {
        switch (code) {
            case Code::Success: return "Success";
            case Code::FileAccessDenied: return "File access denied: " + message;
            case Code::InternalError: return "Internal error: " + message;
        }
        return "Unknown error";
    }
};

/**
 * @brief JSON output of analysis and batch results
 *
 * Single results carry `pairs`, `total_pairs_detected`, `image_quality`,
 * `clinical_recommendations`, `processing_time_ms` and the diagnostic keys
 * `empty_reason`, `warnings`, `calibration_mm_per_pixel`,
 * `magnification_factor`, `detected_teeth_count` and `unpaired_molars`.
 * Batch output adds `file_name`, `file_size` and `status` per item and a
 * `summary` object.
 *
 * @example
 * @code
 * ResultSerializer serializer;
 * auto document = ResultSerializer::toJson(*result);
 * if (auto saved = serializer.save(document, "result.json"); !saved) {
 *     std::cerr << saved.error().toString() << std::endl;
 * }
 * @endcode
 */
class ResultSerializer {
public:
    /// Current output schema version
    static constexpr const char* CURRENT_VERSION = "1.0.0";

    [[nodiscard]] static nlohmann::json toJson(const AnalysisResult& result);

    [[nodiscard]] static nlohmann::json toJson(const BatchResult& batch);

    /// Error object: `error`, `error_code`, `retryable` and, when
    /// retryable, `retry_guidance`
    [[nodiscard]] static nlohmann::json errorToJson(const core::AnalysisError& error);

    /**
     * @brief Render a document with 2-space indentation
     *
     * File names reach the document as raw bytes; invalid UTF-8 sequences
     * are written as U+FFFD instead of failing the whole document.
     */
    [[nodiscard]] static std::string toText(const nlohmann::json& document);

    /// Write toText(document) to @p filePath
    [[nodiscard]] std::expected<void, SerializationError>
    save(const nlohmann::json& document, const std::filesystem::path& filePath) const;
};

}  // namespace dentescope::services
