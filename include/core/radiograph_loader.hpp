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
 * @file radiograph_loader.hpp
 * @brief Raster radiograph decoding into ITK grayscale images
 * @details RadiographLoader turns an encoded image payload (PNG, JPEG, TIFF,
 *          BMP or DICOM bytes) or a file on disk into a single-channel
 *          floating point ITK image. Colour inputs are reduced to luminance
 *          by the ITK reader. The container format is sniffed from the
 *          payload's magic bytes rather than trusted from a file name.
 *
 * ## Thread Safety
 * - decode() and loadFile() are const and keep no state between calls; a
 *   single loader may be shared across batch workers.
 *
 * @author kcenon
 * @since 1.0.0
 */

#pragma once

#include <cstdint>
#include <expected>
#include <filesystem>
#include <span>
#include <string>
#include <vector>

#include <itkImage.h>

namespace dentescope::core {

/// Container formats recognized by the loader
enum class RadiographFormat {
    Unknown,
    Png,
    Jpeg,
    Tiff,
    Bmp,
    Dicom,
    Nrrd,
    MetaImage
};

/**
 * @brief Error information for radiograph decoding
 */
struct DecodeError {
    enum class Code {
        Success,
        FileNotFound,
        EmptyPayload,
        UnsupportedFormat,
        CorruptData,
        IoError
    };

    Code code = Code::Success;
    std::string message;

    [[nodiscard]] bool isSuccess() const noexcept {
        return code == Code::Success;
    }

    [[nodiscard]] std::string toString() const {
        switch (code) {
            case Code::Success: return "Success";
            case Code::FileNotFound: return "File not found: " + message;
            case Code::EmptyPayload: return "Empty payload: " + message;
            case Code::UnsupportedFormat: return "Unsupported format: " + message;
            case Code::CorruptData: return "Corrupt data: " + message;
            case Code::IoError: return "I/O error: " + message;
        }
        return "Unknown error";
    }
};

/**
 * @brief Decoded radiograph with provenance
 */
struct LoadedRadiograph {
    using ImageType = itk::Image<float, 2>;

    ImageType::Pointer image;
    RadiographFormat format = RadiographFormat::Unknown;
    std::string sourceName;
    unsigned int width = 0;
    unsigned int height = 0;
};

/**
 * @brief Decoder for radiograph payloads
 *
 * @example
 * @code
 * RadiographLoader loader;
 * auto radiograph = loader.loadFile("/data/pano_001.png");
 * if (!radiograph) {
 *     std::cerr << radiograph.error().toString() << std::endl;
 *     return;
 * }
 * auto image = radiograph->image;  // itk::Image<float, 2>
 * @endcode
 */
class RadiographLoader {
public:
    using ImageType = LoadedRadiograph::ImageType;

    /**
     * @brief Identify the container format from leading bytes
     *
     * Recognizes PNG, JPEG, TIFF (little and big endian), BMP and DICOM
     * (preamble followed by "DICM" at offset 128).
     */
    [[nodiscard]] static RadiographFormat detectFormat(std::span<const uint8_t> bytes) noexcept;

    /**
     * @brief Decode an in-memory image payload
     * @param bytes Encoded image bytes
     * @param sourceName Name used for logging and result tagging
     * @return Decoded image, or EmptyPayload / UnsupportedFormat / CorruptData
     */
    [[nodiscard]] std::expected<LoadedRadiograph, DecodeError>
    decode(std::span<const uint8_t> bytes, const std::string& sourceName) const;

    /**
     * @brief Decode an image file
     *
     * NRRD (.nrrd, .nhdr) and MetaImage (.mha, .mhd) files are accepted by
     * extension; all other formats are sniffed from the file contents.
     */
    [[nodiscard]] std::expected<LoadedRadiograph, DecodeError>
    loadFile(const std::filesystem::path& filePath) const;

    /// Read a whole file into memory
    [[nodiscard]] static std::expected<std::vector<uint8_t>, DecodeError>
    readBytes(const std::filesystem::path& filePath);
};

[[nodiscard]] std::string toString(RadiographFormat format);

}  // namespace dentescope::core
