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

#include "core/radiograph_loader.hpp"
#include "core/logging.hpp"

#include <algorithm>
#include <array>
#include <atomic>
#include <cctype>
#include <chrono>
#include <cstring>
#include <format>
#include <fstream>
#include <functional>
#include <iterator>
#include <thread>

#include <itkGDCMImageIO.h>
#include <itkImageFileReader.h>

namespace dentescope::core {

namespace {
auto& getLogger() {
    static auto logger = logging::LoggerFactory::create("RadiographLoader");
    return logger;
}

constexpr std::array<uint8_t, 8> kPngSignature = {0x89, 'P', 'N', 'G', '\r', '\n', 0x1A, '\n'};
constexpr size_t kDicomPreambleSize = 128;

/// Staging file for ITK's file based readers, removed on scope exit
class ScopedTempFile {
public:
    explicit ScopedTempFile(const std::string& extension) {
        static std::atomic<uint64_t> counter{0};
        auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        auto thread = std::hash<std::thread::id>{}(std::this_thread::get_id());
        path_ = std::filesystem::temp_directory_path() /
                std::format("dentescope-{:x}-{:x}-{}{}", stamp, thread,
                            counter.fetch_add(1), extension);
    }

    ~ScopedTempFile() {
        std::error_code ec;
        std::filesystem::remove(path_, ec);
        if (ec) {
            getLogger()->warn("Failed to remove staging file {}: {}",
                              path_.string(), ec.message());
        }
    }

    ScopedTempFile(const ScopedTempFile&) = delete;
    ScopedTempFile& operator=(const ScopedTempFile&) = delete;

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
    std::filesystem::path path_;
};

std::string extensionFor(RadiographFormat format) {
    switch (format) {
        case RadiographFormat::Png: return ".png";
        case RadiographFormat::Jpeg: return ".jpg";
        case RadiographFormat::Tiff: return ".tif";
        case RadiographFormat::Bmp: return ".bmp";
        case RadiographFormat::Dicom: return ".dcm";
        case RadiographFormat::Nrrd: return ".nrrd";
        case RadiographFormat::MetaImage: return ".mha";
        case RadiographFormat::Unknown: break;
    }
    return {};
}

RadiographFormat formatFromExtension(const std::filesystem::path& filePath) {
    auto ext = filePath.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (ext == ".nrrd" || ext == ".nhdr") {
        return RadiographFormat::Nrrd;
    }
    if (ext == ".mha" || ext == ".mhd") {
        return RadiographFormat::MetaImage;
    }
    return RadiographFormat::Unknown;
}

std::expected<LoadedRadiograph, DecodeError>
readWithItk(const std::filesystem::path& filePath,
            RadiographFormat format,
            const std::string& sourceName) {
    using ReaderType = itk::ImageFileReader<RadiographLoader::ImageType>;

    try {
        auto reader = ReaderType::New();
        reader->SetFileName(filePath.string());
        if (format == RadiographFormat::Dicom) {
            reader->SetImageIO(itk::GDCMImageIO::New());
        }
        reader->Update();

        LoadedRadiograph result;
        result.image = reader->GetOutput();
        result.format = format;
        result.sourceName = sourceName;

        auto size = result.image->GetLargestPossibleRegion().GetSize();
        result.width = static_cast<unsigned int>(size[0]);
        result.height = static_cast<unsigned int>(size[1]);

        if (result.width == 0 || result.height == 0) {
            return std::unexpected(DecodeError{
                DecodeError::Code::CorruptData,
                sourceName + ": decoded image has no pixels"
            });
        }

        // Detector and measurement geometry work in pixel units
        RadiographLoader::ImageType::SpacingType spacing;
        spacing.Fill(1.0);
        result.image->SetSpacing(spacing);
        RadiographLoader::ImageType::PointType origin;
        origin.Fill(0.0);
        result.image->SetOrigin(origin);
        result.image->DisconnectPipeline();

        getLogger()->debug("Decoded {} ({}, {}x{})", sourceName, toString(format),
                           result.width, result.height);
        return result;
    } catch (const itk::ExceptionObject& e) {
        getLogger()->error("Failed to decode {}: {}", sourceName, e.GetDescription());
        return std::unexpected(DecodeError{
            DecodeError::Code::CorruptData,
            sourceName + ": " + e.GetDescription()
        });
    } catch (const std::exception& e) {
        getLogger()->error("Failed to decode {}: {}", sourceName, e.what());
        return std::unexpected(DecodeError{
            DecodeError::Code::CorruptData,
            sourceName + ": " + e.what()
        });
    }
}

}  // anonymous namespace

std::string toString(RadiographFormat format) {
    switch (format) {
        case RadiographFormat::Png: return "PNG";
        case RadiographFormat::Jpeg: return "JPEG";
        case RadiographFormat::Tiff: return "TIFF";
        case RadiographFormat::Bmp: return "BMP";
        case RadiographFormat::Dicom: return "DICOM";
        case RadiographFormat::Nrrd: return "NRRD";
        case RadiographFormat::MetaImage: return "MetaImage";
        case RadiographFormat::Unknown: break;
    }
    return "Unknown";
}

RadiographFormat RadiographLoader::detectFormat(std::span<const uint8_t> bytes) noexcept {
    if (bytes.size() >= kPngSignature.size() &&
        std::equal(kPngSignature.begin(), kPngSignature.end(), bytes.begin())) {
        return RadiographFormat::Png;
    }
    if (bytes.size() >= 3 && bytes[0] == 0xFF && bytes[1] == 0xD8 && bytes[2] == 0xFF) {
        return RadiographFormat::Jpeg;
    }
    if (bytes.size() >= 4 &&
        ((bytes[0] == 'I' && bytes[1] == 'I' && bytes[2] == 0x2A && bytes[3] == 0x00) ||
         (bytes[0] == 'M' && bytes[1] == 'M' && bytes[2] == 0x00 && bytes[3] == 0x2A))) {
        return RadiographFormat::Tiff;
    }
    if (bytes.size() >= 2 && bytes[0] == 'B' && bytes[1] == 'M') {
        return RadiographFormat::Bmp;
    }
    if (bytes.size() >= kDicomPreambleSize + 4 &&
        std::memcmp(bytes.data() + kDicomPreambleSize, "DICM", 4) == 0) {
        return RadiographFormat::Dicom;
    }
    return RadiographFormat::Unknown;
}

std::expected<LoadedRadiograph, DecodeError>
RadiographLoader::decode(std::span<const uint8_t> bytes, const std::string& sourceName) const {
    if (bytes.empty()) {
        getLogger()->error("Empty payload for {}", sourceName);
        return std::unexpected(DecodeError{
            DecodeError::Code::EmptyPayload,
            sourceName
        });
    }

    auto format = detectFormat(bytes);
    if (format == RadiographFormat::Unknown) {
        getLogger()->error("Unrecognized image signature for {} ({} bytes)",
                           sourceName, bytes.size());
        return std::unexpected(DecodeError{
            DecodeError::Code::UnsupportedFormat,
            sourceName + ": not a PNG, JPEG, TIFF, BMP or DICOM payload"
        });
    }

    ScopedTempFile staging(extensionFor(format));
    {
        std::ofstream out(staging.path(), std::ios::binary);
        if (!out.is_open()) {
            return std::unexpected(DecodeError{
                DecodeError::Code::IoError,
                "Cannot create staging file " + staging.path().string()
            });
        }
        out.write(reinterpret_cast<const char*>(bytes.data()),
                  static_cast<std::streamsize>(bytes.size()));
        if (!out.good()) {
            return std::unexpected(DecodeError{
                DecodeError::Code::IoError,
                "Cannot write staging file " + staging.path().string()
            });
        }
    }

    return readWithItk(staging.path(), format, sourceName);
}

std::expected<LoadedRadiograph, DecodeError>
RadiographLoader::loadFile(const std::filesystem::path& filePath) const {
    if (!std::filesystem::exists(filePath)) {
        getLogger()->error("File not found: {}", filePath.string());
        return std::unexpected(DecodeError{
            DecodeError::Code::FileNotFound,
            filePath.string()
        });
    }

    auto byExtension = formatFromExtension(filePath);
    if (byExtension != RadiographFormat::Unknown) {
        return readWithItk(filePath, byExtension, filePath.filename().string());
    }

    auto bytes = readBytes(filePath);
    if (!bytes) {
        return std::unexpected(bytes.error());
    }
    return decode(*bytes, filePath.filename().string());
}

std::expected<std::vector<uint8_t>, DecodeError>
RadiographLoader::readBytes(const std::filesystem::path& filePath) {
    std::ifstream in(filePath, std::ios::binary);
    if (!in.is_open()) {
        return std::unexpected(DecodeError{
            std::filesystem::exists(filePath) ? DecodeError::Code::IoError
                                              : DecodeError::Code::FileNotFound,
            filePath.string()
        });
    }

    std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(in)),
                               std::istreambuf_iterator<char>());
    if (in.bad()) {
        return std::unexpected(DecodeError{
            DecodeError::Code::IoError,
            "Failed to read " + filePath.string()
        });
    }
    return bytes;
}

}  // namespace dentescope::core
