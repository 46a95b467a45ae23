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

#include "core/analysis_config.hpp"
#include "core/logging.hpp"
#include "core/radiograph_loader.hpp"
#include "services/analysis/batch_analyzer.hpp"
#include "services/analysis/detector_backed_analyzer.hpp"
#include "services/analysis/landmark_analyzer.hpp"
#include "services/analysis/mock_analyzer.hpp"
#include "services/detection/contour_tooth_detector.hpp"
#include "services/detection/recorded_detector.hpp"
#include "services/export/result_serializer.hpp"

#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QCoreApplication>
#include <QTextStream>

#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace {

using dentescope::core::AnalysisConfig;
using dentescope::core::AnalysisError;
using dentescope::core::AnalysisOptions;
using namespace dentescope::services;

namespace ExitCode {
constexpr int Success = 0;
constexpr int Failure = 1;
constexpr int DecodeError = 2;
constexpr int DetectorUnavailable = 3;
constexpr int ConfigurationError = 4;
constexpr int Timeout = 5;
}  // namespace ExitCode

int exitCodeFor(AnalysisError::Code code) {
    switch (code) {
        case AnalysisError::Code::Success: return ExitCode::Success;
        case AnalysisError::Code::ImageDecodeError: return ExitCode::DecodeError;
        case AnalysisError::Code::DetectorUnavailable: return ExitCode::DetectorUnavailable;
        case AnalysisError::Code::CalibrationMisconfigured:
        case AnalysisError::Code::InvalidConfiguration: return ExitCode::ConfigurationError;
        case AnalysisError::Code::Timeout: return ExitCode::Timeout;
        case AnalysisError::Code::PreprocessingFailed:
        case AnalysisError::Code::InternalError: break;
    }
    return ExitCode::Failure;
}

QTextStream& err() {
    static QTextStream stream(stderr);
    return stream;
}

/// Parse an optional floating point option; nullopt when absent
std::optional<double> numericOption(const QCommandLineParser& parser,
                                    const QCommandLineOption& option,
                                    bool& valid) {
    if (!parser.isSet(option)) {
        return std::nullopt;
    }
    bool ok = false;
    const double value = parser.value(option).toDouble(&ok);
    if (!ok) {
        err() << "Invalid numeric value for --" << option.names().constFirst() << ": "
              << parser.value(option) << Qt::endl;
        valid = false;
        return std::nullopt;
    }
    return value;
}

/// Parse "x1,y1,x2,y2" into a landmark segment
std::optional<LandmarkSegment> segmentOption(const QCommandLineParser& parser,
                                             const QCommandLineOption& option) {
    const QString name = option.names().constFirst();
    if (!parser.isSet(option)) {
        err() << "measure requires --" << name << " x1,y1,x2,y2" << Qt::endl;
        return std::nullopt;
    }
    const QStringList parts = parser.value(option).split(',');
    if (parts.size() != 4) {
        err() << "--" << name << " expects four comma separated coordinates" << Qt::endl;
        return std::nullopt;
    }
    double coordinates[4] = {};
    for (qsizetype i = 0; i < parts.size(); ++i) {
        bool ok = false;
        coordinates[i] = parts.at(i).trimmed().toDouble(&ok);
        if (!ok) {
            err() << "Invalid coordinate for --" << name << ": " << parts.at(i) << Qt::endl;
            return std::nullopt;
        }
    }
    return LandmarkSegment{{coordinates[0], coordinates[1]}, {coordinates[2], coordinates[3]}};
}

ImageInput readInput(const QString& path) {
    const std::filesystem::path filePath(path.toStdString());
    ImageInput input;
    input.name = filePath.filename().string();

    // Unreadable files are left empty and surface as decode errors
    auto bytes = dentescope::core::RadiographLoader::readBytes(filePath);
    if (bytes) {
        input.bytes = std::move(*bytes);
    } else {
        err() << QString::fromStdString(bytes.error().toString()) << Qt::endl;
    }
    return input;
}

int writeDocument(const nlohmann::json& document, const QString& outputPath) {
    if (outputPath.isEmpty()) {
        QTextStream out(stdout);
        out << QString::fromStdString(ResultSerializer::toText(document)) << Qt::endl;
        return ExitCode::Success;
    }

    ResultSerializer serializer;
    if (auto saved = serializer.save(document, outputPath.toStdString()); !saved) {
        err() << QString::fromStdString(saved.error().toString()) << Qt::endl;
        return ExitCode::Failure;
    }
    return ExitCode::Success;
}

}  // anonymous namespace

/**
 * @brief Command-line entry point
 *
 * dentescope analyze <image> [options]
 * dentescope batch <images...> [options]
 * dentescope measure [image] --molar x1,y1,x2,y2 --premolar x1,y1,x2,y2 [options]
 */
int main(int argc, char* argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName("dentescope");
    app.setApplicationVersion("1.0.0");
    app.setOrganizationName("DenteScope");
    app.setOrganizationDomain("dentescope.org");

    QCommandLineParser parser;
    parser.setApplicationDescription(
        "Primary molar / premolar width analysis of dental panoramic radiographs");
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument("command", "analyze | batch | measure");
    parser.addPositionalArgument("images", "Radiograph files", "<images...>");

    QCommandLineOption detectionsOption("detections",
        "Replay recorded detector output from <file>.", "file");
    QCommandLineOption configOption("config", "Load configuration from <file>.", "file");
    QCommandLineOption confidenceOption("confidence",
        "Detection confidence threshold.", "value");
    QCommandLineOption calibrationOption("calibration",
        "Calibration in mm per pixel.", "mm");
    QCommandLineOption magnificationOption("magnification",
        "Radiographic magnification factor.", "factor");
    QCommandLineOption mockOption("mock", "Use the deterministic mock analyzer.");
    QCommandLineOption contourOption("contour-detector",
        "Use the classical contour-based tooth detector.");
    QCommandLineOption logLevelOption("log-level",
        "trace, debug, info, warning, error, critical or off.", "level");
    QCommandLineOption outputOption("output", "Write JSON to <file>.", "file");
    QCommandLineOption workersOption("workers", "Batch worker threads.", "count", "0");
    QCommandLineOption molarOption("molar",
        "Molar edge landmarks for measure.", "x1,y1,x2,y2");
    QCommandLineOption premolarOption("premolar",
        "Premolar edge landmarks for measure.", "x1,y1,x2,y2");

    parser.addOptions({detectionsOption, configOption, confidenceOption, calibrationOption,
                       magnificationOption, mockOption, contourOption, logLevelOption,
                       outputOption, workersOption, molarOption, premolarOption});
    parser.process(app);

    const QStringList positional = parser.positionalArguments();
    const QString command = positional.isEmpty() ? QString() : positional.constFirst();
    if (command != "measure" && positional.size() < 2) {
        err() << "Usage: dentescope analyze <image> | dentescope batch <images...>"
              << " | dentescope measure [image] --molar ... --premolar ..." << Qt::endl;
        return ExitCode::Failure;
    }
    if (command != "analyze" && command != "batch" && command != "measure") {
        err() << "Unknown command: " << command << Qt::endl;
        return ExitCode::Failure;
    }
    if (command == "measure" && positional.size() > 2) {
        err() << "measure accepts at most one image name" << Qt::endl;
        return ExitCode::Failure;
    }
    if (command == "analyze" && positional.size() != 2) {
        err() << "analyze expects exactly one image" << Qt::endl;
        return ExitCode::Failure;
    }

    AnalysisConfig config;
    if (parser.isSet(configOption)) {
        auto loaded = AnalysisConfig::loadFromFile(parser.value(configOption).toStdString());
        if (!loaded) {
            err() << QString::fromStdString(loaded.error().toString()) << Qt::endl;
            return ExitCode::ConfigurationError;
        }
        config = std::move(*loaded);
    }
    if (parser.isSet(logLevelOption)) {
        config.logging.level =
            dentescope::logging::parseLogLevel(parser.value(logLevelOption).toStdString());
    }
    dentescope::logging::LoggerFactory::configure(config.logging);

    bool valid = true;
    AnalysisOptions options;
    options.confidenceThreshold = numericOption(parser, confidenceOption, valid);
    options.calibrationMmPerPixel = numericOption(parser, calibrationOption, valid);
    options.magnificationFactor = numericOption(parser, magnificationOption, valid);
    bool workersOk = false;
    const unsigned int workers = parser.value(workersOption).toUInt(&workersOk);
    if (!valid || !workersOk) {
        return ExitCode::ConfigurationError;
    }
    if (auto checked = config.withOverrides(options).validate(); !checked) {
        err() << QString::fromStdString(checked.error().toString()) << Qt::endl;
        return ExitCode::ConfigurationError;
    }

    // Operator-placed landmarks bypass detection entirely
    if (command == "measure") {
        auto molar = segmentOption(parser, molarOption);
        auto premolar = segmentOption(parser, premolarOption);
        if (!molar || !premolar) {
            return ExitCode::ConfigurationError;
        }
        LandmarkRequest request;
        request.sourceName = positional.size() == 2
            ? std::filesystem::path(positional.at(1).toStdString()).filename().string()
            : std::string("landmarks");
        request.molar = *molar;
        request.premolar = *premolar;

        int exitCode = ExitCode::Success;
        auto result = LandmarkAnalyzer(config).analyze(request, options);
        if (!result) {
            err() << QString::fromStdString(result.error().toString()) << Qt::endl;
            exitCode = exitCodeFor(result.error().code);
            if (writeDocument(ResultSerializer::errorToJson(result.error()),
                              parser.value(outputOption)) != ExitCode::Success) {
                err() << "Error report could not be written" << Qt::endl;
            }
        } else {
            exitCode = writeDocument(ResultSerializer::toJson(*result),
                                     parser.value(outputOption));
        }
        dentescope::logging::LoggerFactory::shutdown();
        return exitCode;
    }

    std::shared_ptr<ToothAnalyzer> analyzer;
    if (parser.isSet(mockOption)) {
        analyzer = std::make_shared<MockAnalyzer>(config);
    } else {
        std::shared_ptr<ToothDetector> detector;
        if (parser.isSet(detectionsOption)) {
            auto recorded = RecordedDetector::loadFromFile(
                parser.value(detectionsOption).toStdString());
            if (!recorded) {
                err() << QString::fromStdString(recorded.error().toString()) << Qt::endl;
                return ExitCode::DetectorUnavailable;
            }
            detector = std::move(*recorded);
        } else if (parser.isSet(contourOption)) {
            detector = std::make_shared<ContourToothDetector>();
        } else {
            err() << "No detector backend: use --detections, --contour-detector or --mock"
                  << Qt::endl;
            return ExitCode::DetectorUnavailable;
        }
        analyzer = std::make_shared<DetectorBackedAnalyzer>(std::move(detector), config);
    }

    int exitCode = ExitCode::Success;
    if (command == "analyze") {
        auto result = analyzer->analyze(readInput(positional.at(1)), options);
        if (!result) {
            err() << QString::fromStdString(result.error().toString()) << Qt::endl;
            exitCode = exitCodeFor(result.error().code);
            if (writeDocument(ResultSerializer::errorToJson(result.error()),
                              parser.value(outputOption)) != ExitCode::Success) {
                err() << "Error report could not be written" << Qt::endl;
            }
        } else {
            exitCode = writeDocument(ResultSerializer::toJson(*result),
                                     parser.value(outputOption));
        }
    } else {
        std::vector<ImageInput> inputs;
        for (qsizetype i = 1; i < positional.size(); ++i) {
            inputs.push_back(readInput(positional.at(i)));
        }
        BatchAnalyzer batch(analyzer, workers, config.timeout);
        auto result = batch.analyze(std::move(inputs), options);
        exitCode = writeDocument(ResultSerializer::toJson(result), parser.value(outputOption));
    }

    dentescope::logging::LoggerFactory::shutdown();
    return exitCode;
}
