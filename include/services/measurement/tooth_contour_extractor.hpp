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
 * @file tooth_contour_extractor.hpp
 * @brief Tooth boundary extraction inside a detection box
 * @details Supplies contour points for principal-axis width measurement when
 *          the detector reports only a bounding box. The box region of the
 *          enhanced radiograph is Otsu-thresholded, the largest bright
 *          connected component is kept as the tooth, and its boundary pixels
 *          are returned.
 *
 * @author kcenon
 * @since 1.0.0
 */

#pragma once

#include <expected>
#include <vector>

#include <itkImage.h>

#include "services/detection/detection_types.hpp"
#include "services/measurement/measurement_types.hpp"

namespace dentescope::services {

/**
 * @brief Extracts the boundary of the tooth inside a bounding box
 *
 * @example
 * @code
 * ToothContourExtractor extractor;
 * auto contour = extractor.extract(prepared.enhanced, detection.box);
 * if (contour) {
 *     // contour->size() boundary pixels in processed-image coordinates
 * }
 * @endcode
 */
class ToothContourExtractor {
public:
    using ImageType = itk::Image<float, 2>;
    using MaskType = itk::Image<unsigned char, 2>;
    using LabelImageType = itk::Image<unsigned int, 2>;

    /**
     * @brief Extraction parameters
     */
    struct Parameters {
        /// Box enlargement on each side, as a fraction of the box size
        double paddingFraction = 0.05;

        /// Binary closing radius applied to the Otsu mask
        unsigned int closingRadius = 1;

        /// Components smaller than this are not accepted as a tooth
        size_t minPixels = 20;

        [[nodiscard]] bool isValid() const noexcept {
            return paddingFraction >= 0.0 && paddingFraction <= 0.5 && closingRadius <= 8;
        }
    };

    /**
     * @brief Extract boundary points of the dominant bright region in `box`
     *
     * @param enhanced Preprocessed grayscale image
     * @param box Detection box in the image's pixel space
     * @param params Extraction parameters
     * @return Boundary pixel centers in image pixel coordinates, or
     *         InvalidInput / ExtractionFailed
     */
    [[nodiscard]] std::expected<std::vector<Point2D>, MeasurementError>
    extract(ImageType::Pointer enhanced,
            const BoundingBox& box,
            const Parameters& params = Parameters{}) const;

    /**
     * @brief Collect pixels of `label` that touch a different label (4-neighborhood)
     *
     * Pixels on the region border count as boundary pixels.
     */
    [[nodiscard]] static std::vector<Point2D>
    boundaryPoints(LabelImageType::Pointer labels,
                   unsigned int label,
                   const LabelImageType::RegionType& region);
};

}  // namespace dentescope::services
