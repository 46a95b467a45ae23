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

#include "core/analysis_config.hpp"
#include "services/analysis/tooth_types.hpp"

namespace dentescope::services {

/**
 * @brief Matches primary molars with their successor premolars
 *
 * Greedy nearest-centroid matching: molars are visited in descending raw
 * confidence order and each takes the closest unclaimed premolar that lies
 * anterior to it on the same arch half (by the configured side convention)
 * and, when maxPairDistancePx is set, within that distance. A premolar is
 * claimed by at most one molar. Molars without a valid premolar yield no
 * pair.
 *
 * The result is deterministic for a given input order.
 */
class PairingEngine {
public:
    explicit PairingEngine(core::AnatomicalConfig config);

    [[nodiscard]] PairingResult pair(const ClassificationResult& classified) const;

    /**
     * @brief Anatomical ordering: the premolar lies anterior to the molar
     *        on the same arch half
     */
    [[nodiscard]] static bool isAnatomicallyOrdered(const ClassifiedTooth& molar,
                                                    const ClassifiedTooth& premolar) noexcept;

    [[nodiscard]] static double centroidDistance(const ClassifiedTooth& a,
                                                 const ClassifiedTooth& b) noexcept;

private:
    core::AnatomicalConfig config_;
};

}  // namespace dentescope::services
