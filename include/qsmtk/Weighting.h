/*
 * QSMTK : QSM reconstruction based on MIRTK
 *
 * Copyright 2021- King's College London
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#pragma once

// QSMTK
#include "qsmtk/Common.h"

using namespace std;
using namespace mirtk;

namespace qsmtk {

    /// Weighting of the data-fidelity term
    enum class DataWeighting {
        /// Every voxel weighted by 1
        Uniform = 0,
        /// Inverse noise standard deviation normalised to unit mean over the mask
        SNR = 1
    };

    /// Weighting of the regularisation term
    enum class GradientWeighting {
        /// Edges excluded, non-edges weighted by 1
        Binary = 1
    };

    /// Convert a mode number (0 or 1), throws invalid_argument for other values
    DataWeighting DataWeightingFromInt(int mode);

    /// Convert a mode number (1), throws invalid_argument for other values
    GradientWeighting GradientWeightingFromInt(int mode);

    string ToString(DataWeighting mode);
    string ToString(GradientWeighting mode);

    /// Outcome of the edge threshold search
    struct GradientMaskResult {
        /// 4D image (x, y, z, 3): 1 for non-edge gradient components, 0 for edges
        RealImage weights;

        /// Final gradient magnitude threshold
        double threshold;

        /// Number of 5% threshold adjustments
        int iterations;

        /// False if the search stopped at the iteration cap
        bool converged;
    };

    /**
     * @brief Data-fidelity weighting.
     * Uniform mode returns a volume of ones. SNR mode computes mask / noise_std,
     * zeroes non-finite values and voxels outside the mask and normalises the
     * mean over the mask to 1.
     * @param mode
     * @param noise_std Noise standard deviation map.
     * @param mask
     * @return
     */
    RealImage DataTermMask(DataWeighting mode, const RealImage& noise_std, const RealImage& mask);

    /**
     * @brief Gradient weighting for the edge-preserving regularisation.
     * The gradient components of the masked magnitude are compared with a
     * threshold that starts at 1% of the maximum magnitude and is raised or
     * lowered by 5% per step (at most max_iterations steps) until the ratio of
     * components above it to the number of mask voxels reaches the percentage.
     * @param mode
     * @param magnitude Anatomical magnitude image.
     * @param mask
     * @param percentage Target ratio of edge components.
     * @param max_iterations
     * @return
     */
    GradientMaskResult GradientMask(GradientWeighting mode, const RealImage& magnitude, const RealImage& mask,
        double percentage = 0.9, int max_iterations = 100);

} // namespace qsmtk
