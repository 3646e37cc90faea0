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

// Boost
#define BOOST_TEST_MODULE testWeighting

// QSMTK
#include "TestCommon.h"
#include "qsmtk/Weighting.h"

namespace {
    /// 1D profile whose forward differences alternate between 1 and 0.001
    RealImage AlternatingSteps(int n) {
        RealImage image(GridAttributes(n, 1, 1));
        double value = 0;
        for (int i = 0; i < n; i++) {
            image(i, 0, 0) = value;
            value += i % 2 == 0 ? 1 : 0.001;
        }
        return image;
    }

    /// Check that exactly the large steps are marked as edges
    bool LargeStepsAreEdges(const GradientMaskResult& result, int n) {
        for (int i = 0; i < n; i++) {
            const bool edge = i < n - 1 && i % 2 == 0;
            if (result.weights(i, 0, 0, 0) != (edge ? 0 : 1))
                return false;
            if (result.weights(i, 0, 0, 1) != 1 || result.weights(i, 0, 0, 2) != 1)
                return false;
        }
        return true;
    }
}

BOOST_AUTO_TEST_CASE(ModeConversion) {
    BOOST_CHECK(DataWeightingFromInt(0) == DataWeighting::Uniform);
    BOOST_CHECK(DataWeightingFromInt(1) == DataWeighting::SNR);
    BOOST_CHECK(GradientWeightingFromInt(1) == GradientWeighting::Binary);

    BOOST_CHECK_THROW(DataWeightingFromInt(2), invalid_argument);
    BOOST_CHECK_THROW(DataWeightingFromInt(-1), invalid_argument);
    BOOST_CHECK_THROW(GradientWeightingFromInt(0), invalid_argument);
    BOOST_CHECK_THROW(GradientWeightingFromInt(2), invalid_argument);
}

BOOST_AUTO_TEST_CASE(UniformDataWeighting) {
    const ImageAttributes attr = GridAttributes(8, 8, 8);
    const RealImage mask = BallVolume(attr, 4, 4, 4, 2.5);
    const RealImage noise = RandomVolume(attr, 4);

    const RealImage w = DataTermMask(DataWeighting::Uniform, noise, mask);
    BOOST_CHECK_EQUAL(MaxAbsDifference(w, ConstantVolume(attr, 1)), 0.0);
}

BOOST_AUTO_TEST_CASE(SNRDataWeighting) {
    const ImageAttributes attr = GridAttributes(10, 9, 8);
    const RealImage mask = BallVolume(attr, 5, 4, 4, 3.5);

    RealImage noise = RandomVolume(attr, 8);
    RealPixel *pn = noise.Data();
    for (int i = 0; i < noise.NumberOfVoxels(); i++)
        pn[i] = 0.5 + fabs(pn[i]);
    // Division by zero inside the mask is replaced by 0
    noise(5, 4, 4) = 0;

    const RealImage w = DataTermMask(DataWeighting::SNR, noise, mask);

    BOOST_CHECK(Utility::AllFinite(w));
    BOOST_CHECK_SMALL(MeanInMask(w, mask) - 1, 1e-10);
    BOOST_CHECK_EQUAL(w(5, 4, 4), 0.0);

    bool zero_outside = true;
    for (int i = 0; i < w.NumberOfVoxels(); i++)
        if (mask.Data()[i] == 0 && w.Data()[i] != 0)
            zero_outside = false;
    BOOST_CHECK(zero_outside);

    // Relative weights follow the inverse noise
    BOOST_CHECK_CLOSE(w(4, 4, 4) / w(6, 4, 4), noise(6, 4, 4) / noise(4, 4, 4), 1e-8);
}

BOOST_AUTO_TEST_CASE(SNRDataWeightingEmptyMask) {
    const ImageAttributes attr = GridAttributes(4, 4, 4);
    BOOST_CHECK_THROW(DataTermMask(DataWeighting::SNR, ConstantVolume(attr, 1), ConstantVolume(attr, 0)), runtime_error);
}

BOOST_AUTO_TEST_CASE(GradientMaskAtTarget) {
    const int n = 100;
    const RealImage magnitude = AlternatingSteps(n);
    const RealImage mask = ConstantVolume(magnitude.Attributes(), 1);

    // Half of the voxels have a large step, the initial threshold of 1% of the maximum separates them
    const GradientMaskResult result = GradientMask(GradientWeighting::Binary, magnitude, mask, 0.5);

    BOOST_CHECK_EQUAL(result.weights.GetT(), 3);
    BOOST_CHECK_EQUAL(result.iterations, 0);
    BOOST_CHECK(result.converged);
    BOOST_CHECK(LargeStepsAreEdges(result, n));
}

BOOST_AUTO_TEST_CASE(GradientMaskRaisesThreshold) {
    const int n = 100;
    const RealImage magnitude = AlternatingSteps(n);
    const RealImage mask = ConstantVolume(magnitude.Attributes(), 1);

    // No ratio between 0 and 0.5 is possible, the threshold stops within one step above the large steps
    const GradientMaskResult result = GradientMask(GradientWeighting::Binary, magnitude, mask, 0.3);

    BOOST_CHECK(result.converged);
    BOOST_CHECK(result.threshold >= 1);
    BOOST_CHECK(result.threshold / 1.05 < 1);

    bool all_smooth = true;
    const RealPixel *pw = result.weights.Data();
    for (int i = 0; i < result.weights.NumberOfVoxels(); i++)
        if (pw[i] != 1)
            all_smooth = false;
    BOOST_CHECK(all_smooth);
}

BOOST_AUTO_TEST_CASE(GradientMaskIterationCap) {
    const int n = 100;
    const RealImage magnitude = AlternatingSteps(n);
    const RealImage mask = ConstantVolume(magnitude.Attributes(), 1);

    // Reaching 90% needs the threshold below 0.001, more than 100 steps of 5% away
    GradientMaskResult result;
    BOOST_CHECK_NO_THROW(result = GradientMask(GradientWeighting::Binary, magnitude, mask, 0.9));

    BOOST_CHECK(!result.converged);
    BOOST_CHECK_EQUAL(result.iterations, 100);
    BOOST_CHECK_CLOSE(result.threshold, 0.01 * magnitude(n - 1, 0, 0) * pow(0.95, 100), 1e-8);
    BOOST_CHECK(LargeStepsAreEdges(result, n));
}

BOOST_AUTO_TEST_CASE(GradientMaskChecks) {
    const ImageAttributes attr = GridAttributes(6, 6, 6);
    const RealImage magnitude = RandomVolume(attr, 1);

    BOOST_CHECK_THROW(GradientMask(GradientWeighting::Binary, magnitude, ConstantVolume(attr, 0), 0.9), runtime_error);
    BOOST_CHECK_THROW(GradientMask(GradientWeighting::Binary, magnitude, ConstantVolume(attr, 1), 1.5), invalid_argument);
    BOOST_CHECK_THROW(GradientMask(GradientWeighting::Binary, magnitude, ConstantVolume(GridAttributes(5, 6, 6), 1), 0.9), runtime_error);
}
