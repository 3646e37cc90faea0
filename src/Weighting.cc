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

// QSMTK
#include "qsmtk/Weighting.h"
#include "qsmtk/DifferentialOperators.h"

namespace qsmtk {

    DataWeighting DataWeightingFromInt(int mode) {
        switch (mode) {
        case 0:
            return DataWeighting::Uniform;
        case 1:
            return DataWeighting::SNR;
        default:
            throw invalid_argument("Unsupported data weighting mode: " + to_string(mode));
        }
    }

    //-------------------------------------------------------------------

    GradientWeighting GradientWeightingFromInt(int mode) {
        if (mode == 1)
            return GradientWeighting::Binary;

        throw invalid_argument("Unsupported gradient weighting mode: " + to_string(mode));
    }

    //-------------------------------------------------------------------

    string ToString(DataWeighting mode) {
        switch (mode) {
        case DataWeighting::Uniform:
            return "uniform";
        case DataWeighting::SNR:
            return "SNR";
        }
        throw invalid_argument("Unsupported data weighting mode: " + to_string(int(mode)));
    }

    //-------------------------------------------------------------------

    string ToString(GradientWeighting mode) {
        switch (mode) {
        case GradientWeighting::Binary:
            return "binary";
        }
        throw invalid_argument("Unsupported gradient weighting mode: " + to_string(int(mode)));
    }

    //-------------------------------------------------------------------

    RealImage DataTermMask(DataWeighting mode, const RealImage& noise_std, const RealImage& mask) {
        Utility::CheckSameGrid(noise_std, mask, "noise map and mask");

        RealImage weights(Utility::SpatialAttributes(mask.Attributes()));

        switch (mode) {
        case DataWeighting::Uniform:
            weights = 1;
            return weights;

        case DataWeighting::SNR: {
            const int n = weights.NumberOfVoxels();
            RealPixel *pw = weights.Data();
            const RealPixel *pn = noise_std.Data();
            const RealPixel *pm = mask.Data();

            double sum = 0;
            int count = 0;
            for (int i = 0; i < n; i++) {
                const bool inside = pm[i] > 0;
                double w = (inside ? 1.0 : 0.0) / pn[i];
                if (!isfinite(w) || !inside)
                    w = 0;
                pw[i] = w;
                if (inside) {
                    sum += w;
                    count++;
                }
            }

            if (count == 0)
                throw runtime_error("DataTermMask: the mask is empty");

            const double mean = sum / count;
            if (!(mean > 0))
                throw runtime_error("DataTermMask: the noise map has no finite values inside the mask");

            weights /= mean;
            return weights;
        }
        }

        throw invalid_argument("Unsupported data weighting mode: " + to_string(int(mode)));
    }

    //-------------------------------------------------------------------

    GradientMaskResult GradientMask(GradientWeighting mode, const RealImage& magnitude, const RealImage& mask,
        double percentage, int max_iterations) {
        if (mode != GradientWeighting::Binary)
            throw invalid_argument("Unsupported gradient weighting mode: " + to_string(int(mode)));
        if (!(percentage > 0 && percentage <= 1))
            throw invalid_argument("Edge percentage must be in (0, 1], got " + to_string(percentage));

        Utility::CheckSameGrid(magnitude, mask, "magnitude and mask");

        RealImage masked = Utility::GetVolume(magnitude, 0);
        Utility::MaskImage(masked, mask);

        double max_magnitude = -numeric_limits<double>::infinity();
        const RealPixel *pmag = magnitude.Data();
        for (int i = 0; i < masked.NumberOfVoxels(); i++)
            max_magnitude = max(max_magnitude, double(pmag[i]));

        const int denominator = Utility::CountMaskVoxels(mask);
        if (denominator == 0)
            throw runtime_error("GradientMask: the mask is empty");

        RealImage gradient = Gradient(masked);
        RealPixel *pg = gradient.Data();
        const int n = gradient.NumberOfVoxels();
        for (int i = 0; i < n; i++)
            pg[i] = fabs(pg[i]);

        auto count_edges = [&](double threshold) {
            int count = 0;
            for (int i = 0; i < n; i++)
                if (pg[i] > threshold)
                    count++;
            return count;
        };

        GradientMaskResult result;
        result.threshold = max(0.01 * max_magnitude, numeric_limits<double>::epsilon());
        result.iterations = 0;

        double ratio = double(count_edges(result.threshold)) / denominator;
        if (ratio > percentage) {
            while (ratio > percentage && result.iterations < max_iterations) {
                result.threshold *= 1.05;
                ratio = double(count_edges(result.threshold)) / denominator;
                result.iterations++;
            }
        } else {
            while (ratio < percentage && result.iterations < max_iterations) {
                result.threshold *= 0.95;
                ratio = double(count_edges(result.threshold)) / denominator;
                result.iterations++;
            }
        }

        result.converged = result.iterations < max_iterations;
        if (!result.converged)
            cerr << "Warning: maximum number of iterations reached in the gradient mask threshold search, final ratio "
                << ratio << endl;

        result.weights = RealImage(gradient.Attributes());
        RealPixel *pw = result.weights.Data();
        #pragma omp parallel for
        for (int i = 0; i < n; i++)
            pw[i] = pg[i] <= result.threshold ? 1 : 0;

        return result;
    }

}
