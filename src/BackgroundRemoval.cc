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
#include "qsmtk/BackgroundRemoval.h"

namespace qsmtk {

    RealImage SMV(const RealImage& image, const SphereKernel& kernel, const FourierTransform& fft) {
        return fft.Convolve(image, kernel.fourier);
    }

    //-------------------------------------------------------------------

    RealImage ErodeMask(const RealImage& mask, const SphereKernel& kernel, const FourierTransform& fft, double threshold) {
        const RealImage binary = Utility::CreateMask(mask, 0);
        RealImage eroded = SMV(binary, kernel, fft);

        RealPixel *pe = eroded.Data();
        const RealPixel *pm = binary.Data();
        #pragma omp parallel for
        for (int i = 0; i < eroded.NumberOfVoxels(); i++)
            pe[i] = pe[i] > threshold && pm[i] > 0 ? 1 : 0;

        return eroded;
    }

    //-------------------------------------------------------------------

    RealImage AdjustNoise(const RealImage& noise_std, const SphereKernel& kernel, const FourierTransform& fft) {
        RealImage variance = noise_std;
        variance *= noise_std;

        RealImage adjusted = SMV(variance, kernel, fft);
        RealPixel *pa = adjusted.Data();
        const RealPixel *pv = variance.Data();
        #pragma omp parallel for
        for (int i = 0; i < adjusted.NumberOfVoxels(); i++)
            pa[i] = sqrt(max(pa[i] + pv[i], 0.0));

        return adjusted;
    }

    //-------------------------------------------------------------------

    Array<double> DefaultVSharpRadii(const ImageAttributes& attr) {
        const double step = 2 * min(attr._dx, min(attr._dy, attr._dz));
        if (!(step > 0))
            throw invalid_argument("Voxel size must be positive");

        Array<double> radii;
        for (double r = 18; r >= 2 - 1e-9; r -= step)
            radii.push_back(r);

        if (radii.empty())
            radii.push_back(18);

        return radii;
    }

    //-------------------------------------------------------------------

    BackgroundRemovalResult SMVFilter(const RealImage& field, const RealImage& mask, double radius, double erosion_threshold) {
        Utility::CheckSameGrid(field, mask, "field map and mask");

        const ImageAttributes attr = Utility::SpatialAttributes(field.Attributes());
        const FourierTransform fft(attr);
        const SphereKernel kernel = CreateSphereKernel(attr, radius, fft);

        BackgroundRemovalResult result;
        result.mask = ErodeMask(mask, kernel, fft, erosion_threshold);
        if (Utility::CountMaskVoxels(result.mask) == 0)
            throw runtime_error("SMV erosion with radius " + to_string(radius) + " mm removed every mask voxel");

        result.local_field = field;
        Utility::RemoveNonFinite(result.local_field);
        const RealImage smooth = SMV(result.local_field, kernel, fft);
        result.local_field -= smooth;
        Utility::MaskImage(result.local_field, result.mask);

        return result;
    }

    //-------------------------------------------------------------------

    BackgroundRemovalResult VSharp(const RealImage& field, const RealImage& mask, const Array<double>& radii,
        double threshold, double erosion_threshold) {
        Utility::CheckSameGrid(field, mask, "field map and mask");
        if (radii.empty())
            throw invalid_argument("V-SHARP needs at least one radius");
        if (!(threshold > 0))
            throw invalid_argument("V-SHARP threshold must be positive, got " + to_string(threshold));

        Array<double> sorted = radii;
        sort(sorted.begin(), sorted.end(), greater<double>());

        const ImageAttributes attr = Utility::SpatialAttributes(field.Attributes());
        const FourierTransform fft(attr);
        const int n = attr._x * attr._y * attr._z;

        RealImage total = field;
        Utility::RemoveNonFinite(total);
        const ComplexArray spectrum = fft.Forward(total);

        BackgroundRemovalResult result;
        result.local_field = RealImage(attr);
        result.local_field = 0;
        result.mask = RealImage(attr);
        result.mask = 0;

        KernelArray inverse;

        for (size_t r = 0; r < sorted.size(); r++) {
            const SphereKernel kernel = CreateSphereKernel(attr, sorted[r], fft);
            const RealImage eroded = ErodeMask(mask, kernel, fft, erosion_threshold);

            // High-pass filtered field f - S * f
            ComplexArray filtered = spectrum;
            #pragma omp parallel for
            for (int i = 0; i < n; i++)
                filtered[i] *= 1 - kernel.fourier[i];
            fft.Backward(filtered);

            RealPixel *pl = result.local_field.Data();
            RealPixel *pm = result.mask.Data();
            const RealPixel *pe = eroded.Data();
            #pragma omp parallel for
            for (int i = 0; i < n; i++) {
                if (pe[i] > 0 && pm[i] == 0) {
                    pl[i] = filtered[i].real();
                    pm[i] = 1;
                }
            }

            if (r == 0) {
                inverse.resize(n);
                for (int i = 0; i < n; i++) {
                    const double h = 1 - kernel.fourier[i];
                    inverse[i] = fabs(h) < threshold ? 0 : 1 / h;
                }
            }
        }

        if (Utility::CountMaskVoxels(result.mask) == 0)
            throw runtime_error("V-SHARP erosion removed every mask voxel, smallest radius "
                + to_string(sorted.back()) + " mm");

        result.local_field = fft.Convolve(result.local_field, inverse);
        Utility::RemoveNonFinite(result.local_field);
        Utility::MaskImage(result.local_field, result.mask);

        return result;
    }

}
