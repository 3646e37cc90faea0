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
#include "qsmtk/FourierTransform.h"
#include "qsmtk/Kernels.h"

using namespace std;
using namespace mirtk;

namespace qsmtk {

    /// Local field and the region on which it is valid
    struct BackgroundRemovalResult {
        RealImage local_field;
        RealImage mask;
    };

    /// Spherical mean value of a 3D volume: ifft(fft(x) .* S)
    RealImage SMV(const RealImage& image, const SphereKernel& kernel, const FourierTransform& fft);

    /**
     * @brief Erode a mask with a sphere.
     * A voxel is kept if the spherical mean of the mask around it exceeds the
     * threshold, i.e. the whole sphere lies inside the mask.
     * @param mask
     * @param kernel
     * @param fft
     * @param threshold
     * @return Binary mask, a subset of the input mask.
     */
    RealImage ErodeMask(const RealImage& mask, const SphereKernel& kernel, const FourierTransform& fft, double threshold = 0.999);

    /// Noise of a high-pass filtered volume: sqrt(SMV(n^2) + n^2)
    RealImage AdjustNoise(const RealImage& noise_std, const SphereKernel& kernel, const FourierTransform& fft);

    /**
     * @brief Default V-SHARP radii: 18 mm down to 2 mm in steps of twice the smallest voxel size.
     * @param attr
     * @return Radii in decreasing order [mm].
     */
    Array<double> DefaultVSharpRadii(const ImageAttributes& attr);

    /**
     * @brief Background removal with the spherical mean value filter (SHARP without deconvolution).
     * @param field Total field map.
     * @param mask
     * @param radius [mm]
     * @param erosion_threshold
     * @return f - SMV(f) on the eroded mask. Throws if the eroded mask is empty.
     */
    BackgroundRemovalResult SMVFilter(const RealImage& field, const RealImage& mask, double radius, double erosion_threshold = 0.999);

    /**
     * @brief Background removal with variable-radius SHARP.
     * Every voxel receives the high-pass filtered field of the largest sphere
     * that fits inside the mask around it. The combined field is deconvolved by
     * the high-pass kernel of the largest radius, with kernel values below the
     * threshold set to 0, and masked by the mask eroded with the smallest radius.
     *
     * References:
     * Schweser et al., Quantitative imaging of intrinsic magnetic tissue properties using MRI signal phase, NeuroImage 2011
     * Wu et al., Whole brain susceptibility mapping using compressed sensing, MRM 2012
     *
     * @param field Total field map.
     * @param mask
     * @param radii Sphere radii [mm], sorted internally in decreasing order.
     * @param threshold Truncation threshold of the deconvolution kernel.
     * @param erosion_threshold
     * @return
     */
    BackgroundRemovalResult VSharp(const RealImage& field, const RealImage& mask, const Array<double>& radii,
        double threshold = 0.05, double erosion_threshold = 0.999);

} // namespace qsmtk
