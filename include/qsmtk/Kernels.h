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

using namespace std;
using namespace mirtk;

namespace qsmtk {

    /**
     * @brief Spherical mean value kernel.
     * Both representations have their origin at voxel index 0 (FFT order).
     */
    struct SphereKernel {
        /// Radius [mm]
        double radius;

        /// Normalised sphere in image space, sums to 1
        RealImage image;

        /// Real part of the Fourier transform of the image-space sphere
        KernelArray fourier;
    };

    /**
     * @brief Convert an axis number to a field direction.
     * @param axis 1, 2 or 3 for x, y or z.
     * @return
     */
    Direction FieldDirectionFromAxis(int axis);

    /// Normalise a field direction to unit length (throws for a zero vector)
    Direction NormaliseDirection(const Direction& direction);

    /// Signed frequency (or offset) of FFT index i on an axis with n samples
    inline int SignedIndex(int i, int n) {
        return i < (n + 1) / 2 ? i : i - n;
    }

    /**
     * @brief Fourier-domain dipole kernel D(k) = 1/3 - (k.b)^2 / |k|^2.
     * The kernel is returned in FFT order with D(0) = 0.
     * @param attr Grid size and voxel size.
     * @param direction Field direction (normalised internally).
     * @return
     */
    KernelArray DipoleKernel(const ImageAttributes& attr, const Direction& direction);

    /**
     * @brief Dipole kernel derived from the image-space dipole field
     * d(r) = (3 (r.b)^2 - |r|^2) / (4 PI |r|^5) with d(0) = 0.
     * @param attr
     * @param direction
     * @param fft Transform on the grid of attr.
     * @return Real part of the Fourier transform of d in FFT order.
     */
    KernelArray DipoleKernelImageSpace(const ImageAttributes& attr, const Direction& direction, const FourierTransform& fft);

    /**
     * @brief Rasterise a sphere with sub-voxel accuracy at its boundary.
     * Voxels completely inside the sphere get 1, voxels completely outside 0,
     * boundary voxels the fraction of a 20x20x20 sub-sampling grid inside.
     * @param attr
     * @param radius [mm]
     * @return Sphere normalised to unit sum, centred at voxel 0 with periodic wrap.
     */
    RealImage SphereImage(const ImageAttributes& attr, double radius);

    /**
     * @brief Create a spherical mean value kernel.
     * @param attr
     * @param radius [mm]
     * @param fft Transform on the grid of attr.
     * @return
     */
    SphereKernel CreateSphereKernel(const ImageAttributes& attr, double radius, const FourierTransform& fft);

    /// Fourier-domain kernel of the periodic 7-point discrete Laplacian
    KernelArray LaplacianKernel(const ImageAttributes& attr);

} // namespace qsmtk
