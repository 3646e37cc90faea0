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

// FFTW
#include <fftw3.h>

using namespace std;
using namespace mirtk;

namespace qsmtk {

    /**
     * @brief 3D discrete Fourier transform of volumes on a fixed grid.
     * Data are stored in MIRTK voxel order. The backward transform is
     * normalised, so Backward(Forward(x)) == x.
     */
    class FourierTransform {
        int _nx;
        int _ny;
        int _nz;

        fftw_plan _forward;
        fftw_plan _backward;

    public:
        explicit FourierTransform(const ImageAttributes& attr);
        ~FourierTransform();

        FourierTransform(const FourierTransform&) = delete;
        FourierTransform& operator=(const FourierTransform&) = delete;

        /// In-place forward transform
        void Forward(ComplexArray& data) const;

        /// In-place normalised backward transform
        void Backward(ComplexArray& data) const;

        /// Forward transform of a real 3D volume
        ComplexArray Forward(const RealImage& image) const;

        /**
         * @brief Multiply the spectrum of the data with a kernel: ifft(fft(x) .* K).
         * @param data Complex samples, left unchanged.
         * @param kernel Fourier-domain kernel in FFT order.
         * @return Complex result.
         */
        ComplexArray Convolve(const ComplexArray& data, const KernelArray& kernel) const;

        /// Real part of the kernel convolution of a real 3D volume
        RealImage Convolve(const RealImage& image, const KernelArray& kernel) const;

        inline int GetX() const {
            return _nx;
        }

        inline int GetY() const {
            return _ny;
        }

        inline int GetZ() const {
            return _nz;
        }

        inline int NumberOfVoxels() const {
            return _nx * _ny * _nz;
        }
    };

} // namespace qsmtk
