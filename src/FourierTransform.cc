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
#include "qsmtk/FourierTransform.h"

namespace qsmtk {

    FourierTransform::FourierTransform(const ImageAttributes& attr) : _nx(attr._x), _ny(attr._y), _nz(attr._z) {
        if (_nx < 1 || _ny < 1 || _nz < 1)
            throw runtime_error("FourierTransform: invalid grid size " + to_string(_nx) + "x" + to_string(_ny) + "x" + to_string(_nz));

        // Plans are created once on a scratch buffer and then executed on the caller's arrays,
        // so they must not depend on the alignment of the buffer
        fftw_complex *buffer = fftw_alloc_complex(size_t(NumberOfVoxels()));
        if (buffer == nullptr)
            throw runtime_error("FourierTransform: fftw_alloc_complex failed (N=" + to_string(NumberOfVoxels()) + ")");

        // FFTW is row-major with the last index varying fastest, MIRTK stores x fastest
        const unsigned flags = FFTW_ESTIMATE | FFTW_UNALIGNED;
        _forward = fftw_plan_dft_3d(_nz, _ny, _nx, buffer, buffer, FFTW_FORWARD, flags);
        _backward = fftw_plan_dft_3d(_nz, _ny, _nx, buffer, buffer, FFTW_BACKWARD, flags);
        fftw_free(buffer);

        if (_forward == nullptr || _backward == nullptr) {
            if (_forward) fftw_destroy_plan(_forward);
            if (_backward) fftw_destroy_plan(_backward);
            throw runtime_error("FourierTransform: fftw_plan_dft_3d failed");
        }
    }

    //-------------------------------------------------------------------

    FourierTransform::~FourierTransform() {
        fftw_destroy_plan(_forward);
        fftw_destroy_plan(_backward);
    }

    //-------------------------------------------------------------------

    void FourierTransform::Forward(ComplexArray& data) const {
        if (data.size() != size_t(NumberOfVoxels()))
            throw runtime_error("FourierTransform::Forward: data size does not match the grid");

        fftw_complex *ptr = reinterpret_cast<fftw_complex *>(data.data());
        fftw_execute_dft(_forward, ptr, ptr);
    }

    //-------------------------------------------------------------------

    void FourierTransform::Backward(ComplexArray& data) const {
        if (data.size() != size_t(NumberOfVoxels()))
            throw runtime_error("FourierTransform::Backward: data size does not match the grid");

        fftw_complex *ptr = reinterpret_cast<fftw_complex *>(data.data());
        fftw_execute_dft(_backward, ptr, ptr);

        const double scale = 1.0 / NumberOfVoxels();
        #pragma omp parallel for
        for (int i = 0; i < NumberOfVoxels(); i++)
            data[i] *= scale;
    }

    //-------------------------------------------------------------------

    ComplexArray FourierTransform::Forward(const RealImage& image) const {
        if (image.GetX() != _nx || image.GetY() != _ny || image.GetZ() != _nz)
            throw runtime_error("FourierTransform::Forward: image does not match the grid");

        ComplexArray data(NumberOfVoxels());
        const RealPixel *ptr = image.Data();
        for (int i = 0; i < NumberOfVoxels(); i++)
            data[i] = Complex(ptr[i], 0);

        Forward(data);
        return data;
    }

    //-------------------------------------------------------------------

    ComplexArray FourierTransform::Convolve(const ComplexArray& data, const KernelArray& kernel) const {
        if (kernel.size() != size_t(NumberOfVoxels()))
            throw runtime_error("FourierTransform::Convolve: kernel size does not match the grid");

        ComplexArray result = data;
        Forward(result);
        #pragma omp parallel for
        for (int i = 0; i < NumberOfVoxels(); i++)
            result[i] *= kernel[i];
        Backward(result);

        return result;
    }

    //-------------------------------------------------------------------

    RealImage FourierTransform::Convolve(const RealImage& image, const KernelArray& kernel) const {
        if (kernel.size() != size_t(NumberOfVoxels()))
            throw runtime_error("FourierTransform::Convolve: kernel size does not match the grid");

        ComplexArray spectrum = Forward(image);
        #pragma omp parallel for
        for (int i = 0; i < NumberOfVoxels(); i++)
            spectrum[i] *= kernel[i];
        Backward(spectrum);

        return Utility::RealPart(spectrum, Utility::SpatialAttributes(image.Attributes()));
    }

}
