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
#include "qsmtk/PhaseUnwrapping.h"
#include "qsmtk/DifferentialOperators.h"
#include "qsmtk/FourierTransform.h"
#include "qsmtk/Kernels.h"

namespace qsmtk {

    RealImage UnwrapLaplacian(const RealImage& phase, const RealImage& mask) {
        Utility::CheckSameGrid(phase, mask, "phase and mask");

        const ImageAttributes attr = Utility::SpatialAttributes(phase.Attributes());
        const FourierTransform fft(attr);
        const KernelArray laplacian = LaplacianKernel(attr);

        RealImage unwrapped(phase.Attributes());

        for (int t = 0; t < phase.GetT(); t++) {
            RealImage wrapped = Utility::GetVolume(phase, t);
            Utility::RemoveNonFinite(wrapped);

            RealImage sin_phase(attr), cos_phase(attr);
            const RealPixel *pp = wrapped.Data();
            RealPixel *ps = sin_phase.Data();
            RealPixel *pc = cos_phase.Data();
            #pragma omp parallel for
            for (int i = 0; i < wrapped.NumberOfVoxels(); i++) {
                ps[i] = sin(pp[i]);
                pc[i] = cos(pp[i]);
            }

            const RealImage lap_sin = PeriodicLaplacian(sin_phase);
            const RealImage lap_cos = PeriodicLaplacian(cos_phase);

            // Laplacian of the unwrapped phase
            ComplexArray spectrum(wrapped.NumberOfVoxels());
            const RealPixel *pls = lap_sin.Data();
            const RealPixel *plc = lap_cos.Data();
            #pragma omp parallel for
            for (int i = 0; i < wrapped.NumberOfVoxels(); i++)
                spectrum[i] = pc[i] * pls[i] - ps[i] * plc[i];

            fft.Forward(spectrum);
            #pragma omp parallel for
            for (int i = 0; i < int(spectrum.size()); i++)
                spectrum[i] = laplacian[i] != 0 ? spectrum[i] / laplacian[i] : Complex(0, 0);
            fft.Backward(spectrum);

            RealImage volume = Utility::RealPart(spectrum, attr);
            Utility::RemoveNonFinite(volume);
            Utility::MaskImage(volume, mask);
            Utility::PutVolume(unwrapped, t, volume);
        }

        return unwrapped;
    }

}
