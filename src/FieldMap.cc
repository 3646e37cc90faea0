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
#include "qsmtk/FieldMap.h"

namespace qsmtk {

    void CheckAcquisition(const Array<double>& echo_times, double field_strength, int number_of_echoes) {
        if (int(echo_times.size()) != number_of_echoes)
            throw invalid_argument("Number of echo times (" + to_string(echo_times.size())
                + ") does not match the number of echoes (" + to_string(number_of_echoes) + ")");

        for (size_t i = 0; i < echo_times.size(); i++) {
            if (!(echo_times[i] > 0) || !isfinite(echo_times[i]))
                throw invalid_argument("Echo time " + to_string(i + 1) + " must be positive, got " + to_string(echo_times[i]));
            if (i > 0 && !(echo_times[i] > echo_times[i - 1]))
                throw invalid_argument("Echo times must be strictly increasing, echo " + to_string(i + 1)
                    + " has TE = " + to_string(echo_times[i]) + " s after TE = " + to_string(echo_times[i - 1]) + " s");
        }

        if (!(field_strength > 0) || !isfinite(field_strength))
            throw invalid_argument("Field strength must be positive, got " + to_string(field_strength));
    }

    //-------------------------------------------------------------------

    RealImage CombineEchoes(const RealImage& unwrapped_phase, const Array<double>& echo_times,
        double field_strength, double gyromagnetic_ratio) {
        CheckAcquisition(echo_times, field_strength, unwrapped_phase.GetT());
        if (!(gyromagnetic_ratio > 0))
            throw invalid_argument("Gyromagnetic ratio must be positive, got " + to_string(gyromagnetic_ratio));

        const ImageAttributes attr = Utility::SpatialAttributes(unwrapped_phase.Attributes());
        const int nvox = attr._x * attr._y * attr._z;
        const int nechoes = unwrapped_phase.GetT();

        RealImage field(attr);
        field = 0;

        RealPixel *pf = field.Data();
        const RealPixel *pp = unwrapped_phase.Data();
        for (int t = 0; t < nechoes; t++) {
            const double scale = 1.0 / (2 * PI * field_strength * gyromagnetic_ratio * echo_times[t]);
            #pragma omp parallel for
            for (int i = 0; i < nvox; i++) {
                const double phase = pp[t * nvox + i];
                if (isfinite(phase))
                    pf[i] += phase * scale;
            }
        }

        field /= nechoes;
        Utility::RemoveNonFinite(field);

        return field;
    }

}
