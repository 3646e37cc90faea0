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

    /**
     * @brief Check the acquisition parameters of a multi-echo stack.
     * Throws invalid_argument unless there is one positive echo time per
     * volume, echo times are strictly increasing and the field strength is positive.
     * @param echo_times [s]
     * @param field_strength [T]
     * @param number_of_echoes
     */
    void CheckAcquisition(const Array<double>& echo_times, double field_strength, int number_of_echoes);

    /**
     * @brief Combine unwrapped multi-echo phase into a single field map.
     * Each echo is scaled by 1 / (2 PI B0 gamma TE) before the echoes are
     * averaged. Non-finite phase values are treated as 0.
     * @param unwrapped_phase 4D stack of unwrapped phase [rad].
     * @param echo_times [s]
     * @param field_strength [T]
     * @param gyromagnetic_ratio [MHz/T]
     * @return Field map [ppm].
     */
    RealImage CombineEchoes(const RealImage& unwrapped_phase, const Array<double>& echo_times,
        double field_strength, double gyromagnetic_ratio = GYROMAGNETIC_RATIO);

} // namespace qsmtk
