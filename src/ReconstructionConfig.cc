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
#include "qsmtk/ReconstructionConfig.h"

namespace qsmtk {

    BackgroundMethod BackgroundMethodFromString(const string& name) {
        if (name == "vsharp")
            return BackgroundMethod::VSharp;
        if (name == "smv")
            return BackgroundMethod::SMV;

        throw invalid_argument("Unsupported background removal method: " + name);
    }

    //-------------------------------------------------------------------

    void ReconstructionConfig::Check() const {
        if (!(gyromagnetic_ratio > 0))
            throw invalid_argument("Gyromagnetic ratio must be positive, got " + to_string(gyromagnetic_ratio));
        for (const double r : vsharp_radii)
            if (!(r > 0))
                throw invalid_argument("V-SHARP radii must be positive, got " + to_string(r));
        if (!(vsharp_threshold > 0 && vsharp_threshold < 1))
            throw invalid_argument("V-SHARP threshold must be in (0, 1), got " + to_string(vsharp_threshold));
        if (!(smv_radius > 0))
            throw invalid_argument("SMV radius must be positive, got " + to_string(smv_radius));
        if (!(erosion_threshold > 0 && erosion_threshold <= 1))
            throw invalid_argument("Erosion threshold must be in (0, 1], got " + to_string(erosion_threshold));

        medi.Check();
    }

}
