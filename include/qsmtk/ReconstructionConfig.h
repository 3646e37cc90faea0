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
#include "qsmtk/MEDI.h"

using namespace std;
using namespace mirtk;

namespace qsmtk {

    /// Background field removal method
    enum class BackgroundMethod {
        /// Variable-radius SHARP
        VSharp,
        /// Single-radius spherical mean value filter
        SMV
    };

    /// Parse "vsharp" or "smv", throws invalid_argument for other values
    BackgroundMethod BackgroundMethodFromString(const string& name);

    /// Processing options of the reconstruction pipeline
    struct ReconstructionConfig {
        /// Gyromagnetic ratio [MHz/T]
        double gyromagnetic_ratio = GYROMAGNETIC_RATIO;

        BackgroundMethod background_method = BackgroundMethod::VSharp;

        /// V-SHARP radii [mm], the default radii are used if empty
        Array<double> vsharp_radii;

        /// Truncation threshold of the V-SHARP deconvolution kernel
        double vsharp_threshold = 0.05;

        /// Radius of the single-radius SMV filter [mm]
        double smv_radius = 5;

        /// Spherical mean of the mask above which a voxel survives erosion
        double erosion_threshold = 0.999;

        MEDIParameters medi;

        bool debug = false;
        bool verbose = false;
        bool profile = false;

        /// Verbose output is written here if not empty
        string log_file;

        /// Throw invalid_argument for out-of-range values
        void Check() const;
    };

} // namespace qsmtk
