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

// MIRTK
#include "mirtk/Common.h"
#include "mirtk/Options.h"
#include "mirtk/IOConfig.h"
#include "mirtk/Array.h"
#include "mirtk/Math.h"
#include "mirtk/Parallel.h"
#include "mirtk/BaseImage.h"
#include "mirtk/GenericImage.h"
#include "mirtk/ImageAttributes.h"

// C++ Standard
#include <algorithm>
#include <array>
#include <cmath>
#include <complex>
#include <fstream>
#include <iostream>
#include <limits>
#include <numeric>
#include <stdexcept>
#include <string>

// Boost
#include <boost/filesystem.hpp>
#include <boost/format.hpp>
#include <boost/program_options.hpp>

// OpenMP
#include <omp.h>

using namespace std;
using namespace mirtk;

namespace qsmtk {
    /// Complex sample of a k-space or phasor volume
    typedef complex<double> Complex;

    /// Complex volume stored in MIRTK voxel order (x fastest, then y, then z)
    typedef Array<Complex> ComplexArray;

    /// Real-valued Fourier-domain kernel stored in FFT order (DC at index 0)
    typedef Array<double> KernelArray;

    /// Unit vector of the main magnetic field direction
    typedef array<double, 3> Direction;

    /// PI
    constexpr double PI = 3.14159265358979323846;

    /// Gyromagnetic ratio of hydrogen divided by 2 PI [MHz/T]
    constexpr double GYROMAGNETIC_RATIO = 42.5775;

    /// Regularisation constant of the edge-preserving weight and the update ratio
    constexpr double MEDI_EPSILON = 1e-6;
}

// QSMTK
#include "qsmtk/Utility.h"
