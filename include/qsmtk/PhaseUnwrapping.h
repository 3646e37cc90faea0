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
     * @brief Laplacian-based phase unwrapping.
     * The Laplacian of the true phase is obtained from the wrapped phase as
     * cos(phi) L(sin(phi)) - sin(phi) L(cos(phi)) and the Poisson equation is
     * solved in k-space with the DC term set to 0. Every volume of a 4D stack
     * is unwrapped independently.
     *
     * Reference:
     * Schofield and Zhu, Fast phase unwrapping algorithm for interferometric applications, Opt Lett 2003
     *
     * @param phase Wrapped phase [rad], 3D volume or 4D echo stack.
     * @param mask Region of interest, voxels outside are set to 0.
     * @return Unwrapped phase with the geometry of the input.
     */
    RealImage UnwrapLaplacian(const RealImage& phase, const RealImage& mask);

} // namespace qsmtk
