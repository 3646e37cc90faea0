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
     * @brief Discrete gradient using forward differences with Neumann boundary conditions.
     * The difference across the last voxel of each axis is 0 and every axis
     * is scaled by the inverse voxel size.
     *
     * References:
     * Chambolle, An Algorithm for Total Variation Minimization and Applications, JMIV 2004
     * Pock et al., Global Solutions of Variational Models with Convex Regularization, SIIMS 2010
     *
     * @param image 3D volume.
     * @return 4D image with three volumes holding the x, y and z components.
     */
    RealImage Gradient(const RealImage& image);

    /**
     * @brief Discrete divergence using backward differences with Dirichlet boundary conditions.
     * The sum of the three backward differences is negated, so that the
     * result is the exact adjoint of Gradient:
     * <Gradient(x), g> == <x, Divergence(g)>.
     * @param field 4D image with three components.
     * @return 3D volume.
     */
    RealImage Divergence(const RealImage& field);

    /**
     * @brief 7-point discrete Laplacian with periodic boundary conditions.
     * Its Fourier symbol is LaplacianKernel().
     * @param image
     * @return
     */
    RealImage PeriodicLaplacian(const RealImage& image);

} // namespace qsmtk
