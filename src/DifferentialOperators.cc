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
#include "qsmtk/DifferentialOperators.h"
#include "qsmtk/Parallel.h"

namespace qsmtk {

    RealImage Gradient(const RealImage& image) {
        ImageAttributes attr = Utility::SpatialAttributes(image.Attributes());
        attr._t = 3;

        RealImage gradient(attr);
        Parallel::Gradient parallelGradient(image, gradient);
        parallelGradient();

        return gradient;
    }

    //-------------------------------------------------------------------

    RealImage Divergence(const RealImage& field) {
        if (field.GetT() != 3)
            throw runtime_error("Divergence: expected a field with 3 components, got " + to_string(field.GetT()));

        RealImage divergence(Utility::SpatialAttributes(field.Attributes()));
        Parallel::Divergence parallelDivergence(field, divergence);
        parallelDivergence();

        return divergence;
    }

    //-------------------------------------------------------------------

    RealImage PeriodicLaplacian(const RealImage& image) {
        RealImage laplacian(Utility::SpatialAttributes(image.Attributes()));
        Parallel::PeriodicLaplacian parallelLaplacian(image, laplacian);
        parallelLaplacian();

        return laplacian;
    }

}
