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

using namespace mirtk;
using namespace qsmtk;

namespace qsmtk::Parallel {

    /// Class for computing forward differences of a volume, one z slice per task
    class Gradient {
        const RealImage& image;
        RealImage& gradient;

    public:
        Gradient(const RealImage& image, RealImage& gradient) : image(image), gradient(gradient) {}

        void operator()(const blocked_range<size_t>& r) const {
            const int nx = image.GetX();
            const int ny = image.GetY();
            const int nz = image.GetZ();
            const double sx = 1.0 / image.GetXSize();
            const double sy = 1.0 / image.GetYSize();
            const double sz = 1.0 / image.GetZSize();

            for (size_t k = r.begin(); k != r.end(); k++) {
                const int z = int(k);
                for (int y = 0; y < ny; y++)
                    for (int x = 0; x < nx; x++) {
                        const double v = image(x, y, z);
                        gradient(x, y, z, 0) = x < nx - 1 ? (image(x + 1, y, z) - v) * sx : 0;
                        gradient(x, y, z, 1) = y < ny - 1 ? (image(x, y + 1, z) - v) * sy : 0;
                        gradient(x, y, z, 2) = z < nz - 1 ? (image(x, y, z + 1) - v) * sz : 0;
                    }
            }
        }

        void operator()() const {
            parallel_for(blocked_range<size_t>(0, image.GetZ()), *this);
        }
    };

    //-------------------------------------------------------------------

    /// Class for computing the negated backward-difference divergence of a vector field
    class Divergence {
        const RealImage& field;
        RealImage& divergence;

    public:
        Divergence(const RealImage& field, RealImage& divergence) : field(field), divergence(divergence) {}

        void operator()(const blocked_range<size_t>& r) const {
            const int nx = field.GetX();
            const int ny = field.GetY();
            const int nz = field.GetZ();
            const double sx = 1.0 / field.GetXSize();
            const double sy = 1.0 / field.GetYSize();
            const double sz = 1.0 / field.GetZSize();

            for (size_t k = r.begin(); k != r.end(); k++) {
                const int z = int(k);
                for (int y = 0; y < ny; y++)
                    for (int x = 0; x < nx; x++) {
                        // Components on the last voxel of an axis are treated as 0
                        const double gx = x < nx - 1 ? field(x, y, z, 0) : 0;
                        const double gy = y < ny - 1 ? field(x, y, z, 1) : 0;
                        const double gz = z < nz - 1 ? field(x, y, z, 2) : 0;
                        const double gxm = x > 0 ? field(x - 1, y, z, 0) : 0;
                        const double gym = y > 0 ? field(x, y - 1, z, 1) : 0;
                        const double gzm = z > 0 ? field(x, y, z - 1, 2) : 0;

                        divergence(x, y, z) = -((gx - gxm) * sx + (gy - gym) * sy + (gz - gzm) * sz);
                    }
            }
        }

        void operator()() const {
            parallel_for(blocked_range<size_t>(0, field.GetZ()), *this);
        }
    };

    //-------------------------------------------------------------------

    /// Class for computing the periodic 7-point Laplacian
    class PeriodicLaplacian {
        const RealImage& image;
        RealImage& laplacian;

    public:
        PeriodicLaplacian(const RealImage& image, RealImage& laplacian) : image(image), laplacian(laplacian) {}

        void operator()(const blocked_range<size_t>& r) const {
            const int nx = image.GetX();
            const int ny = image.GetY();
            const int nz = image.GetZ();
            const double wx = 1.0 / (image.GetXSize() * image.GetXSize());
            const double wy = 1.0 / (image.GetYSize() * image.GetYSize());
            const double wz = 1.0 / (image.GetZSize() * image.GetZSize());

            for (size_t k = r.begin(); k != r.end(); k++) {
                const int z = int(k);
                const int zp = (z + 1) % nz, zm = (z + nz - 1) % nz;
                for (int y = 0; y < ny; y++) {
                    const int yp = (y + 1) % ny, ym = (y + ny - 1) % ny;
                    for (int x = 0; x < nx; x++) {
                        const int xp = (x + 1) % nx, xm = (x + nx - 1) % nx;
                        const double v = image(x, y, z);
                        laplacian(x, y, z) = (image(xp, y, z) + image(xm, y, z) - 2 * v) * wx
                            + (image(x, yp, z) + image(x, ym, z) - 2 * v) * wy
                            + (image(x, y, zp) + image(x, y, zm) - 2 * v) * wz;
                    }
                }
            }
        }

        void operator()() const {
            parallel_for(blocked_range<size_t>(0, image.GetZ()), *this);
        }
    };

    //-------------------------------------------------------------------

    /// Class for computing the edge-preserving weights 1 / sqrt(|wG * grad|^2 + eps) of the MEDI regularisation
    class EdgeWeights {
        const RealImage& gradient;
        const RealImage& gradient_mask;
        RealImage& weights;
        const double epsilon;

    public:
        EdgeWeights(const RealImage& gradient, const RealImage& gradient_mask, RealImage& weights, double epsilon) :
            gradient(gradient), gradient_mask(gradient_mask), weights(weights), epsilon(epsilon) {}

        void operator()(const blocked_range<size_t>& r) const {
            const RealPixel *pg = gradient.Data();
            const RealPixel *pw = gradient_mask.Data();
            RealPixel *pv = weights.Data();
            for (size_t i = r.begin(); i != r.end(); i++) {
                const double v = pw[i] * pg[i];
                pv[i] = 1 / sqrt(v * v + epsilon);
            }
        }

        void operator()() const {
            parallel_for(blocked_range<size_t>(0, gradient.NumberOfVoxels()), *this);
        }
    };

} // namespace qsmtk::Parallel
