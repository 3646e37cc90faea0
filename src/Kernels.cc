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
#include "qsmtk/Kernels.h"

namespace qsmtk {

    Direction FieldDirectionFromAxis(int axis) {
        switch (axis) {
        case 1:
            return {1, 0, 0};
        case 2:
            return {0, 1, 0};
        case 3:
            return {0, 0, 1};
        default:
            throw invalid_argument("Field direction axis must be 1, 2 or 3, got " + to_string(axis));
        }
    }

    //-------------------------------------------------------------------

    Direction NormaliseDirection(const Direction& direction) {
        const double norm = sqrt(direction[0] * direction[0] + direction[1] * direction[1] + direction[2] * direction[2]);
        if (!(norm > 0) || !isfinite(norm))
            throw invalid_argument("Field direction must be a non-zero finite vector");

        return {direction[0] / norm, direction[1] / norm, direction[2] / norm};
    }

    //-------------------------------------------------------------------

    KernelArray DipoleKernel(const ImageAttributes& attr, const Direction& direction) {
        const Direction b = NormaliseDirection(direction);
        const int nx = attr._x, ny = attr._y, nz = attr._z;

        // Frequencies normalised by grid extent and voxel size
        const double sx = 1.0 / (nx * attr._dx);
        const double sy = 1.0 / (ny * attr._dy);
        const double sz = 1.0 / (nz * attr._dz);

        KernelArray D(size_t(nx) * ny * nz);
        #pragma omp parallel for
        for (int k = 0; k < nz; k++) {
            const double kz = SignedIndex(k, nz) * sz;
            for (int j = 0; j < ny; j++) {
                const double ky = SignedIndex(j, ny) * sy;
                for (int i = 0; i < nx; i++) {
                    const double kx = SignedIndex(i, nx) * sx;
                    const double k2 = kx * kx + ky * ky + kz * kz;
                    const double kb = kx * b[0] + ky * b[1] + kz * b[2];
                    double value = 1.0 / 3.0 - kb * kb / k2;
                    if (!isfinite(value))
                        value = 0;
                    D[i + nx * (j + ny * size_t(k))] = value;
                }
            }
        }

        return D;
    }

    //-------------------------------------------------------------------

    KernelArray DipoleKernelImageSpace(const ImageAttributes& attr, const Direction& direction, const FourierTransform& fft) {
        const Direction b = NormaliseDirection(direction);
        const int nx = attr._x, ny = attr._y, nz = attr._z;

        ComplexArray d(size_t(nx) * ny * nz);
        #pragma omp parallel for
        for (int k = 0; k < nz; k++) {
            const double z = SignedIndex(k, nz) * attr._dz;
            for (int j = 0; j < ny; j++) {
                const double y = SignedIndex(j, ny) * attr._dy;
                for (int i = 0; i < nx; i++) {
                    const double x = SignedIndex(i, nx) * attr._dx;
                    const double r2 = x * x + y * y + z * z;
                    const double rb = x * b[0] + y * b[1] + z * b[2];
                    double value = (3 * rb * rb - r2) / (4 * PI * pow(r2, 2.5));
                    if (!isfinite(value))
                        value = 0;
                    d[i + nx * (j + ny * size_t(k))] = value;
                }
            }
        }

        fft.Forward(d);

        KernelArray D(d.size());
        for (size_t i = 0; i < d.size(); i++)
            D[i] = d[i].real();

        return D;
    }

    //-------------------------------------------------------------------

    RealImage SphereImage(const ImageAttributes& attr, double radius) {
        if (!(radius > 0))
            throw invalid_argument("Sphere radius must be positive, got " + to_string(radius));

        const int nx = attr._x, ny = attr._y, nz = attr._z;
        const double dx = attr._dx, dy = attr._dy, dz = attr._dz;
        const double r2 = radius * radius;

        // Sub-voxel offsets of the boundary sampling grid
        constexpr int split = 10;
        Array<double> dv(2 * split);
        for (int s = 0; s < 2 * split; s++)
            dv[s] = (s - split + 0.5) / (2.0 * split);

        RealImage sphere(Utility::SpatialAttributes(attr));
        sphere = 0;

        #pragma omp parallel for
        for (int k = 0; k < nz; k++) {
            const double z = SignedIndex(k, nz) * dz;
            for (int j = 0; j < ny; j++) {
                const double y = SignedIndex(j, ny) * dy;
                for (int i = 0; i < nx; i++) {
                    const double x = SignedIndex(i, nx) * dx;

                    // Closest and farthest corner of the voxel from the centre
                    const double ox = max(fabs(x) - 0.5 * dx, 0.0);
                    const double oy = max(fabs(y) - 0.5 * dy, 0.0);
                    const double oz = max(fabs(z) - 0.5 * dz, 0.0);
                    const double ix = fabs(x) + 0.5 * dx;
                    const double iy = fabs(y) + 0.5 * dy;
                    const double iz = fabs(z) + 0.5 * dz;

                    if (ox * ox + oy * oy + oz * oz > r2)
                        continue;

                    if (ix * ix + iy * iy + iz * iz <= r2) {
                        sphere(i, j, k) = 1;
                        continue;
                    }

                    int inside = 0;
                    for (int a = 0; a < 2 * split; a++) {
                        const double xx = x + dv[a] * dx;
                        for (int c = 0; c < 2 * split; c++) {
                            const double yy = y + dv[c] * dy;
                            for (int e = 0; e < 2 * split; e++) {
                                const double zz = z + dv[e] * dz;
                                if (xx * xx + yy * yy + zz * zz <= r2)
                                    inside++;
                            }
                        }
                    }
                    sphere(i, j, k) = double(inside) / (8.0 * split * split * split);
                }
            }
        }

        double sum = 0;
        const RealPixel *ps = sphere.Data();
        for (int i = 0; i < sphere.NumberOfVoxels(); i++)
            sum += ps[i];

        if (!(sum > 0))
            throw runtime_error("Sphere of radius " + to_string(radius) + " mm does not cover any voxel");

        sphere /= sum;
        return sphere;
    }

    //-------------------------------------------------------------------

    SphereKernel CreateSphereKernel(const ImageAttributes& attr, double radius, const FourierTransform& fft) {
        SphereKernel kernel;
        kernel.radius = radius;
        kernel.image = SphereImage(attr, radius);

        const ComplexArray spectrum = fft.Forward(kernel.image);
        kernel.fourier.resize(spectrum.size());
        for (size_t i = 0; i < spectrum.size(); i++)
            kernel.fourier[i] = spectrum[i].real();

        return kernel;
    }

    //-------------------------------------------------------------------

    KernelArray LaplacianKernel(const ImageAttributes& attr) {
        const int nx = attr._x, ny = attr._y, nz = attr._z;
        const double wx = 1.0 / (attr._dx * attr._dx);
        const double wy = 1.0 / (attr._dy * attr._dy);
        const double wz = 1.0 / (attr._dz * attr._dz);

        KernelArray L(size_t(nx) * ny * nz);
        for (int k = 0; k < nz; k++) {
            const double lz = (2 * cos(2 * PI * k / nz) - 2) * wz;
            for (int j = 0; j < ny; j++) {
                const double ly = (2 * cos(2 * PI * j / ny) - 2) * wy;
                for (int i = 0; i < nx; i++) {
                    const double lx = (2 * cos(2 * PI * i / nx) - 2) * wx;
                    L[i + nx * (j + ny * size_t(k))] = lx + ly + lz;
                }
            }
        }

        return L;
    }

}
