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

namespace qsmtk::Utility {

    /**
     * @brief Check whether two attribute sets describe the same spatial grid.
     * Only the number of voxels along x, y and z is compared.
     * @param attr1
     * @param attr2
     * @return
     */
    bool SameGrid(const ImageAttributes& attr1, const ImageAttributes& attr2);

    /**
     * @brief Throw if the spatial grids of two images differ.
     * @param image1
     * @param image2
     * @param what Description used in the error message.
     */
    void CheckSameGrid(const RealImage& image1, const RealImage& image2, const string& what);

    /// Attributes of a single 3D volume of the given (possibly 4D) image
    ImageAttributes SpatialAttributes(const ImageAttributes& attr);

    /// Number of voxels inside a binary mask
    int CountMaskVoxels(const RealImage& mask);

    /// Replace NaN and infinite voxel values by zero, returns the number of replaced voxels
    int RemoveNonFinite(RealImage& image);

    /// Euclidean norm of all voxel values
    double Norm(const RealImage& image);

    /// Inner product of two images on the same grid
    double Dot(const RealImage& image1, const RealImage& image2);

    /**
     * @brief Extract a single volume of a 4D stack.
     * @param stack
     * @param t Volume index.
     * @return 3D volume with the spatial geometry of the stack.
     */
    RealImage GetVolume(const RealImage& stack, int t);

    /**
     * @brief Copy a 3D volume into the given position of a 4D stack.
     * @param stack
     * @param t Volume index.
     * @param volume
     */
    void PutVolume(RealImage& stack, int t, const RealImage& volume);

    /// Promote a real image to complex samples
    ComplexArray ToComplex(const RealImage& image);

    /// Real part of complex samples as an image with the given attributes
    RealImage RealPart(const ComplexArray& data, const ImageAttributes& attr);

    ////////////////////////////////////////////////////////////////////////////////
    // Inline/template definitions
    ////////////////////////////////////////////////////////////////////////////////

    /// Clear and preallocate memory for a vector
    template<typename VectorType>
    inline void ClearAndReserve(vector<VectorType>& vectorVar, size_t reserveSize) {
        vectorVar.clear();
        vectorVar.reserve(reserveSize);
    }

    //-------------------------------------------------------------------

    /**
     * @brief Binarise mask.
     * Voxels above the threshold become 1, all others 0.
     * @param image
     * @param threshold
     * @return
     */
    inline RealImage CreateMask(RealImage image, double threshold = 0.5) {
        RealPixel *ptr = image.Data();
        #pragma omp parallel for
        for (int i = 0; i < image.NumberOfVoxels(); i++)
            ptr[i] = ptr[i] > threshold ? 1 : 0;

        return image;
    }

    //-------------------------------------------------------------------

    /// Mask input volume (every volume of a 4D stack is masked with the same 3D mask)
    inline void MaskImage(RealImage& image, const RealImage& mask, double padding = 0) {
        const int nvox = mask.GetX() * mask.GetY() * mask.GetZ();
        if (image.GetX() * image.GetY() * image.GetZ() != nvox)
            throw runtime_error("Cannot mask the image - different dimensions");

        RealPixel *pr = image.Data();
        const RealPixel *pm = mask.Data();
        for (int t = 0; t < image.GetT(); t++) {
            #pragma omp parallel for
            for (int i = 0; i < nvox; i++)
                if (pm[i] == 0)
                    pr[t * nvox + i] = padding;
        }
    }

    //-------------------------------------------------------------------

    /// Check whether all voxel values are finite
    inline bool AllFinite(const RealImage& image) {
        const RealPixel *ptr = image.Data();
        for (int i = 0; i < image.NumberOfVoxels(); i++)
            if (!isfinite(ptr[i]))
                return false;
        return true;
    }
}
