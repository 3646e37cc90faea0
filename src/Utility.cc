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
#include "qsmtk/Utility.h"

namespace qsmtk::Utility {

    // Compare voxel counts along the three spatial axes
    bool SameGrid(const ImageAttributes& attr1, const ImageAttributes& attr2) {
        return attr1._x == attr2._x && attr1._y == attr2._y && attr1._z == attr2._z;
    }

    //-------------------------------------------------------------------

    void CheckSameGrid(const RealImage& image1, const RealImage& image2, const string& what) {
        if (!SameGrid(image1.Attributes(), image2.Attributes()))
            throw runtime_error(what + ": image dimensions differ (" + to_string(image1.GetX()) + "x" + to_string(image1.GetY())
                + "x" + to_string(image1.GetZ()) + " vs " + to_string(image2.GetX()) + "x" + to_string(image2.GetY())
                + "x" + to_string(image2.GetZ()) + ")");
    }

    //-------------------------------------------------------------------

    ImageAttributes SpatialAttributes(const ImageAttributes& attr) {
        ImageAttributes spatial = attr;
        spatial._t = 1;
        spatial._dt = 1;
        return spatial;
    }

    //-------------------------------------------------------------------

    int CountMaskVoxels(const RealImage& mask) {
        const int nvox = mask.GetX() * mask.GetY() * mask.GetZ();
        const RealPixel *pm = mask.Data();
        int count = 0;
        for (int i = 0; i < nvox; i++)
            if (pm[i] > 0)
                count++;
        return count;
    }

    //-------------------------------------------------------------------

    int RemoveNonFinite(RealImage& image) {
        RealPixel *ptr = image.Data();
        int count = 0;
        for (int i = 0; i < image.NumberOfVoxels(); i++) {
            if (!isfinite(ptr[i])) {
                ptr[i] = 0;
                count++;
            }
        }
        return count;
    }

    //-------------------------------------------------------------------

    double Norm(const RealImage& image) {
        return sqrt(Dot(image, image));
    }

    //-------------------------------------------------------------------

    double Dot(const RealImage& image1, const RealImage& image2) {
        if (image1.NumberOfVoxels() != image2.NumberOfVoxels())
            throw runtime_error("Dot: images have different numbers of voxels");

        const RealPixel *p1 = image1.Data();
        const RealPixel *p2 = image2.Data();
        double sum = 0;
        for (int i = 0; i < image1.NumberOfVoxels(); i++)
            sum += double(p1[i]) * double(p2[i]);
        return sum;
    }

    //-------------------------------------------------------------------

    RealImage GetVolume(const RealImage& stack, int t) {
        if (t < 0 || t >= stack.GetT())
            throw runtime_error("GetVolume: index " + to_string(t) + " outside stack of " + to_string(stack.GetT()) + " volumes");

        RealImage volume(SpatialAttributes(stack.Attributes()));
        const int nvox = stack.GetX() * stack.GetY() * stack.GetZ();
        const RealPixel *ps = stack.Data() + t * nvox;
        RealPixel *pv = volume.Data();
        copy(ps, ps + nvox, pv);

        return volume;
    }

    //-------------------------------------------------------------------

    void PutVolume(RealImage& stack, int t, const RealImage& volume) {
        if (t < 0 || t >= stack.GetT())
            throw runtime_error("PutVolume: index " + to_string(t) + " outside stack of " + to_string(stack.GetT()) + " volumes");
        if (!SameGrid(stack.Attributes(), volume.Attributes()))
            throw runtime_error("PutVolume: volume does not match the stack grid");

        const int nvox = stack.GetX() * stack.GetY() * stack.GetZ();
        const RealPixel *pv = volume.Data();
        copy(pv, pv + nvox, stack.Data() + t * nvox);
    }

    //-------------------------------------------------------------------

    ComplexArray ToComplex(const RealImage& image) {
        ComplexArray data(image.NumberOfVoxels());
        const RealPixel *ptr = image.Data();
        for (int i = 0; i < image.NumberOfVoxels(); i++)
            data[i] = Complex(ptr[i], 0);
        return data;
    }

    //-------------------------------------------------------------------

    RealImage RealPart(const ComplexArray& data, const ImageAttributes& attr) {
        RealImage image(attr);
        if (data.size() != size_t(image.NumberOfVoxels()))
            throw runtime_error("RealPart: data size does not match the image attributes");

        RealPixel *ptr = image.Data();
        #pragma omp parallel for
        for (int i = 0; i < image.NumberOfVoxels(); i++)
            ptr[i] = data[i].real();
        return image;
    }

}
