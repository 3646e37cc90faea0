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

#include "TestCommon.h"

bool EqualFiles(const string& filename1, const string& filename2) {
    // Open files at the end
    ifstream file1(filename1, ifstream::ate | ifstream::binary);
    ifstream file2(filename2, ifstream::ate | ifstream::binary);

    // Check if files are opened
    if (!file1.is_open() || !file2.is_open())
        return false;

    // Different file size
    if (file1.tellg() != file2.tellg())
        return false;

    // Rewind
    file1.seekg(0);
    file2.seekg(0);

    return equal(istreambuf_iterator<char>(file1), istreambuf_iterator<char>(), istreambuf_iterator<char>(file2));
}

ImageAttributes GridAttributes(int nx, int ny, int nz, double dx, double dy, double dz) {
    ImageAttributes attr;
    attr._x = nx;
    attr._y = ny;
    attr._z = nz;
    attr._t = 1;
    attr._dx = dx;
    attr._dy = dy;
    attr._dz = dz;
    attr._dt = 1;
    return attr;
}

RealImage ConstantVolume(const ImageAttributes& attr, double value) {
    RealImage image(attr);
    image = value;
    return image;
}

RealImage RandomVolume(const ImageAttributes& attr, unsigned seed) {
    mt19937 generator(seed);
    uniform_real_distribution<double> distribution(-1, 1);

    RealImage image(attr);
    RealPixel *ptr = image.Data();
    for (int i = 0; i < image.NumberOfVoxels(); i++)
        ptr[i] = distribution(generator);
    return image;
}

RealImage BallVolume(const ImageAttributes& attr, double cx, double cy, double cz, double radius, double value) {
    RealImage image(attr);
    image = 0;
    for (int z = 0; z < attr._z; z++)
        for (int y = 0; y < attr._y; y++)
            for (int x = 0; x < attr._x; x++) {
                const double r2 = (x - cx) * (x - cx) + (y - cy) * (y - cy) + (z - cz) * (z - cz);
                if (r2 <= radius * radius)
                    image(x, y, z) = value;
            }
    return image;
}

double MaxAbsDifference(const RealImage& image1, const RealImage& image2, const RealImage *mask) {
    const RealPixel *p1 = image1.Data();
    const RealPixel *p2 = image2.Data();
    const RealPixel *pm = mask ? mask->Data() : nullptr;
    const int nvox = mask ? mask->NumberOfVoxels() : image1.NumberOfVoxels();

    double difference = 0;
    for (int i = 0; i < image1.NumberOfVoxels(); i++) {
        if (pm && pm[i % nvox] == 0)
            continue;
        difference = max(difference, fabs(double(p1[i]) - double(p2[i])));
    }
    return difference;
}

double MeanInMask(const RealImage& image, const RealImage& mask) {
    const RealPixel *ptr = image.Data();
    const RealPixel *pm = mask.Data();
    double sum = 0;
    int count = 0;
    for (int i = 0; i < mask.NumberOfVoxels(); i++) {
        if (pm[i] > 0) {
            sum += ptr[i];
            count++;
        }
    }
    return count > 0 ? sum / count : 0;
}

string TestDirectory(const string& suite) {
    const std::filesystem::path dir = std::filesystem::temp_directory_path() / ("qsmtk-" + suite);
    std::filesystem::create_directories(dir);
    return dir.string();
}
