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
#include "qsmtk/BackgroundRemoval.h"
#include "qsmtk/ReconstructionConfig.h"
#include "qsmtk/VolumeIO.h"
#define QSMTK_TOOL
#include "qsmtk/Profiling.h"

using namespace std;
using namespace mirtk;
using namespace qsmtk;
using namespace boost::program_options;

// -----------------------------------------------------------------------------

void PrintUsage(const options_description& opts) {
    // Print positional arguments
    cout << "Usage: remove-background [field] [mask] [local_field] [eroded_mask] <options>\n" << endl;
    cout << "  [field]                    Total field map (Nifti format)" << endl;
    cout << "  [mask]                     Binary mask of the region of interest (Nifti format)" << endl;
    cout << "  [local_field]              Name for the local field map (Nifti format)" << endl;
    cout << "  [eroded_mask]              Name for the eroded mask (Nifti format)" << endl << endl;
    // Print optional arguments
    cout << opts << endl;
}

// -----------------------------------------------------------------------------

int main(int argc, char **argv) {
    // Initialisation of MIRTK image reader library
    InitializeIOLibrary();

    // Initialise profiling
    QSMTK_START_TIMING();

    string fieldName;
    string maskName;
    string localName;
    string erodedName;
    string method = "vsharp";
    vector<double> radii;
    double radius = 5;
    double threshold = 0.05;
    double erosionThreshold = 0.999;
    bool debug = false;
    bool profile = false;

    // Define required options
    options_description reqOpts;
    reqOpts.add_options()
        ("field", value<string>(&fieldName)->required(), "Total field map (Nifti format)")
        ("mask", value<string>(&maskName)->required(), "Binary mask (Nifti format)")
        ("local_field", value<string>(&localName)->required(), "Name for the local field map (Nifti format)")
        ("eroded_mask", value<string>(&erodedName)->required(), "Name for the eroded mask (Nifti format)");

    // Define positional options
    positional_options_description posOpts;
    posOpts.add("field", 1).add("mask", 1).add("local_field", 1).add("eroded_mask", 1);

    // Define optional options
    options_description opts("Options");
    opts.add_options()
        ("method", value<string>(&method), "Background field removal: vsharp or smv [Default: vsharp]")
        ("radii", value<vector<double>>(&radii)->multitoken(), "V-SHARP radii in mm [Default: 18 down to 2 in steps of 2 voxels]")
        ("threshold", value<double>(&threshold), "V-SHARP deconvolution threshold [Default: 0.05]")
        ("radius", value<double>(&radius), "SMV radius in mm [Default: 5]")
        ("erosion_threshold", value<double>(&erosionThreshold), "Spherical mean of the mask required to keep a voxel [Default: 0.999]")
        ("profile", bool_switch(&profile), "Profiling mode")
        ("debug", bool_switch(&debug), "Debug mode");

    // Combine all options
    options_description allOpts("Allowed options");
    allOpts.add(reqOpts).add(opts);

    // Parse arguments and catch errors
    variables_map vm;
    try {
        store(command_line_parser(argc, argv).options(allOpts).positional(posOpts)
            // Allow single dash (-) for long arguments
            .style(command_line_style::unix_style | command_line_style::allow_long_disguise).run(), vm);
        notify(vm);
    } catch (error& e) {
        // Delete -- from the argument name in the error message
        string err = e.what();
        size_t dashIndex = err.find("\'--");
        if (dashIndex != string::npos)
            err.erase(dashIndex + 1, 2);
        cerr << "Argument parsing error: " << err << "\n\n";
        PrintUsage(opts);
        return 1;
    }

    try {
        const BackgroundMethod backgroundMethod = BackgroundMethodFromString(method);

        cout << "Field map : " << fieldName << endl;
        const RealImage field = ReadVolume(fieldName);
        cout << "Mask : " << maskName << endl;
        const RealImage mask = Utility::CreateMask(ReadVolume(maskName), 0);
        Utility::CheckSameGrid(field, mask, "field map and mask");

        BackgroundRemovalResult local;
        if (backgroundMethod == BackgroundMethod::SMV) {
            cout << "SMV with radius " << radius << " mm" << endl;
            local = SMVFilter(field, mask, radius, erosionThreshold);
        } else {
            if (radii.empty())
                radii = DefaultVSharpRadii(field.Attributes());
            cout << "V-SHARP with radii";
            for (const double r : radii)
                cout << " " << r;
            cout << " mm" << endl;
            local = VSharp(field, mask, radii, threshold, erosionThreshold);
        }

        cout << "Mask voxels : " << Utility::CountMaskVoxels(mask) << " -> " << Utility::CountMaskVoxels(local.mask) << endl;

        WriteVolume(local.local_field, localName);
        WriteVolume(local.mask, erodedName);
        cout << "Output volumes : " << localName << " " << erodedName << endl;
    } catch (const exception& e) {
        cerr << "Error: " << e.what() << endl;
        return 1;
    }

    QSMTK_END_TIMING("all");

    return 0;
}
