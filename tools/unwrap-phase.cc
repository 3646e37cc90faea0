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
#include "qsmtk/PhaseUnwrapping.h"
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
    cout << "Usage: unwrap-phase [input] [output] <options>\n" << endl;
    cout << "  [input]                    Wrapped phase in radians, 3D volume or 4D echo stack (Nifti format)" << endl;
    cout << "  [output]                   Name for the unwrapped phase (Nifti format)" << endl << endl;
    // Print optional arguments
    cout << opts << endl;
}

// -----------------------------------------------------------------------------

int main(int argc, char **argv) {
    // Initialisation of MIRTK image reader library
    InitializeIOLibrary();

    // Initialise profiling
    QSMTK_START_TIMING();

    string inputName;
    string outputName;
    string maskName;
    bool debug = false;
    bool profile = false;

    // Define required options
    options_description reqOpts;
    reqOpts.add_options()
        ("input", value<string>(&inputName)->required(), "Wrapped phase (Nifti format)")
        ("output", value<string>(&outputName)->required(), "Name for the unwrapped phase (Nifti format)");

    // Define positional options
    positional_options_description posOpts;
    posOpts.add("input", 1).add("output", 1);

    // Define optional options
    options_description opts("Options");
    opts.add_options()
        ("mask", value<string>(&maskName), "Binary mask of the region of interest [Default: whole image]")
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
        cout << "Input phase : " << inputName << endl;
        const RealImage phase = ReadVolume(inputName);

        RealImage mask(Utility::SpatialAttributes(phase.Attributes()));
        if (!maskName.empty()) {
            cout << "Mask : " << maskName << endl;
            mask = Utility::CreateMask(ReadVolume(maskName), 0);
        } else {
            mask = 1;
        }

        cout << "Laplacian unwrapping of " << phase.GetT() << " volume(s)" << endl;
        const RealImage unwrapped = UnwrapLaplacian(phase, mask);

        WriteVolume(unwrapped, outputName);
        cout << "Output volume : " << outputName << endl;
    } catch (const exception& e) {
        cerr << "Error: " << e.what() << endl;
        return 1;
    }

    QSMTK_END_TIMING("all");

    return 0;
}
