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
#include "qsmtk/MEDI.h"
#include "qsmtk/Kernels.h"
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
    cout << "Usage: medi [field] [magnitude] [mask] [output] <options>\n" << endl;
    cout << "  [field]                    Local field map (Nifti format)" << endl;
    cout << "  [magnitude]                Anatomical magnitude image (Nifti format)" << endl;
    cout << "  [mask]                     Binary mask of the region of interest (Nifti format)" << endl;
    cout << "  [output]                   Name for the susceptibility map (Nifti format)" << endl << endl;
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
    string magnitudeName;
    string maskName;
    string outputName;
    string noiseName;
    string costHistoryFile;
    string logFile;
    vector<double> fieldDirection;
    MEDIParameters parameters;
    int dataWeighting = 1;
    int gradientWeighting = 1;
    bool verbose = false;
    bool debug = false;
    bool profile = false;

    // Define required options
    options_description reqOpts;
    reqOpts.add_options()
        ("field", value<string>(&fieldName)->required(), "Local field map (Nifti format)")
        ("magnitude", value<string>(&magnitudeName)->required(), "Magnitude image (Nifti format)")
        ("mask", value<string>(&maskName)->required(), "Binary mask (Nifti format)")
        ("output", value<string>(&outputName)->required(), "Name for the susceptibility map (Nifti format)");

    // Define positional options
    positional_options_description posOpts;
    posOpts.add("field", 1).add("magnitude", 1).add("mask", 1).add("output", 1);

    // Define optional options
    options_description opts("Options");
    opts.add_options()
        ("noise", value<string>(&noiseName), "Noise standard deviation map [Default: ones]")
        ("b0_dir", value<vector<double>>(&fieldDirection)->multitoken(), "Field direction as axis number (1, 2, 3) or vector [Default: 0 0 1]")
        ("lambda", value<double>(&parameters.lambda), "Weight of the data term [Default: 1000]")
        ("percentage", value<double>(&parameters.percentage), "Ratio of edge gradients in the magnitude [Default: 0.9]")
        ("merit", bool_switch(&parameters.merit), "Iterative noise re-weighting of outliers [Default: false]")
        ("smv", bool_switch(&parameters.smv), "SMV filtering before the inversion [Default: false]")
        ("smv_radius", value<double>(&parameters.smv_radius), "SMV radius in mm [Default: 5]")
        ("data_weighting", value<int>(&dataWeighting), "Data weighting: 0 uniform, 1 SNR [Default: 1]")
        ("gradient_weighting", value<int>(&gradientWeighting), "Gradient weighting: 1 binary [Default: 1]")
        ("cg_max_iter", value<int>(&parameters.cg_max_iterations), "Maximum number of CG iterations [Default: 100]")
        ("cg_tol", value<double>(&parameters.cg_tolerance), "CG residual tolerance [Default: 0.01]")
        ("max_iter", value<int>(&parameters.max_iterations), "Maximum number of Gauss-Newton iterations [Default: 10]")
        ("tol_norm_ratio", value<double>(&parameters.tol_norm_ratio), "Update ratio for convergence [Default: 0.1]")
        ("cost_history", value<string>(&costHistoryFile), "Write the per-iteration costs to a CSV file")
        ("log", value<string>(&logFile), "Write verbose output to this file")
        ("verbose", bool_switch(&verbose), "Verbose output")
        ("profile", bool_switch(&profile), "Profiling mode")
        ("debug", bool_switch(&debug), "Debug mode - save intermediate results");

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

        if (!fieldDirection.empty() && fieldDirection.size() != 1 && fieldDirection.size() != 3)
            throw error("Field direction needs 1 or 3 values!");
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
        if (fieldDirection.size() == 1)
            parameters.direction = FieldDirectionFromAxis(int(fieldDirection[0]));
        else if (fieldDirection.size() == 3)
            parameters.direction = NormaliseDirection({fieldDirection[0], fieldDirection[1], fieldDirection[2]});
        parameters.data_weighting = DataWeightingFromInt(dataWeighting);
        parameters.gradient_weighting = GradientWeightingFromInt(gradientWeighting);

        MEDI medi(parameters);
        if (debug)
            medi.DebugOn();
        if (profile)
            medi.ProfileOn();
        if (verbose || !logFile.empty())
            medi.VerboseOn(logFile);

        cout << "Field map : " << fieldName << endl;
        const RealImage field = ReadVolume(fieldName);
        cout << "Magnitude : " << magnitudeName << endl;
        const RealImage magnitude = Utility::GetVolume(ReadVolume(magnitudeName), 0);
        cout << "Mask : " << maskName << endl;
        const RealImage mask = Utility::CreateMask(ReadVolume(maskName), 0);
        Utility::CheckSameGrid(field, mask, "field map and mask");
        Utility::CheckSameGrid(magnitude, mask, "magnitude and mask");

        RealImage noise(Utility::SpatialAttributes(mask.Attributes()));
        if (!noiseName.empty()) {
            cout << "Noise map : " << noiseName << endl;
            noise = ReadVolume(noiseName);
        } else {
            noise = 1;
        }

        cout << "------------------------------------------------------" << endl;

        const MEDIResult result = medi.Run(field, noise, magnitude, mask);

        cout << "------------------------------------------------------" << endl;

        if (!costHistoryFile.empty())
            WriteCostHistory(result.cost_history, costHistoryFile);

        WriteVolume(result.chi, outputName);

        cout << "Iterations : " << result.iterations << (result.converged ? " (converged)" : " (iteration cap)") << endl;
        cout << "Output volume : " << outputName << endl;
    } catch (const exception& e) {
        cerr << "Error: " << e.what() << endl;
        return 1;
    }

    QSMTK_END_TIMING("all");

    return 0;
}
