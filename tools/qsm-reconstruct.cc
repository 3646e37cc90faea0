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
#include "qsmtk/QSMReconstruction.h"
#include "qsmtk/Kernels.h"
#define QSMTK_TOOL
#include "qsmtk/Profiling.h"

using namespace std;
using namespace mirtk;
using namespace qsmtk;
using namespace boost::program_options;

// =============================================================================
//
// =============================================================================

// -----------------------------------------------------------------------------

void PrintUsage(const options_description& opts) {
    // Print positional arguments
    cout << "Usage: qsm-reconstruct [output] <options>\n" << endl;
    cout << "  [output]                   Name for the susceptibility map (Nifti format)" << endl << endl;
    cout << "  The input record is given by -input or by -magnitude, -phase, -mask, -echo_times and -field_strength." << endl;
    cout << "  Values given on the command line override the values of the input record." << endl << endl;
    // Print optional arguments
    cout << opts << endl;
}

// -----------------------------------------------------------------------------

// =============================================================================
// Main function
// =============================================================================

// -----------------------------------------------------------------------------

int main(int argc, char **argv) {

    // -----------------------------------------------------------------------------
    // INPUT VARIABLES, FLAG AND DEFAULT VALUES
    // -----------------------------------------------------------------------------

    // Initialisation of MIRTK image reader library
    InitializeIOLibrary();

    // Initialise profiling
    QSMTK_START_TIMING();

    // Name for output volume
    string outputName;

    // JSON input record
    string inputFile;

    // Input files and acquisition parameters given on the command line
    vector<string> magnitudeFiles;
    vector<string> phaseFiles;
    string maskFile;
    string noiseFile;
    vector<double> echoTimes;
    double fieldStrength = 0;
    vector<double> fieldDirection;

    // Default values for reconstruction variables:
    ReconstructionConfig config;
    string backgroundMethod = "vsharp";
    vector<double> radii;
    int dataWeighting = 1;
    int gradientWeighting = 1;
    string costHistoryFile;
    string logFile;
    bool saveAll = false;
    bool debug = false;
    bool profile = false;
    bool verbose = false;

    // -----------------------------------------------------------------------------
    // READ INPUT DATA AND OPTIONS
    // -----------------------------------------------------------------------------

    // Define required options
    options_description reqOpts;
    reqOpts.add_options()
        ("output", value<string>(&outputName)->required(), "Name for the susceptibility map (Nifti format)");

    // Define positional options
    positional_options_description posOpts;
    posOpts.add("output", 1);

    // Define optional options
    options_description opts("Options");
    opts.add_options()
        ("input", value<string>(&inputFile), "JSON input record with the keys mag_nii, phase_nii, mask, EchoTime, MagneticFieldStrength and optionally B0_dir")
        ("magnitude", value<vector<string>>(&magnitudeFiles)->multitoken(), "Magnitude volumes, one per echo")
        ("phase", value<vector<string>>(&phaseFiles)->multitoken(), "Wrapped phase volumes in radians, one per echo")
        ("mask", value<string>(&maskFile), "Binary mask of the region of interest")
        ("noise", value<string>(&noiseFile), "Noise standard deviation map [Default: ones]")
        ("echo_times", value<vector<double>>(&echoTimes)->multitoken(), "Echo times in seconds, strictly increasing")
        ("field_strength", value<double>(&fieldStrength), "Magnetic field strength in tesla")
        ("b0_dir", value<vector<double>>(&fieldDirection)->multitoken(), "Field direction as axis number (1, 2, 3) or vector [Default: 0 0 1]")
        ("gamma", value<double>(&config.gyromagnetic_ratio), "Gyromagnetic ratio in MHz/T [Default: 42.5775]")
        ("background", value<string>(&backgroundMethod), "Background field removal: vsharp or smv [Default: vsharp]")
        ("radii", value<vector<double>>(&radii)->multitoken(), "V-SHARP radii in mm [Default: 18 down to 2 in steps of 2 voxels]")
        ("vsharp_threshold", value<double>(&config.vsharp_threshold), "V-SHARP deconvolution threshold [Default: 0.05]")
        ("smv_radius", value<double>(&config.smv_radius), "Radius of the SMV background filter in mm [Default: 5]")
        ("lambda", value<double>(&config.medi.lambda), "Weight of the MEDI data term [Default: 1000]")
        ("percentage", value<double>(&config.medi.percentage), "Ratio of edge gradients in the magnitude [Default: 0.9]")
        ("merit", bool_switch(&config.medi.merit), "Iterative noise re-weighting of outliers [Default: false]")
        ("medi_smv", bool_switch(&config.medi.smv), "SMV filtering inside MEDI [Default: false]")
        ("medi_smv_radius", value<double>(&config.medi.smv_radius), "Radius of the SMV filter inside MEDI in mm [Default: 5]")
        ("data_weighting", value<int>(&dataWeighting), "Data weighting: 0 uniform, 1 SNR [Default: 1]")
        ("gradient_weighting", value<int>(&gradientWeighting), "Gradient weighting: 1 binary [Default: 1]")
        ("cg_max_iter", value<int>(&config.medi.cg_max_iterations), "Maximum number of CG iterations [Default: 100]")
        ("cg_tol", value<double>(&config.medi.cg_tolerance), "CG residual tolerance [Default: 0.01]")
        ("max_iter", value<int>(&config.medi.max_iterations), "Maximum number of Gauss-Newton iterations [Default: 10]")
        ("tol_norm_ratio", value<double>(&config.medi.tol_norm_ratio), "Update ratio for convergence [Default: 0.1]")
        ("cost_history", value<string>(&costHistoryFile), "Write the per-iteration costs to a CSV file")
        ("save_all", bool_switch(&saveAll), "Save unwrapped phase, field map, local field and eroded mask next to the output")
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

        if (inputFile.empty() && (magnitudeFiles.empty() || phaseFiles.empty() || maskFile.empty()))
            throw error("Either -input or -magnitude, -phase and -mask are required!");
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
        // Input record, command line values take precedence
        InputRecord record;
        if (!inputFile.empty()) {
            cout << "Input record : " << inputFile << endl;
            record = ReadInputRecord(inputFile);
        }
        if (!magnitudeFiles.empty())
            record.magnitude_files = magnitudeFiles;
        if (!phaseFiles.empty())
            record.phase_files = phaseFiles;
        if (!maskFile.empty())
            record.mask_file = maskFile;
        if (!noiseFile.empty())
            record.noise_file = noiseFile;
        if (!echoTimes.empty())
            record.echo_times = echoTimes;
        if (vm.count("field_strength"))
            record.field_strength = fieldStrength;
        if (fieldDirection.size() == 1)
            record.direction = FieldDirectionFromAxis(int(fieldDirection[0]));
        else if (fieldDirection.size() == 3)
            record.direction = NormaliseDirection({fieldDirection[0], fieldDirection[1], fieldDirection[2]});

        config.background_method = BackgroundMethodFromString(backgroundMethod);
        config.vsharp_radii = radii;
        config.medi.data_weighting = DataWeightingFromInt(dataWeighting);
        config.medi.gradient_weighting = GradientWeightingFromInt(gradientWeighting);
        config.debug = debug;
        config.profile = profile;
        config.verbose = verbose || !logFile.empty();
        config.log_file = logFile;

        CheckInputRecord(record);

        cout << "Output volume : " << outputName << endl;
        cout << "Number of echoes : " << record.phase_files.size() << endl;
        cout << "Field strength : " << record.field_strength << " T" << endl;
        cout << "Field direction : " << record.direction[0] << " " << record.direction[1] << " " << record.direction[2] << endl;

        QSMReconstruction reconstruction(config);

        const MultiEchoData data = LoadMultiEcho(record);

        cout << "------------------------------------------------------" << endl;

        const QSMResult result = reconstruction.Run(data);

        cout << "------------------------------------------------------" << endl;

        // -----------------------------------------------------------------------------
        // SAVE RESULTS
        // -----------------------------------------------------------------------------

        if (saveAll) {
            const boost::filesystem::path dir = boost::filesystem::path(outputName).parent_path();
            WriteVolume(result.unwrapped_phase, (dir / "unwrapped-phase.nii.gz").string());
            WriteVolume(result.field_map, (dir / "field-map.nii.gz").string());
            WriteVolume(result.local_field, (dir / "local-field.nii.gz").string());
            WriteVolume(result.mask, (dir / "eroded-mask.nii.gz").string());
        }

        if (!costHistoryFile.empty())
            WriteCostHistory(result.medi.cost_history, costHistoryFile);

        WriteVolume(result.chi, outputName);

        cout << "MEDI iterations : " << result.medi.iterations << (result.medi.converged ? " (converged)" : " (iteration cap)") << endl;
        cout << "Output volume : " << outputName << endl;
    } catch (const exception& e) {
        cerr << "Error: " << e.what() << endl;
        return 1;
    }

    QSMTK_END_TIMING("all");

    cout << "------------------------------------------------------" << endl;

    return 0;
}
