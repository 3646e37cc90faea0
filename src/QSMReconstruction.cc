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
#include "qsmtk/BackgroundRemoval.h"
#include "qsmtk/FieldMap.h"
#include "qsmtk/PhaseUnwrapping.h"
#include "qsmtk/Profiling.h"

namespace qsmtk {

    QSMReconstruction::QSMReconstruction(const ReconstructionConfig& config) : _config(config), _debug(false), _profile(false), _verbose(false) {
        _config.Check();

        if (_config.debug)
            DebugOn();
        if (_config.profile)
            ProfileOn();
        if (_config.verbose)
            VerboseOn(_config.log_file);
    }

    //-------------------------------------------------------------------

    RealImage QSMReconstruction::UnwrapPhase(const MultiEchoData& data) const {
        QSMTK_START_TIMING();
        cout << "Laplacian phase unwrapping of " << data.phase.GetT() << " echoes" << endl;

        RealImage unwrapped = UnwrapLaplacian(data.phase, data.mask);

        if (_debug)
            unwrapped.Write("unwrapped-phase.nii.gz");

        QSMTK_END_TIMING("UnwrapPhase");
        return unwrapped;
    }

    //-------------------------------------------------------------------

    RealImage QSMReconstruction::FieldMap(const MultiEchoData& data, const RealImage& unwrapped_phase) const {
        cout << "Combining echoes into the field map (B0 = " << data.field_strength << " T)" << endl;

        RealImage field = CombineEchoes(unwrapped_phase, data.echo_times, data.field_strength, _config.gyromagnetic_ratio);

        if (_debug)
            field.Write("field-map.nii.gz");

        return field;
    }

    //-------------------------------------------------------------------

    BackgroundRemovalResult QSMReconstruction::RemoveBackground(const RealImage& field_map, const RealImage& mask) const {
        QSMTK_START_TIMING();

        if (Utility::CountMaskVoxels(mask) == 0)
            throw runtime_error("The mask is empty");

        BackgroundRemovalResult local;
        if (_config.background_method == BackgroundMethod::SMV) {
            cout << "SMV background removal with radius " << _config.smv_radius << " mm" << endl;
            local = SMVFilter(field_map, mask, _config.smv_radius, _config.erosion_threshold);
        } else {
            const Array<double> radii = _config.vsharp_radii.empty()
                ? DefaultVSharpRadii(field_map.Attributes()) : _config.vsharp_radii;

            cout << "V-SHARP background removal with " << radii.size() << " radii" << endl;
            if (_verbose) {
                _verbose_log << "Radii :";
                for (const double r : radii)
                    _verbose_log << " " << r;
                _verbose_log << " mm, threshold " << _config.vsharp_threshold << endl;
            }

            local = VSharp(field_map, mask, radii, _config.vsharp_threshold, _config.erosion_threshold);
        }

        const int before = Utility::CountMaskVoxels(mask);
        const int after = Utility::CountMaskVoxels(local.mask);
        cout << "Mask voxels : " << before << " -> " << after << endl;

        if (_debug) {
            local.local_field.Write("local-field.nii.gz");
            local.mask.Write("eroded-mask.nii.gz");
        }

        QSMTK_END_TIMING("RemoveBackground");
        return local;
    }

    //-------------------------------------------------------------------

    MEDIResult QSMReconstruction::Invert(const MultiEchoData& data, const BackgroundRemovalResult& local) const {
        QSMTK_START_TIMING();

        if (Utility::CountMaskVoxels(local.mask) == 0)
            throw runtime_error("The mask is empty after background removal, the dipole inversion is not run");

        MEDIParameters parameters = _config.medi;
        parameters.direction = data.direction;

        MEDI medi(parameters);
        if (_debug)
            medi.DebugOn();
        if (_profile)
            medi.ProfileOn();
        if (_verbose)
            medi.VerboseOn(_config.log_file.empty() ? "" : _config.log_file + ".medi");

        cout << "MEDI dipole inversion (lambda = " << parameters.lambda << ")" << endl;

        // The first echo is the anatomical reference
        const RealImage magnitude = Utility::GetVolume(data.magnitude, 0);
        MEDIResult result = medi.Run(local.local_field, data.noise_std, magnitude, local.mask);

        QSMTK_END_TIMING("Invert");
        return result;
    }

    //-------------------------------------------------------------------

    QSMResult QSMReconstruction::Run(const MultiEchoData& data) {
        Utility::CheckSameGrid(data.phase, data.mask, "phase and mask");
        Utility::CheckSameGrid(data.magnitude, data.mask, "magnitude and mask");
        if (data.magnitude.GetT() != data.phase.GetT())
            throw runtime_error("Number of magnitude volumes (" + to_string(data.magnitude.GetT())
                + ") does not match the number of phase volumes (" + to_string(data.phase.GetT()) + ")");
        if (Utility::CountMaskVoxels(data.mask) == 0)
            throw runtime_error("The mask is empty");

        QSMResult result;
        result.unwrapped_phase = UnwrapPhase(data);
        result.field_map = FieldMap(data, result.unwrapped_phase);

        const BackgroundRemovalResult local = RemoveBackground(result.field_map, data.mask);
        result.local_field = local.local_field;
        result.mask = local.mask;

        result.medi = Invert(data, local);
        result.chi = result.medi.chi;

        return result;
    }

}
