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

namespace qsmtk {

    /// Locations of the input volumes and the acquisition parameters
    struct InputRecord {
        Array<string> magnitude_files;
        Array<string> phase_files;
        string mask_file;

        /// Optional noise standard deviation map
        string noise_file;

        /// Echo times [s]
        Array<double> echo_times;

        /// Field strength [T]
        double field_strength = 0;

        /// Field direction (unit vector after normalisation)
        Direction direction {0, 0, 1};
    };

    /// Multi-echo acquisition stacked into 4D images
    struct MultiEchoData {
        /// 4D magnitude stack, one volume per echo
        RealImage magnitude;

        /// 4D wrapped phase stack [rad]
        RealImage phase;

        /// Binary region of interest
        RealImage mask;

        /// Noise standard deviation map, ones if not given
        RealImage noise_std;

        Array<double> echo_times;
        double field_strength = 0;
        Direction direction {0, 0, 1};
    };

    /**
     * @brief Read an input record from a JSON file.
     * Keys: mag_nii, phase_nii (lists of files), mask, EchoTime (list or number [s]),
     * MagneticFieldStrength [T] and the optional B0_dir (axis number or vector) and noise_nii.
     * Relative file names are resolved against the directory of the JSON file.
     * @param json_file
     * @return
     */
    InputRecord ReadInputRecord(const string& json_file);

    /// Check the consistency of list lengths and acquisition parameters, throws invalid_argument
    void CheckInputRecord(const InputRecord& record);

    /// Read a volume, throws runtime_error if the file does not exist
    RealImage ReadVolume(const string& file_name);

    /**
     * @brief Stack 3D volumes into a 4D image.
     * Throws runtime_error if the spatial grids differ.
     * @param volumes
     * @param what Description used in error messages.
     * @return
     */
    RealImage StackVolumes(const Array<RealImage>& volumes, const string& what);

    /**
     * @brief Load all volumes of an input record.
     * Every volume must be on the grid of the mask.
     * @param record
     * @return
     */
    MultiEchoData LoadMultiEcho(const InputRecord& record);

    /**
     * @brief Write a volume without leaving a partial file under the final name.
     * The image is written to a temporary sibling with the same extension and
     * renamed after the write succeeded.
     * @param image
     * @param file_name
     */
    void WriteVolume(const RealImage& image, const string& file_name);

    /// Write (data, regularisation) costs per iteration as CSV
    void WriteCostHistory(const Array<pair<double, double>>& cost_history, const string& file_name);

} // namespace qsmtk
