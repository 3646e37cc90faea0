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
#include "qsmtk/MEDI.h"
#include "qsmtk/ReconstructionConfig.h"
#include "qsmtk/VolumeIO.h"

using namespace std;
using namespace mirtk;

namespace qsmtk {

    /// Final and intermediate volumes of a reconstruction
    struct QSMResult {
        /// Susceptibility map [ppm]
        RealImage chi;

        /// Unwrapped phase stack [rad]
        RealImage unwrapped_phase;

        /// Total field map [ppm]
        RealImage field_map;

        /// Local field after background removal [ppm]
        RealImage local_field;

        /// Mask after background removal
        RealImage mask;

        /// Convergence diagnostics of the dipole inversion
        MEDIResult medi;
    };

    /**
     * @brief QSM reconstruction pipeline.
     * Laplacian unwrapping, echo combination, background field removal and MEDI
     * dipole inversion run strictly in sequence on a multi-echo acquisition.
     */
    class QSMReconstruction {
    protected:
        ReconstructionConfig _config;

        /// Debug mode
        bool _debug;

        /// Profiling mode
        bool _profile;

        /// Verbose mode
        bool _verbose;
        mutable ostream _verbose_log {cout.rdbuf()};
        ofstream _verbose_log_stream_buf;

    public:
        explicit QSMReconstruction(const ReconstructionConfig& config);

        /// Unwrap every echo of the phase stack
        RealImage UnwrapPhase(const MultiEchoData& data) const;

        /// Combine unwrapped echoes into a field map
        RealImage FieldMap(const MultiEchoData& data, const RealImage& unwrapped_phase) const;

        /// Remove the background field, throws runtime_error if the mask erodes to nothing
        BackgroundRemovalResult RemoveBackground(const RealImage& field_map, const RealImage& mask) const;

        /// Run the dipole inversion on the local field
        MEDIResult Invert(const MultiEchoData& data, const BackgroundRemovalResult& local) const;

        /// Run all stages
        QSMResult Run(const MultiEchoData& data);

        inline const ReconstructionConfig& Config() const {
            return _config;
        }

        /// Enable debug mode
        inline void DebugOn() {
            _debug = true;
        }

        /// Disable debug mode
        inline void DebugOff() {
            _debug = false;
        }

        /// Enable profiling mode
        inline void ProfileOn() {
            _profile = true;
        }

        /// Disable profiling mode
        inline void ProfileOff() {
            _profile = false;
        }

        /// Enable verbose mode, optionally redirected to a log file
        inline void VerboseOn(const string& log_file_name = "") {
            VerboseOff();

            if (!log_file_name.empty()) {
                _verbose_log_stream_buf.open(log_file_name, ofstream::out | ofstream::trunc);
                _verbose_log.rdbuf(_verbose_log_stream_buf.rdbuf());
            }

            _verbose = true;
        }

        /// Disable verbose mode
        inline void VerboseOff() {
            if (_verbose_log_stream_buf.is_open()) {
                _verbose_log_stream_buf.close();
                _verbose_log.rdbuf(cout.rdbuf());
            }

            _verbose = false;
        }
    };

} // namespace qsmtk
