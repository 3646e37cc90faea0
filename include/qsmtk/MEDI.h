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
#include "qsmtk/ConjugateGradient.h"
#include "qsmtk/FourierTransform.h"
#include "qsmtk/Kernels.h"
#include "qsmtk/Weighting.h"

using namespace std;
using namespace mirtk;

namespace qsmtk {

    /// Tunables of the MEDI dipole inversion
    struct MEDIParameters {
        /// Weight of the data-fidelity term
        double lambda = 1000;

        /// Field direction
        Direction direction {0, 0, 1};

        /// Re-estimate the noise from residual outliers after every iteration
        bool merit = false;

        /// Apply spherical mean value filtering before the inversion
        bool smv = false;

        /// SMV radius [mm]
        double smv_radius = 5;

        DataWeighting data_weighting = DataWeighting::SNR;
        GradientWeighting gradient_weighting = GradientWeighting::Binary;

        /// Target ratio of edge gradient components
        double percentage = 0.9;

        int cg_max_iterations = 100;
        double cg_tolerance = 0.01;

        int max_iterations = 10;
        double tol_norm_ratio = 0.1;

        /// Throw invalid_argument for out-of-range values
        void Check() const;
    };

    /// Output of the dipole inversion
    struct MEDIResult {
        /// Susceptibility map [ppm], 0 outside the mask
        RealImage chi;

        /// Mask used for the inversion (eroded when SMV filtering is enabled)
        RealImage mask;

        /// (data fidelity, regularisation) cost after every outer iteration
        Array<pair<double, double>> cost_history;

        int iterations;
        double res_norm_ratio;

        /// True if the update ratio fell below the tolerance before the iteration cap
        bool converged;

        /// False if the edge threshold search stopped at its iteration cap
        bool gradient_mask_converged;

        /// Noise standard deviation after the last MERIT update (the input noise if MERIT is off)
        RealImage noise_std;

        /// Data weighting of the last iteration
        RealImage data_weighting;
    };

    /// Noise map after one MERIT re-weighting step
    struct MeritUpdate {
        RealImage noise_std;

        /// Number of mask voxels flagged as outliers
        int outliers;
    };

    /**
     * @brief Re-estimate the noise from the complex data residual (MERIT).
     * Mask voxels whose centred residual magnitude exceeds 6 standard deviations
     * get their noise multiplied by the squared ratio, all other voxels are unchanged.
     * @param residual Weighted residual m (exp(i D chi) - exp(i f)).
     * @param mask
     * @param noise_std Current noise map.
     * @return
     */
    MeritUpdate MeritNoise(const ComplexArray& residual, const RealImage& mask, const RealImage& noise_std);

    /// Real part of the k-space dipole convolution Re(ifft(D .* fft(x)))
    class DipoleConvolution : public LinearOperator {
        const FourierTransform& _fft;
        KernelArray _kernel;

    public:
        DipoleConvolution(const FourierTransform& fft, const KernelArray& kernel) : _fft(fft), _kernel(kernel) {}

        RealImage Apply(const RealImage& x) const override;

        inline const KernelArray& Kernel() const {
            return _kernel;
        }
    };

    /// Linearised edge-preserving regulariser div(wG Vr wG grad(x))
    class RegularizationOperator : public LinearOperator {
        /// Combined weights wG * Vr * wG on the gradient components
        RealImage _weights;

    public:
        RegularizationOperator(const RealImage& gradient_mask, const RealImage& edge_weights);

        RealImage Apply(const RealImage& x) const override;
    };

    /// Gauss-Newton curvature of the data term D^T (|w|^2 D(x))
    class FidelityOperator : public LinearOperator {
        const DipoleConvolution& _dipole;
        RealImage _w2;

    public:
        FidelityOperator(const DipoleConvolution& dipole, const RealImage& w2) : _dipole(dipole), _w2(w2) {}

        RealImage Apply(const RealImage& x) const override;
    };

    /**
     * @brief Morphology enabled dipole inversion.
     * Minimises ||wG grad(chi)||_1 + lambda ||m (exp(i D chi) - exp(i f))||_2^2
     * with Gauss-Newton outer iterations and conjugate-gradient inner solves.
     *
     * References:
     * Liu et al., Morphology enabled dipole inversion (MEDI) from a single-angle acquisition, MRM 2011
     * Liu et al., Nonlinear formulation of the magnetic field to source relationship, MRM 2013
     */
    class MEDI {
    protected:
        MEDIParameters _parameters;

        /// Debug mode
        bool _debug;

        /// Profiling mode
        bool _profile;

        /// Verbose mode
        bool _verbose;
        ostream _verbose_log {cout.rdbuf()};
        ofstream _verbose_log_stream_buf;

    public:
        explicit MEDI(const MEDIParameters& parameters = MEDIParameters());

        /**
         * @brief Run the dipole inversion.
         * @param field Local field map.
         * @param noise_std Noise standard deviation map.
         * @param magnitude Anatomical magnitude image for the edge mask.
         * @param mask Region of interest.
         * @return Throws runtime_error on shape mismatch or empty mask.
         */
        MEDIResult Run(const RealImage& field, const RealImage& noise_std, const RealImage& magnitude, const RealImage& mask);

        inline const MEDIParameters& Parameters() const {
            return _parameters;
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
