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
#include "qsmtk/BackgroundRemoval.h"
#include "qsmtk/DifferentialOperators.h"
#include "qsmtk/Parallel.h"
#include "qsmtk/Profiling.h"

namespace qsmtk {

    void MEDIParameters::Check() const {
        if (!(lambda > 0))
            throw invalid_argument("MEDI lambda must be positive, got " + to_string(lambda));
        if (!(percentage > 0 && percentage <= 1))
            throw invalid_argument("MEDI edge percentage must be in (0, 1], got " + to_string(percentage));
        if (smv && !(smv_radius > 0))
            throw invalid_argument("MEDI SMV radius must be positive, got " + to_string(smv_radius));
        if (cg_max_iterations < 1)
            throw invalid_argument("MEDI cg_max_iter must be positive, got " + to_string(cg_max_iterations));
        if (!(cg_tolerance >= 0))
            throw invalid_argument("MEDI cg_tol must be non-negative, got " + to_string(cg_tolerance));
        if (max_iterations < 1)
            throw invalid_argument("MEDI max_iter must be positive, got " + to_string(max_iterations));
        if (!(tol_norm_ratio >= 0))
            throw invalid_argument("MEDI tol_norm_ratio must be non-negative, got " + to_string(tol_norm_ratio));

        NormaliseDirection(direction);
        // Validate the enum values that may have been cast from integers
        ToString(data_weighting);
        ToString(gradient_weighting);
    }

    //-------------------------------------------------------------------

    RealImage DipoleConvolution::Apply(const RealImage& x) const {
        return _fft.Convolve(x, _kernel);
    }

    //-------------------------------------------------------------------

    RegularizationOperator::RegularizationOperator(const RealImage& gradient_mask, const RealImage& edge_weights) : _weights(edge_weights) {
        Utility::CheckSameGrid(gradient_mask, edge_weights, "gradient mask and edge weights");
        _weights *= gradient_mask;
        _weights *= gradient_mask;
    }

    //-------------------------------------------------------------------

    RealImage RegularizationOperator::Apply(const RealImage& x) const {
        RealImage gradient = Gradient(x);
        gradient *= _weights;
        return Divergence(gradient);
    }

    //-------------------------------------------------------------------

    RealImage FidelityOperator::Apply(const RealImage& x) const {
        RealImage y = _dipole.Apply(x);
        y *= _w2;
        return _dipole.Apply(y);
    }

    //-------------------------------------------------------------------

    MEDI::MEDI(const MEDIParameters& parameters) : _parameters(parameters), _debug(false), _profile(false), _verbose(false) {
        _parameters.Check();
    }

    //-------------------------------------------------------------------

    MeritUpdate MeritNoise(const ComplexArray& residual, const RealImage& mask, const RealImage& noise_std) {
        Utility::CheckSameGrid(noise_std, mask, "noise map and mask");
        const RealPixel *pm = mask.Data();
        const int n = mask.NumberOfVoxels();
        if (residual.size() != size_t(n))
            throw runtime_error("MERIT: residual size does not match the mask");

        MeritUpdate update;
        update.noise_std = noise_std;
        update.outliers = 0;

        Complex mean(0, 0);
        int count = 0;
        for (int i = 0; i < n; i++) {
            if (pm[i] > 0) {
                mean += residual[i];
                count++;
            }
        }
        if (count < 2)
            return update;
        mean /= double(count);

        // Standard deviation of the magnitude of the centred residual
        Array<double> magnitude(n);
        double sum = 0;
        for (int i = 0; i < n; i++) {
            magnitude[i] = std::abs(residual[i] - mean);
            if (pm[i] > 0)
                sum += magnitude[i];
        }
        const double average = sum / count;
        double variance = 0;
        for (int i = 0; i < n; i++)
            if (pm[i] > 0)
                variance += (magnitude[i] - average) * (magnitude[i] - average);
        const double factor = 6 * sqrt(variance / (count - 1));
        if (!(factor > 0))
            return update;

        RealPixel *pn = update.noise_std.Data();
        for (int i = 0; i < n; i++) {
            if (pm[i] > 0) {
                const double z = max(magnitude[i] / factor, 1.0);
                if (z > 1)
                    update.outliers++;
                pn[i] *= z * z;
            }
        }

        return update;
    }

    //-------------------------------------------------------------------

    MEDIResult MEDI::Run(const RealImage& field, const RealImage& noise_std, const RealImage& magnitude, const RealImage& mask) {
        Utility::CheckSameGrid(field, mask, "field map and mask");
        Utility::CheckSameGrid(noise_std, mask, "noise map and mask");
        Utility::CheckSameGrid(magnitude, mask, "magnitude and mask");

        if (Utility::CountMaskVoxels(mask) == 0)
            throw runtime_error("MEDI: the mask is empty");

        const ImageAttributes attr = Utility::SpatialAttributes(field.Attributes());
        const int n = attr._x * attr._y * attr._z;
        const double lambda = _parameters.lambda;

        MEDIResult result;
        result.mask = Utility::CreateMask(Utility::GetVolume(mask, 0), 0);

        RealImage rdf = Utility::GetVolume(field, 0);
        Utility::RemoveNonFinite(rdf);

        RealImage noise = Utility::GetVolume(noise_std, 0);
        Utility::MaskImage(noise, result.mask);
        RealImage tempn = noise;

        const FourierTransform fft(attr);
        KernelArray D = DipoleKernel(attr, _parameters.direction);

        SphereKernel sphere;
        if (_parameters.smv) {
            QSMTK_START_TIMING();
            sphere = CreateSphereKernel(attr, _parameters.smv_radius, fft);

            result.mask = ErodeMask(result.mask, sphere, fft);
            if (Utility::CountMaskVoxels(result.mask) == 0)
                throw runtime_error("MEDI: SMV erosion with radius " + to_string(_parameters.smv_radius) + " mm removed every mask voxel");

            for (int i = 0; i < n; i++)
                D[i] *= 1 - sphere.fourier[i];

            const RealImage smooth = SMV(rdf, sphere, fft);
            rdf -= smooth;
            Utility::MaskImage(rdf, result.mask);

            tempn = AdjustNoise(tempn, sphere, fft);

            if (_debug) {
                rdf.Write("medi-smv-field.nii.gz");
                result.mask.Write("medi-smv-mask.nii.gz");
            }
            QSMTK_END_TIMING("SMV preprocessing");
        }

        const DipoleConvolution dipole(fft, D);
        const RealImage& Mask = result.mask;

        cout << "Generating data weighting (" << ToString(_parameters.data_weighting) << ")" << endl;
        RealImage m = DataTermMask(_parameters.data_weighting, tempn, Mask);

        auto phasor = [&](const RealImage& weights, const RealImage& phase) {
            ComplexArray z(n);
            const RealPixel *pw = weights.Data();
            const RealPixel *pp = phase.Data();
            #pragma omp parallel for
            for (int i = 0; i < n; i++)
                z[i] = pw[i] * Complex(cos(pp[i]), sin(pp[i]));
            return z;
        };

        ComplexArray b0 = phasor(m, rdf);

        cout << "Generating gradient weighting (" << ToString(_parameters.gradient_weighting) << ")" << endl;
        const GradientMaskResult gradient_mask = GradientMask(_parameters.gradient_weighting, magnitude, Mask, _parameters.percentage);
        const RealImage& wG = gradient_mask.weights;
        result.gradient_mask_converged = gradient_mask.converged;

        if (_verbose)
            _verbose_log << "Gradient mask threshold : " << gradient_mask.threshold << " after " << gradient_mask.iterations << " iterations" << endl;

        if (_debug) {
            m.Write("medi-data-weighting.nii.gz");
            wG.Write("medi-gradient-weighting.nii.gz");
        }

        RealImage chi(attr);
        chi = 0;

        ConjugateGradient cg(_parameters.cg_tolerance, _parameters.cg_max_iterations);
        Utility::ClearAndReserve(result.cost_history, _parameters.max_iterations);

        result.iterations = 0;
        result.res_norm_ratio = numeric_limits<double>::infinity();

        while (result.res_norm_ratio > _parameters.tol_norm_ratio && result.iterations < _parameters.max_iterations) {
            QSMTK_START_TIMING();
            result.iterations++;

            // Edge-preserving weights of the current estimate
            const RealImage gradient = Gradient(chi);
            RealImage Vr(gradient.Attributes());
            Parallel::EdgeWeights parallelEdgeWeights(gradient, wG, Vr, MEDI_EPSILON);
            parallelEdgeWeights();

            const ComplexArray w = phasor(m, dipole.Apply(chi));

            RealImage w2(attr);
            RealImage rhs(attr);
            RealPixel *pw2 = w2.Data();
            RealPixel *prhs = rhs.Data();
            #pragma omp parallel for
            for (int i = 0; i < n; i++) {
                pw2[i] = std::norm(w[i]);
                prhs[i] = (std::conj(w[i]) * Complex(0, -1) * (w[i] - b0[i])).real();
            }

            const RegularizationOperator reg0(wG, Vr);
            const FidelityOperator fidelity(dipole, w2);
            const SumOperator A(reg0, fidelity, 1, 2 * lambda);

            // b = reg0(chi) + 2 lambda D^T Re(conj(w) (-i) (w - b0))
            RealImage b = reg0.Apply(chi);
            const RealImage data_gradient = dipole.Apply(rhs);
            RealPixel *pb = b.Data();
            const RealPixel *pd = data_gradient.Data();
            #pragma omp parallel for
            for (int i = 0; i < n; i++)
                pb[i] = -(pb[i] + 2 * lambda * pd[i]);

            const RealImage dx = cg.Solve(A, b);

            result.res_norm_ratio = Utility::Norm(dx) / (Utility::Norm(chi) + MEDI_EPSILON);
            chi += dx;

            // Costs of the updated estimate
            ComplexArray residual = phasor(m, dipole.Apply(chi));
            double cost_data = 0;
            for (int i = 0; i < n; i++) {
                residual[i] -= b0[i];
                cost_data += std::norm(residual[i]);
            }
            cost_data = sqrt(cost_data);

            RealImage weighted_gradient = Gradient(chi);
            weighted_gradient *= wG;
            double cost_reg = 0;
            const RealPixel *pg = weighted_gradient.Data();
            for (int i = 0; i < weighted_gradient.NumberOfVoxels(); i++)
                cost_reg += fabs(pg[i]);

            result.cost_history.push_back(make_pair(cost_data, cost_reg));

            if (_parameters.merit) {
                const MeritUpdate update = MeritNoise(residual, Mask, noise);
                noise = update.noise_std;
                if (_verbose)
                    _verbose_log << "MERIT: " << update.outliers << " outlier voxels" << endl;
                tempn = _parameters.smv ? AdjustNoise(noise, sphere, fft) : noise;
                m = DataTermMask(_parameters.data_weighting, tempn, Mask);
                b0 = phasor(m, rdf);
            }

            cout << "Iteration " << result.iterations << " : res_norm_ratio = " << result.res_norm_ratio
                << " cost_data = " << cost_data << " cost_reg = " << cost_reg << endl;
            if (_verbose)
                _verbose_log << "CG iterations : " << cg.Iterations() << (cg.Converged() ? "" : " (not converged)")
                    << " residual = " << cg.ResidualHistory().back() << endl;

            if (_debug)
                chi.Write((boost::format("medi-chi-%1%.nii.gz") % result.iterations).str().c_str());

            QSMTK_END_TIMING("MEDI iteration");
        }

        result.converged = result.res_norm_ratio <= _parameters.tol_norm_ratio;
        if (!result.converged)
            cout << "MEDI stopped at the iteration cap, res_norm_ratio = " << result.res_norm_ratio << endl;

        Utility::MaskImage(chi, Mask);
        result.chi = chi;
        result.noise_std = noise;
        result.data_weighting = m;

        return result;
    }

}
