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

// Boost
#define BOOST_TEST_MODULE testQSMReconstruction

// QSMTK
#include "TestCommon.h"
#include "qsmtk/BackgroundRemoval.h"
#include "qsmtk/QSMReconstruction.h"

namespace {
    /// Two-echo acquisition of a susceptibility sphere inside a spherical brain mask
    MultiEchoData SyntheticAcquisition(double susceptibility) {
        const ImageAttributes attr = GridAttributes(32, 32, 32);
        const RealImage chi = BallVolume(attr, 16, 16, 16, 4, susceptibility);

        const FourierTransform fft(attr);
        const DipoleConvolution dipole(fft, DipoleKernel(attr, {0, 0, 1}));
        const RealImage field = dipole.Apply(chi);

        MultiEchoData data;
        data.echo_times = {0.004, 0.008};
        data.field_strength = 3;
        data.direction = {0, 0, 1};
        data.mask = BallVolume(attr, 16, 16, 16, 12);
        data.noise_std = ConstantVolume(attr, 1);

        ImageAttributes attr4 = attr;
        attr4._t = 2;
        data.magnitude = RealImage(attr4);
        data.phase = RealImage(attr4);
        for (int e = 0; e < 2; e++) {
            const double scale = 2 * PI * data.field_strength * GYROMAGNETIC_RATIO * data.echo_times[e];
            for (int z = 0; z < attr._z; z++)
                for (int y = 0; y < attr._y; y++)
                    for (int x = 0; x < attr._x; x++) {
                        const double phase = field(x, y, z) * scale;
                        data.phase(x, y, z, e) = atan2(sin(phase), cos(phase));
                        data.magnitude(x, y, z, e) = (chi(x, y, z) > 0 ? 0.5 : 1.0) * data.mask(x, y, z);
                    }
        }

        return data;
    }

    ReconstructionConfig FastConfig() {
        ReconstructionConfig config;
        config.background_method = BackgroundMethod::SMV;
        config.smv_radius = 3;
        config.medi.max_iterations = 3;
        config.medi.cg_max_iterations = 30;
        return config;
    }
}

BOOST_AUTO_TEST_CASE(ConfigDefaults) {
    const ReconstructionConfig config;
    BOOST_CHECK_CLOSE(config.gyromagnetic_ratio, 42.5775, 1e-9);
    BOOST_CHECK(config.background_method == BackgroundMethod::VSharp);
    BOOST_CHECK(config.vsharp_radii.empty());
    BOOST_CHECK_EQUAL(config.vsharp_threshold, 0.05);
    BOOST_CHECK_NO_THROW(config.Check());

    BOOST_CHECK(BackgroundMethodFromString("smv") == BackgroundMethod::SMV);
    BOOST_CHECK(BackgroundMethodFromString("vsharp") == BackgroundMethod::VSharp);
    BOOST_CHECK_THROW(BackgroundMethodFromString("pdf"), invalid_argument);
}

BOOST_AUTO_TEST_CASE(InvalidConfig) {
    ReconstructionConfig config;
    config.gyromagnetic_ratio = 0;
    BOOST_CHECK_THROW(QSMReconstruction{config}, invalid_argument);

    config = ReconstructionConfig();
    config.vsharp_threshold = 1;
    BOOST_CHECK_THROW(config.Check(), invalid_argument);

    config = ReconstructionConfig();
    config.vsharp_radii = {4, -2};
    BOOST_CHECK_THROW(config.Check(), invalid_argument);

    config = ReconstructionConfig();
    config.erosion_threshold = 0;
    BOOST_CHECK_THROW(config.Check(), invalid_argument);

    config = ReconstructionConfig();
    config.medi.lambda = -1;
    BOOST_CHECK_THROW(config.Check(), invalid_argument);
}

BOOST_AUTO_TEST_CASE(FullPipeline) {
    const MultiEchoData data = SyntheticAcquisition(0.2);

    QSMReconstruction reconstruction(FastConfig());
    const QSMResult result = reconstruction.Run(data);

    BOOST_CHECK_EQUAL(result.unwrapped_phase.GetT(), 2);
    BOOST_CHECK_EQUAL(result.field_map.GetT(), 1);
    BOOST_CHECK_EQUAL(result.local_field.GetX(), 32);
    BOOST_CHECK_EQUAL(result.chi.GetZ(), 32);
    BOOST_CHECK_EQUAL(result.medi.cost_history.size(), size_t(result.medi.iterations));

    // The eroded mask lies inside the input mask
    int outside = 0;
    for (int i = 0; i < result.mask.NumberOfVoxels(); i++)
        if (result.mask.Data()[i] > 0 && data.mask.Data()[i] == 0)
            outside++;
    BOOST_CHECK_EQUAL(outside, 0);
    BOOST_CHECK_GT(Utility::CountMaskVoxels(result.mask), 0);
    BOOST_CHECK_LT(Utility::CountMaskVoxels(result.mask), Utility::CountMaskVoxels(data.mask));

    // Paramagnetic core stands out against the surrounding tissue
    const ImageAttributes attr = result.chi.Attributes();
    const RealImage core = BallVolume(attr, 16, 16, 16, 2);
    RealImage shell = BallVolume(attr, 16, 16, 16, 8);
    shell -= BallVolume(attr, 16, 16, 16, 6);
    BOOST_CHECK_GT(MeanInMask(result.chi, core), MeanInMask(result.chi, shell));
}

BOOST_AUTO_TEST_CASE(VSharpStage) {
    const MultiEchoData data = SyntheticAcquisition(0.1);

    ReconstructionConfig config = FastConfig();
    config.background_method = BackgroundMethod::VSharp;
    config.vsharp_radii = {4, 6};
    QSMReconstruction reconstruction(config);

    const RealImage unwrapped = reconstruction.UnwrapPhase(data);
    const RealImage field = reconstruction.FieldMap(data, unwrapped);
    const BackgroundRemovalResult local = reconstruction.RemoveBackground(field, data.mask);

    const SphereKernel sphere = CreateSphereKernel(data.mask.Attributes(), 4, FourierTransform(data.mask.Attributes()));
    const RealImage eroded = ErodeMask(data.mask, sphere, FourierTransform(data.mask.Attributes()));
    BOOST_CHECK_EQUAL(MaxAbsDifference(local.mask, eroded), 0.0);
}

BOOST_AUTO_TEST_CASE(VerboseBackgroundLog) {
    const MultiEchoData data = SyntheticAcquisition(0.1);
    const string log_file = TestDirectory("qsm-reconstruction") + "/background.log";

    ReconstructionConfig config = FastConfig();
    config.background_method = BackgroundMethod::VSharp;
    config.vsharp_radii = {6, 4};
    config.verbose = true;
    config.log_file = log_file;

    BackgroundRemovalResult local;
    {
        QSMReconstruction reconstruction(config);
        const RealImage field = reconstruction.FieldMap(data, reconstruction.UnwrapPhase(data));
        local = reconstruction.RemoveBackground(field, data.mask);
    }
    BOOST_CHECK_GT(Utility::CountMaskVoxels(local.mask), 0);

    ifstream log(log_file);
    string line;
    getline(log, line);
    BOOST_CHECK_EQUAL(line, "Radii : 6 4 mm, threshold 0.05");
}

BOOST_AUTO_TEST_CASE(FatalInputs) {
    MultiEchoData data = SyntheticAcquisition(0.1);
    QSMReconstruction reconstruction(FastConfig());

    MultiEchoData empty = data;
    empty.mask = 0;
    BOOST_CHECK_THROW(reconstruction.Run(empty), runtime_error);

    MultiEchoData single_magnitude = data;
    single_magnitude.magnitude = Utility::GetVolume(data.magnitude, 0);
    BOOST_CHECK_THROW(reconstruction.Run(single_magnitude), runtime_error);

    // Erosion removing every voxel
    ReconstructionConfig config = FastConfig();
    config.smv_radius = 14;
    QSMReconstruction large(config);
    BOOST_CHECK_THROW(large.Run(data), runtime_error);
}
