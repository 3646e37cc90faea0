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
#define BOOST_TEST_MODULE testPhaseUnwrapping

// QSMTK
#include "TestCommon.h"
#include "qsmtk/PhaseUnwrapping.h"

namespace {
    const int N = 64;

    /// Periodic phase A sin(2 PI x / N) along x
    RealImage SinePhase(double amplitude, int nt = 1) {
        ImageAttributes attr = GridAttributes(N, 4, 4);
        attr._t = nt;
        RealImage phase(attr);
        for (int t = 0; t < nt; t++)
            for (int z = 0; z < attr._z; z++)
                for (int y = 0; y < attr._y; y++)
                    for (int x = 0; x < attr._x; x++)
                        phase(x, y, z, t) = (t + 1) * amplitude * sin(2 * PI * x / N);
        return phase;
    }

    RealImage Wrap(RealImage phase) {
        RealPixel *ptr = phase.Data();
        for (int i = 0; i < phase.NumberOfVoxels(); i++)
            ptr[i] = atan2(sin(ptr[i]), cos(ptr[i]));
        return phase;
    }
}

BOOST_AUTO_TEST_CASE(UnwrapSine) {
    const RealImage phase = SinePhase(4);
    const RealImage wrapped = Wrap(phase);
    const RealImage mask = ConstantVolume(Utility::SpatialAttributes(phase.Attributes()), 1);

    // The wrapped input has jumps close to 2 PI
    BOOST_CHECK(MaxAbsDifference(wrapped, phase) > 6);

    const RealImage unwrapped = UnwrapLaplacian(wrapped, mask);
    BOOST_CHECK_EQUAL(unwrapped.GetX(), phase.GetX());
    BOOST_CHECK(Utility::AllFinite(unwrapped));

    const double error = MaxAbsDifference(unwrapped, phase);
    BOOST_CHECK_MESSAGE(error < 0.3, "maximum unwrapping error " << error << " rad");
}

BOOST_AUTO_TEST_CASE(UnwrapIsIdempotent) {
    const RealImage phase = SinePhase(2);
    const RealImage mask = ConstantVolume(Utility::SpatialAttributes(phase.Attributes()), 1);

    const RealImage once = UnwrapLaplacian(phase, mask);
    const RealImage twice = UnwrapLaplacian(once, mask);

    const double change = MaxAbsDifference(once, twice);
    BOOST_CHECK_MESSAGE(change < 0.02 * 2, "second unwrapping changed the phase by " << change << " rad");
}

BOOST_AUTO_TEST_CASE(UnwrapEchoStack) {
    const RealImage phase = SinePhase(2, 2);
    const RealImage mask = BallVolume(Utility::SpatialAttributes(phase.Attributes()), 32, 1.5, 1.5, 20);

    const RealImage unwrapped = UnwrapLaplacian(Wrap(phase), mask);
    BOOST_CHECK_EQUAL(unwrapped.GetT(), 2);

    // Every echo is unwrapped on its own, voxels outside the mask are 0
    const RealImage echo2 = Utility::GetVolume(unwrapped, 1);
    const RealImage truth2 = Utility::GetVolume(phase, 1);
    BOOST_CHECK(MaxAbsDifference(echo2, truth2, &mask) < 0.3);
    BOOST_CHECK_EQUAL(unwrapped(0, 0, 0, 0), 0.0);
    BOOST_CHECK_EQUAL(unwrapped(0, 0, 0, 1), 0.0);
}

BOOST_AUTO_TEST_CASE(UnwrapNonFiniteInput) {
    RealImage phase = SinePhase(1);
    phase(10, 1, 1) = numeric_limits<double>::quiet_NaN();
    phase(20, 2, 2) = numeric_limits<double>::infinity();
    const RealImage mask = ConstantVolume(Utility::SpatialAttributes(phase.Attributes()), 1);

    const RealImage unwrapped = UnwrapLaplacian(phase, mask);
    BOOST_CHECK(Utility::AllFinite(unwrapped));
}

BOOST_AUTO_TEST_CASE(UnwrapShapeMismatch) {
    const RealImage phase = SinePhase(1);
    const RealImage mask = ConstantVolume(GridAttributes(N, 4, 3), 1);
    BOOST_CHECK_THROW(UnwrapLaplacian(phase, mask), runtime_error);
}
