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
#define BOOST_TEST_MODULE testFieldMap

// QSMTK
#include "TestCommon.h"
#include "qsmtk/FieldMap.h"

namespace {
    const double B0 = 3;

    /// Phase accumulated by a field [ppm] at the given echo times
    RealImage PhaseStack(const RealImage& field, const Array<double>& echo_times) {
        ImageAttributes attr = field.Attributes();
        attr._t = int(echo_times.size());
        RealImage phase(attr);
        for (int t = 0; t < attr._t; t++) {
            RealImage echo = field;
            echo *= 2 * PI * B0 * GYROMAGNETIC_RATIO * echo_times[t];
            Utility::PutVolume(phase, t, echo);
        }
        return phase;
    }
}

BOOST_AUTO_TEST_CASE(CombineConsistentEchoes) {
    const ImageAttributes attr = GridAttributes(6, 5, 4);
    RealImage field = RandomVolume(attr, 21);
    field *= 0.05;

    const Array<double> echo_times {0.004, 0.008, 0.012};
    const RealImage combined = CombineEchoes(PhaseStack(field, echo_times), echo_times, B0);

    BOOST_CHECK_EQUAL(combined.GetT(), 1);
    BOOST_CHECK_SMALL(MaxAbsDifference(combined, field), 1e-12);
}

BOOST_AUTO_TEST_CASE(ScalingBeforeAveraging) {
    const ImageAttributes attr = GridAttributes(3, 3, 3);
    const Array<double> echo_times {0.005, 0.02};

    // Echoes measured with different fields are averaged after scaling
    ImageAttributes attr4 = attr;
    attr4._t = 2;
    RealImage phase(attr4);
    const double f1 = 0.1, f2 = 0.3;
    for (int i = 0; i < attr._x * attr._y * attr._z; i++) {
        phase.Data()[i] = 2 * PI * B0 * GYROMAGNETIC_RATIO * echo_times[0] * f1;
        phase.Data()[attr._x * attr._y * attr._z + i] = 2 * PI * B0 * GYROMAGNETIC_RATIO * echo_times[1] * f2;
    }

    const RealImage combined = CombineEchoes(phase, echo_times, B0);
    BOOST_CHECK_CLOSE(combined(1, 1, 1), (f1 + f2) / 2, 1e-10);
}

BOOST_AUTO_TEST_CASE(GyromagneticRatio) {
    const ImageAttributes attr = GridAttributes(2, 2, 2);
    ImageAttributes attr4 = attr;
    attr4._t = 1;
    RealImage phase(attr4);
    phase = 1;

    const RealImage combined = CombineEchoes(phase, {0.01}, 7, 40);
    BOOST_CHECK_CLOSE(combined(0, 0, 0), 1 / (2 * PI * 7 * 40 * 0.01), 1e-10);
}

BOOST_AUTO_TEST_CASE(NonFinitePhase) {
    const ImageAttributes attr = GridAttributes(4, 4, 4);
    RealImage field = ConstantVolume(attr, 0.02);
    const Array<double> echo_times {0.01, 0.02};
    RealImage phase = PhaseStack(field, echo_times);
    phase(1, 1, 1, 0) = numeric_limits<double>::quiet_NaN();
    phase(2, 2, 2, 1) = numeric_limits<double>::infinity();

    const RealImage combined = CombineEchoes(phase, echo_times, B0);
    BOOST_CHECK(Utility::AllFinite(combined));
    BOOST_CHECK_CLOSE(combined(1, 1, 1), 0.01, 1e-8);
    BOOST_CHECK_CLOSE(combined(3, 3, 3), 0.02, 1e-8);
}

BOOST_AUTO_TEST_CASE(AcquisitionChecks) {
    const RealImage phase = PhaseStack(ConstantVolume(GridAttributes(3, 3, 3), 0.1), {0.01, 0.02});

    BOOST_CHECK_THROW(CombineEchoes(phase, {0.01}, B0), invalid_argument);
    BOOST_CHECK_THROW(CombineEchoes(phase, {0.02, 0.01}, B0), invalid_argument);
    BOOST_CHECK_THROW(CombineEchoes(phase, {0.01, 0.01}, B0), invalid_argument);
    BOOST_CHECK_THROW(CombineEchoes(phase, {0, 0.01}, B0), invalid_argument);
    BOOST_CHECK_THROW(CombineEchoes(phase, {0.01, 0.02}, 0), invalid_argument);
    BOOST_CHECK_THROW(CombineEchoes(phase, {0.01, 0.02}, B0, -1), invalid_argument);
    BOOST_CHECK_NO_THROW(CombineEchoes(phase, {0.01, 0.02}, B0));
}
