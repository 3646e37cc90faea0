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
#define BOOST_TEST_MODULE testVolumeIO

// QSMTK
#include "TestCommon.h"
#include "qsmtk/VolumeIO.h"

string testFolder;

namespace {
    void WriteText(const string& file_name, const string& text) {
        ofstream file(file_name);
        file << text;
    }
}

BOOST_AUTO_TEST_CASE(InitialiseTest) {
    InitializeIOLibrary();
    testFolder = TestDirectory("volume-io");
    BOOST_CHECK_MESSAGE(is_directory(testFolder), "Test folder couldn't be created!");
    ExitOnFailure();
}

BOOST_AUTO_TEST_CASE(StackVolumesMismatch) {
    const Array<RealImage> same {ConstantVolume(GridAttributes(4, 5, 6), 1), ConstantVolume(GridAttributes(4, 5, 6), 2)};
    const RealImage stack = StackVolumes(same, "phase");
    BOOST_CHECK_EQUAL(stack.GetT(), 2);
    BOOST_CHECK_EQUAL(stack(3, 4, 5, 1), 2.0);

    const Array<RealImage> different {ConstantVolume(GridAttributes(4, 5, 6), 1), ConstantVolume(GridAttributes(4, 5, 7), 2)};
    BOOST_CHECK_THROW(StackVolumes(different, "phase"), runtime_error);
    BOOST_CHECK_THROW(StackVolumes(Array<RealImage>(), "phase"), invalid_argument);
}

BOOST_AUTO_TEST_CASE(WriteVolumeLeavesNoTemporaryFile) {
    const RealImage image = RandomVolume(GridAttributes(5, 4, 3, 0.5, 0.7, 1.2), 17);
    const string file_name = testFolder + "/written.nii";
    const string reference = testFolder + "/reference.nii";

    WriteVolume(image, file_name);
    image.Write(reference.c_str());

    BOOST_CHECK(exists(file_name));
    BOOST_CHECK(!exists(testFolder + "/.tmp-written.nii"));
    BOOST_CHECK(EqualFiles(file_name, reference));

    const RealImage read = ReadVolume(file_name);
    BOOST_CHECK_EQUAL(read.GetX(), 5);
    BOOST_CHECK_CLOSE(read.GetZSize(), 1.2, 1e-4);
    BOOST_CHECK_SMALL(MaxAbsDifference(read, image), 1e-6);
}

BOOST_AUTO_TEST_CASE(ReadMissingVolume) {
    BOOST_CHECK_THROW(ReadVolume(testFolder + "/missing.nii.gz"), runtime_error);
}

BOOST_AUTO_TEST_CASE(ReadInputRecordFile) {
    const string json = testFolder + "/inputs.json";
    WriteText(json,
        "{\n"
        "  \"mag_nii\": [\"mag1.nii\", \"mag2.nii\"],\n"
        "  \"phase_nii\": [\"phase1.nii\", \"/abs/phase2.nii\"],\n"
        "  \"mask\": \"mask.nii\",\n"
        "  \"EchoTime\": [0.004, 0.012],\n"
        "  \"MagneticFieldStrength\": 7,\n"
        "  \"B0_dir\": [0, 2, 0]\n"
        "}\n");

    const InputRecord record = ReadInputRecord(json);
    BOOST_CHECK_EQUAL(record.magnitude_files.size(), 2u);
    BOOST_CHECK_EQUAL(record.magnitude_files[0], (path(testFolder) / "mag1.nii").string());
    BOOST_CHECK_EQUAL(record.phase_files[1], "/abs/phase2.nii");
    BOOST_CHECK_EQUAL(record.mask_file, (path(testFolder) / "mask.nii").string());
    BOOST_CHECK(record.noise_file.empty());
    BOOST_CHECK_CLOSE(record.echo_times[1], 0.012, 1e-12);
    BOOST_CHECK_CLOSE(record.field_strength, 7.0, 1e-12);
    BOOST_CHECK_EQUAL(record.direction[1], 1.0);
    BOOST_CHECK_NO_THROW(CheckInputRecord(record));
}

BOOST_AUTO_TEST_CASE(ReadInputRecordDefaults) {
    const string json = testFolder + "/single.json";
    WriteText(json,
        "{ \"mag_nii\": \"mag.nii\", \"phase_nii\": \"phase.nii\", \"mask\": \"mask.nii\","
        "  \"EchoTime\": 0.02, \"MagneticFieldStrength\": 3, \"B0_dir\": 1 }");

    const InputRecord record = ReadInputRecord(json);
    BOOST_CHECK_EQUAL(record.magnitude_files.size(), 1u);
    BOOST_CHECK_EQUAL(record.echo_times.size(), 1u);
    BOOST_CHECK_EQUAL(record.direction[0], 1.0);
    BOOST_CHECK_EQUAL(record.direction[2], 0.0);
}

BOOST_AUTO_TEST_CASE(InvalidInputRecords) {
    const string missing_key = testFolder + "/missing-key.json";
    WriteText(missing_key, "{ \"mag_nii\": [\"a.nii\"], \"phase_nii\": [\"b.nii\"], \"EchoTime\": [0.01], \"MagneticFieldStrength\": 3 }");
    BOOST_CHECK_THROW(ReadInputRecord(missing_key), runtime_error);

    const string broken = testFolder + "/broken.json";
    WriteText(broken, "{ \"mag_nii\": [");
    BOOST_CHECK_THROW(ReadInputRecord(broken), runtime_error);

    const string bad_direction = testFolder + "/bad-direction.json";
    WriteText(bad_direction, "{ \"mag_nii\": \"a.nii\", \"phase_nii\": \"b.nii\", \"mask\": \"m.nii\","
        " \"EchoTime\": 0.01, \"MagneticFieldStrength\": 3, \"B0_dir\": 5 }");
    BOOST_CHECK_THROW(ReadInputRecord(bad_direction), invalid_argument);

    BOOST_CHECK_THROW(ReadInputRecord(testFolder + "/none.json"), runtime_error);

    InputRecord record;
    record.magnitude_files = {"a.nii", "b.nii"};
    record.phase_files = {"c.nii"};
    record.mask_file = "m.nii";
    record.echo_times = {0.01, 0.02};
    record.field_strength = 3;
    BOOST_CHECK_THROW(CheckInputRecord(record), invalid_argument);

    record.phase_files = {"c.nii", "d.nii"};
    record.echo_times = {0.02, 0.01};
    BOOST_CHECK_THROW(CheckInputRecord(record), invalid_argument);
}

BOOST_AUTO_TEST_CASE(LoadMultiEchoVolumes) {
    const ImageAttributes attr = GridAttributes(6, 6, 4);
    InputRecord record;
    for (int e = 0; e < 2; e++) {
        const string mag = testFolder + "/mag" + to_string(e + 1) + ".nii";
        const string phase = testFolder + "/phase" + to_string(e + 1) + ".nii";
        ConstantVolume(attr, 100 - 10 * e).Write(mag.c_str());
        ConstantVolume(attr, 0.5 * (e + 1)).Write(phase.c_str());
        record.magnitude_files.push_back(mag);
        record.phase_files.push_back(phase);
    }
    record.mask_file = testFolder + "/mask.nii";
    BallVolume(attr, 3, 3, 2, 2).Write(record.mask_file.c_str());
    record.echo_times = {0.005, 0.010};
    record.field_strength = 3;

    const MultiEchoData data = LoadMultiEcho(record);
    BOOST_CHECK_EQUAL(data.magnitude.GetT(), 2);
    BOOST_CHECK_EQUAL(data.phase.GetT(), 2);
    BOOST_CHECK_CLOSE(data.phase(1, 1, 1, 1), 1.0, 1e-6);
    BOOST_CHECK_CLOSE(data.magnitude(1, 1, 1, 1), 90.0, 1e-6);
    BOOST_CHECK_EQUAL(data.mask(3, 3, 2), 1.0);
    BOOST_CHECK_EQUAL(data.noise_std(0, 0, 0), 1.0);

    // Echo with a different grid
    const string wrong = testFolder + "/phase-wrong.nii";
    ConstantVolume(GridAttributes(6, 6, 5), 0).Write(wrong.c_str());
    record.phase_files[1] = wrong;
    BOOST_CHECK_THROW(LoadMultiEcho(record), runtime_error);
}

BOOST_AUTO_TEST_CASE(CostHistoryCSV) {
    const string file_name = testFolder + "/costs.csv";
    WriteCostHistory({{3.5, 10}, {2.25, 12}}, file_name);

    ifstream file(file_name);
    string header, first, second;
    getline(file, header);
    getline(file, first);
    getline(file, second);
    BOOST_CHECK_EQUAL(header, "iteration,cost_data,cost_reg");
    BOOST_CHECK_EQUAL(first, "1,3.5,10");
    BOOST_CHECK_EQUAL(second, "2,2.25,12");
}
