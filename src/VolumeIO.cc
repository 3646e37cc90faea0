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
#include "qsmtk/VolumeIO.h"
#include "qsmtk/FieldMap.h"
#include "qsmtk/Kernels.h"

// Boost
#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/ptree.hpp>

namespace fs = boost::filesystem;
namespace pt = boost::property_tree;

namespace qsmtk {

    namespace {
        /// Values of a JSON array, or the single value of a scalar entry
        template<typename T>
        Array<T> ReadList(const pt::ptree& tree, const string& key) {
            const pt::ptree& node = tree.get_child(key);
            Array<T> values;
            if (node.empty()) {
                values.push_back(node.get_value<T>());
            } else {
                for (const auto& child : node)
                    values.push_back(child.second.get_value<T>());
            }
            return values;
        }

        string ResolvePath(const string& file_name, const fs::path& base) {
            if (file_name.empty())
                return file_name;
            const fs::path path(file_name);
            return path.is_absolute() ? path.string() : (base / path).string();
        }
    }

    //-------------------------------------------------------------------

    InputRecord ReadInputRecord(const string& json_file) {
        if (!fs::exists(json_file))
            throw runtime_error("Input record " + json_file + " does not exist");

        pt::ptree tree;
        try {
            pt::read_json(json_file, tree);
        } catch (const pt::json_parser_error& e) {
            throw runtime_error("Cannot parse input record " + json_file + ": " + e.what());
        }

        const fs::path base = fs::path(json_file).parent_path();

        InputRecord record;
        try {
            for (const auto& file : ReadList<string>(tree, "mag_nii"))
                record.magnitude_files.push_back(ResolvePath(file, base));
            for (const auto& file : ReadList<string>(tree, "phase_nii"))
                record.phase_files.push_back(ResolvePath(file, base));
            record.mask_file = ResolvePath(tree.get<string>("mask"), base);
            record.noise_file = ResolvePath(tree.get<string>("noise_nii", ""), base);
            record.echo_times = ReadList<double>(tree, "EchoTime");
            record.field_strength = tree.get<double>("MagneticFieldStrength");

            if (tree.count("B0_dir") > 0) {
                const Array<double> direction = ReadList<double>(tree, "B0_dir");
                if (direction.size() == 1)
                    record.direction = FieldDirectionFromAxis(int(direction[0]));
                else if (direction.size() == 3)
                    record.direction = NormaliseDirection({direction[0], direction[1], direction[2]});
                else
                    throw invalid_argument("B0_dir must be an axis number or a vector with 3 components");
            }
        } catch (const pt::ptree_error& e) {
            throw runtime_error("Invalid input record " + json_file + ": " + e.what());
        }

        return record;
    }

    //-------------------------------------------------------------------

    void CheckInputRecord(const InputRecord& record) {
        if (record.magnitude_files.empty())
            throw invalid_argument("No magnitude volumes given");
        if (record.phase_files.size() != record.magnitude_files.size())
            throw invalid_argument("Number of phase volumes (" + to_string(record.phase_files.size())
                + ") does not match the number of magnitude volumes (" + to_string(record.magnitude_files.size()) + ")");
        if (record.mask_file.empty())
            throw invalid_argument("No mask given");

        CheckAcquisition(record.echo_times, record.field_strength, int(record.phase_files.size()));
        NormaliseDirection(record.direction);
    }

    //-------------------------------------------------------------------

    RealImage ReadVolume(const string& file_name) {
        if (!fs::exists(file_name))
            throw runtime_error("Volume " + file_name + " does not exist");

        RealImage image;
        image.Read(file_name.c_str());
        return image;
    }

    //-------------------------------------------------------------------

    RealImage StackVolumes(const Array<RealImage>& volumes, const string& what) {
        if (volumes.empty())
            throw invalid_argument("No " + what + " volumes to stack");

        ImageAttributes attr = Utility::SpatialAttributes(volumes[0].Attributes());
        for (size_t i = 1; i < volumes.size(); i++)
            if (!Utility::SameGrid(volumes[i].Attributes(), attr))
                throw runtime_error((boost::format("Input-shape mismatch: %1% volume %2% is %3%x%4%x%5%, expected %6%x%7%x%8%")
                    % what % (i + 1) % volumes[i].GetX() % volumes[i].GetY() % volumes[i].GetZ()
                    % attr._x % attr._y % attr._z).str());

        attr._t = int(volumes.size());
        RealImage stack(attr);
        for (size_t i = 0; i < volumes.size(); i++) {
            if (volumes[i].GetT() != 1)
                throw runtime_error(what + " volume " + to_string(i + 1) + " is not a 3D volume");
            Utility::PutVolume(stack, int(i), volumes[i]);
        }

        return stack;
    }

    //-------------------------------------------------------------------

    MultiEchoData LoadMultiEcho(const InputRecord& record) {
        CheckInputRecord(record);

        MultiEchoData data;
        data.echo_times = record.echo_times;
        data.field_strength = record.field_strength;
        data.direction = NormaliseDirection(record.direction);

        cout << "Reading mask " << record.mask_file << endl;
        data.mask = Utility::CreateMask(ReadVolume(record.mask_file), 0);

        Array<RealImage> magnitudes, phases;
        for (size_t i = 0; i < record.magnitude_files.size(); i++) {
            cout << "Reading echo " << i + 1 << " : " << record.magnitude_files[i] << " " << record.phase_files[i] << endl;
            magnitudes.push_back(ReadVolume(record.magnitude_files[i]));
            phases.push_back(ReadVolume(record.phase_files[i]));
        }

        data.magnitude = StackVolumes(magnitudes, "magnitude");
        data.phase = StackVolumes(phases, "phase");
        Utility::CheckSameGrid(data.magnitude, data.mask, "magnitude and mask");
        Utility::CheckSameGrid(data.phase, data.mask, "phase and mask");

        if (!record.noise_file.empty()) {
            data.noise_std = ReadVolume(record.noise_file);
            Utility::CheckSameGrid(data.noise_std, data.mask, "noise map and mask");
        } else {
            data.noise_std = RealImage(data.mask.Attributes());
            data.noise_std = 1;
        }

        return data;
    }

    //-------------------------------------------------------------------

    void WriteVolume(const RealImage& image, const string& file_name) {
        const fs::path target(file_name);
        const fs::path temporary = target.parent_path() / (".tmp-" + target.filename().string());

        try {
            image.Write(temporary.string().c_str());
            fs::rename(temporary, target);
        } catch (const exception&) {
            boost::system::error_code ec;
            fs::remove(temporary, ec);
            throw;
        }
    }

    //-------------------------------------------------------------------

    void WriteCostHistory(const Array<pair<double, double>>& cost_history, const string& file_name) {
        ofstream file(file_name);
        if (!file)
            throw runtime_error("Cannot open " + file_name + " for writing");

        file << "iteration,cost_data,cost_reg" << endl;
        file.precision(10);
        for (size_t i = 0; i < cost_history.size(); i++)
            file << i + 1 << "," << cost_history[i].first << "," << cost_history[i].second << endl;

        if (!file)
            throw runtime_error("Failed writing " + file_name);
    }

}
