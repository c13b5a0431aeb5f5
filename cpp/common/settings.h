// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

// Abstract class for storing all user defined configuration
// parameters. It is initialized from a YAML configuration file. The
// parameters themselves are Setting instances defined in a derived
// class, each with its YAML path, default value and an info string:
//
// class SettingsDerived : public Settings
// {
// public:
//     SettingsDerived(const std::string& yaml_file) : Settings { yaml_file } {}
//     struct
//     {
//         Setting<bool> enabled { { "radar", "enabled" }, true, "description" };
//     } radar;
//     auto scanKeys() -> void override
//     {
//         scan(radar.enabled);
//     }
//     auto checkParameters() -> void override {}
// };
//
// Newline symbols in an info string are kept by YAML::Emitter when
// printing the configuration.

#pragma once

#include "yaml.h"

#include <algorithm>

namespace seedtrack {

class Settings
{
private:
    // Whether to load or dump (for output) a YAML node in the scan function
    bool do_dump { false };
    // Warn about keys in the configuration file that no setting uses
    auto unrecognizedKeywordCheck() const -> void;
    // YAML keys minus the last key of the setting that was dumped
    // last. A change in this location means a YAML::BeginMap or
    // YAML::EndMap must be inserted into the emitter.
    std::vector<std::string> cur_map_loc {};
    // Emitter for converting the configuration into a string
    Emitter yaml_emitter {};
    // Feed a setting into the emitter, opening and closing maps as
    // the nesting of the YAML keys changes.
    template <typename T>
    auto dump(Emitter& emitter, const Setting<T>& setting) -> void
    {
        const auto& keys { setting.yaml_keys };
        // Close maps deeper than the location of this setting
        while (cur_map_loc.size() + 1 > keys.size()) {
            emitter << YAML::EndMap;
            cur_map_loc.pop_back();
        }
        // Close maps whose keys differ from the setting location,
        // starting from the innermost one.
        for (int i { static_cast<int>(
               std::min(cur_map_loc.size(), keys.size() - 1) - 1) };
             i >= 0;
             --i) {
            if (cur_map_loc.at(i) != keys.at(i)) {
                emitter << YAML::EndMap;
                cur_map_loc.pop_back();
            }
        }
        // Open any new maps on the way to the setting
        for (int i { static_cast<int>(cur_map_loc.size()) };
             i < static_cast<int>(keys.size() - 1);
             ++i) {
            cur_map_loc.push_back(keys.at(i));
            emitter << YAML::Key << cur_map_loc.back() << YAML::Value
                    << YAML::BeginMap;
        }
        emitter << setting;
    }

protected:
    // Full configuration as read from file
    YAML::Node config {};
    // Full configuration with default values
    YAML::Node default_config {};
    // Every key the scan function comes across. Used for recognizing
    // unknown keys.
    std::vector<std::vector<std::string>> all_valid_keys {};
    // Check for invalid values and inconsistencies between
    // parameters. Editing parameter values is allowed here.
    virtual auto checkParameters() -> void = 0;

public:
    Settings() = default;
    Settings(const std::string& yaml_file)
      : config { YAML::LoadFile(yaml_file) }
    {}
    Settings(const Settings& /* settings */) {};
    // Read input from the configuration file and check parameters
    // for correctness.
    auto init() -> void;
    // Visit every setting with scan. Called by init and c_str.
    virtual auto scanKeys() -> void = 0;
    // Find a YAML node and either dump into a string or convert it
    // into a C++ data structure
    template <typename T>
    auto scan(Setting<T>& item)
    {
        if (do_dump) {
            dump(yaml_emitter, item);
            return;
        }
        if (item.yaml_keys.empty()) {
            return;
        }
        all_valid_keys.push_back(item.yaml_keys);
        YAML::Node node { YAML::Clone(config) };
        // If the key is not found leave the default value unmodified
        for (const auto& key : item.yaml_keys) {
            node = node[key];
            if (!node) {
                return;
            }
        }
        try {
            item = node.as<T>();
        } catch (const YAML::BadConversion&) {
            std::string str_value {};
            try {
                str_value = node.as<std::string>();
            } catch (const YAML::BadConversion&) {
                // Not a scalar, the message will be less informative
            }
            throw std::runtime_error { "cannot set " + item.keyToStr()
                                       + ", which is of type " + item.type
                                       + ", to the value " + str_value };
        }
    }
    // Convert the current configuration into a string. If only the
    // default constructor was called this is the default
    // configuration.
    auto c_str(const bool verbose = true) -> const char*;
    // Return the configuration with default values filled in for
    // everything the user did not set
    auto getConfig() const -> std::string;
    virtual ~Settings() = default;
};

} // namespace seedtrack
