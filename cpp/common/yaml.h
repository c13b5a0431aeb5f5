// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

// Printing of configuration parameters with YAML::Emitter

#pragma once

#include "setting.h"

#include <yaml-cpp/yaml.h>

namespace seedtrack {

// Emitter with a verbosity switch. If verbose, each parameter is
// printed together with its type and description.
class Emitter : public YAML::Emitter
{
public:
    bool verbose {};
};

template <typename T>
static auto operator<<(Emitter& out, const Setting<T> setting) -> Emitter&
{
    out << YAML::Key << setting.yaml_keys.back();
    if (out.verbose) {
        out << YAML::Value;
        out << YAML::BeginMap;
        // NOLINTNEXTLINE(cppcoreguidelines-slicing)
        out << YAML::Key << "default" << YAML::Value << static_cast<T>(setting);
        out << YAML::Key << "type" << YAML::Value << setting.type;
        out << YAML::Key << "info" << YAML::Value << YAML::Literal
            << setting.info;
        out << YAML::EndMap;
    } else {
        // NOLINTNEXTLINE(cppcoreguidelines-slicing)
        out << YAML::Value << static_cast<T>(setting);
    }
    return out;
}

} // namespace seedtrack
