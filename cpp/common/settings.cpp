// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

#include "settings.h"

#include <algorithm>
#include <spdlog/spdlog.h>
#include <utility>

namespace seedtrack {

auto Settings::init() -> void
{
    default_config = YAML::Load(c_str(false));
    scanKeys();
    unrecognizedKeywordCheck();
    checkParameters();
}

// Key chains of all leaf nodes in document order. A leaf is anything
// that is not a map, so lists such as [radar][bounds] count as one
// parameter.
static auto leafKeys(const YAML::Node& root)
  -> std::vector<std::vector<std::string>>
{
    std::vector<std::vector<std::string>> keys {};
    if (!root.IsMap()) {
        return keys;
    }
    // Nodes still to visit together with their key chain. Children are
    // pushed in reverse so they are visited in document order.
    std::vector<std::pair<YAML::Node, std::vector<std::string>>> stack {
        { root, {} }
    };
    while (!stack.empty()) {
        auto [node, chain] { std::move(stack.back()) };
        stack.pop_back();
        if (!node.IsMap()) {
            keys.push_back(std::move(chain));
            continue;
        }
        std::vector<std::pair<YAML::Node, std::vector<std::string>>> children {};
        for (const auto& child : node) {
            auto child_chain { chain };
            child_chain.push_back(child.first.as<std::string>());
            children.emplace_back(child.second, std::move(child_chain));
        }
        std::move(children.rbegin(), children.rend(), std::back_inserter(stack));
    }
    return keys;
}

auto Settings::unrecognizedKeywordCheck() const -> void
{
    for (const auto& key : leafKeys(YAML::Clone(config))) {
        if (std::ranges::find(all_valid_keys, key) == all_valid_keys.end()) {
            spdlog::warn("unrecognized input parameter: {}",
                         Setting<bool> { key, false, "" }.keyToStr());
        }
    }
}

auto Settings::c_str(const bool verbose) -> const char*
{
    do_dump = true;
    yaml_emitter.SetBoolFormat(YAML::YesNoBool);
    yaml_emitter.SetNullFormat(YAML::LowerNull);
    yaml_emitter.verbose = verbose;
    // One map at the top with the sections inside
    yaml_emitter << YAML::BeginMap;
    scanKeys();
    do_dump = false;
    return yaml_emitter.c_str();
}

// Values from the input where present, defaults everywhere else. Keys
// of the input without a default are dropped.
// NOLINTNEXTLINE(misc-no-recursion)
static auto mergeWithDefaults(const YAML::Node& defaults,
                              const YAML::Node& input) -> YAML::Node
{
    if (!defaults.IsMap() || !input.IsMap()) {
        return input ? input : defaults;
    }
    YAML::Node merged { YAML::NodeType::Map };
    for (const auto& entry : defaults) {
        const std::string key { entry.first.as<std::string>() };
        merged[key] = mergeWithDefaults(entry.second, input[key]);
    }
    return merged;
}

auto Settings::getConfig() const -> std::string
{
    YAML::Emitter out {};
    out.SetBoolFormat(YAML::YesNoBool);
    out.SetNullFormat(YAML::LowerNull);
    out << mergeWithDefaults(default_config, YAML::Clone(config));
    return out.c_str();
}

} // namespace seedtrack
