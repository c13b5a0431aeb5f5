// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

// A configuration parameter is stored in a Setting instance. Besides
// the value it carries the chain of YAML keys leading to the
// parameter, a short description, and the name of its type for
// printing the default configuration. For example, the parameter
//
//   radar:
//     n_workers: 3
//
// has yaml_keys = { "radar", "n_workers" }.
//
// Settings of primitive types store their value in the "value" member
// and convert implicitly to that type, so one can write
//
//   if (settings.radar.enabled) {
//       ...
//
// Settings of non-primitive types (strings and vectors)
// inherit from that type and can be used directly as one, e.g.
// settings.radar.fields.size().

#pragma once

#include <sstream>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <vector>

namespace seedtrack {

// String representation of a setting type as shown in the verbose
// configuration dump
template <typename T>
auto settingTypeName(const bool is_list) -> std::string
{
    const std::string suffix { is_list ? " list" : "" };
    if constexpr (std::is_same_v<T, bool>) {
        return "boolean" + suffix;
    } else if constexpr (std::is_same_v<T, int>) {
        return "integer" + suffix;
    } else if constexpr (std::is_same_v<T, size_t>) {
        return "unsigned integer" + suffix;
    } else if constexpr (std::is_same_v<T, double>) {
        return "double (float64)" + suffix;
    } else if constexpr (std::is_same_v<T, std::string>) {
        return "string" + suffix;
    } else {
        throw std::domain_error { "type not supported by the Setting class" };
    }
}

// Meta information shared by all settings. The value itself is
// defined in a derived class.
template <typename T>
class SettingBase
{
public:
    std::vector<std::string> yaml_keys {};
    const std::string info {};
    std::string type {};

    // The default constructor defines an unused setting
    SettingBase() = default;
    SettingBase(const bool is_list,
                const std::vector<std::string>& yaml_keys,
                const std::string& info)
      : yaml_keys { yaml_keys }
      , info { info }
      , type { settingTypeName<T>(is_list) }
    {}
    // Convert the list of YAML keys into a string [a][b]...
    [[nodiscard]] auto keyToStr() const -> std::string
    {
        std::stringstream s {};
        for (const auto& key : yaml_keys) {
            s << '[' << key << ']';
        }
        return s.str();
    }
    ~SettingBase() = default;
};

// Setting for primitive types
template <typename T>
class Setting : public SettingBase<T>
{
public:
    T value {};

    Setting() = default;
    Setting(const std::vector<std::string>& yaml_keys,
            const T value,
            const std::string& info)
      : SettingBase<T> { false, yaml_keys, info }, value { value }
    {}

    operator T() const { return value; }
    auto operator=(const T& new_value) -> Setting<T>&
    {
        value = new_value;
        return *this;
    }

    ~Setting() = default;
};

// Setting holding a list of values
template <typename T>
class Setting<std::vector<T>>
  : public SettingBase<T>
  , public std::vector<T>
{
public:
    Setting() = default;
    Setting(const std::vector<std::string>& yaml_keys,
            const std::vector<T> value,
            const std::string& info)
      : SettingBase<T> { true, yaml_keys, info }, std::vector<T> { value }
    {}
    // Assignment acts on the std::vector base
    auto operator=(const std::vector<T>& value) -> Setting<std::vector<T>>&
    {
        std::vector<T>* base { this };
        *base = value;
        return *this;
    }
};

// Setting holding a string, typically a file or directory name
template <>
class Setting<std::string>
  : public SettingBase<std::string>
  , public std::string
{
public:
    Setting() = default;
    Setting(const std::vector<std::string>& yaml_keys,
            const std::string value,
            const std::string& info)
      : SettingBase<std::string> { false, yaml_keys, info }
      , std::string { value }
    {}
    auto operator=(const std::string& value) -> Setting<std::string>&
    {
        std::string* base { this };
        *base = value;
        return *this;
    }
};

} // namespace seedtrack
