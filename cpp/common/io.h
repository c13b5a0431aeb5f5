// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

// Functions for formatting the output to stdout, for manipulating
// input/output files, and for writing and reading the JSON artifacts
// of the processor (tracks, radar metadata, master index).

#pragma once

#include <filesystem>
#include <spdlog/pattern_formatter.h>
#include <yaml-cpp/yaml.h>

namespace seedtrack {

// Define a new spdlog formatter flag. The primary purpose is to show
// labels such as [warning] for warnings but no label for regular
// (info) messages.
class seedtrack_formatter_flag : public spdlog::custom_flag_formatter
{
public:
    auto format(const spdlog::details::log_msg& log_msg,
                const std::tm&,
                spdlog::memory_buf_t& dest) -> void override;
    auto clone() const -> std::unique_ptr<custom_flag_formatter> override;
};

// Set up two loggers: the default one with a verbose pattern and a
// plain one (prints just the message text) for headings.
auto initLogging() -> void;

// Print the name of a processing section. For example, the track
// stage would start with
//
// ##########
// # Tracks #
// ##########
auto printHeading(const std::string& heading,
                  const bool incl_empty_line = true) -> void;

// Print information about the host system and how the executable was
// built.
auto printSystemInfo(const std::string& project_version,
                     const std::string& git_commit,
                     const std::string& cmake_host_system,
                     const std::string& executable,
                     const std::string& compiler,
                     const std::string& compiler_flags,
                     const std::string& libraries) -> void;

// Print the percentage of work done (iteration / work_size). Only
// the first OpenMP thread prints.
auto printPercentage(const int iteration,
                     const size_t work_size,
                     const std::string_view text) -> void;

auto splitString(const std::string& list,
                 const char delimiter) -> std::vector<std::string>;

// Remove leading and trailing whitespace
[[nodiscard]] auto trim(const std::string& str) -> std::string;

// All files in a directory with the given extension, sorted by
// name. Subdirectories are not searched.
[[nodiscard]] auto listFiles(const std::filesystem::path& dir,
                             const std::string& extension)
  -> std::vector<std::filesystem::path>;

// Configure an emitter to produce JSON: flow style, double quoted
// strings, and null instead of ~. JSON is a subset of YAML 1.2 so the
// artifacts can be read back with YAML::LoadFile.
auto setJsonFormat(YAML::Emitter& out) -> void;

// Write the contents of an emitter to file. Parent directories are
// created as necessary.
auto writeJson(const std::filesystem::path& filename,
               const YAML::Emitter& out) -> void;

} // namespace seedtrack
