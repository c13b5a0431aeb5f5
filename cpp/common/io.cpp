// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

#include "io.h"

#include "time.h"

#include <algorithm>
#include <fstream>
#include <sstream>
#include <omp.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace seedtrack {

// Number of significant digits for coordinates and other doubles in
// the JSON artifacts
constexpr int json_precision { 10 };

auto seedtrack_formatter_flag::format(const spdlog::details::log_msg& log_msg,
                                      const std::tm& /* tm_time */,
                                      spdlog::memory_buf_t& dest) -> void
{
    std::string text {};
    switch (log_msg.level) {
    case spdlog::level::info:
        break;
    case spdlog::level::warn:
        text = " [warning]";
        break;
    case spdlog::level::err:
        text = " [error]";
        break;
    case spdlog::level::debug:
        text = " [debug]";
        break;
    case spdlog::level::off:
    case spdlog::level::trace:
    case spdlog::level::critical:
    case spdlog::level::n_levels:
    default:
        text = " [unknown]";
    }
    // NOLINTNEXTLINE(cppcoreguidelines-pro-bounds-pointer-arithmetic)
    dest.append(text.data(), text.data() + text.size());
}

auto seedtrack_formatter_flag::clone() const
  -> std::unique_ptr<custom_flag_formatter>
{
    return spdlog::details::make_unique<seedtrack_formatter_flag>();
}

auto initLogging() -> void
{
    // Only if the logger does not already exist
    if (!spdlog::get("plain")) {
        auto formatter { std::make_unique<spdlog::pattern_formatter>() };
        formatter->add_flag<seedtrack_formatter_flag>('*').set_pattern(
          "[%H:%M:%S]%* %v");
        spdlog::set_formatter(std::move(formatter));
        spdlog::stdout_color_mt("plain");
        spdlog::get("plain")->set_pattern("%v");
    }
    spdlog::set_level(spdlog::level::info);
}

auto printHeading(const std::string& heading,
                  const bool incl_empty_line) -> void
{
    if (incl_empty_line) {
        spdlog::get("plain")->info("");
    }
    std::string hash_line(heading.size() + 4, '#');
    spdlog::get("plain")->info(hash_line);
    spdlog::get("plain")->info("# " + heading + " #");
    spdlog::get("plain")->info(hash_line);
}

auto printSystemInfo(const std::string& project_version,
                     const std::string& git_commit,
                     const std::string& cmake_host_system,
                     const std::string& executable,
                     const std::string& compiler,
                     const std::string& compiler_flags,
                     const std::string& libraries) -> void
{
    spdlog::get("plain")->info("Version                 : {}", project_version);
    if (git_commit != "GITDIR-N") {
        spdlog::get("plain")->info("Commit hash             : {}", git_commit);
    }
    spdlog::get("plain")->info("Date and timezone       : {}", getDate());
    spdlog::get("plain")->info("Host system             : {}",
                               cmake_host_system);
    spdlog::get("plain")->info("Executable location     : {}", executable);
    spdlog::get("plain")->info("C++ compiler            : {}", compiler);
    spdlog::get("plain")->info("C++ compiler flags      : {}", compiler_flags);
    spdlog::get("plain")->info("Number of threads       : {}",
                               omp_get_max_threads());
    for (bool first_line { true };
         const auto& lib : splitString(libraries, ' ')) {
        if (first_line) {
            spdlog::get("plain")->info("Linking against         : {}", lib);
            first_line = false;
        } else {
            spdlog::get("plain")->info("                          {}", lib);
        }
    }
}

auto printPercentage(const int iteration,
                     const size_t work_size,
                     const std::string_view text) -> void
{
    if (omp_get_thread_num() != 0) {
        return;
    }
    spdlog::info(
      "{} {:6.2f}%",
      text,
      std::min(100.0, 1e2 * iteration / static_cast<double>(work_size)));
}

auto splitString(const std::string& list,
                 const char delimiter) -> std::vector<std::string>
{
    std::stringstream ss { list };
    std::string name {};
    std::vector<std::string> strings {};
    while (getline(ss, name, delimiter)) {
        strings.push_back(name);
    }
    return strings;
}

[[nodiscard]] auto trim(const std::string& str) -> std::string
{
    constexpr std::string_view whitespace { " \t\r\n" };
    const auto first { str.find_first_not_of(whitespace) };
    if (first == std::string::npos) {
        return {};
    }
    const auto last { str.find_last_not_of(whitespace) };
    return str.substr(first, last - first + 1);
}

[[nodiscard]] auto listFiles(const std::filesystem::path& dir,
                             const std::string& extension)
  -> std::vector<std::filesystem::path>
{
    std::vector<std::filesystem::path> files {};
    for (const auto& entry : std::filesystem::directory_iterator { dir }) {
        if (entry.is_regular_file()
            && entry.path().extension() == extension) {
            files.push_back(entry.path());
        }
    }
    std::ranges::sort(files);
    return files;
}

auto setJsonFormat(YAML::Emitter& out) -> void
{
    out.SetMapFormat(YAML::Flow);
    out.SetSeqFormat(YAML::Flow);
    out.SetStringFormat(YAML::DoubleQuoted);
    out.SetNullFormat(YAML::LowerNull);
    out.SetBoolFormat(YAML::TrueFalseBool);
    out.SetDoublePrecision(json_precision);
}

auto writeJson(const std::filesystem::path& filename,
               const YAML::Emitter& out) -> void
{
    if (!out.good()) {
        throw std::runtime_error { "could not generate " + filename.string()
                                   + ": " + out.GetLastError() };
    }
    if (filename.has_parent_path()) {
        std::filesystem::create_directories(filename.parent_path());
    }
    std::ofstream file { filename };
    if (!file) {
        throw std::runtime_error { "could not open " + filename.string()
                                   + " for writing" };
    }
    file << out.c_str() << '\n';
    if (!file) {
        throw std::runtime_error { "could not write " + filename.string() };
    }
}

} // namespace seedtrack
