// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

#include "archive.h"

#include <algorithm>
#include <iterator>
#include <common/io.h>

namespace seedtrack {

[[nodiscard]] auto listArchive(const std::filesystem::path& archive_dir,
                               const std::string& extension)
  -> std::vector<std::filesystem::path>
{
    if (!std::filesystem::is_directory(archive_dir)) {
        throw std::runtime_error { "radar archive not found at "
                                   + archive_dir.string() };
    }
    return listFiles(archive_dir, extension);
}

[[nodiscard]] auto matchArchive(const std::vector<std::string>& date_keys,
                                const std::vector<std::filesystem::path>& files)
  -> std::vector<std::filesystem::path>
{
    std::vector<std::filesystem::path> matched {};
    std::ranges::copy_if(
      files, std::back_inserter(matched), [&](const auto& file) {
          const std::string name { file.filename().string() };
          return std::ranges::any_of(date_keys, [&](const auto& key) {
              return name.find(key) != std::string::npos;
          });
      });
    return matched;
}

[[nodiscard]] auto parseScanTime(const std::filesystem::path& file,
                                 const ScanNameFormat& format) -> Timestamp
{
    const std::vector<std::string> tokens { splitString(file.stem().string(),
                                                        '_') };
    const int n_tokens { static_cast<int>(tokens.size()) };
    if (format.date_token >= n_tokens || format.time_token >= n_tokens) {
        throw std::invalid_argument {
            "cannot parse acquisition time from " + file.filename().string()
        };
    }
    return parseCompactDate(tokens[format.date_token])
           + parseCompactTime(tokens[format.time_token]);
}

} // namespace seedtrack
