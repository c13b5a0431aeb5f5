// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

// Access to the shared archive of radar volume scans. The archive is
// a flat directory of files whose names carry the acquisition date
// and time as underscore separated tokens, e.g.
// KDAX_V06_20240601_235012.nc where token 2 is the date (YYYYMMDD)
// and token 3 the time (HHMMSS). The archive is only ever read.

#pragma once

#include <common/time.h>
#include <filesystem>
#include <string>
#include <vector>

namespace seedtrack {

// Positions of the date and time tokens in a scan file name
struct ScanNameFormat
{
    int date_token { 2 };
    int time_token { 3 };
};

// All files of the archive with the given extension, sorted by
// name. Throws std::runtime_error if the archive does not exist.
[[nodiscard]] auto listArchive(const std::filesystem::path& archive_dir,
                               const std::string& extension)
  -> std::vector<std::filesystem::path>;

// Select the files whose name contains any of the date keys. This is
// a plain substring test on the file name. It is not restricted to the
// date token.
[[nodiscard]] auto matchArchive(const std::vector<std::string>& date_keys,
                                const std::vector<std::filesystem::path>& files)
  -> std::vector<std::filesystem::path>;

// Acquisition time embedded in the name of a scan file. Throws
// std::invalid_argument if the name does not follow the format.
[[nodiscard]] auto parseScanTime(const std::filesystem::path& file,
                                 const ScanNameFormat& format = {})
  -> Timestamp;

} // namespace seedtrack
