// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

#include "settings_pipeline.h"

#include <common/constants.h>

namespace seedtrack {

auto SettingsPipeline::scanKeys() -> void
{
    scan(io_files.raw_data);
    scan(io_files.processed_data);
    scan(io_files.radar_archive);
    scan(io_files.index);

    scan(tracks.enabled);
    scan(tracks.log_extension);
    scan(tracks.delimiter);
    scan(tracks.skip_existing);
    scan(tracks.track_file);

    scan(radar.enabled);
    scan(radar.n_workers);
    scan(radar.archive_extension);
    scan(radar.fields);
    scan(radar.sweep);
    scan(radar.date_token);
    scan(radar.time_token);
    scan(radar.bounds);
    scan(radar.image_width);
    scan(radar.image_height);
    scan(radar.frames_dir);
    scan(radar.metadata_file);
}

auto SettingsPipeline::checkParameters() -> void
{
    if (tracks.delimiter.size() != 1) {
        throw std::invalid_argument {
            tracks.delimiter.keyToStr()
            + " must be a single character, got \"" + tracks.delimiter + '"'
        };
    }
    if (radar.n_workers < 1) {
        throw std::invalid_argument { radar.n_workers.keyToStr()
                                      + " must be at least 1" };
    }
    if (radar.fields.empty()) {
        throw std::invalid_argument { radar.fields.keyToStr()
                                      + " must not be empty" };
    }
    if (radar.sweep < 0 || radar.date_token < 0 || radar.time_token < 0) {
        throw std::invalid_argument {
            "[radar][sweep], [radar][date_token] and [radar][time_token] "
            "must not be negative"
        };
    }
    if (static_cast<int>(radar.bounds.size()) != bound::n) {
        throw std::invalid_argument { radar.bounds.keyToStr()
                                      + " must have exactly 4 elements" };
    }
    if (radar.bounds[bound::lat_min] >= radar.bounds[bound::lat_max]
        || radar.bounds[bound::lon_min] >= radar.bounds[bound::lon_max]) {
        throw std::invalid_argument {
            radar.bounds.keyToStr() + " must be ordered as lat_min, lon_min, "
            + "lat_max, lon_max with min < max"
        };
    }
    if (radar.image_width < 1 || radar.image_height < 1) {
        throw std::invalid_argument { "frame size must be positive" };
    }
}

} // namespace seedtrack
