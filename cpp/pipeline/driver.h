// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

#pragma once

namespace seedtrack {

class SettingsPipeline;

// Run the track stage (raw logs to tracks and the master index)
// followed by the radar stage (frames and radar metadata for every
// flight directory). A failing stage is reported and does not
// prevent the other one from running.
auto driver(const SettingsPipeline& settings) -> void;

} // namespace seedtrack
