// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

#include "driver.h"
#include "settings_pipeline.h"

#include <iostream>

auto main(int argc, char* argv[]) -> int
{
    if (argc == 1) {
        // When called without an argument print the default
        // configuration.
        std::cout << "%YAML 1.2\n---\n"
                  << seedtrack::SettingsPipeline {}.c_str() << '\n';
    } else {
        // NOLINTNEXTLINE(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        seedtrack::SettingsPipeline settings { argv[1] };
        settings.init();
        seedtrack::driver(settings);
    }
    return 0;
}
