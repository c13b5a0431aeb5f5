// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

#pragma once

#include <common/time.h>
#include <string>
#include <vector>

namespace seedtrack {

// Date keys (YYYYMMDD) of every UTC calendar day from the day of the
// first timestamp to the day of the last one, inclusive, in ascending
// order. Days are generated by stepping so that flights longer than a
// day get all intermediate days too. Empty if last precedes first.
[[nodiscard]] auto flightDateKeys(const Timestamp first,
                                  const Timestamp last)
  -> std::vector<std::string>;

} // namespace seedtrack
