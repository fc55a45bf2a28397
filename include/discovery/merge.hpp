#pragma once

#include <vector>

#include "model/device.hpp"

namespace netmon_agent::discovery {

// Folds source into target. Scalars keep the first non-empty value; sets are unioned.
void merge_into(model::DiscoveredDevice& target, const model::DiscoveredDevice& source);

// Deduplicates by IP across every list. The result is ordered by numeric IP,
// so the output does not depend on list order when scalar fields do not conflict.
std::vector<model::DiscoveredDevice> merge_devices(const std::vector<std::vector<model::DiscoveredDevice>>& sources);

}  // namespace netmon_agent::discovery
