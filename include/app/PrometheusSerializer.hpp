#pragma once

#include <string>
#include <vector>

#include "model/Metric.hpp"
#include "model/Node.hpp"

namespace skynode::app {

// Serialize the latest sample of every metric into Prometheus text exposition
// format (version 0.0.4). Each metric becomes a skynode_<name> gauge labelled
// with the node id.
[[nodiscard]] std::string samples_to_prometheus(const std::vector<model::MetricSample>& samples,
                                                const model::Node& self);

} // namespace skynode::app
