#pragma once

#include "sk/core/errors.h"
#include "sk/core/point_cloud.h"

namespace sk {

// Check array lengths against numPoints. Strict mode also rejects non-finite
// values and non-positive scales. Empty message means the cloud is valid.
Error ValidateBasic(const PointCloud &pc, bool strict = false);

} // namespace sk
