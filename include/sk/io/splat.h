#pragma once

#include <memory>

#include "sk/io/reader.h"

namespace sk {

std::unique_ptr<IPointCloudReader> MakeSplatReader();

} // namespace sk
