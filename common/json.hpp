#pragma once

#include <nlohmann/json.hpp>

namespace common {
using json = nlohmann::json;
} // namespace common
