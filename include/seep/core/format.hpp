#pragma once

#include <fmt/core.h>

namespace seep::compat {
using fmt::format;
}
