#pragma once

#include <fmt/core.h>

namespace aries::compat {
    using fmt::format;
}
