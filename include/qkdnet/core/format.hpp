#pragma once

#include <fmt/core.h>

namespace qkdnet::compat {
    using fmt::format;
}
