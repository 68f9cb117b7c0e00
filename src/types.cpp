#include "termsession/types.hpp"

namespace termsession {

auto to_size(const WinSize& ws) -> Size {
    return Size{.rows = static_cast<int>(ws.height), .cols = static_cast<int>(ws.width)};
}

} // namespace termsession
