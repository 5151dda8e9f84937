#pragma once

#include <chrono>
#include <cstdint>

namespace puresend::core {

using Millis = std::int64_t; // milliseconds since the Unix epoch

inline Millis NowMillis() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

} // namespace puresend::core
