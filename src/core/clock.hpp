#pragma once
#include <chrono>
#include <cstdint>

namespace core {

// Milliseconds on the process-wide monotonic clock.
inline int64_t now_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now().time_since_epoch()).count();
}

}
