#pragma once

#include <mutex>

namespace scenegen {

// Global mutex to keep stderr logs readable (one line at a time).
inline std::mutex& log_mutex() {
    static std::mutex mu;
    return mu;
}

}  // namespace scenegen
