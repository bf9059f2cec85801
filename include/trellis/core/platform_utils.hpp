#pragma once

#include <cstddef>
#include <cstdlib>
#include <optional>
#include <string>
#include <thread>

namespace trellis::core {

// getenv wrapper. Returns std::nullopt if the variable is not set. If set but
// empty, returns an engaged optional with an empty string.
inline std::optional<std::string> safe_getenv(const char* name) noexcept {
    if (name == nullptr || *name == '\0') return std::nullopt;
    const char* v = std::getenv(name);
    if (!v) return std::nullopt;
    return std::string(v);
}

// Number of hardware threads, at least 1 when the platform cannot tell.
inline std::size_t available_parallelism() noexcept {
    const unsigned n = std::thread::hardware_concurrency();
    return n == 0 ? 1u : static_cast<std::size_t>(n);
}

} // namespace trellis::core
