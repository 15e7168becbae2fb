#ifndef KARTA_CORE_UTIL_H
#define KARTA_CORE_UTIL_H

#include <cmath>
#include <cstdint>
#include <cstdio>
#include <functional>
#include <random>
#include <string>

#ifdef EMSCRIPTEN
#include <emscripten/emscripten.h>
#else
#include <chrono>
// Polyfill for native builds and tests
inline double emscripten_get_now() {
    using namespace std::chrono;
    return duration_cast<duration<double, std::milli>>(steady_clock::now().time_since_epoch()).count();
}
#endif

namespace karta {

// Milliseconds from a monotonic source.
using ClockFn = std::function<double()>;

inline double nowMs() {
    return emscripten_get_now();
}

inline ClockFn defaultClock() {
    return []() { return nowMs(); };
}

// 16 hex digits; used when the host does not name the site.
inline std::string randomSiteId() {
    std::random_device rd;
    std::mt19937_64 gen((static_cast<std::uint64_t>(rd()) << 32) ^ rd());
    char buf[17];
    std::snprintf(buf, sizeof(buf), "%016llx", static_cast<unsigned long long>(gen()));
    return buf;
}

inline bool isFiniteNumber(double v) noexcept {
    return std::isfinite(v);
}

// Degrees into [0, 360). Non-finite input maps to 0.
inline float normalizeRotation(float deg) {
    if (!std::isfinite(deg)) return 0.0f;
    float r = std::fmod(deg, 360.0f);
    if (r < 0.0f) r += 360.0f;
    if (r >= 360.0f) r = 0.0f;
    return r;
}

template <typename T>
inline T clampValue(T v, T lo, T hi) noexcept {
    return v < lo ? lo : (v > hi ? hi : v);
}

} // namespace karta

#endif // KARTA_CORE_UTIL_H
