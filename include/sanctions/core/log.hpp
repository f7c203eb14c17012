#pragma once

#include <iostream>
#include <sstream>
#include <chrono>
#include <cstdint>

namespace sn::core {

inline std::uint64_t nowNs() {
    using clock = std::chrono::steady_clock;
    return std::chrono::duration_cast<std::chrono::nanoseconds>(clock::now().time_since_epoch()).count();
}

} // namespace sn::core

// Lines are assembled before the write so concurrent workers do not interleave
#define SN_EMIT(stream, level, msg) do { \
    std::ostringstream sn_line_; \
    sn_line_ << sn::core::nowNs() << " | " << level << " | " << msg << '\n'; \
    stream << sn_line_.str() << std::flush; \
} while(0)

#ifdef SANCTIONS_VERBOSE_LOG
#define SN_LOG(msg) SN_EMIT(std::cout, "DEBUG", msg)
#else
#define SN_LOG(msg) do {} while(0)
#endif

#define SN_WARN(msg) SN_EMIT(std::cerr, "WARN", msg)
#define SN_ERROR(msg) SN_EMIT(std::cerr, "ERROR", msg)
