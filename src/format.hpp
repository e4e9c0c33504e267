#pragma once

// Number formatting shared by the diagnostic and compact text forms.

#include "plume/types.hpp"
#include <charconv>
#include <cstdio>
#include <string>
#include <system_error>

namespace plume {
namespace detail {

// Shortest decimal form that reads back as the same f32, never in exponent
// notation ("12", "3.5", "0.1"). Integral values past 2^24 print their exact
// binary value (1e20f is "100000002004087734272").
inline void appendShortest(std::string& out, f32 value) {
    char buf[64];
    // Fits any finite f32: at most 39 integer digits plus sign and fraction.
    auto res = std::to_chars(buf, buf + sizeof(buf), value, std::chars_format::fixed);
    if (res.ec == std::errc()) {
        out.append(buf, res.ptr);
    }
}

// Exactly four decimals ("3.5000").
inline void appendFixed4(std::string& out, f32 value) {
    char buf[64];
    int n = std::snprintf(buf, sizeof(buf), "%.4f", static_cast<f64>(value));
    if (n > 0 && static_cast<size_t>(n) < sizeof(buf)) out.append(buf, static_cast<size_t>(n));
}

} // namespace detail
} // namespace plume
