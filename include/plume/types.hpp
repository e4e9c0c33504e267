#pragma once

#include <cstdint>
#include <string>

/**
 * @file types.hpp
 * @brief Core type aliases and length types for the plume library.
 */

namespace plume {

using i32 = int32_t;   ///< Signed 32-bit integer.
using u32 = uint32_t;  ///< Unsigned 32-bit integer.
using u64 = uint64_t;  ///< Unsigned 64-bit integer.
using u8 = uint8_t;    ///< Unsigned 8-bit integer.
using f32 = float;     ///< 32-bit floating point.
using f64 = double;    ///< 64-bit floating point.

/// @brief A length, stored in typographic points (1/72 inch).
///
/// Sizes are expected to be finite. A NaN or infinite size has no meaning
/// to any consumer and the result of feeding one in is undefined.
class Size {
public:
    constexpr Size() = default;

    /// @brief The zero length.
    static constexpr Size zero() { return Size(); }
    /// @brief A length in points.
    static constexpr Size pt(f32 points) { return Size(points); }
    /// @brief A length in millimeters.
    static constexpr Size mm(f32 v) { return Size(v * kPointsPerMm); }
    /// @brief A length in centimeters.
    static constexpr Size cm(f32 v) { return Size(v * kPointsPerMm * 10.0f); }
    /// @brief A length in inches.
    static constexpr Size inches(f32 v) { return Size(v * kPointsPerInch); }

    /// @brief Length in points, the stored unit.
    constexpr f32 toPt() const { return points_; }
    /// @brief Length in millimeters.
    constexpr f32 toMm() const { return points_ / kPointsPerMm; }
    /// @brief Length in centimeters.
    constexpr f32 toCm() const { return points_ / (kPointsPerMm * 10.0f); }
    /// @brief Length in inches.
    constexpr f32 toInches() const { return points_ / kPointsPerInch; }

    /// @brief The smaller of two lengths.
    static constexpr Size min(Size a, Size b) { return a.points_ <= b.points_ ? a : b; }
    /// @brief The larger of two lengths.
    static constexpr Size max(Size a, Size b) { return a.points_ >= b.points_ ? a : b; }

    constexpr Size operator-() const { return Size(-points_); }
    constexpr Size operator+(Size o) const { return Size(points_ + o.points_); }
    constexpr Size operator-(Size o) const { return Size(points_ - o.points_); }
    constexpr Size operator*(f32 k) const { return Size(points_ * k); }
    constexpr Size operator/(f32 k) const { return Size(points_ / k); }
    /// @brief Ratio of two lengths.
    constexpr f32 operator/(Size o) const { return points_ / o.points_; }

    Size& operator+=(Size o) { points_ += o.points_; return *this; }
    Size& operator-=(Size o) { points_ -= o.points_; return *this; }
    Size& operator*=(f32 k) { points_ *= k; return *this; }
    Size& operator/=(f32 k) { points_ /= k; return *this; }

    constexpr bool operator==(Size o) const { return points_ == o.points_; }
    constexpr bool operator!=(Size o) const { return points_ != o.points_; }
    constexpr bool operator<(Size o) const { return points_ < o.points_; }
    constexpr bool operator<=(Size o) const { return points_ <= o.points_; }
    constexpr bool operator>(Size o) const { return points_ > o.points_; }
    constexpr bool operator>=(Size o) const { return points_ >= o.points_; }

    /// @brief Human-readable form, e.g. "12pt" or "3.5pt".
    std::string toString() const;

private:
    static constexpr f32 kPointsPerInch = 72.0f;
    static constexpr f32 kPointsPerMm = kPointsPerInch / 25.4f;

    constexpr explicit Size(f32 points) : points_(points) {}

    f32 points_ = 0;
};

inline constexpr Size operator*(f32 k, Size s) { return s * k; }

/// @brief A position or extent made of two lengths.
struct Size2D {
    Size x;  ///< Horizontal component.
    Size y;  ///< Vertical component.

    /// @brief Both components zero.
    static constexpr Size2D zero() { return {}; }
    /// @brief Both components set to the same length.
    static constexpr Size2D withAll(Size s) { return {s, s}; }

    constexpr Size2D operator+(Size2D o) const { return {x + o.x, y + o.y}; }
    constexpr Size2D operator-(Size2D o) const { return {x - o.x, y - o.y}; }
    constexpr Size2D operator-() const { return {-x, -y}; }
    constexpr Size2D operator*(f32 k) const { return {x * k, y * k}; }

    Size2D& operator+=(Size2D o) { x += o.x; y += o.y; return *this; }
    Size2D& operator-=(Size2D o) { x -= o.x; y -= o.y; return *this; }

    constexpr bool operator==(Size2D o) const { return x == o.x && y == o.y; }
    constexpr bool operator!=(Size2D o) const { return !(*this == o); }

    /// @brief Human-readable form, e.g. "[10pt, 20pt]".
    std::string toString() const;
};

}
