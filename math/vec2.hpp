#ifndef SPIROB_MATH_VEC2_HPP
#define SPIROB_MATH_VEC2_HPP

#include "vec3.hpp"
#include <cmath>

namespace spirob {

// Point or direction in the sketch plane (z = 0)
struct Vec2 {
    double x = 0.0;
    double y = 0.0;

    constexpr Vec2() = default;
    constexpr Vec2(double x_, double y_) : x(x_), y(y_) {}

    constexpr Vec2 operator+(const Vec2& other) const {
        return {x + other.x, y + other.y};
    }

    constexpr Vec2 operator-(const Vec2& other) const {
        return {x - other.x, y - other.y};
    }

    constexpr Vec2 operator*(double scalar) const {
        return {x * scalar, y * scalar};
    }

    constexpr Vec2 operator-() const {
        return {-x, -y};
    }

    constexpr double dot(const Vec2& other) const {
        return x * other.x + y * other.y;
    }

    // z component of the 3D cross product
    constexpr double cross(const Vec2& other) const {
        return x * other.y - y * other.x;
    }

    constexpr double length_squared() const {
        return x * x + y * y;
    }

    double length() const {
        return std::sqrt(length_squared());
    }

    double distance_to(const Vec2& other) const {
        return (*this - other).length();
    }

    // Reflection across the x-axis
    constexpr Vec2 mirrored_y() const {
        return {x, -y};
    }

    constexpr Vec3 to_vec3(double z = 0.0) const {
        return {x, y, z};
    }

    constexpr bool operator==(const Vec2& other) const {
        return x == other.x && y == other.y;
    }

    constexpr bool operator!=(const Vec2& other) const {
        return !(*this == other);
    }
};

constexpr Vec2 operator*(double scalar, const Vec2& v) {
    return v * scalar;
}

}  // namespace spirob

#endif // SPIROB_MATH_VEC2_HPP
