#ifndef SPIROB_MATH_VEC3_HPP
#define SPIROB_MATH_VEC3_HPP

#include <cmath>

namespace spirob {

// Point or direction in model space (mm). Sketch planes are z = 0.
struct Vec3 {
    double x = 0.0;
    double y = 0.0;
    double z = 0.0;

    constexpr Vec3() = default;
    constexpr Vec3(double x_, double y_, double z_) : x(x_), y(y_), z(z_) {}

    constexpr Vec3 operator+(const Vec3& o) const { return {x + o.x, y + o.y, z + o.z}; }
    constexpr Vec3 operator-(const Vec3& o) const { return {x - o.x, y - o.y, z - o.z}; }
    constexpr Vec3 operator*(double s) const { return {x * s, y * s, z * s}; }
    constexpr Vec3 operator/(double s) const { return {x / s, y / s, z / s}; }

    constexpr double dot(const Vec3& o) const {
        return x * o.x + y * o.y + z * o.z;
    }

    // Right-handed: unit_x().cross(unit_y()) == unit_z()
    constexpr Vec3 cross(const Vec3& o) const {
        return {y * o.z - z * o.y, z * o.x - x * o.z, x * o.y - y * o.x};
    }

    constexpr double length_squared() const { return dot(*this); }

    double length() const { return std::sqrt(length_squared()); }

    // Zero stays zero
    Vec3 normalized() const {
        double len = length();
        return len > 0.0 ? *this / len : Vec3{};
    }

    double distance_to(const Vec3& o) const { return (*this - o).length(); }

    constexpr bool operator==(const Vec3& o) const {
        return x == o.x && y == o.y && z == o.z;
    }
};

constexpr Vec3 operator*(double s, const Vec3& v) {
    return v * s;
}

namespace vec3 {
    constexpr Vec3 zero() { return {0.0, 0.0, 0.0}; }
    constexpr Vec3 unit_x() { return {1.0, 0.0, 0.0}; }
    constexpr Vec3 unit_y() { return {0.0, 1.0, 0.0}; }
    constexpr Vec3 unit_z() { return {0.0, 0.0, 1.0}; }
}

}  // namespace spirob

#endif // SPIROB_MATH_VEC3_HPP
