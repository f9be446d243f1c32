#pragma once
#include <algorithm>
#include <cmath>
#include <ostream>

namespace st {

// Plain 3D vector used for tracking samples
struct Vector3 {
    float x{0.f};
    float y{0.f};
    float z{0.f};

    Vector3() = default;
    Vector3(float x_, float y_, float z_) : x(x_), y(y_), z(z_) {}

    Vector3 operator+(const Vector3& o) const { return {x + o.x, y + o.y, z + o.z}; }
    Vector3 operator-(const Vector3& o) const { return {x - o.x, y - o.y, z - o.z}; }
    Vector3 operator*(float s) const { return {x * s, y * s, z * s}; }
    Vector3 operator/(float s) const { return {x / s, y / s, z / s}; }

    // Componentwise product
    Vector3 operator*(const Vector3& o) const { return {x * o.x, y * o.y, z * o.z}; }

    Vector3& operator+=(const Vector3& o) {
        x += o.x;
        y += o.y;
        z += o.z;
        return *this;
    }

    Vector3& operator/=(float s) {
        x /= s;
        y /= s;
        z /= s;
        return *this;
    }

    bool operator==(const Vector3& o) const { return x == o.x && y == o.y && z == o.z; }
    bool operator!=(const Vector3& o) const { return !(*this == o); }

    float lengthSquared() const { return x * x + y * y + z * z; }
    float length() const { return std::sqrt(lengthSquared()); }

    Vector3 abs() const { return {std::fabs(x), std::fabs(y), std::fabs(z)}; }
    Vector3 sqrt() const { return {std::sqrt(x), std::sqrt(y), std::sqrt(z)}; }
    float maxComponent() const { return std::max({x, y, z}); }

    bool isFinite() const { return std::isfinite(x) && std::isfinite(y) && std::isfinite(z); }
};

inline Vector3 operator*(float s, const Vector3& v) { return v * s; }

inline bool anyGreater(const Vector3& lhs, const Vector3& rhs) {
    return lhs.x > rhs.x || lhs.y > rhs.y || lhs.z > rhs.z;
}

inline bool approxEqual(const Vector3& a, const Vector3& b, float eps = 1e-5f) {
    return std::fabs(a.x - b.x) <= eps && std::fabs(a.y - b.y) <= eps &&
           std::fabs(a.z - b.z) <= eps;
}

inline std::ostream& operator<<(std::ostream& out, const Vector3& v) {
    return out << '(' << v.x << ", " << v.y << ", " << v.z << ')';
}

} // namespace st
