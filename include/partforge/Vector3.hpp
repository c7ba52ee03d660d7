#pragma once
#include <cmath>
#include <functional>

namespace partforge {

/**
 * @brief 3D vector used for placement math, directions and bounding boxes
 *
 * Dot product is operator*, cross product is operator%.
 */
struct Vector3 {
    double x, y, z;

    Vector3() : x(0.0), y(0.0), z(0.0) {}
    Vector3(double x_, double y_, double z_) : x(x_), y(y_), z(z_) {}

    Vector3 operator+(const Vector3& other) const {
        return Vector3(x + other.x, y + other.y, z + other.z);
    }

    Vector3 operator-(const Vector3& other) const {
        return Vector3(x - other.x, y - other.y, z - other.z);
    }

    Vector3 operator-() const {
        return Vector3(-x, -y, -z);
    }

    Vector3 operator*(double scalar) const {
        return Vector3(x * scalar, y * scalar, z * scalar);
    }

    // Dot product
    double operator*(const Vector3& other) const {
        return x * other.x + y * other.y + z * other.z;
    }

    // Cross product
    Vector3 operator%(const Vector3& other) const {
        return Vector3(
            y * other.z - z * other.y,
            z * other.x - x * other.z,
            x * other.y - y * other.x
        );
    }

    double length() const {
        return std::sqrt(x * x + y * y + z * z);
    }

    Vector3 normalized() const {
        double len = length();
        if (len < 1e-10) return Vector3(0, 0, 0);
        return Vector3(x / len, y / len, z / len);
    }

    bool isZero(double epsilon = 1e-10) const {
        return length() < epsilon;
    }

    // Equality with epsilon tolerance
    bool operator==(const Vector3& other) const {
        const double epsilon = 1e-9;
        return std::abs(x - other.x) < epsilon &&
               std::abs(y - other.y) < epsilon &&
               std::abs(z - other.z) < epsilon;
    }

    bool operator!=(const Vector3& other) const {
        return !(*this == other);
    }

    // Lexicographic ordering for std::map keys
    bool operator<(const Vector3& other) const {
        if (x != other.x) return x < other.x;
        if (y != other.y) return y < other.y;
        return z < other.z;
    }
};

/**
 * @brief 3x3 rotation matrix
 *
 * Used to orient frame tubes and to rotate pattern instances on kernels
 * that only accept point warps.
 */
struct Matrix3 {
    double m[3][3];

    Matrix3() {
        m[0][0] = 1.0; m[0][1] = 0.0; m[0][2] = 0.0;
        m[1][0] = 0.0; m[1][1] = 1.0; m[1][2] = 0.0;
        m[2][0] = 0.0; m[2][1] = 0.0; m[2][2] = 1.0;
    }

    Matrix3(double m00, double m01, double m02,
            double m10, double m11, double m12,
            double m20, double m21, double m22) {
        m[0][0] = m00; m[0][1] = m01; m[0][2] = m02;
        m[1][0] = m10; m[1][1] = m11; m[1][2] = m12;
        m[2][0] = m20; m[2][1] = m21; m[2][2] = m22;
    }

    Vector3 operator*(const Vector3& v) const {
        return Vector3(
            m[0][0] * v.x + m[0][1] * v.y + m[0][2] * v.z,
            m[1][0] * v.x + m[1][1] * v.y + m[1][2] * v.z,
            m[2][0] * v.x + m[2][1] * v.y + m[2][2] * v.z
        );
    }

    // Rotation about an axis through the origin (Rodrigues' formula)
    static Matrix3 rotation(const Vector3& axis, double angleRadians) {
        Vector3 k = axis.normalized();
        double c = std::cos(angleRadians);
        double s = std::sin(angleRadians);
        double t = 1.0 - c;

        return Matrix3(
            t * k.x * k.x + c,       t * k.x * k.y - s * k.z, t * k.x * k.z + s * k.y,
            t * k.x * k.y + s * k.z, t * k.y * k.y + c,       t * k.y * k.z - s * k.x,
            t * k.x * k.z - s * k.y, t * k.y * k.z + s * k.x, t * k.z * k.z + c
        );
    }
};

constexpr double kPi = 3.14159265358979323846;

inline double degreesToRadians(double degrees) {
    return degrees * kPi / 180.0;
}

} // namespace partforge

namespace std {
    template<>
    struct hash<partforge::Vector3> {
        size_t operator()(const partforge::Vector3& v) const {
            size_t h1 = hash<double>{}(v.x);
            size_t h2 = hash<double>{}(v.y);
            size_t h3 = hash<double>{}(v.z);
            return h1 ^ (h2 << 1) ^ (h3 << 2);
        }
    };
}
