#ifndef BREPCORE_MATH_MAT2_HPP
#define BREPCORE_MATH_MAT2_HPP

#include <optional>

namespace brep {

struct Vec2 {
    double x = 0.0;
    double y = 0.0;

    constexpr Vec2() = default;
    constexpr Vec2(double x_, double y_) : x(x_), y(y_) {}

    constexpr Vec2 operator-() const {
        return {-x, -y};
    }
};

// Row-major 2x2 matrix
//   | m00 m01 |
//   | m10 m11 |
struct Mat2 {
    double m00 = 1.0;
    double m01 = 0.0;
    double m10 = 0.0;
    double m11 = 1.0;

    constexpr Mat2() = default;
    constexpr Mat2(double a, double b, double c, double d)
        : m00(a), m01(b), m10(c), m11(d) {}

    constexpr double determinant() const {
        return m00 * m11 - m01 * m10;
    }

    // Inverse, or nullopt when the determinant is exactly zero
    std::optional<Mat2> try_inverse() const {
        double det = determinant();
        if (det == 0.0) {
            return std::nullopt;
        }
        double inv = 1.0 / det;
        return Mat2(m11 * inv, -m01 * inv, -m10 * inv, m00 * inv);
    }

    constexpr Vec2 operator*(const Vec2& v) const {
        return {m00 * v.x + m01 * v.y, m10 * v.x + m11 * v.y};
    }
};

}  // namespace brep

#endif // BREPCORE_MATH_MAT2_HPP
