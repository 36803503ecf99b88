#include <gtest/gtest.h>
#include <math/mat2.hpp>
#include <math/vec3.hpp>

using namespace brep;

TEST(Vec3Test, DefaultConstruction) {
    Vec3 v;
    EXPECT_DOUBLE_EQ(v.x, 0.0);
    EXPECT_DOUBLE_EQ(v.y, 0.0);
    EXPECT_DOUBLE_EQ(v.z, 0.0);
}

TEST(Vec3Test, Subtraction) {
    Vec3 a(4.0, 5.0, 6.0);
    Vec3 b(1.0, 2.0, 3.0);
    Vec3 c = a - b;
    EXPECT_DOUBLE_EQ(c.x, 3.0);
    EXPECT_DOUBLE_EQ(c.y, 3.0);
    EXPECT_DOUBLE_EQ(c.z, 3.0);
}

TEST(Vec3Test, DotProduct) {
    EXPECT_DOUBLE_EQ(vec3::unit_x().dot(vec3::unit_y()), 0.0);

    Vec3 c(1.0, 2.0, 3.0);
    Vec3 d(4.0, 5.0, 6.0);
    EXPECT_DOUBLE_EQ(c.dot(d), 32.0);
}

TEST(Vec3Test, Magnitude) {
    Vec3 v(3.0, 4.0, 0.0);
    EXPECT_DOUBLE_EQ(v.magnitude_squared(), 25.0);
    EXPECT_DOUBLE_EQ(v.magnitude(), 5.0);
}

TEST(Vec3Test, Normalize) {
    Vec3 n = Vec3(3.0, 4.0, 0.0).normalize();
    EXPECT_DOUBLE_EQ(n.magnitude(), 1.0);
    EXPECT_DOUBLE_EQ(n.x, 0.6);
    EXPECT_DOUBLE_EQ(n.y, 0.8);
}

TEST(Vec3Test, NormalizeZeroStaysZero) {
    EXPECT_EQ(vec3::zero().normalize(), vec3::zero());
}

TEST(Mat2Test, Determinant) {
    Mat2 m(1.0, 2.0, 3.0, 4.0);
    EXPECT_DOUBLE_EQ(m.determinant(), -2.0);
}

TEST(Mat2Test, InverseTimesVector) {
    Mat2 m(2.0, 0.0, 0.0, 4.0);
    auto mi = m.try_inverse();
    ASSERT_TRUE(mi.has_value());
    Vec2 v = *mi * Vec2(2.0, 2.0);
    EXPECT_DOUBLE_EQ(v.x, 1.0);
    EXPECT_DOUBLE_EQ(v.y, 0.5);
}

TEST(Mat2Test, SingularHasNoInverse) {
    Mat2 m(1.0, 1.0, 1.0, 1.0);
    EXPECT_FALSE(m.try_inverse().has_value());
}
