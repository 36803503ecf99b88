#ifndef BREPCORE_TEST_HELPERS_HPP
#define BREPCORE_TEST_HELPERS_HPP

#include <gtest/gtest.h>
#include <index/geo_index.hpp>
#include <index/seg.hpp>
#include <math/vec3.hpp>

namespace brep {
namespace test {

// A single rib between two fresh points
struct RibFixture {
    PtId p0;
    PtId p1;
    RibId rib;
};

inline RibFixture add_rib(GeoIndex& index, const Vec3& a, const Vec3& b) {
    RibFixture f;
    f.p0 = index.insert_point(a);
    f.p1 = index.insert_point(b);
    f.rib = index.insert_rib(f.p0, f.p1);
    return f;
}

inline void expect_vec3_near(const Vec3& actual, const Vec3& expected, double tol = 1e-9) {
    EXPECT_NEAR(actual.x, expected.x, tol);
    EXPECT_NEAR(actual.y, expected.y, tol);
    EXPECT_NEAR(actual.z, expected.z, tol);
}

}  // namespace test
}  // namespace brep

#endif // BREPCORE_TEST_HELPERS_HPP
