#include <gtest/gtest.h>
#include <common/error.hpp>
#include <index/geo_index.hpp>
#include <index/seg.hpp>
#include "test_helpers.hpp"

using namespace brep;
using namespace brep::test;

TEST(SegmentRefTest, SamePointIsNotASegment) {
    GeoIndex index;
    PtId a = index.insert_point(Vec3(0.0, 0.0, 0.0));
    EXPECT_THROW(SegmentRef(a, a, index), DegenerateSegment);
    EXPECT_EQ(index.shared_borrow_count(), 0u);
}

TEST(SegmentRefTest, NeedsNoRib) {
    GeoIndex index;
    PtId a = index.insert_point(Vec3(0.0, 0.0, 0.0));
    PtId b = index.insert_point(Vec3(0.0, 3.0, 4.0));

    SegmentRef segment(a, b, index);
    EXPECT_EQ(index.rib_count(), 0u);
    EXPECT_EQ(segment.from_pt(), a);
    EXPECT_EQ(segment.to_pt(), b);
    EXPECT_EQ(segment.from(), Vec3(0.0, 0.0, 0.0));
    EXPECT_EQ(segment.to(), Vec3(0.0, 3.0, 4.0));
    EXPECT_EQ(segment.dir(), Vec3(0.0, 3.0, 4.0));
    EXPECT_TRUE(segment.has(a));
    EXPECT_TRUE(segment.has(b));
}

TEST(SegmentRefTest, FlipSwapsEnds) {
    GeoIndex index;
    PtId a = index.insert_point(Vec3(0.0, 0.0, 0.0));
    PtId b = index.insert_point(Vec3(1.0, 0.0, 0.0));

    SegmentRef segment(a, b, index);
    SegmentRef flipped = segment.flip();
    EXPECT_EQ(flipped.from_pt(), b);
    EXPECT_EQ(flipped.to_pt(), a);
    EXPECT_EQ(flipped.flip().from_pt(), a);
    EXPECT_EQ(flipped.dir(), Vec3(-1.0, 0.0, 0.0));
}

TEST(SegmentRefTest, DistanceFromOwnStartIsZero) {
    GeoIndex index;
    PtId a = index.insert_point(Vec3(1.0, -2.0, 0.5));
    PtId b = index.insert_point(Vec3(3.0, 7.0, 2.0));

    SegmentRef segment(a, b, index);
    EXPECT_DOUBLE_EQ(segment.distance_to_pt_squared(segment.from()), 0.0);
}

TEST(SegmentRefTest, DistanceToPerpendicularPoint) {
    GeoIndex index;
    PtId a = index.insert_point(Vec3(0.0, 0.0, 0.0));
    PtId b = index.insert_point(Vec3(2.0, 0.0, 0.0));

    SegmentRef segment(a, b, index);
    EXPECT_DOUBLE_EQ(segment.distance_to_pt_squared(Vec3(1.0, 1.0, 0.0)), 1.0);
}

TEST(SegmentRefTest, DistanceIsToInfiniteLine) {
    GeoIndex index;
    PtId a = index.insert_point(Vec3(0.0, 0.0, 0.0));
    PtId b = index.insert_point(Vec3(2.0, 0.0, 0.0));

    SegmentRef segment(a, b, index);

    // Beyond the end of the segment but 2 away from its line
    EXPECT_NEAR(segment.distance_to_pt_squared(Vec3(10.0, 0.0, 2.0)), 4.0, 1e-9);
    // On the line, behind the start
    EXPECT_NEAR(segment.distance_to_pt_squared(Vec3(-5.0, 0.0, 0.0)), 0.0, 1e-9);
}

TEST(SegmentRefTest, DistanceInvariantUnderFlip) {
    GeoIndex index;
    PtId a = index.insert_point(Vec3(0.0, 0.0, 0.0));
    PtId b = index.insert_point(Vec3(2.0, 0.0, 0.0));
    SegmentRef segment(a, b, index);

    EXPECT_DOUBLE_EQ(segment.flip().distance_to_pt_squared(Vec3(1.0, 1.0, 0.0)), 1.0);

    Vec3 probe(0.3, -1.7, 2.2);
    EXPECT_NEAR(segment.distance_to_pt_squared(probe),
                segment.flip().distance_to_pt_squared(probe), 1e-9);
}

TEST(SegmentRefTest, OverStoredRibPoints) {
    GeoIndex index;
    auto f = add_rib(index, Vec3(0.0, 0.0, 0.0), Vec3(1.0, 0.0, 0.0));
    SegRef seg = Seg(f.rib, SegmentDir::Reverse).to_ref(index);

    SegmentRef segment(seg.from_pt(), seg.to_pt(), index);
    EXPECT_EQ(segment.from(), seg.from());
    EXPECT_EQ(segment.to(), seg.to());
    EXPECT_EQ(index.shared_borrow_count(), 2u);
}
