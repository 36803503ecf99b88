#ifndef BREPCORE_INDEX_INTERSECTION_HPP
#define BREPCORE_INDEX_INTERSECTION_HPP

#include "tolerance.hpp"
#include <common/logging.hpp>
#include <math/mat2.hpp>
#include <math/vec3.hpp>
#include <cmath>
#include <optional>
#include <utility>

namespace brep {

// Intersection parameters (f, g) of two segments.
//
// f is measured along self's unnormalized direction, so p = self.from() +
// self.dir() * f. g is a fraction of other's length, so
// p = other.from() + other.dir() * g. The two conventions differ and
// callers must not mix them.
using IntersectionParams = std::pair<double, double>;

// Closest-approach solve between the supporting lines of `self` and
// `other`, accepted when the two closest points lie within the vertex
// pulling tolerance of each other.
//
// Returns nullopt for near-parallel lines (|det| below tolerance squared),
// which includes collinear overlapping segments, and for skew lines that
// pass further apart than the tolerance. Either side having zero length
// also gives nullopt.
//
// A and B are any segment views exposing from() and dir() as Vec3.
template <typename A, typename B>
std::optional<IntersectionParams> intersection_params(const A& self, const B& other,
                                                      const ToleranceConfig& tolerance) {
    const double vertex_pulling_sq = tolerance.vertex_pulling_sq();

    const Vec3 self_from = self.from();
    const Vec3 other_from = other.from();
    const Vec3 self_dir_raw = self.dir();
    const Vec3 other_dir_raw = other.dir();

    // A rib between two coincident points has no direction
    if (self_dir_raw.magnitude_squared() == 0.0 || other_dir_raw.magnitude_squared() == 0.0) {
        logging::get_logger()->trace("intersection: zero-length direction");
        return std::nullopt;
    }

    const Vec3 other_dir = other_dir_raw.normalize();
    const Vec3 self_dir = self_dir_raw.normalize();
    const Vec3 q = self_from - other_from;

    const double dot = self_dir.dot(other_dir);

    const Mat2 m(1.0, -dot, dot, -1.0);
    const Vec2 b = -Vec2(q.dot(self_dir), q.dot(other_dir));

    if (std::abs(m.determinant()) < vertex_pulling_sq) {
        logging::get_logger()->trace("intersection: parallel, det={}", m.determinant());
        return std::nullopt;
    }

    auto mi = m.try_inverse();
    if (!mi) {
        return std::nullopt;
    }

    const Vec2 st = *mi * b;
    const Vec3 p1 = self_dir_raw * st.x + self_from;
    const Vec3 p2 = other_dir * st.y + other_from;
    const double gap_sq = (p1 - p2).magnitude_squared();

    if (gap_sq < vertex_pulling_sq) {
        return IntersectionParams{st.x, st.y / other_dir_raw.magnitude()};
    }

    logging::get_logger()->trace("intersection: lines miss by {}", std::sqrt(gap_sq));
    return std::nullopt;
}

}  // namespace brep

#endif // BREPCORE_INDEX_INTERSECTION_HPP
