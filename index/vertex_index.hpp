#ifndef BREPCORE_INDEX_VERTEX_INDEX_HPP
#define BREPCORE_INDEX_VERTEX_INDEX_HPP

#include "ids.hpp"
#include <math/vec3.hpp>
#include <vector>

namespace brep {

// Append-only point storage. A PtId is the position of its point in
// insertion order. Coincident points are not merged here.
class VertexIndex {
public:
    VertexIndex() = default;

    PtId insert_point(const Vec3& point);

    // Throws DanglingReference for an id this store never issued
    const Vec3& get_point(PtId id) const;

    bool contains(PtId id) const { return id < points_.size(); }
    size_t size() const { return points_.size(); }
    bool empty() const { return points_.empty(); }

    const std::vector<Vec3>& points() const { return points_; }

private:
    std::vector<Vec3> points_;
};

}  // namespace brep

#endif // BREPCORE_INDEX_VERTEX_INDEX_HPP
