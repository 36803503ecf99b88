#ifndef BREPCORE_INDEX_GEO_INDEX_HPP
#define BREPCORE_INDEX_GEO_INDEX_HPP

#include "ids.hpp"
#include "rib.hpp"
#include "tolerance.hpp"
#include "vertex_index.hpp"
#include <cstddef>

namespace brep {

// Authoritative store of points and ribs. All contextual references
// (SegRef, SegmentRef, RibRef and their mutable forms) borrow it and
// resolve geometry from it on every query.
//
// Borrow discipline: any number of shared borrows, or exactly one
// exclusive borrow. The collaborator mutators below refuse to run while
// any borrow is alive. During an exclusive borrow, writes go through the
// IndexWriter that the mutable token's index() returns.
//
// Not copyable or movable: borrows hold its address.
class GeoIndex {
public:
    explicit GeoIndex(const ToleranceConfig& tolerance = ToleranceConfig::micrometer());
    GeoIndex(const GeoIndex&) = delete;
    GeoIndex& operator=(const GeoIndex&) = delete;

    const ToleranceConfig& tolerance() const { return tolerance_; }

    // Points
    PtId insert_point(const Vec3& point);
    const Vec3& point_of(PtId id) const { return vertices_.get_point(id); }
    const VertexIndex& vertices() const { return vertices_; }

    // Ribs. insert_rib draws a fresh RibId; it does not look for an existing
    // rib over the same points.
    RibId insert_rib(PtId origin, PtId destination);
    bool remove_rib(RibId id);
    const Rib& rib(RibId id) const;
    const Rib* find_rib(RibId id) const;
    bool contains_rib(RibId id) const { return ribs_.find(id) != ribs_.end(); }
    size_t rib_count() const { return ribs_.size(); }
    const RibMap& ribs() const { return ribs_; }

    size_t shared_borrow_count() const { return shared_borrows_; }
    bool is_exclusively_borrowed() const { return exclusive_borrow_; }

private:
    friend class IndexBorrow;
    friend class IndexBorrowMut;
    friend class IndexWriter;

    void ensure_unborrowed(const char* operation) const;

    PtId insert_point_unchecked(const Vec3& point);
    RibId insert_rib_unchecked(PtId origin, PtId destination);
    bool remove_rib_unchecked(RibId id);

    ToleranceConfig tolerance_;
    VertexIndex vertices_;
    RibMap ribs_;

    mutable size_t shared_borrows_ = 0;
    bool exclusive_borrow_ = false;
};

}  // namespace brep

#endif // BREPCORE_INDEX_GEO_INDEX_HPP
