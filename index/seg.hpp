#ifndef BREPCORE_INDEX_SEG_HPP
#define BREPCORE_INDEX_SEG_HPP

#include "borrow.hpp"
#include "geo_object.hpp"
#include "ids.hpp"
#include "intersection.hpp"
#include "rib.hpp"
#include <math/vec3.hpp>
#include <optional>
#include <ostream>

namespace brep {

// Which way a segment reads its rib
enum class SegmentDir {
    Forward,  // origin -> destination
    Reverse   // destination -> origin
};

constexpr SegmentDir flip(SegmentDir dir) {
    return dir == SegmentDir::Forward ? SegmentDir::Reverse : SegmentDir::Forward;
}

class SegRef;
class SegRefMut;

// Directed traversal of a stored rib. Many loops can share one rib, each
// reading it in its own direction; flipping never touches the rib.
struct Seg {
    RibId rib_id;
    SegmentDir dir = SegmentDir::Forward;

    Seg() = default;
    Seg(RibId rib_id_, SegmentDir dir_) : rib_id(rib_id_), dir(dir_) {}

    Seg flip() const { return Seg(rib_id, brep::flip(dir)); }

    // Resolve against a rib map the caller already holds.
    // Throws DanglingReference if the rib is not in `ribs`.
    PtId from(const RibMap& ribs) const;
    PtId to(const RibMap& ribs) const;

    SegRef to_ref(const GeoIndex& index) const;

    bool operator==(const Seg& other) const {
        return rib_id == other.rib_id && dir == other.dir;
    }
    bool operator!=(const Seg& other) const { return !(*this == other); }
};

// Seg bound to a shared borrow of the index. Every accessor looks the rib
// up again; a rib missing from the index throws DanglingReference.
class SegRef {
public:
    SegRef(RibId rib_id, SegmentDir dir, const GeoIndex& index);

    Vec3 from() const;
    Vec3 to() const;
    Vec3 dir() const { return to() - from(); }

    PtId from_pt() const;
    PtId to_pt() const;

    bool has(PtId pt) const { return from_pt() == pt || to_pt() == pt; }

    SegRef flip() const;
    Seg seg() const { return Seg(rib_id_, dir_); }
    SegmentDir direction() const { return dir_; }
    RibId rib_id() const { return rib_id_; }

    // Length of the underlying rib
    double magnitude() const;

    const GeoIndex& index() const { return borrow_.index(); }

    bool operator==(const SegRef& other) const {
        return rib_id_ == other.rib_id_ && dir_ == other.dir_ &&
               &index() == &other.index();
    }
    bool operator!=(const SegRef& other) const { return !(*this == other); }

private:
    const Rib& rib() const;

    RibId rib_id_;
    SegmentDir dir_;
    IndexBorrow borrow_;
};

// Seg bound to an exclusive borrow of the index. Carries no operations of
// its own: owning one is the permission that topology editors require.
class SegRefMut {
public:
    SegRefMut(RibId rib_id, SegmentDir dir, GeoIndex& index);

    RibId rib_id() const { return rib_id_; }
    SegmentDir direction() const { return dir_; }
    IndexWriter index() const { return borrow_.writer(); }

private:
    RibId rib_id_;
    SegmentDir dir_;
    IndexBorrowMut borrow_;
};

// Directed pair of points that need not be a stored rib. Used to probe
// candidate geometry before it is committed to the index.
class SegmentRef {
public:
    // Throws DegenerateSegment if from == to
    SegmentRef(PtId from, PtId to, const GeoIndex& index);

    Vec3 from() const;
    Vec3 to() const;
    Vec3 dir() const { return to() - from(); }

    PtId from_pt() const { return from_; }
    PtId to_pt() const { return to_; }

    bool has(PtId pt) const { return from_ == pt || to_ == pt; }

    SegmentRef flip() const;

    // Squared distance from `pt` to the infinite line through this segment.
    // Not clamped to the endpoints.
    double distance_to_pt_squared(const Vec3& pt) const;

    // See intersection_params() for the meaning of the returned pair.
    // Uses the index's vertex pulling tolerance.
    std::optional<IntersectionParams> get_intersection_params_seg_ref(const SegRef& other) const;
    std::optional<IntersectionParams> get_intersection_params(const SegmentRef& other) const;

    const GeoIndex& index() const { return borrow_.index(); }

private:
    PtId from_;
    PtId to_;
    IndexBorrow borrow_;
};

template <>
struct GeoObject<Seg> {
    using Ref = SegRef;
    using MutRef = SegRefMut;

    static Ref make_ref(const Seg& seg, const GeoIndex& index) {
        return SegRef(seg.rib_id, seg.dir, index);
    }

    static MutRef make_mut_ref(const Seg& seg, GeoIndex& index) {
        return SegRefMut(seg.rib_id, seg.dir, index);
    }
};

template <>
struct UnRef<SegRef> {
    using Obj = Seg;
    static Obj un_ref(SegRef ref) { return ref.seg(); }
};

// Mutable references collapse to the rib they were granted over
template <>
struct UnRef<SegRefMut> {
    using Obj = RibId;
    static Obj un_ref(SegRefMut ref) { return ref.rib_id(); }
};

std::ostream& operator<<(std::ostream& os, SegmentDir dir);
std::ostream& operator<<(std::ostream& os, const Seg& seg);

// "fx fy fz -> tx ty tz"
std::ostream& operator<<(std::ostream& os, const SegRef& seg);
std::ostream& operator<<(std::ostream& os, const SegmentRef& segment);

}  // namespace brep

#endif // BREPCORE_INDEX_SEG_HPP
