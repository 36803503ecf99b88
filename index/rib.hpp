#ifndef BREPCORE_INDEX_RIB_HPP
#define BREPCORE_INDEX_RIB_HPP

#include "borrow.hpp"
#include "geo_object.hpp"
#include "ids.hpp"
#include <math/vec3.hpp>
#include <map>
#include <ostream>

namespace brep {

// Undirected edge between two stored points. The origin/destination order
// is fixed at creation and only matters as the Forward reading.
struct Rib {
    PtId origin = 0;
    PtId destination = 0;

    bool has(PtId pt) const { return origin == pt || destination == pt; }

    bool operator==(const Rib& other) const {
        return origin == other.origin && destination == other.destination;
    }
    bool operator!=(const Rib& other) const { return !(*this == other); }
};

using RibMap = std::map<RibId, Rib>;

// Read view of one rib in its stored orientation
class RibRef {
public:
    RibRef(RibId rib_id, const GeoIndex& index);

    const Rib& rib() const;
    PtId from_pt() const { return rib().origin; }
    PtId to_pt() const { return rib().destination; }

    Vec3 from() const;
    Vec3 to() const;
    Vec3 dir() const { return to() - from(); }
    double magnitude() const { return dir().magnitude(); }

    bool has(PtId pt) const { return rib().has(pt); }

    RibId rib_id() const { return rib_id_; }
    const GeoIndex& index() const { return borrow_.index(); }

private:
    RibId rib_id_;
    IndexBorrow borrow_;
};

// Exclusive write token for one rib. Topology-changing operations live in
// the components that consume it.
class RibRefMut {
public:
    RibRefMut(RibId rib_id, GeoIndex& index);

    RibId rib_id() const { return rib_id_; }
    IndexWriter index() const { return borrow_.writer(); }

private:
    RibId rib_id_;
    IndexBorrowMut borrow_;
};

template <>
struct GeoObject<RibId> {
    using Ref = RibRef;
    using MutRef = RibRefMut;

    static Ref make_ref(const RibId& rib_id, const GeoIndex& index) {
        return RibRef(rib_id, index);
    }

    static MutRef make_mut_ref(const RibId& rib_id, GeoIndex& index) {
        return RibRefMut(rib_id, index);
    }
};

template <>
struct UnRef<RibRef> {
    using Obj = RibId;
    static Obj un_ref(RibRef ref) { return ref.rib_id(); }
};

template <>
struct UnRef<RibRefMut> {
    using Obj = RibId;
    static Obj un_ref(RibRefMut ref) { return ref.rib_id(); }
};

inline std::ostream& operator<<(std::ostream& os, const Rib& rib) {
    return os << rib.origin << " - " << rib.destination;
}

}  // namespace brep

#endif // BREPCORE_INDEX_RIB_HPP
