#include "rib.hpp"
#include "geo_index.hpp"

namespace brep {

RibRef::RibRef(RibId rib_id, const GeoIndex& index)
    : rib_id_(rib_id), borrow_(index) {}

const Rib& RibRef::rib() const {
    return borrow_.index().rib(rib_id_);
}

Vec3 RibRef::from() const {
    return borrow_.index().point_of(from_pt());
}

Vec3 RibRef::to() const {
    return borrow_.index().point_of(to_pt());
}

RibRefMut::RibRefMut(RibId rib_id, GeoIndex& index)
    : rib_id_(rib_id), borrow_(index) {}

}  // namespace brep
