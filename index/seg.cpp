#include "seg.hpp"
#include "geo_index.hpp"
#include <common/error.hpp>
#include <common/logging.hpp>
#include <string>

namespace brep {

namespace {

const Rib& lookup_rib(const RibMap& ribs, RibId rib_id) {
    auto it = ribs.find(rib_id);
    if (it == ribs.end()) {
        logging::get_logger()->error("Seg: no rib found: {}", rib_id.to_string());
        throw DanglingReference("Seg: no rib found: " + rib_id.to_string());
    }
    return it->second;
}

PtId start_of(const Rib& rib, SegmentDir dir) {
    return dir == SegmentDir::Forward ? rib.origin : rib.destination;
}

PtId end_of(const Rib& rib, SegmentDir dir) {
    return dir == SegmentDir::Forward ? rib.destination : rib.origin;
}

}  // namespace

// --- Seg ---

PtId Seg::from(const RibMap& ribs) const {
    return start_of(lookup_rib(ribs, rib_id), dir);
}

PtId Seg::to(const RibMap& ribs) const {
    return end_of(lookup_rib(ribs, rib_id), dir);
}

SegRef Seg::to_ref(const GeoIndex& index) const {
    return SegRef(rib_id, dir, index);
}

// --- SegRef ---

SegRef::SegRef(RibId rib_id, SegmentDir dir, const GeoIndex& index)
    : rib_id_(rib_id), dir_(dir), borrow_(index) {}

const Rib& SegRef::rib() const {
    return borrow_.index().rib(rib_id_);
}

PtId SegRef::from_pt() const {
    return start_of(rib(), dir_);
}

PtId SegRef::to_pt() const {
    return end_of(rib(), dir_);
}

Vec3 SegRef::from() const {
    return borrow_.index().point_of(from_pt());
}

Vec3 SegRef::to() const {
    return borrow_.index().point_of(to_pt());
}

SegRef SegRef::flip() const {
    return SegRef(rib_id_, brep::flip(dir_), borrow_.index());
}

double SegRef::magnitude() const {
    return make_ref(rib_id_, borrow_.index()).magnitude();
}

// --- SegRefMut ---

SegRefMut::SegRefMut(RibId rib_id, SegmentDir dir, GeoIndex& index)
    : rib_id_(rib_id), dir_(dir), borrow_(index) {}

// --- SegmentRef ---

SegmentRef::SegmentRef(PtId from, PtId to, const GeoIndex& index)
    : from_(from), to_(to), borrow_(index) {
    if (from == to) {
        logging::get_logger()->error("SegmentRef: same point {} - not a segment", from);
        throw DegenerateSegment("SegmentRef: same point " + std::to_string(from) +
                                " - not a segment");
    }
}

Vec3 SegmentRef::from() const {
    return borrow_.index().point_of(from_);
}

Vec3 SegmentRef::to() const {
    return borrow_.index().point_of(to_);
}

SegmentRef SegmentRef::flip() const {
    return SegmentRef(to_, from_, borrow_.index());
}

double SegmentRef::distance_to_pt_squared(const Vec3& pt) const {
    Vec3 v = pt - from();
    if (v.magnitude_squared() == 0.0) {
        return 0.0;
    }
    Vec3 dir_n = dir().normalize();
    double t = v.dot(dir_n);
    return v.dot(v) - t * t;
}

std::optional<IntersectionParams>
SegmentRef::get_intersection_params_seg_ref(const SegRef& other) const {
    return intersection_params(*this, other, borrow_.index().tolerance());
}

std::optional<IntersectionParams>
SegmentRef::get_intersection_params(const SegmentRef& other) const {
    return intersection_params(*this, other, borrow_.index().tolerance());
}

// --- Formatting ---

std::ostream& operator<<(std::ostream& os, SegmentDir dir) {
    return os << (dir == SegmentDir::Forward ? "fow" : "rev");
}

std::ostream& operator<<(std::ostream& os, const Seg& seg) {
    return os << "Seg(" << seg.rib_id << ", " << seg.dir << ")";
}

std::ostream& operator<<(std::ostream& os, const SegRef& seg) {
    Vec3 f = seg.from();
    Vec3 t = seg.to();
    return os << f.x << " " << f.y << " " << f.z << " -> "
              << t.x << " " << t.y << " " << t.z;
}

std::ostream& operator<<(std::ostream& os, const SegmentRef& segment) {
    Vec3 f = segment.from();
    Vec3 t = segment.to();
    return os << f.x << " " << f.y << " " << f.z << " -> "
              << t.x << " " << t.y << " " << t.z;
}

}  // namespace brep
