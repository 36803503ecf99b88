#include "geo_index.hpp"
#include <common/error.hpp>
#include <common/logging.hpp>
#include <string>

namespace brep {

GeoIndex::GeoIndex(const ToleranceConfig& tolerance)
    : tolerance_(tolerance) {}

void GeoIndex::ensure_unborrowed(const char* operation) const {
    if (shared_borrows_ > 0) {
        logging::get_logger()->error("GeoIndex::{}: {} shared borrow(s) alive",
                                     operation, shared_borrows_);
        throw BorrowConflict(std::string("GeoIndex::") + operation +
                             ": index is borrowed for reading");
    }
    if (exclusive_borrow_) {
        logging::get_logger()->error("GeoIndex::{}: index is exclusively borrowed", operation);
        throw BorrowConflict(std::string("GeoIndex::") + operation +
                             ": index is borrowed for writing, use its IndexWriter");
    }
}

PtId GeoIndex::insert_point(const Vec3& point) {
    ensure_unborrowed("insert_point");
    return insert_point_unchecked(point);
}

RibId GeoIndex::insert_rib(PtId origin, PtId destination) {
    ensure_unborrowed("insert_rib");
    return insert_rib_unchecked(origin, destination);
}

bool GeoIndex::remove_rib(RibId id) {
    ensure_unborrowed("remove_rib");
    return remove_rib_unchecked(id);
}

PtId GeoIndex::insert_point_unchecked(const Vec3& point) {
    PtId id = vertices_.insert_point(point);
    logging::get_logger()->debug("GeoIndex: point {} = ({}, {}, {})",
                                 id, point.x, point.y, point.z);
    return id;
}

RibId GeoIndex::insert_rib_unchecked(PtId origin, PtId destination) {
    auto log = logging::get_logger();

    if (origin == destination) {
        log->error("GeoIndex::insert_rib: both ends are point {}", origin);
        throw DegenerateSegment("GeoIndex::insert_rib: rib from point " +
                                std::to_string(origin) + " to itself");
    }
    if (!vertices_.contains(origin) || !vertices_.contains(destination)) {
        log->error("GeoIndex::insert_rib: unknown endpoint in {} - {}", origin, destination);
        throw DanglingReference("GeoIndex::insert_rib: unknown endpoint");
    }

    RibId id = RibId::generate();
    ribs_.emplace(id, Rib{origin, destination});
    log->debug("GeoIndex: rib {} = {} - {}", id.to_string(), origin, destination);
    return id;
}

bool GeoIndex::remove_rib_unchecked(RibId id) {
    bool removed = ribs_.erase(id) > 0;
    if (removed) {
        logging::get_logger()->debug("GeoIndex: removed rib {}", id.to_string());
    }
    return removed;
}

const Rib& GeoIndex::rib(RibId id) const {
    auto it = ribs_.find(id);
    if (it == ribs_.end()) {
        logging::get_logger()->error("GeoIndex: no rib found: {}", id.to_string());
        throw DanglingReference("GeoIndex::rib: no rib found: " + id.to_string());
    }
    return it->second;
}

const Rib* GeoIndex::find_rib(RibId id) const {
    auto it = ribs_.find(id);
    if (it == ribs_.end()) {
        return nullptr;
    }
    return &it->second;
}

}  // namespace brep
