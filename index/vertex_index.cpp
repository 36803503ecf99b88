#include "vertex_index.hpp"
#include <common/error.hpp>
#include <common/logging.hpp>
#include <string>

namespace brep {

PtId VertexIndex::insert_point(const Vec3& point) {
    PtId id = static_cast<PtId>(points_.size());
    points_.push_back(point);
    return id;
}

const Vec3& VertexIndex::get_point(PtId id) const {
    if (!contains(id)) {
        logging::get_logger()->error("VertexIndex: unknown point {}", id);
        throw DanglingReference("VertexIndex::get_point: unknown point id " + std::to_string(id));
    }
    return points_[id];
}

}  // namespace brep
