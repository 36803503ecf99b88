#ifndef BREPCORE_SERIALIZATION_CONFIG_JSON_HPP
#define BREPCORE_SERIALIZATION_CONFIG_JSON_HPP

#include <nlohmann/json.hpp>
#include <math/vec3.hpp>
#include <index/ids.hpp>
#include <index/rib.hpp>
#include <index/seg.hpp>
#include <index/tolerance.hpp>
#include <string>

namespace brep {

// Vec3 serialization
inline void to_json(nlohmann::json& j, const Vec3& v) {
    j = nlohmann::json::array({v.x, v.y, v.z});
}

inline void from_json(const nlohmann::json& j, Vec3& v) {
    v.x = j.at(0).get<double>();
    v.y = j.at(1).get<double>();
    v.z = j.at(2).get<double>();
}

// Identifiers travel as canonical uuid text
template <typename Tag>
void to_json(nlohmann::json& j, const UniqueId<Tag>& id) {
    j = id.to_string();
}

template <typename Tag>
void from_json(const nlohmann::json& j, UniqueId<Tag>& id) {
    id.uuid = Uuid::parse(j.get<std::string>());
}

NLOHMANN_JSON_SERIALIZE_ENUM(SegmentDir, {
    {SegmentDir::Forward, "fow"},
    {SegmentDir::Reverse, "rev"},
})

inline void to_json(nlohmann::json& j, const Seg& seg) {
    j = {
        {"rib", seg.rib_id},
        {"dir", seg.dir}
    };
}

inline void from_json(const nlohmann::json& j, Seg& seg) {
    seg.rib_id = j.at("rib").get<RibId>();
    seg.dir = j.at("dir").get<SegmentDir>();
}

inline void to_json(nlohmann::json& j, const Rib& rib) {
    j = nlohmann::json::array({rib.origin, rib.destination});
}

inline void from_json(const nlohmann::json& j, Rib& rib) {
    rib.origin = j.at(0).get<PtId>();
    rib.destination = j.at(1).get<PtId>();
}

// ToleranceConfig serialization
inline void to_json(nlohmann::json& j, const ToleranceConfig& config) {
    j = {
        {"vertex_pulling", config.vertex_pulling}
    };
}

inline void from_json(const nlohmann::json& j, ToleranceConfig& config) {
    config.vertex_pulling = j.value("vertex_pulling", 0.001);
}

}  // namespace brep

#endif // BREPCORE_SERIALIZATION_CONFIG_JSON_HPP
