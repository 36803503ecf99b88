#ifndef BREPCORE_INDEX_IDS_HPP
#define BREPCORE_INDEX_IDS_HPP

#include <cstddef>
#include <cstdint>
#include <functional>
#include <ostream>
#include <string>

namespace brep {

// Handle into the vertex store. Identity only, no geometric meaning.
using PtId = uint32_t;

// 128-bit random value laid out as an RFC 4122 version 4 UUID.
struct Uuid {
    uint64_t hi = 0;
    uint64_t lo = 0;

    // Draw a fresh random value from the process-wide generator
    static Uuid generate();

    bool is_nil() const { return hi == 0 && lo == 0; }

    // Canonical 8-4-4-4-12 hex text
    std::string to_string() const;

    // Inverse of to_string(). Throws std::invalid_argument on malformed text.
    static Uuid parse(const std::string& text);

    bool operator==(const Uuid& other) const { return hi == other.hi && lo == other.lo; }
    bool operator!=(const Uuid& other) const { return !(*this == other); }
    bool operator<(const Uuid& other) const {
        return hi < other.hi || (hi == other.hi && lo < other.lo);
    }
};

// Globally unique identifier tagged by the entity kind it names, so a rib
// handle cannot be passed where a segment handle is expected.
template <typename Tag>
struct UniqueId {
    Uuid uuid;

    static UniqueId generate() { return UniqueId{Uuid::generate()}; }

    std::string to_string() const { return uuid.to_string(); }

    bool operator==(const UniqueId& other) const { return uuid == other.uuid; }
    bool operator!=(const UniqueId& other) const { return uuid != other.uuid; }
    bool operator<(const UniqueId& other) const { return uuid < other.uuid; }
};

struct RibTag {};
struct SegTag {};

using RibId = UniqueId<RibTag>;

// Per-traversal handle for components that track individual segments of a
// loop. Not consumed inside the core.
using SegId = UniqueId<SegTag>;

inline std::ostream& operator<<(std::ostream& os, const Uuid& uuid) {
    return os << uuid.to_string();
}

template <typename Tag>
std::ostream& operator<<(std::ostream& os, const UniqueId<Tag>& id) {
    return os << id.uuid;
}

}  // namespace brep

namespace std {

template <>
struct hash<brep::Uuid> {
    std::size_t operator()(const brep::Uuid& uuid) const noexcept {
        return std::hash<uint64_t>{}(uuid.hi ^ (uuid.lo * 0x9e3779b97f4a7c15ULL));
    }
};

template <typename Tag>
struct hash<brep::UniqueId<Tag>> {
    std::size_t operator()(const brep::UniqueId<Tag>& id) const noexcept {
        return std::hash<brep::Uuid>{}(id.uuid);
    }
};

}  // namespace std

#endif // BREPCORE_INDEX_IDS_HPP
