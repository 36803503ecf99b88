#include "ids.hpp"
#include <iomanip>
#include <random>
#include <sstream>
#include <stdexcept>

namespace brep {

namespace {

std::mt19937_64& id_engine() {
    static std::mt19937_64 engine = []() {
        std::random_device rd;
        std::seed_seq seq{rd(), rd(), rd(), rd(), rd(), rd(), rd(), rd()};
        return std::mt19937_64(seq);
    }();
    return engine;
}

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

}  // namespace

Uuid Uuid::generate() {
    auto& engine = id_engine();
    Uuid uuid;
    uuid.hi = engine();
    uuid.lo = engine();

    // Version 4 in the high nibble of time_hi, variant 10xx in clock_seq
    uuid.hi = (uuid.hi & 0xffffffffffff0fffULL) | 0x0000000000004000ULL;
    uuid.lo = (uuid.lo & 0x3fffffffffffffffULL) | 0x8000000000000000ULL;
    return uuid;
}

std::string Uuid::to_string() const {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0')
        << std::setw(8) << (hi >> 32) << '-'
        << std::setw(4) << ((hi >> 16) & 0xffff) << '-'
        << std::setw(4) << (hi & 0xffff) << '-'
        << std::setw(4) << (lo >> 48) << '-'
        << std::setw(12) << (lo & 0xffffffffffffULL);
    return oss.str();
}

Uuid Uuid::parse(const std::string& text) {
    if (text.size() != 36 || text[8] != '-' || text[13] != '-' ||
        text[18] != '-' || text[23] != '-') {
        throw std::invalid_argument("Uuid::parse: malformed uuid: " + text);
    }

    Uuid uuid;
    int digits = 0;
    for (size_t i = 0; i < text.size(); ++i) {
        if (i == 8 || i == 13 || i == 18 || i == 23) continue;
        int v = hex_value(text[i]);
        if (v < 0) {
            throw std::invalid_argument("Uuid::parse: malformed uuid: " + text);
        }
        uint64_t& half = digits < 16 ? uuid.hi : uuid.lo;
        half = (half << 4) | static_cast<uint64_t>(v);
        ++digits;
    }
    return uuid;
}

}  // namespace brep
