#ifndef BREPCORE_COMMON_ERROR_HPP
#define BREPCORE_COMMON_ERROR_HPP

#include <stdexcept>
#include <string>

namespace brep {

// Invariant violations. None of these are recovered from inside the core;
// they abort whatever operation raised them.

// An identifier that does not resolve in the index (stale or foreign handle).
struct DanglingReference : public std::out_of_range {
    using std::out_of_range::out_of_range;
};

// A segment whose two endpoints are the same point.
struct DegenerateSegment : public std::invalid_argument {
    using std::invalid_argument::invalid_argument;
};

// A borrow that would alias an exclusive borrow of the same index.
struct BorrowConflict : public std::logic_error {
    using std::logic_error::logic_error;
};

}  // namespace brep

#endif // BREPCORE_COMMON_ERROR_HPP
