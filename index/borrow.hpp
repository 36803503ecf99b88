#ifndef BREPCORE_INDEX_BORROW_HPP
#define BREPCORE_INDEX_BORROW_HPP

#include "ids.hpp"
#include <math/vec3.hpp>
#include <cstddef>

namespace brep {

class GeoIndex;

// Shared read borrow of a GeoIndex.
//
// Any number of shared borrows may be alive at once. Acquiring one while
// the index is exclusively borrowed throws BorrowConflict. Copies count as
// separate borrows, so a copied reference keeps the index locked against
// writers for as long as it lives.
class IndexBorrow {
public:
    explicit IndexBorrow(const GeoIndex& index);
    IndexBorrow(const IndexBorrow& other);
    IndexBorrow& operator=(const IndexBorrow& other);
    ~IndexBorrow();

    const GeoIndex& index() const { return *index_; }

private:
    const GeoIndex* index_;
};

// Mutation access to a GeoIndex, handed out only by a live exclusive
// borrow. While that borrow exists the index's own mutators refuse to run,
// so this is the one way to write. Valid only while the issuing borrow is.
class IndexWriter {
public:
    PtId insert_point(const Vec3& point) const;
    RibId insert_rib(PtId origin, PtId destination) const;
    bool remove_rib(RibId id) const;

    const GeoIndex& index() const { return *index_; }

private:
    friend class IndexBorrowMut;
    explicit IndexWriter(GeoIndex& index) : index_(&index) {}

    GeoIndex* index_;
};

// Exclusive write borrow of a GeoIndex.
//
// Acquiring it while any other borrow (shared or exclusive) is alive throws
// BorrowConflict. Move-only; a moved-from borrow holds nothing.
class IndexBorrowMut {
public:
    explicit IndexBorrowMut(GeoIndex& index);
    IndexBorrowMut(IndexBorrowMut&& other) noexcept;
    IndexBorrowMut& operator=(IndexBorrowMut&& other) noexcept;
    IndexBorrowMut(const IndexBorrowMut&) = delete;
    IndexBorrowMut& operator=(const IndexBorrowMut&) = delete;
    ~IndexBorrowMut();

    // Throws BorrowConflict on a moved-from borrow
    IndexWriter writer() const;

    bool holds() const { return index_ != nullptr; }

private:
    void release() noexcept;

    GeoIndex* index_;
};

}  // namespace brep

#endif // BREPCORE_INDEX_BORROW_HPP
