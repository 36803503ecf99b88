#include "borrow.hpp"
#include "geo_index.hpp"
#include <common/error.hpp>
#include <common/logging.hpp>

namespace brep {

IndexBorrow::IndexBorrow(const GeoIndex& index) : index_(&index) {
    if (index.exclusive_borrow_) {
        logging::get_logger()->error("IndexBorrow: index is exclusively borrowed");
        throw BorrowConflict("IndexBorrow: index is exclusively borrowed");
    }
    ++index_->shared_borrows_;
}

IndexBorrow::IndexBorrow(const IndexBorrow& other) : index_(other.index_) {
    ++index_->shared_borrows_;
}

IndexBorrow& IndexBorrow::operator=(const IndexBorrow& other) {
    if (this != &other) {
        ++other.index_->shared_borrows_;
        --index_->shared_borrows_;
        index_ = other.index_;
    }
    return *this;
}

IndexBorrow::~IndexBorrow() {
    --index_->shared_borrows_;
}

IndexBorrowMut::IndexBorrowMut(GeoIndex& index) : index_(&index) {
    if (index.exclusive_borrow_ || index.shared_borrows_ > 0) {
        logging::get_logger()->error(
            "IndexBorrowMut: index already borrowed ({} shared, exclusive={})",
            index.shared_borrows_, index.exclusive_borrow_);
        throw BorrowConflict("IndexBorrowMut: index is already borrowed");
    }
    index_->exclusive_borrow_ = true;
}

IndexBorrowMut::IndexBorrowMut(IndexBorrowMut&& other) noexcept
    : index_(other.index_) {
    other.index_ = nullptr;
}

IndexBorrowMut& IndexBorrowMut::operator=(IndexBorrowMut&& other) noexcept {
    if (this != &other) {
        release();
        index_ = other.index_;
        other.index_ = nullptr;
    }
    return *this;
}

IndexBorrowMut::~IndexBorrowMut() {
    release();
}

IndexWriter IndexBorrowMut::writer() const {
    if (!index_) {
        throw BorrowConflict("IndexBorrowMut: borrow was moved out");
    }
    return IndexWriter(*index_);
}

void IndexBorrowMut::release() noexcept {
    if (index_) {
        index_->exclusive_borrow_ = false;
        index_ = nullptr;
    }
}

PtId IndexWriter::insert_point(const Vec3& point) const {
    return index_->insert_point_unchecked(point);
}

RibId IndexWriter::insert_rib(PtId origin, PtId destination) const {
    return index_->insert_rib_unchecked(origin, destination);
}

bool IndexWriter::remove_rib(RibId id) const {
    return index_->remove_rib_unchecked(id);
}

}  // namespace brep
