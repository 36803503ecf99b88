#ifndef BREPCORE_INDEX_GEO_OBJECT_HPP
#define BREPCORE_INDEX_GEO_OBJECT_HPP

#include <type_traits>
#include <utility>

namespace brep {

class GeoIndex;

// Capability conversion between identifier-only values and contextual
// references into a GeoIndex.
//
// An indexed entity kind T plugs in by specialising GeoObject<T>:
//
//   template <>
//   struct GeoObject<Seg> {
//       using Ref = SegRef;
//       using MutRef = SegRefMut;
//       static Ref make_ref(const Seg& seg, const GeoIndex& index);
//       static MutRef make_mut_ref(const Seg& seg, GeoIndex& index);
//   };
//
// and each reference type R specialises UnRef<R> with the plain value it
// collapses back to. References carry identifiers plus a borrow, never
// resolved coordinates, so every query reads the index as it is now.
template <typename T>
struct GeoObject;

template <typename R>
struct UnRef;

// Read capability bound to a shared borrow of `index`
template <typename T>
typename GeoObject<T>::Ref make_ref(const T& obj, const GeoIndex& index) {
    return GeoObject<T>::make_ref(obj, index);
}

// Write capability bound to an exclusive borrow of `index`.
// Throws BorrowConflict if any other reference into `index` is alive.
template <typename T>
typename GeoObject<T>::MutRef make_mut_ref(const T& obj, GeoIndex& index) {
    return GeoObject<T>::make_mut_ref(obj, index);
}

// Drop the borrow and recover the identifier-only value
template <typename R>
typename UnRef<std::decay_t<R>>::Obj un_ref(R&& ref) {
    return UnRef<std::decay_t<R>>::un_ref(std::forward<R>(ref));
}

}  // namespace brep

#endif // BREPCORE_INDEX_GEO_OBJECT_HPP
