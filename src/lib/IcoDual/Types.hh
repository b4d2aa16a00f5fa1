////////////////////////////////////////////////////////////////////////////////
// Types.hh
////////////////////////////////////////////////////////////////////////////////
/*! @file
//      Scalar, point and index-table types shared by the whole library.
*/
////////////////////////////////////////////////////////////////////////////////
#ifndef TYPES_HH
#define TYPES_HH

#include <Eigen/Dense>
#include <array>
#include <vector>
#include <IcoDual_export.h>

typedef double Real;

template<size_t N>
using VectorND = Eigen::Matrix<Real, N, 1, Eigen::ColMajor, N, 1>;
template<size_t N>
using PointND = VectorND<N>;

typedef  PointND<3>  Point3D;
typedef VectorND<3> Vector3D;

ICODUAL_EXPORT extern Eigen::IOFormat pointFormatter;

////////////////////////////////////////////////////////////////////////////////
// Fixed-width index tables.
// Every node has room for MAX_VALENCE incident links/corners; unused slots
// hold INVALID_INDEX. Pentagonal cells are recognized by their one sentinel.
////////////////////////////////////////////////////////////////////////////////
constexpr int    INVALID_INDEX = -1;
constexpr size_t MAX_VALENCE   = 6;

using SlotArray    = std::array<int, MAX_VALENCE>;
using IndexPair    = std::array<int, 2>;
using IndexTriplet = std::array<int, 3>;

inline SlotArray emptySlots() {
    SlotArray s;
    s.fill(INVALID_INDEX);
    return s;
}

// Number of valid (non-sentinel) entries of a slot array.
inline size_t numValidSlots(const SlotArray &s) {
    size_t n = 0;
    for (int v : s) n += (v != INVALID_INDEX);
    return n;
}

#endif /* end of include guard: TYPES_HH */
