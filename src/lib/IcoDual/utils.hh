////////////////////////////////////////////////////////////////////////////////
// utils.hh
////////////////////////////////////////////////////////////////////////////////
/*! @file
//      Various useful utilities and algorithms
*/
////////////////////////////////////////////////////////////////////////////////
#ifndef UTILS_HH
#define UTILS_HH

#include <algorithm>
#include <stdexcept>
#include <string>
#include <vector>

////////////////////////////////////////////////////////////////////////////////
/*! Generate a permutation that puts a collection of values in sorted order:
//      p[i] gives index of i^th entry in sorted list;
//      values[p] is sorted.
//  The sort is stable: equal values keep their relative order.
//  @param[in]  values      values to sort
//  @param[out] p           sorting permutation
//  @param[in]  descend     when true, sort is descending (default to ascending)
*///////////////////////////////////////////////////////////////////////////////
template<typename Container>
void sortPermutation(const Container &values, std::vector<size_t> &p,
                     bool descend = false)
{
    p.clear();
    p.reserve(values.size());
    for (size_t i = 0; i < values.size(); ++i)
        p.push_back(i);

    std::stable_sort(p.begin(), p.end(), [&values, descend](size_t a, size_t b) -> bool {
            return descend ? (values[b] < values[a]) : (values[a] < values[b]); });
}

template<typename Container>
std::vector<size_t> sortPermutation(const Container &values,
                                    bool descend = false) {
    std::vector<size_t> result;
    sortPermutation(values, result, descend);
    return result;
}

////////////////////////////////////////////////////////////////////////////////
/*! Summary statistics of a nonempty array.
//  Median is slighly incorrect for arrays of even length: the upper element
//  of the pair at the middle is returned instead of the pair's average.
*///////////////////////////////////////////////////////////////////////////////
template<typename Real>
struct ArrayStats {
    Real min, median, max;
};

template<typename Real>
ArrayStats<Real> arrayStats(std::vector<Real> values) {
    if (values.empty()) throw std::runtime_error("arrayStats: empty array");
    ArrayStats<Real> s;
    s.min = *std::min_element(values.begin(), values.end());
    s.max = *std::max_element(values.begin(), values.end());
    size_t n = values.size() / 2;
    std::nth_element(values.begin(), values.begin() + n, values.end());
    s.median = values[n];
    return s;
}

////////////////////////////////////////////////////////////////////////////
/*! Get the file extension for a path.
//  @param[in]  path
//  @return     file extension including initial period.
*///////////////////////////////////////////////////////////////////////////
inline std::string fileExtension(const std::string &path) {
    size_t last = path.find_last_of('.');
    return (last == std::string::npos) ? "" : path.substr(last);
}

#endif // UTILS_HH
