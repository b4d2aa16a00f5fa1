////////////////////////////////////////////////////////////////////////////////
// EdgeKey.hh
////////////////////////////////////////////////////////////////////////////////
/*! @file
//      Orientation-independent key of the edge joining two nodes. Keys the
//      link registry, the refinement's midpoint cache and the patch
//      adjacency map, so that (a, b) and (b, a) land in the same entry.
*/
////////////////////////////////////////////////////////////////////////////////
#ifndef EDGEKEY_HH
#define EDGEKEY_HH

#include <IcoDual/Types.hh>

#include <algorithm>
#include <iostream>

struct EdgeKey {
    EdgeKey(int a, int b) : nodes{{std::min(a, b), std::max(a, b)}} { }

    int lo() const { return nodes[0]; }
    int hi() const { return nodes[1]; }

    bool operator==(const EdgeKey &b) const { return nodes == b.nodes; }
    bool operator!=(const EdgeKey &b) const { return nodes != b.nodes; }
    bool operator< (const EdgeKey &b) const { return nodes <  b.nodes; }

    friend std::ostream &operator<<(std::ostream &os, const EdgeKey &e) {
        return os << e.lo() << ", " << e.hi();
    }

    // (lo, hi)
    IndexPair nodes;
};

#endif /* end of include guard: EDGEKEY_HH */
