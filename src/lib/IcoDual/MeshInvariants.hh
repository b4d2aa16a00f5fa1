////////////////////////////////////////////////////////////////////////////////
// MeshInvariants.hh
////////////////////////////////////////////////////////////////////////////////
/*! @file
//      Consistency checks for a constructed DualIcosphere:
//        - primal/dual bijections (faces = links, cells = nodes,
//          corners = patches)
//        - valences: every node has 5 or 6 links, exactly 12 have 5, and
//          the valences sum to twice the link count
//        - link and corner slot tables agree on each node's valence
//        - corners lie on the sphere
//        - each face joins two distinct corners and has positive length
//        - corners around each node have strictly increasing local angles
//        - the exact cell areas sum to the sphere's surface area
*/
////////////////////////////////////////////////////////////////////////////////
#ifndef MESHINVARIANTS_HH
#define MESHINVARIANTS_HH

#include <IcoDual/DualIcosphere.hh>
#include <string>
#include <vector>

// Returns a description of each violated invariant (empty if none).
// tol is a relative tolerance on lengths and areas.
ICODUAL_EXPORT std::vector<std::string>
checkInvariants(const DualIcosphere &mesh, Real tol = 1e-9);

#endif /* end of include guard: MESHINVARIANTS_HH */
