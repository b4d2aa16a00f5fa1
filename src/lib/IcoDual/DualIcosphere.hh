////////////////////////////////////////////////////////////////////////////////
// DualIcosphere.hh
////////////////////////////////////////////////////////////////////////////////
/*! @file
//  A quasi-uniform spherical mesh made of two interlocking complexes: the
//  primal triangulation of a refined icosahedron and its dual polygonal
//  (pentagon/hexagon) tessellation.
//
//  Primal entities        Dual entities
//      node   (vertex)        cell   (polygon around the node)
//      link   (edge)          face   (edge crossing the link)
//      patch  (triangle)      corner (vertex at the patch's normal)
//
//  The dual complex shares the primal index space: cell i is node i, face j
//  is link j and corner k is patch k. Only the dual geometry (corner
//  coordinates, face lengths, cell areas) and the per-node corner ordering
//  are stored separately.
//
//  Per-node adjacency is stored in fixed-width slot arrays of MAX_VALENCE
//  entries padded with INVALID_INDEX (see Types.hh). Every table is computed
//  once, at construction, and the mesh is immutable afterwards. A few derived
//  quantities (spherical node coordinates, patch areas, exact cell areas) are
//  computed on first access and then cached.
//
//  Link orientation is the orientation in which the link was first seen while
//  scanning the triangle list; link_dirs_at_node is -1 where the node is the
//  link's tail and +1 where it is the head (0 in padding slots).
*/
////////////////////////////////////////////////////////////////////////////////
#ifndef DUALICOSPHERE_HH
#define DUALICOSPHERE_HH

#include <IcoDual/Types.hh>
#include <IcoDual/SphericalGeometry.hh>

#include <boost/optional.hpp>
#include <vector>

class ICODUAL_EXPORT DualIcosphere {
public:
    ////////////////////////////////////////////////////////////////////////////
    /*! Build the dual mesh of an icosahedron refined meshDensificationLevel
    //  times and projected onto the sphere of the given radius.
    //  @param[in]  radius                  sphere radius (> 0)
    //  @param[in]  meshDensificationLevel  number of 1-to-4 triangle splits
    //  @param[in]  verbose                 report construction progress on stdout
    *///////////////////////////////////////////////////////////////////////////
    DualIcosphere(Real radius = 1.0, size_t meshDensificationLevel = 0,
                  bool verbose = false);

    ////////////////////////////////////////////////////////////////////////////
    /*! Build the dual mesh of an arbitrary closed, consistently oriented
    //  triangulation of the sphere of the given radius.
    //  Throws std::runtime_error on malformed input (index out of range,
    //  repeated triangle vertex, vertex off the sphere, valence above
    //  MAX_VALENCE, edge shared by more than two triangles, boundary edge,
    //  degenerate triangle).
    *///////////////////////////////////////////////////////////////////////////
    DualIcosphere(const std::vector<Point3D> &vertices,
                  const std::vector<IndexTriplet> &triangles,
                  Real radius, bool verbose = false);

    Real radius() const { return m_radius; }

    size_t numNodes()   const { return m_coordsOfNode.size(); }
    size_t numLinks()   const { return m_nodesAtLink.size(); }
    size_t numPatches() const { return m_nodesAtPatch.size(); }
    size_t numCorners() const { return m_coordsOfCorner.size(); }
    size_t numFaces()   const { return m_cornersAtFace.size(); }
    size_t numCells()   const { return m_areaOfCell.size(); }

    // Number of links (equivalently corners) incident on a node: 5 or 6 for
    // icosahedral meshes.
    size_t valence(size_t node) const { return numValidSlots(m_linksAtNode.at(node)); }

    ////////////////////////////////////////////////////////////////////////////
    // Primal tables
    ////////////////////////////////////////////////////////////////////////////
    const std::vector<Point3D>      &coordsOfNode()   const { return m_coordsOfNode; }
    const std::vector<IndexPair>    &nodesAtLink()    const { return m_nodesAtLink; }
    const std::vector<Real>         &lengthOfLink()   const { return m_lengthOfLink; }
    const std::vector<SlotArray>    &linksAtNode()    const { return m_linksAtNode; }
    const std::vector<SlotArray>    &linkDirsAtNode() const { return m_linkDirsAtNode; }
    const std::vector<IndexTriplet> &nodesAtPatch()   const { return m_nodesAtPatch; }

    int nodeAtLinkTail(size_t link) const { return m_nodesAtLink.at(link)[0]; }
    int nodeAtLinkHead(size_t link) const { return m_nodesAtLink.at(link)[1]; }

    ////////////////////////////////////////////////////////////////////////////
    // Dual tables
    ////////////////////////////////////////////////////////////////////////////
    const std::vector<Point3D>   &coordsOfCorner() const { return m_coordsOfCorner; }
    // Counterclockwise (seen from outside the sphere) around each node.
    const std::vector<SlotArray> &cornersAtNode()  const { return m_cornersAtNode; }
    const std::vector<IndexPair> &cornersAtFace()  const { return m_cornersAtFace; }
    const std::vector<Real>      &lengthOfFace()   const { return m_lengthOfFace; }
    // Wedge-replication estimate (one wedge area times the cell valence).
    const std::vector<Real>      &areaOfCell()     const { return m_areaOfCell; }

    ////////////////////////////////////////////////////////////////////////////
    // Cross-complex identities
    ////////////////////////////////////////////////////////////////////////////
    int  cellAtNode(size_t node) const { return m_checkedIndex(node, numNodes()); }
    int  nodeAtCell(size_t cell) const { return m_checkedIndex(cell, numCells()); }
    int  faceAtLink(size_t link) const { return m_checkedIndex(link, numLinks()); }
    int  linkAtFace(size_t face) const { return m_checkedIndex(face, numFaces()); }
    int cornerAtPatch(size_t patch) const { return m_checkedIndex(patch, numPatches()); }

    const std::vector<SlotArray> &patchesAtNode() const { return m_cornersAtNode; }
    const std::vector<SlotArray> &cornersAtCell() const { return m_cornersAtNode; }
    const std::vector<SlotArray> &facesAtCell()   const { return m_linksAtNode; }

    ////////////////////////////////////////////////////////////////////////////
    // Lazily computed quantities
    ////////////////////////////////////////////////////////////////////////////
    const std::vector<Real> &rOfNode()     const { return m_nodeSphericalCoords().r; }
    const std::vector<Real> &phiOfNode()   const { return m_nodeSphericalCoords().phi; }
    const std::vector<Real> &thetaOfNode() const { return m_nodeSphericalCoords().theta; }

    // Spherical triangle area of each patch.
    const std::vector<Real> &areaOfPatch() const;

    // Cell areas summed over all wedges (node, corner k, corner k + 1);
    // these tile the sphere exactly.
    const std::vector<Real> &exactAreaOfCell() const;

    ////////////////////////////////////////////////////////////////////////////
    /*! Angle of each corner of a node, in [0, 2 pi), measured in the local
    //  frame obtained by rotating the node onto the +z axis.
    //  Returned in the order the corners are stored in cornersAtNode().
    *///////////////////////////////////////////////////////////////////////////
    std::vector<Real> cornerAnglesAtNode(size_t node) const;

private:
    struct NodeSphericalCoords {
        std::vector<Real> r, phi, theta;
    };

    // Construction pipeline; each stage only writes its own tables.
    void m_build(const std::vector<Point3D> &vertices,
                 const std::vector<IndexTriplet> &triangles);
    void m_validateInput(const std::vector<Point3D> &vertices,
                         const std::vector<IndexTriplet> &triangles) const;
    void m_setupNodes(const std::vector<Point3D> &vertices);
    void m_setupLinks(const std::vector<IndexTriplet> &triangles);
    void m_setupPatchesAndCorners(const std::vector<IndexTriplet> &triangles);
    void m_sortCornersCCW();
    void m_setupFaces();
    void m_setupCells();

    std::vector<Real> m_localCornerAngles(size_t node, const SlotArray &corners) const;
    const NodeSphericalCoords &m_nodeSphericalCoords() const;
    static int m_checkedIndex(size_t i, size_t n);

    Real m_radius;
    bool m_verbose;

    std::vector<Point3D>      m_coordsOfNode;
    std::vector<IndexPair>    m_nodesAtLink;
    std::vector<Real>         m_lengthOfLink;
    std::vector<SlotArray>    m_linksAtNode;
    std::vector<SlotArray>    m_linkDirsAtNode;
    std::vector<IndexTriplet> m_nodesAtPatch;

    std::vector<Point3D>   m_coordsOfCorner;
    std::vector<SlotArray> m_cornersAtNode;
    std::vector<IndexPair> m_cornersAtFace;
    std::vector<Real>      m_lengthOfFace;
    std::vector<Real>      m_areaOfCell;

    // Memoized on first access (geometry never changes after construction).
    mutable boost::optional<NodeSphericalCoords> m_sphericalCoordsCache;
    mutable boost::optional<std::vector<Real>>   m_areaOfPatchCache;
    mutable boost::optional<std::vector<Real>>   m_exactAreaOfCellCache;
};

#endif /* end of include guard: DUALICOSPHERE_HH */
