#include <IcoDual/DualIcosphere.hh>
#include <IcoDual/RefinableIcosahedron.hh>
#include <IcoDual/EdgeKey.hh>
#include <IcoDual/GlobalBenchmark.hh>
#include <IcoDual/utils.hh>

#include <algorithm>
#include <cmath>
#include <iostream>
#include <map>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>

DualIcosphere::DualIcosphere(Real radius, size_t meshDensificationLevel, bool verbose)
    : m_radius(radius), m_verbose(verbose)
{
    RefinableIcosahedron ico(radius);
    if (meshDensificationLevel > 0)
        ico.refine(meshDensificationLevel);
    if (m_verbose) {
        std::cout << "Refined icosahedron to level " << meshDensificationLevel << ": "
                  << ico.numVertices() << " vertices, "
                  << ico.numTriangles() << " triangles" << std::endl;
    }
    m_build(ico.vertices(), ico.triangles());
}

DualIcosphere::DualIcosphere(const std::vector<Point3D> &vertices,
                             const std::vector<IndexTriplet> &triangles,
                             Real radius, bool verbose)
    : m_radius(radius), m_verbose(verbose)
{
    m_build(vertices, triangles);
}

void DualIcosphere::m_build(const std::vector<Point3D> &vertices,
                            const std::vector<IndexTriplet> &triangles) {
    BENCHMARK_SCOPED_TIMER_SECTION timer("Build dual icosphere");
    m_validateInput(vertices, triangles);
    m_setupNodes(vertices);
    m_setupLinks(triangles);
    m_setupPatchesAndCorners(triangles);
    m_setupFaces();
    m_setupCells();

    if (m_verbose) {
        std::cout << "Dual icosphere: "
                  << numNodes()   << " nodes/cells, "
                  << numLinks()   << " links/faces, "
                  << numPatches() << " patches/corners" << std::endl;
    }
}

////////////////////////////////////////////////////////////////////////////////
// Input validation
////////////////////////////////////////////////////////////////////////////////
void DualIcosphere::m_validateInput(const std::vector<Point3D> &vertices,
                                    const std::vector<IndexTriplet> &triangles) const {
    if (!(m_radius > 0) || !std::isfinite(m_radius))
        throw std::runtime_error("Icosphere radius must be positive and finite (got "
                                 + std::to_string(m_radius) + ")");
    if (vertices.empty() || triangles.empty())
        throw std::runtime_error("Empty vertex or triangle list");

    for (size_t i = 0; i < vertices.size(); ++i) {
        const Real r = vertices[i].norm();
        if (!std::isfinite(r) || (std::abs(r - m_radius) > 1e-9 * m_radius)) {
            std::stringstream ss;
            ss << "Vertex " << i << " " << vertices[i].format(pointFormatter)
               << " does not lie on the sphere of radius " << m_radius;
            throw std::runtime_error(ss.str());
        }
    }

    const int nv = int(vertices.size());
    for (size_t t = 0; t < triangles.size(); ++t) {
        const auto &tri = triangles[t];
        for (int c = 0; c < 3; ++c) {
            if ((tri[c] < 0) || (tri[c] >= nv)) {
                throw std::runtime_error("Triangle " + std::to_string(t) + " references vertex "
                                         + std::to_string(tri[c]) + " outside [0, "
                                         + std::to_string(nv) + ")");
            }
        }
        if ((tri[0] == tri[1]) || (tri[1] == tri[2]) || (tri[2] == tri[0])) {
            throw std::runtime_error("Triangle " + std::to_string(t) + " has a repeated vertex ("
                                     + std::to_string(tri[0]) + ", " + std::to_string(tri[1])
                                     + ", " + std::to_string(tri[2]) + ")");
        }
    }
}

////////////////////////////////////////////////////////////////////////////////
// Primal mesh
////////////////////////////////////////////////////////////////////////////////
void DualIcosphere::m_setupNodes(const std::vector<Point3D> &vertices) {
    m_coordsOfNode = vertices;
}

void DualIcosphere::m_setupLinks(const std::vector<IndexTriplet> &triangles) {
    BENCHMARK_SCOPED_TIMER_SECTION timer("Links");

    // Register each triangle edge under its unordered key, keeping the
    // orientation and the link index of its first appearance.
    std::map<EdgeKey, size_t> linkForEdge;
    m_nodesAtLink.clear();
    m_nodesAtLink.reserve((3 * triangles.size()) / 2);
    for (const auto &tri : triangles) {
        for (int c = 0; c < 3; ++c) {
            const int tail = tri[c], head = tri[(c + 1) % 3];
            auto res = linkForEdge.emplace(EdgeKey(tail, head), m_nodesAtLink.size());
            if (res.second) m_nodesAtLink.push_back({{tail, head}});
        }
    }

    const size_t nn = numNodes(), nl = numLinks();
    m_linksAtNode.assign(nn, emptySlots());
    m_linkDirsAtNode.assign(nn, SlotArray());
    for (auto &dirs : m_linkDirsAtNode) dirs.fill(0);
    std::vector<size_t> numLinksAtNode(nn, 0);

    auto addLinkAtNode = [&](int node, size_t link, int dir) {
        size_t &slot = numLinksAtNode[node];
        if (slot >= MAX_VALENCE) {
            throw std::runtime_error("Node " + std::to_string(node) + " has more than "
                                     + std::to_string(MAX_VALENCE) + " incident links");
        }
        m_linksAtNode   [node][slot] = int(link);
        m_linkDirsAtNode[node][slot] = dir;
        ++slot;
    };

    m_lengthOfLink.resize(nl);
    for (size_t l = 0; l < nl; ++l) {
        const int tail = m_nodesAtLink[l][0], head = m_nodesAtLink[l][1];
        addLinkAtNode(tail, l, -1);
        addLinkAtNode(head, l,  1);
        m_lengthOfLink[l] = m_radius * arcLength(m_coordsOfNode[tail], m_coordsOfNode[head], m_radius);
    }

    for (size_t n = 0; n < nn; ++n) {
        if (numLinksAtNode[n] == 0)
            std::cerr << "WARNING: node " << n << " is not referenced by any triangle" << std::endl;
    }
}

////////////////////////////////////////////////////////////////////////////////
// Patches and corners
////////////////////////////////////////////////////////////////////////////////
void DualIcosphere::m_setupPatchesAndCorners(const std::vector<IndexTriplet> &triangles) {
    BENCHMARK_SCOPED_TIMER_SECTION timer("Patches and corners");

    m_nodesAtPatch = triangles;
    const size_t np = numPatches();

    // Corners are the outward unit normals of the patches, scaled to the sphere.
    m_coordsOfCorner.resize(np);
    for (size_t p = 0; p < np; ++p) {
        const auto &tri = m_nodesAtPatch[p];
        m_coordsOfCorner[p] = m_radius * unitTriangleNormal(m_coordsOfNode[tri[0]],
                                                            m_coordsOfNode[tri[1]],
                                                            m_coordsOfNode[tri[2]]);
    }

    // Corners at node in patch (discovery) order; sorted below.
    m_cornersAtNode.assign(numNodes(), emptySlots());
    std::vector<size_t> numCornersAtNode(numNodes(), 0);
    for (size_t p = 0; p < np; ++p) {
        for (int node : m_nodesAtPatch[p]) {
            size_t &slot = numCornersAtNode[node];
            if (slot >= MAX_VALENCE) {
                throw std::runtime_error("Node " + std::to_string(node) + " has more than "
                                         + std::to_string(MAX_VALENCE) + " incident patches");
            }
            m_cornersAtNode[node][slot++] = int(p);
        }
    }

    m_sortCornersCCW();
}

std::vector<Real> DualIcosphere::m_localCornerAngles(size_t node, const SlotArray &corners) const {
    const NodeSphericalCoords &sc = m_nodeSphericalCoords();
    const Real phi = sc.phi[node], theta = sc.theta[node];

    std::vector<Real> angles;
    angles.reserve(MAX_VALENCE);
    for (int c : corners) {
        if (c == INVALID_INDEX) break;
        // Bring the node to the +z pole; its corners then surround the pole.
        const Point3D rc = rotateZY(m_coordsOfCorner[c], -phi, -theta);
        Real ang = std::atan2(rc[1], rc[0]);
        if (ang < 0.0) ang += 2 * M_PI;
        // A tiny negative atan2 result rounds up to exactly 2 pi.
        if (ang >= 2 * M_PI) ang = 0.0;
        angles.push_back(ang);
    }
    return angles;
}

void DualIcosphere::m_sortCornersCCW() {
    BENCHMARK_SCOPED_TIMER_SECTION timer("Sort corners");

    std::vector<size_t> perm;
    for (size_t n = 0; n < numNodes(); ++n) {
        SlotArray &corners = m_cornersAtNode[n];
        sortPermutation(m_localCornerAngles(n, corners), perm);

        const SlotArray unsorted = corners;
        for (size_t i = 0; i < perm.size(); ++i)
            corners[i] = unsorted[perm[i]];
    }
}

////////////////////////////////////////////////////////////////////////////////
// Faces
////////////////////////////////////////////////////////////////////////////////
void DualIcosphere::m_setupFaces() {
    BENCHMARK_SCOPED_TIMER_SECTION timer("Faces");

    // Patches sharing each node pair, smaller patch index first.
    std::map<EdgeKey, IndexPair> patchesAtNodePair;
    for (size_t p = 0; p < numPatches(); ++p) {
        const auto &tri = m_nodesAtPatch[p];
        for (int j = 0; j < 3; ++j) {
            EdgeKey key(tri[(j + 2) % 3], tri[j]);
            auto res = patchesAtNodePair.emplace(key, IndexPair{{int(p), INVALID_INDEX}});
            if (res.second) continue;

            IndexPair &adj = res.first->second;
            if (adj[1] != INVALID_INDEX) {
                std::stringstream ss;
                ss << "Edge (" << key << ") is shared by more than two patches ("
                   << adj[0] << ", " << adj[1] << ", " << p << ")";
                throw std::runtime_error(ss.str());
            }
            adj = {{std::min(adj[0], int(p)), std::max(adj[0], int(p))}};
        }
    }

    const size_t nf = numLinks();
    m_cornersAtFace.resize(nf);
    m_lengthOfFace.resize(nf);
    for (size_t f = 0; f < nf; ++f) {
        const EdgeKey key(m_nodesAtLink[f][0], m_nodesAtLink[f][1]);
        auto it = patchesAtNodePair.find(key);
        if (it == patchesAtNodePair.end())
            throw std::runtime_error("Link " + std::to_string(f) + " belongs to no patch");
        const IndexPair &adj = it->second;
        if (adj[1] == INVALID_INDEX) {
            std::stringstream ss;
            ss << "Link " << f << " (" << key << ") is a boundary link: only patch "
               << adj[0] << " contains it; open meshes are unsupported";
            throw std::runtime_error(ss.str());
        }
        // Corner and patch numbering coincide.
        m_cornersAtFace[f] = adj;
        m_lengthOfFace[f] = m_radius * arcLength(m_coordsOfCorner[adj[0]],
                                                 m_coordsOfCorner[adj[1]], m_radius);
    }
}

////////////////////////////////////////////////////////////////////////////////
// Cells
////////////////////////////////////////////////////////////////////////////////
// The cell is split into wedges (node, corner k, corner k + 1), and the first
// wedge's area is replicated once per corner. This is exact for the regular
// cells of the unrefined icosahedron only; refined cells are approximated
// (see exactAreaOfCell()).
void DualIcosphere::m_setupCells() {
    BENCHMARK_SCOPED_TIMER_SECTION timer("Cells");

    const size_t nc = numNodes();
    m_areaOfCell.assign(nc, 0.0);
    for (size_t cell = 0; cell < nc; ++cell) {
        const SlotArray &corners = m_cornersAtNode[cell];
        const size_t numWedges = numValidSlots(corners);
        if (numWedges < 3) continue;
        const Real wedge = sphericalTriangleArea(m_coordsOfNode[cell],
                                                 m_coordsOfCorner[corners[0]],
                                                 m_coordsOfCorner[corners[1]], m_radius);
        m_areaOfCell[cell] = numWedges * wedge;
    }
}

////////////////////////////////////////////////////////////////////////////////
// Lazily computed quantities
////////////////////////////////////////////////////////////////////////////////
const DualIcosphere::NodeSphericalCoords &DualIcosphere::m_nodeSphericalCoords() const {
    if (!m_sphericalCoordsCache) {
        NodeSphericalCoords sc;
        const size_t nn = numNodes();
        sc.r.resize(nn), sc.phi.resize(nn), sc.theta.resize(nn);
        for (size_t n = 0; n < nn; ++n) {
            SphericalCoordinates s = cartesianToSpherical(m_coordsOfNode[n]);
            sc.r[n] = s.r, sc.phi[n] = s.phi, sc.theta[n] = s.theta;
        }
        m_sphericalCoordsCache = std::move(sc);
    }
    return *m_sphericalCoordsCache;
}

const std::vector<Real> &DualIcosphere::areaOfPatch() const {
    if (!m_areaOfPatchCache) {
        std::vector<Real> area(numPatches());
        for (size_t p = 0; p < numPatches(); ++p) {
            const auto &tri = m_nodesAtPatch[p];
            area[p] = sphericalTriangleArea(m_coordsOfNode[tri[0]], m_coordsOfNode[tri[1]],
                                            m_coordsOfNode[tri[2]], m_radius);
        }
        m_areaOfPatchCache = std::move(area);
    }
    return *m_areaOfPatchCache;
}

const std::vector<Real> &DualIcosphere::exactAreaOfCell() const {
    if (!m_exactAreaOfCellCache) {
        std::vector<Real> area(numCells(), 0.0);
        for (size_t cell = 0; cell < numCells(); ++cell) {
            const SlotArray &corners = m_cornersAtNode[cell];
            const size_t nc = numValidSlots(corners);
            if (nc < 3) continue;
            for (size_t k = 0; k < nc; ++k) {
                area[cell] += sphericalTriangleArea(m_coordsOfNode[cell],
                                                    m_coordsOfCorner[corners[k]],
                                                    m_coordsOfCorner[corners[(k + 1) % nc]],
                                                    m_radius);
            }
        }
        m_exactAreaOfCellCache = std::move(area);
    }
    return *m_exactAreaOfCellCache;
}

std::vector<Real> DualIcosphere::cornerAnglesAtNode(size_t node) const {
    return m_localCornerAngles(node, m_cornersAtNode.at(node));
}

int DualIcosphere::m_checkedIndex(size_t i, size_t n) {
    if (i >= n)
        throw std::runtime_error("Index " + std::to_string(i) + " out of range [0, "
                                 + std::to_string(n) + ")");
    return int(i);
}
