////////////////////////////////////////////////////////////////////////////////
// RefinableIcosahedron.hh
////////////////////////////////////////////////////////////////////////////////
/*! @file
//      A triangulated sphere obtained by repeatedly splitting the faces of a
//      regular icosahedron and projecting the new vertices onto the sphere.
//
//      The twelve icosahedron vertices keep indices 0..11 through every
//      refinement pass; new vertices are appended in the order their edges
//      are first visited. All triangles are oriented counterclockwise when
//      viewed from outside the sphere.
*/
////////////////////////////////////////////////////////////////////////////////
#ifndef REFINABLEICOSAHEDRON_HH
#define REFINABLEICOSAHEDRON_HH

#include <IcoDual/Types.hh>
#include <IcoDual/EdgeKey.hh>

#include <map>
#include <vector>

class ICODUAL_EXPORT RefinableIcosahedron {
public:
    static constexpr size_t NUM_BASE_VERTICES  = 12;
    static constexpr size_t NUM_BASE_TRIANGLES = 20;

    // Throws if radius is not positive and finite.
    RefinableIcosahedron(Real radius = 1.0);

    // Split every triangle into four, levels times.
    void refine(size_t levels = 1);

    Real radius() const { return m_radius; }
    size_t refinementLevel() const { return m_level; }

    const std::vector<Point3D>      &vertices()  const { return m_vertices; }
    const std::vector<IndexTriplet> &triangles() const { return m_triangles; }

    size_t numVertices()  const { return m_vertices.size(); }
    size_t numTriangles() const { return m_triangles.size(); }

    // Entity counts after a given number of refinement passes.
    static size_t numVerticesAtLevel (size_t level) { return 10 * (size_t(1) << (2 * level)) + 2; }
    static size_t numTrianglesAtLevel(size_t level) { return 20 * (size_t(1) << (2 * level)); }
    static size_t numEdgesAtLevel    (size_t level) { return 30 * (size_t(1) << (2 * level)); }

private:
    // Add p (projected onto the sphere) and return its index.
    int m_addVertex(const Point3D &p);

    // Index of the (projected) midpoint of edge (a, b), created on demand.
    int m_midpoint(int a, int b);

    Real m_radius;
    size_t m_level = 0;
    std::vector<Point3D>      m_vertices;
    std::vector<IndexTriplet> m_triangles;

    // Midpoint vertex for each edge split during the current pass.
    std::map<EdgeKey, int> m_midpointCache;
};

#endif /* end of include guard: REFINABLEICOSAHEDRON_HH */
