#include <IcoDual/RefinableIcosahedron.hh>
#include <IcoDual/GlobalBenchmark.hh>

#include <cmath>
#include <stdexcept>
#include <string>

RefinableIcosahedron::RefinableIcosahedron(Real radius)
    : m_radius(radius)
{
    if (!(radius > 0) || !std::isfinite(radius))
        throw std::runtime_error("Icosphere radius must be positive and finite (got "
                                 + std::to_string(radius) + ")");

    const Real t = 0.5 * (1.0 + std::sqrt(5.0)); // golden ratio

    m_vertices.reserve(NUM_BASE_VERTICES);
    m_addVertex(Point3D(-1,  t,  0));
    m_addVertex(Point3D( 1,  t,  0));
    m_addVertex(Point3D(-1, -t,  0));
    m_addVertex(Point3D( 1, -t,  0));

    m_addVertex(Point3D( 0, -1,  t));
    m_addVertex(Point3D( 0,  1,  t));
    m_addVertex(Point3D( 0, -1, -t));
    m_addVertex(Point3D( 0,  1, -t));

    m_addVertex(Point3D( t,  0, -1));
    m_addVertex(Point3D( t,  0,  1));
    m_addVertex(Point3D(-t,  0, -1));
    m_addVertex(Point3D(-t,  0,  1));

    m_triangles = {
        // 5 triangles around vertex 0
        {{ 0, 11,  5}}, {{ 0,  5,  1}}, {{ 0,  1,  7}}, {{ 0,  7, 10}}, {{ 0, 10, 11}},
        // 5 adjacent triangles
        {{ 1,  5,  9}}, {{ 5, 11,  4}}, {{11, 10,  2}}, {{10,  7,  6}}, {{ 7,  1,  8}},
        // 5 triangles around vertex 3
        {{ 3,  9,  4}}, {{ 3,  4,  2}}, {{ 3,  2,  6}}, {{ 3,  6,  8}}, {{ 3,  8,  9}},
        // 5 adjacent triangles
        {{ 4,  9,  5}}, {{ 2,  4, 11}}, {{ 6,  2, 10}}, {{ 8,  6,  7}}, {{ 9,  8,  1}}
    };
}

int RefinableIcosahedron::m_addVertex(const Point3D &p) {
    m_vertices.push_back((m_radius / p.norm()) * p);
    return int(m_vertices.size()) - 1;
}

int RefinableIcosahedron::m_midpoint(int a, int b) {
    auto it = m_midpointCache.lower_bound(EdgeKey(a, b));
    if ((it != m_midpointCache.end()) && (it->first == EdgeKey(a, b)))
        return it->second;

    // Copy first: m_addVertex may reallocate m_vertices.
    Point3D midpt = m_vertices[a];
    midpt += m_vertices[b];
    midpt *= 0.5;
    const int idx = m_addVertex(midpt);
    m_midpointCache.emplace_hint(it, EdgeKey(a, b), idx);
    return idx;
}

void RefinableIcosahedron::refine(size_t levels) {
    BENCHMARK_SCOPED_TIMER_SECTION timer("Refine icosahedron");

    for (size_t l = 0; l < levels; ++l) {
        /*         v2                   v2
        //         +                    +
        //        / \                  / \
        //       /   \      ===>      / 2 \
        //      /     \           v5 +-----+ v4
        //     /       \            / \ 3 / \
        //    /         \          / 0 \ / 1 \
        //   +-----------+        +-----+-----+
        // v0             v1    v0      v3     v1
        */
        static const unsigned char subCorners[4][3] = { {0, 3, 5}, {1, 4, 3}, {2, 5, 4}, {3, 4, 5} };

        m_midpointCache.clear();
        m_vertices.reserve(m_vertices.size() + (3 * m_triangles.size()) / 2);

        std::vector<IndexTriplet> subTriangles;
        subTriangles.reserve(4 * m_triangles.size());
        for (const auto &tri : m_triangles) {
            int cornerIdx[6];
            for (int i = 0; i < 3; ++i) {
                cornerIdx[    i] = tri[i];
                cornerIdx[3 + i] = m_midpoint(tri[i], tri[(i + 1) % 3]);
            }
            for (int i = 0; i < 4; ++i) {
                IndexTriplet subTri;
                for (int c = 0; c < 3; ++c)
                    subTri[c] = cornerIdx[subCorners[i][c]];
                subTriangles.push_back(subTri);
            }
        }
        m_triangles.swap(subTriangles);
        ++m_level;
    }
    m_midpointCache.clear();
}
