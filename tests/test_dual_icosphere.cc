#include <catch2/catch.hpp>
#include <IcoDual/DualIcosphere.hh>
#include <IcoDual/RefinableIcosahedron.hh>

#include <algorithm>
#include <cmath>
#include <numeric>
#include <stdexcept>
#include <vector>

static Real sum(const std::vector<Real> &values) {
    return std::accumulate(values.begin(), values.end(), Real(0));
}

static SlotArray slots(std::initializer_list<int> entries) {
    SlotArray s = emptySlots();
    std::copy(entries.begin(), entries.end(), s.begin());
    return s;
}

// Regular octahedron: a closed triangulation with valence-4 nodes.
static void octahedron(std::vector<Point3D> &vertices, std::vector<IndexTriplet> &triangles) {
    vertices = { Point3D( 1, 0, 0), Point3D(-1, 0, 0),
                 Point3D( 0, 1, 0), Point3D( 0,-1, 0),
                 Point3D( 0, 0, 1), Point3D( 0, 0,-1) };
    triangles = { {{0, 2, 4}}, {{2, 1, 4}}, {{1, 3, 4}}, {{3, 0, 4}},
                  {{2, 0, 5}}, {{1, 2, 5}}, {{3, 1, 5}}, {{0, 3, 5}} };
}

TEST_CASE("unrefined dual icosphere", "[dual_icosphere]") {
    DualIcosphere mesh;

    SECTION("Counts") {
        REQUIRE(mesh.radius() == 1.0);
        REQUIRE(mesh.numNodes()   == 12);
        REQUIRE(mesh.numLinks()   == 30);
        REQUIRE(mesh.numPatches() == 20);
        REQUIRE(mesh.numCorners() == 20);
        REQUIRE(mesh.numFaces()   == 30);
        REQUIRE(mesh.numCells()   == 12);
        for (size_t n = 0; n < mesh.numNodes(); ++n)
            REQUIRE(mesh.valence(n) == 5);
        REQUIRE(mesh.nodesAtPatch()[0] == IndexTriplet{{0, 11, 5}});
    }

    SECTION("Links") {
        const auto &nal = mesh.nodesAtLink();
        REQUIRE(nal[0] == IndexPair{{ 0, 11}});
        REQUIRE(nal[1] == IndexPair{{11,  5}});
        REQUIRE(nal[2] == IndexPair{{ 5,  0}});
        REQUIRE(nal[3] == IndexPair{{ 5,  1}});
        REQUIRE(nal[4] == IndexPair{{ 1,  0}});
        REQUIRE(nal[5] == IndexPair{{ 1,  7}});
        REQUIRE(mesh.nodeAtLinkTail(2) == 5);
        REQUIRE(mesh.nodeAtLinkHead(2) == 0);

        // All edges of the regular icosahedron subtend atan(2).
        REQUIRE(mesh.lengthOfLink()[0] == Approx(1.1071487177940904));
        for (Real l : mesh.lengthOfLink())
            REQUIRE(l == Approx(std::atan(2.0)));

        REQUIRE(mesh.linksAtNode()[0]    == slots({ 0, 2, 4, 6, 8}));
        REQUIRE(mesh.linkDirsAtNode()[0] == SlotArray{{-1, 1, 1, 1, 1, 0}});
    }

    SECTION("Link directions") {
        for (size_t n = 0; n < mesh.numNodes(); ++n) {
            for (size_t k = 0; k < MAX_VALENCE; ++k) {
                int link = mesh.linksAtNode()[n][k];
                int dir  = mesh.linkDirsAtNode()[n][k];
                if (link == INVALID_INDEX) { REQUIRE(dir == 0); continue; }
                if (dir < 0) REQUIRE(mesh.nodeAtLinkTail(link) == int(n));
                else         REQUIRE(mesh.nodeAtLinkHead(link) == int(n));
            }
        }
    }

    SECTION("Corners") {
        const Point3D &c1 = mesh.coordsOfCorner()[1];
        REQUIRE(c1[0] == Approx(0.0).margin(1e-15));
        REQUIRE(c1[1] == Approx(0.9341723589627157));
        REQUIRE(c1[2] == Approx(0.3568220897730899));
        for (const auto &c : mesh.coordsOfCorner())
            REQUIRE(c.norm() == Approx(1.0));
    }

    SECTION("Counterclockwise corner order") {
        const std::vector<SlotArray> expected = {
            slots({ 3,  4,  0,  1,  2}), slots({ 2,  1,  5, 19,  9}),
            slots({12, 11, 16,  7, 17}), slots({13, 14, 10, 11, 12}),
            slots({11, 10, 15,  6, 16}), slots({ 1,  0,  6, 15,  5}),
            slots({18, 13, 12, 17,  8}), slots({ 8,  3,  2,  9, 18}),
            slots({18,  9, 19, 14, 13}), slots({19,  5, 15, 10, 14}),
            slots({ 8, 17,  7,  4,  3}), slots({ 7, 16,  6,  0,  4}) };
        REQUIRE(mesh.cornersAtNode() == expected);
    }

    SECTION("Faces") {
        REQUIRE(mesh.cornersAtFace()[0] == IndexPair{{0, 4}});
        REQUIRE(mesh.lengthOfFace()[0] == Approx(0.7297276562269666));
        for (const auto &cf : mesh.cornersAtFace())
            REQUIRE(cf[0] < cf[1]);
        for (Real l : mesh.lengthOfFace())
            REQUIRE(l == Approx(0.7297276562269666));
    }

    SECTION("Cells") {
        for (Real a : mesh.areaOfCell())
            REQUIRE(a == Approx(4 * M_PI / 12));
        REQUIRE(mesh.areaOfCell()[0] == Approx(1.0471975511965972));
        REQUIRE(sum(mesh.areaOfCell()) == Approx(4 * M_PI));
        REQUIRE(sum(mesh.exactAreaOfCell()) == Approx(4 * M_PI));
    }
}

TEST_CASE("dual icosphere adjacency", "[dual_icosphere]") {
    DualIcosphere mesh(1.0, 1);

    SECTION("Identity maps") {
        REQUIRE(mesh.cellAtNode(5) == 5);
        REQUIRE(mesh.nodeAtCell(41) == 41);
        REQUIRE(mesh.faceAtLink(119) == 119);
        REQUIRE(mesh.linkAtFace(0) == 0);
        REQUIRE(mesh.cornerAtPatch(79) == 79);
        REQUIRE_THROWS_AS(mesh.cellAtNode(42), std::runtime_error);
        REQUIRE_THROWS_AS(mesh.linkAtFace(120), std::runtime_error);
        REQUIRE_THROWS_AS(mesh.cornerAtPatch(80), std::runtime_error);

        REQUIRE(&mesh.patchesAtNode() == &mesh.cornersAtNode());
        REQUIRE(&mesh.cornersAtCell() == &mesh.cornersAtNode());
        REQUIRE(&mesh.facesAtCell()   == &mesh.linksAtNode());
    }

    SECTION("Every patch is a corner of its three nodes") {
        for (size_t p = 0; p < mesh.numPatches(); ++p) {
            for (int n : mesh.nodesAtPatch()[p]) {
                const auto &c = mesh.cornersAtNode()[n];
                REQUIRE(std::count(c.begin(), c.end(), int(p)) == 1);
            }
        }
    }

    SECTION("Faces join the patches sharing their link") {
        for (size_t f = 0; f < mesh.numFaces(); ++f) {
            const int a = mesh.nodeAtLinkTail(f), b = mesh.nodeAtLinkHead(f);
            for (int p : mesh.cornersAtFace()[f]) {
                const auto &tri = mesh.nodesAtPatch()[p];
                REQUIRE(std::count(tri.begin(), tri.end(), a) == 1);
                REQUIRE(std::count(tri.begin(), tri.end(), b) == 1);
            }
        }
    }

    SECTION("Sentinel padding") {
        size_t numPentagons = 0;
        for (size_t n = 0; n < mesh.numNodes(); ++n) {
            const size_t v = mesh.valence(n);
            REQUIRE(((v == 5) || (v == 6)));
            numPentagons += (v == 5);
            // Pentagons are exactly the vertices of the base icosahedron.
            REQUIRE((v == 5) == (n < 12));
            // Valid entries come first.
            for (size_t k = 0; k < MAX_VALENCE; ++k) {
                REQUIRE((mesh.cornersAtNode()[n][k] == INVALID_INDEX) == (k >= v));
                REQUIRE((mesh.linksAtNode()  [n][k] == INVALID_INDEX) == (k >= v));
            }
        }
        REQUIRE(numPentagons == 12);
    }
}

TEST_CASE("refined dual icosphere", "[dual_icosphere]") {
    SECTION("Level 1") {
        DualIcosphere mesh(1.0, 1);
        REQUIRE(mesh.numNodes()   == 42);
        REQUIRE(mesh.numLinks()   == 120);
        REQUIRE(mesh.numPatches() == 80);
        REQUIRE(mesh.cornersAtNode()[0] == slots({12, 16, 0, 4, 8}));
        REQUIRE(mesh.areaOfCell()[0] == Approx(0.2738442177482583));
        REQUIRE(mesh.exactAreaOfCell()[0] == Approx(0.273844217748258));
        // Hexagonal cells are not regular: the wedge estimate differs.
        REQUIRE(mesh.areaOfCell()[12] == Approx(0.2997054694200483));
        REQUIRE(mesh.exactAreaOfCell()[12] == Approx(0.3093413333793357));

        REQUIRE(sum(mesh.areaOfCell()) / (4 * M_PI) == Approx(0.9953992138597555));
        REQUIRE(sum(mesh.exactAreaOfCell()) == Approx(4 * M_PI));
    }

    SECTION("Levels 2 and 3") {
        const size_t nodes[]   = { 162, 642 };
        const size_t links[]   = { 480, 1920 };
        const size_t patches[] = { 320, 1280 };
        const Real approxRatio[] = { 0.9940006728588331, 0.9922324250457288 };
        for (size_t i = 0; i < 2; ++i) {
            DualIcosphere mesh(1.0, i + 2);
            REQUIRE(mesh.numNodes()   == nodes[i]);
            REQUIRE(mesh.numLinks()   == links[i]);
            REQUIRE(mesh.numPatches() == patches[i]);
            REQUIRE(sum(mesh.areaOfCell()) / (4 * M_PI) == Approx(approxRatio[i]));
            REQUIRE(sum(mesh.exactAreaOfCell()) == Approx(4 * M_PI));
            REQUIRE(sum(mesh.areaOfPatch()) == Approx(4 * M_PI));
        }
    }

    SECTION("Corners around the poles") {
        // Nodes 25 and 28 sit exactly at (0, 0, 1) and (0, 0, -1).
        DualIcosphere mesh(1.0, 1);
        for (size_t n : { 25, 28 }) {
            REQUIRE(mesh.valence(n) == 6);
            const auto angles = mesh.cornerAnglesAtNode(n);
            REQUIRE(angles.size() == 6);
            for (size_t i = 1; i < angles.size(); ++i)
                REQUIRE(angles[i] > angles[i - 1]);
        }
    }
}

TEST_CASE("corner angles", "[dual_icosphere]") {
    for (size_t level = 0; level <= 3; ++level) {
        DualIcosphere mesh(1.0, level);
        for (size_t n = 0; n < mesh.numNodes(); ++n) {
            const auto angles = mesh.cornerAnglesAtNode(n);
            REQUIRE(angles.size() == mesh.valence(n));
            for (size_t i = 0; i < angles.size(); ++i) {
                REQUIRE(angles[i] >= 0.0);
                REQUIRE(angles[i] < 2 * M_PI);
                if (i > 0) REQUIRE(angles[i] > angles[i - 1]);
            }
        }
        REQUIRE_THROWS(mesh.cornerAnglesAtNode(mesh.numNodes()));
    }

    // Node 4's corner 11 lies on its local +x axis, just below zero after
    // rounding; it wraps to 0, not 2 pi.
    DualIcosphere mesh(1.0, 0);
    REQUIRE(mesh.cornersAtNode()[4][0] == 11);
    REQUIRE(mesh.cornerAnglesAtNode(4)[0] == 0.0);
}

TEST_CASE("radius scaling", "[dual_icosphere]") {
    DualIcosphere mesh(2.0, 0);
    REQUIRE(mesh.lengthOfLink()[0] == Approx(2.214297435588181));
    REQUIRE(mesh.lengthOfFace()[0] == Approx(1.4594553124539331));
    REQUIRE(mesh.areaOfCell()[0]   == Approx(4.188790204786389));
    REQUIRE(sum(mesh.exactAreaOfCell()) == Approx(16 * M_PI));
    for (const auto &p : mesh.coordsOfNode())   REQUIRE(p.norm() == Approx(2.0));
    for (const auto &c : mesh.coordsOfCorner()) REQUIRE(c.norm() == Approx(2.0));

    // Topology does not depend on the radius.
    DualIcosphere unit(1.0, 0);
    REQUIRE(mesh.nodesAtLink()   == unit.nodesAtLink());
    REQUIRE(mesh.cornersAtNode() == unit.cornersAtNode());
    REQUIRE(mesh.cornersAtFace() == unit.cornersAtFace());
}

TEST_CASE("deterministic construction", "[dual_icosphere]") {
    DualIcosphere a(1.5, 2), b(1.5, 2);
    REQUIRE(a.nodesAtLink()    == b.nodesAtLink());
    REQUIRE(a.linksAtNode()    == b.linksAtNode());
    REQUIRE(a.linkDirsAtNode() == b.linkDirsAtNode());
    REQUIRE(a.cornersAtNode()  == b.cornersAtNode());
    REQUIRE(a.cornersAtFace()  == b.cornersAtFace());
    REQUIRE(a.areaOfCell()     == b.areaOfCell());
    REQUIRE(a.lengthOfFace()   == b.lengthOfFace());
}

TEST_CASE("lazy quantities", "[dual_icosphere]") {
    DualIcosphere mesh(3.0, 1);

    SECTION("Spherical node coordinates") {
        const auto &r = mesh.rOfNode();
        REQUIRE(r.size() == mesh.numNodes());
        for (Real ri : r) REQUIRE(ri == Approx(3.0));
        REQUIRE(&mesh.rOfNode() == &r);

        REQUIRE(mesh.phiOfNode()[0]   == Approx(2.1243706856919418));
        REQUIRE(mesh.thetaOfNode()[0] == Approx(M_PI / 2));
        REQUIRE(mesh.thetaOfNode()[25] == Approx(0.0).margin(1e-12));
        REQUIRE(mesh.thetaOfNode()[28] == Approx(M_PI));
    }

    SECTION("Patch areas") {
        const auto &area = mesh.areaOfPatch();
        REQUIRE(area.size() == mesh.numPatches());
        REQUIRE(&mesh.areaOfPatch() == &area);
        for (Real a : area) REQUIRE(a > 0);
        REQUIRE(sum(area) == Approx(36 * M_PI));
    }

    SECTION("Exact cell areas") {
        const auto &area = mesh.exactAreaOfCell();
        REQUIRE(&mesh.exactAreaOfCell() == &area);
        // Pentagons (regular) are estimated exactly.
        for (size_t n = 0; n < 12; ++n)
            REQUIRE(area[n] == Approx(mesh.areaOfCell()[n]));
    }
}

TEST_CASE("construction from a triangle list", "[dual_icosphere]") {
    SECTION("Icosahedron input matches the level constructor") {
        RefinableIcosahedron ico(1.0);
        ico.refine(1);
        DualIcosphere fromList(ico.vertices(), ico.triangles(), 1.0);
        DualIcosphere fromLevel(1.0, 1);
        REQUIRE(fromList.nodesAtLink()   == fromLevel.nodesAtLink());
        REQUIRE(fromList.cornersAtNode() == fromLevel.cornersAtNode());
        REQUIRE(fromList.areaOfCell()    == fromLevel.areaOfCell());
    }

    SECTION("Octahedron") {
        std::vector<Point3D> v;
        std::vector<IndexTriplet> t;
        octahedron(v, t);
        DualIcosphere mesh(v, t, 1.0);
        REQUIRE(mesh.numNodes() == 6);
        REQUIRE(mesh.numLinks() == 12);
        REQUIRE(mesh.numPatches() == 8);
        for (size_t n = 0; n < 6; ++n) {
            REQUIRE(mesh.valence(n) == 4);
            // Each cell is a face of the spherical cube.
            REQUIRE(mesh.areaOfCell()[n]      == Approx(2 * M_PI / 3));
            REQUIRE(mesh.exactAreaOfCell()[n] == Approx(2 * M_PI / 3));
        }
    }
}

TEST_CASE("malformed input", "[dual_icosphere]") {
    RefinableIcosahedron ico;
    std::vector<Point3D> v = ico.vertices();
    std::vector<IndexTriplet> t = ico.triangles();

    SECTION("Radius") {
        REQUIRE_THROWS_AS(DualIcosphere( 0.0, 0), std::runtime_error);
        REQUIRE_THROWS_AS(DualIcosphere(-2.0, 1), std::runtime_error);
        REQUIRE_THROWS_AS(DualIcosphere(v, t, 0.0), std::runtime_error);
    }

    SECTION("Empty input") {
        REQUIRE_THROWS_AS(DualIcosphere(std::vector<Point3D>(), std::vector<IndexTriplet>(), 1.0),
                          std::runtime_error);
        REQUIRE_THROWS_AS(DualIcosphere(v, std::vector<IndexTriplet>(), 1.0), std::runtime_error);
    }

    SECTION("Index out of range") {
        t[3][1] = 12;
        REQUIRE_THROWS_AS(DualIcosphere(v, t, 1.0), std::runtime_error);
        t[3][1] = -1;
        REQUIRE_THROWS_AS(DualIcosphere(v, t, 1.0), std::runtime_error);
    }

    SECTION("Repeated vertex") {
        t[7] = {{2, 10, 2}};
        REQUIRE_THROWS_AS(DualIcosphere(v, t, 1.0), std::runtime_error);
    }

    SECTION("Vertex off the sphere") {
        v[4] *= 1.1;
        REQUIRE_THROWS_AS(DualIcosphere(v, t, 1.0), std::runtime_error);
        // ...or a radius that does not match the vertices
        REQUIRE_THROWS_AS(DualIcosphere(ico.vertices(), t, 2.0), std::runtime_error);
    }

    SECTION("Open fan (boundary links)") {
        t.resize(5);
        REQUIRE_THROWS_AS(DualIcosphere(v, t, 1.0), std::runtime_error);
    }

    SECTION("Single triangle") {
        t.resize(1);
        REQUIRE_THROWS_AS(DualIcosphere(v, t, 1.0), std::runtime_error);
    }

    SECTION("Valence above capacity") {
        // Seven triangles fanning around the north pole.
        std::vector<Point3D> fanV = { Point3D(0, 0, 1) };
        std::vector<IndexTriplet> fanT;
        for (int k = 0; k < 7; ++k) {
            fanV.emplace_back(std::cos(2 * M_PI * k / 7), std::sin(2 * M_PI * k / 7), 0);
            fanT.push_back({{0, 1 + k, 1 + (k + 1) % 7}});
        }
        REQUIRE_THROWS_AS(DualIcosphere(fanV, fanT, 1.0), std::runtime_error);
    }

    SECTION("Edge shared by three patches") {
        std::vector<Point3D> pv = { Point3D(1, 0, 0), Point3D(0, 1, 0), Point3D(0, 0, 1),
                                    Point3D(0, 0, -1), Point3D(-1, 0, 0) };
        std::vector<IndexTriplet> pt = { {{0, 1, 2}}, {{1, 0, 3}}, {{0, 1, 4}} };
        REQUIRE_THROWS_AS(DualIcosphere(pv, pt, 1.0), std::runtime_error);
    }

    SECTION("Degenerate patch") {
        // Vertex 12 duplicates vertex 0.
        v.push_back(v[0]);
        t[0] = {{12, 11, 5}};
        t.push_back({{0, 12, 5}});
        REQUIRE_THROWS_AS(DualIcosphere(v, t, 1.0), std::runtime_error);
    }
}
