#include <catch2/catch.hpp>
#include <IcoDual/MeshInvariants.hh>
#include <IcoDual/RefinableIcosahedron.hh>

#include <algorithm>
#include <string>
#include <utility>
#include <vector>

static bool mentions(const std::vector<std::string> &violations, const std::string &word) {
    return std::any_of(violations.begin(), violations.end(),
                       [&](const std::string &v) { return v.find(word) != std::string::npos; });
}

TEST_CASE("icospheres satisfy the mesh invariants", "[mesh_invariants]") {
    for (size_t level = 0; level <= 3; ++level) {
        DualIcosphere mesh(1.0, level);
        auto violations = checkInvariants(mesh);
        INFO("level " << level);
        REQUIRE(violations.empty());
    }

    DualIcosphere big(6371.0, 2);
    REQUIRE(checkInvariants(big).empty());
}

TEST_CASE("non-icosahedral meshes are reported", "[mesh_invariants]") {
    // Octahedron: closed and consistently oriented, but every node has
    // valence 4.
    std::vector<Point3D> v = { Point3D( 1, 0, 0), Point3D(-1, 0, 0),
                               Point3D( 0, 1, 0), Point3D( 0,-1, 0),
                               Point3D( 0, 0, 1), Point3D( 0, 0,-1) };
    std::vector<IndexTriplet> t = { {{0, 2, 4}}, {{2, 1, 4}}, {{1, 3, 4}}, {{3, 0, 4}},
                                    {{2, 0, 5}}, {{1, 2, 5}}, {{3, 1, 5}}, {{0, 3, 5}} };
    DualIcosphere mesh(v, t, 1.0);

    auto violations = checkInvariants(mesh);
    REQUIRE(!violations.empty());
    REQUIRE(mentions(violations, "valence 4"));
    REQUIRE(mentions(violations, "pentagonal"));
    // The dual cube still tiles the sphere.
    REQUIRE(!mentions(violations, "areas sum"));
    REQUIRE(!mentions(violations, "counterclockwise"));
}

TEST_CASE("inward-oriented triangulation is reported", "[mesh_invariants]") {
    // Reversing every triangle moves each corner to its antipode, so the
    // wedges around a node wrap around the far side of the sphere.
    RefinableIcosahedron ico;
    std::vector<IndexTriplet> flipped = ico.triangles();
    for (auto &tri : flipped) std::swap(tri[1], tri[2]);
    DualIcosphere mesh(ico.vertices(), flipped, 1.0);

    auto violations = checkInvariants(mesh);
    REQUIRE(mentions(violations, "areas sum"));
}
