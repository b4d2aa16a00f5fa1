#include <IcoDual/MeshInvariants.hh>

#include <cmath>
#include <sstream>

std::vector<std::string> checkInvariants(const DualIcosphere &mesh, Real tol) {
    std::vector<std::string> violations;
    auto report = [&violations](const std::string &msg) { violations.push_back(msg); };

    if (mesh.numFaces() != mesh.numLinks())
        report("face count " + std::to_string(mesh.numFaces()) + " != link count " + std::to_string(mesh.numLinks()));
    if (mesh.numCells() != mesh.numNodes())
        report("cell count " + std::to_string(mesh.numCells()) + " != node count " + std::to_string(mesh.numNodes()));
    if (mesh.numCorners() != mesh.numPatches())
        report("corner count " + std::to_string(mesh.numCorners()) + " != patch count " + std::to_string(mesh.numPatches()));

    // Valences
    size_t valenceSum = 0, numPentagons = 0;
    for (size_t n = 0; n < mesh.numNodes(); ++n) {
        const size_t v = mesh.valence(n);
        valenceSum += v;
        if (v == 5) ++numPentagons;
        else if (v != 6) report("node " + std::to_string(n) + " has valence " + std::to_string(v));
        if (numValidSlots(mesh.cornersAtNode()[n]) != v)
            report("node " + std::to_string(n) + " has mismatched link and corner counts");
    }
    if (valenceSum != 2 * mesh.numLinks())
        report("valence sum " + std::to_string(valenceSum) + " != twice the link count");
    if (numPentagons != 12)
        report(std::to_string(numPentagons) + " pentagonal cells (expected 12)");

    const Real r = mesh.radius();
    for (size_t c = 0; c < mesh.numCorners(); ++c) {
        const Real cr = mesh.coordsOfCorner()[c].norm();
        if (std::abs(cr - r) > tol * r) {
            std::stringstream ss;
            ss << "corner " << c << " lies off the sphere (|c| = " << cr << ")";
            report(ss.str());
        }
    }

    for (size_t f = 0; f < mesh.numFaces(); ++f) {
        const auto &cf = mesh.cornersAtFace()[f];
        if ((cf[0] < 0) || (cf[1] < 0) || (cf[0] == cf[1]))
            report("face " + std::to_string(f) + " does not join two distinct corners");
        else if (!(mesh.lengthOfFace()[f] > 0))
            report("face " + std::to_string(f) + " has non-positive length");
    }

    for (size_t n = 0; n < mesh.numNodes(); ++n) {
        const std::vector<Real> angles = mesh.cornerAnglesAtNode(n);
        for (size_t i = 1; i < angles.size(); ++i) {
            if (!(angles[i] > angles[i - 1])) {
                report("corners of node " + std::to_string(n) + " are not in counterclockwise order");
                break;
            }
        }
    }

    Real totalArea = 0;
    for (Real a : mesh.exactAreaOfCell()) totalArea += a;
    const Real sphereArea = 4 * M_PI * r * r;
    if (std::abs(totalArea - sphereArea) > tol * sphereArea) {
        std::stringstream ss;
        ss << "cell areas sum to " << totalArea << " instead of " << sphereArea;
        report(ss.str());
    }

    return violations;
}
