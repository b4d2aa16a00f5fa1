#include <IcoDual/SphericalGeometry.hh>

#include <algorithm>
#include <cmath>
#include <sstream>
#include <stdexcept>

Real arcLength(const Point3D &p1, const Point3D &p2, Real r) {
    // Rounding can push the cosine slightly outside [-1, 1] for (anti)podal
    // and coincident points.
    Real cosAngle = p1.dot(p2) / (r * r);
    cosAngle = std::max(Real(-1.0), std::min(Real(1.0), cosAngle));
    return std::acos(cosAngle);
}

Real sphericalTriangleArea(const Point3D &p0, const Point3D &p1,
                           const Point3D &p2, Real r) {
    const Real a = arcLength(p1, p2, r);
    const Real b = arcLength(p0, p2, r);
    const Real c = arcLength(p0, p1, r);
    const Real s = 0.5 * (a + b + c);

    Real t = std::tan(0.5 * s)
           * std::tan(0.5 * (s - a))
           * std::tan(0.5 * (s - b))
           * std::tan(0.5 * (s - c));
    // Degenerate (zero-area) triangles can produce tiny negative products.
    t = std::max(t, Real(0.0));

    const Real excess = 4.0 * std::atan(std::sqrt(t));
    return r * r * excess;
}

SphericalCoordinates cartesianToSpherical(const Point3D &p) {
    SphericalCoordinates result;
    result.r = p.norm();
    if (result.r == 0.0)
        throw std::runtime_error("Spherical coordinates undefined for the origin");
    result.phi   = std::atan2(p[1], p[0]);
    result.theta = std::acos(std::max(Real(-1.0), std::min(Real(1.0), p[2] / result.r)));
    return result;
}

Point3D sphericalToCartesian(const SphericalCoordinates &s) {
    const Real st = std::sin(s.theta);
    return Point3D(s.r * st * std::cos(s.phi),
                   s.r * st * std::sin(s.phi),
                   s.r * std::cos(s.theta));
}

Point3D rotateZY(const Point3D &p, Real phi, Real theta) {
    const Real cp = std::cos(phi),   sp = std::sin(phi);
    const Real ct = std::cos(theta), st = std::sin(theta);

    // About z
    const Real xr = p[0] * cp - p[1] * sp;
    const Real yr = p[0] * sp + p[1] * cp;
    const Real zr = p[2];

    // About y
    return Point3D(xr * ct + zr * st,
                   yr,
                  -xr * st + zr * ct);
}

Vector3D unitTriangleNormal(const Point3D &p0, const Point3D &p1,
                            const Point3D &p2) {
    const Vector3D u = p1 - p0;
    const Vector3D v = p2 - p0;
    const Vector3D n = u.cross(v);

    // |u x v| = |u||v| sin(angle); compare against the edge scale.
    const Real scale = std::max(u.squaredNorm(), v.squaredNorm());
    const Real nrm = n.norm();
    if (!(nrm > 1e-12 * scale)) {
        std::stringstream ss;
        ss << "Degenerate triangle (collinear corners): "
           << p0.format(pointFormatter) << ", "
           << p1.format(pointFormatter) << ", "
           << p2.format(pointFormatter);
        throw std::runtime_error(ss.str());
    }
    return n / nrm;
}
