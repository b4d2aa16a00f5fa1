////////////////////////////////////////////////////////////////////////////////
// SphericalGeometry.hh
////////////////////////////////////////////////////////////////////////////////
/*! @file
//      Stateless geometry on a sphere centered at the origin: great-circle
//      angles, spherical triangle areas, spherical coordinates and the
//      z-then-y rotation used to bring a point of the sphere to the pole.
//
//      Spherical coordinates follow the physics convention:
//          phi   = atan2(y, x)   (azimuth, in (-pi, pi])
//          theta = acos(z / r)   (polar angle, in [0, pi])
*/
////////////////////////////////////////////////////////////////////////////////
#ifndef SPHERICALGEOMETRY_HH
#define SPHERICALGEOMETRY_HH

#include <IcoDual/Types.hh>

struct SphericalCoordinates {
    Real r, phi, theta;
};

////////////////////////////////////////////////////////////////////////////////
/*! Central angle between two points lying on the sphere of radius r.
//  The great-circle distance is r * arcLength(p1, p2, r).
//  @param[in]  p1, p2  points on the sphere
//  @param[in]  r       sphere radius
//  @return     angle in radians, in [0, pi]
*///////////////////////////////////////////////////////////////////////////////
ICODUAL_EXPORT Real arcLength(const Point3D &p1, const Point3D &p2, Real r);

////////////////////////////////////////////////////////////////////////////////
/*! Area of the spherical triangle p0 p1 p2 (L'Huilier's theorem).
//  @param[in]  p0, p1, p2  triangle corners on the sphere
//  @param[in]  r           sphere radius
//  @return     area (r^2 times the spherical excess)
*///////////////////////////////////////////////////////////////////////////////
ICODUAL_EXPORT Real sphericalTriangleArea(const Point3D &p0, const Point3D &p1,
                                          const Point3D &p2, Real r);

// Throws if p is the zero vector.
ICODUAL_EXPORT SphericalCoordinates cartesianToSpherical(const Point3D &p);

ICODUAL_EXPORT Point3D sphericalToCartesian(const SphericalCoordinates &s);

////////////////////////////////////////////////////////////////////////////////
/*! Rotate p about the z axis by phi, then about the y axis by theta.
//  rotateZY(p, -phi(p), -theta(p)) carries p onto the positive z axis, so the
//  neighborhood of p ends up (locally) in a plane parallel to xy.
*///////////////////////////////////////////////////////////////////////////////
ICODUAL_EXPORT Point3D rotateZY(const Point3D &p, Real phi, Real theta);

////////////////////////////////////////////////////////////////////////////////
/*! Unit normal of the planar triangle p0 p1 p2, oriented by the right-hand
//  rule: normalize((p1 - p0) x (p2 - p0)).
//  Throws std::runtime_error for (near) collinear corners, where the normal
//  is undefined.
*///////////////////////////////////////////////////////////////////////////////
ICODUAL_EXPORT Vector3D unitTriangleNormal(const Point3D &p0, const Point3D &p1,
                                           const Point3D &p2);

#endif /* end of include guard: SPHERICALGEOMETRY_HH */
