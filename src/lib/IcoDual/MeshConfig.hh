////////////////////////////////////////////////////////////////////////////////
// MeshConfig.hh
////////////////////////////////////////////////////////////////////////////////
/*! @file
//      Parameters for building and exporting a DualIcosphere. Read from a
//      JSON file of the form
//          {
//              "radius": 6371.0,
//              "mesh_densification_level": 3,
//              "output_base": "earth",
//              "verbose": true
//          }
//      where every key is optional (missing keys keep their defaults).
*/
////////////////////////////////////////////////////////////////////////////////
#ifndef MESHCONFIG_HH
#define MESHCONFIG_HH

#include <IcoDual/Types.hh>

#include <boost/property_tree/ptree.hpp>
#include <iosfwd>
#include <string>

struct ICODUAL_EXPORT MeshConfig {
    Real        radius = 1.0;
    size_t      meshDensificationLevel = 0;
    std::string outputBase = "icosphere";
    bool        verbose = false;

    // Throws std::runtime_error on a parse failure or invalid value.
    void setFromPTree(const boost::property_tree::ptree &pt);
    void setFromJSON(std::istream &is);
    void setFromFile(const std::string &path);

    // Throws std::runtime_error for a non-positive radius or an empty output base.
    void validate() const;
};

ICODUAL_EXPORT std::ostream &operator<<(std::ostream &os, const MeshConfig &config);

#endif /* end of include guard: MESHCONFIG_HH */
