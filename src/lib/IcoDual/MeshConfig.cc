#include <IcoDual/MeshConfig.hh>

#include <boost/property_tree/json_parser.hpp>

#include <cmath>
#include <fstream>
#include <iostream>
#include <stdexcept>

using boost::property_tree::ptree;

namespace {
    // Overwrite value only if key is present; a value that fails to convert
    // throws ptree_bad_data instead of falling back to the default.
    template<typename T>
    void readIfPresent(const ptree &pt, const std::string &key, T &value) {
        if (pt.get_child_optional(key))
            value = pt.get<T>(key);
    }
}

void MeshConfig::setFromPTree(const ptree &pt) {
    try {
        readIfPresent(pt, "radius",      radius);
        readIfPresent(pt, "output_base", outputBase);
        readIfPresent(pt, "verbose",     verbose);

        // Read signed so that a negative level is reported instead of wrapping.
        long level = long(meshDensificationLevel);
        readIfPresent(pt, "mesh_densification_level", level);
        if (level < 0)
            throw std::runtime_error("mesh_densification_level must be nonnegative (got "
                                     + std::to_string(level) + ")");
        meshDensificationLevel = size_t(level);
    }
    catch (const boost::property_tree::ptree_bad_data &e) {
        throw std::runtime_error(std::string("Invalid mesh configuration value: ") + e.what());
    }
    validate();
}

void MeshConfig::setFromJSON(std::istream &is) {
    ptree pt;
    try {
        boost::property_tree::read_json(is, pt);
    }
    catch (const boost::property_tree::json_parser_error &e) {
        throw std::runtime_error(std::string("Failed to parse mesh configuration: ") + e.what());
    }
    setFromPTree(pt);
}

void MeshConfig::setFromFile(const std::string &path) {
    std::ifstream is(path);
    if (!is.is_open())
        throw std::runtime_error("Couldn't open configuration " + path);
    setFromJSON(is);
}

void MeshConfig::validate() const {
    if (!(std::isfinite(radius) && (radius > 0)))
        throw std::runtime_error("radius must be positive and finite (got " + std::to_string(radius) + ")");
    if (outputBase.empty())
        throw std::runtime_error("output_base must not be empty");
}

std::ostream &operator<<(std::ostream &os, const MeshConfig &config) {
    os << "radius:                   " << config.radius << std::endl
       << "mesh_densification_level: " << config.meshDensificationLevel << std::endl
       << "output_base:              " << config.outputBase << std::endl
       << "verbose:                  " << (config.verbose ? "true" : "false") << std::endl;
    return os;
}
