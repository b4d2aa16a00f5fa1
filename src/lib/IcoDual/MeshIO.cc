#include <IcoDual/MeshIO.hh>
#include <IcoDual/DualIcosphere.hh>
#include <IcoDual/utils.hh>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iomanip>
#include <limits>

using namespace std;

namespace MeshIO {

std::ostream & operator<<(std::ostream &os, const IOVertex &v) {
    os << v[0] << " " << v[1] << " " << v[2] << '\n';
    return os;
}

std::ostream & operator<<(std::ostream &os, const IOElement &e) {
    os << e.size();
    for (size_t i = 0; i < e.size(); ++i)
        os << ' ' << e[i];
    os << '\n';
    return os;
}

namespace {
    void validateField(const ScalarField *field, size_t numElements) {
        if (field && (field->values.size() != numElements)) {
            throw std::runtime_error("Field '" + field->name + "' has " + to_string(field->values.size())
                                     + " values for " + to_string(numElements) + " elements");
        }
    }
}

////////////////////////////////////////////////////////////////////////////////
// OFF
////////////////////////////////////////////////////////////////////////////////
void MeshIO_OFF::save(std::ostream &os, const std::vector<Vertex> &nodes,
                      const std::vector<Element> &elements, const ScalarField *field) {
    if (field) {
        cerr << "WARNING: OFF format cannot store field '" << field->name
             << "'; skipped." << endl;
    }
    os << "OFF" << '\n';
    os << nodes.size() << ' ' << elements.size() << " 0" << '\n';
    os << std::setprecision(numeric_limits<Real>::max_digits10);
    for (const auto &n : nodes) os << n;
    for (const auto &e : elements) os << e;
}

////////////////////////////////////////////////////////////////////////////////
// Legacy VTK
////////////////////////////////////////////////////////////////////////////////
void MeshIO_VTK::save(std::ostream &os, const std::vector<Vertex> &nodes,
                      const std::vector<Element> &elements, const ScalarField *field) {
    validateField(field, elements.size());

    size_t listSize = 0, maxCorners = 0;
    for (const auto &e : elements) {
        for (size_t c : e) {
            if (c >= nodes.size())
                throw std::runtime_error("Element references point " + to_string(c)
                                         + " outside [0, " + to_string(nodes.size()) + ")");
        }
        listSize += e.size() + 1;
        maxCorners = std::max(maxCorners, e.size());
    }

    os << "# vtk DataFile Version 2.0" << '\n'
       << m_title << '\n'
       << "ASCII" << '\n'
       << "DATASET UNSTRUCTURED_GRID" << '\n';

    // Points: the x, y, z coordinates of each point (node or corner)
    os << "POINTS " << nodes.size() << " float" << '\n';
    os << std::setprecision(numeric_limits<Real>::max_digits10);
    for (const auto &n : nodes) os << n;
    os << '\n';

    // Cells: generic polygons on the sphere (patches or dual cells).
    os << "CELLS " << elements.size() << " " << listSize << '\n';
    for (const auto &e : elements) os << e;
    os << '\n';

    const int cellType = (maxCorners == 3) ? VTK_TRIANGLE : VTK_POLYGON;
    os << "CELL_TYPES " << elements.size() << '\n';
    for (size_t i = 0; i < elements.size(); ++i)
        os << cellType << '\n';

    if (field) {
        os << "CELL_DATA " << field->values.size() << '\n'
           << "SCALARS " << field->name << " float 1" << '\n'
           << "LOOKUP_TABLE default" << '\n';
        for (Real val : field->values)
            os << val << '\n';
    }
}

////////////////////////////////////////////////////////////////////////////////
/*! Guesses the file format of a mesh from its file extension
//  @param[in]  path    mesh path
//  @return     file format, or INVALID if the extension wasn't recognized
*///////////////////////////////////////////////////////////////////////////////
Format guessFormat(const std::string &path) {
    // Extract file extension from the path (including the last .)
    std::string ext = fileExtension(path);
    // Make comparisons insensitive;
    for (size_t i = 0; i < ext.length(); ++i)
        ext[i] = tolower(ext[i]);
    if (ext == ".off")  return FMT_OFF;
    if (ext == ".vtk")  return FMT_VTK;

    return FMT_INVALID;
}

////////////////////////////////////////////////////////////////////////////////
/*! Gets a writer that will work with a particular file format
//  @param[in]  format  file format
//  @return     format writer object
*///////////////////////////////////////////////////////////////////////////////
MeshIO *getMeshIO(const Format &format) {
    static MeshIO_OFF s_offIO;
    static MeshIO_VTK s_vtkIO;

    // Indexed using Format enum (order must match enum)
    static std::vector<MeshIO *> IOs = { &s_offIO, &s_vtkIO };

    if ((format >= 0) && (size_t(format) < IOs.size()))
        return IOs[format];

    throw std::runtime_error("Illegal mesh format: " + to_string(int(format)));
}

void save(std::ostream &os, const std::vector<IOVertex> &nodes,
          const std::vector<IOElement> &elements, Format format,
          const ScalarField *field)
{
    MeshIO *io = getMeshIO(format);
    io->save(os, nodes, elements, field);
    if (!os) throw std::runtime_error("Error in save: bad i/o");
}

void save(const std::string &path, const std::vector<IOVertex> &nodes,
          const std::vector<IOElement> &elements, Format format,
          const ScalarField *field)
{
    if (format == FMT_GUESS)
        format = guessFormat(path);
    if (format == FMT_INVALID)
        throw std::runtime_error("Couldn't determine mesh format of " + path);

    std::ofstream os(path);
    if (!os.is_open()) throw std::runtime_error("Couldn't open out file " + path);

    save(os, nodes, elements, format, field);
}

////////////////////////////////////////////////////////////////////////////////
// Dual icosphere output
////////////////////////////////////////////////////////////////////////////////
void patchSoup(const DualIcosphere &mesh, std::vector<IOVertex> &nodes,
               std::vector<IOElement> &elements) {
    nodes.clear(), elements.clear();
    nodes.reserve(mesh.numNodes());
    for (const auto &p : mesh.coordsOfNode()) nodes.emplace_back(p);

    elements.reserve(mesh.numPatches());
    for (const auto &tri : mesh.nodesAtPatch())
        elements.push_back(IOElement{size_t(tri[0]), size_t(tri[1]), size_t(tri[2])});
}

void cellSoup(const DualIcosphere &mesh, std::vector<IOVertex> &corners,
              std::vector<IOElement> &elements) {
    corners.clear(), elements.clear();
    corners.reserve(mesh.numCorners());
    for (const auto &p : mesh.coordsOfCorner()) corners.emplace_back(p);

    elements.reserve(mesh.numCells());
    for (const auto &slots : mesh.cornersAtCell()) {
        IOElement e;
        for (int c : slots)
            if (c != INVALID_INDEX) e.push_back(size_t(c));
        elements.push_back(e);
    }
}

void saveDualIcosphere(const std::string &baseName, const DualIcosphere &mesh,
                       const ScalarField *cellField, const ScalarField *patchField) {
    // Reject both fields before either file is created.
    validateField(cellField,  mesh.numCells());
    validateField(patchField, mesh.numPatches());

    std::vector<IOVertex>  points;
    std::vector<IOElement> elements;

    cellSoup(mesh, points, elements);
    save(baseName + "_cells.vtk", points, elements, FMT_VTK, cellField);

    patchSoup(mesh, points, elements);
    save(baseName + "_patches.vtk", points, elements, FMT_VTK, patchField);
}

} // namespace MeshIO
