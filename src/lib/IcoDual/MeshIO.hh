////////////////////////////////////////////////////////////////////////////////
// MeshIO.hh
////////////////////////////////////////////////////////////////////////////////
/*! @file
//      Writes polygon soups (and an optional per-element scalar field) in
//      the OFF and legacy ASCII VTK formats.
//
//      Write a plain polygon soup using:
//          save(path, nodes, elements[, format[, field]])
//      Write both complexes of a DualIcosphere using:
//          saveDualIcosphere(baseName, mesh[, cellField[, patchField]])
//      which produces baseName_patches.vtk (nodes + triangular patches) and
//      baseName_cells.vtk (corners + pentagonal/hexagonal cells).
*/
////////////////////////////////////////////////////////////////////////////////
#ifndef MESH_IO_HH
#define MESH_IO_HH

#include <IcoDual/Types.hh>

#include <string>
#include <stdexcept>
#include <iostream>
#include <vector>

#include <IcoDual_export.h>

class DualIcosphere;

namespace MeshIO {
    /** Supported file formats */
    typedef enum { FMT_OFF = 0, FMT_VTK = 1,
                   FMT_GUESS = -1, FMT_INVALID = -1 } Format;

    // VTK cell type codes
    enum { VTK_TRIANGLE = 5, VTK_POLYGON = 7 };

    ////////////////////////////////////////////////////////////////////////////
    /*! @class IOVertex
    //  Minimal vertex class for unattributed mesh I/O
    *///////////////////////////////////////////////////////////////////////////
    class IOVertex {
    public:
        Point3D point;

        IOVertex()                       : point(0, 0, 0) { }
        IOVertex(Real x, Real y, Real z) : point(x, y, z) { }
        IOVertex(const Point3D &p)       : point(p) { }

        Real  operator[](size_t i) const { return point[i]; }
        Real &operator[](size_t i)       { return point[i]; }
    };

    ////////////////////////////////////////////////////////////////////////////
    /*! @class IOElement
    //  Minimal polygon class for unattributed mesh i/o.
    *///////////////////////////////////////////////////////////////////////////
    class IOElement : public std::vector<size_t> {
        typedef std::vector<size_t> Base;
    public:
        IOElement(size_t n = 0) : Base(n) { }
        IOElement(std::initializer_list<size_t> l) : Base(l) { }
    };

    ////////////////////////////////////////////////////////////////////////////
    /*! Named per-element scalar values (VTK CELL_DATA).
    *///////////////////////////////////////////////////////////////////////////
    struct ScalarField {
        ScalarField(const std::string &n = "cell_data",
                    const std::vector<Real> &v = std::vector<Real>())
            : name(n), values(v) { }
        std::string name;
        std::vector<Real> values;
    };

    ////////////////////////////////////////////////////////////////////////////
    /*! IOVertex ASCII output  (for implementing OFF/VTK I/O)
    //  Format: x y z
    *///////////////////////////////////////////////////////////////////////////
    ICODUAL_EXPORT std::ostream & operator<<(std::ostream &os, const IOVertex &v);

    ////////////////////////////////////////////////////////////////////////////
    /*! IOElement ASCII output  (for implementing OFF/VTK I/O)
    //  Format: Nv v0 v1 ... v[Nv - 1]
    *///////////////////////////////////////////////////////////////////////////
    ICODUAL_EXPORT std::ostream & operator<<(std::ostream &os, const IOElement &e);

    ////////////////////////////////////////////////////////////////////////////
    /*! Abstract base functor for supporting various mesh format output
    *///////////////////////////////////////////////////////////////////////////
    class ICODUAL_EXPORT MeshIO {
        public:
            typedef IOVertex  Vertex;
            typedef IOElement Element;

            // field (optional) holds one value per element.
            virtual void save(std::ostream &os,
                              const std::vector<Vertex> &nodes,
                              const std::vector<Element> &elements,
                              const ScalarField *field) = 0;
            virtual ~MeshIO() { }
    };

    class ICODUAL_EXPORT MeshIO_OFF : public MeshIO {
        public:
            void save(std::ostream &os, const std::vector<Vertex> &v, const std::vector<Element> &e,
                      const ScalarField *field) override;
    };

    // Legacy (version 2.0) ASCII VTK unstructured grid
    class ICODUAL_EXPORT MeshIO_VTK : public MeshIO {
        public:
            MeshIO_VTK(const std::string &title = "IcoDual Icosphere Grid") : m_title(title) { }

            void save(std::ostream &os, const std::vector<Vertex> &v, const std::vector<Element> &e,
                      const ScalarField *field) override;

        private:
            std::string m_title;
    };

    ////////////////////////////////////////////////////////////////////////////
    /*! Guesses the file format of a mesh from its file extension
    //  @param[in]  path    mesh path
    //  @return     file format, or INVALID if the extension wasn't recognized
    *///////////////////////////////////////////////////////////////////////////
    ICODUAL_EXPORT Format guessFormat(const std::string &path);

    ////////////////////////////////////////////////////////////////////////////
    /*! Gets a writer that will work with a particular file format
    //  @param[in]  format  file format
    //  @return     format writer object
    *///////////////////////////////////////////////////////////////////////////
    ICODUAL_EXPORT MeshIO *getMeshIO(const Format &format);

    ////////////////////////////////////////////////////////////////////////////
    /*! Writes an element soup to an output stream
    //  @param[in]  os        stream to which geometry is written
    //  @param[in]  nodes     nodes to write
    //  @param[in]  elements  elements to write
    //  @param[in]  format    file format
    //  @param[in]  field     optional per-element field
    *///////////////////////////////////////////////////////////////////////////
    ICODUAL_EXPORT
    void save(std::ostream &os, const std::vector<IOVertex> &nodes,
              const std::vector<IOElement> &elements, Format format,
              const ScalarField *field = nullptr);

    ////////////////////////////////////////////////////////////////////////////
    /*! Writes an element soup to a mesh path
    //  @param[in]  path      the path to which geometry is written
    //  @param[in]  nodes     nodes to write
    //  @param[in]  elements  elements to write
    //  @param[in]  format    file format (default: guess from extension)
    //  @param[in]  field     optional per-element field
    *///////////////////////////////////////////////////////////////////////////
    ICODUAL_EXPORT
    void save(const std::string &path, const std::vector<IOVertex> &nodes,
              const std::vector<IOElement> &elements, Format format = FMT_GUESS,
              const ScalarField *field = nullptr);

    ////////////////////////////////////////////////////////////////////////////
    // Element soups of the two complexes of a dual icosphere.
    ////////////////////////////////////////////////////////////////////////////
    // Nodes and triangular patches
    ICODUAL_EXPORT void patchSoup(const DualIcosphere &mesh,
                                  std::vector<IOVertex> &nodes,
                                  std::vector<IOElement> &elements);
    // Corners and polygonal cells (padding slots dropped)
    ICODUAL_EXPORT void cellSoup(const DualIcosphere &mesh,
                                 std::vector<IOVertex> &corners,
                                 std::vector<IOElement> &elements);

    ////////////////////////////////////////////////////////////////////////////
    /*! Writes baseName_cells.vtk and baseName_patches.vtk.
    //  Fields are optional; a field whose size differs from the number of
    //  cells (patches) raises std::runtime_error.
    *///////////////////////////////////////////////////////////////////////////
    ICODUAL_EXPORT
    void saveDualIcosphere(const std::string &baseName, const DualIcosphere &mesh,
                           const ScalarField *cellField = nullptr,
                           const ScalarField *patchField = nullptr);
}

#endif // MESH_IO_HH
