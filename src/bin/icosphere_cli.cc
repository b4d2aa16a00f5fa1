#include <IcoDual/DualIcosphere.hh>
#include <IcoDual/MeshConfig.hh>
#include <IcoDual/MeshInvariants.hh>
#include <IcoDual/MeshIO.hh>
#include <IcoDual/GlobalBenchmark.hh>
#include <IcoDual/utils.hh>

#include <cmath>
#include <iostream>
#include <iomanip>
#include <string>
#include <vector>
#include <boost/program_options.hpp>
#include <boost/filesystem.hpp>

namespace po = boost::program_options;
namespace fs = boost::filesystem;

using namespace std;

[[ noreturn ]] void usage(int exitVal, const po::options_description &visible_opts) {
    cout << "Usage: icosphere_cli [config.json] [options]" << endl;
    cout << visible_opts << endl;
    exit(exitVal);
}

po::variables_map parseCmdLine(int argc, const char *argv[]) {
    po::options_description hidden_opts("Hidden Arguments");
    hidden_opts.add_options()
        ("config", po::value<string>(), "JSON mesh configuration")
        ;

    po::positional_options_description p;
    p.add("config", 1);

    po::options_description visible_opts;
    visible_opts.add_options()("help", "Produce this help message")
        ("radius,r",     po::value<double>(),  "Sphere radius (overrides config)")
        ("level,l",      po::value<int>(),     "Mesh densification level (overrides config)")
        ("outBase,o",    po::value<string>(),  "Base path for the VTK output (overrides config)")
        ("info,i",                             "Report entity counts and length/area statistics")
        ("vtk",                                "Write <outBase>_cells.vtk and <outBase>_patches.vtk")
        ("off",          po::value<string>(),  "Write the dual cells as an OFF polygon mesh")
        ("benchmark,b",                        "Report the construction stage timings")
        ("verbose,v",                          "Report construction progress")
        ;

    po::options_description cli_opts;
    cli_opts.add(visible_opts).add(hidden_opts);

    po::variables_map vm;
    try {
        po::store(po::command_line_parser(argc, argv).
                  options(cli_opts).positional(p).run(), vm);
        po::notify(vm);
    }
    catch (std::exception &e) {
        cout << "Error: " << e.what() << endl << endl;
        usage(1, visible_opts);
    }

    if (vm.count("help"))
        usage(0, visible_opts);

    if (vm.count("level") && (vm["level"].as<int>() < 0)) {
        cout << "Error: level must be nonnegative" << endl;
        usage(1, visible_opts);
    }

    return vm;
}

void reportArrayStats(const string &name, const vector<Real> &array) {
    auto s = arrayStats(array);
    cout << "Min "    << name << ":\t" << s.min    << endl;
    cout << "Median " << name << ":\t" << s.median << endl;
    cout << "Max "    << name << ":\t" << s.max    << endl;
}

// Create the directory that will hold path, if needed.
void createParentDirectory(const string &path) {
    fs::path parent = fs::path(path).parent_path();
    if (!parent.empty() && !fs::exists(parent))
        fs::create_directories(parent);
}

int run(const po::variables_map &args) {
    MeshConfig config;
    if (args.count("config")) config.setFromFile(args["config"].as<string>());

    if (args.count("radius"))  config.radius                 = args["radius"].as<double>();
    if (args.count("level"))   config.meshDensificationLevel = size_t(args["level"].as<int>());
    if (args.count("outBase")) config.outputBase             = args["outBase"].as<string>();
    if (args.count("verbose")) config.verbose                = true;
    config.validate();

    if (config.verbose) cout << config;

    BENCHMARK_RESET();
    DualIcosphere mesh(config.radius, config.meshDensificationLevel, config.verbose);

    if (args.count("info")) {
        cout << "Nodes:\t"   << mesh.numNodes()   << endl
             << "Links:\t"   << mesh.numLinks()   << endl
             << "Patches:\t" << mesh.numPatches() << endl
             << "Corners:\t" << mesh.numCorners() << endl
             << "Faces:\t"   << mesh.numFaces()   << endl
             << "Cells:\t"   << mesh.numCells()   << endl;

        size_t numPentagons = 0;
        for (size_t n = 0; n < mesh.numNodes(); ++n)
            numPentagons += (mesh.valence(n) == 5);
        cout << "Pentagons:\t" << numPentagons << endl
             << "Hexagons:\t"  << mesh.numCells() - numPentagons << endl;

        reportArrayStats("link length", mesh.lengthOfLink());
        reportArrayStats("face length", mesh.lengthOfFace());
        reportArrayStats("cell area",   mesh.areaOfCell());

        Real totalArea = 0;
        for (Real a : mesh.exactAreaOfCell()) totalArea += a;
        cout << "Total cell area:\t" << totalArea << endl
             << "Sphere area:\t" << 4 * M_PI * mesh.radius() * mesh.radius() << endl;
    }

    auto violations = checkInvariants(mesh);
    for (const auto &v : violations)
        cerr << "WARNING: " << v << endl;
    if (config.verbose && violations.empty())
        cout << "All mesh invariants hold" << endl;

    if (args.count("vtk")) {
        createParentDirectory(config.outputBase);
        MeshIO::ScalarField cellArea("area_of_cell", mesh.areaOfCell());
        MeshIO::ScalarField patchArea("area_of_patch", mesh.areaOfPatch());
        MeshIO::saveDualIcosphere(config.outputBase, mesh, &cellArea, &patchArea);
        if (config.verbose)
            cout << "Wrote " << config.outputBase << "_cells.vtk and "
                 << config.outputBase << "_patches.vtk" << endl;
    }

    if (args.count("off")) {
        const string offPath = args["off"].as<string>();
        createParentDirectory(offPath);
        vector<MeshIO::IOVertex>  corners;
        vector<MeshIO::IOElement> cells;
        MeshIO::cellSoup(mesh, corners, cells);
        MeshIO::save(offPath, corners, cells, MeshIO::FMT_OFF);
    }

    if (args.count("benchmark"))
        BENCHMARK_REPORT();

    return violations.empty() ? 0 : 2;
}

////////////////////////////////////////////////////////////////////////////////
/*! Program entry point
//  @param[in]  argc    Number of arguments
//  @param[in]  argv    Argument strings
//  @return     status  (0 on success, 1 on error, 2 if an invariant fails)
*///////////////////////////////////////////////////////////////////////////////
int main(int argc, const char *argv[])
{
    cout << setprecision(16);

    po::variables_map args = parseCmdLine(argc, argv);

    try {
        return run(args);
    }
    catch (const std::exception &e) {
        cerr << "ERROR: " << e.what() << endl;
        return 1;
    }
}
