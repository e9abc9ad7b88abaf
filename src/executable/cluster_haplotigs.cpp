#include "HaplotigCluster.hpp"
#include "coords.hpp"
#include "Timer.hpp"
#include "misc.hpp"

#include "cpptrace/from_current.hpp"
#include "CLI/CLI.hpp"

#include <filesystem>

using std::filesystem::path;

#include <exception>
#include <stdexcept>
#include <iostream>
#include <fstream>

using std::runtime_error;
using std::exception;
using std::ofstream;
using std::cerr;
using std::cout;


using namespace hapsyn;


void cluster_haplotigs(path coords_path, path output_path, const string& contig, const HaplotigClusterConfig& config){
    Timer t;

    cerr << t << "Cluster homologous regions that are within " << config.dist << " bp." << '\n';

    vector<AlignmentSegment> segments;
    load_coords(coords_path, segments);

    cerr << t << "Loaded " << segments.size() << " alignment segments" << '\n';

    vector<HaplotigRegion> regions;
    hapsyn::cluster_haplotigs(segments, contig, config, regions);

    cerr << t << "Found " << regions.size() << " haplotigs of " << contig << '\n';

    if (output_path.empty()){
        write_haplotig_regions(cout, regions);
        cout.flush();
    }
    else{
        ofstream file(output_path);

        if (not (file.is_open() and file.good())){
            throw runtime_error("ERROR: could not write file: " + output_path.string());
        }

        write_haplotig_regions(file, regions);
    }

    cerr << t << "Done" << '\n';
}


int main (int argc, char* argv[]){
    path coords_path;
    path output_path;
    string contig;
    HaplotigClusterConfig config;

    CLI::App app{"Very aggressive clustering of homologous regions, one primary region per haplotig"};

    app.add_option(
            "--coords",
            coords_path,
            "Path to headerless `show-coords -r -T -l -d -c` output. Use - for stdin")
            ->required();

    app.add_option(
            "--contig",
            contig,
            "Name of the primary contig, written in the first column of the output")
            ->required();

    app.add_option(
            "--output",
            output_path,
            "Path to output file (default: stdout)");

    app.add_option(
            "-d,--dist",
            config.dist,
            "Maximal distance for clustering, doubled until the haplotig is covered")
            ->check(CLI::PositiveNumber);

    app.add_option(
            "--min_coverage",
            config.min_coverage,
            "Stop doubling the distance once this fraction of the haplotig is spanned")
            ->check(CLI::Range(0.0, 1.0));

    app.add_flag("--debug", HAPSYN_DEBUG, "Invoke this to log each iteration of the clustering");

    try{
        app.parse(argc, argv);
    }
    catch (const CLI::ParseError &e) {
        return app.exit(e);
    }

    CPPTRACE_TRY {
        cluster_haplotigs(coords_path, output_path, contig, config);
    }
    CPPTRACE_CATCH(const exception& e) {
        cerr << e.what() << '\n';

        if (HAPSYN_DEBUG or dynamic_cast<const MalformedRecord*>(&e) == nullptr){
            cpptrace::from_current_exception().print();
        }
        return 1;
    }

    return 0;
}
