#include "SyntenyChainer.hpp"
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
using std::ostream;
using std::cerr;
using std::cout;


using namespace hapsyn;


void chain_synteny(
        path coords_path,
        path output_path,
        const string& contig,
        const ChainerConfig& config,
        int64_t min_block_length
){
    Timer t;

    cerr << t << "Chaining alignments of primary contig " << contig << '\n';
    cerr << t << "max_gap=" << config.max_gap
         << " overlap_tolerance=" << config.overlap_tolerance
         << " tie_break=" << tie_break_name(config.tie_break)
         << " n_threads=" << config.n_threads << '\n';

    SyntenyChainer chainer(config);

    cerr << t << "Loading coords: " << (coords_path == "-" ? "stdin" : coords_path.string()) << '\n';

    vector<AlignmentSegment> segments;
    load_coords(coords_path, segments);

    cerr << t << "Loaded " << segments.size() << " alignment segments" << '\n';

    vector<SyntenyBlock> blocks;
    chainer.chain(segments, blocks);

    cerr << t << "Chained into " << blocks.size() << " synteny blocks" << '\n';

    if (min_block_length > 0){
        auto n_before = blocks.size();
        remove_short_blocks(blocks, min_block_length);
        cerr << t << "Removed " << n_before - blocks.size() << " blocks shorter than " << min_block_length << " bp" << '\n';
    }

    if (output_path.empty()){
        write_blocks(cout, blocks);
        cout.flush();
    }
    else{
        ofstream file(output_path);

        if (not (file.is_open() and file.good())){
            throw runtime_error("ERROR: could not write file: " + output_path.string());
        }

        write_blocks(file, blocks);
    }

    cerr << t << "Peak memory usage: " << get_peak_memory_usage() << '\n';
    cerr << t << "Done" << '\n';
}


int main (int argc, char* argv[]){
    path coords_path;
    path output_path;
    string contig;
    string tie_break = "first";
    int64_t min_block_length = 0;
    ChainerConfig config;

    CLI::App app{"Chain collinear show-coords alignments of haplotigs against a primary contig into synteny blocks"};

    app.add_option(
            "--coords",
            coords_path,
            "Path to headerless `show-coords -r -T -l -d -c` output, sorted by query, ref, ref start. Use - for stdin")
            ->required();

    app.add_option(
            "--contig",
            contig,
            "Name of the primary contig, only used for logging")
            ->required();

    app.add_option(
            "--output",
            output_path,
            "Path to output file (default: stdout)");

    app.add_option(
            "--max_gap",
            config.max_gap,
            "Maximum unaligned distance (bp) between consecutive alignments of one block, in ref and in query")
            ->check(CLI::NonNegativeNumber);

    app.add_option(
            "--overlap_tolerance",
            config.overlap_tolerance,
            "Maximum overlap (bp) between consecutive alignments of one block, in ref and in query")
            ->check(CLI::NonNegativeNumber);

    app.add_option(
            "--tie_break",
            tie_break,
            "Which alignment takes precedence when two start at the same position: 'first' keeps input order, "
            "'identity' prefers the higher identity")
            ->check(CLI::IsMember({"first", "identity"}));

    app.add_option(
            "--min_block_length",
            min_block_length,
            "Drop blocks whose ref or query span is shorter than this (bp), default keeps all blocks")
            ->check(CLI::NonNegativeNumber);

    app.add_option(
            "--n_threads",
            config.n_threads,
            "Maximum number of threads to use, contig pairs are chained in parallel")
            ->check(CLI::PositiveNumber);

    app.add_flag("--debug", HAPSYN_DEBUG, "Invoke this to log every block as it is produced");

    try{
        app.parse(argc, argv);
    }
    catch (const CLI::ParseError &e) {
        return app.exit(e);
    }

    if (HAPSYN_DEBUG){
        cerr << DEBUG_BANNER;
    }

    CPPTRACE_TRY {
        config.tie_break = parse_tie_break(tie_break);

        chain_synteny(
                coords_path,
                output_path,
                contig,
                config,
                min_block_length
        );
    }
    CPPTRACE_CATCH(const exception& e) {
        cerr << e.what() << '\n';

        // Bad input is reported by message alone, anything else gets a trace
        if (HAPSYN_DEBUG or dynamic_cast<const MalformedRecord*>(&e) == nullptr){
            cpptrace::from_current_exception().print();
        }
        return 1;
    }

    return 0;
}
