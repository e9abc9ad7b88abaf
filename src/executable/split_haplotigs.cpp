#include "haplotigs.hpp"
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
using std::ifstream;
using std::ofstream;
using std::cerr;


using namespace hapsyn;


void split_haplotigs(path fasta_path, path output_dir, const string& contig){
    if (std::filesystem::exists(output_dir)){
        throw runtime_error("ERROR: output dir exists already: " + output_dir.string());
    }
    else{
        std::filesystem::create_directories(output_dir);
    }

    Timer t;

    path primary_path = output_dir / (contig + ".fasta");
    path haplotigs_path = output_dir / (contig + "_haplotigs.fasta");

    ofstream primary_file(primary_path);
    ofstream haplotigs_file(haplotigs_path);

    if (not (primary_file.is_open() and haplotigs_file.is_open())){
        throw runtime_error("ERROR: could not write to output dir: " + output_dir.string());
    }

    cerr << t << "Extracting " << contig << " and its haplotigs" << '\n';

    HaplotigSplitCounts counts;

    if (fasta_path == "-"){
        counts = hapsyn::split_haplotigs(std::cin, contig, primary_file, haplotigs_file);
    }
    else{
        ifstream file(fasta_path);

        if (not (file.is_open() and file.good())){
            throw runtime_error("ERROR: could not read file: " + fasta_path.string());
        }

        counts = hapsyn::split_haplotigs(file, contig, primary_file, haplotigs_file);
    }

    if (counts.n_haplotigs == 0){
        cerr << "WARNING: no haplotigs found for primary contig " << contig << '\n';
    }

    cerr << t << "Wrote " << counts.n_primary << " primary and " << counts.n_haplotigs << " haplotig sequences, skipped "
         << counts.n_skipped << '\n';
    cerr << t << "Done" << '\n';
}


int main (int argc, char* argv[]){
    path fasta_path;
    path output_dir;
    string contig;

    CLI::App app{"Extract a primary contig and its haplotigs (<contig>_<digits>) from a combined fasta"};

    app.add_option(
            "--fasta",
            fasta_path,
            "Path to fasta containing primary contigs and haplotigs. Use - for stdin")
            ->required();

    app.add_option(
            "--contig",
            contig,
            "Name of the primary contig to extract")
            ->required();

    app.add_option(
            "--output_dir",
            output_dir,
            "Path to output directory which must not exist yet")
            ->required();

    try{
        app.parse(argc, argv);
    }
    catch (const CLI::ParseError &e) {
        return app.exit(e);
    }

    CPPTRACE_TRY {
        split_haplotigs(fasta_path, output_dir, contig);
    }
    CPPTRACE_CATCH(const exception& e) {
        cerr << e.what() << '\n';
        cpptrace::from_current_exception().print();
        return 1;
    }

    return 0;
}
