#include "cpptrace/from_current.hpp"
#include "Sequence.hpp"
#include "fasta.hpp"

using hapsyn::for_sequence_in_fasta_file;
using hapsyn::for_sequence_in_fasta;
using hapsyn::write_fasta_record;
using hapsyn::Sequence;

#include <filesystem>
#include <stdexcept>
#include <iostream>
#include <sstream>
#include <vector>

using std::filesystem::path;
using std::runtime_error;
using std::stringstream;
using std::to_string;
using std::string;
using std::vector;
using std::cerr;


void test_file(path data_directory){
    path fasta_path = data_directory / "test.fasta";

    vector<Sequence> expected_results = {
            Sequence("a", "AAAA"),
            Sequence("c", "CCCCCCCC"),
            Sequence("g", "GGGGGGGGGGGG")
    };

    size_t i=0;
    for_sequence_in_fasta_file(fasta_path,[&](const Sequence& r){
        cerr << r.name << '\t' << r.sequence << '\n';

        if (i >= expected_results.size() or not (r == expected_results[i])){
            throw runtime_error("FAIL: result not expected for record: " + to_string(i));
        }

        i++;
    });

    if (i != expected_results.size()){
        throw runtime_error("FAIL: expected " + to_string(expected_results.size()) + " records, found " + to_string(i));
    }
}


void test_stream(){
    stringstream input;
    input << ">x desc\r\nAC\r\nGT\r\n\n>y\n>z\nTT";

    vector<Sequence> results;
    for_sequence_in_fasta(input, [&](const Sequence& r){
        results.emplace_back(r);
    });

    // Empty records are still reported, and the last record does not need a trailing newline
    vector<Sequence> expected_results = {
            Sequence("x", "ACGT"),
            Sequence("y", ""),
            Sequence("z", "TT")
    };

    if (results != expected_results){
        throw runtime_error("FAIL: unexpected records parsed from stream");
    }

    stringstream output;
    write_fasta_record(output, results[0]);

    if (output.str() != ">x\nACGT\n"){
        throw runtime_error("FAIL: unexpected fasta record written: " + output.str());
    }
}


void test_no_header(){
    stringstream input;
    input << "ACGT\n>x\nAC\n";

    try {
        for_sequence_in_fasta(input, [&](const Sequence& r){});
    }
    catch (const runtime_error& e){
        cerr << '\t' << e.what() << '\n';
        return;
    }

    throw runtime_error("FAIL: sequence before header accepted");
}


void test_bad_extension(path data_directory){
    try {
        for_sequence_in_fasta_file(data_directory / "test.coords", [&](const Sequence& r){});
    }
    catch (const runtime_error& e){
        cerr << '\t' << e.what() << '\n';
        return;
    }

    throw runtime_error("FAIL: non fasta extension accepted");
}


int main(){
    CPPTRACE_TRY {
        path project_directory = path(__FILE__).parent_path().parent_path().parent_path();
        path data_directory = project_directory / "data";

        cerr << data_directory << '\n';

        cerr << "TESTING: file\n";
        test_file(data_directory);

        cerr << "TESTING: stream\n";
        test_stream();

        cerr << "TESTING: no_header\n";
        test_no_header();

        cerr << "TESTING: bad_extension\n";
        test_bad_extension(data_directory);
    }
    CPPTRACE_CATCH(const std::exception& e) {
        std::cerr<<"Exception: "<<e.what()<<std::endl;
        cpptrace::from_current_exception().print_with_snippets();
        throw runtime_error("FAIL: exception caught");
    }

    cerr << "PASS\n";

    return 0;
}
