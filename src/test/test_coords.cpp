#include "cpptrace/from_current.hpp"
#include "coords.hpp"
#include "misc.hpp"

using hapsyn::AlignmentSegment;
using hapsyn::MalformedRecord;
using hapsyn::parse_coords_line;
using hapsyn::load_coords;
using hapsyn::HAPSYN_DEBUG;

#include <filesystem>
#include <stdexcept>
#include <iostream>
#include <fstream>
#include <sstream>
#include <vector>

using std::filesystem::path;
using std::runtime_error;
using std::stringstream;
using std::ifstream;
using std::to_string;
using std::string;
using std::vector;
using std::cerr;


/**
 * Check that parsing `line` fails with MalformedRecord, and that the error points at the right line
 */
void expect_malformed(const string& line, const string& description){
    cerr << "\t" << description << '\n';

    try {
        parse_coords_line(line, 7);
    }
    catch (const MalformedRecord& e){
        cerr << "\t\t" << e.what() << '\n';

        if (e.get_line_number() != 7){
            throw runtime_error("FAIL: wrong line number in MalformedRecord for case: " + description);
        }
        return;
    }

    throw runtime_error("FAIL: no MalformedRecord thrown for case: " + description);
}


void test_parse_full_layout(){
    string line = "10001\t40000\t1\t30000\t30000\t30000\t99.50\t500000\t120000\t6.00\t25.00\t1\t1\t000000F\t000000F_001";

    auto s = parse_coords_line(line, 1);

    AlignmentSegment expected(10001, 40000, 1, 30000, 99.5, 500000, 120000, "000000F", "000000F_001");

    cerr << s << '\n';

    if (not (s == expected)){
        throw runtime_error("FAIL: full layout parsed incorrectly: " + s.to_string());
    }

    if (s.is_reverse()){
        throw runtime_error("FAIL: forward alignment parsed as reverse");
    }
}


void test_parse_minimal_layout(){
    // No coverage or frame columns, space delimited
    string line = "  200001 201000   5000 4001 1000 1000 95 500000 120000 000000F 000000F_001 ";

    auto s = parse_coords_line(line, 1);

    if (not s.is_reverse()){
        throw runtime_error("FAIL: reverse alignment not detected");
    }

    if (s.query_low() != 4001 or s.query_high() != 5000){
        throw runtime_error("FAIL: incorrect query bounds for reverse alignment: " + s.to_string());
    }

    if (s.query_len != 1000 or s.ref_contig_id != "000000F" or s.query_contig_id != "000000F_001"){
        throw runtime_error("FAIL: minimal layout parsed incorrectly: " + s.to_string());
    }

    string expected_string = "200001\t201000\t5000\t4001\t1000\t1000\t95.00\t500000\t120000\t000000F\t000000F_001";
    if (s.to_string() != expected_string){
        throw runtime_error("FAIL: unexpected string: " + s.to_string());
    }
}


void test_malformed_lines(){
    expect_malformed("10001 40000 1 30000 30000 30000 99.50 500000 000000F 000000F_001", "too few fields");
    expect_malformed("10001 40000 1 30000 30000 30000 99.50 500000 120000 6 25 1 1 9 000000F 000000F_001", "too many fields");
    expect_malformed("10001 4000O 1 30000 30000 30000 99.50 500000 120000 000000F 000000F_001", "non-integer ref_end");
    expect_malformed("10001 40000 1 30000 30000 30000 high 500000 120000 000000F 000000F_001", "non-numeric identity");
    expect_malformed("10001 40000 1 30000 30000 30000 99.50 500000 120000 6.00 x 000000F 000000F_001", "non-numeric coverage");
    expect_malformed("40000 10001 1 30000 30000 30000 99.50 500000 120000 000000F 000000F_001", "ref_end < ref_start");
    expect_malformed("10001 40000 1 30000 29999 30000 99.50 500000 120000 000000F 000000F_001", "ref_len mismatch");
    expect_malformed("10001 40000 1 30000 30000 30000 100.5 500000 120000 000000F 000000F_001", "identity > 100");
    expect_malformed("10001 40000 1 30000 30000 30000 99.50 0 120000 000000F 000000F_001", "zero contig length");
    expect_malformed("10001 40000 1 30000 30000 -5 99.50 500000 120000 000000F 000000F_001", "negative query_len");
}


void test_load_file(path data_directory){
    vector<AlignmentSegment> segments;
    load_coords(data_directory / "test.coords", segments);

    if (segments.size() != 8){
        throw runtime_error("FAIL: expected 8 segments, found " + to_string(segments.size()));
    }

    // Input order is preserved
    vector<int64_t> expected_ref_starts = {10001, 40101, 100001, 120501, 200001, 300001, 320201, 340001};

    for (size_t i=0; i<segments.size(); i++){
        if (segments[i].ref_start != expected_ref_starts[i]){
            throw runtime_error("FAIL: segment out of order at index " + to_string(i));
        }
    }

    if (segments[5].query_contig_id != "000000F_002" or segments[5].query_contig_len != 60000 or not segments[5].is_reverse()){
        throw runtime_error("FAIL: incorrect segment: " + segments[5].to_string());
    }
}


void test_load_stream(){
    stringstream input;
    input << "1 100 1 100 100 100 99.00 1000 1000 r q\n";
    input << "\n";
    input << "   \t\n";
    input << "201 300 201 300 100 100 98.00 1000 1000 r q\r\n";

    vector<AlignmentSegment> segments;
    load_coords(input, segments);

    if (segments.size() != 2){
        throw runtime_error("FAIL: blank lines not skipped, found " + to_string(segments.size()) + " segments");
    }

    if (segments[1].query_contig_id != "q"){
        throw runtime_error("FAIL: carriage return not stripped from: " + segments[1].query_contig_id);
    }
}


void test_file_matches_stream(path data_directory){
    // Blank lines are reported the same way for both sources
    HAPSYN_DEBUG = true;

    stringstream padded;
    ifstream file(data_directory / "test.coords");
    string line;
    while (std::getline(file, line)){
        padded << line << "\n\n";
    }

    vector<AlignmentSegment> from_path;
    vector<AlignmentSegment> from_stream;

    load_coords(data_directory / "test.coords", from_path);
    load_coords(padded, from_stream);

    HAPSYN_DEBUG = false;

    if (from_path != from_stream){
        throw runtime_error("FAIL: file and stream loading disagree");
    }
}


void test_load_malformed_file(path data_directory){
    vector<AlignmentSegment> segments;

    try {
        load_coords(data_directory / "test_malformed.coords", segments);
    }
    catch (const MalformedRecord& e){
        cerr << "\t" << e.what() << '\n';

        // Line 2 is blank, line 3 is missing the query contig length
        if (e.get_line_number() != 3){
            throw runtime_error("FAIL: expected error on line 3, got " + to_string(e.get_line_number()));
        }
        return;
    }

    throw runtime_error("FAIL: malformed file loaded without error");
}


int main(){
    CPPTRACE_TRY {
        path project_directory = path(__FILE__).parent_path().parent_path().parent_path();
        path data_directory = project_directory / "data";

        cerr << data_directory << '\n';

        cerr << "TESTING: parse_full_layout\n";
        test_parse_full_layout();

        cerr << "TESTING: parse_minimal_layout\n";
        test_parse_minimal_layout();

        cerr << "TESTING: malformed_lines\n";
        test_malformed_lines();

        cerr << "TESTING: load_file\n";
        test_load_file(data_directory);

        cerr << "TESTING: load_stream\n";
        test_load_stream();

        cerr << "TESTING: file_matches_stream\n";
        test_file_matches_stream(data_directory);

        cerr << "TESTING: load_malformed_file\n";
        test_load_malformed_file(data_directory);
    }
    CPPTRACE_CATCH(const std::exception& e) {
        std::cerr<<"Exception: "<<e.what()<<std::endl;
        cpptrace::from_current_exception().print_with_snippets();
        throw runtime_error("FAIL: exception caught");
    }

    cerr << "PASS\n";

    return 0;
}
