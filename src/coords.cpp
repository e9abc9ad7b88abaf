#include "coords.hpp"

#include <iostream>
#include <iomanip>
#include <sstream>
#include <fstream>
#include <cstdlib>

using std::ostringstream;
using std::ifstream;
using std::to_string;
using std::cerr;


namespace hapsyn{


MalformedRecord::MalformedRecord(const string& message, int64_t line_number):
        runtime_error(message),
        line_number(line_number)
{}


int64_t MalformedRecord::get_line_number() const{
    return line_number;
}


AlignmentSegment::AlignmentSegment(
        int64_t ref_start,
        int64_t ref_end,
        int64_t query_start,
        int64_t query_end,
        double identity_pct,
        int64_t ref_contig_len,
        int64_t query_contig_len,
        const string& ref_contig_id,
        const string& query_contig_id
):
        ref_start(ref_start),
        ref_end(ref_end),
        query_start(query_start),
        query_end(query_end),
        ref_len(ref_end - ref_start + 1),
        query_len(llabs(query_end - query_start) + 1),
        identity_pct(identity_pct),
        ref_contig_len(ref_contig_len),
        query_contig_len(query_contig_len),
        ref_contig_id(ref_contig_id),
        query_contig_id(query_contig_id)
{}


bool AlignmentSegment::is_reverse() const{
    return query_start > query_end;
}


int64_t AlignmentSegment::query_low() const{
    return is_reverse() ? query_end : query_start;
}


int64_t AlignmentSegment::query_high() const{
    return is_reverse() ? query_start : query_end;
}


string AlignmentSegment::to_string() const{
    ostringstream s;
    s << *this;
    return s.str();
}


bool AlignmentSegment::operator==(const AlignmentSegment& other) const{
    return ref_start == other.ref_start and
           ref_end == other.ref_end and
           query_start == other.query_start and
           query_end == other.query_end and
           ref_len == other.ref_len and
           query_len == other.query_len and
           identity_pct == other.identity_pct and
           ref_contig_len == other.ref_contig_len and
           query_contig_len == other.query_contig_len and
           ref_contig_id == other.ref_contig_id and
           query_contig_id == other.query_contig_id;
}


static int64_t parse_int_field(const vector<string>& tokens, size_t index, const char* name, const string& line, int64_t line_number){
    int64_t result;

    if (not parse_int64(tokens[index], result)){
        throw MalformedRecord("ERROR: non-integer " + string(name) + " '" + tokens[index] + "' on line " +
                              to_string(line_number) + ": " + line, line_number);
    }

    return result;
}


AlignmentSegment parse_coords_line(const string& line, int64_t line_number){
    vector<string> tokens;
    split_whitespace(line, tokens);

    if (tokens.size() < COORDS_MIN_FIELDS or tokens.size() > COORDS_MAX_FIELDS){
        throw MalformedRecord("ERROR: expected " + to_string(COORDS_MIN_FIELDS) + " to " +
                              to_string(COORDS_MAX_FIELDS) + " fields but found " + to_string(tokens.size()) +
                              " on line " + to_string(line_number) + ": " + line, line_number);
    }

    AlignmentSegment s;

    s.ref_start = parse_int_field(tokens, 0, "ref_start", line, line_number);
    s.ref_end = parse_int_field(tokens, 1, "ref_end", line, line_number);
    s.query_start = parse_int_field(tokens, 2, "query_start", line, line_number);
    s.query_end = parse_int_field(tokens, 3, "query_end", line, line_number);
    s.ref_len = parse_int_field(tokens, 4, "ref_len", line, line_number);
    s.query_len = parse_int_field(tokens, 5, "query_len", line, line_number);

    if (not parse_double(tokens[6], s.identity_pct)){
        throw MalformedRecord("ERROR: non-numeric identity '" + tokens[6] + "' on line " +
                              to_string(line_number) + ": " + line, line_number);
    }

    s.ref_contig_len = parse_int_field(tokens, 7, "ref_contig_len", line, line_number);
    s.query_contig_len = parse_int_field(tokens, 8, "query_contig_len", line, line_number);

    // Coverage and frame columns are not used, but they must still be numbers or the layout is not what we think
    for (size_t i=9; i<tokens.size()-2; i++){
        double x;
        if (not parse_double(tokens[i], x)){
            throw MalformedRecord("ERROR: non-numeric optional column " + to_string(i+1) + " '" + tokens[i] +
                                  "' on line " + to_string(line_number) + ": " + line, line_number);
        }
    }

    s.ref_contig_id = tokens[tokens.size()-2];
    s.query_contig_id = tokens[tokens.size()-1];

    string reason;

    if (s.ref_start < 1 or s.query_start < 1 or s.query_end < 1){
        reason = "coordinates must be 1-based positive integers";
    }
    else if (s.ref_end < s.ref_start){
        reason = "ref_end < ref_start";
    }
    else if (s.ref_len != s.ref_end - s.ref_start + 1){
        reason = "ref_len does not equal ref_end - ref_start + 1";
    }
    else if (s.query_len <= 0){
        reason = "query_len must be positive";
    }
    else if (s.identity_pct < 0 or s.identity_pct > 100){
        reason = "identity must be within [0,100]";
    }
    else if (s.ref_contig_len <= 0 or s.query_contig_len <= 0){
        reason = "contig lengths must be positive";
    }

    if (not reason.empty()){
        throw MalformedRecord("ERROR: " + reason + " on line " + to_string(line_number) + ": " + line, line_number);
    }

    return s;
}


void for_segment_in_coords(std::istream& input, const function<void(const AlignmentSegment& s)>& f){
    for_line_in_stream(input, [&](const string& line, int64_t line_number){
        if (line.find_first_not_of(" \t") == string::npos){
            if (HAPSYN_DEBUG){
                cerr << "WARNING: skipping empty line " << line_number << '\n';
            }
            return;
        }

        f(parse_coords_line(line, line_number));
    });
}


void for_segment_in_coords(const path& coords_path, const function<void(const AlignmentSegment& s)>& f){
    if (coords_path == "-"){
        for_segment_in_coords(std::cin, f);
        return;
    }

    ifstream file(coords_path);

    if (not (file.is_open() and file.good())){
        throw runtime_error("ERROR: could not read file: " + coords_path.string());
    }

    for_segment_in_coords(file, f);
}


void load_coords(std::istream& input, vector<AlignmentSegment>& segments){
    for_segment_in_coords(input, [&](const AlignmentSegment& s){
        segments.emplace_back(s);
    });
}


void load_coords(const path& coords_path, vector<AlignmentSegment>& segments){
    for_segment_in_coords(coords_path, [&](const AlignmentSegment& s){
        segments.emplace_back(s);
    });
}


}


ostream& operator<<(ostream& o, const hapsyn::AlignmentSegment& s){
    auto flags = o.flags();
    auto precision = o.precision();

    o << s.ref_start << '\t'
      << s.ref_end << '\t'
      << s.query_start << '\t'
      << s.query_end << '\t'
      << s.ref_len << '\t'
      << s.query_len << '\t'
      << std::fixed << std::setprecision(2) << s.identity_pct << '\t';

    o.flags(flags);
    o.precision(precision);

    o << s.ref_contig_len << '\t'
      << s.query_contig_len << '\t'
      << s.ref_contig_id << '\t'
      << s.query_contig_id;

    return o;
}
