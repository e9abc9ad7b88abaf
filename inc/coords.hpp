#pragma once

#include "misc.hpp"

#include <functional>
#include <stdexcept>
#include <cstdint>
#include <istream>
#include <ostream>
#include <string>
#include <vector>

using std::runtime_error;
using std::function;
using std::ostream;
using std::string;
using std::vector;

#include <filesystem>
using std::filesystem::path;


namespace hapsyn{


/**
 * Thrown when a coordinate record does not have the expected fields, types, or internal consistency. Carries the
 * 1-based line number (0 if the record did not come from a line) so the diagnostic can point at the input.
 */
class MalformedRecord: public runtime_error{
    int64_t line_number;

public:
    MalformedRecord(const string& message, int64_t line_number=0);
    [[nodiscard]] int64_t get_line_number() const;
};


/**
 * One row of `show-coords -r -T -l -d -c` output. Coordinates are 1-based and inclusive. A reverse alignment is
 * represented the way show-coords represents it, with query_start > query_end.
 */
class AlignmentSegment{
public:
    int64_t ref_start = 0;
    int64_t ref_end = 0;
    int64_t query_start = 0;
    int64_t query_end = 0;
    int64_t ref_len = 0;
    int64_t query_len = 0;
    double identity_pct = 0;
    int64_t ref_contig_len = 0;
    int64_t query_contig_len = 0;
    string ref_contig_id;
    string query_contig_id;

    AlignmentSegment()=default;
    AlignmentSegment(
            int64_t ref_start,
            int64_t ref_end,
            int64_t query_start,
            int64_t query_end,
            double identity_pct,
            int64_t ref_contig_len,
            int64_t query_contig_len,
            const string& ref_contig_id,
            const string& query_contig_id
    );

    [[nodiscard]] bool is_reverse() const;
    [[nodiscard]] int64_t query_low() const;
    [[nodiscard]] int64_t query_high() const;

    /// Tab separated, same column order as the output of the chainer (without optional columns)
    [[nodiscard]] string to_string() const;

    bool operator==(const AlignmentSegment& other) const;
};


/// Minimum number of whitespace-delimited fields: 9 numeric columns plus the two contig names
static const size_t COORDS_MIN_FIELDS = 11;

/// Full `-l -d -c` layout: coverage (2) and frame (2) columns between the lengths and the names
static const size_t COORDS_MAX_FIELDS = 15;

/**
 * Decode one coords line into a segment
 * @param line whitespace-delimited record with no header
 * @param line_number used only for diagnostics
 * @return the decoded segment, or throws MalformedRecord
 */
AlignmentSegment parse_coords_line(const string& line, int64_t line_number);

/**
 * Iterate the segments of a coords file in input order. Blank lines are skipped.
 * @param coords_path path to the coords table, or "-" to read stdin
 * @param f lambda function to operate on each segment
 */
void for_segment_in_coords(const path& coords_path, const function<void(const AlignmentSegment& s)>& f);

void for_segment_in_coords(std::istream& input, const function<void(const AlignmentSegment& s)>& f);

void load_coords(const path& coords_path, vector<AlignmentSegment>& segments);

void load_coords(std::istream& input, vector<AlignmentSegment>& segments);

}


ostream& operator<<(ostream& o, const hapsyn::AlignmentSegment& s);
