#pragma once

#include "coords.hpp"

#include <unordered_map>
#include <functional>
#include <cstdint>
#include <ostream>
#include <string>
#include <vector>

using std::unordered_map;
using std::function;
using std::ostream;
using std::string;
using std::vector;


namespace hapsyn{


/**
 * How to order segments which start at the same ref and query position. FIRST keeps input order, IDENTITY puts the
 * higher identity segment first so that it takes the extension rights for the current block.
 */
enum class TieBreak {
    FIRST,
    IDENTITY
};

TieBreak parse_tie_break(const string& name);

string tie_break_name(TieBreak t);


class ChainerConfig {
public:
    ChainerConfig() = default;

    // Maximum number of unaligned bp between the trailing edge of a block and the next segment, in either axis
    int64_t max_gap = 15000;

    // Maximum overlap (in bp) between the trailing edge of a block and the next segment, in either axis
    int64_t overlap_tolerance = 1000;

    TieBreak tie_break = TieBreak::FIRST;

    // Contig pairs are independent, so they can be chained concurrently
    size_t n_threads = 1;

    void validate() const;
};


/**
 * Two segments referring to the same contig disagree on the length of that contig
 */
class ContigMetadataConflict: public MalformedRecord{
public:
    explicit ContigMetadataConflict(const string& message);
};


/**
 * A chain of collinear segments between one ref contig and one query contig, in a single orientation. The envelope is
 * stored orientation-free as [query_low, query_high], and converted back to show-coords convention (start > end for
 * reverse) on output.
 */
class SyntenyBlock{
    vector<AlignmentSegment> members;
    double weighted_identity_sum = 0;
    int64_t member_ref_length_sum = 0;

public:
    string ref_contig_id;
    string query_contig_id;
    int64_t ref_contig_len;
    int64_t query_contig_len;
    int64_t ref_start;
    int64_t ref_end;
    int64_t query_low;
    int64_t query_high;
    bool reverse;

    explicit SyntenyBlock(const AlignmentSegment& first);

    /// Grow the envelope to include the segment and append it to the members, no compatibility checks are done here
    void extend(const AlignmentSegment& s);

    [[nodiscard]] const vector<AlignmentSegment>& get_members() const;
    [[nodiscard]] size_t size() const;

    /// ref_len weighted mean of the member identities
    [[nodiscard]] double get_identity() const;
    [[nodiscard]] int64_t get_ref_length() const;
    [[nodiscard]] int64_t get_query_length() const;
    [[nodiscard]] int64_t get_query_start() const;
    [[nodiscard]] int64_t get_query_end() const;

    /// Collapse the block into one coords record, which can be fed back into the loader or the chainer
    [[nodiscard]] AlignmentSegment as_segment() const;
};


class ContigPairGroup{
public:
    string ref_contig_id;
    string query_contig_id;
    vector<AlignmentSegment> segments;
};


class SyntenyChainer{
    ChainerConfig config;

public:
    explicit SyntenyChainer(const ChainerConfig& config);

    /**
     * Group segments by (ref contig, query contig) in order of first appearance, and chain each group. Output order is
     * group order, then forward blocks followed by reverse blocks, then chain order. This does not depend on the
     * number of threads.
     * @param segments all segments of the run, expected to be sorted by query, ref, ref_start
     * @param result blocks are appended here
     */
    void chain(const vector<AlignmentSegment>& segments, vector<SyntenyBlock>& result) const;

    /**
     * Chain the segments of a single contig pair
     */
    void chain_group(const ContigPairGroup& group, vector<SyntenyBlock>& result) const;

    /**
     * Chain one orientation of one contig pair. Segments are sorted in place before the greedy merge.
     */
    void chain_oriented(vector<AlignmentSegment>& segments, vector<SyntenyBlock>& result) const;

    /**
     * Collinearity and proximity test of a segment against the trailing edge of the open block
     */
    [[nodiscard]] bool is_extendable(const SyntenyBlock& block, const AlignmentSegment& s) const;

    void sort_segments(vector<AlignmentSegment>& segments, bool reverse) const;

    /**
     * Partition segments into contig pair groups, while verifying that every contig has one length
     * @throws ContigMetadataConflict
     */
    static void group_segments(const vector<AlignmentSegment>& segments, vector<ContigPairGroup>& groups);
};


/// Caller level filter: drop blocks whose ref or query envelope is shorter than min_length
void remove_short_blocks(vector<SyntenyBlock>& blocks, int64_t min_length);

void write_blocks(ostream& output, const vector<SyntenyBlock>& blocks);

}


ostream& operator<<(ostream& o, const hapsyn::SyntenyBlock& b);
