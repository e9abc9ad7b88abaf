#pragma once

#include "SyntenyChainer.hpp"
#include "coords.hpp"
#include "misc.hpp"

#include <cstdint>
#include <ostream>
#include <string>
#include <vector>

using std::ostream;
using std::string;
using std::vector;


namespace hapsyn{


/**
 * All of the alignment intervals of one haplotig against the primary contig. Query intervals are stored with
 * start <= stop regardless of the orientation of the alignment.
 */
class HaplotigCoords{
public:
    string query_contig_id;
    int64_t query_contig_len = 0;
    vector<interval_t> ref_intervals;
    vector<interval_t> query_intervals;
};


/**
 * One row of the coarse "where does this haplotig sit on the primary" summary
 */
class HaplotigRegion{
public:
    string primary;
    string haplotig;
    int64_t primary_start = 0;
    int64_t primary_end = 0;
    int64_t haplotig_start = 0;
    int64_t haplotig_end = 0;
    int64_t haplotig_length = 0;
};


class HaplotigClusterConfig{
public:
    HaplotigClusterConfig() = default;

    // Starting distance threshold, doubled on every iteration that fails to cover enough of the haplotig
    int64_t dist = 15000;

    // Fraction of the haplotig length that the query envelope must span to stop iterating
    double min_coverage = 0.95;

    void validate() const;
};


/**
 * Collect the intervals of each query contig, in order of first appearance. Intervals are sorted by start.
 * @throws ContigMetadataConflict if a query contig is given two lengths
 */
void collect_haplotig_coords(const vector<AlignmentSegment>& segments, vector<HaplotigCoords>& result);

/**
 * Start at the largest interval and absorb neighboring intervals in both directions, stopping in each direction at
 * the first gap that is at least `dist`. Intervals must be sorted.
 * @return the envelope of the absorbed intervals
 */
interval_t cluster_intervals(const vector<interval_t>& intervals, int64_t dist);

/**
 * Repeatedly cluster the ref and query intervals of one haplotig, doubling the distance threshold until the query
 * envelope covers `min_coverage` of the haplotig or stops growing.
 */
HaplotigRegion cluster_haplotig(const HaplotigCoords& coords, const string& primary, const HaplotigClusterConfig& config);

void cluster_haplotigs(
        const vector<AlignmentSegment>& segments,
        const string& primary,
        const HaplotigClusterConfig& config,
        vector<HaplotigRegion>& result
);

void write_haplotig_regions(ostream& output, const vector<HaplotigRegion>& regions);

}
