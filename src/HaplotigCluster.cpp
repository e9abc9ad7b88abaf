#include "HaplotigCluster.hpp"

#include <unordered_map>
#include <stdexcept>
#include <algorithm>
#include <iostream>

using std::unordered_map;
using std::runtime_error;
using std::to_string;
using std::cerr;
using std::min;
using std::max;


namespace hapsyn{


void HaplotigClusterConfig::validate() const{
    if (dist <= 0){
        throw runtime_error("ERROR: clustering distance must be positive: " + to_string(dist));
    }
    if (min_coverage <= 0 or min_coverage > 1){
        throw runtime_error("ERROR: min_coverage must be in (0,1]: " + to_string(min_coverage));
    }
}


void collect_haplotig_coords(const vector<AlignmentSegment>& segments, vector<HaplotigCoords>& result){
    unordered_map<string,size_t> indexes;

    for (const auto& s: segments){
        auto [iter, success] = indexes.try_emplace(s.query_contig_id, result.size());

        if (success){
            result.emplace_back();
            result.back().query_contig_id = s.query_contig_id;
            result.back().query_contig_len = s.query_contig_len;
        }

        auto& h = result[iter->second];

        if (h.query_contig_len != s.query_contig_len){
            throw ContigMetadataConflict("ERROR: query contig " + s.query_contig_id + " has conflicting lengths " +
                                         to_string(h.query_contig_len) + " and " + to_string(s.query_contig_len) +
                                         " in segment: " + s.to_string());
        }

        h.ref_intervals.emplace_back(s.ref_start, s.ref_end);
        h.query_intervals.emplace_back(s.query_low(), s.query_high());
    }

    for (auto& h: result){
        std::stable_sort(h.ref_intervals.begin(), h.ref_intervals.end());
        std::sort(h.query_intervals.begin(), h.query_intervals.end());
    }
}


interval_t cluster_intervals(const vector<interval_t>& intervals, int64_t dist){
    if (intervals.empty()){
        throw runtime_error("ERROR: cannot cluster empty interval list");
    }

    // gaps[i] is the distance between interval i and i+1
    vector<int64_t> gaps;
    for (size_t i=0; i+1<intervals.size(); i++){
        gaps.emplace_back(intervals[i+1].first - intervals[i].second);
    }

    // Largest interval, first one wins on ties
    size_t center = 0;
    int64_t max_size = numeric_limits<int64_t>::min();
    for (size_t i=0; i<intervals.size(); i++){
        auto size = intervals[i].second - intervals[i].first;
        if (size > max_size){
            max_size = size;
            center = i;
        }
    }

    // Walk left from the center, stop at the first gap which is too wide
    size_t first = 0;
    for (size_t i=center; i>0; i--){
        if (gaps[i-1] >= dist){
            first = i;
            break;
        }
    }

    // Walk right
    size_t last = intervals.size() - 1;
    for (size_t i=center; i<gaps.size(); i++){
        if (gaps[i] >= dist){
            last = i;
            break;
        }
    }

    interval_t result = {numeric_limits<int64_t>::max(), numeric_limits<int64_t>::min()};
    for (size_t i=first; i<=last; i++){
        result.first = min(result.first, min(intervals[i].first, intervals[i].second));
        result.second = max(result.second, max(intervals[i].first, intervals[i].second));
    }

    return result;
}


HaplotigRegion cluster_haplotig(const HaplotigCoords& coords, const string& primary, const HaplotigClusterConfig& config){
    HaplotigRegion region;
    region.primary = primary;
    region.haplotig = coords.query_contig_id;
    region.haplotig_length = coords.query_contig_len;

    int64_t dist = config.dist;
    int64_t prev_query_size = 0;

    while (true){
        auto ref = cluster_intervals(coords.ref_intervals, dist);
        auto query = cluster_intervals(coords.query_intervals, dist);

        int64_t query_size = query.second - query.first;

        region.primary_start = ref.first;
        region.primary_end = ref.second;
        region.haplotig_start = query.first;
        region.haplotig_end = query.second;

        if (double(query_size)/double(coords.query_contig_len) >= config.min_coverage or query_size == prev_query_size){
            break;
        }

        if (HAPSYN_DEBUG){
            cerr << "DEBUG: " << coords.query_contig_id << " covers " << query_size << " of "
                 << coords.query_contig_len << " bp at dist=" << dist << ", doubling" << '\n';
        }

        dist *= 2;
        prev_query_size = query_size;
    }

    return region;
}


void cluster_haplotigs(
        const vector<AlignmentSegment>& segments,
        const string& primary,
        const HaplotigClusterConfig& config,
        vector<HaplotigRegion>& result
){
    config.validate();

    vector<HaplotigCoords> haplotigs;
    collect_haplotig_coords(segments, haplotigs);

    for (const auto& h: haplotigs){
        result.emplace_back(cluster_haplotig(h, primary, config));
    }
}


void write_haplotig_regions(ostream& output, const vector<HaplotigRegion>& regions){
    output << "Primary\tHaplotig\tPrimary_Start\tPrimary_end\tHaplotig_Start\tHaplotig_End\tHaplotig_Length" << '\n';

    for (const auto& r: regions){
        output << r.primary << '\t'
               << r.haplotig << '\t'
               << r.primary_start << '\t'
               << r.primary_end << '\t'
               << r.haplotig_start << '\t'
               << r.haplotig_end << '\t'
               << r.haplotig_length << '\n';
    }
}


}
