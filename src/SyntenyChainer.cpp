#include "SyntenyChainer.hpp"

#include <exception>
#include <stdexcept>
#include <algorithm>
#include <iostream>
#include <utility>
#include <atomic>
#include <thread>

using std::exception_ptr;
using std::runtime_error;
using std::thread;
using std::atomic;
using std::cerr;
using std::min;
using std::max;


namespace hapsyn{


TieBreak parse_tie_break(const string& name){
    if (name == "first"){
        return TieBreak::FIRST;
    }
    else if (name == "identity"){
        return TieBreak::IDENTITY;
    }
    else{
        throw runtime_error("ERROR: unrecognized tie break policy: " + name);
    }
}


string tie_break_name(TieBreak t){
    switch (t){
        case TieBreak::FIRST: return "first";
        case TieBreak::IDENTITY: return "identity";
    }

    throw runtime_error("ERROR: unrecognized tie break policy");
}


void ChainerConfig::validate() const{
    if (max_gap < 0){
        throw runtime_error("ERROR: max_gap must be non-negative: " + std::to_string(max_gap));
    }
    if (overlap_tolerance < 0){
        throw runtime_error("ERROR: overlap_tolerance must be non-negative: " + std::to_string(overlap_tolerance));
    }
    if (n_threads == 0){
        throw runtime_error("ERROR: n_threads must be at least 1");
    }
}


ContigMetadataConflict::ContigMetadataConflict(const string& message):
        MalformedRecord(message)
{}


SyntenyBlock::SyntenyBlock(const AlignmentSegment& first):
        members({first}),
        weighted_identity_sum(first.identity_pct*double(first.ref_len)),
        member_ref_length_sum(first.ref_len),
        ref_contig_id(first.ref_contig_id),
        query_contig_id(first.query_contig_id),
        ref_contig_len(first.ref_contig_len),
        query_contig_len(first.query_contig_len),
        ref_start(first.ref_start),
        ref_end(first.ref_end),
        query_low(first.query_low()),
        query_high(first.query_high()),
        reverse(first.is_reverse())
{}


void SyntenyBlock::extend(const AlignmentSegment& s){
    ref_start = min(ref_start, s.ref_start);
    ref_end = max(ref_end, s.ref_end);
    query_low = min(query_low, s.query_low());
    query_high = max(query_high, s.query_high());

    weighted_identity_sum += s.identity_pct*double(s.ref_len);
    member_ref_length_sum += s.ref_len;

    members.emplace_back(s);
}


const vector<AlignmentSegment>& SyntenyBlock::get_members() const{
    return members;
}


size_t SyntenyBlock::size() const{
    return members.size();
}


double SyntenyBlock::get_identity() const{
    if (member_ref_length_sum == 0){
        return 0;
    }

    return weighted_identity_sum / double(member_ref_length_sum);
}


int64_t SyntenyBlock::get_ref_length() const{
    return ref_end - ref_start + 1;
}


int64_t SyntenyBlock::get_query_length() const{
    return query_high - query_low + 1;
}


int64_t SyntenyBlock::get_query_start() const{
    return reverse ? query_high : query_low;
}


int64_t SyntenyBlock::get_query_end() const{
    return reverse ? query_low : query_high;
}


AlignmentSegment SyntenyBlock::as_segment() const{
    AlignmentSegment s(
            ref_start,
            ref_end,
            get_query_start(),
            get_query_end(),
            get_identity(),
            ref_contig_len,
            query_contig_len,
            ref_contig_id,
            query_contig_id
    );

    return s;
}


SyntenyChainer::SyntenyChainer(const ChainerConfig& config):
        config(config)
{
    config.validate();
}


void SyntenyChainer::group_segments(const vector<AlignmentSegment>& segments, vector<ContigPairGroup>& groups){
    unordered_map<string, int64_t> ref_lengths;
    unordered_map<string, int64_t> query_lengths;

    // Ref and query names are separate namespaces, so nest them rather than concatenating
    unordered_map<string, unordered_map<string,size_t> > group_indexes;

    auto check_length = [](unordered_map<string,int64_t>& lengths, const string& name, int64_t length, const char* axis, const AlignmentSegment& s){
        auto [iter, success] = lengths.try_emplace(name, length);

        if (not success and iter->second != length){
            throw ContigMetadataConflict("ERROR: " + string(axis) + " contig " + name + " has conflicting lengths " +
                                         std::to_string(iter->second) + " and " + std::to_string(length) + " in segment: " +
                                         s.to_string());
        }
    };

    for (const auto& s: segments){
        check_length(ref_lengths, s.ref_contig_id, s.ref_contig_len, "ref", s);
        check_length(query_lengths, s.query_contig_id, s.query_contig_len, "query", s);

        auto& query_indexes = group_indexes[s.ref_contig_id];
        auto [iter, success] = query_indexes.try_emplace(s.query_contig_id, groups.size());

        if (success){
            groups.emplace_back();
            groups.back().ref_contig_id = s.ref_contig_id;
            groups.back().query_contig_id = s.query_contig_id;
        }

        groups[iter->second].segments.emplace_back(s);
    }
}


void SyntenyChainer::sort_segments(vector<AlignmentSegment>& segments, bool reverse) const{
    auto tie_break = config.tie_break;

    auto comparator = [reverse, tie_break](const AlignmentSegment& a, const AlignmentSegment& b){
        if (a.ref_start != b.ref_start){
            return a.ref_start < b.ref_start;
        }

        if (a.query_start != b.query_start){
            return reverse ? (a.query_start > b.query_start) : (a.query_start < b.query_start);
        }

        if (tie_break == TieBreak::IDENTITY){
            return a.identity_pct > b.identity_pct;
        }

        return false;
    };

    // Stable, so that TieBreak::FIRST (and equal identities) fall back on input order
    std::stable_sort(segments.begin(), segments.end(), comparator);
}


bool SyntenyChainer::is_extendable(const SyntenyBlock& block, const AlignmentSegment& s) const{
    if (s.is_reverse() != block.reverse){
        return false;
    }

    const int64_t tolerance = config.overlap_tolerance;

    // Number of unaligned bp between the trailing edge of the block and the segment (negative if they overlap)
    int64_t ref_gap = s.ref_start - block.ref_end - 1;
    int64_t query_gap;

    if (block.reverse){
        query_gap = block.query_low - s.query_start - 1;
    }
    else{
        query_gap = s.query_start - block.query_high - 1;
    }

    if (ref_gap < -tolerance or ref_gap > config.max_gap){
        return false;
    }

    if (query_gap < -tolerance or query_gap > config.max_gap){
        return false;
    }

    // No backtracking behind the start of the block. The tolerance only applies to the trailing edge, so the start
    // of a block never moves once it is opened.
    if (s.ref_start < block.ref_start){
        return false;
    }

    if (block.reverse){
        if (s.query_start > block.query_high){
            return false;
        }
    }
    else{
        if (s.query_start < block.query_low){
            return false;
        }
    }

    return true;
}


void SyntenyChainer::chain_oriented(vector<AlignmentSegment>& segments, vector<SyntenyBlock>& result) const{
    if (segments.empty()){
        return;
    }

    bool reverse = segments.front().is_reverse();
    sort_segments(segments, reverse);

    enum class State {IDLE, ACCUMULATING};
    State state = State::IDLE;

    // The open block always lives at the back of the result
    for (const auto& s: segments){
        switch (state){
            case State::IDLE:
                result.emplace_back(s);
                state = State::ACCUMULATING;
                break;

            case State::ACCUMULATING:
                if (is_extendable(result.back(), s)){
                    result.back().extend(s);
                }
                else{
                    // Close the current block and start a new one from this segment
                    result.emplace_back(s);
                }
                break;
        }
    }
}


void SyntenyChainer::chain_group(const ContigPairGroup& group, vector<SyntenyBlock>& result) const{
    vector<AlignmentSegment> forward;
    vector<AlignmentSegment> reverse;

    for (const auto& s: group.segments){
        if (s.is_reverse()){
            reverse.emplace_back(s);
        }
        else{
            forward.emplace_back(s);
        }
    }

    chain_oriented(forward, result);
    chain_oriented(reverse, result);
}


static void chain_group_thread_fn(
        const SyntenyChainer& chainer,
        const vector<ContigPairGroup>& groups,
        vector <vector<SyntenyBlock> >& group_results,
        vector<exception_ptr>& group_errors,
        atomic<size_t>& job_index
){
    size_t i = job_index.fetch_add(1);

    while (i < groups.size()){
        try {
            chainer.chain_group(groups[i], group_results[i]);
        }
        catch (...) {
            // Handed back to the calling thread, which rethrows
            group_errors[i] = std::current_exception();
        }

        i = job_index.fetch_add(1);
    }
}


void SyntenyChainer::chain(const vector<AlignmentSegment>& segments, vector<SyntenyBlock>& result) const{
    vector<ContigPairGroup> groups;
    group_segments(segments, groups);

    vector <vector<SyntenyBlock> > group_results(groups.size());

    if (config.n_threads <= 1 or groups.size() <= 1){
        for (size_t i=0; i<groups.size(); i++){
            chain_group(groups[i], group_results[i]);
        }
    }
    else{
        vector<exception_ptr> group_errors(groups.size());

        // Thread-related variables
        atomic<size_t> job_index = 0;
        vector<thread> threads;

        size_t n_threads = min(config.n_threads, groups.size());
        threads.reserve(n_threads);

        for (size_t n=0; n<n_threads; n++){
            threads.emplace_back(chain_group_thread_fn,
                                 std::cref(*this),
                                 std::cref(groups),
                                 std::ref(group_results),
                                 std::ref(group_errors),
                                 std::ref(job_index)
            );
        }

        // Wait for threads to finish
        for (auto& t: threads){
            t.join();
        }

        for (const auto& e: group_errors){
            if (e){
                std::rethrow_exception(e);
            }
        }
    }

    for (size_t i=0; i<groups.size(); i++){
        if (HAPSYN_DEBUG){
            cerr << "DEBUG: " << groups[i].ref_contig_id << ',' << groups[i].query_contig_id << ' '
                 << groups[i].segments.size() << " segments -> " << group_results[i].size() << " blocks" << '\n';

            for (const auto& b: group_results[i]){
                cerr << "DEBUG:     " << b << '\t' << b.size() << " members" << '\n';
            }
        }

        for (auto& b: group_results[i]){
            result.emplace_back(std::move(b));
        }
    }
}


void remove_short_blocks(vector<SyntenyBlock>& blocks, int64_t min_length){
    if (min_length <= 0){
        return;
    }

    std::erase_if(blocks, [min_length](const SyntenyBlock& b){
        return b.get_ref_length() < min_length or b.get_query_length() < min_length;
    });
}


void write_blocks(ostream& output, const vector<SyntenyBlock>& blocks){
    for (const auto& b: blocks){
        output << b << '\n';
    }
}


}


ostream& operator<<(ostream& o, const hapsyn::SyntenyBlock& b){
    o << b.as_segment();
    return o;
}
