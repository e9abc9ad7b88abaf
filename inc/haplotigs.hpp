#pragma once

#include "Sequence.hpp"
#include "fasta.hpp"

#include <cstdint>
#include <istream>
#include <ostream>
#include <string>

using std::ostream;
using std::string;


namespace hapsyn{


/**
 * Haplotigs of a primary contig are named `<primary>_<digits>`, e.g. 000123F_001 for primary 000123F
 */
bool is_haplotig_name(const string& name, const string& primary);


class HaplotigSplitCounts{
public:
    size_t n_primary = 0;
    size_t n_haplotigs = 0;
    size_t n_skipped = 0;
};


/**
 * Stream a combined primary+haplotig fasta, writing the primary record and the haplotig records of `primary` to
 * separate outputs. All other records are skipped.
 * @throws runtime_error if the primary is missing or occurs more than once
 */
HaplotigSplitCounts split_haplotigs(
        std::istream& input,
        const string& primary,
        ostream& primary_output,
        ostream& haplotigs_output
);

}
