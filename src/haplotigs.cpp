#include "haplotigs.hpp"

#include <stdexcept>
#include <cctype>

using std::runtime_error;


namespace hapsyn{


bool is_haplotig_name(const string& name, const string& primary){
    // Need at least the underscore and one digit after the primary name
    if (primary.empty() or name.size() < primary.size() + 2){
        return false;
    }

    if (name.compare(0, primary.size(), primary) != 0 or name[primary.size()] != '_'){
        return false;
    }

    for (size_t i=primary.size()+1; i<name.size(); i++){
        if (not isdigit(static_cast<unsigned char>(name[i]))){
            return false;
        }
    }

    return true;
}


HaplotigSplitCounts split_haplotigs(
        std::istream& input,
        const string& primary,
        ostream& primary_output,
        ostream& haplotigs_output
){
    HaplotigSplitCounts counts;

    for_sequence_in_fasta(input, [&](const Sequence& s){
        if (s.name == primary){
            if (counts.n_primary > 0){
                throw runtime_error("ERROR: primary contig occurs more than once in fasta: " + primary);
            }
            write_fasta_record(primary_output, s);
            counts.n_primary++;
        }
        else if (is_haplotig_name(s.name, primary)){
            write_fasta_record(haplotigs_output, s);
            counts.n_haplotigs++;
        }
        else{
            counts.n_skipped++;
        }
    });

    if (counts.n_primary == 0){
        throw runtime_error("ERROR: primary contig not found in fasta: " + primary);
    }

    return counts;
}


}
