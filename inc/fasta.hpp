#pragma once

#include <functional>
#include <filesystem>
#include <istream>
#include <ostream>
using std::filesystem::path;
using std::function;
using std::ostream;

#include "Sequence.hpp"

namespace hapsyn {

void for_sequence_in_fasta_file(path fasta_path, const function<void(const Sequence& s)>& f);

void for_sequence_in_fasta(std::istream& input, const function<void(const Sequence& s)>& f);

/**
 * Write one record with the sequence on a single line
 */
void write_fasta_record(ostream& output, const Sequence& s);

} // hapsyn
