#include "fasta.hpp"

#include <stdexcept>
#include <iostream>
#include <fstream>
#include <cctype>

using std::runtime_error;
using std::ifstream;
using std::cerr;


namespace hapsyn {

/**
 * Iterate over the sequences of a Fasta stream, ignoring header annotation fields (anything after the first
 * whitespace of a header line). Multi-line sequences are concatenated, and carriage returns are dropped.
 * @param input stream positioned at the first header
 * @param f lambda function to operate on each sequence
 */
void for_sequence_in_fasta(std::istream& input, const function<void(const Sequence& s)>& f){
    char c;
    Sequence s;

    char header_char = '>';
    bool in_header = false;
    bool in_tags = false;
    bool found_header = false;

    while (input.get(c)){
        if (c == '\r'){
            continue;
        }

        if (in_header){
            if (c == '\n'){
                in_header = false;
                in_tags = false;
            }
            else if (isspace(c)){
                in_tags = true;
            }
            else if (not in_tags){
                s.name += c;
            }
            continue;
        }

        if (c == header_char){
            if (found_header){
                f(s);
                s.name.clear();
                s.sequence.clear();
            }
            found_header = true;
            in_header = true;
            continue;
        }

        if (isspace(c)){
            continue;
        }

        if (not found_header){
            throw runtime_error("ERROR: sequence data found before first fasta header");
        }

        s.sequence += c;
    }

    if (found_header){
        f(s);
    }
}


/**
 * Iterate over the sequences of a Fasta file, or stdin if the path is "-"
 * @param fasta_path path to fasta file on disk
 * @param f lambda function to operate on each sequence
 */
void for_sequence_in_fasta_file(path fasta_path, const function<void(const Sequence& s)>& f){
    if (fasta_path == "-"){
        for_sequence_in_fasta(std::cin, f);
        return;
    }

    auto extension = fasta_path.extension();
    if (not (extension == ".fasta" or extension == ".fa" or extension == ".fna")){
        throw runtime_error("ERROR: file does not have compatible fasta extension: " + fasta_path.string());
    }

    ifstream file(fasta_path);

    if (not (file.is_open() and file.good())){
        throw runtime_error("ERROR: could not read file: " + fasta_path.string());
    }

    for_sequence_in_fasta(file, f);
}


void write_fasta_record(ostream& output, const Sequence& s){
    output << '>' << s.name << '\n';
    output << s.sequence << '\n';
}

} // hapsyn
