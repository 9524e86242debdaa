// Copyright 2013 Nadia Davidson for Murdoch Childrens Research
// Institute Australia. This program is distributed under the GNU
// General Public License. We also ask that you cite this software in
// publications where you made use of it for any part of the data
// analysis.

// Isoform IDs from the mapped-read FASTQ.  Record names look like
//
//     PB.3811.1|chr1:14500-15200(+)|c4567/f12p0/1650
//
// and the isoform is the part before the first '|'.  The FASTQ order
// defines the rows of the count matrix.  Any htslib-readable sequence
// file works (FASTQ, FASTA, SAM/BAM, optionally compressed).

#pragma once

#include <string>
#include <vector>

// Part of a record name before the first '|'.
std::string isoform_from_record_name(const std::string &name);

// Distinct isoform IDs in order of first appearance.
// Throws MissingFileError if the file cannot be opened and
// FormatError if htslib cannot parse a record.
std::vector<std::string> read_mapped_isoforms(const std::string &filename);
