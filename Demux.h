// Copyright 2013 Nadia Davidson for Murdoch Childrens Research
// Institute Australia. This program is distributed under the GNU
// General Public License. We also ask that you cite this software in
// publications where you made use of it for any part of the data
// analysis.

// Runs the three stages that produce the FL count matrix:
//   1 - index the classify report (read -> primer),
//   2 - count full-length reads per isoform and primer (read_stat),
//   3 - write one row per isoform of the mapped FASTQ.

#pragma once

#include <ostream>
#include <string>

struct DemuxInputs {
    std::string mapped_fastq;
    std::string read_stat;
    std::string classify_csv;
    std::string primer_names;   // optional, empty for none
};

struct DemuxSummary {
    int primers       = 0;   // observed in the classify report
    int columns       = 0;   // written, including override-only primers
    int fl_reads      = 0;
    int isoform_rows  = 0;
    int unlisted_isoforms = 0;   // counted but not in the mapped FASTQ
};

// All inputs are checked for existence before any parsing.  Throws
// MissingFileError, FormatError, MissingReadError or OutputError.
DemuxSummary run_demux(const DemuxInputs &inputs, std::ostream &out);

// As above, writing to the file at output ("-" for stdout).  The file
// is opened only after every input has been read and counted, so a
// failed run leaves an existing file untouched.
DemuxSummary run_demux(const DemuxInputs &inputs, const std::string &output);
