// Copyright 2013 Nadia Davidson for Murdoch Childrens Research
// Institute Australia. This program is distributed under the GNU
// General Public License. We also ask that you cite this software in
// publications where you made use of it for any part of the data
// analysis.

#include <Demux.h>
#include <ClassifyIndex.h>
#include <DelimitedTable.h>
#include <Errors.h>
#include <FLCounts.h>
#include <MappedReads.h>
#include <MatrixWriter.h>
#include <PrimerNames.h>
#include <Progress.h>

#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <memory>
#include <unordered_set>

using std::string;
using std::vector;

static void check_exists(const string &filename) {
    if (!std::filesystem::exists(filename))
        throw MissingFileError(filename);
}

using MatrixSink = std::function<int(const MatrixWriter &, const vector<string> &,
                                     const CountMatrix &)>;

// Every stage up to the write.  The sink is only called once all
// inputs are read and counted.
static DemuxSummary demux(const DemuxInputs &inputs, const MatrixSink &sink) {
    check_exists(inputs.mapped_fastq);
    check_exists(inputs.read_stat);
    check_exists(inputs.classify_csv);
    if (!inputs.primer_names.empty())
        check_exists(inputs.primer_names);

    DemuxSummary summary;
    double t_start = progress::now();

    progress::print_banner("Reading " + inputs.classify_csv);
    ClassifyIndex index;
    {
        DelimitedTable classify(inputs.classify_csv, ',');
        index.build(classify);
    }
    summary.primers = static_cast<int>(index.primers().size());
    progress::print_status(progress::format_count(index.size()) + " FL reads, "
                           + progress::format_count(index.nfl_skipped()) + " nFL skipped, "
                           + std::to_string(summary.primers) + " primers");
    if (index.duplicates() > 0)
        progress::print_warning(std::to_string(index.duplicates())
                                + " read IDs appear more than once in the classify report;"
                                + " the last occurrence was used.");

    progress::print_banner("Reading " + inputs.read_stat);
    CountMatrix counts;
    FLCountAggregator aggregator;
    {
        DelimitedTable read_stat(inputs.read_stat, '\t');
        aggregator.aggregate(read_stat, index, counts);
    }
    summary.fl_reads = aggregator.fl_reads();
    progress::print_status(progress::format_count(aggregator.fl_reads()) + " FL reads counted over "
                           + progress::format_count(counts.n_isoforms()) + " isoforms");

    std::unique_ptr<PrimerNames> names;
    if (!inputs.primer_names.empty()) {
        names = std::make_unique<PrimerNames>(PrimerNames::load(inputs.primer_names));
        progress::print_status(std::to_string(names->size()) + " primer names from "
                               + inputs.primer_names);
    }
    MatrixWriter writer(resolve_columns(index.primers(), names.get()));
    summary.columns = static_cast<int>(writer.columns().size());

    progress::print_banner("Reading " + inputs.mapped_fastq);
    vector<string> isoforms = read_mapped_isoforms(inputs.mapped_fastq);

    std::unordered_set<string> listed(isoforms.begin(), isoforms.end());
    for (const auto &[pbid, iso] : counts.isoforms()) {
        if (!listed.contains(pbid))
            summary.unlisted_isoforms++;
    }
    if (summary.unlisted_isoforms > 0)
        progress::print_warning(std::to_string(summary.unlisted_isoforms)
                                + " counted isoforms are not in the mapped FASTQ and are not written.");

    summary.isoform_rows = sink(writer, isoforms, counts);
    progress::print_status(progress::ansi::green(
        std::to_string(summary.isoform_rows) + " isoforms x " + std::to_string(summary.columns)
        + " primers in " + progress::format_duration(progress::now() - t_start)));
    return summary;
}

DemuxSummary run_demux(const DemuxInputs &inputs, std::ostream &out) {
    return demux(inputs, [&out](const MatrixWriter &writer, const vector<string> &isoforms,
                                const CountMatrix &counts) {
        return writer.write(isoforms, counts, out);
    });
}

DemuxSummary run_demux(const DemuxInputs &inputs, const string &output) {
    return demux(inputs, [&output](const MatrixWriter &writer, const vector<string> &isoforms,
                                   const CountMatrix &counts) {
        if (output == "-")
            return writer.write(isoforms, counts, std::cout);
        std::ofstream ofile(output);
        if (!ofile.good())
            throw OutputError("Could not open " + output + " for writing");
        int rows = writer.write(isoforms, counts, ofile);
        ofile.close();
        if (ofile.fail())
            throw OutputError("Failed closing " + output);
        return rows;
    });
}
