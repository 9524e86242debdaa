// Copyright 2013 Nadia Davidson for Murdoch Childrens Research
// Institute Australia. This program is distributed under the GNU
// General Public License. We also ask that you cite this software in
// publications where you made use of it for any part of the data
// analysis.

// Locates the inputs of a SMRT Link IsoSeq job directory.  IsoSeq1 and
// IsoSeq2 write the mapped FASTQ and read_stat table under different
// task directories; the classify report is in the same place for both.
// IsoSeq1 is detected by the presence of its mapped FASTQ.

#pragma once

#include <string>
#include <string_view>

struct JobFiles {
    std::string mapped_fastq;
    std::string mapped_gff;
    std::string read_stat;
    std::string classify_csv;
    int isoseq_version = 0;
};

class JobDir {
public:
    static constexpr std::string_view isoseq1_task  = "tasks/pbtranscript.tasks.post_mapping_to_genome-0";
    static constexpr std::string_view isoseq2_task  = "tasks/pbtranscript2tools.tasks.post_mapping_to_genome-0";
    static constexpr std::string_view classify_task = "tasks/pbcoretools.tasks.gather_csv-1";

    static constexpr std::string_view mapped_fastq_name = "output_mapped.fastq";
    static constexpr std::string_view mapped_gff_name   = "output_mapped.gff";
    static constexpr std::string_view read_stat_name    = "output_mapped.no5merge.collapsed.read_stat.txt";
    static constexpr std::string_view classify_name     = "file.csv";

    // Paths of the job's inputs.  Existence of anything but the
    // IsoSeq1 FASTQ is not checked here.
    static JobFiles resolve(const std::string &job_dir);

    // Symlink the resolved files into out_dir as mapped.fastq,
    // mapped.gff, mapped.read_stat.txt and classify_report.csv, and
    // return the linked paths.  Throws std::filesystem::filesystem_error
    // if a link cannot be created (e.g. it already exists).
    static JobFiles link(const JobFiles &files, const std::string &out_dir);
};
