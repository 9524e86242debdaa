// Copyright 2013 Nadia Davidson for Murdoch Childrens Research
// Institute Australia. This program is distributed under the GNU
// General Public License. We also ask that you cite this software in
// publications where you made use of it for any part of the data
// analysis.

#include <JobDir.h>
#include <Progress.h>

#include <filesystem>

namespace fs = std::filesystem;
using std::string;

JobFiles JobDir::resolve(const string &job_dir) {
    const fs::path root = fs::absolute(job_dir);
    const fs::path v1 = root / isoseq1_task;
    const fs::path v2 = root / isoseq2_task;

    JobFiles files;
    fs::path task;
    if (fs::exists(v1 / mapped_fastq_name)) {
        progress::print_status("Detecting IsoSeq1 task directories...");
        task = v1;
        files.isoseq_version = 1;
    } else {
        progress::print_status("Detecting IsoSeq2 task directories...");
        task = v2;
        files.isoseq_version = 2;
    }
    files.mapped_fastq = (task / mapped_fastq_name).string();
    files.mapped_gff   = (task / mapped_gff_name).string();
    files.read_stat    = (task / read_stat_name).string();
    files.classify_csv = (root / classify_task / classify_name).string();
    return files;
}

JobFiles JobDir::link(const JobFiles &files, const string &out_dir) {
    const fs::path dir(out_dir);
    JobFiles linked = files;
    linked.mapped_fastq = (dir / "mapped.fastq").string();
    linked.mapped_gff   = (dir / "mapped.gff").string();
    linked.read_stat    = (dir / "mapped.read_stat.txt").string();
    linked.classify_csv = (dir / "classify_report.csv").string();

    fs::create_symlink(files.mapped_fastq, linked.mapped_fastq);
    fs::create_symlink(files.mapped_gff,   linked.mapped_gff);
    fs::create_symlink(files.read_stat,    linked.read_stat);
    fs::create_symlink(files.classify_csv, linked.classify_csv);
    return linked;
}
