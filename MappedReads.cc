// Copyright 2013 Nadia Davidson for Murdoch Childrens Research
// Institute Australia. This program is distributed under the GNU
// General Public License. We also ask that you cite this software in
// publications where you made use of it for any part of the data
// analysis.

#include <MappedReads.h>
#include <Errors.h>
#include <Progress.h>

#include <unordered_set>
#include <htslib/sam.h>

using std::string;
using std::vector;

namespace {

// Owns the htslib handles for one file; released on scope exit.
struct HtsReader {
    samFile *in   = nullptr;
    sam_hdr_t *hdr = nullptr;
    bam1_t *b     = nullptr;

    explicit HtsReader(const string &filename) {
        in = sam_open(filename.c_str(), "r");
        if (!in)
            throw MissingFileError(filename);
        hdr = sam_hdr_read(in);
        if (!hdr)
            throw FormatError("fail to read header from " + filename);
        b = bam_init1();
    }
    HtsReader(const HtsReader &) = delete;
    HtsReader &operator=(const HtsReader &) = delete;

    ~HtsReader() {
        if (b)   bam_destroy1(b);
        if (hdr) sam_hdr_destroy(hdr);
        if (in)  sam_close(in);
    }
};

} // namespace

string isoform_from_record_name(const string &name) {
    return name.substr(0, name.find('|'));
}

vector<string> read_mapped_isoforms(const string &filename) {
    HtsReader reader(filename);

    vector<string> isoforms;
    std::unordered_set<string> seen;
    progress::ProgressLine rec_progress("mapped reads");
    int64_t rec_count = 0;

    int ret;
    while ((ret = sam_read1(reader.in, reader.hdr, reader.b)) >= 0) {
        string pbid = isoform_from_record_name(bam_get_qname(reader.b));
        if (seen.insert(pbid).second)
            isoforms.push_back(pbid);
        rec_count++;
        rec_progress.update(rec_count);
    }
    if (ret < -1)
        throw FormatError("fail to parse record " + std::to_string(rec_count + 1)
                          + " of " + filename);
    rec_progress.finish();
    return isoforms;
}
