// Copyright 2013 Nadia Davidson for Murdoch Childrens Research
// Institute Australia. This program is distributed under the GNU
// General Public License. We also ask that you cite this software in
// publications where you made use of it for any part of the data
// analysis.

// Index over the classify report: which primer each full-length read
// came from, and the set of primers seen.
//
// IsoSeq1/2 reports carry an integer "primer" column.  IsoSeq3 reports
// also carry "primer_index" (e.g. 0--7), which takes precedence when
// present.  Reads with primer "NA" are non-full-length and are left
// out of both the primer set and the lookup.

#pragma once

#include <set>
#include <string>
#include <unordered_map>

class DelimitedTable;

class ClassifyIndex {
    std::set<std::string> primers_;
    std::unordered_map<std::string, std::string> read_primer_;
    int rows_       = 0;
    int nfl_rows_   = 0;   // skipped, primer == NA
    int duplicates_ = 0;   // read IDs seen more than once

public:
    static inline const std::string no_primer = "NA";

    // Build from a comma-delimited classify report.
    // Throws FormatError if the header lacks "id" or "primer".
    void build(DelimitedTable &table);

    // Primer of a read, or nullptr if the read is not in the index.
    [[nodiscard]] const std::string *find(const std::string &read_id) const {
        auto it = read_primer_.find(read_id);
        return (it != read_primer_.end()) ? &it->second : nullptr;
    }

    // Distinct primers, sorted.
    [[nodiscard]] const std::set<std::string> &primers() const { return primers_; }

    [[nodiscard]] int size() const { return static_cast<int>(read_primer_.size()); }
    [[nodiscard]] int rows_read() const { return rows_; }
    [[nodiscard]] int nfl_skipped() const { return nfl_rows_; }
    [[nodiscard]] int duplicates() const { return duplicates_; }
};
