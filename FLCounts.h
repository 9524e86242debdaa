// Copyright 2013 Nadia Davidson for Murdoch Childrens Research
// Institute Australia. This program is distributed under the GNU
// General Public License. We also ask that you cite this software in
// publications where you made use of it for any part of the data
// analysis.

// Full-length read counts per isoform and primer, aggregated from
// the collapsed read_stat table:
//
//     id      length  is_fl   stat    pbid
//     m54006_170729_232022/43123426/1712_71_CCS  1641  Y  unique  PB.3811.1
//
// Only rows with is_fl == "Y" are counted.  Each counted read must be
// present in the ClassifyIndex; otherwise the inputs are inconsistent
// and aggregation stops with MissingReadError.

#pragma once

#include <string>
#include <Isoform.h>

class ClassifyIndex;
class DelimitedTable;

// Sparse isoform x primer matrix.  Pairs never counted read as zero.
class CountMatrix {
    IsoformList isoforms_;

public:
    void add(const std::string &isoform, const std::string &primer, int weight = 1) {
        isoforms_.insert(isoform)->add_fl_count(primer, weight);
    }

    [[nodiscard]] int count(const std::string &isoform, const std::string &primer) const {
        const Isoform *iso = isoforms_.find(isoform);
        return iso ? iso->get_fl_count(primer) : 0;
    }

    [[nodiscard]] const Isoform *find(const std::string &isoform) const {
        return isoforms_.find(isoform);
    }

    [[nodiscard]] int n_isoforms() const { return isoforms_.size(); }
    [[nodiscard]] const IsoformList &isoforms() const { return isoforms_; }
};

class FLCountAggregator {
    int rows_    = 0;
    int fl_rows_ = 0;

public:
    static inline const std::string full_length_flag = "Y";

    // Add every full-length row of the tab-delimited read_stat table
    // to counts.  Throws FormatError if "id", "is_fl" or "pbid" is
    // missing and MissingReadError for an unclassified FL read.
    void aggregate(DelimitedTable &table, const ClassifyIndex &index, CountMatrix &counts);

    [[nodiscard]] int rows_read() const { return rows_; }
    [[nodiscard]] int fl_reads() const { return fl_rows_; }
};
