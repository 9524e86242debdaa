// Copyright 2013 Nadia Davidson for Murdoch Childrens Research
// Institute Australia. This program is distributed under the GNU
// General Public License. We also ask that you cite this software in
// publications where you made use of it for any part of the data
// analysis.

// One collapsed isoform (pbid) and its full-length read counts,
// keyed by primer.  Primers that never received a read are absent
// and read back as zero.

#pragma once

#include <map>
#include <string>
#include <StringSet.h>

class Isoform {
    std::string name_;
    std::map<std::string, int> fl_counts_;   // primer -> FL reads

public:
    explicit Isoform(const std::string &name) : name_(name) {}

    [[nodiscard]] const std::string &get_name() const { return name_; }

    void add_fl_count(const std::string &primer, int weight = 1) {
        fl_counts_[primer] += weight;
    }
    [[nodiscard]] int get_fl_count(const std::string &primer) const;
    [[nodiscard]] int total_fl_counts() const;
};

using IsoformList = StringSet<Isoform>;
