// Copyright 2013 Nadia Davidson for Murdoch Childrens Research
// Institute Australia. This program is distributed under the GNU
// General Public License. We also ask that you cite this software in
// publications where you made use of it for any part of the data
// analysis.

#include <Isoform.h>

int Isoform::get_fl_count(const std::string &primer) const {
    auto it = fl_counts_.find(primer);
    return (it != fl_counts_.end()) ? it->second : 0;
}

int Isoform::total_fl_counts() const {
    int sum = 0;
    for (const auto &[primer, c] : fl_counts_) sum += c;
    return sum;
}
