// Copyright 2013 Nadia Davidson for Murdoch Childrens Research
// Institute Australia. This program is distributed under the GNU
// General Public License. We also ask that you cite this software in
// publications where you made use of it for any part of the data
// analysis.

// Display names for primers (count matrix column labels).
//
// The override file has one primer per line:
//
//     0--1    Liver
//     0--2    Brain
//
// Its line order is the column order.  Observed primers the file
// does not mention are appended after it, labelled by their own ID.

#pragma once

#include <set>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

struct PrimerColumn {
    std::string primer;
    std::string label;

    bool operator==(const PrimerColumn &) const = default;
};

class PrimerNames {
    std::vector<PrimerColumn> columns_;
    std::unordered_map<std::string, int> pos_;

public:
    // Parse a whitespace-separated two-column file.  Throws
    // MissingFileError if it cannot be opened and FormatError for a
    // line without exactly two fields.
    static PrimerNames load(const std::string &filename);

    // Identity mapping over a sorted primer set.
    static PrimerNames defaults(const std::set<std::string> &primers);

    // Add or relabel a primer.  A relabelled primer keeps its position.
    void add(const std::string &primer, const std::string &label);

    [[nodiscard]] bool contains(const std::string &primer) const { return pos_.contains(primer); }
    [[nodiscard]] const std::vector<PrimerColumn> &columns() const { return columns_; }
    [[nodiscard]] int size() const { return static_cast<int>(columns_.size()); }
};

// Final column list: the override's columns (or the sorted primer set
// if there is none), then every observed primer the override left out.
std::vector<PrimerColumn> resolve_columns(const std::set<std::string> &primers,
                                          const PrimerNames *names);
