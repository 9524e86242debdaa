// Copyright 2013 Nadia Davidson for Murdoch Childrens Research
// Institute Australia. This program is distributed under the GNU
// General Public License. We also ask that you cite this software in
// publications where you made use of it for any part of the data
// analysis.

// Writes the FL count matrix as CSV:
//
//     id,Liver,Brain
//     PB.1.1,12,0
//     PB.1.2,3,7

#pragma once

#include <ostream>
#include <utility>
#include <string>
#include <vector>
#include <PrimerNames.h>

class CountMatrix;

class MatrixWriter {
    std::vector<PrimerColumn> columns_;

public:
    static inline constexpr char separator = ',';
    static inline const std::string id_header = "id";

    explicit MatrixWriter(std::vector<PrimerColumn> columns) : columns_(std::move(columns)) {}

    // Header line then one line per isoform, in the given order.
    // Returns the number of rows written.  Throws OutputError if the
    // stream fails.
    int write(const std::vector<std::string> &isoforms, const CountMatrix &counts,
              std::ostream &out) const;

    [[nodiscard]] const std::vector<PrimerColumn> &columns() const { return columns_; }
};
