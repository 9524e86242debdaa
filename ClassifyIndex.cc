// Copyright 2013 Nadia Davidson for Murdoch Childrens Research
// Institute Australia. This program is distributed under the GNU
// General Public License. We also ask that you cite this software in
// publications where you made use of it for any part of the data
// analysis.

#include <ClassifyIndex.h>
#include <DelimitedTable.h>
#include <Progress.h>

using std::string;

void ClassifyIndex::build(DelimitedTable &table) {
    const int id_col     = table.require_field("id");
    const int primer_col = table.require_field("primer");
    // IsoSeq3: primer_index (0--7) identifies the barcode, primer is its name
    const int token_col  = table.has_field("primer_index")
                               ? table.require_field("primer_index")
                               : primer_col;

    progress::ProgressLine rows_progress("classify report");
    TableRow row;
    while (table.next(row)) {
        rows_++;
        rows_progress.update(rows_);
        if (row[primer_col] == no_primer) {
            nfl_rows_++;
            continue;
        }
        const string &primer = row[token_col];
        primers_.insert(primer);
        auto [it, inserted] = read_primer_.insert_or_assign(row[id_col], primer);
        if (!inserted)
            duplicates_++;
    }
    rows_progress.finish();
}
