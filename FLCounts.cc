// Copyright 2013 Nadia Davidson for Murdoch Childrens Research
// Institute Australia. This program is distributed under the GNU
// General Public License. We also ask that you cite this software in
// publications where you made use of it for any part of the data
// analysis.

#include <FLCounts.h>
#include <ClassifyIndex.h>
#include <DelimitedTable.h>
#include <Errors.h>
#include <Progress.h>

void FLCountAggregator::aggregate(DelimitedTable &table, const ClassifyIndex &index,
                                  CountMatrix &counts) {
    const int id_col    = table.require_field("id");
    const int is_fl_col = table.require_field("is_fl");
    const int pbid_col  = table.require_field("pbid");

    progress::ProgressLine rows_progress("read_stat");
    TableRow row;
    while (table.next(row)) {
        rows_++;
        rows_progress.update(rows_);
        if (row[is_fl_col] != full_length_flag)
            continue;

        const std::string *primer = index.find(row[id_col]);
        if (!primer)
            throw MissingReadError(row[id_col], table.path());
        counts.add(row[pbid_col], *primer);
        fl_rows_++;
    }
    rows_progress.finish();
}
