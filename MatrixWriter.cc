// Copyright 2013 Nadia Davidson for Murdoch Childrens Research
// Institute Australia. This program is distributed under the GNU
// General Public License. We also ask that you cite this software in
// publications where you made use of it for any part of the data
// analysis.

#include <MatrixWriter.h>
#include <FLCounts.h>
#include <Errors.h>

#include <sstream>

using std::ostringstream;
using std::string;
using std::vector;

int MatrixWriter::write(const vector<string> &isoforms, const CountMatrix &counts,
                        std::ostream &out) const {
    ostringstream buf;
    buf << id_header;
    for (const auto &col : columns_)
        buf << separator << col.label;
    buf << "\n";

    int rows = 0;
    for (const auto &pbid : isoforms) {
        buf << pbid;
        const Isoform *iso = counts.find(pbid);
        for (const auto &col : columns_)
            buf << separator << (iso ? iso->get_fl_count(col.primer) : 0);
        buf << "\n";
        rows++;
    }

    out << buf.str();
    out.flush();
    if (!out)
        throw OutputError("Failed writing count matrix");
    return rows;
}
