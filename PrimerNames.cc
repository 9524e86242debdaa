// Copyright 2013 Nadia Davidson for Murdoch Childrens Research
// Institute Australia. This program is distributed under the GNU
// General Public License. We also ask that you cite this software in
// publications where you made use of it for any part of the data
// analysis.

#include <PrimerNames.h>
#include <Errors.h>

#include <fstream>
#include <sstream>

using std::ifstream;
using std::istringstream;
using std::set;
using std::string;
using std::vector;

void PrimerNames::add(const string &primer, const string &label) {
    auto [it, inserted] = pos_.try_emplace(primer, static_cast<int>(columns_.size()));
    if (inserted)
        columns_.push_back({primer, label});
    else
        columns_[it->second].label = label;
}

PrimerNames PrimerNames::load(const string &filename) {
    ifstream file(filename);
    if (!file.good())
        throw MissingFileError(filename);

    PrimerNames names;
    string line, primer, label, extra;
    int line_no = 0;
    while (getline(file, line)) {
        line_no++;
        istringstream ls(line);
        if (!(ls >> primer))
            continue;   // blank line
        if (!(ls >> label) || (ls >> extra))
            throw FormatError(filename + " line " + std::to_string(line_no)
                              + ": expected '<primer> <name>'");
        names.add(primer, label);
    }
    return names;
}

PrimerNames PrimerNames::defaults(const set<string> &primers) {
    PrimerNames names;
    for (const auto &p : primers)
        names.add(p, p);
    return names;
}

vector<PrimerColumn> resolve_columns(const set<string> &primers, const PrimerNames *names) {
    if (!names)
        return PrimerNames::defaults(primers).columns();

    vector<PrimerColumn> columns = names->columns();
    for (const auto &p : primers) {
        if (!names->contains(p))
            columns.push_back({p, p});
    }
    return columns;
}
