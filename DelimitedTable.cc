// Copyright 2013 Nadia Davidson for Murdoch Childrens Research
// Institute Australia. This program is distributed under the GNU
// General Public License. We also ask that you cite this software in
// publications where you made use of it for any part of the data
// analysis.

#include <DelimitedTable.h>
#include <Errors.h>

using std::string;
using std::vector;

static string unquote(const string &field) {
    if (field.size() < 2 || field.front() != '"' || field.back() != '"')
        return field;
    string out;
    out.reserve(field.size() - 2);
    for (string::size_type i = 1; i + 1 < field.size(); i++) {
        out += field[i];
        if (field[i] == '"' && field[i + 1] == '"' && i + 2 < field.size())
            i++;
    }
    return out;
}

void tokenize_strict(const string &s, char delim, vector<string> &fields) {
    fields.clear();
    string::size_type last = 0;
    string::size_type pos = s.find(delim);
    while (pos != string::npos) {
        fields.push_back(unquote(s.substr(last, pos - last)));
        last = pos + 1;
        pos = s.find(delim, last);
    }
    fields.push_back(unquote(s.substr(last)));
}

static void chomp(string &line) {
    if (!line.empty() && line.back() == '\r')
        line.pop_back();
}

DelimitedTable::DelimitedTable(const string &path, char delim)
    : path_(path), delim_(delim), file_(path) {
    if (!file_.good())
        throw MissingFileError(path);

    string line;
    while (getline(file_, line)) {
        line_++;
        chomp(line);
        if (!line.empty()) break;
    }
    if (line.empty())
        throw FormatError("No header line in " + path);

    tokenize_strict(line, delim_, header_);
    for (int c = 0; c < static_cast<int>(header_.size()); c++)
        columns_.try_emplace(header_[c], c);
}

int DelimitedTable::require_field(const string &name) {
    auto it = columns_.find(name);
    if (it == columns_.end())
        throw FormatError("Field '" + name + "' is missing from the header of " + path_);
    if (it->second > max_required_)
        max_required_ = it->second;
    return it->second;
}

bool DelimitedTable::next(TableRow &row) {
    string line;
    while (getline(file_, line)) {
        line_++;
        chomp(line);
        if (line.empty()) continue;

        tokenize_strict(line, delim_, row.fields_);
        row.line_ = line_;
        if (row.size() <= max_required_)
            throw FormatError(path_ + " line " + std::to_string(line_) + " has "
                              + std::to_string(row.size()) + " fields, expected "
                              + std::to_string(header_.size()));
        rows_++;
        return true;
    }
    if (file_.bad())
        throw FormatError("Error reading " + path_);
    return false;
}
