// Copyright 2013 Nadia Davidson for Murdoch Childrens Research
// Institute Australia. This program is distributed under the GNU
// General Public License. We also ask that you cite this software in
// publications where you made use of it for any part of the data
// analysis.

// Reader for delimited text tables with a header line (classify
// report CSV, read_stat TSV).  Fields are looked up by header name;
// the column index is resolved once with require_field() and then
// used for every row.
//
// Quoting is minimal: a field wrapped in double quotes, as in
// "id","primer", is unquoted and "" inside it becomes ".  A quoted
// field containing the delimiter is still split at the delimiter.

#pragma once

#include <fstream>
#include <string>
#include <unordered_map>
#include <vector>

// Split s on delim.  Consecutive delimiters yield empty fields, and
// fields wrapped in double quotes are unquoted.
void tokenize_strict(const std::string &s, char delim, std::vector<std::string> &fields);

// One data row.  Holds the fields of the current line only.
class TableRow {
    std::vector<std::string> fields_;
    int line_ = 0;

    friend class DelimitedTable;

public:
    [[nodiscard]] const std::string &operator[](int column) const { return fields_[column]; }
    [[nodiscard]] int size() const { return static_cast<int>(fields_.size()); }
    [[nodiscard]] int line() const { return line_; }
};

class DelimitedTable {
    std::string path_;
    char delim_;
    std::ifstream file_;
    std::vector<std::string> header_;
    std::unordered_map<std::string, int> columns_;
    int max_required_ = -1;   // highest column index handed out
    int line_ = 0;
    int rows_ = 0;

public:
    // Opens path and reads the header line.
    // Throws MissingFileError if the file cannot be opened and
    // FormatError if it has no header.
    DelimitedTable(const std::string &path, char delim);

    [[nodiscard]] bool has_field(const std::string &name) const {
        return columns_.contains(name);
    }

    // Column index of name; throws FormatError if the header lacks it.
    int require_field(const std::string &name);

    // Read the next non-empty line into row.  Returns false at EOF.
    // Throws FormatError if the line has fewer fields than a required
    // column needs.
    bool next(TableRow &row);

    [[nodiscard]] const std::string &path() const { return path_; }
    [[nodiscard]] int rows_read() const { return rows_; }
};
