// Copyright 2013 Nadia Davidson for Murdoch Childrens Research
// Institute Australia. This program is distributed under the GNU
// General Public License. We also ask that you cite this software in
// publications where you made use of it for any part of the data
// analysis.

// Fatal error types.  Library code throws; isodemux.cc reports the
// message on stderr and exits with status 1.  Nothing is retried.

#pragma once

#include <stdexcept>
#include <string>

// A required input file is missing or cannot be opened.
class MissingFileError : public std::runtime_error {
public:
    explicit MissingFileError(const std::string &path)
        : std::runtime_error("Unable to open file " + path), path_(path) {}

    [[nodiscard]] const std::string &path() const { return path_; }

private:
    std::string path_;
};

// A table lacks a required header field, has a short row, or a
// record cannot be parsed.
class FormatError : public std::runtime_error {
public:
    explicit FormatError(const std::string &what) : std::runtime_error(what) {}
};

// A full-length read in the read_stat table has no entry in the
// classify report lookup.  The two files come from different runs.
class MissingReadError : public std::runtime_error {
public:
    MissingReadError(const std::string &read_id, const std::string &file)
        : std::runtime_error("Full-length read " + read_id + " in " + file
                             + " is missing from the classify report."
                             + " Are the input files from the same job?"),
          read_id_(read_id) {}

    [[nodiscard]] const std::string &read_id() const { return read_id_; }

private:
    std::string read_id_;
};

// Writing the count matrix failed.
class OutputError : public std::runtime_error {
public:
    explicit OutputError(const std::string &what) : std::runtime_error(what) {}
};
