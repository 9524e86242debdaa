// Copyright 2013 Nadia Davidson for Murdoch Childrens Research
// Institute Australia. This program is distributed under the GNU
// General Public License. We also ask that you cite this software in
// publications where you made use of it for any part of the data
// analysis.

/** Main program for isodemux.  Controls I/O and command-line options.
 **
 ** Demultiplexes an IsoSeq job (with genome mapping) into a CSV of
 ** full-length read counts per isoform and primer.
 **
 ** Inputs are either a job directory (-j), from which the mapped FASTQ,
 ** collapsed read_stat table and classify report are located, or the
 ** three files given directly.
 **/

#include <iostream>
#include <string>
#include <cstdlib>
#include <exception>

#include <unistd.h>

#include <Demux.h>
#include <JobDir.h>
#include <Progress.h>

#ifndef ISODEMUX_VERSION
#define ISODEMUX_VERSION "unknown"
#endif

using std::cerr;
using std::cout;
using std::endl;
using std::string;


// ── Usage text ──────────────────────────────────────────────────────

void print_usage() {
    cerr << "\n"
         << "isodemux counts full-length reads per isoform and primer for a\n"
         << "multiplexed IsoSeq job mapped to a genome.\n"
         << "\n"
         << "Usage: isodemux [options] -o <output.csv>\n"
         << "\n"
         << "Options:\n"
         << "\n"
         << "  -j, --job_dir <dir>      Job directory (if given, automatically finds required files)\n"
         << "  --mapped_fastq <file>    Mapped FASTQ (overridden by --job_dir if given)\n"
         << "  --read_stat <file>       Collapsed read_stat table (overridden by --job_dir if given)\n"
         << "  --classify_csv <file>    Classify report CSV (overridden by --job_dir if given)\n"
         << "  --primer_names <file>    Primer sample names, two columns: <primer> <name>\n"
         << "  --link                   With --job_dir, symlink the job's inputs into the\n"
         << "                           current directory before reading them.\n"
         << "  -o, --output <file>      Output count file, or - for stdout. Required.\n"
         << "  -v, --version            Print version and exit.\n"
         << "  -h, --help               Print this help message and exit.\n"
         << endl;
}

// ── Main ────────────────────────────────────────────────────────────

int main(int argc, char **argv) {
    string job_dir;
    string output;
    bool link_inputs = false;
    DemuxInputs inputs;
    int c;

    // Handle long options before getopt (which only does short opts).
    // Mark consumed args with nullptr, then compact argv.
    for (int i = 1; i < argc; ++i) {
        string arg(argv[i]);
        if (arg == "--version" || arg == "-v") {
            cout << "isodemux version " << ISODEMUX_VERSION << endl;
            return 0;
        }
        if (arg == "--help" || arg == "-h") {
            print_usage();
            return 0;
        }
        if (arg == "--link") {
            link_inputs = true;
            argv[i] = nullptr;
            continue;
        }
        string *target = nullptr;
        if (arg == "--job_dir")           target = &job_dir;
        else if (arg == "--mapped_fastq") target = &inputs.mapped_fastq;
        else if (arg == "--read_stat")    target = &inputs.read_stat;
        else if (arg == "--classify_csv") target = &inputs.classify_csv;
        else if (arg == "--primer_names") target = &inputs.primer_names;
        else if (arg == "--output")       target = &output;
        if (target) {
            if (i + 1 >= argc) {
                cerr << "ERROR: " << arg << " needs an argument." << endl;
                print_usage();
                exit(1);
            }
            *target = argv[i + 1];
            argv[i] = nullptr; argv[++i] = nullptr;
        }
    }
    // Compact argv: remove consumed long options
    {
        int dst = 1;
        for (int src = 1; src < argc; src++)
            if (argv[src]) argv[dst++] = argv[src];
        argc = dst;
    }

    while ((c = getopt(argc, argv, "j:o:")) != EOF) {
        switch (c) {
        case 'j':
            job_dir = optarg;
            break;
        case 'o':
            output = optarg;
            break;
        case '?':
            cerr << "Unknown option.. stopping" << endl;
            print_usage();
            exit(1);
            break;
        }
    }
    if (optind < argc) {
        cerr << "Unexpected argument " << argv[optind] << endl;
        print_usage();
        exit(1);
    }
    if (output.empty()) {
        cerr << "No output file specified (-o)" << endl;
        print_usage();
        exit(1);
    }

    cerr << "\n" << progress::ansi::bold("isodemux " + string(ISODEMUX_VERSION)) << endl;

    try {
        if (!job_dir.empty()) {
            JobFiles files = JobDir::resolve(job_dir);
            if (link_inputs)
                files = JobDir::link(files, ".");
            inputs.mapped_fastq = files.mapped_fastq;
            inputs.read_stat    = files.read_stat;
            inputs.classify_csv = files.classify_csv;
        } else {
            if (link_inputs)
                progress::print_warning("--link ignored without --job_dir");
            if (inputs.mapped_fastq.empty() || inputs.read_stat.empty()
                || inputs.classify_csv.empty()) {
                cerr << "Either --job_dir or all of --mapped_fastq, --read_stat and "
                     << "--classify_csv must be given." << endl;
                print_usage();
                exit(1);
            }
        }

        run_demux(inputs, output);
        if (output == "-")
            cerr << "Count file written to stdout." << endl;
        else
            cerr << "Count file written to " << output << "." << endl;
    } catch (const std::exception &e) {
        cerr << progress::ansi::red("ERROR: ") << e.what() << endl;
        exit(1);
    }

    return 0;
}
