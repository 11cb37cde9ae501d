#include <getopt.h>
#include <iostream>
#include <memory>
#include <string>
#include <json/json.h>
#include "CalendarSplitter.hpp"
#include "ChunkSink.hpp"
#include "LineSource.hpp"
#include "MemorySegment.hpp"
#include "SplitErrors.hpp"
#include "SplitOptions.hpp"
#include "SplitReport.hpp"
#include "TextEncoding.hpp"

static const char* kVersion = "2.0.0";

enum LongOnlyOption {
    kOptDryRun = 256,
    kOptOverwrite,
};

static const struct option kLongOptions[] = {
    {"size", required_argument, nullptr, 's'},
    {"number", required_argument, nullptr, 'n'},
    {"encoding", required_argument, nullptr, 'e'},
    {"output-prefix", required_argument, nullptr, 'o'},
    {"output-dir", required_argument, nullptr, 'd'},
    {"config", required_argument, nullptr, 'c'},
    {"quiet", no_argument, nullptr, 'q'},
    {"json", no_argument, nullptr, 'j'},
    {"verbose", no_argument, nullptr, 'v'},
    {"dry-run", no_argument, nullptr, kOptDryRun},
    {"overwrite", no_argument, nullptr, kOptOverwrite},
    {"version", no_argument, nullptr, 'V'},
    {"help", no_argument, nullptr, 'h'},
    {nullptr, 0, nullptr, 0}
};

void printUsage(std::ostream& out, const char* prog) {
    out << "Usage: " << prog << " [options] <input.ics | ->\n"
        << "Split large ICS calendar files into smaller chunks.\n\n"
        << "Options:\n"
        << "  -s, --size SIZE           Maximum size per output file, e.g. 500K or 1M (default: 1M)\n"
        << "  -n, --number N            Maximum number of events per output file\n"
        << "  -e, --encoding ENC        Output file encoding (default: utf-8)\n"
        << "  -o, --output-prefix P     Prefix for output files (default: derived from input filename)\n"
        << "  -d, --output-dir DIR      Directory for output files (default: next to the input)\n"
        << "  -c, --config FILE         JSON config file with a \"split\" section\n"
        << "  -q, --quiet               Suppress the summary\n"
        << "  -j, --json                Print the summary as JSON\n"
        << "  -v, --verbose             Log progress to stderr\n"
        << "      --dry-run             Show what would be created without writing files\n"
        << "      --overwrite           Overwrite existing output files\n"
        << "  -V, --version             Print version and exit\n"
        << "  -h, --help                Print this help and exit\n\n"
        << "Example: " << prog << " calendar.ics -s 500K -n 50" << std::endl;
}

int runSplit(const SplitOptions& options) {
    SplitConfig config = make_split_config(options);
    TextEncoding encoding(options.encoding);

    std::unique_ptr<ChunkSink> sink;
    if (options.dryRun) {
        sink = std::make_unique<DryRunChunkSink>(options.outputPrefix);
    } else {
        sink = std::make_unique<FileChunkSink>(options.outputDir, options.outputPrefix, encoding, options.overwrite);
    }
    std::unique_ptr<ChunkSink> logged;
    ChunkSink* target = sink.get();
    if (options.verbose) {
        logged = std::make_unique<LoggingChunkSink>(*sink, std::cerr, options.outputPrefix);
        target = logged.get();
    }

    CalendarSplitter splitter(config, *target, encoding);
    std::vector<ChunkDescriptor> chunks;
    if (options.inputPath == "-") {
        if (options.verbose) std::cerr << "Reading calendar from standard input" << std::endl;
        StreamLineSource source(std::cin);
        chunks = splitter.split(source);
    } else {
        MemorySegment segment(options.inputPath);
        if (options.verbose) std::cerr << "Mapped " << segment.path() << " (" << segment.size() << " bytes)" << std::endl;
        BufferLineSource source(segment);
        chunks = splitter.split(source);
    }

    if (!options.quiet) {
        if (options.json) {
            Json::StreamWriterBuilder writer;
            writer["indentation"] = "  ";
            std::cout << Json::writeString(writer, report_to_json(options.outputPrefix, chunks, options.dryRun)) << std::endl;
        } else {
            print_summary(std::cout, options.outputPrefix, chunks, options.dryRun);
        }
    }
    return 0;
}

int main(int argc, char** argv) {
    std::ios::sync_with_stdio(false);
    CommandLine cli;
    int opt;
    while ((opt = getopt_long(argc, argv, "s:n:e:o:d:c:qjvVh", kLongOptions, nullptr)) != -1) {
        switch (opt) {
        case 's': cli.size = optarg; break;
        case 'n': cli.number = optarg; break;
        case 'e': cli.encoding = optarg; break;
        case 'o': cli.outputPrefix = optarg; break;
        case 'd': cli.outputDir = optarg; break;
        case 'c': cli.configPath = optarg; break;
        case 'q': cli.quiet = true; break;
        case 'j': cli.json = true; break;
        case 'v': cli.verbose = true; break;
        case kOptDryRun: cli.dryRun = true; break;
        case kOptOverwrite: cli.overwrite = true; break;
        case 'V':
            std::cout << "icssplit " << kVersion << std::endl;
            return 0;
        case 'h':
            printUsage(std::cout, argv[0]);
            return 0;
        default:
            printUsage(std::cerr, argv[0]);
            return 2;
        }
    }
    if (argc - optind != 1) {
        std::cerr << (argc - optind == 0 ? "Missing input file" : "Too many arguments") << "\n\n";
        printUsage(std::cerr, argv[0]);
        return 2;
    }
    cli.input = argv[optind];

    try {
        SplitOptions options;
        if (cli.configPath) {
            load_options_file(*cli.configPath, options);
            if (cli.verbose) std::cerr << "Loaded config " << *cli.configPath << std::endl;
        }
        apply_command_line(cli, options);
        resolve_output_paths(options);

        return runSplit(options);
    } catch (const SplitError& e) {
        std::cerr << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "error: " << e.what() << std::endl;
        return 1;
    }
}
