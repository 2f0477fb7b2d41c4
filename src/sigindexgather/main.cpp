#include "core/config.hpp"
#include "core/errors.hpp"
#include "core/version.hpp"
#include "index/index.hpp"
#include "io/result_writer.hpp"
#include "util/cli_parser.hpp"
#include "util/common_init.hpp"
#include "util/database_args.hpp"
#include "util/logger.hpp"

#include <cstdio>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

#include <tbb/task_arena.h>

using namespace sigindex;

static void print_usage(const char* prog) {
    std::fprintf(stderr,
        "Usage: %s [options]\n"
        "\n"
        "Required:\n"
        "  -query <path>            Query signature file (scaled sketch)\n"
        "  -db <path>               Signature file, .zip archive or directory (repeatable)\n"
        "\n"
        "Options:\n"
        "  -counter                 Greedy decomposition (default: one-shot gather)\n"
        "  -threshold_bp <float>    Minimum overlap in base pairs (default: 0)\n"
        "  -k <int>                 Query k-mer size\n"
        "  -moltype <str>           Query molecule type\n"
        "  -scaled <int>            Query scaled value\n"
        "  -pathlist                Treat each -db as a file listing index paths\n"
        "  -force                   Skip unloadable files in directories\n"
        "  -outfmt <tab|json>       Output format (default: tab)\n"
        "  -o <path>                Output file (default: stdout)\n"
        "  -threads <int>           Scoring threads (default: all cores)\n"
        "  -v, --verbose            Verbose logging\n"
        "  -q, --quiet              Warnings and errors only\n"
        "  -log_level <level>       error, warn, info or debug\n"
        "  --version                Print version\n",
        prog);
}

int main(int argc, char* argv[]) {
    auto switches = common_switches();
    switches.insert(switches.end(), {"-counter", "-pathlist", "-force"});
    CliParser cli(argc, argv, switches);

    if (check_version(cli, "sigindexgather")) return 0;
    if (cli.has("-h") || cli.has("--help")) {
        print_usage(argv[0]);
        return 0;
    }
    if (!cli.has("-query") || !cli.has("-db")) {
        print_usage(argv[0]);
        return 1;
    }

    Logger logger;
    if (!make_logger(cli, "sigindexgather", logger)) return 1;
    int num_threads = resolve_threads(cli);

    OutputFormat outfmt = OutputFormat::kTab;
    std::string error_msg;
    if (!parse_output_format(cli.get_string("-outfmt", "tab"), outfmt, error_msg)) {
        std::fprintf(stderr, "%s\n", error_msg.c_str());
        return 1;
    }

    GatherOptions opts;
    opts.threshold_bp = cli.get_double("-threshold_bp", 0.0);
    bool counter = cli.has("-counter");

    std::vector<GatherResult> results;
    try {
        SignaturePtr query = load_query_signature(cli.get_string("-query"),
                                                  selection_from_cli(cli));
        if (query->minhash().scaled() == 0) {
            throw ConfigurationError("gather requires a scaled query signature");
        }
        logger.info("Query %s: k=%u, scaled=%lu, %zu hashes",
                    query->display_name().c_str(), query->minhash().ksize(),
                    static_cast<unsigned long>(query->minhash().scaled()),
                    query->minhash().size());

        IndexPtr db = load_databases(cli.get_strings("-db"), cli.has("-pathlist"),
                                     cli.has("-force"), logger);
        db = db->select(selection_for_query(*query, true));

        tbb::task_arena arena(num_threads);
        arena.execute([&] {
            results = counter ? db->counter_gather(*query, opts)
                              : db->gather(*query, opts);
        });
    } catch (const Error& e) {
        std::fprintf(stderr, "Error: %s\n", e.what());
        return 1;
    }

    logger.info("%zu match(es)%s", results.size(),
                counter ? " in greedy decomposition" : "");

    auto hits = to_output_hits(results);
    std::string output_path = cli.get_string("-o");
    if (output_path.empty()) {
        if (!write_results(std::cout, hits, outfmt, "containment")) {
            std::fprintf(stderr, "Error: failed to write results to stdout\n");
            return 1;
        }
    } else {
        std::ofstream out(output_path);
        if (!out.is_open()) {
            std::fprintf(stderr, "Error: cannot open output file %s\n", output_path.c_str());
            return 1;
        }
        if (!write_results(out, hits, outfmt, "containment")) {
            std::fprintf(stderr, "Error: failed to write %s\n", output_path.c_str());
            return 1;
        }
    }
    return 0;
}
