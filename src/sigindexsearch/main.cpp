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
        "  -query <path>            Query signature file\n"
        "  -db <path>               Signature file, .zip archive or directory (repeatable)\n"
        "\n"
        "Options:\n"
        "  -threshold <float>       Minimum score (default: 0.08)\n"
        "  -containment             Score by containment of the query\n"
        "  -max_containment         Score by overlap / smaller sketch\n"
        "  -ignore_abundance        Use Jaccard even if abundances are present\n"
        "  -k <int>                 Query k-mer size\n"
        "  -moltype <str>           Query molecule type (DNA, protein, dayhoff, hp)\n"
        "  -scaled <int>            Query scaled value\n"
        "  -num <int>               Query num value\n"
        "  -pathlist                Treat each -db as a file listing index paths\n"
        "  -force                   Skip unloadable files in directories\n"
        "  -num_results <int>       Max results to report (default: 0 = all)\n"
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
    switches.insert(switches.end(), {"-containment", "-max_containment", "-ignore_abundance",
                                       "-pathlist", "-force"});
    CliParser cli(argc, argv, switches);

    if (check_version(cli, "sigindexsearch")) return 0;
    if (cli.has("-h") || cli.has("--help")) {
        print_usage(argv[0]);
        return 0;
    }
    if (!cli.has("-query") || !cli.has("-db")) {
        print_usage(argv[0]);
        return 1;
    }

    Logger logger;
    if (!make_logger(cli, "sigindexsearch", logger)) return 1;
    int num_threads = resolve_threads(cli);

    OutputFormat outfmt = OutputFormat::kTab;
    std::string error_msg;
    if (!parse_output_format(cli.get_string("-outfmt", "tab"), outfmt, error_msg)) {
        std::fprintf(stderr, "%s\n", error_msg.c_str());
        return 1;
    }

    SearchOptions opts;
    opts.threshold = cli.get_double("-threshold", 0.08);
    opts.do_containment = cli.has("-containment");
    opts.do_max_containment = cli.has("-max_containment");
    opts.ignore_abundance = cli.has("-ignore_abundance");
    int num_results = cli.get_int("-num_results", 0);

    std::vector<SearchResult> results;
    try {
        SignaturePtr query = load_query_signature(cli.get_string("-query"),
                                                  selection_from_cli(cli));
        logger.info("Query %s: k=%u, %zu hashes",
                    query->display_name().c_str(), query->minhash().ksize(),
                    query->minhash().size());

        IndexPtr db = load_databases(cli.get_strings("-db"), cli.has("-pathlist"),
                                     cli.has("-force"), logger);
        bool containment = opts.do_containment || opts.do_max_containment;
        db = db->select(selection_for_query(*query, containment));

        tbb::task_arena arena(num_threads);
        arena.execute([&] {
            results = db->search(*query, opts);
        });
    } catch (const Error& e) {
        std::fprintf(stderr, "Error: %s\n", e.what());
        return 1;
    }

    logger.info("%zu match(es) at threshold %.3f", results.size(), *opts.threshold);
    if (num_results > 0 && results.size() > static_cast<size_t>(num_results)) {
        results.resize(static_cast<size_t>(num_results));
    }

    const char* score_name = opts.do_max_containment ? "max_containment"
                            : opts.do_containment ? "containment" : "similarity";
    auto hits = to_output_hits(results);
    std::string output_path = cli.get_string("-o");
    if (output_path.empty()) {
        if (!write_results(std::cout, hits, outfmt, score_name)) {
            std::fprintf(stderr, "Error: failed to write results to stdout\n");
            return 1;
        }
    } else {
        std::ofstream out(output_path);
        if (!out.is_open()) {
            std::fprintf(stderr, "Error: cannot open output file %s\n", output_path.c_str());
            return 1;
        }
        if (!write_results(out, hits, outfmt, score_name)) {
            std::fprintf(stderr, "Error: failed to write %s\n", output_path.c_str());
            return 1;
        }
    }
    return 0;
}
