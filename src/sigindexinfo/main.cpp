#include "core/config.hpp"
#include "core/errors.hpp"
#include "core/version.hpp"
#include "index/index.hpp"
#include "index/index_loader.hpp"
#include "io/signature_codec.hpp"
#include "io/zip_writer.hpp"
#include "util/cli_parser.hpp"
#include "util/common_init.hpp"
#include "util/logger.hpp"

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <vector>

using namespace sigindex;

static void print_usage(const char* prog) {
    std::fprintf(stderr,
        "Usage: %s <path>... [options]\n"
        "       %s -pack <out.zip> <signature file>...\n"
        "\n"
        "Lists the signatures in each signature file, .zip archive or directory.\n"
        "\n"
        "Options:\n"
        "  -pack <out.zip>          Store the given signature files in a zip archive\n"
        "  -force                   Load every file/member, skipping unloadable ones\n"
        "  -v, --verbose            Verbose logging\n"
        "  -q, --quiet              Warnings and errors only\n"
        "  -log_level <level>       error, warn, info or debug\n"
        "  --version                Print version\n",
        prog, prog);
}

// Copy signature files into a zip archive, one member per file.
static int pack_archive(const std::string& out_path,
                        const std::vector<std::string>& inputs,
                        const Logger& logger) {
    ZipWriter writer;
    for (const auto& path : inputs) {
        std::ifstream in(path, std::ios::binary);
        if (!in.is_open()) {
            logger.error("Cannot open %s", path.c_str());
            return 1;
        }
        std::string data((std::istreambuf_iterator<char>(in)),
                         std::istreambuf_iterator<char>());
        if (decode_signatures(data).empty()) {
            logger.warn("%s contains no signatures; storing anyway", path.c_str());
        }
        std::string member = std::filesystem::path(path).filename().string();
        if (!writer.add_entry(member, data)) return 1;
        logger.debug("Added %s as %s", path.c_str(), member.c_str());
    }
    if (!writer.write(out_path)) return 1;
    logger.info("Wrote %zu member(s) to %s", writer.num_entries(), out_path.c_str());
    return 0;
}

int main(int argc, char* argv[]) {
    auto switches = common_switches();
    switches.insert(switches.end(), {"-force"});
    CliParser cli(argc, argv, switches);

    if (check_version(cli, "sigindexinfo")) return 0;
    if (cli.has("-h") || cli.has("--help")) {
        print_usage(argv[0]);
        return 0;
    }
    const auto& paths = cli.positional();
    if (paths.empty()) {
        print_usage(argv[0]);
        return 1;
    }

    Logger logger;
    if (!make_logger(cli, "sigindexinfo", logger)) return 1;

    if (cli.has("-pack")) {
        return pack_archive(cli.get_string("-pack"), paths, logger);
    }

    std::printf("# name\tksize\tmoltype\tscaled\tnum\thashes\tmd5\tsource\n");
    try {
        for (const auto& path : paths) {
            IndexPtr idx = load_file_as_index(path, cli.has("-force"), logger);
            size_t count = 0;
            idx->signatures_with_location([&](const SignaturePtr& sig, const Location& loc) {
                const MinHash& mh = sig->minhash();
                std::printf("%s\t%u\t%s\t%lu\t%u\t%zu\t%s\t%s\n",
                            sig->display_name().c_str(), mh.ksize(),
                            mh.moltype().c_str(),
                            static_cast<unsigned long>(mh.scaled()), mh.num(),
                            mh.size(), sig->md5sum().c_str(),
                            loc.value_or("-").c_str());
                count++;
            });
            logger.info("%s: %zu signature(s)", path.c_str(), count);
        }
    } catch (const Error& e) {
        std::fprintf(stderr, "Error: %s\n", e.what());
        return 1;
    }
    return 0;
}
