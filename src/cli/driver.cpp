//! # smlc Driver
//!
//! For every input file the driver:
//!
//! 1. loads the file and parses it into a `DocumentSet`
//! 2. prints the rendering of the root node
//! 3. reduces the root
//! 4. prints the original root again, showing it was left untouched
//! 5. prints the reduced tree
//!
//! ## Return Codes
//!
//! | Code | Meaning                                   |
//! |------|-------------------------------------------|
//! | 0    | Success                                   |
//! | 1    | A file could not be read, parsed or reduced |
//! | 2    | Usage error                               |

#include "cli/driver.hpp"

#include "common.hpp"
#include "lexer/source.hpp"
#include "lexer/token_stream.hpp"
#include "log/log.hpp"
#include "parser/tree.hpp"

#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

namespace sml::cli {

namespace {

struct DriverOptions {
    bool dump_tokens = false;
    bool reduce = true;
    std::string name; ///< Document name override for a single input.
};

void print_usage(std::ostream& out) {
    out << "Usage: smlc [options] <file.sml>...\n"
        << "\n"
        << "Options:\n"
        << "  --sync-scan         Scan on the parsing thread instead of a scanner thread\n"
        << "  --tokens            Print the token stream before parsing\n"
        << "  --no-reduce         Print the parsed tree only\n"
        << "  --name=<doc>        Document name (single input only; default: file stem)\n"
        << "  -h, --help          Show this help\n"
        << "  -V, --version       Show the version\n"
        << "\n"
        << "Logging:\n"
        << "  -v, -vv, -vvv       Info, debug or trace logging\n"
        << "  -q, --quiet         Errors only\n"
        << "  --log-level=<lvl>   trace|debug|info|warn|error|fatal|off\n"
        << "  --log-filter=<spec> Per-module levels, e.g. lexer=trace,*=warn\n"
        << "  --log-file=<path>   Also write log records to a file\n"
        << "  --log-format=<fmt>  text|json\n"
        << "\n"
        << "The SML_LOG environment variable is used when no level is given.\n";
}

void print_version() {
    std::cout << "smlc " << VERSION << "\n";
}

void dump_tokens(const lexer::Source& source) {
    auto tokens = lexer::open_token_stream(source, lexer::default_scan_mode());
    while (auto token = tokens->next()) {
        auto loc = source.location(token->pos);
        std::cout << loc.line << ":" << loc.column << " "
                  << lexer::token_kind_to_string(token->kind) << " " << *token << "\n";
    }
}

int run_file(const std::string& path, const DriverOptions& opts, parser::DocumentSet& documents) {
    auto loaded = lexer::Source::from_file(path);
    if (is_err(loaded)) {
        std::cerr << "error: " << unwrap_err(loaded) << "\n";
        return 1;
    }
    const auto& source = unwrap(loaded);

    std::string name =
        opts.name.empty() ? std::filesystem::path(path).stem().string() : opts.name;
    SML_LOG_INFO("cli", "parsing " << path << " as " << name);
    SML_DEBUG_LN("smlc: " << path << " (" << source.length() << " bytes)");

    if (opts.dump_tokens) {
        dump_tokens(source);
    }

    auto parsed = documents.parse_into(name, std::string(source.content()),
                                       lexer::default_scan_mode());
    if (is_err(parsed)) {
        std::cerr << "error: " << unwrap_err(parsed) << "\n";
        return 1;
    }
    const auto& tree = unwrap(parsed);
    std::cout << *tree->root << "\n";

    if (!opts.reduce) {
        return 0;
    }

    SML_LOG_INFO("cli", "reducing " << name);
    auto reduced = tree->root->reduce();
    if (is_err(reduced)) {
        const auto& error = unwrap_err(reduced);
        auto loc = tree->source.location(error.pos);
        std::cerr << "error: " << name << ":" << loc.line << ":" << loc.column << ": "
                  << error.message << "\n";
        return 1;
    }
    std::cout << *tree->root << "\n";
    std::cout << *unwrap(reduced) << "\n";
    return 0;
}

} // namespace

} // namespace sml::cli

int sml_main(int argc, char* argv[]) {
    using namespace sml;

    auto log_config = sml::log::parse_log_options(argc, argv);
    sml::log::Logger::init(log_config);

    cli::DriverOptions opts;
    std::vector<std::string> files;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (sml::log::is_log_option(arg)) {
            if (arg == "--verbose" || arg.starts_with("-v")) {
                ParseOptions::verbose = true;
            }
            continue;
        }
        if (arg == "--help" || arg == "-h") {
            cli::print_usage(std::cout);
            return 0;
        }
        if (arg == "--version" || arg == "-V") {
            cli::print_version();
            return 0;
        }
        if (arg == "--sync-scan") {
            ParseOptions::concurrent_scan = false;
        } else if (arg == "--tokens") {
            opts.dump_tokens = true;
        } else if (arg == "--no-reduce") {
            opts.reduce = false;
        } else if (arg.starts_with("--name=")) {
            opts.name = arg.substr(7);
            if (opts.name.empty()) {
                std::cerr << "error: --name requires a value\n";
                return 2;
            }
        } else if (arg.starts_with("-")) {
            std::cerr << "error: unknown option " << arg << "\n";
            cli::print_usage(std::cerr);
            return 2;
        } else {
            files.push_back(std::move(arg));
        }
    }

    if (files.empty()) {
        cli::print_usage(std::cerr);
        return 2;
    }
    if (!opts.name.empty() && files.size() > 1) {
        std::cerr << "error: --name needs exactly one input file\n";
        return 2;
    }

    SML_LOG_DEBUG("cli", "scan mode: " << (ParseOptions::concurrent_scan ? "concurrent" : "sync"));

    parser::DocumentSet documents;
    int status = 0;
    for (const auto& path : files) {
        if (cli::run_file(path, opts, documents) != 0) {
            status = 1;
        }
    }

    sml::log::Logger::instance().flush();
    return status;
}
