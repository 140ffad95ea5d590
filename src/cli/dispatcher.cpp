//! # CLI Command Dispatcher
//!
//! Parses command-line arguments and routes to the command handlers.
//!
//! ## Architecture
//!
//! ```text
//! jcodec_main()
//!   ├─ --help, -h     → print_usage()
//!   ├─ --version, -V  → print_version()
//!   ├─ fmt            → run_fmt()
//!   ├─ get            → run_get()
//!   ├─ delete         → run_delete()
//!   └─ check          → run_check()
//! ```
//!
//! Logging options (`--log-*`, `-v`, `-q`) may appear anywhere and are
//! removed before the command's own arguments are read.
//!
//! ## Return Codes
//!
//! | Code | Meaning                                          |
//! |------|--------------------------------------------------|
//! | 0    | Success                                          |
//! | 1    | Input does not parse, or the cursor fails        |
//! | 2    | Usage error or unreadable input                  |

#include "cli/driver.hpp"
#include "cli/utils.hpp"
#include "json/json.hpp"
#include "log/log.hpp"

#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace jcodec::cli {

namespace {

auto load(const std::string& path, json::JsonValue& out) -> int {
    std::string text;
    try {
        text = read_input(path);
    } catch (const std::runtime_error& e) {
        std::cerr << "error: " << e.what() << "\n";
        return 2;
    }

    auto parsed = json::parse_json(text);
    if (is_err(parsed)) {
        std::cerr << path << ": " << unwrap_err(parsed).to_string() << "\n";
        return 1;
    }
    out = std::move(unwrap(parsed));
    return 0;
}

auto load_cursor(const std::string& text, json::JsonCursor& out) -> int {
    auto cursor = json::parse_cursor(text);
    if (is_err(cursor)) {
        std::cerr << "error: invalid cursor '" << text << "': " << unwrap_err(cursor).to_string()
                  << "\n";
        return 2;
    }
    out = std::move(unwrap(cursor));
    return 0;
}

int run_fmt(const std::vector<std::string>& args) {
    bool compact = false;
    std::string path;
    for (const auto& arg : args) {
        if (arg == "--compact") {
            compact = true;
        } else {
            path = arg;
        }
    }
    if (path.empty()) {
        std::cerr << "Usage: jcodec fmt [--compact] <file|->\n";
        return 2;
    }

    json::JsonValue doc;
    if (int rc = load(path, doc); rc != 0) {
        return rc;
    }
    json::write_json(doc, std::cout, compact ? json::Indent() : json::Indent(0));
    std::cout << "\n";
    return 0;
}

int run_get(const std::vector<std::string>& args) {
    if (args.size() != 2) {
        std::cerr << "Usage: jcodec get <cursor> <file|->\n";
        return 2;
    }

    json::JsonCursor cursor;
    if (int rc = load_cursor(args[0], cursor); rc != 0) {
        return rc;
    }
    json::JsonValue doc;
    if (int rc = load(args[1], doc); rc != 0) {
        return rc;
    }

    auto found = doc.get(cursor);
    if (is_err(found)) {
        std::cerr << cursor.to_string() << ": " << unwrap_err(found).to_string() << "\n";
        return 1;
    }
    std::cout << unwrap(found).to_string_pretty() << "\n";
    return 0;
}

int run_delete(const std::vector<std::string>& args) {
    if (args.size() != 2) {
        std::cerr << "Usage: jcodec delete <cursor> <file|->\n";
        return 2;
    }

    json::JsonCursor cursor;
    if (int rc = load_cursor(args[0], cursor); rc != 0) {
        return rc;
    }
    json::JsonValue doc;
    if (int rc = load(args[1], doc); rc != 0) {
        return rc;
    }

    auto result = doc.delete_at(cursor);
    if (is_err(result)) {
        std::cerr << cursor.to_string() << ": " << unwrap_err(result).to_string() << "\n";
        return 1;
    }
    std::cout << unwrap(result).to_string_pretty() << "\n";
    return 0;
}

int run_check(const std::vector<std::string>& args) {
    if (args.size() != 1) {
        std::cerr << "Usage: jcodec check <file|->\n";
        return 2;
    }

    json::JsonValue doc;
    int rc = load(args[0], doc);
    if (rc == 0) {
        JCODEC_LOG_INFO("cli", args[0] << " parsed as " << json::type_name(doc.type()));
        std::cout << args[0] << ": ok\n";
    }
    return rc;
}

} // namespace

} // namespace jcodec::cli

/// Main entry point for the jcodec CLI.
int jcodec_main(int argc, char* argv[]) {
    using namespace jcodec;

    log::Logger::init(log::parse_log_options(argc, argv));

    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        if (!log::is_log_option(argv[i])) {
            args.emplace_back(argv[i]);
        }
    }

    if (args.empty()) {
        cli::print_usage();
        return 0;
    }

    std::string command = args[0];
    std::vector<std::string> rest(args.begin() + 1, args.end());

    if (command == "--help" || command == "-h") {
        cli::print_usage();
        return 0;
    }

    if (command == "--version" || command == "-V") {
        cli::print_version();
        return 0;
    }

    JCODEC_LOG_DEBUG("cli", "command '" << command << "' with " << rest.size() << " argument(s)");

    if (command == "fmt") {
        return cli::run_fmt(rest);
    }
    if (command == "get") {
        return cli::run_get(rest);
    }
    if (command == "delete") {
        return cli::run_delete(rest);
    }
    if (command == "check") {
        return cli::run_check(rest);
    }

    std::cerr << "Unknown command: " << command << "\n";
    std::cerr << "Run 'jcodec --help' for usage information.\n";
    return 2;
}
