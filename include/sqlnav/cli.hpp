#pragma once

/**
 * @file cli.hpp
 * @brief Command line parsing for the sqlnav program
 *
 *   sqlnav [-c config.json] [--log file] [database.db]
 *
 * A positional argument is opened as an extra SQLite connection.
 */

#include "errors.hpp"

#include <optional>
#include <ostream>
#include <string>

namespace sqlnav::cli {

constexpr const char* version = "0.4.0";

// ============================================================================
// CLI Arguments
// ============================================================================

struct cli_args {
    std::string config_path;     // -c; empty = default location
    std::string log_path;        // --log; empty = from config
    std::string sqlite_path;     // positional

    bool help = false;
    bool version = false;
};

// ============================================================================
// Argument Parser
// ============================================================================

class arg_parser {
public:
    arg_parser(const std::string& program_name, std::ostream& out)
        : program_name_(program_name), out_(out) {}

    /**
     * @return Parsed arguments, or nullopt after printing --help / --version
     * @throws ConfigError on an unknown option or missing value
     */
    std::optional<cli_args> parse(int argc, char** argv) {
        cli_args args;

        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];

            if (arg == "-h" || arg == "--help") {
                args.help = true;
            }
            else if (arg == "--version") {
                args.version = true;
            }
            else if (arg == "-c" || arg == "--config") {
                args.config_path = value(argc, argv, i, arg);
            }
            else if (arg == "--log") {
                args.log_path = value(argc, argv, i, arg);
            }
            else if (arg.size() > 1 && arg[0] == '-') {
                throw ConfigError("unknown option: " + arg);
            }
            else if (args.sqlite_path.empty()) {
                args.sqlite_path = arg;
            }
            else {
                throw ConfigError("unexpected argument: " + arg);
            }
        }

        if (args.help) {
            print_help();
            return std::nullopt;
        }
        if (args.version) {
            out_ << program_name_ << " " << version << "\n";
            return std::nullopt;
        }
        return args;
    }

private:
    std::string program_name_;
    std::ostream& out_;

    static std::string value(int argc, char** argv, int& i, const std::string& arg) {
        if (++i >= argc) {
            throw ConfigError("missing argument for " + arg);
        }
        return argv[i];
    }

    void print_help() {
        out_ << program_name_ << " - terminal browser for MySQL, PostgreSQL and SQLite\n\n";
        out_ << "Usage:\n";
        out_ << "  " << program_name_ << " [options] [database.db]\n";
        out_ << "\n";
        out_ << "Options:\n";
        out_ << "  -c, --config <path>    Configuration file (default: ~/.config/sqlnav/config.json)\n";
        out_ << "  --log <path>           Log file (default: ~/.sqlnav.log)\n";
        out_ << "  -h, --help             Show this help\n";
        out_ << "  --version              Show version\n";
        out_ << "\n";
        out_ << "Press ? inside the program for key bindings.\n";
    }
};

} // namespace sqlnav::cli
