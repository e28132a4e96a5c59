/**
 * @file Cli.cpp
 * @brief Command dispatch for the mergepatch executable
 */

#include "mergepatch/Cli.hpp"
#include "mergepatch/Codec.hpp"
#include "mergepatch/Compose.hpp"
#include "mergepatch/Diff.hpp"
#include "mergepatch/Equality.hpp"
#include "mergepatch/Errors.hpp"
#include "mergepatch/Merge.hpp"
#include "mergepatch/Settings.hpp"

#include <cxxopts.hpp>
#include <algorithm>
#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace mergepatch {

namespace {

// Reported with kExitUsage
class UsageError : public std::runtime_error {
public:
    explicit UsageError(const std::string& msg) : std::runtime_error(msg) {}
};

// "-" reads the input stream
std::string read_input(const std::string& path, std::istream& in) {
    if (path == "-") {
        return std::string(std::istreambuf_iterator<char>(in),
                           std::istreambuf_iterator<char>());
    }
    std::ifstream ifs(path, std::ios::binary);
    if (!ifs) {
        throw FileNotFoundError(path);
    }
    std::ostringstream ss;
    ss << ifs.rdbuf();
    return ss.str();
}

void expect_operands(const std::vector<std::string>& cmdv, std::size_t count) {
    if (cmdv.size() != count + 1) {
        throw UsageError("command '" + cmdv[0] + "' takes " + std::to_string(count) +
                         " argument(s)");
    }
    if (std::count(cmdv.begin() + 1, cmdv.end(), "-") > 1) {
        throw UsageError("standard input can only be read once");
    }
}

} // namespace

int run_cli(int argc, const char* const* argv,
            std::istream& in, std::ostream& out, std::ostream& err) {
    try {
        cxxopts::Options options("mergepatch", "Apply, create and compose JSON merge patches (RFC 7386)");
        options.positional_help("COMMAND [ARGS]");

        // Global options
        options.add_options()
            ("c,config", "Path to JSON/TOML settings file", cxxopts::value<std::string>())
            ("o,out", "Write the result to FILE instead of stdout", cxxopts::value<std::string>())
            ("indent", "Pretty-print with N spaces (-1 for compact)", cxxopts::value<int>())
            ("max-depth", "Maximum nesting depth accepted", cxxopts::value<std::size_t>())
            ("no-escape-html", "Write &, < and > literally")
            ("h,help", "Show help");

        // Command + operands captured as positional strings
        options.add_options()
            ("command", "Subcommand", cxxopts::value<std::vector<std::string>>());

        options.parse_positional({"command"});

        auto result = options.parse(argc, argv);
        if (result.count("help") || !result.count("command")) {
            out << options.help() << "\n";
            out << "Commands: apply TARGET PATCH | diff ORIGINAL MODIFIED | compose PATCH1 PATCH2 | equal A B | is-array FILE\n";
            out << "Use - for a file operand to read standard input.\n";
            out << "Exit codes: 0 success or true, 1 false, 2 usage error, 3 error.\n";
            return kExitOk;
        }

        if (result.count("indent") && result["indent"].as<int>() < -1) {
            throw UsageError("--indent must be >= -1");
        }
        if (result.count("max-depth") && result["max-depth"].as<std::size_t>() == 0) {
            throw UsageError("--max-depth must be >= 1");
        }

        const auto cmdv = result["command"].as<std::vector<std::string>>();
        const std::string& cmd = cmdv[0];
        if (cmd != "apply" && cmd != "diff" && cmd != "compose" &&
            cmd != "equal" && cmd != "is-array") {
            throw UsageError("unknown command '" + cmd + "'");
        }
        expect_operands(cmdv, cmd == "is-array" ? 1 : 2);

        // defaults -> file -> env -> flags
        std::optional<std::string> config_path;
        if (result.count("config")) config_path = result["config"].as<std::string>();
        ApplyOptions opts = load_options(config_path);
        if (result.count("indent")) opts.indent = result["indent"].as<int>();
        if (result.count("max-depth")) opts.max_depth = result["max-depth"].as<std::size_t>();
        if (result.count("no-escape-html")) opts.escape_html = false;

        auto emit = [&](const std::string& text) {
            if (result.count("out")) {
                const auto path = result["out"].as<std::string>();
                std::ofstream ofs(path, std::ios::binary);
                if (!ofs) {
                    err << "Error: cannot write to " << path << "\n";
                    return kExitError;
                }
                ofs << text << "\n";
                return kExitOk;
            }
            out << text << "\n";
            return kExitOk;
        };

        // APPLY
        if (cmd == "apply") {
            return emit(apply_with_options(read_input(cmdv[1], in), read_input(cmdv[2], in), opts));
        }

        // DIFF
        if (cmd == "diff") {
            return emit(create_merge_patch(read_input(cmdv[1], in), read_input(cmdv[2], in), opts));
        }

        // COMPOSE
        if (cmd == "compose") {
            return emit(merge_merge_patches(read_input(cmdv[1], in), read_input(cmdv[2], in), opts));
        }

        // EQUAL
        if (cmd == "equal") {
            const std::string a = read_input(cmdv[1], in);
            const std::string b = read_input(cmdv[2], in);
            const bool same = json_equal(a, b);
            out << (same ? "true" : "false") << "\n";
            return same ? kExitOk : kExitFalse;
        }

        // IS-ARRAY
        const bool array = resembles_array(read_input(cmdv[1], in));
        out << (array ? "true" : "false") << "\n";
        return array ? kExitOk : kExitFalse;

    } catch (const cxxopts::exceptions::exception& ex) {
        err << "Error: " << ex.what() << "\n";
        return kExitUsage;
    } catch (const UsageError& ex) {
        err << "Error: " << ex.what() << "\n";
        return kExitUsage;
    } catch (const PatchError& ex) {
        err << "Error: " << ex.what() << "\n";
        return kExitError;
    } catch (const std::exception& ex) {
        err << "Error: " << ex.what() << "\n";
        return kExitError;
    }
}

} // namespace mergepatch
