/**
 * @file Cli.hpp
 * @brief Command dispatch for the mergepatch executable
 *
 * Commands:
 *   apply TARGET PATCH | diff ORIGINAL MODIFIED | compose PATCH1 PATCH2
 *   equal A B | is-array FILE
 *
 * A FILE operand of "-" reads the supplied input stream (at most once).
 */

#ifndef MERGEPATCH_CLI_HPP
#define MERGEPATCH_CLI_HPP

#include <iosfwd>

namespace mergepatch {

/// Success, or a true answer from equal / is-array.
constexpr int kExitOk = 0;
/// A false answer from equal / is-array.
constexpr int kExitFalse = 1;
/// Bad flags, unknown command or wrong operand count.
constexpr int kExitUsage = 2;
/// Unreadable input, malformed JSON, bad settings, or a failed diff.
constexpr int kExitError = 3;

/**
 * @brief Run the tool with explicit streams
 *
 * Diagnostics go to @p err as "Error: <message>".
 *
 * @return One of the kExit* codes
 */
int run_cli(int argc, const char* const* argv,
            std::istream& in, std::ostream& out, std::ostream& err);

} // namespace mergepatch

#endif // MERGEPATCH_CLI_HPP
