/**
 * @file Cli.hpp
 * @brief The fieldmerge command line
 *
 * Exit status: 0 on success, 2 when an apply conflicts, 1 on any other
 * error or when `owners` finds nobody.
 */

#ifndef FIELDMERGE_CLI_HPP
#define FIELDMERGE_CLI_HPP

#include <iosfwd>

namespace fieldmerge {

constexpr int kExitConflict = 2;

/**
 * @brief Run one command
 *
 * Results go to out, errors and the verbose summary to err.
 *
 * @return Process exit status
 */
int run_cli(int argc, char** argv, std::ostream& out, std::ostream& err);

} // namespace fieldmerge

#endif // FIELDMERGE_CLI_HPP
