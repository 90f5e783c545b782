#ifndef SC_CLI_HPP
#define SC_CLI_HPP

// Exit codes
constexpr int SC_EXIT_OK = 0;
constexpr int SC_EXIT_FILE_FAILED = 1;
constexpr int SC_EXIT_USAGE = 2;

// Runs scunpack with a full command line (argv[0] included)
// Returns SC_EXIT_OK when every file succeeded, SC_EXIT_FILE_FAILED when any
//   file failed and SC_EXIT_USAGE for a bad command line
// argv may be permuted by getopt_long
int sc_cli_run(int argc, char** argv);

#endif // SC_CLI_HPP
