#ifndef SC_LOG_HPP
#define SC_LOG_HPP

constexpr int LOG_ERR = 0;
constexpr int LOG_LOG = 1;
constexpr int LOG_VERBOSE = 2;
constexpr int LOG_VERY_VERBOSE = 3;

extern int log_level;

// Logs to stderr so stdout stays usable for --text and --detect output
void sc_log(int level, const char* format, ...);

#endif // SC_LOG_HPP
