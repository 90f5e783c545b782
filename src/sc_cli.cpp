
#include "sc_cli.hpp"

#include "sc_compression.hpp"
#include "sc_config.hpp"
#include "sc_error.hpp"
#include "sc_file.hpp"
#include "sc_log.hpp"
#include "sc_signature.hpp"

#include <stdexcept>
#include <string>
#include <vector>

#include <cstdio>
#include <cstdlib>

#include <getopt.h>

// ---

#define SCUNPACK_VERSION "1.0"

// Appended to the input file name to build the default output name
#define DEFAULT_OUTPUT_SUFFIX ".out"

// Environment variable naming a config file when --config is not given
#define CONFIG_ENV "SCUNPACK_CONFIG"

// ---

namespace
{
	struct cmdline_options
	{
		const char* config = nullptr;
		const char* output = nullptr;
		const char* output_dir = nullptr;

		bool detect_only = false;
		bool to_text = false;
		bool sclz_passthrough = false;

		int log_level_adjust = 0;
	};

	// Prints the help message seen when calling scunpack --help
	void print_help(const char* argv0)
	{
		std::printf("\
Usage: %1$s [OPTION]... FILE...\n\
Decompresses Supercell game asset files (LZMA, SC and Sig: containers).\n\
\n\
  -q, --quiet            only output when something goes wrong\n\
\n\
  -v, --verbose          more detailed logging output\n\
                         specify twice (e.g. -v -v) for even more output\n\
\n\
  -o, --output=<file>    write the decompressed data to <file>\n\
                         only valid with a single input FILE\n\
\n\
  --output-dir=<dir>     write decompressed files in to <dir>\n\
                         if not specified, each output is placed beside its input\n\
\n\
  --detect               print the detected signature of each FILE and exit\n\
\n\
  --text                 print the decompressed data to stdout as UTF-8 text\n\
\n\
  --sclz-passthrough     copy SCLZ (LZHAM) files through undecoded\n\
                         instead of failing\n\
\n\
  --config=<file>        load settings from <file>\n\
                         if not specified, $" CONFIG_ENV " is used when set\n\
\n\
  --help                 display this help and exit\n\
\n\
  --version              display version information and exit\n\
\n", argv0);
	}

	// Prints the version message seen when calling scunpack --version
	void print_version()
	{
		std::puts("scunpack " SCUNPACK_VERSION);
	}

	// Gets the config file path from the command line or environment
	// Returns an empty string if there is none
	std::string get_config_filename(const cmdline_options& options)
	{
		if (options.config)
			return options.config;

		const char* env_config = std::getenv(CONFIG_ENV);

		if (env_config)
			return std::string(env_config);

		return std::string();
	}

	std::string base_name(const std::string& path)
	{
		std::size_t slash_pos = path.find_last_of('/');

		if (slash_pos == std::string::npos)
			return path;

		return path.substr(slash_pos + 1);
	}

	std::string dir_name(const std::string& path)
	{
		std::size_t slash_pos = path.find_last_of('/');

		if (slash_pos == std::string::npos)
			return ".";
		else if (slash_pos == 0)
			return "/";

		return path.substr(0, slash_pos);
	}

	// Output directory from --output-dir, else the config, else empty (beside the input)
	std::string get_output_dir(const cmdline_options& options, const sc_config& config)
	{
		if (options.output_dir)
			return options.output_dir;

		return config.get_else("output_dir", "");
	}

	// Picks the output path for an input from -o, the output directory or the input's own directory
	std::string build_output_filename(const std::string& input, const std::string& output_dir,
	                                  const cmdline_options& options, const sc_config& config)
	{
		if (options.output)
			return options.output;

		std::string dir = output_dir.empty() ? dir_name(input) : output_dir;

		return dir + '/' + base_name(input) + config.get_else("output_suffix", DEFAULT_OUTPUT_SUFFIX);
	}

	// Runs the requested action on one input file
	// Any failure is logged and reported as false so the other files still run
	bool process_file(const std::string& input, const std::string& output_dir,
	                  const cmdline_options& options, const sc_config& config)
	{
		try
		{
			sc_compression compression = sc_compression::from_file(input);
			compression.set_sclz_passthrough(options.sclz_passthrough);

			if (options.detect_only)
			{
				std::printf("%s: %s\n", input.c_str(), sc_signature_name(compression.signature()));
				return true;
			}

			if (options.to_text)
			{
				std::string text = compression.decompress_to_string();
				std::fwrite(text.data(), 1, text.size(), stdout);
				return std::fflush(stdout) == 0;
			}

			std::string output = build_output_filename(input, output_dir, options, config);
			std::size_t written = compression.decompress_to_file(output);

			sc_log(LOG_LOG, "%s -> %s (%lu bytes)", input.c_str(), output.c_str(), static_cast<unsigned long>(written));

			return true;
		}
		catch (sc_unsupported_format& e)
		{
			sc_log(LOG_ERR, "%s: %s (use --sclz-passthrough to copy it as-is)", input.c_str(), e.what());
		}
		catch (std::exception& e)
		{
			sc_log(LOG_ERR, "%s: %s", input.c_str(), e.what());
		}

		return false;
	}
}

int sc_cli_run(int argc, char** argv) try
{
// --- Handle command line options ---
	cmdline_options options;

	{
		int result;
		int indexptr;

		const option longopts[] = {
			{ "quiet",            no_argument,       nullptr, 'q' },
			{ "verbose",          no_argument,       nullptr, 'v' },
			{ "output",           required_argument, nullptr, 'o' },
			{ "output-dir",       required_argument, nullptr, 'D' },
			{ "detect",           no_argument,       nullptr, 'd' },
			{ "text",             no_argument,       nullptr, 'T' },
			{ "sclz-passthrough", no_argument,       nullptr, 'S' },
			{ "config",           required_argument, nullptr, 'C' },
			{ "help",             no_argument,       nullptr, 'H' },
			{ "version",          no_argument,       nullptr, 'V' },
			{ nullptr,            no_argument,       nullptr, 0 },
		};

		// Zero makes glibc reinitialize its scanner between runs
		optind = 0;

		while ((result = getopt_long(argc, argv, "qvo:", longopts, &indexptr)) != -1)
		{
			switch (result)
			{
				case 'q': --options.log_level_adjust; break;
				case 'v': ++options.log_level_adjust; break;
				case 'o': options.output = optarg; break;
				case 'D': options.output_dir = optarg; break;
				case 'd': options.detect_only = true; break;
				case 'T': options.to_text = true; break;
				case 'S': options.sclz_passthrough = true; break;
				case 'C': options.config = optarg; break;
				case 'V': print_version(); return SC_EXIT_OK;
				case 'H': print_help(argv[0]); return SC_EXIT_OK;
				default: std::fprintf(stderr, "Try '%s --help' for more information.\n", argv[0]); return SC_EXIT_USAGE;
			}
		}
	}

	std::vector<std::string> inputs(argv + optind, argv + argc);

	if (inputs.empty())
	{
		std::fprintf(stderr, "%s: no input files\nTry '%s --help' for more information.\n", argv[0], argv[0]);
		return SC_EXIT_USAGE;
	}

	if (options.output && inputs.size() > 1)
	{
		std::fprintf(stderr, "%s: --output can only be used with a single input file\n", argv[0]);
		return SC_EXIT_USAGE;
	}

// --- Load settings ---
	sc_config config("scunpack config");
	std::string config_filename = get_config_filename(options);
	sc_file file;

	if (!config_filename.empty())
		config.parse(file.get(config_filename.c_str(), sc_file::mode_text));

	// Command line flags adjust whatever level the config asked for
	log_level = config.get_int_else("log_level", LOG_LOG) + options.log_level_adjust;

	if (!config_filename.empty())
		sc_log(LOG_VERBOSE, "Loaded settings from %s", config_filename.c_str());

	if (config.get_int_else("sclz_passthrough", 0))
		options.sclz_passthrough = true;

	std::string output_dir = get_output_dir(options, config);

	if (!output_dir.empty() && !options.detect_only && !options.to_text && !options.output)
	{
		sc_log(LOG_VERBOSE, "Output directory is %s", output_dir.c_str());
		file.mkdir(output_dir, true);
	}

// --- Process files ---
	int failures = 0;

	for (const std::string& input : inputs)
	{
		if (!process_file(input, output_dir, options, config))
			++failures;
	}

	if (failures > 0)
	{
		sc_log(LOG_LOG, "%d of %lu files failed", failures, static_cast<unsigned long>(inputs.size()));
		return SC_EXIT_FILE_FAILED;
	}

	return SC_EXIT_OK;
}
catch (std::exception& e)
{
	sc_log(LOG_ERR, "%s", e.what());
	return SC_EXIT_FILE_FAILED;
}

