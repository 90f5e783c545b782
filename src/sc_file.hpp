#ifndef SC_FILE_HPP
#define SC_FILE_HPP

#include <string>

#include <cstddef>

// Whole-file reads and writes
class sc_file
{
	public:
		enum file_mode_t
		{
			mode_binary,
			mode_text
		};

		// Creates every missing directory leading up to path
		// The final component is only created as well when is_dir is true
		// Throws if a component exists but is not a directory
		void mkdir(const std::string& path, bool is_dir = false);

		// Reads a local file's contents in to a string
		std::string get(const char* path, file_mode_t file_mode = mode_binary);

		// Writes a string to a local file, creating its parent directories
		// Returns the number of bytes written
		std::size_t put(const char* path, const char* data, std::size_t size, file_mode_t file_mode = mode_binary);
};

#endif // SC_FILE_HPP
