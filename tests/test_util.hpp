#ifndef SC_TEST_UTIL_HPP
#define SC_TEST_UTIL_HPP

#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>

#include <lzma.h>

#include <dirent.h>
#include <sys/stat.h>
#include <unistd.h>

#include "sc_log.hpp"

// Compresses data in to a standard .lzma stream (13 byte header, unknown size)
inline std::string lzma_alone_encode(const std::string& input)
{
	lzma_options_lzma options;

	if (lzma_lzma_preset(&options, 6))
		throw std::runtime_error("lzma_lzma_preset failed");

	lzma_stream stream = LZMA_STREAM_INIT;

	if (lzma_alone_encoder(&stream, &options) != LZMA_OK)
		throw std::runtime_error("lzma_alone_encoder failed");

	std::string output;
	std::unique_ptr<char[]> buffer(new char[64 * 1024]);

	stream.next_in = reinterpret_cast<const std::uint8_t*>(input.data());
	stream.avail_in = input.size();

	lzma_ret result;

	do
	{
		stream.next_out = reinterpret_cast<std::uint8_t*>(buffer.get());
		stream.avail_out = 64 * 1024;

		result = lzma_code(&stream, LZMA_FINISH);

		output.append(buffer.get(), 64 * 1024 - stream.avail_out);
	} while (result == LZMA_OK);

	lzma_end(&stream);

	if (result != LZMA_STREAM_END)
		throw std::runtime_error("LZMA encoding failed");

	return output;
}

// Turns a standard .lzma stream in to the game's 9 byte header form by
//   dropping the high half of the 64-bit size
inline std::string to_game_lzma(const std::string& lzma_stream)
{
	return lzma_stream.substr(0, 9) + lzma_stream.substr(13);
}

// Repetitive text that compresses well but is not trivially short
inline std::string sample_text()
{
	std::string text;

	for (int i = 0; i < 500; ++i)
		text += "name,health,damage\nbarbarian," + std::to_string(i * 7) + "," + std::to_string(i % 13) + "\n";

	return text;
}

// Logs why a test failed and returns false for the test to pass back up
inline bool test_fail(const char* test, const char* message)
{
	sc_log(LOG_ERR, "%s: %s", test, message);
	return false;
}

// Removes a directory and everything below it
inline bool remove_tree(const std::string& path)
{
	DIR* dir = ::opendir(path.c_str());

	if (!dir)
		return false;

	bool removed = true;

	while (dirent* entry = ::readdir(dir))
	{
		std::string name = entry->d_name;

		if (name == "." || name == "..")
			continue;

		std::string child = path + '/' + name;
		struct stat child_stat;

		if (::lstat(child.c_str(), &child_stat) != 0)
			removed = false;
		else if (S_ISDIR(child_stat.st_mode))
			removed = remove_tree(child) && removed;
		else if (::unlink(child.c_str()) != 0)
			removed = false;
	}

	::closedir(dir);

	return ::rmdir(path.c_str()) == 0 && removed;
}

#endif // SC_TEST_UTIL_HPP
