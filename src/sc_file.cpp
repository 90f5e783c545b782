
#include "sc_file.hpp"

#include <stdexcept>

#include <cerrno>
#include <cstdio>
#include <cstring>

#include <sys/stat.h>
#include <sys/types.h>

namespace
{
	// Closes the handle on every way out of get() and put()
	struct file_handle
	{
		FILE* fh;

		explicit file_handle(FILE* f) : fh(f) { }
		~file_handle() { if (fh) std::fclose(fh); }

		file_handle(const file_handle&) = delete;
		file_handle& operator=(const file_handle&) = delete;

		// Flushes and reports whether the close succeeded
		bool close()
		{
			int result = std::fclose(fh);
			fh = nullptr;
			return result == 0;
		}
	};
}

void sc_file::mkdir(const std::string& path, bool is_dir)
{
	auto ensure_dir = [](const std::string& dir)
	{
		struct stat dir_stat;

		if (::stat(dir.c_str(), &dir_stat) == 0)
		{
			if (!S_ISDIR(dir_stat.st_mode))
				throw std::runtime_error("Not a directory: " + dir);

			return;
		}

		if (::mkdir(dir.c_str(), S_IRWXU | S_IRWXG | S_IRWXO) != 0 && errno != EEXIST)
			throw std::runtime_error("Could not create directory: " + dir + ": " + std::strerror(errno));
	};

	// Create each parent in turn, skipping the root and runs of slashes
	for (std::size_t slash_pos = path.find('/', 1); slash_pos != std::string::npos; slash_pos = path.find('/', slash_pos + 1))
	{
		if (path[slash_pos - 1] != '/')
			ensure_dir(path.substr(0, slash_pos));
	}

	if (is_dir && !path.empty() && path.back() != '/')
		ensure_dir(path);
}

std::string sc_file::get(const char* path, file_mode_t file_mode)
{
	const char* mode_str =
		  (file_mode == mode_text)
		? "rt"
		: "rb";

	file_handle file(std::fopen(path, mode_str));
	std::string buffer;

	if (!file.fh)
		throw std::runtime_error(std::string("Could not open file: ") + path);

	while (!std::feof(file.fh))
	{
		char buf[64 * 1024];

		std::size_t result = std::fread(buf, 1, sizeof(buf), file.fh);

		if (std::ferror(file.fh))
			throw std::runtime_error(std::string("Failed while reading file: ") + path);

		buffer.append(buf, result);
	}

	return buffer;
}

std::size_t sc_file::put(const char* path, const char* data, std::size_t size, file_mode_t file_mode)
{
	const char* mode_str =
		  (file_mode == mode_text)
		? "wt"
		: "wb";

	mkdir(path);

	file_handle file(std::fopen(path, mode_str));

	if (!file.fh)
		throw std::runtime_error(std::string("Could not open file: ") + path);

	std::size_t written = 0;

	while (written < size)
	{
		written += std::fwrite(data + written, 1, size - written, file.fh);

		if (std::ferror(file.fh))
			throw std::runtime_error(std::string("Failed while writing file: ") + path);
	}

	if (!file.close())
		throw std::runtime_error(std::string("Failed while closing file: ") + path);

	return written;
}

