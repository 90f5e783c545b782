#include "sc_file.hpp"

#include "test_util.hpp"

#include <cstdlib>
#include <stdexcept>
#include <string>

#include <sys/stat.h>

namespace
{
	std::string temp_dir;

	bool is_directory(const std::string& path)
	{
		struct stat path_stat;
		return ::stat(path.c_str(), &path_stat) == 0 && S_ISDIR(path_stat.st_mode);
	}

	bool exists(const std::string& path)
	{
		struct stat path_stat;
		return ::stat(path.c_str(), &path_stat) == 0;
	}
}

bool TestMkdirParentsOnly()
{
	sc_file file;
	std::string path = temp_dir + "/parents/only/leaf";

	file.mkdir(path);

	if (!is_directory(temp_dir + "/parents/only"))
		return test_fail("TestMkdirParentsOnly", "parent directories not created");

	if (exists(path))
		return test_fail("TestMkdirParentsOnly", "final component created without is_dir");

	sc_log(LOG_LOG, "TestMkdirParentsOnly: Passed");
	return true;
}

bool TestMkdirWholePath()
{
	sc_file file;
	std::string path = temp_dir + "/whole//path/leaf";

	file.mkdir(path, true);

	if (!is_directory(path))
		return test_fail("TestMkdirWholePath", "final component not created with is_dir");

	// Existing directories are fine
	file.mkdir(path, true);

	// A trailing slash already names a directory
	file.mkdir(temp_dir + "/trailing/", false);

	if (!is_directory(temp_dir + "/trailing"))
		return test_fail("TestMkdirWholePath", "trailing slash directory not created");

	sc_log(LOG_LOG, "TestMkdirWholePath: Passed");
	return true;
}

bool TestMkdirThroughFile()
{
	sc_file file;
	std::string blocker = temp_dir + "/blocker";
	file.put(blocker.c_str(), "x", 1);

	try
	{
		file.mkdir(blocker + "/below", true);
		return test_fail("TestMkdirThroughFile", "directory created below a regular file");
	}
	catch (std::runtime_error&)
	{
	}

	sc_log(LOG_LOG, "TestMkdirThroughFile: Passed");
	return true;
}

bool TestPutGet()
{
	sc_file file;
	std::string path = temp_dir + "/put/get.bin";
	std::string data("\x00\x01\x02\xFF binary", 11);

	if (file.put(path.c_str(), data.data(), data.size()) != data.size())
		return test_fail("TestPutGet", "put returned the wrong byte count");

	if (file.get(path.c_str()) != data)
		return test_fail("TestPutGet", "get returned different bytes");

	if (file.put(path.c_str(), "", 0) != 0 || !file.get(path.c_str()).empty())
		return test_fail("TestPutGet", "empty write did not truncate");

	try
	{
		file.get((temp_dir + "/missing").c_str());
		return test_fail("TestPutGet", "missing file read");
	}
	catch (std::runtime_error&)
	{
	}

	sc_log(LOG_LOG, "TestPutGet: Passed");
	return true;
}

int main()
{
	char dir_template[] = "/tmp/scunpack_file_XXXXXX";

	if (!::mkdtemp(dir_template))
	{
		sc_log(LOG_ERR, "Could not create a temporary directory");
		return -1;
	}

	temp_dir = dir_template;

	bool passed = TestMkdirParentsOnly()
	           && TestMkdirWholePath()
	           && TestMkdirThroughFile()
	           && TestPutGet();

	if (!remove_tree(temp_dir))
		sc_log(LOG_ERR, "Could not remove %s", temp_dir.c_str());

	if (!passed)
	{
		sc_log(LOG_ERR, "test_file failed");
		return -1;
	}

	sc_log(LOG_LOG, "All tests passed");
	return 0;
}
