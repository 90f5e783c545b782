
#include "sc_compression.hpp"

#include <utility>

#include "sc_decompress.hpp"
#include "sc_error.hpp"
#include "sc_file.hpp"
#include "sc_log.hpp"
#include "sc_text.hpp"

sc_compression::sc_compression(const std::string& path, std::string buffer)
	: m_buffer(std::move(buffer))
	, m_sclz_passthrough(false)
{
	if (!path.empty() && !m_buffer.empty())
		throw sc_invalid_input("Only one of a file path or a buffer may be passed in");

	if (path.empty() && m_buffer.empty())
		throw sc_invalid_input("A file path or a buffer must be passed in");

	if (!path.empty())
	{
		sc_log(LOG_VERBOSE, "Reading %s", path.c_str());

		sc_file file;
		m_buffer = file.get(path.c_str());
	}
}

sc_compression sc_compression::from_file(const std::string& path)
{
	return sc_compression(path, std::string());
}

sc_compression sc_compression::from_buffer(std::string buffer)
{
	return sc_compression(std::string(), std::move(buffer));
}

sc_signature sc_compression::signature() const
{
	return sc_read_signature(m_buffer.data(), m_buffer.size());
}

std::string sc_compression::decompress() const
{
	return sc_decompress(m_buffer.data(), m_buffer.size(), m_sclz_passthrough);
}

std::string sc_compression::decompress_to_string() const
{
	std::string output = decompress();

	if (!sc_is_valid_utf8(output.data(), output.size()))
		throw sc_encoding_error("Decompressed data is not valid UTF-8 text");

	return output;
}

std::size_t sc_compression::decompress_to_file(const std::string& path) const
{
	std::string output = decompress();

	sc_log(LOG_VERBOSE, "Writing %lu bytes to %s", static_cast<unsigned long>(output.size()), path.c_str());

	sc_file file;
	return file.put(path.c_str(), output.data(), output.size());
}

