
#include "sc_signature.hpp"

namespace
{
	// Offset of the "SCLZ" marker inside an SC header
	constexpr std::size_t sclz_marker_offset = 26;

	// Only ASCII letters are folded, anything else must match exactly
	unsigned char ascii_lower(unsigned char c)
	{
		if (c >= 'A' && c <= 'Z')
			return static_cast<unsigned char>(c - 'A' + 'a');

		return c;
	}

	// Compares size bytes at data + offset against a lowercase ASCII pattern
	bool match_nocase(const char* data, std::size_t size, std::size_t offset, const char* pattern, std::size_t pattern_size)
	{
		if (offset > size || size - offset < pattern_size)
			return false;

		const unsigned char* p = reinterpret_cast<const unsigned char*>(data + offset);

		for (std::size_t i = 0; i < pattern_size; ++i)
		{
			if (ascii_lower(p[i]) != static_cast<unsigned char>(pattern[i]))
				return false;
		}

		return true;
	}
}

sc_signature sc_read_signature(const char* data, std::size_t size)
{
	const unsigned char* p = reinterpret_cast<const unsigned char*>(data);

	if (size >= 3 && p[0] == 0x5D && p[1] == 0x00 && p[2] == 0x00)
		return sc_signature::lzma;

	if (match_nocase(data, size, 0, "sc", 2))
	{
		if (size > 30 && match_nocase(data, size, sclz_marker_offset, "sclz", 4))
			return sc_signature::sclz;

		return sc_signature::sc;
	}

	if (match_nocase(data, size, 0, "sig:", 4))
		return sc_signature::sig;

	return sc_signature::none;
}

const char* sc_signature_name(sc_signature signature)
{
	switch (signature)
	{
		case sc_signature::none: return "none";
		case sc_signature::lzma: return "lzma";
		case sc_signature::sc:   return "sc";
		case sc_signature::sclz: return "sclz";
		case sc_signature::sig:  return "sig";
	}

	return "unknown";
}

