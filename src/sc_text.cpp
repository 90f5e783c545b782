
#include "sc_text.hpp"

bool sc_is_valid_utf8(const char* data, std::size_t size)
{
	const unsigned char* p = reinterpret_cast<const unsigned char*>(data);
	std::size_t i = 0;

	while (i < size)
	{
		unsigned char c = p[i];

		if (c < 0x80)
		{
			++i;
			continue;
		}

		std::size_t length;
		unsigned char lo = 0x80, hi = 0xBF; // Allowed range of the second byte

		if (c >= 0xC2 && c <= 0xDF)
			length = 2;
		else if (c >= 0xE0 && c <= 0xEF)
		{
			length = 3;

			if (c == 0xE0)
				lo = 0xA0;
			else if (c == 0xED)
				hi = 0x9F;
		}
		else if (c >= 0xF0 && c <= 0xF4)
		{
			length = 4;

			if (c == 0xF0)
				lo = 0x90;
			else if (c == 0xF4)
				hi = 0x8F;
		}
		else
			return false;

		if (size - i < length)
			return false;

		if (p[i + 1] < lo || p[i + 1] > hi)
			return false;

		for (std::size_t j = 2; j < length; ++j)
		{
			if ((p[i + j] & 0xC0) != 0x80)
				return false;
		}

		i += length;
	}

	return true;
}

