#ifndef SC_COMPRESSION_HPP
#define SC_COMPRESSION_HPP

#include <cstddef>
#include <string>

#include "sc_signature.hpp"

// A Supercell asset held in memory, read once from a file or given directly
class sc_compression
{
	private:
		std::string m_buffer;
		bool m_sclz_passthrough;

	public:
		// Exactly one of path and buffer must be non-empty, otherwise throws
		//   sc_invalid_input. A path is read fully here and not touched again
		sc_compression(const std::string& path, std::string buffer);

		static sc_compression from_file(const std::string& path);
		static sc_compression from_buffer(std::string buffer);

		// Return SCLZ data undecoded instead of throwing sc_unsupported_format
		void set_sclz_passthrough(bool passthrough) { m_sclz_passthrough = passthrough; }

		sc_signature signature() const;

		std::string decompress() const;

		// Throws sc_encoding_error if the data is not UTF-8 text
		std::string decompress_to_string() const;

		// Returns the number of bytes written
		std::size_t decompress_to_file(const std::string& path) const;

		const std::string& buffer() const { return m_buffer; }
};

#endif // SC_COMPRESSION_HPP
