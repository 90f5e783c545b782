#ifndef SC_ERROR_HPP
#define SC_ERROR_HPP

#include <stdexcept>
#include <string>

class sc_error : public std::runtime_error
{
	public:
		explicit sc_error(const std::string& what)
			: std::runtime_error(what)
		{ }
};

// Both or neither of a path and a buffer were given
class sc_invalid_input : public sc_error
{
	public:
		explicit sc_invalid_input(const std::string& what) : sc_error(what) { }
};

// SCLZ (LZHAM) data, which cannot be decoded
class sc_unsupported_format : public sc_error
{
	public:
		explicit sc_unsupported_format(const std::string& what) : sc_error(what) { }
};

// liblzma rejected the stream, or the header was cut short
class sc_decode_error : public sc_error
{
	public:
		explicit sc_decode_error(const std::string& what) : sc_error(what) { }
};

class sc_encoding_error : public sc_error
{
	public:
		explicit sc_encoding_error(const std::string& what) : sc_error(what) { }
};

#endif // SC_ERROR_HPP
