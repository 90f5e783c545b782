
#include "sc_decompress.hpp"

#include <cstdint>
#include <memory>
#include <string>

#include <lzma.h>

#include "sc_error.hpp"
#include "sc_log.hpp"
#include "sc_signature.hpp"

namespace
{
	// Offset of the 32-bit uncompressed size inside the game header
	constexpr std::size_t size_field_offset = 5;

	std::int32_t decode_int_le(const char* src)
	{
		const unsigned char* src_uc = reinterpret_cast<const unsigned char*>(src);

		return static_cast<std::int32_t>(
		       static_cast<std::uint32_t>(src_uc[0])
		     | static_cast<std::uint32_t>(src_uc[1]) << 8
		     | static_cast<std::uint32_t>(src_uc[2]) << 16
		     | static_cast<std::uint32_t>(src_uc[3]) << 24);
	}

	const char* describe_lzma_ret(lzma_ret result)
	{
		switch (result)
		{
			case LZMA_MEM_ERROR:       return "out of memory";
			case LZMA_MEMLIMIT_ERROR:  return "memory limit reached";
			case LZMA_FORMAT_ERROR:    return "not an .lzma stream";
			case LZMA_OPTIONS_ERROR:   return "unsupported header options";
			case LZMA_DATA_ERROR:      return "corrupt data";
			case LZMA_BUF_ERROR:       return "truncated data";
			case LZMA_PROG_ERROR:      return "internal error";
			default:                   return "unexpected result";
		}
	}

	// Releases the decoder however we leave sc_lzma_decode
	struct lzma_stream_guard
	{
		lzma_stream& stream;

		explicit lzma_stream_guard(lzma_stream& s) : stream(s) { }
		~lzma_stream_guard() { lzma_end(&stream); }

		lzma_stream_guard(const lzma_stream_guard&) = delete;
		lzma_stream_guard& operator=(const lzma_stream_guard&) = delete;
	};

	std::string adapt_and_decode(const char* data, std::size_t size, std::size_t offset)
	{
		std::string stream = sc_adapt_lzma(data, size, offset);
		return sc_lzma_decode(stream.data(), stream.size());
	}
}

std::string sc_adapt_lzma(const char* data, std::size_t size, std::size_t offset)
{
	if (offset > size || size - offset < SC_GAME_HEADER_SIZE)
		throw sc_decode_error("LZMA header truncated: need " + std::to_string(offset + SC_GAME_HEADER_SIZE)
		                      + " bytes, have " + std::to_string(size));

	const char* header = data + offset;
	std::int32_t uncompressed_size = decode_int_le(header + size_field_offset);

	sc_log(LOG_VERY_VERBOSE, "Stored uncompressed size: %ld", static_cast<long>(uncompressed_size));

	std::string stream;
	stream.reserve(size - offset + (SC_LZMA_HEADER_SIZE - SC_GAME_HEADER_SIZE));

	stream.append(header, SC_GAME_HEADER_SIZE);

	// High half of the 64-bit size
	if (uncompressed_size == -1)
		stream.append("\xFF\xFF\xFF\xFF", 4);
	else
		stream.append("\x00\x00\x00\x00", 4);

	stream.append(header + SC_GAME_HEADER_SIZE, size - offset - SC_GAME_HEADER_SIZE);

	return stream;
}

std::string sc_lzma_decode(const char* data, std::size_t size)
{
	constexpr int buffer_size = 256 * 1024;

	std::string output;
	std::unique_ptr<char[]> output_buffer(new char[buffer_size]);

	lzma_stream stream = LZMA_STREAM_INIT;

	lzma_ret result = lzma_alone_decoder(&stream, UINT64_MAX);

	if (result != LZMA_OK)
		throw sc_decode_error(std::string("LZMA decoder initialization failed: ") + describe_lzma_ret(result));

	lzma_stream_guard guard(stream);

	stream.next_in = reinterpret_cast<const std::uint8_t*>(data);
	stream.avail_in = size;

	for (;;)
	{
		stream.next_out = reinterpret_cast<std::uint8_t*>(output_buffer.get());
		stream.avail_out = buffer_size;

		// All input is already here, so LZMA_FINISH lets liblzma report truncation
		result = lzma_code(&stream, LZMA_FINISH);

		std::size_t bytes_decompressed = buffer_size - stream.avail_out;

		output.append(output_buffer.get(), bytes_decompressed);

		if (result == LZMA_STREAM_END)
			break;

		if (result != LZMA_OK)
			throw sc_decode_error(std::string("LZMA decoder failed after ") + std::to_string(output.size())
			                      + " bytes: " + describe_lzma_ret(result));
	}

	if (stream.avail_in > 0)
		sc_log(LOG_VERBOSE, "Ignoring %lu trailing bytes after end of LZMA stream", static_cast<unsigned long>(stream.avail_in));

	return output;
}

std::string sc_decompress(const char* data, std::size_t size, bool sclz_passthrough)
{
	sc_signature signature = sc_read_signature(data, size);

	sc_log(LOG_VERBOSE, "Signature: %s", sc_signature_name(signature));

	switch (signature)
	{
		case sc_signature::none:
			return std::string(data, size);

		case sc_signature::lzma:
			return adapt_and_decode(data, size, SC_OFFSET_LZMA);

		case sc_signature::sc:
			return adapt_and_decode(data, size, SC_OFFSET_SC);

		case sc_signature::sclz:
			if (!sclz_passthrough)
				throw sc_unsupported_format("SCLZ data uses LZHAM compression, which is not supported");

			sc_log(LOG_LOG, "SCLZ data is not supported, passing it through undecoded");
			return std::string(data, size);

		case sc_signature::sig:
			return adapt_and_decode(data, size, SC_OFFSET_SIG);
	}

	throw sc_decode_error("Unknown signature");
}

