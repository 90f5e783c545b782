#ifndef SC_DECOMPRESS_HPP
#define SC_DECOMPRESS_HPP

#include <cstddef>
#include <string>

// Bytes of container header in front of the game LZMA header
constexpr std::size_t SC_OFFSET_LZMA = 0;
constexpr std::size_t SC_OFFSET_SC = 26;
constexpr std::size_t SC_OFFSET_SIG = 68;

// Game LZMA header: properties (1) + dictionary size (4) + uncompressed size (4)
constexpr std::size_t SC_GAME_HEADER_SIZE = 9;

// .lzma header: properties (1) + dictionary size (4) + uncompressed size (8)
constexpr std::size_t SC_LZMA_HEADER_SIZE = 13;

// Turns the game LZMA stream found at offset into a standard .lzma stream by
//   widening the 32-bit little-endian size field to 64 bits
// A stored size of FF FF FF FF (-1, unknown) becomes eight FF bytes
std::string sc_adapt_lzma(const char* data, std::size_t size, std::size_t offset);

// Decodes a standard .lzma stream
std::string sc_lzma_decode(const char* data, std::size_t size);

// Decompresses a buffer according to its signature
// Uncompressed buffers are returned as-is. SCLZ buffers throw
//   sc_unsupported_format unless sclz_passthrough is set
std::string sc_decompress(const char* data, std::size_t size, bool sclz_passthrough = false);

#endif // SC_DECOMPRESS_HPP
