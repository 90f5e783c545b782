#ifndef SC_SIGNATURE_HPP
#define SC_SIGNATURE_HPP

#include <cstddef>

enum class sc_signature
{
	none, // Not compressed
	lzma, // Bare game LZMA header: 5D 00 00 ...
	sc,   // "SC" container with a 26 byte header
	sclz, // "SC" container holding LZHAM data ("SCLZ" at byte 26)
	sig   // "Sig:" container with a 68 byte header
};

// Classifies a buffer by its leading bytes
// Never throws - short buffers and non-text bytes just fail to match
sc_signature sc_read_signature(const char* data, std::size_t size);

const char* sc_signature_name(sc_signature signature);

#endif // SC_SIGNATURE_HPP
