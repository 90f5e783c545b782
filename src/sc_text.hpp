#ifndef SC_TEXT_HPP
#define SC_TEXT_HPP

#include <cstddef>

// Strict UTF-8 check: rejects overlong forms, surrogates, code points past
//   U+10FFFF and sequences cut off at the end of the buffer
bool sc_is_valid_utf8(const char* data, std::size_t size);

#endif // SC_TEXT_HPP
