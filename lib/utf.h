#pragma once
#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

// decode one UTF-8 sequence; returns bytes consumed, 0 at end of string,
// -1 for an invalid sequence (codepoint set to U+FFFD, caller skips 1 byte)
int utf8_to_codepoint(const unsigned char* utf8, uint32_t* codepoint);
int utf8_char_count(const char* utf8_string);
int utf8_char_to_byte_offset(const char* utf8_string, int char_index);
// encode codepoint into out (at least 5 bytes, NUL terminated); returns byte length or 0
int unicode_to_utf8(uint32_t codepoint, char* out);

#ifdef __cplusplus
}
#endif
