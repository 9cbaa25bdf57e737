#ifndef FILE_H
#define FILE_H

#include <stddef.h>

#ifdef __cplusplus
extern "C" {
#endif

// Read a whole file into a NUL terminated heap buffer; the caller frees it.
// Returns NULL (and logs) when the file cannot be read. *out_len receives
// the byte count when out_len is non-null.
char* read_text_file(const char *filename, size_t *out_len);

#ifdef __cplusplus
}
#endif

#endif // FILE_H
