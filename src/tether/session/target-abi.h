#pragma once

/**
 * The C entry point of a target built as a shared library, `lib<id>.so`.
 *
 * `tether_invoke` answers one request payload by calling `write` (any number of times) to
 * append to the response. It returns 0 on success. Any other value is an application
 * failure, and whatever was written becomes the failure message.
 */

#include <stddef.h>

#ifdef __cplusplus
extern "C" {
#endif

typedef void (*tether_write_fn)(void* sink, const char* data, size_t size);

typedef int (*tether_invoke_fn)(const char* request, size_t request_size, void* sink,
                                tether_write_fn write);

#define TETHER_INVOKE_SYMBOL "tether_invoke"

int tether_invoke(const char* request, size_t request_size, void* sink, tether_write_fn write);

#ifdef __cplusplus
}
#endif
