#include "ht/io.h"

#include <stddef.h>

#ifdef _WIN32
#include <io.h> // for _write
#else
#include <unistd.h> // for write
#endif

namespace ht {

namespace {

void print_native(const char *str) {
    size_t len = 0;
    const char *p = str;
    while (*p++)
        len++;
#ifdef _WIN32
    _write(2, str, static_cast<unsigned int>(len)); // 2 = stderr
#else
    // stderr is best effort; a short write just truncates the log line.
    ssize_t written = ::write(2, str, len);
    (void)written;
#endif
}

#ifdef HALFTONE_TESTING
// Lazy initialization to avoid global constructors
print_handler_t &get_print_handler() {
    static print_handler_t handler;
    return handler;
}

println_handler_t &get_println_handler() {
    static println_handler_t handler;
    return handler;
}
#endif

} // namespace

void print(const char *str) {
    if (!str)
        return;
#ifdef HALFTONE_TESTING
    if (get_print_handler()) {
        get_print_handler()(str);
        return;
    }
#endif
    print_native(str);
}

void println(const char *str) {
    if (!str)
        return;
#ifdef HALFTONE_TESTING
    if (get_println_handler()) {
        get_println_handler()(str);
        return;
    }
#endif
    print(str);
    print("\n");
}

#ifdef HALFTONE_TESTING

void inject_print_handler(const print_handler_t &handler) {
    get_print_handler() = handler;
}

void inject_println_handler(const println_handler_t &handler) {
    get_println_handler() = handler;
}

void clear_io_handlers() {
    get_print_handler() = print_handler_t();
    get_println_handler() = println_handler_t();
}

#endif // HALFTONE_TESTING

} // namespace ht
