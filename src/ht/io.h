#pragma once

#ifdef HALFTONE_TESTING
#include <functional>
#endif

namespace ht {

// Low-level print functions. Everything the library logs funnels through
// println() so that tests can capture it.

// Print a string without newline
void print(const char *str);

// Print a string with newline
#ifndef HT_PRINTLN_DECLARED
#define HT_PRINTLN_DECLARED
void println(const char *str);
#endif

#ifdef HALFTONE_TESTING

// Testing function handler types
using print_handler_t = std::function<void(const char *)>;
using println_handler_t = std::function<void(const char *)>;

// Inject function handlers for testing
void inject_print_handler(const print_handler_t &handler);
void inject_println_handler(const println_handler_t &handler);

// Clear all injected handlers (restores default behavior)
void clear_io_handlers();

#endif // HALFTONE_TESTING

} // namespace ht
