#define DOCTEST_CONFIG_IMPLEMENT
#include "doctest.h"

// This file contains the main function for doctest
// It will be compiled once and linked to the test executable

int main(int argc, char **argv) {
    return doctest::Context(argc, argv).run();
}
