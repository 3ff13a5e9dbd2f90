/*
 * Include this file to use assert in test code. This will allow the use of assert and ensure that
 * NDEBUG is undefined, which would cause tests to pass without checking anything.
 */

#ifndef LZWFORGE_ASSERT_TEST_H
#define LZWFORGE_ASSERT_TEST_H

#ifdef NDEBUG
# undef NDEBUG
#endif
#include <assert.h>

#endif /* LZWFORGE_ASSERT_TEST_H */
