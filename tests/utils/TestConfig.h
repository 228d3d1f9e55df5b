#ifndef TAINTREACH_TESTS_UTILS_TESTCONFIG_H_
#define TAINTREACH_TESTS_UTILS_TESTCONFIG_H_

#include <string>

// Fixture files live under tests/test_data of the source tree.
#define TAINTREACH_TEST_FILE(NAME)                                             \
  (std::string(TAINTREACH_SRC_DIR "/tests/test_data/") + (NAME))

#endif // TAINTREACH_TESTS_UTILS_TESTCONFIG_H_
