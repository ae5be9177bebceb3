#ifndef TESTS_UTILS_H_
#define TESTS_UTILS_H_

#include <gtest/gtest.h>
#include "patgen/patgen_errors.h"

#define EXPECT_OK(expr) EXPECT_EQ(::patgen::STATUS_OK, (expr))
#define ASSERT_OK(expr) ASSERT_EQ(::patgen::STATUS_OK, (expr))

#endif  // TESTS_UTILS_H_
