#pragma once

#include "assert/assert.hpp"

#define RPS_CHECK(expr, ...) \
    ASSERT_INVOKE(expr, false, true, "RPS_CHECK", verification, , __VA_ARGS__)

namespace rps {
using check_failure = libassert::verification_failure;
}
