#ifndef MPINT_ASSERT_HPP
#define MPINT_ASSERT_HPP

#include "ulight/impl/assert.hpp"

// Precondition violations are reported through ulight's assertion handler.

#define MPINT_ASSERT(...) ULIGHT_ASSERT(__VA_ARGS__)
#define MPINT_DEBUG_ASSERT(...) ULIGHT_DEBUG_ASSERT(__VA_ARGS__)

#define MPINT_ASSERT_UNREACHABLE(...) ULIGHT_ASSERT_UNREACHABLE(__VA_ARGS__)

#endif
