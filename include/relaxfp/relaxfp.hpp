#pragma once

// RELAXFP - Relaxed floating point
// Main convenience header

// Core: the wrapper and its relaxed operators
#include <relaxfp/core/relaxed.hpp>
#include <relaxfp/operations/arithmetic.hpp>

// Delegated primitive API
#include <relaxfp/io/print.hpp>
#include <relaxfp/operations/bits.hpp>
#include <relaxfp/operations/classify.hpp>
#include <relaxfp/operations/math.hpp>

// Additive identity trait
#include <relaxfp/traits/zero.hpp>

// Named relaxed operations on bare primitives
#include <relaxfp/ext/fast_ops.hpp>
