#pragma once

#include "brotbench/colorize.hpp"
#include "brotbench/error.hpp"
#include "brotbench/escape_time.hpp"
#include "brotbench/evaluate.hpp"
#include "brotbench/iteration_grid.hpp"
#include "brotbench/render.hpp"
#include "brotbench/viewport.hpp"

// single
#include "brotbench/backends/naive.hpp"
#include "brotbench/backends/scalar.hpp"

// SIMD
#include "brotbench/backends/simd.hpp"

// MT (+ SIMD)
#include "brotbench/backends/threaded.hpp"

#include "brotbench/backend.hpp"
