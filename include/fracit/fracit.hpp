#pragma once

// model
#include "fracit/config.hpp"
#include "fracit/error.hpp"
#include "fracit/result.hpp"

// iteration rules
#include "fracit/fractal.hpp"
#include "fracit/julia.hpp"
#include "fracit/mandelbrot.hpp"
#include "fracit/polynomiograph.hpp"
#include "fracit/rational_julia.hpp"

// kernels
#include "fracit/quadratic.hpp"
#include "fracit/simd.hpp"

// MT
#include "fracit/domain.hpp"
#include "fracit/results.hpp"
#include "fracit/run.hpp"

// colouring
#include "fracit/palette.hpp"
