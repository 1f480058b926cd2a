#ifndef COMPACTFLOAT_COMPACTFLOAT_HPP
#define COMPACTFLOAT_COMPACTFLOAT_HPP

// compactfloat: compact binary encoding of decimal floating point values.
//
// This is the umbrella header. Include this to get everything.

#include "compactfloat/core/bigdecimal.hpp"
#include "compactfloat/core/bigfloat.hpp"
#include "compactfloat/core/bigint.hpp"
#include "compactfloat/core/codec.hpp"
#include "compactfloat/core/dfloat.hpp"
#include "compactfloat/core/layout.hpp"
#include "compactfloat/core/literal.hpp"
#include "compactfloat/core/rounding.hpp"
#include "compactfloat/core/status.hpp"
#include "compactfloat/core/stream.hpp"
#include "compactfloat/core/uleb128.hpp"

#endif // COMPACTFLOAT_COMPACTFLOAT_HPP
