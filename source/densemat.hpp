#pragma once

#include "builder.hpp"  // IWYU pragma: keep
#include "errors.hpp"   // IWYU pragma: keep
#include "format.hpp"   // IWYU pragma: keep
#include "matrix.hpp"   // IWYU pragma: keep
#include "types.hpp"    // IWYU pragma: keep
