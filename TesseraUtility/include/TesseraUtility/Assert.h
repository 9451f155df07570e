#pragma once

#include <cstdint>

//
// Assertions that survive NDEBUG when TESSERA_FORCE_ASSERTIONS is defined, so
// that release builds of the mosaic engine can still check its invariants.
//
#if defined TESSERA_FORCE_ASSERTIONS && defined NDEBUG
namespace TesseraUtility {
std::int32_t forceAssertFailure();
};
#define TESSERA_ASSERT(expression)                                             \
  ((expression) ? 0 : TesseraUtility::forceAssertFailure())
#else
#include <cassert>
#define TESSERA_ASSERT(expression) assert(expression)
#endif
