#if defined TESSERA_FORCE_ASSERTIONS && defined NDEBUG

#undef NDEBUG
#include <cassert>
#define NDEBUG

#include <cstdint>

namespace TesseraUtility {
std::int32_t forceAssertFailure() {
  assert(0 && "Assertion failed");
  return 1;
}
}; // namespace TesseraUtility

#endif
