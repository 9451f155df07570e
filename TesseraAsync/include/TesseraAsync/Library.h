#pragma once

/**
 * @brief Classes that run work in background threads with bounded
 * concurrency and cooperative cancellation.
 */
namespace TesseraAsync {}

#if defined(_WIN32) && defined(TESSERA_SHARED)
#ifdef TESSERAASYNC_BUILDING
#define TESSERAASYNC_API __declspec(dllexport)
#else
#define TESSERAASYNC_API __declspec(dllimport)
#endif
#else
#define TESSERAASYNC_API
#endif
