#pragma once

/**
 * @brief Pixel buffers, validity masks and the asset reader interface used to
 * build mosaic tiles.
 */
namespace TesseraRaster {}

#if defined(_WIN32) && defined(TESSERA_SHARED)
#ifdef TESSERARASTER_BUILDING
#define TESSERARASTER_API __declspec(dllexport)
#else
#define TESSERARASTER_API __declspec(dllimport)
#endif
#else
#define TESSERARASTER_API
#endif
