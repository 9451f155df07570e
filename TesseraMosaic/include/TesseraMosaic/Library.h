#pragma once

/**
 * @brief Assembles mosaic tiles from many overlapping raster assets.
 */
namespace TesseraMosaic {}

#if defined(_WIN32) && defined(TESSERA_SHARED)
#ifdef TESSERAMOSAIC_BUILDING
#define TESSERAMOSAIC_API __declspec(dllexport)
#else
#define TESSERAMOSAIC_API __declspec(dllimport)
#endif
#else
#define TESSERAMOSAIC_API
#endif
