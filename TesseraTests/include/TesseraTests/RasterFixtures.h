#pragma once

#include <TesseraRaster/PixelDataType.h>
#include <TesseraRaster/TileImage.h>
#include <TesseraRaster/TileShape.h>

#include <cstdint>
#include <vector>

namespace TesseraTests {

/**
 * @brief Creates an image where every sample has the same value.
 *
 * @param shape The dimensions.
 * @param value The value of every sample.
 * @param dataType The sample type.
 * @param valid The validity of every pixel.
 */
TesseraRaster::TileImage makeConstantImage(
    const TesseraRaster::TileShape& shape,
    double value,
    TesseraRaster::PixelDataType dataType =
        TesseraRaster::PixelDataType::UInt8,
    bool valid = true);

/**
 * @brief Creates an image from explicit samples and mask values.
 *
 * @param shape The dimensions.
 * @param samples `shape.getSampleCount()` values, band by band.
 * @param mask `shape.getPixelCount()` values, nonzero for valid.
 * @param dataType The sample type.
 */
TesseraRaster::TileImage makeImage(
    const TesseraRaster::TileShape& shape,
    const std::vector<double>& samples,
    std::vector<uint8_t> mask,
    TesseraRaster::PixelDataType dataType =
        TesseraRaster::PixelDataType::UInt8);

/**
 * @brief Makes a deep copy of an image.
 */
TesseraRaster::TileImage cloneImage(const TesseraRaster::TileImage& image);

} // namespace TesseraTests
