#pragma once

/**
 * @file ImageIO.h
 * @brief Reading and writing single-channel images as Array2D
 *
 * Readable formats: anything stb_image decodes (PNG 8/16-bit, JPEG, BMP,
 * PGM/PNM, TGA, ...), color images are converted to luminance.
 * Writable formats: PNG, JPEG, BMP (8-bit, scaled), RAW (binary).
 *
 * Image files store the top row first. By default rows are flipped on read
 * and write so that array row yOrigin is the bottom of the picture, matching
 * the (1, 1) = bottom-left pixel convention used for photometry.
 */

#include <ApPhot/Core/Array2D.h>

#include <cstdint>
#include <string>
#include <vector>

namespace Ap::Phot::IO {

// =============================================================================
// Image Format Enumeration
// =============================================================================

enum class ImageFormat {
    Auto,       ///< Detect from extension
    PNG,        ///< PNG (lossless, 8/16-bit)
    JPEG,       ///< JPEG (lossy, 8-bit)
    BMP,        ///< BMP (uncompressed, 8-bit)
    PGM,        ///< PGM/PNM (portable graymap)
    RAW         ///< Headerless binary samples
};

/// Sample type of RAW files
enum class RawPixelType {
    UInt8,
    UInt16,
    Float32,
    Float64
};

// =============================================================================
// Parameter Structures
// =============================================================================

/**
 * @brief Parameters for reading encoded images
 */
struct ImageReadParams {
    bool flipVertical = true;   ///< First file row becomes the top array row
    int32_t xOrigin = 1;        ///< Index of the first column
    int32_t yOrigin = 1;        ///< Index of the first row

    ImageReadParams& SetFlipVertical(bool f) { flipVertical = f; return *this; }
    ImageReadParams& SetOrigin(int32_t x0, int32_t y0) { xOrigin = x0; yOrigin = y0; return *this; }
};

/**
 * @brief Parameters for reading RAW files
 */
struct RawReadParams {
    int32_t width = 0;
    int32_t height = 0;
    RawPixelType pixelType = RawPixelType::UInt16;
    int32_t headerBytes = 0;    ///< Bytes to skip before the samples
    bool bigEndian = false;
    bool flipVertical = false;  ///< RAW rows are stored bottom-up by default
    int32_t xOrigin = 1;        ///< Index of the first column
    int32_t yOrigin = 1;        ///< Index of the first row

    RawReadParams& SetSize(int32_t w, int32_t h) { width = w; height = h; return *this; }
    RawReadParams& SetPixelType(RawPixelType t) { pixelType = t; return *this; }
    RawReadParams& SetHeaderBytes(int32_t n) { headerBytes = n; return *this; }
    RawReadParams& SetBigEndian(bool b) { bigEndian = b; return *this; }
    RawReadParams& SetFlipVertical(bool f) { flipVertical = f; return *this; }
    RawReadParams& SetOrigin(int32_t x0, int32_t y0) { xOrigin = x0; yOrigin = y0; return *this; }
};

/**
 * @brief Parameters for writing 8-bit images
 *
 * Values are mapped linearly from [scaleMin, scaleMax] to [0, 255] and
 * clamped. When scaleMin == scaleMax the image's own min / max are used.
 */
struct ImageWriteParams {
    ImageFormat format = ImageFormat::Auto;
    double scaleMin = 0.0;
    double scaleMax = 0.0;
    int32_t jpegQuality = 95;   ///< [1, 100]
    bool flipVertical = true;

    ImageWriteParams& SetFormat(ImageFormat f) { format = f; return *this; }
    ImageWriteParams& SetScale(double lo, double hi) { scaleMin = lo; scaleMax = hi; return *this; }
    ImageWriteParams& SetJpegQuality(int32_t q) { jpegQuality = q; return *this; }
    ImageWriteParams& SetFlipVertical(bool f) { flipVertical = f; return *this; }
};

/**
 * @brief Basic information about an image file
 */
struct ImageMetadata {
    int32_t width = 0;
    int32_t height = 0;
    int32_t channels = 0;
    int32_t bitsPerChannel = 0;
};

// =============================================================================
// Format Utilities
// =============================================================================

/// Format from the file extension (case-insensitive), Auto if unknown
ImageFormat GetFormatFromFilename(const std::string& filename);

std::string GetExtensionForFormat(ImageFormat format);

// =============================================================================
// Reading
// =============================================================================

/**
 * @brief Read an image file as luminance
 *
 * 8-bit files give values in [0, 255], 16-bit files in [0, 65535].
 *
 * @throws IOException if the file cannot be opened or decoded
 */
Array2D<double> ReadImage(const std::string& filename,
                          const ImageReadParams& params = ImageReadParams());

/**
 * @brief Read headerless binary samples
 *
 * @throws InvalidArgumentException if width or height is not positive
 * @throws IOException if the file is missing or too short
 */
Array2D<double> ReadImageRaw(const std::string& filename, const RawReadParams& params);

/**
 * @brief Read width, height, channel count and bit depth without decoding
 * @return false if the file is not a readable image
 */
bool ReadImageMetadata(const std::string& filename, ImageMetadata& metadata);

// =============================================================================
// Writing
// =============================================================================

/**
 * @brief Write an array as an 8-bit grayscale image
 *
 * Format RAW writes Float64 samples (see WriteImageRaw).
 *
 * @return false if the array is empty or the file cannot be written
 */
bool WriteImage(const Array2D<double>& image, const std::string& filename,
                const ImageWriteParams& params = ImageWriteParams());

/**
 * @brief Write samples as headerless binary, bottom row first
 * @return false if the array is empty or the file cannot be written
 */
bool WriteImageRaw(const Array2D<double>& image, const std::string& filename,
                   RawPixelType pixelType = RawPixelType::Float64, bool bigEndian = false);

} // namespace Ap::Phot::IO
