/**
 * @file ImageIO.cpp
 * @brief Image reading and writing with stb_image / stb_image_write
 */

#include <ApPhot/IO/ImageIO.h>
#include <ApPhot/Core/Constants.h>
#include <ApPhot/Core/Exception.h>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <limits>
#include <memory>

#define STB_IMAGE_STATIC
#define STB_IMAGE_IMPLEMENTATION
#include <stb/stb_image.h>
#undef STB_IMAGE_IMPLEMENTATION
#undef STB_IMAGE_STATIC

#define STB_IMAGE_WRITE_STATIC
#define STB_IMAGE_WRITE_IMPLEMENTATION
#include <stb/stb_image_write.h>
#undef STB_IMAGE_WRITE_IMPLEMENTATION
#undef STB_IMAGE_WRITE_STATIC

namespace Ap::Phot::IO {

// =============================================================================
// Helper Functions
// =============================================================================

namespace {

std::string ToLower(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

std::string GetExtension(const std::string& filename) {
    auto pos = filename.rfind('.');
    if (pos == std::string::npos) return "";
    return ToLower(filename.substr(pos));
}

size_t GetSampleSize(RawPixelType type) {
    switch (type) {
        case RawPixelType::UInt8:   return 1;
        case RawPixelType::UInt16:  return 2;
        case RawPixelType::Float32: return 4;
        case RawPixelType::Float64: return 8;
    }
    return 1;
}

bool HostIsBigEndian() {
    const uint16_t probe = 0x0102;
    uint8_t first = 0;
    std::memcpy(&first, &probe, 1);
    return first == 0x01;
}

/// Decode one stored sample, swapping bytes when the file order differs from the host
double DecodeSample(const uint8_t* src, RawPixelType type, bool swap) {
    uint8_t bytes[8];
    size_t n = GetSampleSize(type);
    std::memcpy(bytes, src, n);
    if (swap) std::reverse(bytes, bytes + n);

    switch (type) {
        case RawPixelType::UInt8:
            return bytes[0];
        case RawPixelType::UInt16: {
            uint16_t v;
            std::memcpy(&v, bytes, 2);
            return v;
        }
        case RawPixelType::Float32: {
            float v;
            std::memcpy(&v, bytes, 4);
            return v;
        }
        case RawPixelType::Float64: {
            double v;
            std::memcpy(&v, bytes, 8);
            return v;
        }
    }
    return 0.0;
}

void EncodeSample(double value, RawPixelType type, bool swap, uint8_t* dst) {
    uint8_t bytes[8];
    size_t n = GetSampleSize(type);

    switch (type) {
        case RawPixelType::UInt8: {
            double c = std::isfinite(value) ? Clamp(std::round(value), 0.0, 255.0) : 0.0;
            bytes[0] = static_cast<uint8_t>(c);
            break;
        }
        case RawPixelType::UInt16: {
            double c = std::isfinite(value) ? Clamp(std::round(value), 0.0, 65535.0) : 0.0;
            uint16_t v = static_cast<uint16_t>(c);
            std::memcpy(bytes, &v, 2);
            break;
        }
        case RawPixelType::Float32: {
            float v = static_cast<float>(value);
            std::memcpy(bytes, &v, 4);
            break;
        }
        case RawPixelType::Float64:
            std::memcpy(bytes, &value, 8);
            break;
    }

    if (swap) std::reverse(bytes, bytes + n);
    std::memcpy(dst, bytes, n);
}

/// Array from top-down file rows
template<typename S>
Array2D<double> FromFileRows(const S* pixels, int32_t width, int32_t height,
                             bool flipVertical, int32_t x0, int32_t y0) {
    std::vector<double> values(static_cast<size_t>(width) * height);
    for (int32_t j = 0; j < height; ++j) {
        int32_t row = flipVertical ? height - 1 - j : j;
        const S* src = pixels + static_cast<size_t>(row) * width;
        std::copy(src, src + width, values.begin() + static_cast<size_t>(j) * width);
    }
    return Array2D<double>(width, height, std::move(values), x0, y0);
}

struct StbFree {
    void operator()(void* p) const { stbi_image_free(p); }
};

} // anonymous namespace

// =============================================================================
// Format Utility Functions
// =============================================================================

ImageFormat GetFormatFromFilename(const std::string& filename) {
    std::string ext = GetExtension(filename);

    if (ext == ".png") return ImageFormat::PNG;
    if (ext == ".jpg" || ext == ".jpeg") return ImageFormat::JPEG;
    if (ext == ".bmp") return ImageFormat::BMP;
    if (ext == ".pgm" || ext == ".pnm") return ImageFormat::PGM;
    if (ext == ".raw" || ext == ".bin") return ImageFormat::RAW;

    return ImageFormat::Auto;
}

std::string GetExtensionForFormat(ImageFormat format) {
    switch (format) {
        case ImageFormat::PNG: return ".png";
        case ImageFormat::JPEG: return ".jpg";
        case ImageFormat::BMP: return ".bmp";
        case ImageFormat::PGM: return ".pgm";
        case ImageFormat::RAW: return ".raw";
        case ImageFormat::Auto: break;
    }
    return ".png";
}

// =============================================================================
// Image Read Functions
// =============================================================================

Array2D<double> ReadImage(const std::string& filename, const ImageReadParams& params) {
    int w = 0;
    int h = 0;
    int channels = 0;

    // Request one channel: stb converts color to luminance
    if (stbi_is_16_bit(filename.c_str())) {
        std::unique_ptr<stbi_us, StbFree> data(
            stbi_load_16(filename.c_str(), &w, &h, &channels, 1));
        if (!data) {
            throw IOException("failed to read image " + filename + " - " + stbi_failure_reason());
        }
        return FromFileRows(data.get(), w, h, params.flipVertical, params.xOrigin, params.yOrigin);
    }

    std::unique_ptr<stbi_uc, StbFree> data(stbi_load(filename.c_str(), &w, &h, &channels, 1));
    if (!data) {
        throw IOException("failed to read image " + filename + " - " + stbi_failure_reason());
    }
    return FromFileRows(data.get(), w, h, params.flipVertical, params.xOrigin, params.yOrigin);
}

Array2D<double> ReadImageRaw(const std::string& filename, const RawReadParams& params) {
    if (params.width <= 0 || params.height <= 0) {
        throw InvalidArgumentException("RAW read requires positive width and height");
    }
    if (params.headerBytes < 0) {
        throw InvalidArgumentException("RAW header size must be non-negative");
    }

    std::ifstream file(filename, std::ios::binary);
    if (!file) {
        throw IOException("cannot open file " + filename);
    }

    if (params.headerBytes > 0) {
        file.seekg(params.headerBytes);
    }

    size_t sampleSize = GetSampleSize(params.pixelType);
    size_t count = static_cast<size_t>(params.width) * params.height;
    std::vector<uint8_t> buffer(count * sampleSize);
    file.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(buffer.size()));
    if (!file) {
        throw IOException("failed to read raw data from " + filename);
    }

    bool swap = sampleSize > 1 && params.bigEndian != HostIsBigEndian();
    std::vector<double> values(count);
    for (int32_t j = 0; j < params.height; ++j) {
        int32_t row = params.flipVertical ? params.height - 1 - j : j;
        const uint8_t* src = buffer.data() + static_cast<size_t>(row) * params.width * sampleSize;
        double* dst = values.data() + static_cast<size_t>(j) * params.width;
        for (int32_t i = 0; i < params.width; ++i) {
            dst[i] = DecodeSample(src + i * sampleSize, params.pixelType, swap);
        }
    }
    return Array2D<double>(params.width, params.height, std::move(values),
                           params.xOrigin, params.yOrigin);
}

bool ReadImageMetadata(const std::string& filename, ImageMetadata& metadata) {
    int w, h, channels;
    if (stbi_info(filename.c_str(), &w, &h, &channels) == 0) {
        return false;
    }

    metadata.width = w;
    metadata.height = h;
    metadata.channels = channels;
    metadata.bitsPerChannel = stbi_is_16_bit(filename.c_str()) ? 16 : 8;
    return true;
}

// =============================================================================
// Image Write Functions
// =============================================================================

bool WriteImage(const Array2D<double>& image, const std::string& filename,
                const ImageWriteParams& params) {
    if (image.Empty()) {
        return false;
    }

    ImageFormat format = params.format;
    if (format == ImageFormat::Auto) {
        format = GetFormatFromFilename(filename);
        if (format == ImageFormat::Auto) {
            format = ImageFormat::PNG;
        }
    }
    if (format == ImageFormat::RAW) {
        return WriteImageRaw(image, filename);
    }

    double lo = params.scaleMin;
    double hi = params.scaleMax;
    if (lo == hi) {
        lo = std::numeric_limits<double>::infinity();
        hi = -std::numeric_limits<double>::infinity();
        for (double v : image) {
            if (!std::isfinite(v)) continue;
            lo = std::min(lo, v);
            hi = std::max(hi, v);
        }
    }
    // A flat (or all non-finite) image writes as black
    double scale = hi > lo ? 255.0 / (hi - lo) : 0.0;

    int32_t w = image.Width();
    int32_t h = image.Height();
    std::vector<uint8_t> buffer(static_cast<size_t>(w) * h);
    for (int32_t r = 0; r < h; ++r) {
        int32_t y = image.YOrigin() + (params.flipVertical ? h - 1 - r : r);
        uint8_t* dst = buffer.data() + static_cast<size_t>(r) * w;
        for (int32_t i = 0; i < w; ++i) {
            double v = image(image.XOrigin() + i, y);
            double c = std::isfinite(v) ? Clamp((v - lo) * scale, 0.0, 255.0) : 0.0;
            dst[i] = static_cast<uint8_t>(std::lround(c));
        }
    }

    switch (format) {
        case ImageFormat::JPEG:
            return stbi_write_jpg(filename.c_str(), w, h, 1, buffer.data(),
                                  Clamp(params.jpegQuality, 1, 100)) != 0;
        case ImageFormat::BMP:
            return stbi_write_bmp(filename.c_str(), w, h, 1, buffer.data()) != 0;
        case ImageFormat::PGM: {
            std::ofstream file(filename, std::ios::binary);
            if (!file) return false;
            file << "P5\n" << w << " " << h << "\n255\n";
            file.write(reinterpret_cast<const char*>(buffer.data()),
                       static_cast<std::streamsize>(buffer.size()));
            return static_cast<bool>(file);
        }
        default:
            return stbi_write_png(filename.c_str(), w, h, 1, buffer.data(), w) != 0;
    }
}

bool WriteImageRaw(const Array2D<double>& image, const std::string& filename,
                   RawPixelType pixelType, bool bigEndian) {
    if (image.Empty()) {
        return false;
    }

    std::ofstream file(filename, std::ios::binary);
    if (!file) {
        return false;
    }

    size_t sampleSize = GetSampleSize(pixelType);
    bool swap = sampleSize > 1 && bigEndian != HostIsBigEndian();
    std::vector<uint8_t> buffer(image.Size() * sampleSize);
    size_t offset = 0;
    for (double v : image) {
        EncodeSample(v, pixelType, swap, buffer.data() + offset);
        offset += sampleSize;
    }

    file.write(reinterpret_cast<const char*>(buffer.data()),
               static_cast<std::streamsize>(buffer.size()));
    return static_cast<bool>(file);
}

} // namespace Ap::Phot::IO
