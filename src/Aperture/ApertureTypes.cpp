/**
 * @file ApertureTypes.cpp
 * @brief Overlap method construction and string conversion
 */

#include <ApPhot/Aperture/ApertureTypes.h>
#include <ApPhot/Core/Exception.h>

#include <cctype>

namespace Ap::Phot {

OverlapMethod OverlapMethod::Subpixel(int32_t subpixels) {
    if (subpixels < 1) {
        throw InvalidArgumentException("subpixels must be >= 1, got " + std::to_string(subpixels));
    }
    return OverlapMethod(OverlapMode::Subpixel, subpixels);
}

OverlapMethod ParseOverlapMethod(const std::string& method, int32_t subpixels) {
    std::string lower;
    lower.reserve(method.size());
    for (char c : method) {
        lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }

    if (lower == "exact")    return OverlapMethod::Exact();
    if (lower == "center")   return OverlapMethod::Center();
    if (lower == "subpixel") return OverlapMethod::Subpixel(subpixels);

    throw InvalidArgumentException("unknown overlap method '" + method +
                                   "' (expected exact, center or subpixel)");
}

std::string OverlapMethodToString(const OverlapMethod& method) {
    if (method.IsExact()) return "exact";
    if (method.Subpixels() == 1) return "center";
    return "subpixel(" + std::to_string(method.Subpixels()) + ")";
}

std::string PixelFlagToString(PixelFlag flag) {
    switch (flag) {
        case PixelFlag::Inside:  return "inside";
        case PixelFlag::Outside: return "outside";
        case PixelFlag::Partial: return "partial";
    }
    return "unknown";
}

} // namespace Ap::Phot
