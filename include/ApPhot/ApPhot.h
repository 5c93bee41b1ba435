#pragma once

/**
 * @file ApPhot.h
 * @brief Main header file for ApPhot library
 *
 * ApPhot measures flux through circular, elliptical and rectangular
 * apertures (and their annuli) with exact pixel overlap.
 *
 * @version 0.1.0
 */

// Core types and utilities
#include <ApPhot/Core/Types.h>
#include <ApPhot/Core/Constants.h>
#include <ApPhot/Core/Exception.h>
#include <ApPhot/Core/Array2D.h>

// Feature modules
#include <ApPhot/Aperture/ApertureTypes.h>
#include <ApPhot/Aperture/Shapes.h>
#include <ApPhot/Aperture/ApertureView.h>
#include <ApPhot/Photometry/Photometry.h>
#include <ApPhot/IO/ImageIO.h>

namespace Ap::Phot {

/**
 * @brief Get library version string
 * @return Version string in format "major.minor.patch"
 */
inline const char* GetVersion() {
    return "0.1.0";
}

/**
 * @brief Get library version as integers
 */
inline void GetVersion(int& major, int& minor, int& patch) {
    major = 0;
    minor = 1;
    patch = 0;
}

} // namespace Ap::Phot
