#pragma once

/**
 * @file Array2D.h
 * @brief Dense 2D numeric array indexed by (x, y) with a movable origin
 *
 * Storage is row-major with y as the row index. By default the first pixel
 * is (1, 1), centered on the bottom-left pixel, so the image corner sits at
 * (0.5, 0.5).
 */

#include <ApPhot/Core/Exception.h>
#include <ApPhot/Core/Types.h>

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace Ap::Phot {

template<typename T>
class Array2D {
public:
    using value_type = T;

    Array2D() = default;

    /**
     * @brief Create an array filled with a value
     * @param width  Number of columns (x)
     * @param height Number of rows (y)
     * @param value  Fill value
     * @param x0     Index of the first column
     * @param y0     Index of the first row
     */
    Array2D(int32_t width, int32_t height, T value = T{}, int32_t x0 = 1, int32_t y0 = 1)
        : width_(width), height_(height), x0_(x0), y0_(y0) {
        if (width < 0 || height < 0) {
            throw InvalidArgumentException("Array2D dimensions must be non-negative, got " +
                                           std::to_string(width) + "x" + std::to_string(height));
        }
        data_.assign(static_cast<size_t>(width) * static_cast<size_t>(height), value);
    }

    /**
     * @brief Wrap existing row-major data (row y0 first)
     */
    Array2D(int32_t width, int32_t height, std::vector<T> data, int32_t x0 = 1, int32_t y0 = 1)
        : width_(width), height_(height), x0_(x0), y0_(y0), data_(std::move(data)) {
        if (width < 0 || height < 0 ||
            data_.size() != static_cast<size_t>(width) * static_cast<size_t>(height)) {
            throw InvalidArgumentException("Array2D data size does not match " +
                                           std::to_string(width) + "x" + std::to_string(height));
        }
    }

    int32_t Width() const { return width_; }
    int32_t Height() const { return height_; }
    int32_t XOrigin() const { return x0_; }
    int32_t YOrigin() const { return y0_; }
    size_t Size() const { return data_.size(); }
    bool Empty() const { return data_.empty(); }

    /// Inclusive index range covered by the array
    Box2i Bounds() const {
        return Box2i(x0_, x0_ + width_ - 1, y0_, y0_ + height_ - 1);
    }

    /// Unchecked element access
    T& operator()(int32_t x, int32_t y) {
        return data_[Offset(x, y)];
    }
    const T& operator()(int32_t x, int32_t y) const {
        return data_[Offset(x, y)];
    }

    /// Checked element access
    T& At(int32_t x, int32_t y) {
        CheckIndex(x, y);
        return data_[Offset(x, y)];
    }
    const T& At(int32_t x, int32_t y) const {
        CheckIndex(x, y);
        return data_[Offset(x, y)];
    }

    void Fill(T value) { data_.assign(data_.size(), value); }

    T* Data() { return data_.data(); }
    const T* Data() const { return data_.data(); }

    typename std::vector<T>::const_iterator begin() const { return data_.begin(); }
    typename std::vector<T>::const_iterator end() const { return data_.end(); }

private:
    size_t Offset(int32_t x, int32_t y) const {
        return static_cast<size_t>(y - y0_) * static_cast<size_t>(width_) +
               static_cast<size_t>(x - x0_);
    }

    void CheckIndex(int32_t x, int32_t y) const {
        if (!Bounds().Contains(x, y)) {
            throw OutOfRangeException("index (" + std::to_string(x) + ", " + std::to_string(y) +
                                      ") outside [" + std::to_string(x0_) + ".." +
                                      std::to_string(x0_ + width_ - 1) + "] x [" +
                                      std::to_string(y0_) + ".." +
                                      std::to_string(y0_ + height_ - 1) + "]");
        }
    }

    int32_t width_ = 0;
    int32_t height_ = 0;
    int32_t x0_ = 1;
    int32_t y0_ = 1;
    std::vector<T> data_;
};

} // namespace Ap::Phot
