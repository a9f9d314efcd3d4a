#pragma once

#include "hashtok/types.hpp"

#include <cstddef>
#include <span>

namespace hashtok {

/**
 * Padding plan along one axis.
 *
 *   output_length = ceil((L - W) / S + 1)
 *   padding_size  = (output_length - 1) * S - L + W
 *
 * Windows start at i * S; padding is appended after the last sample so the
 * last window is fully populated.
 */
struct AxisPlan {
    size_t input_length = 0;
    size_t output_length = 0;
    size_t padding_size = 0;

    size_t padded_length() const noexcept { return input_length + padding_size; }
};

/**
 * Computes the plan for one axis. Throws MalformedInputError when the
 * input yields no window (L - W + S <= 0) or is empty.
 */
AxisPlan plan_axis(size_t length, size_t window, size_t stride);

/**
 * Slides fixed-size windows over 1D sequences.
 */
class WindowExtractor {
public:
    // Throws ConfigurationError if window_size or stride is zero
    WindowExtractor(size_t window_size, size_t stride, double padding_value = 0.0);

    AxisPlan plan(size_t length) const { return plan_axis(length, window_size_, stride_); }

    // (output_length, window_size) windows of `sequence`
    WindowBatch extract(std::span<const double> sequence) const;

    size_t window_size() const noexcept { return window_size_; }
    size_t stride() const noexcept { return stride_; }
    double padding_value() const noexcept { return padding_value_; }

private:
    size_t window_size_;
    size_t stride_;
    double padding_value_;
};

/**
 * Slides fixed-size windows over 2D matrices, each axis with its own window
 * size and stride.
 */
class WindowExtractor2D {
public:
    WindowExtractor2D(size_t window_height, size_t window_width,
                      size_t stride_height, size_t stride_width,
                      double padding_value = 0.0);

    AxisPlan plan_height(size_t height) const { return plan_axis(height, window_height_, stride_height_); }
    AxisPlan plan_width(size_t width) const { return plan_axis(width, window_width_, stride_width_); }

    // (output_height, output_width, window_height, window_width) windows of `image`
    WindowGrid extract(const Image& image) const;

    size_t window_height() const noexcept { return window_height_; }
    size_t window_width() const noexcept { return window_width_; }
    size_t stride_height() const noexcept { return stride_height_; }
    size_t stride_width() const noexcept { return stride_width_; }
    double padding_value() const noexcept { return padding_value_; }

private:
    size_t window_height_;
    size_t window_width_;
    size_t stride_height_;
    size_t stride_width_;
    double padding_value_;
};

} // namespace hashtok
