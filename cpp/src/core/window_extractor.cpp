#include "hashtok/window_extractor.hpp"
#include "hashtok/error.hpp"

#include <algorithm>
#include <cstdint>
#include <string>

namespace hashtok {

AxisPlan plan_axis(size_t length, size_t window, size_t stride) {
    HASHTOK_CHECK_INPUT(length > 0, "Cannot extract windows from an empty input");

    // ceil((L - W) / S + 1) == ceil((L - W + S) / S), positive only if L - W + S > 0
    const int64_t numerator = static_cast<int64_t>(length) - static_cast<int64_t>(window)
                            + static_cast<int64_t>(stride);
    HASHTOK_CHECK_INPUT(numerator > 0,
        "Input of length " + std::to_string(length) + " yields no window of size " +
        std::to_string(window) + " at stride " + std::to_string(stride));

    const int64_t s = static_cast<int64_t>(stride);
    const int64_t output_length = (numerator + s - 1) / s;
    const int64_t padding_size = (output_length - 1) * s - static_cast<int64_t>(length)
                               + static_cast<int64_t>(window);

    AxisPlan plan;
    plan.input_length = length;
    plan.output_length = static_cast<size_t>(output_length);
    plan.padding_size = static_cast<size_t>(std::max<int64_t>(0, padding_size));
    return plan;
}

// =============================================================================
// 1D
// =============================================================================

WindowExtractor::WindowExtractor(size_t window_size, size_t stride, double padding_value)
    : window_size_(window_size), stride_(stride), padding_value_(padding_value) {
    HASHTOK_CHECK_CONFIG(window_size_ >= 1, "window_size must be at least 1");
    HASHTOK_CHECK_CONFIG(stride_ >= 1, "stride must be at least 1");
}

WindowBatch WindowExtractor::extract(std::span<const double> sequence) const {
    const AxisPlan p = plan(sequence.size());

    std::vector<double> padded(p.padded_length(), padding_value_);
    std::copy(sequence.begin(), sequence.end(), padded.begin());

    WindowBatch batch;
    batch.windows.resize(static_cast<Eigen::Index>(p.output_length),
                         static_cast<Eigen::Index>(window_size_));
    for (size_t i = 0; i < p.output_length; ++i) {
        const double* src = padded.data() + i * stride_;
        for (size_t k = 0; k < window_size_; ++k) {
            batch.windows(static_cast<Eigen::Index>(i), static_cast<Eigen::Index>(k)) = src[k];
        }
    }
    return batch;
}

// =============================================================================
// 2D
// =============================================================================

WindowExtractor2D::WindowExtractor2D(size_t window_height, size_t window_width,
                                     size_t stride_height, size_t stride_width,
                                     double padding_value)
    : window_height_(window_height), window_width_(window_width),
      stride_height_(stride_height), stride_width_(stride_width),
      padding_value_(padding_value) {
    HASHTOK_CHECK_CONFIG(window_height_ >= 1 && window_width_ >= 1,
                         "window_height and window_width must be at least 1");
    HASHTOK_CHECK_CONFIG(stride_height_ >= 1 && stride_width_ >= 1, "stride must be at least 1");
}

WindowGrid WindowExtractor2D::extract(const Image& image) const {
    const AxisPlan ph = plan_height(static_cast<size_t>(image.rows()));
    const AxisPlan pw = plan_width(static_cast<size_t>(image.cols()));

    // Pad bottom and right only
    Image padded = Image::Constant(static_cast<Eigen::Index>(ph.padded_length()),
                                   static_cast<Eigen::Index>(pw.padded_length()),
                                   padding_value_);
    padded.topLeftCorner(image.rows(), image.cols()) = image;

    WindowGrid grid;
    grid.output_height = ph.output_length;
    grid.output_width = pw.output_length;
    grid.window_height = window_height_;
    grid.window_width = window_width_;
    grid.windows.resize(static_cast<Eigen::Index>(ph.output_length * pw.output_length),
                        static_cast<Eigen::Index>(window_height_ * window_width_));

    const auto wh = static_cast<Eigen::Index>(window_height_);
    const auto ww = static_cast<Eigen::Index>(window_width_);
    for (size_t i = 0; i < ph.output_length; ++i) {
        const auto start_y = static_cast<Eigen::Index>(i * stride_height_);
        for (size_t j = 0; j < pw.output_length; ++j) {
            const auto start_x = static_cast<Eigen::Index>(j * stride_width_);
            Eigen::Map<Image> cell(grid.windows.row(static_cast<Eigen::Index>(grid.cell_index(i, j))).data(),
                                   wh, ww);
            cell = padded.block(start_y, start_x, wh, ww);
        }
    }
    return grid;
}

} // namespace hashtok
