#pragma once

#include "hashtok/types.hpp"

#include <cstddef>
#include <span>

namespace hashtok {

// signal[i + 1] - signal[i]; one sample shorter than the input
Signal first_difference(std::span<const double> signal);

/**
 * Drops leading and trailing near-silence.
 *
 * Keeps [first - offset, last + offset] clamped to the signal, where first
 * and last are the outermost samples with |x| > threshold. A signal with no
 * such sample is returned whole.
 */
Signal trim_silence(std::span<const double> signal, double threshold, size_t offset);

// Periodic Hann window of length n
Signal hann_window(size_t n);

/**
 * Magnitude spectrogram in decibels.
 *
 * Hann-windowed STFT of the signal zero-padded by n_fft / 2 on both sides.
 * Rows are the n_fft / 2 + 1 frequency bins, columns the
 * 1 + L / hop_length frames. Values are 20 log10 of the magnitude relative
 * to the largest one, floored at -top_db.
 */
Image stft_magnitude_db(std::span<const double> signal, size_t n_fft, size_t hop_length,
                        double top_db = 80.0);

struct SpectrogramParams {
    size_t sampling_rate = 22050;
    size_t n_fft = 2000;
    size_t hop_length = 100;
    double silence_threshold = 1e-3;
    size_t silence_offset = 500;
    double top_db = 80.0;
};

/**
 * Audio to dB spectrogram: silence trimming followed by the STFT.
 */
class SpectrogramTransform {
public:
    // Throws ConfigurationError on n_fft < 2, hop_length < 1 or sampling_rate < 1
    explicit SpectrogramTransform(SpectrogramParams params);

    // Throws MalformedInputError on an empty signal
    Image operator()(std::span<const double> signal) const;

    size_t num_bins() const noexcept { return params_.n_fft / 2 + 1; }
    size_t num_frames(size_t trimmed_length) const noexcept { return 1 + trimmed_length / params_.hop_length; }
    double seconds_per_frame() const noexcept {
        return static_cast<double>(params_.hop_length) / static_cast<double>(params_.sampling_rate);
    }

    const SpectrogramParams& params() const noexcept { return params_; }

private:
    SpectrogramParams params_;
};

} // namespace hashtok
