#include "hashtok/signal_processing.hpp"
#include "hashtok/error.hpp"
#include "hashtok/logging.hpp"

#include <algorithm>
#include <cmath>
#include <complex>
#include <vector>

#include <unsupported/Eigen/FFT>

namespace hashtok {

namespace {

constexpr double kPi = 3.14159265358979323846;

// Magnitudes below this count as silence in the dB conversion
constexpr double kMinAmplitude = 1e-5;

} // anonymous namespace

Signal first_difference(std::span<const double> signal) {
    Signal diff;
    if (signal.size() < 2) return diff;
    diff.reserve(signal.size() - 1);
    for (size_t i = 0; i + 1 < signal.size(); ++i) {
        diff.push_back(signal[i + 1] - signal[i]);
    }
    return diff;
}

Signal trim_silence(std::span<const double> signal, double threshold, size_t offset) {
    auto loud = [threshold](double x) { return std::abs(x) > threshold; };

    const auto first = std::find_if(signal.begin(), signal.end(), loud);
    if (first == signal.end()) {
        return Signal(signal.begin(), signal.end());
    }
    const auto last = std::find_if(signal.rbegin(), signal.rend(), loud);

    const size_t first_idx = static_cast<size_t>(first - signal.begin());
    const size_t last_idx = signal.size() - 1 - static_cast<size_t>(last - signal.rbegin());

    const size_t begin = first_idx > offset ? first_idx - offset : 0;
    const size_t end = std::min(signal.size(), last_idx + offset + 1);
    return Signal(signal.begin() + begin, signal.begin() + end);
}

Signal hann_window(size_t n) {
    Signal w(n);
    for (size_t i = 0; i < n; ++i) {
        w[i] = 0.5 - 0.5 * std::cos(2.0 * kPi * static_cast<double>(i) / static_cast<double>(n));
    }
    return w;
}

Image stft_magnitude_db(std::span<const double> signal, size_t n_fft, size_t hop_length, double top_db) {
    const size_t half = n_fft / 2;
    const size_t bins = half + 1;
    const size_t frames = 1 + signal.size() / hop_length;

    // Centered frames: zero-pad n_fft / 2 on both sides
    std::vector<double> padded(signal.size() + 2 * half, 0.0);
    std::copy(signal.begin(), signal.end(), padded.begin() + static_cast<std::ptrdiff_t>(half));
    padded.resize(std::max(padded.size(), (frames - 1) * hop_length + n_fft), 0.0);

    const Signal window = hann_window(n_fft);

    Eigen::FFT<double> fft;
    std::vector<double> frame(n_fft);
    std::vector<std::complex<double>> spectrum;

    Image magnitude(static_cast<Eigen::Index>(bins), static_cast<Eigen::Index>(frames));
    for (size_t t = 0; t < frames; ++t) {
        const size_t start = t * hop_length;
        for (size_t k = 0; k < n_fft; ++k) {
            frame[k] = padded[start + k] * window[k];
        }
        fft.fwd(spectrum, frame);
        for (size_t f = 0; f < bins; ++f) {
            magnitude(static_cast<Eigen::Index>(f), static_cast<Eigen::Index>(t)) = std::abs(spectrum[f]);
        }
    }

    const double ref = std::max(kMinAmplitude, magnitude.maxCoeff());
    const double ref_db = 20.0 * std::log10(ref);
    return magnitude.unaryExpr([&](double m) {
        const double db = 20.0 * std::log10(std::max(kMinAmplitude, m)) - ref_db;
        return std::max(db, -top_db);
    });
}

SpectrogramTransform::SpectrogramTransform(SpectrogramParams params)
    : params_(params) {
    HASHTOK_CHECK_CONFIG(params_.n_fft >= 2, "n_fft must be at least 2");
    HASHTOK_CHECK_CONFIG(params_.hop_length >= 1, "hop_length must be at least 1");
    HASHTOK_CHECK_CONFIG(params_.sampling_rate >= 1, "sampling_rate must be at least 1");
    HASHTOK_CHECK_CONFIG(params_.top_db > 0.0, "top_db must be positive");
    LOG_DEBUG("Spectrogram n_fft=", params_.n_fft, " hop_length=", params_.hop_length,
              " (", seconds_per_frame() * 1000.0, " ms per frame)");
}

Image SpectrogramTransform::operator()(std::span<const double> signal) const {
    HASHTOK_CHECK_INPUT(!signal.empty(), "Cannot compute the spectrogram of an empty signal");

    const Signal trimmed = trim_silence(signal, params_.silence_threshold, params_.silence_offset);
    return stft_magnitude_db(trimmed, params_.n_fft, params_.hop_length, params_.top_db);
}

} // namespace hashtok
