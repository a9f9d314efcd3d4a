#include "hashtok/hash_quantizer.hpp"
#include "hashtok/blake3.hpp"
#include "hashtok/error.hpp"
#include "hashtok/logging.hpp"
#include "hashtok/util/utf8.hpp"

#include <cmath>
#include <random>

namespace hashtok {

// =============================================================================
// VocabularyBounds
// =============================================================================

VocabularyBounds::VocabularyBounds(TokenId num_embeddings, TokenId padding_idx)
    : num_embeddings_(num_embeddings), padding_idx_(padding_idx) {
    HASHTOK_CHECK_CONFIG(num_embeddings_ > 0,
                         "num_embeddings must be positive, got " + std::to_string(num_embeddings_));
    HASHTOK_CHECK_CONFIG(padding_idx_ >= 0,
                         "padding_idx must be non-negative, got " + std::to_string(padding_idx_));
    HASHTOK_CHECK_CONFIG(num_embeddings_ <= kMaxNumEmbeddings,
                         "num_embeddings must not exceed 2^40, got " + std::to_string(num_embeddings_));
    HASHTOK_CHECK_CONFIG(num_embeddings_ > first_free_id(),
                         "num_embeddings (" + std::to_string(num_embeddings_) +
                         ") leaves no ids above the reserved range ending at " +
                         std::to_string(first_free_id()));
}

size_t hyperplane_bits(TokenId num_embeddings) noexcept {
    size_t bits = 0;
    while (bits < 63 && (TokenId(1) << bits) < num_embeddings) {
        ++bits;
    }
    return bits;
}

// =============================================================================
// CryptoHashQuantizer
// =============================================================================

CryptoHashQuantizer::CryptoHashQuantizer(VocabularyBounds bounds)
    : bounds_(bounds) {}

TokenId CryptoHashQuantizer::quantize(std::string_view token) const {
    const Blake3Hash digest = Blake3Hasher::hash(token);
    return bounds_.reduce(digest.mod(static_cast<uint64_t>(bounds_.num_embeddings())));
}

std::vector<TokenId> CryptoHashQuantizer::quantize(const std::vector<std::string>& tokens) const {
    std::vector<TokenId> ids;
    ids.reserve(tokens.size());
    for (const auto& token : tokens) {
        ids.push_back(quantize(token));
    }
    return ids;
}

// =============================================================================
// RandomHyperplaneQuantizer
// =============================================================================

RandomHyperplaneQuantizer::RandomHyperplaneQuantizer(VocabularyBounds bounds, size_t window_size,
                                                     uint64_t seed)
    : bounds_(bounds), seed_(seed) {
    HASHTOK_CHECK_CONFIG(window_size >= 1, "window_size must be at least 1");
    basis_ = generate_basis(hyperplane_bits(bounds_.num_embeddings()), window_size, seed_);
    LOG_DEBUG("Random hyperplane basis ", basis_.rows(), "x", basis_.cols(), " seed=", seed_);
}

namespace {

// Standard normal draws by Box-Muller over raw mt19937_64 output. The
// sequence depends on the engine only, not on the library's normal_distribution.
class GaussianSource {
public:
    explicit GaussianSource(uint64_t seed) : rng_(seed) {}

    double operator()() {
        if (has_spare_) {
            has_spare_ = false;
            return spare_;
        }
        // u1 in (0, 1], u2 in [0, 1), 53 bits each
        const double u1 = static_cast<double>((rng_() >> 11) + 1) * 0x1.0p-53;
        const double u2 = static_cast<double>(rng_() >> 11) * 0x1.0p-53;
        const double radius = std::sqrt(-2.0 * std::log(u1));
        const double angle = 2.0 * 3.14159265358979323846 * u2;
        spare_ = radius * std::sin(angle);
        has_spare_ = true;
        return radius * std::cos(angle);
    }

private:
    std::mt19937_64 rng_;
    double spare_ = 0.0;
    bool has_spare_ = false;
};

} // anonymous namespace

Eigen::MatrixXd RandomHyperplaneQuantizer::generate_basis(size_t rows, size_t cols, uint64_t seed) {
    GaussianSource normal(seed);

    Eigen::MatrixXd basis(static_cast<Eigen::Index>(rows), static_cast<Eigen::Index>(cols));
    for (Eigen::Index r = 0; r < basis.rows(); ++r) {
        for (Eigen::Index c = 0; c < basis.cols(); ++c) {
            basis(r, c) = normal();
        }
    }
    return basis;
}

template<typename Row>
TokenId RandomHyperplaneQuantizer::code_of(const Row& projection) const {
    uint64_t code = 0;
    for (Eigen::Index k = 0; k < projection.size(); ++k) {
        code = (code << 1) | (projection(k) > 0.0 ? 1u : 0u);
    }
    return bounds_.reduce(code);
}

TokenId RandomHyperplaneQuantizer::quantize(std::span<const double> window) const {
    HASHTOK_CHECK_INPUT(window.size() == window_size(),
                        "Window of length " + std::to_string(window.size()) +
                        " does not match basis width " + std::to_string(window_size()));

    Eigen::Map<const Eigen::VectorXd> v(window.data(), static_cast<Eigen::Index>(window.size()));
    const Eigen::VectorXd projection = basis_ * v;
    return code_of(projection);
}

std::vector<TokenId> RandomHyperplaneQuantizer::quantize(const WindowMatrix& windows) const {
    HASHTOK_CHECK_INPUT(static_cast<size_t>(windows.cols()) == window_size(),
                        "Windows of length " + std::to_string(windows.cols()) +
                        " do not match basis width " + std::to_string(window_size()));

    // (num_windows, num_bits)
    const Eigen::MatrixXd projections = windows * basis_.transpose();

    std::vector<TokenId> ids;
    ids.reserve(static_cast<size_t>(projections.rows()));
    for (Eigen::Index r = 0; r < projections.rows(); ++r) {
        ids.push_back(code_of(projections.row(r)));
    }
    return ids;
}

// =============================================================================
// StringLshQuantizer
// =============================================================================

StringLshQuantizer::StringLshQuantizer(VocabularyBounds bounds, size_t feature_dim, uint64_t seed)
    : feature_dim_(feature_dim),
      hyperplanes_(bounds, feature_dim == 0 ? 1 : feature_dim, seed) {
    HASHTOK_CHECK_CONFIG(feature_dim_ >= 1, "lsh_feature_dim must be at least 1");
}

Eigen::VectorXd StringLshQuantizer::embed(std::string_view token) const {
    Eigen::VectorXd features = Eigen::VectorXd::Zero(static_cast<Eigen::Index>(feature_dim_));

    auto add_feature = [&](const std::string& feature) {
        const Blake3Hash digest = Blake3Hasher::hash(feature);
        const auto bucket = static_cast<Eigen::Index>(digest.truncated_64() % feature_dim_);
        features(bucket) += (digest.bytes[8] & 1) ? 1.0 : -1.0;
    };

    const std::vector<uint32_t> cps = util::decode_utf8(token);
    for (size_t i = 0; i < cps.size(); ++i) {
        add_feature("1:" + util::encode_utf8(cps[i]));
        if (i + 1 < cps.size()) {
            add_feature("2:" + util::encode_range(cps, i, i + 2));
        }
    }
    return features;
}

TokenId StringLshQuantizer::quantize(std::string_view token) const {
    const Eigen::VectorXd features = embed(token);
    return hyperplanes_.quantize(std::span<const double>(features.data(), static_cast<size_t>(features.size())));
}

std::vector<TokenId> StringLshQuantizer::quantize(const std::vector<std::string>& tokens) const {
    std::vector<TokenId> ids;
    ids.reserve(tokens.size());
    for (const auto& token : tokens) {
        ids.push_back(quantize(token));
    }
    return ids;
}

} // namespace hashtok
