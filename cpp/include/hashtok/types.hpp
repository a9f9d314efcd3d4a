#pragma once

#include <cstdint>
#include <cstddef>
#include <array>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <Eigen/Dense>

namespace hashtok {

// Integer id fed to an embedding table of size num_embeddings
using TokenId = int64_t;

// Coarse offset of a character inside its word, in [0, max_positional)
using Position = int32_t;

// 1D raw input (audio samples, sensor readings, ...)
using Signal = std::vector<double>;

// 2D raw input, row-major so that row slices are contiguous like numpy arrays
using Image = Eigen::Matrix<double, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;

// One window per row
using WindowMatrix = Eigen::Matrix<double, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;

// =============================================================================
// Special tokens
// =============================================================================
//
// Reserved ids occupy [padding_idx, padding_idx + SpecialTokens::count).
// The hashing path never emits them.
//
struct SpecialTokens {
    static constexpr std::array<std::string_view, 5> names = {
        "<PAD>", "<CLS>", "<SEP>", "<MASK>", "<UNK>"
    };
    static constexpr TokenId count = static_cast<TokenId>(names.size());

    // First id available to hashed tokens
    static constexpr TokenId first_free_id(TokenId padding_idx) noexcept {
        return padding_idx + count;
    }

    // Reserved id of a special token, or -1 if the name is not special
    static constexpr TokenId id_of(std::string_view name, TokenId padding_idx) noexcept {
        for (size_t i = 0; i < names.size(); ++i) {
            if (names[i] == name) return padding_idx + static_cast<TokenId>(i);
        }
        return -1;
    }
};

// =============================================================================
// Window collections
// =============================================================================

// (output_length, window_size) windows of a 1D sequence
struct WindowBatch {
    WindowMatrix windows;

    size_t output_length() const noexcept { return static_cast<size_t>(windows.rows()); }
    size_t window_size() const noexcept { return static_cast<size_t>(windows.cols()); }
};

// (output_height, output_width, window_height, window_width) windows of a matrix.
// Cell (i, j) is row i * output_width + j of `windows`, flattened row-major.
struct WindowGrid {
    size_t output_height = 0;
    size_t output_width = 0;
    size_t window_height = 0;
    size_t window_width = 0;
    WindowMatrix windows;

    size_t cell_index(size_t i, size_t j) const noexcept { return i * output_width + j; }

    // View of window (i, j) as a window_height x window_width matrix
    Eigen::Map<const Image> window(size_t i, size_t j) const {
        return Eigen::Map<const Image>(windows.row(static_cast<Eigen::Index>(cell_index(i, j))).data(),
                                       static_cast<Eigen::Index>(window_height),
                                       static_cast<Eigen::Index>(window_width));
    }
};

// =============================================================================
// Positional character structures
// =============================================================================

struct PositionedChars {
    std::vector<std::string> chars;   // one UTF-8 encoded codepoint each
    std::vector<Position> positions;  // parallel to chars
};

struct PositionedIds {
    std::vector<TokenId> ids;
    std::vector<Position> positions;

    bool operator==(const PositionedIds& other) const {
        return ids == other.ids && positions == other.positions;
    }
};

} // namespace hashtok
