#include "wavelet_squeeze.hpp"

#include "errors.hpp"
#include "matrix_build.hpp"
#include "sparse_math.hpp"
#include "squeeze.hpp"
#include "tensor_util.hpp"

#include <string>
#include <vector>

/// Longer filters would need boundary-corrected matrices to stay invertible.
static void check_two_tap(Wavelet const& wavelet) {
    if (!wavelet.is_two_tap()) {
        throw UnsupportedPatternError(
            "wavelet squeeze supports two-tap filter banks only, '" + wavelet.name +
            "' has " + std::to_string(wavelet.dec_len()) + " taps");
    }
}

/// Reorder channel groups between group-major [g][c] (squeeze output) and
/// channel-major [c][g] (one block of `groups` channels per input channel).
static torch::Tensor swap_channel_grouping(
    torch::Tensor const& t,
    int64_t outer,
    int64_t inner) {

    int64_t const ch = channel_dim(t);
    auto shape = t.sizes().vec();
    std::vector<int64_t> split_shape(shape.begin(), shape.begin() + ch);
    split_shape.push_back(outer);
    split_shape.push_back(inner);
    split_shape.push_back(shape.back());

    return t.reshape(split_shape).transpose(ch, ch + 1).reshape(shape).contiguous();
}

torch::Tensor wavelet_squeeze(
    torch::Tensor const& x,
    Wavelet const& wavelet) {

    int64_t const rank = spatial_rank(x, "wavelet_squeeze input");
    check_two_tap(wavelet);

    auto const opts = sparse_opts(x);
    auto coeffs = x;
    for (int64_t d = 0; d < rank; ++d) {
        auto analysis = construct_a(wavelet, x.size(d), opts);
        coeffs = apply_matrix_along_axis(analysis, coeffs, d);
    }

    auto grouped = squeeze(coeffs, SqueezePattern::patch);
    return swap_channel_grouping(grouped, 1LL << rank, num_channels(x));
}

torch::Tensor wavelet_unsqueeze(
    torch::Tensor const& y,
    Wavelet const& wavelet) {

    int64_t const rank = spatial_rank(y, "wavelet_unsqueeze input");
    check_two_tap(wavelet);

    int64_t const groups = 1LL << rank;
    if (num_channels(y) % groups != 0) {
        throw ShapeError(
            "wavelet_unsqueeze needs a channel count divisible by " + std::to_string(groups) +
            ", got shape " + shape_string(y));
    }

    auto grouped = swap_channel_grouping(y, num_channels(y) / groups, groups);
    auto coeffs = unsqueeze(grouped, SqueezePattern::patch);

    auto const opts = sparse_opts(y);
    for (int64_t d = rank - 1; d >= 0; --d) {
        auto synthesis = construct_s(wavelet, coeffs.size(d), opts);
        coeffs = apply_matrix_along_axis(synthesis, coeffs, d);
    }
    return coeffs;
}
