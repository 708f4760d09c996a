#include "matrix_build.hpp"

#include "errors.hpp"
#include "sparse_math.hpp"

#include <string>

static void check_length(int64_t length) {
    if (length < 2 || length % 2 != 0) {
        throw ShapeError(
            "filter bank matrices need an even length >= 2, got " + std::to_string(length));
    }
}

torch::Tensor construct_a(
    Wavelet const& wavelet,
    int64_t length,
    torch::TensorOptions const& opts) {

    check_length(length);
    auto analysis_lo = construct_strided_conv_matrix(torch::tensor(wavelet.dec_lo, opts), length, 2);
    auto analysis_hi = construct_strided_conv_matrix(torch::tensor(wavelet.dec_hi, opts), length, 2);
    return torch::cat({analysis_lo, analysis_hi}).coalesce();
}

torch::Tensor construct_s(
    Wavelet const& wavelet,
    int64_t length,
    torch::TensorOptions const& opts) {

    check_length(length);
    // Reconstruction filters are time-reversed relative to their stored form.
    auto synthesis_lo = construct_strided_conv_matrix(torch::tensor(wavelet.rec_lo, opts).flip(0), length, 2);
    auto synthesis_hi = construct_strided_conv_matrix(torch::tensor(wavelet.rec_hi, opts).flip(0), length, 2);
    return torch::cat({synthesis_lo, synthesis_hi}).t().coalesce();
}
