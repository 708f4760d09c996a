#pragma once

#include <torch/torch.h>

#include "wavelet.hpp"

/// Build the one-level analysis matrix A of a two-channel filter bank.
/// Top length/2 rows: lowpass (dec_lo), bottom length/2 rows: highpass (dec_hi).
/// Returns a sparse COO tensor of shape (length, length).
torch::Tensor construct_a(
    Wavelet const& wavelet,
    int64_t length,
    torch::TensorOptions const& opts);

/// Build the one-level synthesis matrix S.
/// S = cat(strided_conv(flip(rec_lo)), strided_conv(flip(rec_hi))).T
/// Returns a sparse COO tensor of shape (length, length).
torch::Tensor construct_s(
    Wavelet const& wavelet,
    int64_t length,
    torch::TensorOptions const& opts);
