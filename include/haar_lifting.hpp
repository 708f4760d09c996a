#pragma once

#include <torch/torch.h>

#include <utility>

/// One normalized Haar lifting step along spatial axis `axis`.
/// Splits the axis into odd (L) and even (H) positions, then
///   predict:   H = H - L
///   update:    L = L + H / 2
///   normalize: H = H / sqrt(2), L = L * sqrt(2)
/// Returns (L, H), each with half the extent along `axis`.
std::pair<torch::Tensor, torch::Tensor> haar_lift(
    torch::Tensor const& x,
    int64_t axis);

/// Exact inverse of haar_lift: undo normalize, update and predict, then
/// re-interleave L (odd positions) and H (even positions) along `axis`.
torch::Tensor inv_haar_lift(
    torch::Tensor const& low,
    torch::Tensor const& high,
    int64_t axis);

/// One-level channelwise Haar transform by lifting, with each sub-band
/// stored as a channel group.
/// 2-D: (nx, ny, c, batch) -> (nx/2, ny/2, 4c, batch), groups [a, v, h, d].
/// 3-D: (nx, ny, nz, c, batch) -> (nx/2, ny/2, nz/2, 8c, batch),
///      groups [ah, al, vh, vl, hh, hl, dh, dl].
/// Orthonormal: the sum of squares of the input is preserved.
torch::Tensor haar_squeeze(torch::Tensor const& x);

/// Inverse of haar_squeeze.
torch::Tensor inv_haar_unsqueeze(torch::Tensor const& y);
