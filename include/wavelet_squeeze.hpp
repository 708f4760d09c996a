#pragma once

#include <torch/torch.h>

#include "wavelet.hpp"

/// One-level channelwise filter-bank wavelet transform, squeezed into channels.
/// Each spatial axis is analysed with the sparse matrix from construct_a
/// (lowpass half, then highpass half); the sub-bands are then arranged with
/// the patch squeeze pattern, 2^rank consecutive output channels per input
/// channel.
/// x: (nx, ny, c, batch) -> (nx/2, ny/2, 4c, batch)
///    (nx, ny, nz, c, batch) -> (nx/2, ny/2, nz/2, 8c, batch)
/// Only two-tap orthogonal filter banks are supported.
torch::Tensor wavelet_squeeze(
    torch::Tensor const& x,
    Wavelet const& wavelet);

/// Inverse of wavelet_squeeze.
torch::Tensor wavelet_unsqueeze(
    torch::Tensor const& y,
    Wavelet const& wavelet);
