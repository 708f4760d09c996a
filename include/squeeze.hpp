#pragma once

#include <torch/torch.h>

#include <string>
#include <utility>

/// Pixel-to-channel arrangement used by squeeze/unsqueeze (2-D view, four
/// output channel groups numbered 1..4):
///
///     1 2 3 4        1 1 3 3        1 3 1 3
///     1 2 3 4        1 1 3 3        2 4 2 4
///     1 2 3 4        2 2 4 4        1 3 1 3
///     1 2 3 4        2 2 4 4        2 4 2 4
///
///     column          patch       checkerboard
///
/// Rows of the picture run along the first spatial axis.
enum class SqueezePattern { column, patch, checkerboard };

/// Parse a squeeze pattern from a string.
/// Accepted values: "column", "patch", "checkerboard".
SqueezePattern parse_squeeze_pattern(std::string const& name);

std::string to_string(SqueezePattern pattern);

/// Halve every spatial axis and multiply the channel count by 2^rank.
/// x: (nx, ny, c, batch) -> (nx/2, ny/2, 4c, batch)
///    (nx, ny, nz, c, batch) -> (nx/2, ny/2, nz/2, 8c, batch)
/// Channel group g holds the spatial offset whose bits (x, y, z) are the
/// bits of g, either as a half-block (patch) or a parity (checkerboard).
torch::Tensor squeeze(
    torch::Tensor const& x,
    SqueezePattern pattern);

/// Exact inverse of squeeze with the same pattern.
torch::Tensor unsqueeze(
    torch::Tensor const& y,
    SqueezePattern pattern);

/// Unsqueeze two tensors with the same pattern, e.g. a gradient and its input.
std::pair<torch::Tensor, torch::Tensor> unsqueeze(
    torch::Tensor const& first,
    torch::Tensor const& second,
    SqueezePattern pattern);
