#pragma once

#include <torch/torch.h>

#include "residual_block.hpp"

#include <string>

/// Where the channel permutation is applied in a HINT layer.
///   none:  never
///   lower: to the second channel half before the recursion (size n_in / 2)
///   full:  to the whole input before splitting (size n_in)
///   both:  to the whole input before splitting and, inverted, to the output
enum class PermuteType { none, lower, both, full };

/// Parse a permutation mode from a string.
/// Accepted values: "none", "lower", "both", "full".
PermuteType parse_permute_type(std::string const& name);

std::string to_string(PermuteType permute);

/// Construction parameters of a CouplingLayerHINT.
struct HintConfig {
    int64_t spatial_dims = 2;      // 2 (image) or 3 (volume)
    int64_t n_in = 0;              // input channels
    int64_t n_hidden = 0;          // hidden channels of each residual block
    int64_t batch_size = 1;        // informational; any batch size is accepted
    bool logdet = false;
    PermuteType permute = PermuteType::none;
    ResidualBlockOptions block = {};
    torch::Dtype dtype = torch::kFloat32;
};
