#pragma once

#include <torch/torch.h>

#include <utility>

/// Split a (spatial..., channel, batch) tensor along the channel axis into
/// two halves. Requires an even channel count. Inverse operation of
/// tensor_cat.
std::pair<torch::Tensor, torch::Tensor> tensor_split(torch::Tensor const& x);

/// As tensor_split, with the first split_index channels in the left part
/// and the remainder in the right part. split_index may be 0 or the full
/// channel count.
std::pair<torch::Tensor, torch::Tensor> tensor_split_at(
    torch::Tensor const& x,
    int64_t split_index);

/// Concatenate two tensors along the channel axis. If either operand has
/// zero channels the other one is returned unchanged.
torch::Tensor tensor_cat(torch::Tensor const& a, torch::Tensor const& b);

torch::Tensor tensor_cat(std::pair<torch::Tensor, torch::Tensor> const& halves);
