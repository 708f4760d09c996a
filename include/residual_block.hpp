#pragma once

#include <torch/torch.h>

/// Hyperparameters of the residual conditioner inside a coupling block.
/// k1/p1/s1 configure the first and third convolution, k2/p2/s2 the second.
struct ResidualBlockOptions {
    int64_t k1 = 3;
    int64_t k2 = 3;
    int64_t p1 = 1;
    int64_t p2 = 1;
    int64_t s1 = 1;
    int64_t s2 = 1;
};

/// conv(k1, s1, p1) -> ReLU -> conv(k2, s2, p2) -> ReLU -> transposed conv(k1, s1, p1)
/// mapping n_in -> n_hidden -> n_hidden -> 2 * n_in channels.
/// Operates on libtorch's (batch, channel, spatial...) layout, 2-D or 3-D.
struct ResidualBlockImpl : torch::nn::Module {
    ResidualBlockImpl(
        int64_t spatial_dims,
        int64_t n_in,
        int64_t n_hidden,
        ResidualBlockOptions const& options);

    torch::Tensor forward(torch::Tensor const& x);

    int64_t spatial_dims;
    torch::nn::Sequential net{nullptr};
};

TORCH_MODULE(ResidualBlock);
