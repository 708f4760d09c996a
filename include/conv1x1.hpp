#pragma once

#include <torch/torch.h>

#include "flow_types.hpp"

#include <vector>

/// Invertible linear mixing of the channel axis ("permutation").
/// forward and inverse act on (spatial..., channel, batch) tensors whose
/// channel count equals channels().
class ChannelPermutation {
public:
    virtual ~ChannelPermutation() = default;

    virtual torch::Tensor forward(torch::Tensor const& x) const = 0;
    virtual torch::Tensor inverse(torch::Tensor const& y) const = 0;

    /// Adjoint of forward: from (dY, Y) return (dX, X).
    virtual FlowGradients backward(torch::Tensor const& grad_y, torch::Tensor const& y) const = 0;

    /// Adjoint of inverse: from (dX, X) return (dY, Y).
    virtual FlowGradients backward_inverse(torch::Tensor const& grad_x, torch::Tensor const& x) const = 0;

    virtual int64_t channels() const = 0;

    virtual std::vector<torch::Tensor> parameters() const = 0;
};

/// Orthogonal 1x1 convolution W = H(v1) H(v2) H(v3), a product of three
/// Householder reflections H(v) = I - 2 v v^T / (v^T v). The same matrix
/// mixes the channels at every pixel; its log-determinant is zero.
class Conv1x1 : public ChannelPermutation {
public:
    /// Random reflection vectors drawn from a standard normal.
    explicit Conv1x1(int64_t channels, torch::Dtype dtype = torch::kFloat32);

    /// Explicit reflection vectors, each of length `channels`.
    Conv1x1(torch::Tensor v1, torch::Tensor v2, torch::Tensor v3);

    torch::Tensor forward(torch::Tensor const& x) const override;
    torch::Tensor inverse(torch::Tensor const& y) const override;

    FlowGradients backward(torch::Tensor const& grad_y, torch::Tensor const& y) const override;
    FlowGradients backward_inverse(torch::Tensor const& grad_x, torch::Tensor const& x) const override;

    int64_t channels() const override { return channels_; }

    std::vector<torch::Tensor> parameters() const override { return {v1_, v2_, v3_}; }

    /// The dense (channels x channels) mixing matrix W.
    torch::Tensor matrix() const;

private:
    void check_width(torch::Tensor const& t, char const* op) const;

    int64_t channels_;
    torch::Tensor v1_;
    torch::Tensor v2_;
    torch::Tensor v3_;
};
