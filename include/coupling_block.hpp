#pragma once

#include <torch/torch.h>

#include "residual_block.hpp"

#include <memory>
#include <vector>

/// Outputs of a coupling block evaluation. `first` is the conditioning half
/// (passed through unchanged), `second` the transformed half. `logdet` is a
/// 0-dim tensor, undefined unless requested.
struct CouplingOutput {
    torch::Tensor first;
    torch::Tensor second;
    torch::Tensor logdet;
};

/// Gradients and recomputed inputs of a coupling block backward pass.
struct CouplingGradients {
    torch::Tensor grad_first;
    torch::Tensor grad_second;
    torch::Tensor first;
    torch::Tensor second;
};

/// A bijective map (xa, xb) -> (xa, f(xb; xa)) on two channel halves.
///
/// backward never reads cached activations: it recovers the block input from
/// the block output via the inverse and differentiates from there. The first
/// gradient returned by backward/backward_inverse includes the seed passed in.
/// With `logdet` set, backward differentiates <dY, Y> - logdet and
/// backward_inverse <dX, X> - inverse logdet.
class CouplingBlock {
public:
    virtual ~CouplingBlock() = default;

    virtual CouplingOutput forward(
        torch::Tensor const& xa,
        torch::Tensor const& xb,
        bool logdet) const = 0;

    virtual CouplingOutput inverse(
        torch::Tensor const& ya,
        torch::Tensor const& yb,
        bool logdet) const = 0;

    /// Given gradients with respect to the outputs (ya, yb) of forward,
    /// return gradients with respect to (xa, xb) together with (xa, xb).
    virtual CouplingGradients backward(
        torch::Tensor const& grad_ya,
        torch::Tensor const& grad_yb,
        torch::Tensor const& ya,
        torch::Tensor const& yb,
        bool logdet) const = 0;

    /// Given gradients with respect to the outputs (xa, xb) of inverse,
    /// return gradients with respect to (ya, yb) together with (ya, yb).
    virtual CouplingGradients backward_inverse(
        torch::Tensor const& grad_xa,
        torch::Tensor const& grad_xb,
        torch::Tensor const& xa,
        torch::Tensor const& xb,
        bool logdet) const = 0;

    /// Channel count of each half.
    virtual int64_t channels() const = 0;

    virtual std::vector<torch::Tensor> parameters() const = 0;
};

/// Affine coupling conditioned by a residual block:
///   (raw_s, t) = split(RB(xa)),  s = 2 * sigmoid(raw_s)
///   yb = s * xb + t
///   logdet = sum(log|s|) / batch
class AffineCouplingBlock : public CouplingBlock {
public:
    AffineCouplingBlock(
        int64_t spatial_dims,
        int64_t channels,
        int64_t n_hidden,
        ResidualBlockOptions const& options = {});

    CouplingOutput forward(
        torch::Tensor const& xa,
        torch::Tensor const& xb,
        bool logdet) const override;

    CouplingOutput inverse(
        torch::Tensor const& ya,
        torch::Tensor const& yb,
        bool logdet) const override;

    CouplingGradients backward(
        torch::Tensor const& grad_ya,
        torch::Tensor const& grad_yb,
        torch::Tensor const& ya,
        torch::Tensor const& yb,
        bool logdet) const override;

    CouplingGradients backward_inverse(
        torch::Tensor const& grad_xa,
        torch::Tensor const& grad_xb,
        torch::Tensor const& xa,
        torch::Tensor const& xb,
        bool logdet) const override;

    int64_t channels() const override { return channels_; }

    std::vector<torch::Tensor> parameters() const override;

    /// Move the conditioner parameters to the given dtype.
    void to(torch::Dtype dtype);

    ResidualBlock const& residual_block() const { return rb_; }

private:
    struct Affine {
        torch::Tensor scale;
        torch::Tensor shift;
    };

    Affine conditioner(torch::Tensor const& xa) const;
    void check_halves(torch::Tensor const& a, torch::Tensor const& b, char const* op) const;

    int64_t spatial_dims_;
    int64_t channels_;
    ResidualBlock rb_;
};
