#pragma once

#include <torch/torch.h>

#include "flow_types.hpp"

#include <memory>
#include <vector>

/// An invertible layer with closed-form inverse and a backward pass that
/// recomputes its input from its output instead of caching activations.
class InvertibleLayer {
public:
    explicit InvertibleLayer(bool logdet) : logdet_(logdet) {}
    virtual ~InvertibleLayer() = default;

    /// Forward pass, returning the log-determinant iff the layer tracks it.
    FlowOutput forward(torch::Tensor const& x) const { return forward(x, logdet_); }

    /// Inverse pass without log-determinant.
    FlowOutput inverse(torch::Tensor const& y) const { return inverse(y, false); }

    virtual FlowOutput forward(torch::Tensor const& x, bool logdet) const = 0;
    virtual FlowOutput inverse(torch::Tensor const& y, bool logdet) const = 0;

    /// From (dY, Y) compute (dX, X) for the forward map.
    virtual FlowGradients backward(torch::Tensor const& grad_y, torch::Tensor const& y) const = 0;

    /// From (dX, X) compute (dY, Y) for the inverse map.
    virtual FlowGradients backward_inverse(torch::Tensor const& grad_x, torch::Tensor const& x) const = 0;

    virtual std::vector<torch::Tensor> parameters() const = 0;

    virtual bool is_reversed() const { return false; }

    bool logdet() const { return logdet_; }

    /// Zero the accumulated gradients of all parameters.
    void clear_grad() const;

private:
    bool logdet_;
};

/// View of a layer with forward/inverse and backward/backward_inverse
/// swapped. Shares the wrapped layer; nothing is copied or rebuilt.
class ReversedLayer : public InvertibleLayer {
public:
    explicit ReversedLayer(std::shared_ptr<InvertibleLayer> layer);

    using InvertibleLayer::forward;
    using InvertibleLayer::inverse;

    FlowOutput forward(torch::Tensor const& x, bool logdet) const override;
    FlowOutput inverse(torch::Tensor const& y, bool logdet) const override;

    FlowGradients backward(torch::Tensor const& grad_y, torch::Tensor const& y) const override;
    FlowGradients backward_inverse(torch::Tensor const& grad_x, torch::Tensor const& x) const override;

    std::vector<torch::Tensor> parameters() const override { return layer_->parameters(); }

    bool is_reversed() const override { return true; }

    std::shared_ptr<InvertibleLayer> const& layer() const { return layer_; }

private:
    std::shared_ptr<InvertibleLayer> layer_;
};

/// Reverse a layer. Reversing a reversed view returns the original layer.
std::shared_ptr<InvertibleLayer> reverse(std::shared_ptr<InvertibleLayer> const& layer);
