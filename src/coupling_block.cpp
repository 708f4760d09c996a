#include "coupling_block.hpp"

#include "errors.hpp"
#include "tensor_split.hpp"
#include "tensor_util.hpp"

#include <string>
#include <vector>

// The residual block runs on libtorch's (batch, channel, spatial...) layout;
// coupling blocks receive (spatial..., channel, batch) tensors.

static torch::Tensor to_batch_first(torch::Tensor const& t) {
    int64_t const rank = t.dim() - 2;
    std::vector<int64_t> order = {t.dim() - 1, t.dim() - 2};
    for (int64_t d = 0; d < rank; ++d) {
        order.push_back(d);
    }
    return t.permute(order).contiguous();
}

static torch::Tensor from_batch_first(torch::Tensor const& t) {
    int64_t const rank = t.dim() - 2;
    std::vector<int64_t> order;
    for (int64_t d = 0; d < rank; ++d) {
        order.push_back(d + 2);
    }
    order.push_back(1);
    order.push_back(0);
    return t.permute(order).contiguous();
}

static torch::Tensor batch_logdet(torch::Tensor const& scale) {
    return torch::log(torch::abs(scale)).sum() / static_cast<double>(scale.size(-1));
}

AffineCouplingBlock::AffineCouplingBlock(
    int64_t spatial_dims,
    int64_t channels,
    int64_t n_hidden,
    ResidualBlockOptions const& options)
    : spatial_dims_(spatial_dims),
      channels_(channels),
      rb_(spatial_dims, channels, n_hidden, options) {}

std::vector<torch::Tensor> AffineCouplingBlock::parameters() const {
    return rb_->parameters();
}

void AffineCouplingBlock::to(torch::Dtype dtype) {
    rb_->to(dtype);
}

void AffineCouplingBlock::check_halves(
    torch::Tensor const& a,
    torch::Tensor const& b,
    char const* op) const {

    int64_t const rank = spatial_rank(a, op);
    if (rank != spatial_dims_) {
        throw ShapeError(
            std::string(op) + ": block built for " + std::to_string(spatial_dims_) +
            " spatial dims, got shape " + shape_string(a));
    }
    check_same_shape(a, b, "first half", "second half");
    if (num_channels(a) != channels_) {
        throw ShapeError(
            std::string(op) + ": block built for " + std::to_string(channels_) +
            " channels per half, got shape " + shape_string(a));
    }
}

AffineCouplingBlock::Affine AffineCouplingBlock::conditioner(torch::Tensor const& xa) const {
    auto out = from_batch_first(rb_.ptr()->forward(to_batch_first(xa)));

    // Strided or padded convolutions can change the spatial extent; the
    // affine parameters must line up with the second half element for element.
    for (int64_t d = 0; d < spatial_dims_; ++d) {
        if (out.size(d) != xa.size(d)) {
            throw ShapeError(
                "residual block output " + shape_string(out) +
                " does not preserve the spatial shape of its input " + shape_string(xa));
        }
    }

    auto [raw_scale, shift] = tensor_split(out);
    return {2.0 * torch::sigmoid(raw_scale), shift};
}

CouplingOutput AffineCouplingBlock::forward(
    torch::Tensor const& xa,
    torch::Tensor const& xb,
    bool logdet) const {

    check_halves(xa, xb, "coupling forward");
    torch::NoGradGuard no_grad;

    auto const affine = conditioner(xa);
    CouplingOutput out{xa, affine.scale * xb + affine.shift, {}};
    if (logdet) {
        out.logdet = batch_logdet(affine.scale);
    }
    return out;
}

CouplingOutput AffineCouplingBlock::inverse(
    torch::Tensor const& ya,
    torch::Tensor const& yb,
    bool logdet) const {

    check_halves(ya, yb, "coupling inverse");
    torch::NoGradGuard no_grad;

    auto const affine = conditioner(ya);
    CouplingOutput out{ya, (yb - affine.shift) / affine.scale, {}};
    if (logdet) {
        out.logdet = -batch_logdet(affine.scale);
    }
    return out;
}

CouplingGradients AffineCouplingBlock::backward(
    torch::Tensor const& grad_ya,
    torch::Tensor const& grad_yb,
    torch::Tensor const& ya,
    torch::Tensor const& yb,
    bool logdet) const {

    check_halves(ya, yb, "coupling backward");
    check_same_shape(grad_ya, ya, "grad_ya", "ya");
    check_same_shape(grad_yb, yb, "grad_yb", "yb");

    auto const xb = inverse(ya, yb, false).second;

    torch::AutoGradMode enable_grad(true);
    auto xa_leaf = ya.detach().requires_grad_(true);
    auto xb_leaf = xb.detach().requires_grad_(true);

    auto const affine = conditioner(xa_leaf);
    auto yb_recomputed = affine.scale * xb_leaf + affine.shift;

    auto objective = (yb_recomputed * grad_yb.detach()).sum();
    if (logdet) {
        objective = objective - batch_logdet(affine.scale);
    }
    objective.backward();

    return {grad_ya + xa_leaf.grad(), xb_leaf.grad(), ya, xb};
}

CouplingGradients AffineCouplingBlock::backward_inverse(
    torch::Tensor const& grad_xa,
    torch::Tensor const& grad_xb,
    torch::Tensor const& xa,
    torch::Tensor const& xb,
    bool logdet) const {

    check_halves(xa, xb, "coupling backward_inverse");
    check_same_shape(grad_xa, xa, "grad_xa", "xa");
    check_same_shape(grad_xb, xb, "grad_xb", "xb");

    auto const yb = forward(xa, xb, false).second;

    torch::AutoGradMode enable_grad(true);
    auto ya_leaf = xa.detach().requires_grad_(true);
    auto yb_leaf = yb.detach().requires_grad_(true);

    auto const affine = conditioner(ya_leaf);
    auto xb_recomputed = (yb_leaf - affine.shift) / affine.scale;

    // The inverse map has log-determinant -batch_logdet(scale).
    auto objective = (xb_recomputed * grad_xb.detach()).sum();
    if (logdet) {
        objective = objective + batch_logdet(affine.scale);
    }
    objective.backward();

    return {grad_xa + ya_leaf.grad(), yb_leaf.grad(), xa, yb};
}
