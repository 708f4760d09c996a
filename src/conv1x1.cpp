#include "conv1x1.hpp"

#include "errors.hpp"
#include "tensor_util.hpp"

#include <string>

static torch::Tensor householder(torch::Tensor const& v) {
    auto const n = v.size(0);
    auto eye = torch::eye(n, v.options());
    return eye - 2.0 * torch::outer(v, v) / v.dot(v);
}

Conv1x1::Conv1x1(int64_t channels, torch::Dtype dtype)
    : Conv1x1(torch::randn({channels}, torch::TensorOptions().dtype(dtype)),
              torch::randn({channels}, torch::TensorOptions().dtype(dtype)),
              torch::randn({channels}, torch::TensorOptions().dtype(dtype))) {}

Conv1x1::Conv1x1(torch::Tensor v1, torch::Tensor v2, torch::Tensor v3)
    : channels_(v1.defined() && v1.dim() == 1 ? v1.size(0) : 0) {

    if (channels_ < 1) {
        throw ConfigurationError("Conv1x1 reflection vectors must be non-empty 1-D tensors");
    }
    for (auto const* v : {&v1, &v2, &v3}) {
        if (!v->defined() || v->dim() != 1 || v->size(0) != channels_) {
            throw ConfigurationError(
                "Conv1x1 reflection vectors must all have length " + std::to_string(channels_));
        }
        if (v->norm().item<double>() == 0.0) {
            throw ConfigurationError("Conv1x1 reflection vectors must be non-zero");
        }
    }
    v1_ = v1.detach().clone().requires_grad_(true);
    v2_ = v2.detach().clone().requires_grad_(true);
    v3_ = v3.detach().clone().requires_grad_(true);
}

torch::Tensor Conv1x1::matrix() const {
    return torch::mm(householder(v1_), torch::mm(householder(v2_), householder(v3_)));
}

void Conv1x1::check_width(torch::Tensor const& t, char const* op) const {
    spatial_rank(t, op);
    if (num_channels(t) != channels_) {
        throw ShapeError(
            std::string(op) + ": Conv1x1 built for " + std::to_string(channels_) +
            " channels, got shape " + shape_string(t));
    }
}

// The channel axis is second-to-last, so matmul broadcasts W over the
// spatial axes and multiplies every (channel x batch) slice.

torch::Tensor Conv1x1::forward(torch::Tensor const& x) const {
    check_width(x, "Conv1x1 forward");
    torch::NoGradGuard no_grad;
    return torch::matmul(matrix(), x);
}

torch::Tensor Conv1x1::inverse(torch::Tensor const& y) const {
    check_width(y, "Conv1x1 inverse");
    torch::NoGradGuard no_grad;
    return torch::matmul(matrix().t(), y);
}

FlowGradients Conv1x1::backward(torch::Tensor const& grad_y, torch::Tensor const& y) const {
    check_same_shape(grad_y, y, "grad_y", "y");
    auto const x = inverse(y);

    torch::AutoGradMode enable_grad(true);
    auto x_leaf = x.detach().requires_grad_(true);
    auto objective = (torch::matmul(matrix(), x_leaf) * grad_y.detach()).sum();
    objective.backward();
    return {x_leaf.grad(), x};
}

FlowGradients Conv1x1::backward_inverse(torch::Tensor const& grad_x, torch::Tensor const& x) const {
    check_same_shape(grad_x, x, "grad_x", "x");
    auto const y = forward(x);

    torch::AutoGradMode enable_grad(true);
    auto y_leaf = y.detach().requires_grad_(true);
    auto objective = (torch::matmul(matrix().t(), y_leaf) * grad_x.detach()).sum();
    objective.backward();
    return {y_leaf.grad(), y};
}
