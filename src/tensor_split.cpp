#include "tensor_split.hpp"

#include "errors.hpp"
#include "tensor_util.hpp"

#include <algorithm>
#include <string>

/// The channel axis of an N-D tensor is N-2; a 1-D tensor is split along
/// its only axis.
static int64_t split_axis(torch::Tensor const& x) {
    if (!x.defined() || x.dim() < 1) {
        throw ShapeError("tensor_split/tensor_cat need a tensor with at least 1 dimension");
    }
    return std::max<int64_t>(0, x.dim() - 2);
}

std::pair<torch::Tensor, torch::Tensor> tensor_split(torch::Tensor const& x) {
    int64_t const total = x.size(split_axis(x));

    // Halving must not round: an odd count would make the two halves
    // disagree with the coupling block widths further down.
    if (total % 2 != 0) {
        throw ShapeError(
            "cannot split " + std::to_string(total) +
            " channels in half, channel count must be even (shape " + shape_string(x) + ")");
    }
    return tensor_split_at(x, total / 2);
}

std::pair<torch::Tensor, torch::Tensor> tensor_split_at(
    torch::Tensor const& x,
    int64_t split_index) {

    int64_t const axis = split_axis(x);
    int64_t const total = x.size(axis);
    if (split_index < 0 || split_index > total) {
        throw ShapeError(
            "split index " + std::to_string(split_index) + " out of range for " +
            std::to_string(total) + " channels");
    }
    return {x.narrow(axis, 0, split_index), x.narrow(axis, split_index, total - split_index)};
}

torch::Tensor tensor_cat(torch::Tensor const& a, torch::Tensor const& b) {
    int64_t const axis = split_axis(a);
    if (b.dim() != a.dim()) {
        throw ShapeError(
            "tensor_cat operands must have the same rank, got " + shape_string(a) +
            " and " + shape_string(b));
    }

    if (a.size(axis) == 0) {
        return b;
    }
    if (b.size(axis) == 0) {
        return a;
    }

    for (int64_t d = 0; d < a.dim(); ++d) {
        if (d != axis && a.size(d) != b.size(d)) {
            throw ShapeError(
                "tensor_cat operands differ outside the channel axis: " + shape_string(a) +
                " vs " + shape_string(b));
        }
    }
    return torch::cat({a, b}, axis);
}

torch::Tensor tensor_cat(std::pair<torch::Tensor, torch::Tensor> const& halves) {
    return tensor_cat(halves.first, halves.second);
}
