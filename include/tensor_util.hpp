#pragma once

#include "errors.hpp"

#include <torch/torch.h>

#include <sstream>
#include <string>

// Tensors handled by this library are laid out as
//   (nx, ny, [nz,] channel, batch)
// i.e. spatial axes first, channel second-to-last and batch last.

/// Build TensorOptions with only dtype and device from an existing tensor.
/// Necessary because tensor.options() includes layout (e.g. Strided), which
/// is incompatible with torch::sparse_coo_tensor.
inline torch::TensorOptions sparse_opts(torch::Tensor const& t) {
    return torch::TensorOptions().dtype(t.dtype()).device(t.device());
}

/// Build int64 TensorOptions on the same device as the given tensor.
/// Used for index tensors (row/col indices) in sparse matrix construction.
inline torch::TensorOptions long_opts_like(torch::Tensor const& t) {
    return torch::TensorOptions().dtype(torch::kLong).device(t.device());
}

/// Render a tensor shape as "(a, b, c)" for error messages.
inline std::string shape_string(torch::Tensor const& t) {
    std::ostringstream out;
    out << "(";
    for (int64_t i = 0; i < t.dim(); ++i) {
        if (i > 0) out << ", ";
        out << t.size(i);
    }
    out << ")";
    return out.str();
}

inline int64_t channel_dim(torch::Tensor const& t) {
    return t.dim() - 2;
}

inline int64_t num_channels(torch::Tensor const& t) {
    return t.size(channel_dim(t));
}

/// Number of spatial axes of a (spatial..., channel, batch) tensor.
/// Throws ShapeError unless the tensor is 4-D (image) or 5-D (volume).
inline int64_t spatial_rank(torch::Tensor const& t, char const* name = "input") {
    if (!t.defined()) {
        throw ShapeError(std::string(name) + " is an undefined tensor");
    }
    if (t.dim() != 4 && t.dim() != 5) {
        throw ShapeError(
            std::string(name) + " must be 4-D (nx, ny, c, batch) or 5-D (nx, ny, nz, c, batch), got shape " +
            shape_string(t));
    }
    return t.dim() - 2;
}

/// Throw ShapeError unless both tensors have exactly the same shape.
inline void check_same_shape(
    torch::Tensor const& a,
    torch::Tensor const& b,
    char const* name_a,
    char const* name_b) {
    if (a.sizes() != b.sizes()) {
        throw ShapeError(
            std::string(name_a) + " " + shape_string(a) + " and " + name_b + " " +
            shape_string(b) + " must have the same shape");
    }
}
