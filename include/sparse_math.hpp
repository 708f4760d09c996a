#pragma once

#include <torch/torch.h>

/// Build a sparse convolution matrix (sameshift mode).
/// Result is a square (input_length x input_length) sparse COO tensor.
torch::Tensor construct_conv_matrix(
    torch::Tensor const& filter,
    int64_t input_length);

/// Build a strided sparse convolution matrix (sameshift mode).
/// Keeps rows 1, 1 + stride, 1 + 2*stride, ... of construct_conv_matrix.
/// Result shape: (ceil((input_length - 1) / stride), input_length).
torch::Tensor construct_strided_conv_matrix(
    torch::Tensor const& filter,
    int64_t input_length,
    int64_t stride);

/// Multiply a sparse (M x n) matrix into `data` along `axis`, where
/// data.size(axis) == n. Every other axis is treated as a batch of vectors.
/// Result has extent M along `axis`.
torch::Tensor apply_matrix_along_axis(
    torch::Tensor const& matrix,
    torch::Tensor const& data,
    int64_t axis);
