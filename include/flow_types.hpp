#pragma once

#include <torch/torch.h>

/// Result of forward/inverse: the transformed tensor and, when requested,
/// the log-determinant of the Jacobian as a 0-dim tensor. `logdet` is an
/// undefined tensor when it was not requested.
struct FlowOutput {
    torch::Tensor tensor;
    torch::Tensor logdet;

    bool has_logdet() const { return logdet.defined(); }
};

/// Result of a backward pass: the gradient with respect to the input of the
/// map and the input itself, recomputed from the output.
struct FlowGradients {
    torch::Tensor grad;
    torch::Tensor input;
};
