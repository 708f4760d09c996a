#include "residual_block.hpp"

#include "errors.hpp"

#include <string>

static void check_options(ResidualBlockOptions const& o) {
    if (o.k1 < 1 || o.k2 < 1 || o.s1 < 1 || o.s2 < 1 || o.p1 < 0 || o.p2 < 0) {
        throw ConfigurationError(
            "invalid residual block options: k1=" + std::to_string(o.k1) +
            " k2=" + std::to_string(o.k2) + " p1=" + std::to_string(o.p1) +
            " p2=" + std::to_string(o.p2) + " s1=" + std::to_string(o.s1) +
            " s2=" + std::to_string(o.s2));
    }
}

ResidualBlockImpl::ResidualBlockImpl(
    int64_t spatial_dims,
    int64_t n_in,
    int64_t n_hidden,
    ResidualBlockOptions const& o)
    : spatial_dims(spatial_dims) {

    check_options(o);
    if (n_in < 1 || n_hidden < 1) {
        throw ConfigurationError(
            "residual block needs positive channel counts, got n_in=" + std::to_string(n_in) +
            " n_hidden=" + std::to_string(n_hidden));
    }

    if (spatial_dims == 2) {
        net = torch::nn::Sequential(
            torch::nn::Conv2d(torch::nn::Conv2dOptions(n_in, n_hidden, o.k1).stride(o.s1).padding(o.p1)),
            torch::nn::ReLU(),
            torch::nn::Conv2d(torch::nn::Conv2dOptions(n_hidden, n_hidden, o.k2).stride(o.s2).padding(o.p2)),
            torch::nn::ReLU(),
            torch::nn::ConvTranspose2d(
                torch::nn::ConvTranspose2dOptions(n_hidden, 2 * n_in, o.k1).stride(o.s1).padding(o.p1)));
    } else if (spatial_dims == 3) {
        net = torch::nn::Sequential(
            torch::nn::Conv3d(torch::nn::Conv3dOptions(n_in, n_hidden, o.k1).stride(o.s1).padding(o.p1)),
            torch::nn::ReLU(),
            torch::nn::Conv3d(torch::nn::Conv3dOptions(n_hidden, n_hidden, o.k2).stride(o.s2).padding(o.p2)),
            torch::nn::ReLU(),
            torch::nn::ConvTranspose3d(
                torch::nn::ConvTranspose3dOptions(n_hidden, 2 * n_in, o.k1).stride(o.s1).padding(o.p1)));
    } else {
        throw ConfigurationError(
            "spatial_dims must be 2 or 3, got " + std::to_string(spatial_dims));
    }
    register_module("net", net);
}

torch::Tensor ResidualBlockImpl::forward(torch::Tensor const& x) {
    return net->forward(x);
}
