#include "coupling_layer_hint.hpp"

#include "errors.hpp"
#include "tensor_split.hpp"
#include "tensor_util.hpp"

#include <c10/util/Logging.h>

#include <string>
#include <utility>

int64_t get_depth(int64_t n_in) {
    int64_t depth = 1;
    while (n_in > 4) {
        n_in /= 2;
        ++depth;
    }
    return depth;
}

// Every level halves the channel count, so every value visited while
// recursing has to be even.
static void check_channel_count(int64_t n_in) {
    if (n_in < 2) {
        throw ConfigurationError("HINT layer needs at least 2 channels, got " + std::to_string(n_in));
    }
    int64_t n = n_in;
    while (n > 4) {
        if (n % 2 != 0) break;
        n /= 2;
    }
    if (n % 2 != 0) {
        throw ConfigurationError(
            "HINT layer needs a power-of-two channel count, got " + std::to_string(n_in));
    }
}

static bool permutes_full(PermuteType permute) {
    return permute == PermuteType::full || permute == PermuteType::both;
}

static bool is_leaf(torch::Tensor const& t) {
    return num_channels(t) <= 4;
}

static torch::Tensor zero_logdet(torch::Tensor const& like) {
    return torch::zeros({}, like.options());
}

static std::vector<std::shared_ptr<CouplingBlock>> make_blocks(HintConfig const& config) {
    if (config.spatial_dims != 2 && config.spatial_dims != 3) {
        throw ConfigurationError(
            "HINT layer supports 2 or 3 spatial dims, got " + std::to_string(config.spatial_dims));
    }
    if (config.n_hidden < 1) {
        throw ConfigurationError(
            "HINT layer needs a positive hidden channel count, got " + std::to_string(config.n_hidden));
    }
    check_channel_count(config.n_in);

    std::vector<std::shared_ptr<CouplingBlock>> blocks;
    int64_t const depth = get_depth(config.n_in);
    for (int64_t j = 1; j <= depth; ++j) {
        auto block = std::make_shared<AffineCouplingBlock>(
            config.spatial_dims, config.n_in >> j, config.n_hidden, config.block);
        block->to(config.dtype);
        blocks.push_back(std::move(block));
    }
    return blocks;
}

static std::shared_ptr<ChannelPermutation> make_permutation(HintConfig const& config) {
    switch (config.permute) {
        case PermuteType::none:
            return nullptr;
        case PermuteType::lower:
            return std::make_shared<Conv1x1>(config.n_in / 2, config.dtype);
        case PermuteType::both:
        case PermuteType::full:
            return std::make_shared<Conv1x1>(config.n_in, config.dtype);
    }
    throw ConfigurationError("Unknown permutation type");
}

CouplingLayerHINT::CouplingLayerHINT(HintConfig const& config)
    : CouplingLayerHINT(
          make_blocks(config),
          make_permutation(config),
          config.spatial_dims,
          config.logdet,
          config.permute) {}

CouplingLayerHINT::CouplingLayerHINT(
    std::vector<std::shared_ptr<CouplingBlock>> blocks,
    std::shared_ptr<ChannelPermutation> permutation,
    int64_t spatial_dims,
    bool logdet,
    PermuteType permute)
    : InvertibleLayer(logdet),
      blocks_(std::move(blocks)),
      permutation_(std::move(permutation)),
      spatial_dims_(spatial_dims),
      n_in_(0),
      permute_(permute) {

    if (spatial_dims_ != 2 && spatial_dims_ != 3) {
        throw ConfigurationError(
            "HINT layer supports 2 or 3 spatial dims, got " + std::to_string(spatial_dims_));
    }
    if (blocks_.empty()) {
        throw ConfigurationError("HINT layer needs at least one coupling block");
    }
    for (auto const& block : blocks_) {
        if (!block) {
            throw ConfigurationError("HINT layer got a null coupling block");
        }
    }

    n_in_ = 2 * blocks_.front()->channels();
    check_channel_count(n_in_);
    if (get_depth(n_in_) != depth()) {
        throw ConfigurationError(
            "HINT layer over " + std::to_string(n_in_) + " channels needs " +
            std::to_string(get_depth(n_in_)) + " coupling blocks, got " + std::to_string(depth()));
    }
    for (int64_t j = 0; j < depth(); ++j) {
        int64_t const expected = n_in_ >> (j + 1);
        if (blocks_[j]->channels() != expected) {
            throw ConfigurationError(
                "coupling block " + std::to_string(j) + " must act on " + std::to_string(expected) +
                " channels per half, got " + std::to_string(blocks_[j]->channels()));
        }
    }

    if (permute_ == PermuteType::none) {
        if (permutation_) {
            throw ConfigurationError("permutation given but permutation type is none");
        }
    } else {
        int64_t const width = permute_ == PermuteType::lower ? n_in_ / 2 : n_in_;
        if (!permutation_) {
            throw ConfigurationError("permutation type " + to_string(permute_) + " needs a permutation");
        }
        if (permutation_->channels() != width) {
            throw ConfigurationError(
                "permutation type " + to_string(permute_) + " needs a permutation over " +
                std::to_string(width) + " channels, got " + std::to_string(permutation_->channels()));
        }
    }

    std::string widths;
    for (auto const& block : blocks_) {
        widths += (widths.empty() ? "" : ",") + std::to_string(block->channels());
    }
    LOG(INFO) << "CouplingLayerHINT: n_in=" << n_in_ << " depth=" << depth()
              << " block widths=[" << widths << "] spatial_dims=" << spatial_dims_
              << " permute=" << to_string(permute_) << " logdet=" << (logdet ? "true" : "false");
}

std::vector<torch::Tensor> CouplingLayerHINT::parameters() const {
    std::vector<torch::Tensor> params;
    for (auto const& block : blocks_) {
        auto p = block->parameters();
        params.insert(params.end(), p.begin(), p.end());
    }
    if (permutation_) {
        auto p = permutation_->parameters();
        params.insert(params.end(), p.begin(), p.end());
    }
    return params;
}

void CouplingLayerHINT::check_input(torch::Tensor const& t, char const* op) const {
    int64_t const rank = spatial_rank(t, op);
    if (rank != spatial_dims_ || num_channels(t) != n_in_) {
        throw ShapeError(
            std::string(op) + ": layer built for " + std::to_string(spatial_dims_) +
            " spatial dims and " + std::to_string(n_in_) + " channels, got shape " + shape_string(t));
    }
}

CouplingBlock const& CouplingLayerHINT::block_at(size_t scale, torch::Tensor const& t) const {
    if (scale >= blocks_.size()) {
        throw ShapeError(
            "input " + shape_string(t) + " recurses past the " + std::to_string(blocks_.size()) +
            " levels this layer was built with");
    }
    return *blocks_[scale];
}

FlowOutput CouplingLayerHINT::forward(torch::Tensor const& x, bool logdet) const {
    check_input(x, "HINT forward");
    auto out = forward_at(x, 0, logdet, permute_);
    if (!logdet) {
        out.logdet = {};
    }
    return out;
}

FlowOutput CouplingLayerHINT::inverse(torch::Tensor const& y, bool logdet) const {
    check_input(y, "HINT inverse");
    auto out = inverse_at(y, 0, logdet, permute_);
    if (!logdet) {
        out.logdet = {};
    }
    return out;
}

FlowGradients CouplingLayerHINT::backward(torch::Tensor const& grad_y, torch::Tensor const& y) const {
    check_input(y, "HINT backward");
    check_same_shape(grad_y, y, "grad_y", "y");
    return backward_at(grad_y, y, 0, permute_);
}

FlowGradients CouplingLayerHINT::backward_inverse(torch::Tensor const& grad_x, torch::Tensor const& x) const {
    check_input(x, "HINT backward_inverse");
    check_same_shape(grad_x, x, "grad_x", "x");
    return backward_inverse_at(grad_x, x, 0, permute_);
}

FlowOutput CouplingLayerHINT::forward_at(
    torch::Tensor const& x,
    size_t scale,
    bool logdet,
    PermuteType permute) const {

    auto input = permutes_full(permute) ? permutation_->forward(x) : x;
    auto [xa, xb] = tensor_split(input);
    if (permute == PermuteType::lower) {
        xb = permutation_->forward(xb);
    }

    auto const& block = block_at(scale, input);
    VLOG(2) << "HINT forward: level " << scale << " input " << shape_string(input)
            << (is_leaf(input) ? " leaf" : " internal");

    torch::Tensor ya, yb;
    auto ld = zero_logdet(input);
    if (is_leaf(input)) {
        auto out = block.forward(xa, xb, logdet);
        ya = xa;
        yb = out.second;
        if (logdet) ld = ld + out.logdet;
    } else {
        auto sub_a = forward_at(xa, scale + 1, logdet, PermuteType::none);
        auto sub_b = forward_at(xb, scale + 1, logdet, PermuteType::none);
        auto out = block.forward(xa, sub_b.tensor, logdet);
        ya = sub_a.tensor;
        yb = out.second;
        ld = ld + sub_a.logdet + sub_b.logdet;
        if (logdet) ld = ld + out.logdet;
    }

    auto y = tensor_cat(ya, yb);
    if (permute == PermuteType::both) {
        y = permutation_->inverse(y);
    }
    return {y, ld};
}

FlowOutput CouplingLayerHINT::inverse_at(
    torch::Tensor const& y,
    size_t scale,
    bool logdet,
    PermuteType permute) const {

    auto input = permute == PermuteType::both ? permutation_->forward(y) : y;
    auto [ya, yb] = tensor_split(input);

    auto const& block = block_at(scale, input);
    VLOG(2) << "HINT inverse: level " << scale << " input " << shape_string(input)
            << (is_leaf(input) ? " leaf" : " internal");

    torch::Tensor xa, xb;
    auto ld = zero_logdet(input);
    if (is_leaf(input)) {
        auto out = block.inverse(ya, yb, logdet);
        xa = ya;
        xb = out.second;
        if (logdet) ld = ld + out.logdet;
    } else {
        auto sub_a = inverse_at(ya, scale + 1, logdet, PermuteType::none);
        auto mid = block.inverse(sub_a.tensor, yb, logdet);
        auto sub_b = inverse_at(mid.second, scale + 1, logdet, PermuteType::none);
        xa = sub_a.tensor;
        xb = sub_b.tensor;
        ld = ld + sub_a.logdet + sub_b.logdet;
        if (logdet) ld = ld + mid.logdet;
    }

    if (permute == PermuteType::lower) {
        xb = permutation_->inverse(xb);
    }
    auto x = tensor_cat(xa, xb);
    if (permutes_full(permute)) {
        x = permutation_->inverse(x);
    }
    return {x, ld};
}

FlowGradients CouplingLayerHINT::backward_at(
    torch::Tensor const& grad_y,
    torch::Tensor const& y,
    size_t scale,
    PermuteType permute) const {

    auto grad = grad_y;
    auto out = y;
    if (permute == PermuteType::both) {
        auto g = permutation_->backward_inverse(grad, out);
        grad = g.grad;
        out = g.input;
    }
    auto [ya, yb] = tensor_split(out);
    auto [grad_ya, grad_yb] = tensor_split(grad);

    auto const& block = block_at(scale, out);
    VLOG(2) << "HINT backward: level " << scale << " output " << shape_string(out)
            << (is_leaf(out) ? " leaf" : " internal");

    torch::Tensor xa, xb, grad_xa, grad_xb;
    if (is_leaf(out)) {
        auto g = block.backward(torch::zeros_like(grad_ya), grad_yb, ya, yb, logdet());
        xa = ya;
        xb = g.second;
        grad_xa = grad_ya + g.grad_first;
        grad_xb = g.grad_second;
    } else {
        // The coupling block was conditioned on the original first half, so
        // that half has to be recovered before the block can be undone.
        auto sub_a = backward_at(grad_ya, ya, scale + 1, PermuteType::none);
        auto g = block.backward(torch::zeros_like(sub_a.grad), grad_yb, sub_a.input, yb, logdet());
        auto sub_b = backward_at(g.grad_second, g.second, scale + 1, PermuteType::none);
        xa = sub_a.input;
        xb = sub_b.input;
        grad_xa = sub_a.grad + g.grad_first;
        grad_xb = sub_b.grad;
    }

    if (permute == PermuteType::lower) {
        auto g = permutation_->backward(grad_xb, xb);
        grad_xb = g.grad;
        xb = g.input;
    }

    FlowGradients result{tensor_cat(grad_xa, grad_xb), tensor_cat(xa, xb)};
    if (permutes_full(permute)) {
        result = permutation_->backward(result.grad, result.input);
    }
    return result;
}

FlowGradients CouplingLayerHINT::backward_inverse_at(
    torch::Tensor const& grad_x,
    torch::Tensor const& x,
    size_t scale,
    PermuteType permute) const {

    auto grad = grad_x;
    auto in = x;
    if (permutes_full(permute)) {
        auto g = permutation_->backward_inverse(grad, in);
        grad = g.grad;
        in = g.input;
    }
    auto [xa, xb] = tensor_split(in);
    auto [grad_xa, grad_xb] = tensor_split(grad);
    if (permute == PermuteType::lower) {
        auto g = permutation_->backward_inverse(grad_xb, xb);
        grad_xb = g.grad;
        xb = g.input;
    }

    auto const& block = block_at(scale, in);
    VLOG(2) << "HINT backward_inverse: level " << scale << " input " << shape_string(in)
            << (is_leaf(in) ? " leaf" : " internal");

    torch::Tensor ya, yb, grad_ya, grad_yb;
    if (is_leaf(in)) {
        auto g = block.backward_inverse(torch::zeros_like(grad_xa), grad_xb, xa, xb, logdet());
        ya = xa;
        yb = g.second;
        grad_ya = grad_xa + g.grad_first;
        grad_yb = g.grad_second;
    } else {
        auto sub_b = backward_inverse_at(grad_xb, xb, scale + 1, PermuteType::none);
        auto g = block.backward_inverse(torch::zeros_like(grad_xa), sub_b.grad, xa, sub_b.input, logdet());
        auto sub_a = backward_inverse_at(grad_xa + g.grad_first, xa, scale + 1, PermuteType::none);
        ya = sub_a.input;
        yb = g.second;
        grad_ya = sub_a.grad;
        grad_yb = g.grad_second;
    }

    FlowGradients result{tensor_cat(grad_ya, grad_yb), tensor_cat(ya, yb)};
    if (permute == PermuteType::both) {
        result = permutation_->backward(result.grad, result.input);
    }
    return result;
}
