#pragma once

#include <torch/torch.h>

#include "conv1x1.hpp"
#include "coupling_block.hpp"
#include "hint_config.hpp"
#include "invertible_layer.hpp"

#include <memory>
#include <vector>

/// Number of recursion levels of a HINT layer over n_in channels: halve n_in
/// while it is greater than 4, counting the halvings, plus one.
int64_t get_depth(int64_t n_in);

/// Recursive hierarchical invertible coupling layer (HINT, Kruse et al. 2020).
///
/// The channels are split in half; both halves are transformed recursively
/// and the coupling block of the current level then transforms the second
/// result conditioned on the first half of the input. Recursion stops once
/// a tensor has at most 4 channels. Coupling block j (0-based) acts on
/// n_in / 2^(j+1) channels per half, so one block exists per level.
///
/// The optional permutation is applied at the outermost level only.
class CouplingLayerHINT : public InvertibleLayer {
public:
    explicit CouplingLayerHINT(HintConfig const& config);

    /// Assemble a layer from existing blocks, ordered from the root level
    /// down. `permutation` must be null iff `permute` is PermuteType::none.
    CouplingLayerHINT(
        std::vector<std::shared_ptr<CouplingBlock>> blocks,
        std::shared_ptr<ChannelPermutation> permutation,
        int64_t spatial_dims,
        bool logdet,
        PermuteType permute);

    using InvertibleLayer::forward;
    using InvertibleLayer::inverse;

    FlowOutput forward(torch::Tensor const& x, bool logdet) const override;
    FlowOutput inverse(torch::Tensor const& y, bool logdet) const override;

    FlowGradients backward(torch::Tensor const& grad_y, torch::Tensor const& y) const override;
    FlowGradients backward_inverse(torch::Tensor const& grad_x, torch::Tensor const& x) const override;

    /// Coupling block parameters from the root level down, then the
    /// permutation parameters.
    std::vector<torch::Tensor> parameters() const override;

    int64_t depth() const { return static_cast<int64_t>(blocks_.size()); }
    int64_t n_in() const { return n_in_; }
    int64_t spatial_dims() const { return spatial_dims_; }
    PermuteType permute_type() const { return permute_; }

    std::vector<std::shared_ptr<CouplingBlock>> const& blocks() const { return blocks_; }
    std::shared_ptr<ChannelPermutation> const& permutation() const { return permutation_; }

private:
    // Recursive traversals. `scale` indexes blocks_; the log-determinant is
    // always carried (zero when not requested) so subtrees can be summed.
    FlowOutput forward_at(torch::Tensor const& x, size_t scale, bool logdet, PermuteType permute) const;
    FlowOutput inverse_at(torch::Tensor const& y, size_t scale, bool logdet, PermuteType permute) const;
    FlowGradients backward_at(
        torch::Tensor const& grad_y, torch::Tensor const& y, size_t scale, PermuteType permute) const;
    FlowGradients backward_inverse_at(
        torch::Tensor const& grad_x, torch::Tensor const& x, size_t scale, PermuteType permute) const;

    CouplingBlock const& block_at(size_t scale, torch::Tensor const& t) const;
    void check_input(torch::Tensor const& t, char const* op) const;

    std::vector<std::shared_ptr<CouplingBlock>> blocks_;
    std::shared_ptr<ChannelPermutation> permutation_;
    int64_t spatial_dims_;
    int64_t n_in_;
    PermuteType permute_;
};
