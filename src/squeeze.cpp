#include "squeeze.hpp"

#include "errors.hpp"
#include "tensor_util.hpp"

#include <vector>

SqueezePattern parse_squeeze_pattern(std::string const& name) {
    if (name == "column") return SqueezePattern::column;
    if (name == "patch") return SqueezePattern::patch;
    if (name == "checkerboard") return SqueezePattern::checkerboard;
    throw UnsupportedPatternError("Unknown squeeze pattern: " + name);
}

std::string to_string(SqueezePattern pattern) {
    switch (pattern) {
        case SqueezePattern::column: return "column";
        case SqueezePattern::patch: return "patch";
        case SqueezePattern::checkerboard: return "checkerboard";
    }
    return "unknown";
}

/// Number of channel groups produced per input channel: 2^rank.
static int64_t num_groups(int64_t rank) {
    return 1LL << rank;
}

static void check_pattern_supported(SqueezePattern pattern, int64_t rank) {
    if (pattern == SqueezePattern::checkerboard && rank == 3) {
        throw UnsupportedPatternError("checkerboard squeeze is not defined for 3-D (5-D tensor) inputs");
    }
}

/// View of the spatial sub-lattice that feeds channel group `group`.
/// `fine` has full spatial resolution; bit d of `group` selects the upper
/// half (patch) or the odd positions (checkerboard) along spatial axis d.
static torch::Tensor group_view(
    torch::Tensor const& fine,
    int64_t rank,
    int64_t group,
    SqueezePattern pattern) {

    auto view = fine;
    for (int64_t d = 0; d < rank; ++d) {
        int64_t const half = fine.size(d) / 2;
        int64_t const bit = (group >> d) & 1;
        if (pattern == SqueezePattern::patch) {
            view = view.narrow(d, bit * half, half);
        } else {
            view = view.slice(d, bit, fine.size(d), 2);
        }
    }
    return view;
}

torch::Tensor squeeze(torch::Tensor const& x, SqueezePattern pattern) {
    int64_t const rank = spatial_rank(x, "squeeze input");
    check_pattern_supported(pattern, rank);

    for (int64_t d = 0; d < rank; ++d) {
        if (x.size(d) % 2 != 0) {
            throw ShapeError("squeeze needs even spatial dimensions, got shape " + shape_string(x));
        }
    }

    int64_t const groups = num_groups(rank);
    int64_t const channels = num_channels(x);

    if (pattern == SqueezePattern::column) {
        std::vector<int64_t> shape;
        for (int64_t d = 0; d < rank; ++d) {
            shape.push_back(x.size(d) / 2);
        }
        shape.push_back(channels * groups);
        shape.push_back(x.size(-1));
        return x.reshape(shape);
    }

    std::vector<torch::Tensor> blocks;
    blocks.reserve(groups);
    for (int64_t g = 0; g < groups; ++g) {
        blocks.push_back(group_view(x, rank, g, pattern));
    }
    return torch::cat(blocks, channel_dim(x));
}

torch::Tensor unsqueeze(torch::Tensor const& y, SqueezePattern pattern) {
    int64_t const rank = spatial_rank(y, "unsqueeze input");
    check_pattern_supported(pattern, rank);

    int64_t const groups = num_groups(rank);
    int64_t const channels = num_channels(y);
    if (channels % groups != 0) {
        throw ShapeError(
            "unsqueeze needs a channel count divisible by " + std::to_string(groups) +
            ", got shape " + shape_string(y));
    }
    int64_t const channels_out = channels / groups;

    std::vector<int64_t> shape;
    for (int64_t d = 0; d < rank; ++d) {
        shape.push_back(y.size(d) * 2);
    }
    shape.push_back(channels_out);
    shape.push_back(y.size(-1));

    if (pattern == SqueezePattern::column) {
        return y.reshape(shape);
    }

    auto x = torch::empty(shape, y.options());
    for (int64_t g = 0; g < groups; ++g) {
        group_view(x, rank, g, pattern)
            .copy_(y.narrow(channel_dim(y), g * channels_out, channels_out));
    }
    return x;
}

std::pair<torch::Tensor, torch::Tensor> unsqueeze(
    torch::Tensor const& first,
    torch::Tensor const& second,
    SqueezePattern pattern) {
    return {unsqueeze(first, pattern), unsqueeze(second, pattern)};
}
