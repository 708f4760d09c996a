#include "haar_lifting.hpp"

#include "errors.hpp"
#include "tensor_util.hpp"

#include <cmath>
#include <string>

static void check_lifting_axis(torch::Tensor const& x, int64_t axis) {
    int64_t const rank = spatial_rank(x, "Haar lifting input");
    if (axis < 0 || axis >= rank) {
        throw ShapeError(
            "Haar lifting axis must be a spatial axis in [0, " + std::to_string(rank) +
            "), got " + std::to_string(axis));
    }
}

std::pair<torch::Tensor, torch::Tensor> haar_lift(
    torch::Tensor const& x,
    int64_t axis) {

    check_lifting_axis(x, axis);
    int64_t const n = x.size(axis);
    if (n % 2 != 0) {
        throw ShapeError(
            "Haar lifting needs an even extent along axis " + std::to_string(axis) +
            ", got shape " + shape_string(x));
    }

    double const sqrt2 = std::sqrt(2.0);

    // Strided slices are views of x; every step below allocates.
    auto low = x.slice(axis, 1, n, 2);
    auto high = x.slice(axis, 0, n, 2);

    high = high - low;           // predict
    low = low + high / 2.0;      // update
    high = high / sqrt2;         // normalize
    low = low * sqrt2;

    return {low, high};
}

torch::Tensor inv_haar_lift(
    torch::Tensor const& low_in,
    torch::Tensor const& high_in,
    int64_t axis) {

    check_lifting_axis(low_in, axis);
    check_same_shape(low_in, high_in, "Haar low band", "Haar high band");

    double const sqrt2 = std::sqrt(2.0);

    auto high = high_in * sqrt2;  // inverse normalize
    auto low = low_in / sqrt2;
    low = low - high / 2.0;       // inverse update
    high = low + high;            // inverse predict

    auto sizes = low.sizes().vec();
    sizes[axis] *= 2;
    auto x = torch::empty(sizes, low.options());
    x.slice(axis, 1, sizes[axis], 2).copy_(low);
    x.slice(axis, 0, sizes[axis], 2).copy_(high);
    return x;
}

torch::Tensor haar_squeeze(torch::Tensor const& x) {
    int64_t const rank = spatial_rank(x, "haar_squeeze input");
    int64_t const ch = channel_dim(x);

    auto [low, high] = haar_lift(x, 1);
    auto [a, h] = haar_lift(low, 0);
    auto [v, d] = haar_lift(high, 0);

    if (rank == 2) {
        return torch::cat({a, v, h, d}, ch);
    }

    auto [al, ah] = haar_lift(a, 2);
    auto [vl, vh] = haar_lift(v, 2);
    auto [hl, hh] = haar_lift(h, 2);
    auto [dl, dh] = haar_lift(d, 2);
    return torch::cat({ah, al, vh, vl, hh, hl, dh, dl}, ch);
}

torch::Tensor inv_haar_unsqueeze(torch::Tensor const& y) {
    int64_t const rank = spatial_rank(y, "inv_haar_unsqueeze input");
    int64_t const ch = channel_dim(y);
    int64_t const groups = 1LL << rank;
    int64_t const channels = num_channels(y);
    if (channels % groups != 0) {
        throw ShapeError(
            "inv_haar_unsqueeze needs a channel count divisible by " + std::to_string(groups) +
            ", got shape " + shape_string(y));
    }
    int64_t const c = channels / groups;
    auto band = [&](int64_t i) { return y.narrow(ch, i * c, c); };

    torch::Tensor a, v, h, d;
    if (rank == 2) {
        a = band(0);
        v = band(1);
        h = band(2);
        d = band(3);
    } else {
        a = inv_haar_lift(band(1), band(0), 2);
        v = inv_haar_lift(band(3), band(2), 2);
        h = inv_haar_lift(band(5), band(4), 2);
        d = inv_haar_lift(band(7), band(6), 2);
    }

    auto low = inv_haar_lift(a, h, 0);
    auto high = inv_haar_lift(v, d, 0);
    return inv_haar_lift(low, high, 1);
}
