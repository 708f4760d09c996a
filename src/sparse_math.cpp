#include "sparse_math.hpp"

#include "errors.hpp"
#include "tensor_util.hpp"

#include <string>
#include <vector>

/// Collect the (row, col, tap) triplets of the square sameshift convolution
/// matrix.
static torch::Tensor build_conv_triplets(torch::Tensor const& filter, int64_t input_length) {
    if (filter.dim() != 1 || filter.size(0) == 0) {
        throw ConfigurationError("convolution filter must be a non-empty 1-D tensor");
    }
    if (input_length < 1) {
        throw ConfigurationError("invalid conv matrix length " + std::to_string(input_length));
    }

    int64_t const filter_len = filter.size(0);

    // Sameshift centering: the center tap sits on the diagonal. Positions that
    // would fall outside [0, input_length) are dropped.
    int64_t const start_row = filter_len / 2 - 1 + filter_len % 2;

    std::vector<int64_t> rows;
    std::vector<int64_t> cols;
    std::vector<int64_t> taps;
    for (int64_t col = 0; col < input_length; ++col) {
        for (int64_t tap = 0; tap < filter_len; ++tap) {
            int64_t const row = tap + col - start_row;
            if (row < 0 || row >= input_length) {
                continue;
            }
            rows.push_back(row);
            cols.push_back(col);
            taps.push_back(tap);
        }
    }

    auto const long_opts = long_opts_like(filter);
    return torch::stack({
        torch::tensor(rows, long_opts),
        torch::tensor(cols, long_opts),
        torch::tensor(taps, long_opts)});
}

torch::Tensor construct_conv_matrix(
    torch::Tensor const& filter,
    int64_t input_length) {

    auto triplets = build_conv_triplets(filter, input_length);
    auto values = filter.index({triplets[2]});
    return torch::sparse_coo_tensor(
        triplets.slice(0, 0, 2), values, {input_length, input_length}, sparse_opts(filter)).coalesce();
}

torch::Tensor construct_strided_conv_matrix(
    torch::Tensor const& filter,
    int64_t input_length,
    int64_t stride) {

    if (stride < 1) {
        throw ConfigurationError("invalid conv matrix stride " + std::to_string(stride));
    }
    auto conv_matrix = construct_conv_matrix(filter, input_length);

    // Row 1 is the first valid center-aligned output position.
    auto select_rows = torch::arange(1, input_length, stride, long_opts_like(filter));
    return conv_matrix.index_select(0, select_rows).coalesce();
}

torch::Tensor apply_matrix_along_axis(
    torch::Tensor const& matrix,
    torch::Tensor const& data,
    int64_t axis) {

    if (data.size(axis) != matrix.size(1)) {
        throw ShapeError(
            "matrix with " + std::to_string(matrix.size(1)) + " columns cannot act on axis " +
            std::to_string(axis) + " of shape " + shape_string(data));
    }

    // Sparse mm acts on the leading dim: move `axis` to the front and fold
    // every other axis into the column count.
    auto moved = torch::movedim(data, axis, 0);
    auto const moved_shape = moved.sizes().vec();
    auto columns = moved.reshape({moved_shape[0], -1});

    auto result = torch::mm(matrix, columns);

    auto result_shape = moved_shape;
    result_shape[0] = matrix.size(0);
    return torch::movedim(result.reshape(result_shape), 0, axis).contiguous();
}
