#include "coupling_layer_hint.hpp"
#include "haar_lifting.hpp"
#include "squeeze.hpp"
#include "tensor_split.hpp"
#include "wavelet_squeeze.hpp"

#include <torch/extension.h>
#include <pybind11/stl.h>

#include <optional>
#include <utility>

namespace {

using TensorPair = std::pair<torch::Tensor, torch::Tensor>;
using FlowTuple = std::pair<torch::Tensor, std::optional<torch::Tensor>>;

FlowTuple to_tuple(FlowOutput const& out) {
    if (out.has_logdet()) {
        return {out.tensor, out.logdet};
    }
    return {out.tensor, std::nullopt};
}

TensorPair to_pair(FlowGradients const& g) {
    return {g.grad, g.input};
}

torch::Tensor squeeze_wrapper(torch::Tensor const& x, std::string const& pattern) {
    return squeeze(x, parse_squeeze_pattern(pattern));
}

torch::Tensor unsqueeze_wrapper(torch::Tensor const& y, std::string const& pattern) {
    return unsqueeze(y, parse_squeeze_pattern(pattern));
}

torch::Tensor wavelet_squeeze_wrapper(torch::Tensor const& x, std::string const& wavelet_name) {
    return wavelet_squeeze(x, make_wavelet(wavelet_name));
}

torch::Tensor wavelet_unsqueeze_wrapper(torch::Tensor const& y, std::string const& wavelet_name) {
    return wavelet_unsqueeze(y, make_wavelet(wavelet_name));
}

std::shared_ptr<CouplingLayerHINT> make_hint(
    int64_t n_in,
    int64_t n_hidden,
    int64_t spatial_dims,
    int64_t batch_size,
    bool logdet,
    std::string const& permute,
    int64_t k1, int64_t k2,
    int64_t p1, int64_t p2,
    int64_t s1, int64_t s2,
    bool double_precision) {
    return std::make_shared<CouplingLayerHINT>(HintConfig{
        .spatial_dims = spatial_dims,
        .n_in = n_in,
        .n_hidden = n_hidden,
        .batch_size = batch_size,
        .logdet = logdet,
        .permute = parse_permute_type(permute),
        .block = {.k1 = k1, .k2 = k2, .p1 = p1, .p2 = p2, .s1 = s1, .s2 = s2},
        .dtype = double_precision ? torch::kFloat64 : torch::kFloat32,
    });
}

}  // namespace

PYBIND11_MODULE(hintflow, m) {
    m.doc() = "Hierarchical invertible neural transport (HINT) layers on LibTorch";

    m.def("tensor_split",
          [](torch::Tensor const& x, std::optional<int64_t> split_index) {
              return split_index ? tensor_split_at(x, *split_index) : tensor_split(x);
          },
          "Split along the channel axis, into halves unless split_index is given",
          py::arg("x"),
          py::arg("split_index") = std::nullopt);

    m.def("tensor_cat", [](torch::Tensor const& a, torch::Tensor const& b) { return tensor_cat(a, b); },
          "Concatenate along the channel axis",
          py::arg("a"), py::arg("b"));

    m.def("squeeze", &squeeze_wrapper,
          "Halve every spatial axis, multiplying the channel count by 2^rank",
          py::arg("x"),
          py::arg("pattern") = "column");

    m.def("unsqueeze", &unsqueeze_wrapper,
          "Inverse of squeeze",
          py::arg("y"),
          py::arg("pattern") = "column");

    m.def("haar_squeeze", &haar_squeeze,
          "One-level Haar transform by lifting, sub-bands stored as channels",
          py::arg("x"));

    m.def("inv_haar_unsqueeze", &inv_haar_unsqueeze,
          "Inverse of haar_squeeze",
          py::arg("y"));

    m.def("wavelet_squeeze", &wavelet_squeeze_wrapper,
          "One-level filter-bank wavelet transform, sub-bands stored as channels",
          py::arg("x"),
          py::arg("wavelet_name") = "haar");

    m.def("wavelet_unsqueeze", &wavelet_unsqueeze_wrapper,
          "Inverse of wavelet_squeeze",
          py::arg("y"),
          py::arg("wavelet_name") = "haar");

    m.def("get_depth", &get_depth,
          "Number of recursion levels of a HINT layer",
          py::arg("n_in"));

    py::class_<InvertibleLayer, std::shared_ptr<InvertibleLayer>>(m, "InvertibleLayer")
        .def("forward",
             [](InvertibleLayer const& self, torch::Tensor const& x, std::optional<bool> logdet) {
                 return to_tuple(logdet ? self.forward(x, *logdet) : self.forward(x));
             },
             py::arg("x"), py::arg("logdet") = std::nullopt)
        .def("inverse",
             [](InvertibleLayer const& self, torch::Tensor const& y, bool logdet) {
                 return to_tuple(self.inverse(y, logdet));
             },
             py::arg("y"), py::arg("logdet") = false)
        .def("backward",
             [](InvertibleLayer const& self, torch::Tensor const& grad_y, torch::Tensor const& y) {
                 return to_pair(self.backward(grad_y, y));
             },
             py::arg("grad_y"), py::arg("y"))
        .def("backward_inverse",
             [](InvertibleLayer const& self, torch::Tensor const& grad_x, torch::Tensor const& x) {
                 return to_pair(self.backward_inverse(grad_x, x));
             },
             py::arg("grad_x"), py::arg("x"))
        .def("parameters", &InvertibleLayer::parameters)
        .def("clear_grad", &InvertibleLayer::clear_grad)
        .def_property_readonly("logdet", &InvertibleLayer::logdet)
        .def_property_readonly("is_reversed", &InvertibleLayer::is_reversed);

    py::class_<CouplingLayerHINT, InvertibleLayer, std::shared_ptr<CouplingLayerHINT>>(m, "CouplingLayerHINT")
        .def(py::init(&make_hint),
             py::arg("n_in"),
             py::arg("n_hidden"),
             py::arg("spatial_dims") = 2,
             py::arg("batch_size") = 1,
             py::arg("logdet") = false,
             py::arg("permute") = "none",
             py::arg("k1") = 3, py::arg("k2") = 3,
             py::arg("p1") = 1, py::arg("p2") = 1,
             py::arg("s1") = 1, py::arg("s2") = 1,
             py::arg("double_precision") = false)
        .def_property_readonly("depth", &CouplingLayerHINT::depth)
        .def_property_readonly("n_in", &CouplingLayerHINT::n_in)
        .def_property_readonly("permute", [](CouplingLayerHINT const& self) {
            return to_string(self.permute_type());
        });

    m.def("reverse", &reverse,
          "View of a layer with forward and inverse swapped",
          py::arg("layer"));
}
