#include "coupling_layer_hint.hpp"

#include <torch/torch.h>
#include <iostream>

int main() {
    std::cout << "LibTorch version: " << TORCH_VERSION << std::endl;
    std::cout << "CUDA available:   " << (torch::cuda::is_available() ? "yes" : "no") << std::endl;

    CouplingLayerHINT layer(HintConfig{
        .spatial_dims = 2,
        .n_in = 16,
        .n_hidden = 8,
        .logdet = true,
        .permute = PermuteType::both,
    });

    auto x = torch::randn({8, 8, 16, 2});
    auto y = layer.forward(x);
    auto x_back = layer.inverse(y.tensor);

    std::cout << "HINT depth:       " << layer.depth() << std::endl;
    std::cout << "logdet:           " << y.logdet.item<float>() << std::endl;
    std::cout << "round-trip error: " << (x_back.tensor - x).abs().max().item<float>() << std::endl;
    return 0;
}
