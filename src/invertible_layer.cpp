#include "invertible_layer.hpp"

#include "errors.hpp"

#include <utility>

void InvertibleLayer::clear_grad() const {
    for (auto const& p : parameters()) {
        if (p.grad().defined()) {
            p.grad().detach_();
            p.grad().zero_();
        }
    }
}

ReversedLayer::ReversedLayer(std::shared_ptr<InvertibleLayer> layer)
    : InvertibleLayer(layer ? layer->logdet() : false),
      layer_(std::move(layer)) {
    if (!layer_) {
        throw ConfigurationError("cannot reverse a null layer");
    }
}

FlowOutput ReversedLayer::forward(torch::Tensor const& x, bool logdet) const {
    return layer_->inverse(x, logdet);
}

FlowOutput ReversedLayer::inverse(torch::Tensor const& y, bool logdet) const {
    return layer_->forward(y, logdet);
}

FlowGradients ReversedLayer::backward(torch::Tensor const& grad_y, torch::Tensor const& y) const {
    return layer_->backward_inverse(grad_y, y);
}

FlowGradients ReversedLayer::backward_inverse(torch::Tensor const& grad_x, torch::Tensor const& x) const {
    return layer_->backward(grad_x, x);
}

std::shared_ptr<InvertibleLayer> reverse(std::shared_ptr<InvertibleLayer> const& layer) {
    if (!layer) {
        throw ConfigurationError("cannot reverse a null layer");
    }
    if (auto const* reversed = dynamic_cast<ReversedLayer const*>(layer.get())) {
        return reversed->layer();
    }
    return std::make_shared<ReversedLayer>(layer);
}
