#ifndef PASTICHE_OPTIMIZER_REGISTRY_HPP
#define PASTICHE_OPTIMIZER_REGISTRY_HPP


#include <memory>
#include <stdexcept>
#include <utility>
#include <vector>

#include <torch/torch.h>

#include "details/adam.hpp"

namespace Pastiche::Optimizer::Details {
    template <class Descriptor>
    std::unique_ptr<torch::optim::Optimizer> build_optimizer(std::vector<torch::Tensor>, const Descriptor&) {
        static_assert(sizeof(Descriptor) == 0, "Unsupported optimizer descriptor provided to build_optimizer.");
        return nullptr;
    }

    inline std::unique_ptr<torch::optim::Optimizer> build_optimizer(std::vector<torch::Tensor> parameters, const AdamDescriptor& descriptor) {
        descriptor.options.validate();
        if (parameters.empty()) {
            throw std::invalid_argument("Optimizer requires at least one trainable parameter.");
        }
        auto options = to_torch_options(descriptor.options);
        return std::make_unique<torch::optim::Adam>(std::move(parameters), options);
    }
}

#endif // PASTICHE_OPTIMIZER_REGISTRY_HPP
