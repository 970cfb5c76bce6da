#ifndef PASTICHE_ADAM_HPP
#define PASTICHE_ADAM_HPP
// Adam options for the transformer optimizer. Defaults follow the fast style
// transfer recipe: a slow first moment (beta1 = 0.99) and a large epsilon.

#include <cmath>
#include <stdexcept>
#include <tuple>
#include <torch/torch.h>

namespace Pastiche::Optimizer::Details {

    struct AdamOptions {
        double learning_rate{1e-3};
        double beta1{0.99};
        double beta2{0.999};
        double eps{1e-1};
        double weight_decay{0.0};
        bool amsgrad{false};

        void validate() const {
            if (!std::isfinite(learning_rate) || learning_rate <= 0.0) {
                throw std::invalid_argument("Adam learning rate must be a positive finite number.");
            }
            if (beta1 < 0.0 || beta1 >= 1.0 || beta2 < 0.0 || beta2 >= 1.0) {
                throw std::invalid_argument("Adam betas must lie in [0, 1).");
            }
            if (eps <= 0.0) {
                throw std::invalid_argument("Adam epsilon must be positive.");
            }
            if (weight_decay < 0.0) {
                throw std::invalid_argument("Adam weight decay must be non-negative.");
            }
        }
    };

    struct AdamDescriptor {
        AdamOptions options{};
    };

    inline torch::optim::AdamOptions to_torch_options(const AdamOptions& options) {
        torch::optim::AdamOptions torch_options(options.learning_rate);
        torch_options = torch_options.betas(std::make_tuple(options.beta1, options.beta2));
        torch_options = torch_options.eps(options.eps);
        torch_options = torch_options.weight_decay(options.weight_decay);
        torch_options = torch_options.amsgrad(options.amsgrad);
        return torch_options;
    }

}

#endif // PASTICHE_ADAM_HPP
