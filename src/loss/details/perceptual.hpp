#ifndef PASTICHE_LOSS_PERCEPTUAL_HPP
#define PASTICHE_LOSS_PERCEPTUAL_HPP

#include <stdexcept>
#include <string>

#include <torch/torch.h>

#include "../../common/types.hpp"
#include "reduction.hpp"

namespace Pastiche::Loss::Details {

    inline void require_same_layers(const NamedTensors& produced,
                                    const NamedTensors& reference,
                                    const std::string& context)
    {
        bool same = produced.size() == reference.size();
        if (same) {
            auto lhs = produced.begin();
            auto rhs = reference.begin();
            for (; lhs != produced.end(); ++lhs, ++rhs) {
                if (lhs->first != rhs->first) {
                    same = false;
                    break;
                }
            }
        }
        if (!same) {
            throw std::invalid_argument(context + " layer mismatch: produced {"
                                        + Common::join(Common::keys_of(produced)) + "} but reference holds {"
                                        + Common::join(Common::keys_of(reference)) + "}.");
        }
        if (produced.empty()) {
            throw std::invalid_argument(context + " requires at least one layer.");
        }
    }

    // Sum over layers of mean((produced[name] - reference[name])^2).
    inline torch::Tensor layerwise_squared_error(const NamedTensors& produced,
                                                 const NamedTensors& reference,
                                                 const std::string& context)
    {
        require_same_layers(produced, reference, context);

        torch::Tensor total;
        for (const auto& [name, activation] : produced) {
            const auto& target = reference.at(name);
            if (!activation.defined() || !target.defined()) {
                throw std::invalid_argument(context + " layer '" + name + "' holds an undefined tensor.");
            }
            auto term = squared_error(activation, target, Reduction::Mean);
            total = total.defined() ? total + term : term;
        }
        return total;
    }

    // Stylized features against the precomputed style target.
    inline torch::Tensor style_loss(const NamedTensors& transformed_style, const NamedTensors& style_targets)
    {
        return layerwise_squared_error(transformed_style, style_targets, "Style loss");
    }

    // Stylized features against the features of the unstylized input batch.
    inline torch::Tensor content_loss(const NamedTensors& transformed_content, const NamedTensors& content_outputs)
    {
        return layerwise_squared_error(transformed_content, content_outputs, "Content loss");
    }

}

#endif // PASTICHE_LOSS_PERCEPTUAL_HPP
