#ifndef PASTICHE_LOSS_COMPOSER_HPP
#define PASTICHE_LOSS_COMPOSER_HPP

#include <cmath>
#include <stdexcept>
#include <string>

#include <torch/torch.h>

#include "../../common/types.hpp"
#include "perceptual.hpp"
#include "total_variation.hpp"

namespace Pastiche::Loss::Details {

    struct LossWeights {
        double content_weight{1e4};
        double style_weight{1e-2};
        double tv_weight{1.0};

        void validate() const {
            auto check = [](double value, const char* name) {
                if (!std::isfinite(value) || value <= 0.0) {
                    throw std::invalid_argument(std::string("Loss weight '") + name + "' must be a positive finite number.");
                }
            };
            check(content_weight, "content_weight");
            check(style_weight, "style_weight");
            check(tv_weight, "tv_weight");
        }
    };

    // Image the total-variation term is measured on. `Input` regularises the raw
    // batch fed to the transformer; `Stylized` measures the transformer output.
    enum class TvTarget { Input, Stylized };

    // All four terms already carry their weights; `total` is their sum.
    struct LossBreakdown {
        torch::Tensor style{};
        torch::Tensor content{};
        torch::Tensor tv{};
        torch::Tensor total{};
    };

    inline LossBreakdown compose(const FeatureBundle& outputs,
                                 const FeatureBundle& transformed_outputs,
                                 const NamedTensors& style_targets,
                                 const torch::Tensor& tv_image,
                                 const LossWeights& weights)
    {
        const auto num_style_layers = static_cast<double>(style_targets.size());
        const auto num_content_layers = static_cast<double>(outputs.content.size());

        LossBreakdown losses{};
        losses.style = style_loss(transformed_outputs.style, style_targets);
        losses.content = content_loss(transformed_outputs.content, outputs.content);
        losses.tv = total_variation_loss(tv_image);

        losses.style = losses.style * (weights.style_weight / num_style_layers);
        losses.content = losses.content * (weights.content_weight / num_content_layers);
        losses.tv = losses.tv * weights.tv_weight;
        losses.total = losses.style + losses.content + losses.tv;
        return losses;
    }

}

#endif // PASTICHE_LOSS_COMPOSER_HPP
