#ifndef PASTICHE_LOSS_HPP
#define PASTICHE_LOSS_HPP
// This file is a factory, must exempt it from any logical-code. For functions look into "/details"
#include <string>
#include <stdexcept>

#include "details/reduction.hpp"
#include "details/perceptual.hpp"
#include "details/total_variation.hpp"
#include "details/composer.hpp"

namespace Pastiche::Loss {
    using Reduction = Details::Reduction;
    using LossWeights = Details::LossWeights;
    using LossBreakdown = Details::LossBreakdown;
    using TvTarget = Details::TvTarget;

    using Details::compose;
    using Details::content_loss;
    using Details::squared_error;
    using Details::style_loss;
    using Details::total_variation_loss;

    [[nodiscard]] inline auto ParseTvTarget(const std::string& value) -> TvTarget {
        if (value == "input") {
            return TvTarget::Input;
        }
        if (value == "stylized") {
            return TvTarget::Stylized;
        }
        throw std::invalid_argument("Unknown total variation target '" + value + "' (expected 'input' or 'stylized').");
    }

    [[nodiscard]] inline auto ToString(TvTarget target) -> std::string {
        return target == TvTarget::Stylized ? "stylized" : "input";
    }
}

#endif //PASTICHE_LOSS_HPP
