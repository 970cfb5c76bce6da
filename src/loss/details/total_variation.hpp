#ifndef PASTICHE_LOSS_TOTAL_VARIATION_HPP
#define PASTICHE_LOSS_TOTAL_VARIATION_HPP

#include <utility>

#include <torch/torch.h>

#include "../../common/types.hpp"

namespace Pastiche::Loss::Details {

    // Neighbour differences of an NHWC batch along width (x) and height (y).
    inline std::pair<torch::Tensor, torch::Tensor> high_pass_x_y(const torch::Tensor& image)
    {
        using torch::indexing::None;
        using torch::indexing::Slice;

        auto x_var = image.index({Slice(), Slice(), Slice(1, None), Slice()})
                   - image.index({Slice(), Slice(), Slice(None, -1), Slice()});
        auto y_var = image.index({Slice(), Slice(1, None), Slice(), Slice()})
                   - image.index({Slice(), Slice(None, -1), Slice(), Slice()});
        return {std::move(x_var), std::move(y_var)};
    }

    inline torch::Tensor total_variation_loss(const torch::Tensor& image)
    {
        Common::check_image_batch(image, "Total variation loss");
        if (image.size(1) < 2 || image.size(2) < 2) {
            throw std::invalid_argument("Total variation loss needs at least 2x2 pixels but received "
                                        + Common::format_shape(image) + ".");
        }
        auto [x_deltas, y_deltas] = high_pass_x_y(image);
        return x_deltas.pow(2).mean() + y_deltas.pow(2).mean();
    }

}

#endif // PASTICHE_LOSS_TOTAL_VARIATION_HPP
