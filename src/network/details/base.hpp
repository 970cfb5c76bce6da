#ifndef PASTICHE_NETWORK_BASE_HPP
#define PASTICHE_NETWORK_BASE_HPP

#include <string>
#include <vector>

#include <torch/torch.h>

#include "../../common/types.hpp"

namespace Pastiche::Network::Details {

    // Image-to-image network whose parameters are trained. Input and output
    // are (batch, height, width, 3) tensors in [0, 255] of identical shape.
    class StyleTransformer : public torch::nn::Module {
    public:
        StyleTransformer() = default;
        ~StyleTransformer() override = default;

        virtual torch::Tensor forward(const torch::Tensor& images) = 0;
    };

    // Frozen perceptual oracle. The layer name sets never change for a given
    // instance, so every bundle it returns has the same keys.
    class FeatureExtractor : public torch::nn::Module {
    public:
        FeatureExtractor() = default;
        ~FeatureExtractor() override = default;

        virtual FeatureBundle extract(const torch::Tensor& images) = 0;

        [[nodiscard]] virtual std::vector<std::string> style_layers() const = 0;
        [[nodiscard]] virtual std::vector<std::string> content_layers() const = 0;

        void freeze() {
            for (auto& parameter : this->parameters(/*recurse=*/true)) {
                parameter.set_requires_grad(false);
            }
            this->eval();
        }
    };

    // Channel Gram matrix of an NCHW activation, normalised by spatial positions.
    inline torch::Tensor gram_matrix(const torch::Tensor& features)
    {
        const auto batch = features.size(0);
        const auto channels = features.size(1);
        const auto locations = features.size(2) * features.size(3);
        auto flat = features.reshape({batch, channels, locations});
        return torch::bmm(flat, flat.transpose(1, 2)) / static_cast<double>(locations);
    }

    // Runs a transformer for inspection only: no graph is recorded.
    inline torch::Tensor stylize(StyleTransformer& transformer, const torch::Tensor& images)
    {
        Common::check_image_batch(images, "stylize");
        torch::NoGradGuard no_grad{};
        return transformer.forward(images).detach();
    }

}

#endif // PASTICHE_NETWORK_BASE_HPP
