#ifndef PASTICHE_NETWORK_HPP
#define PASTICHE_NETWORK_HPP
// This file is a factory, must exempt it from any logical-code. For functions look into "/details"
#include <memory>

#include "details/base.hpp"
#include "details/transformer_net.hpp"
#include "details/vgg.hpp"

namespace Pastiche::Network {
    using StyleTransformer = Details::StyleTransformer;
    using FeatureExtractor = Details::FeatureExtractor;
    using TransformerNet = Details::TransformerNet;
    using TransformerNetOptions = Details::TransformerNetOptions;
    using VggExtractor = Details::VggExtractor;
    using VggOptions = Details::VggOptions;

    using Details::gram_matrix;
    using Details::stylize;

    [[nodiscard]] inline auto Transformer(const TransformerNetOptions& options = {}) -> std::shared_ptr<TransformerNet> {
        return std::make_shared<TransformerNet>(options);
    }

    [[nodiscard]] inline auto Vgg19(const VggOptions& options = {}) -> std::shared_ptr<VggExtractor> {
        return std::make_shared<VggExtractor>(options);
    }
}

#endif // PASTICHE_NETWORK_HPP
