#ifndef PASTICHE_NETWORK_VGG_HPP
#define PASTICHE_NETWORK_VGG_HPP

#include <algorithm>
#include <array>
#include <cstdint>
#include <filesystem>
#include <set>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <torch/torch.h>

#include "base.hpp"

namespace Pastiche::Network::Details {

    struct VggOptions {
        std::vector<std::string> style_layers{"block1_conv1", "block2_conv1", "block3_conv1", "block4_conv1", "block5_conv1"};
        std::vector<std::string> content_layers{"block5_conv2"};
    };

    // Convolutional trunk of VGG19 with Keras layer names ("block3_conv2", ...).
    // Style layers yield Gram matrices, content layers raw activations.
    class VggExtractor : public FeatureExtractor {
    public:
        explicit VggExtractor(VggOptions options = {})
            : options_(std::move(options))
        {
            if (options_.style_layers.empty() || options_.content_layers.empty()) {
                throw std::invalid_argument("VggExtractor needs at least one style and one content layer.");
            }

            // Convolutions per block and output channels of VGG19.
            constexpr std::array<std::pair<int, std::int64_t>, 5> kBlocks{{{2, 64}, {2, 128}, {4, 256}, {4, 512}, {4, 512}}};
            std::int64_t in_channels = 3;
            for (std::size_t block = 0; block < kBlocks.size(); ++block) {
                const auto [convolutions, channels] = kBlocks[block];
                for (int index = 0; index < convolutions; ++index) {
                    const auto name = "block" + std::to_string(block + 1) + "_conv" + std::to_string(index + 1);
                    auto conv = torch::nn::Conv2d(torch::nn::Conv2dOptions(in_channels, channels, 3).padding(1));
                    stages_.push_back(Stage{name, register_module(name, conv), index + 1 == convolutions});
                    in_channels = channels;
                }
            }

            std::set<std::string> known;
            for (const auto& stage : stages_) {
                known.insert(stage.name);
            }
            for (const auto* layers : {&options_.style_layers, &options_.content_layers}) {
                for (const auto& layer : *layers) {
                    if (known.count(layer) == 0) {
                        throw std::invalid_argument("VggExtractor has no layer named '" + layer + "'.");
                    }
                }
            }

            for (std::size_t index = 0; index < stages_.size(); ++index) {
                const auto& name = stages_[index].name;
                if (contains(options_.style_layers, name) || contains(options_.content_layers, name)) {
                    depth_ = index + 1;
                }
            }

            freeze();
        }

        // Loads pretrained weights saved from a module with the same layer names.
        void load_weights(const std::filesystem::path& path)
        {
            if (!std::filesystem::is_regular_file(path)) {
                throw std::runtime_error("VGG weight archive not found: " + path.string());
            }
            torch::serialize::InputArchive archive;
            try {
                archive.load_from(path.string());
                this->load(archive);
            } catch (const c10::Error& error) {
                throw std::runtime_error("Failed to load VGG weights from '" + path.string() + "': " + error.what());
            }
            freeze();
        }

        FeatureBundle extract(const torch::Tensor& images) override
        {
            Common::check_image_batch(images, "VggExtractor");

            // Caffe preprocessing: BGR channel order, ImageNet mean removed.
            static const std::array<double, 3> kMeanBgr{103.939, 116.779, 123.68};
            auto x = images.flip({3});
            x = x - torch::tensor({kMeanBgr[0], kMeanBgr[1], kMeanBgr[2]}, x.options());
            x = x.permute({0, 3, 1, 2});

            FeatureBundle bundle{};
            for (std::size_t index = 0; index < depth_; ++index) {
                const auto& stage = stages_[index];
                x = torch::relu(stage.conv->forward(x));
                if (contains(options_.style_layers, stage.name)) {
                    bundle.style.emplace(stage.name, gram_matrix(x));
                }
                if (contains(options_.content_layers, stage.name)) {
                    bundle.content.emplace(stage.name, x);
                }
                if (stage.pool_after) {
                    x = torch::max_pool2d(x, {2, 2}, {2, 2});
                }
            }
            return bundle;
        }

        [[nodiscard]] std::vector<std::string> style_layers() const override { return options_.style_layers; }
        [[nodiscard]] std::vector<std::string> content_layers() const override { return options_.content_layers; }

    private:
        struct Stage {
            std::string name;
            torch::nn::Conv2d conv;
            bool pool_after;
        };

        static bool contains(const std::vector<std::string>& layers, const std::string& name) {
            return std::find(layers.begin(), layers.end(), name) != layers.end();
        }

        VggOptions options_;
        std::vector<Stage> stages_{};
        std::size_t depth_{0};
    };

}

#endif // PASTICHE_NETWORK_VGG_HPP
