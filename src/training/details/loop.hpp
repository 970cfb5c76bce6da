#ifndef PASTICHE_TRAINING_LOOP_HPP
#define PASTICHE_TRAINING_LOOP_HPP

#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <torch/torch.h>

#include "../../checkpoint/checkpoint.hpp"
#include "../../common/types.hpp"
#include "../../loss/loss.hpp"
#include "../../metric/metric.hpp"
#include "../../network/network.hpp"
#include "../../optimizer/optimizer.hpp"

namespace Pastiche::Training::Details {

    struct LoopOptions {
        Loss::LossWeights weights{};
        Loss::TvTarget tv_target{Loss::TvTarget::Input};
        Optimizer::AdamOptions optimizer{};
        std::int64_t image_size{256};
        std::int64_t batch_size{4};
    };

    // Weighted loss terms of one step, read back from the device.
    struct StepMetrics {
        double total{0.0};
        double style{0.0};
        double content{0.0};
        double tv{0.0};
    };

    class TrainingLoop {
    public:
        TrainingLoop(std::shared_ptr<Network::StyleTransformer> transformer,
                     std::shared_ptr<Network::FeatureExtractor> extractor,
                     const torch::Tensor& style_image,
                     LoopOptions options)
            : transformer_(std::move(transformer)), extractor_(std::move(extractor)), options_(options)
        {
            if (!transformer_ || !extractor_) {
                throw std::invalid_argument("TrainingLoop requires a transformer and a feature extractor.");
            }
            options_.weights.validate();
            if (options_.image_size <= 0 || options_.batch_size <= 0) {
                throw std::invalid_argument("TrainingLoop requires a positive image size and batch size.");
            }
            Common::check_image_batch(style_image, "Style image");
            if (style_image.size(0) != 1) {
                throw std::invalid_argument("Style image must be a single image but has shape "
                                            + Common::format_shape(style_image) + ".");
            }
            if (extractor_->style_layers().empty() || extractor_->content_layers().empty()) {
                throw std::invalid_argument("Feature extractor exposes no style or no content layers.");
            }

            extractor_->freeze();
            {
                torch::NoGradGuard no_grad{};
                auto bundle = extractor_->extract(style_image);
                for (auto& [name, tensor] : bundle.style) {
                    style_targets_.emplace(name, tensor.detach());
                }
            }

            optimizer_ = Optimizer::build_optimizer(transformer_->parameters(/*recurse=*/true),
                                                    Optimizer::Adam(options_.optimizer));
            transformer_->train();
        }

        StepMetrics step(const torch::Tensor& batch, Metric::MetricSet& metrics)
        {
            check_batch(batch);

            optimizer_->zero_grad();
            auto transformed = transformer_->forward(batch);

            FeatureBundle outputs{};
            {
                torch::NoGradGuard no_grad{};
                outputs = extractor_->extract(batch);
            }
            const auto transformed_outputs = extractor_->extract(transformed);
            const auto& tv_image = options_.tv_target == Loss::TvTarget::Stylized ? transformed : batch;

            auto losses = Loss::compose(outputs, transformed_outputs, style_targets_, tv_image, options_.weights);
            losses.total.backward();
            optimizer_->step();

            StepMetrics values{
                .total = losses.total.item<double>(),
                .style = losses.style.item<double>(),
                .content = losses.content.item<double>(),
                .tv = losses.tv.item<double>(),
            };
            metrics.at(Metric::kLoss).update(values.total);
            metrics.at(Metric::kStyleLoss).update(values.style);
            metrics.at(Metric::kContentLoss).update(values.content);
            metrics.at(Metric::kTvLoss).update(values.tv);
            return values;
        }

        [[nodiscard]] torch::Tensor stylize(const torch::Tensor& images)
        {
            return Network::stylize(*transformer_, images);
        }

        [[nodiscard]] Checkpoint::TrainingState capture(std::int64_t step) const
        {
            return Checkpoint::capture(step, *transformer_, *optimizer_);
        }

        void restore(const Checkpoint::TrainingState& state)
        {
            Checkpoint::apply(state, *transformer_, *optimizer_);
        }

        [[nodiscard]] Network::StyleTransformer& transformer() noexcept { return *transformer_; }
        [[nodiscard]] Network::FeatureExtractor& extractor() noexcept { return *extractor_; }
        [[nodiscard]] torch::optim::Optimizer& optimizer() noexcept { return *optimizer_; }
        [[nodiscard]] const NamedTensors& style_targets() const noexcept { return style_targets_; }
        [[nodiscard]] const LoopOptions& options() const noexcept { return options_; }

    private:
        void check_batch(const torch::Tensor& batch) const
        {
            Common::check_image_batch(batch, "TrainingLoop");
            if (batch.size(0) != options_.batch_size || batch.size(1) != options_.image_size
                || batch.size(2) != options_.image_size) {
                throw std::invalid_argument("TrainingLoop expects batches of shape ("
                                            + std::to_string(options_.batch_size) + ", "
                                            + std::to_string(options_.image_size) + ", "
                                            + std::to_string(options_.image_size) + ", 3) but received "
                                            + Common::format_shape(batch) + ".");
            }
        }

        std::shared_ptr<Network::StyleTransformer> transformer_;
        std::shared_ptr<Network::FeatureExtractor> extractor_;
        LoopOptions options_;
        NamedTensors style_targets_{};
        std::unique_ptr<torch::optim::Optimizer> optimizer_{};
    };

}

#endif // PASTICHE_TRAINING_LOOP_HPP
