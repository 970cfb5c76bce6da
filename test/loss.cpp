#include "common.hpp"

namespace {
    using namespace PasticheTest;
    namespace Loss = Pastiche::Loss;

    Pastiche::FeatureBundle Features(const torch::Tensor& images)
    {
        PoolingExtractor extractor;
        extractor.freeze();
        torch::NoGradGuard no_grad{};
        return extractor.extract(images);
    }

    void TvIsZeroForConstantImage()
    {
        auto image = torch::full({2, 16, 16, 3}, 127.0);
        Check(Loss::total_variation_loss(image).item<double>() == 0.0, "constant image must have zero total variation");
    }

    void TvIsNonNegative()
    {
        torch::manual_seed(3);
        for (int trial = 0; trial < 5; ++trial) {
            auto image = RandomImages(2, 9, 7);
            Check(Loss::total_variation_loss(image).item<double>() >= 0.0, "total variation must be non-negative");
        }
    }

    void TvMatchesHandComputedValue()
    {
        // Single channel ramp along the width, replicated across channels:
        // horizontal deltas are all 1, vertical deltas all 0.
        auto row = torch::arange(4, torch::kFloat32).view({1, 1, 4, 1});
        auto image = row.expand({1, 3, 4, 3}).contiguous();
        CheckNear(Loss::total_variation_loss(image).item<double>(), 1.0, 1e-6, "ramp image total variation");

        // Checkerboard on a 2x2 grid: every neighbour differs by 10.
        auto board = torch::tensor({0.0f, 10.0f, 10.0f, 0.0f}).view({1, 2, 2, 1}).expand({1, 2, 2, 3}).contiguous();
        CheckNear(Loss::total_variation_loss(board).item<double>(), 200.0, 1e-6, "checkerboard total variation");
    }

    void TvRejectsDegenerateImages()
    {
        CheckThrows<std::invalid_argument>([] { (void)Loss::total_variation_loss(torch::zeros({1, 1, 5, 3})); },
                                           "a single row image must be rejected");
        CheckThrows<std::invalid_argument>([] { (void)Loss::total_variation_loss(torch::zeros({1, 5, 5})); },
                                           "rank 3 input must be rejected");
    }

    void IdenticalFeaturesGiveZeroPerceptualLoss()
    {
        torch::manual_seed(7);
        const auto images = RandomImages(2, 32, 32);
        const auto features = Features(images);
        const auto losses = Loss::compose(features, features, features.style, images, Loss::LossWeights{});
        Check(losses.content.item<double>() == 0.0, "content loss must vanish for identical features");
        Check(losses.style.item<double>() == 0.0, "style loss must vanish when the target equals the features");
    }

    void TotalIsWeightedSumOfTerms()
    {
        torch::manual_seed(11);
        const auto images = RandomImages(3, 32, 32);
        const auto stylized = RandomImages(3, 32, 32);
        const auto style_image = RandomImages(1, 32, 32);

        const auto outputs = Features(images);
        const auto transformed = Features(stylized);
        const auto targets = Features(style_image).style;
        const Loss::LossWeights weights{.content_weight = 3.0, .style_weight = 5.0, .tv_weight = 0.25};

        const auto losses = Loss::compose(outputs, transformed, targets, images, weights);

        const auto raw_style = Loss::style_loss(transformed.style, targets).item<double>();
        const auto raw_content = Loss::content_loss(transformed.content, outputs.content).item<double>();
        const auto raw_tv = Loss::total_variation_loss(images).item<double>();
        const auto expected = raw_style * (5.0 / 5.0) + raw_content * (3.0 / 1.0) + raw_tv * 0.25;

        CheckNear(losses.style.item<double>(), raw_style, 1e-5, "scaled style term");
        CheckNear(losses.content.item<double>(), raw_content * 3.0, 1e-5, "scaled content term");
        CheckNear(losses.tv.item<double>(), raw_tv * 0.25, 1e-5, "scaled tv term");
        CheckNear(losses.total.item<double>(), expected, 1e-5, "total must equal the weighted sum");
    }

    void StyleTargetBroadcastsOverBatch()
    {
        torch::manual_seed(13);
        const auto style_image = RandomImages(1, 32, 32);
        const auto targets = Features(style_image).style;
        const auto batch = Features(style_image.expand({4, 32, 32, 3}).contiguous());
        const auto value = Loss::style_loss(batch.style, targets).item<double>();
        CheckNear(value, 0.0, 1e-6, "a batch of copies of the style image must match its target");
    }

    void SquaredErrorBroadcastsTarget()
    {
        auto prediction = torch::tensor({1.0f, 2.0f, 3.0f, 4.0f}).view({2, 2});
        auto target = torch::tensor({1.0f, 1.0f}).view({1, 2});
        CheckNear(Loss::squared_error(prediction, target, Loss::Reduction::Sum).item<double>(), 14.0, 1e-9, "summed error");
        CheckNear(Loss::squared_error(prediction, target).item<double>(), 3.5, 1e-9, "mean error");
        Check(Loss::squared_error(prediction, target, Loss::Reduction::None).sizes() == torch::IntArrayRef({2, 2}),
              "unreduced error keeps the broadcast shape");
    }

    void MismatchedKeysAreRejected()
    {
        torch::manual_seed(17);
        const auto images = RandomImages(1, 32, 32);
        const auto features = Features(images);
        auto missing = features.style;
        missing.erase("pool5");
        CheckThrows<std::invalid_argument>(
            [&] { (void)Loss::compose(features, features, missing, images, Loss::LossWeights{}); },
            "a style target without pool5 must be rejected");

        auto renamed = features;
        renamed.content.clear();
        renamed.content.emplace("other", features.content.at("pool3"));
        CheckThrows<std::invalid_argument>(
            [&] { (void)Loss::compose(features, renamed, features.style, images, Loss::LossWeights{}); },
            "content layers with different names must be rejected");
    }

    void TvTargetIsConfigurable()
    {
        Check(Loss::ParseTvTarget("input") == Loss::TvTarget::Input, "'input' parses");
        Check(Loss::ParseTvTarget("stylized") == Loss::TvTarget::Stylized, "'stylized' parses");
        Check(Loss::ToString(Loss::TvTarget::Stylized) == "stylized", "stylized prints");
        CheckThrows<std::invalid_argument>([] { (void)Loss::ParseTvTarget("output"); }, "unknown target must throw");
    }

    void WeightsMustBePositive()
    {
        Loss::LossWeights weights{};
        weights.validate();
        weights.tv_weight = 0.0;
        CheckThrows<std::invalid_argument>([&] { weights.validate(); }, "zero tv weight must be rejected");
        weights.tv_weight = 1.0;
        weights.style_weight = std::nan("");
        CheckThrows<std::invalid_argument>([&] { weights.validate(); }, "NaN style weight must be rejected");
    }
}

int main()
{
    return Run("loss", {
        {"total variation of a constant image is zero", TvIsZeroForConstantImage},
        {"total variation is non-negative", TvIsNonNegative},
        {"total variation matches hand computed values", TvMatchesHandComputedValue},
        {"total variation rejects degenerate images", TvRejectsDegenerateImages},
        {"identical features give zero style and content", IdenticalFeaturesGiveZeroPerceptualLoss},
        {"total is the weighted sum of its terms", TotalIsWeightedSumOfTerms},
        {"style target broadcasts over the batch", StyleTargetBroadcastsOverBatch},
        {"squared error broadcasts the target", SquaredErrorBroadcastsTarget},
        {"mismatched layer names are rejected", MismatchedKeysAreRejected},
        {"total variation target parses", TvTargetIsConfigurable},
        {"loss weights must be positive", WeightsMustBePositive},
    });
}
