#ifndef PASTICHE_TEST_COMMON_HPP
#define PASTICHE_TEST_COMMON_HPP

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <cmath>
#include <exception>
#include <filesystem>
#include <functional>
#include <iostream>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include <torch/torch.h>

#include "../include/Pastiche.h"

namespace PasticheTest {

    struct Scenario {
        std::string name;
        std::function<void()> body;
    };

    inline void Check(bool condition, const std::string& message)
    {
        if (!condition) {
            throw std::runtime_error(message);
        }
    }

    inline void CheckNear(double actual, double expected, double tolerance, const std::string& message)
    {
        if (!(std::abs(actual - expected) <= tolerance * std::max(1.0, std::abs(expected)))) {
            throw std::runtime_error(message + " (expected " + std::to_string(expected) + ", got " + std::to_string(actual) + ")");
        }
    }

    template <class Exception, class Body>
    void CheckThrows(Body&& body, const std::string& message)
    {
        try {
            body();
        } catch (const Exception&) {
            return;
        }
        throw std::runtime_error(message);
    }

    // Runs every scenario, prints one line each and returns the process exit code.
    inline int Run(const std::string& suite, const std::vector<Scenario>& scenarios)
    {
        namespace Terminal = Pastiche::Utils::Terminal;
        int failures = 0;
        for (const auto& scenario : scenarios) {
            try {
                scenario.body();
                std::cout << Terminal::ApplyColor(Terminal::Symbols::kCheck, Terminal::Colors::kBrightGreen) << ' '
                          << suite << ": " << scenario.name << '\n';
            } catch (const std::exception& error) {
                ++failures;
                std::cerr << Terminal::ApplyColor(Terminal::Symbols::kCross, Terminal::Colors::kBrightRed) << ' '
                          << suite << ": " << scenario.name << ": " << error.what() << '\n';
            }
        }
        std::cout << suite << ": " << (scenarios.size() - static_cast<std::size_t>(failures)) << '/'
                  << scenarios.size() << " scenarios passed." << std::endl;
        return failures == 0 ? 0 : 1;
    }

    // Scratch directory removed on scope exit.
    class TempDir {
    public:
        explicit TempDir(const std::string& name)
        {
            const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
            path_ = std::filesystem::temp_directory_path() / ("pastiche_" + name + "_" + std::to_string(stamp));
            std::filesystem::create_directories(path_);
        }
        ~TempDir()
        {
            std::error_code error;
            std::filesystem::remove_all(path_, error);
        }
        TempDir(const TempDir&) = delete;
        TempDir& operator=(const TempDir&) = delete;

        [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

    private:
        std::filesystem::path path_;
    };

    // Returns its input unchanged. The bias only exists so the optimizer has
    // something to own; it never changes the output.
    class IdentityTransformer : public Pastiche::Network::StyleTransformer {
    public:
        IdentityTransformer() { bias_ = register_parameter("bias", torch::zeros({1})); }

        torch::Tensor forward(const torch::Tensor& images) override {
            return images + bias_ * 0.0;
        }

    private:
        torch::Tensor bias_;
    };

    // Per-pixel colour mix: a 1x1 convolution squashed back into [0, 255].
    class MixingTransformer : public Pastiche::Network::StyleTransformer {
    public:
        MixingTransformer() : conv_(torch::nn::Conv2dOptions(3, 3, 1)) { register_module("conv", conv_); }

        torch::Tensor forward(const torch::Tensor& images) override {
            auto x = images.permute({0, 3, 1, 2}).div(255.0);
            x = torch::sigmoid(conv_->forward(x)).mul(255.0);
            return x.permute({0, 2, 3, 1});
        }

    private:
        torch::nn::Conv2d conv_;
    };

    // Five average-pooling levels: every level is a style layer, the third
    // one is also the content layer.
    class PoolingExtractor : public Pastiche::Network::FeatureExtractor {
    public:
        PoolingExtractor() { scale_ = register_parameter("scale", torch::ones({1})); }

        Pastiche::FeatureBundle extract(const torch::Tensor& images) override {
            Pastiche::FeatureBundle bundle{};
            auto x = images.permute({0, 3, 1, 2}).div(255.0) * scale_;
            for (int level = 1; level <= 5; ++level) {
                x = torch::avg_pool2d(x, {2, 2});
                const auto name = "pool" + std::to_string(level);
                bundle.style.emplace(name, Pastiche::Network::gram_matrix(x));
                if (level == 3) {
                    bundle.content.emplace(name, x);
                }
            }
            return bundle;
        }

        [[nodiscard]] std::vector<std::string> style_layers() const override {
            return {"pool1", "pool2", "pool3", "pool4", "pool5"};
        }
        [[nodiscard]] std::vector<std::string> content_layers() const override { return {"pool3"}; }

        [[nodiscard]] const torch::Tensor& scale() const noexcept { return scale_; }

    private:
        torch::Tensor scale_;
    };

    // Uniform pixels in [0, 255].
    inline torch::Tensor RandomImages(std::int64_t batch, std::int64_t height, std::int64_t width)
    {
        return torch::rand({batch, height, width, 3}) * 255.0;
    }

    inline bool SameTensors(const torch::OrderedDict<std::string, torch::Tensor>& a,
                            const torch::OrderedDict<std::string, torch::Tensor>& b)
    {
        if (a.size() != b.size()) {
            return false;
        }
        for (std::size_t index = 0; index < a.size(); ++index) {
            const auto& left = a[index];
            const auto& right = b[index];
            if (left.key() != right.key() || left.value().sizes() != right.value().sizes()
                || !torch::equal(left.value(), right.value())) {
                return false;
            }
        }
        return true;
    }

    // Compares Adam moments parameter by parameter. Serialised blobs of two
    // optimizers differ even for equal moments, so compare the tensors.
    inline bool SameAdamMoments(torch::optim::Optimizer& a, torch::optim::Optimizer& b)
    {
        const auto& left_params = a.param_groups().at(0).params();
        const auto& right_params = b.param_groups().at(0).params();
        if (left_params.size() != right_params.size() || a.state().size() != b.state().size()) {
            return false;
        }
        for (std::size_t index = 0; index < left_params.size(); ++index) {
            auto left = a.state().find(left_params[index].unsafeGetTensorImpl());
            auto right = b.state().find(right_params[index].unsafeGetTensorImpl());
            const bool left_found = left != a.state().end();
            const bool right_found = right != b.state().end();
            if (left_found != right_found) {
                return false;
            }
            if (!left_found) {
                continue;
            }
            const auto& lhs = static_cast<const torch::optim::AdamParamState&>(*left->second);
            const auto& rhs = static_cast<const torch::optim::AdamParamState&>(*right->second);
            if (lhs.step() != rhs.step() || !torch::equal(lhs.exp_avg(), rhs.exp_avg())
                || !torch::equal(lhs.exp_avg_sq(), rhs.exp_avg_sq())) {
                return false;
            }
        }
        return true;
    }

}

#endif // PASTICHE_TEST_COMMON_HPP
