#ifndef PASTICHE_CONFIG_RUN_HPP
#define PASTICHE_CONFIG_RUN_HPP

#include <cstdint>
#include <filesystem>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "../../common/save_load.hpp"
#include "../../loss/loss.hpp"
#include "../../optimizer/optimizer.hpp"

namespace Pastiche::Config::Details {

    struct RunConfig {
        std::filesystem::path log_dir{"logs/style"};
        double learning_rate{1e-3};
        std::int64_t image_size{256};
        std::int64_t batch_size{4};
        std::int64_t epochs{2};
        double content_weight{1e4};
        double style_weight{1e-2};
        double tv_weight{1.0};
        std::string tv_target{"input"};
        std::int64_t report_interval{500};
        std::int64_t max_to_keep{3};
        double beta1{0.99};
        double beta2{0.999};
        double eps{1e-1};
        std::uint64_t seed{0};
        std::int64_t workers{2};
        std::vector<std::string> style_layers{"block1_conv1", "block2_conv1", "block3_conv1", "block4_conv1", "block5_conv1"};
        std::vector<std::string> content_layers{"block5_conv2"};
        std::filesystem::path dataset_dir{};
        std::filesystem::path style_image{};
        std::filesystem::path test_image{};
        std::filesystem::path extractor_weights{};

        [[nodiscard]] std::filesystem::path checkpoint_dir() const { return log_dir; }
        [[nodiscard]] std::filesystem::path report_dir() const { return log_dir / "train"; }

        [[nodiscard]] Loss::LossWeights loss_weights() const {
            return Loss::LossWeights{.content_weight = content_weight, .style_weight = style_weight, .tv_weight = tv_weight};
        }

        [[nodiscard]] Optimizer::AdamOptions adam_options() const {
            Optimizer::AdamOptions options{};
            options.learning_rate = learning_rate;
            options.beta1 = beta1;
            options.beta2 = beta2;
            options.eps = eps;
            return options;
        }

        void validate() const
        {
            auto positive = [](std::int64_t value, const char* name) {
                if (value <= 0) {
                    std::ostringstream message;
                    message << "Configuration value '" << name << "' must be positive (got " << value << ").";
                    throw std::invalid_argument(message.str());
                }
            };
            if (log_dir.empty()) {
                throw std::invalid_argument("Configuration value 'log_dir' must not be empty.");
            }
            positive(image_size, "image_size");
            positive(batch_size, "batch_size");
            positive(epochs, "epochs");
            positive(report_interval, "report_interval");
            positive(max_to_keep, "max_to_keep");
            if (workers < 0) {
                throw std::invalid_argument("Configuration value 'workers' must not be negative.");
            }
            if (style_layers.empty() || content_layers.empty()) {
                throw std::invalid_argument("Configuration requires at least one style layer and one content layer.");
            }
            (void)Loss::ParseTvTarget(tv_target);
            loss_weights().validate();
            adam_options().validate();
        }
    };

    // Overlays the keys present in a JSON document onto `config`. Unknown keys
    // are rejected so a misspelt option never silently falls back to a default.
    inline void apply_json(RunConfig& config, const Common::SaveLoad::PropertyTree& tree, const std::string& context)
    {
        namespace SaveLoad = Common::SaveLoad;
        for (const auto& [key, node] : tree) {
            if (key == "log_dir") {
                config.log_dir = SaveLoad::Detail::get_string(tree, key, context);
            } else if (key == "learning_rate") {
                config.learning_rate = SaveLoad::Detail::get_numeric<double>(tree, key, context);
            } else if (key == "image_size") {
                config.image_size = SaveLoad::Detail::get_numeric<std::int64_t>(tree, key, context);
            } else if (key == "batch_size") {
                config.batch_size = SaveLoad::Detail::get_numeric<std::int64_t>(tree, key, context);
            } else if (key == "epochs") {
                config.epochs = SaveLoad::Detail::get_numeric<std::int64_t>(tree, key, context);
            } else if (key == "content_weight") {
                config.content_weight = SaveLoad::Detail::get_numeric<double>(tree, key, context);
            } else if (key == "style_weight") {
                config.style_weight = SaveLoad::Detail::get_numeric<double>(tree, key, context);
            } else if (key == "tv_weight") {
                config.tv_weight = SaveLoad::Detail::get_numeric<double>(tree, key, context);
            } else if (key == "tv_target") {
                config.tv_target = SaveLoad::Detail::to_lower(SaveLoad::Detail::get_string(tree, key, context));
            } else if (key == "report_interval") {
                config.report_interval = SaveLoad::Detail::get_numeric<std::int64_t>(tree, key, context);
            } else if (key == "max_to_keep") {
                config.max_to_keep = SaveLoad::Detail::get_numeric<std::int64_t>(tree, key, context);
            } else if (key == "beta1") {
                config.beta1 = SaveLoad::Detail::get_numeric<double>(tree, key, context);
            } else if (key == "beta2") {
                config.beta2 = SaveLoad::Detail::get_numeric<double>(tree, key, context);
            } else if (key == "eps") {
                config.eps = SaveLoad::Detail::get_numeric<double>(tree, key, context);
            } else if (key == "seed") {
                config.seed = SaveLoad::Detail::get_numeric<std::uint64_t>(tree, key, context);
            } else if (key == "workers") {
                config.workers = SaveLoad::Detail::get_numeric<std::int64_t>(tree, key, context);
            } else if (key == "style_layers") {
                config.style_layers = SaveLoad::Detail::read_array<std::string>(node, context);
            } else if (key == "content_layers") {
                config.content_layers = SaveLoad::Detail::read_array<std::string>(node, context);
            } else if (key == "dataset_dir") {
                config.dataset_dir = SaveLoad::Detail::get_string(tree, key, context);
            } else if (key == "style_image") {
                config.style_image = SaveLoad::Detail::get_string(tree, key, context);
            } else if (key == "test_image") {
                config.test_image = SaveLoad::Detail::get_string(tree, key, context);
            } else if (key == "extractor_weights") {
                config.extractor_weights = SaveLoad::Detail::get_string(tree, key, context);
            } else {
                throw std::invalid_argument("Unknown key '" + key + "' in " + context + ".");
            }
        }
    }

    [[nodiscard]] inline RunConfig load_json(const std::filesystem::path& path, RunConfig base = {})
    {
        if (!std::filesystem::is_regular_file(path)) {
            throw std::invalid_argument("Configuration file not found: " + path.string());
        }
        const auto tree = Common::SaveLoad::read_json_file(path);
        apply_json(base, tree, "configuration '" + path.string() + "'");
        return base;
    }

}

#endif // PASTICHE_CONFIG_RUN_HPP
