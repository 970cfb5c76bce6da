// pastiche_train: trains a TransformerNet against a fixed style image.
// -----------------------------------------------------------------------------
// Workflow:
//  - Defaults, then an optional JSON file (--config), then command line flags.
//  - Resumes from <log-dir>/checkpoint when present, otherwise starts fresh.
//  - Every --report-interval steps writes scalars and sample images under
//    <log-dir>/train and saves a checkpoint.
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include <boost/program_options.hpp>
#include <torch/torch.h>

#include "../include/Pastiche.h"

namespace {
    namespace po = boost::program_options;
    namespace Terminal = Pastiche::Utils::Terminal;

    po::options_description make_options()
    {
        po::options_description options("pastiche_train options");
        options.add_options()
            ("help,h", "Print this message.")
            ("config", po::value<std::string>(), "JSON file with configuration values.")
            ("log-dir", po::value<std::string>(), "Checkpoint and summary directory (default logs/style).")
            ("learning-rate", po::value<double>(), "Adam learning rate (default 1e-3).")
            ("image-size", po::value<std::int64_t>(), "Square training crop size (default 256).")
            ("batch-size", po::value<std::int64_t>(), "Images per batch (default 4).")
            ("epochs", po::value<std::int64_t>(), "Passes over the dataset (default 2).")
            ("content-weight", po::value<double>(), "Content loss weight (default 1e4).")
            ("style-weight", po::value<double>(), "Style loss weight (default 1e-2).")
            ("tv-weight", po::value<double>(), "Total variation weight (default 1).")
            ("tv-target", po::value<std::string>(), "Image the total variation is measured on: input or stylized.")
            ("report-interval", po::value<std::int64_t>(), "Steps between reports and checkpoints (default 500).")
            ("max-to-keep", po::value<std::int64_t>(), "Checkpoints retained (default 3).")
            ("seed", po::value<std::uint64_t>(), "Random seed.")
            ("workers", po::value<std::int64_t>(), "Data loader worker threads (default 2).")
            ("dataset", po::value<std::string>(), "Directory of training images.")
            ("style-image", po::value<std::string>(), "Reference style image.")
            ("test-image", po::value<std::string>(), "Held-out content image stylized in every report.")
            ("vgg-weights", po::value<std::string>(), "LibTorch archive with VGG19 weights.");
        return options;
    }

    template <class T>
    void overlay(const po::variables_map& values, const char* flag, T& target)
    {
        if (values.count(flag) != 0) {
            target = values[flag].as<T>();
        }
    }

    void overlay_path(const po::variables_map& values, const char* flag, std::filesystem::path& target)
    {
        if (values.count(flag) != 0) {
            target = values[flag].as<std::string>();
        }
    }

    Pastiche::Config::RunConfig build_config(const po::variables_map& values)
    {
        Pastiche::Config::RunConfig config{};
        if (values.count("config") != 0) {
            config = Pastiche::Config::load_json(values["config"].as<std::string>(), config);
        }
        overlay_path(values, "log-dir", config.log_dir);
        overlay(values, "learning-rate", config.learning_rate);
        overlay(values, "image-size", config.image_size);
        overlay(values, "batch-size", config.batch_size);
        overlay(values, "epochs", config.epochs);
        overlay(values, "content-weight", config.content_weight);
        overlay(values, "style-weight", config.style_weight);
        overlay(values, "tv-weight", config.tv_weight);
        overlay(values, "tv-target", config.tv_target);
        overlay(values, "report-interval", config.report_interval);
        overlay(values, "max-to-keep", config.max_to_keep);
        overlay(values, "seed", config.seed);
        overlay(values, "workers", config.workers);
        overlay_path(values, "dataset", config.dataset_dir);
        overlay_path(values, "style-image", config.style_image);
        overlay_path(values, "test-image", config.test_image);
        overlay_path(values, "vgg-weights", config.extractor_weights);

        config.validate();
        if (config.dataset_dir.empty() || config.style_image.empty() || config.extractor_weights.empty()) {
            throw std::invalid_argument("--dataset, --style-image and --vgg-weights are required.");
        }
        return config;
    }

    std::int64_t run(const Pastiche::Config::RunConfig& config)
    {
        using namespace Pastiche;
        torch::manual_seed(config.seed);

        const auto style_image = Data::load_image(config.style_image);
        const auto test_image = config.test_image.empty() ? torch::Tensor() : Data::load_image(config.test_image);

        auto extractor = Network::Vgg19({.style_layers = config.style_layers, .content_layers = config.content_layers});
        extractor->load_weights(config.extractor_weights);
        auto transformer = Network::Transformer();

        Training::TrainingLoop loop(transformer, extractor, style_image, Training::LoopOptions{
            .weights = config.loss_weights(),
            .tv_target = Loss::ParseTvTarget(config.tv_target),
            .optimizer = config.adam_options(),
            .image_size = config.image_size,
            .batch_size = config.batch_size,
        });

        Data::ImageFolder dataset(config.dataset_dir, {.image_size = config.image_size});
        Terminal::Log(&std::cout, "Found " + std::to_string(dataset.files().size()) + " training images in "
                                      + config.dataset_dir.string());
        auto loader = Data::make_loader(std::move(dataset), {
            .batch_size = static_cast<std::size_t>(config.batch_size),
            .workers = static_cast<std::size_t>(config.workers),
        });

        auto checkpoints = Checkpoint::Manager({
            .directory = config.checkpoint_dir(),
            .max_to_keep = static_cast<std::size_t>(config.max_to_keep),
        });
        auto reporter = Report::Reporter({.directory = config.report_dir(), .stream = &std::cout});

        return Training::fit(loop, checkpoints, reporter, *loader,
                             Training::SampleImages{.content = test_image, .style = style_image},
                             Training::FitOptions{
                                 .epochs = config.epochs,
                                 .report_interval = config.report_interval,
                                 .stream = &std::cout,
                             });
    }
}

int main(int argc, char** argv)
{
    try {
        const auto options = make_options();
        po::variables_map values;
        po::store(po::parse_command_line(argc, argv, options), values);
        po::notify(values);
        if (values.count("help") != 0) {
            std::cout << options << '\n';
            return 0;
        }

        const auto config = build_config(values);
        const auto step = run(config);
        Terminal::Log(&std::cout, "Training finished at step " + std::to_string(step) + ".",
                      Terminal::Colors::kBrightGreen);
        return 0;
    } catch (const std::exception& error) {
        std::cerr << Terminal::ApplyColor(Terminal::kTag, Terminal::Colors::kBrightRed) << ' '
                  << Terminal::ApplyColor(Terminal::Symbols::kCross, Terminal::Colors::kRed) << ' '
                  << error.what() << '\n';
        return 1;
    }
}
