#include <fstream>

#include "common.hpp"

namespace {
    using namespace PasticheTest;
    namespace Config = Pastiche::Config;

    void DefaultsAreValid()
    {
        const Config::RunConfig config{};
        config.validate();
        Check(config.log_dir == "logs/style", "default log directory");
        Check(config.report_interval == 500 && config.max_to_keep == 3, "default cadence and retention");
        Check(config.report_dir() == std::filesystem::path("logs/style") / "train", "reports live under train/");
        const auto adam = config.adam_options();
        Check(adam.beta1 == 0.99 && adam.eps == 1e-1 && adam.learning_rate == 1e-3, "adam defaults");
        Check(config.style_layers.size() == 5 && config.content_layers == std::vector<std::string>{"block5_conv2"},
              "default layers");
    }

    void InvalidValuesAreRejected()
    {
        const auto expect_invalid = [](auto mutate, const std::string& message) {
            Config::RunConfig config{};
            mutate(config);
            CheckThrows<std::invalid_argument>([&] { config.validate(); }, message);
        };
        expect_invalid([](Config::RunConfig& c) { c.batch_size = 0; }, "zero batch size");
        expect_invalid([](Config::RunConfig& c) { c.image_size = -4; }, "negative image size");
        expect_invalid([](Config::RunConfig& c) { c.report_interval = 0; }, "zero report interval");
        expect_invalid([](Config::RunConfig& c) { c.max_to_keep = 0; }, "zero retention");
        expect_invalid([](Config::RunConfig& c) { c.style_weight = 0.0; }, "zero style weight");
        expect_invalid([](Config::RunConfig& c) { c.learning_rate = -1.0; }, "negative learning rate");
        expect_invalid([](Config::RunConfig& c) { c.content_layers.clear(); }, "no content layers");
        expect_invalid([](Config::RunConfig& c) { c.log_dir.clear(); }, "empty log directory");
        expect_invalid([](Config::RunConfig& c) { c.tv_target = "output"; }, "unknown tv target");
    }

    void JsonOverlaysDefaults()
    {
        TempDir dir("config_json");
        const auto path = dir.path() / "run.json";
        std::ofstream(path) << R"({
            "log_dir": "runs/wave",
            "learning_rate": 0.0005,
            "batch_size": 8,
            "tv_target": "Stylized",
            "style_layers": ["block1_conv1", "block3_conv1"]
        })";

        const auto config = Config::load_json(path);
        Check(config.log_dir == "runs/wave", "log_dir from JSON");
        CheckNear(config.learning_rate, 5e-4, 1e-12, "learning_rate from JSON");
        Check(config.batch_size == 8, "batch_size from JSON");
        Check(config.tv_target == "stylized", "tv_target is case-insensitive");
        Check(config.style_layers == std::vector<std::string>{"block1_conv1", "block3_conv1"}, "style layers from JSON");
        Check(config.image_size == 256 && config.epochs == 2, "untouched keys keep their defaults");
        config.validate();
    }

    void JsonErrorsAreReported()
    {
        TempDir dir("config_errors");
        CheckThrows<std::invalid_argument>([&] { (void)Config::load_json(dir.path() / "missing.json"); }, "missing file");

        std::ofstream(dir.path() / "typo.json") << R"({"bach_size": 8})";
        CheckThrows<std::invalid_argument>([&] { (void)Config::load_json(dir.path() / "typo.json"); }, "unknown key");

        std::ofstream(dir.path() / "bad.json") << R"({"epochs": "many"})";
        CheckThrows<std::runtime_error>([&] { (void)Config::load_json(dir.path() / "bad.json"); }, "non numeric value");
        try {
            (void)Config::load_json(dir.path() / "bad.json");
        } catch (const std::runtime_error& error) {
            Check(std::string(error.what()).find("'epochs'") != std::string::npos
                      && std::string(error.what()).find("is not numeric") != std::string::npos,
                  "a non numeric value is reported as such, not as missing");
        }

        std::ofstream(dir.path() / "negative_seed.json") << R"({"seed": -5})";
        CheckThrows<std::runtime_error>([&] { (void)Config::load_json(dir.path() / "negative_seed.json"); },
                                        "a negative seed must not wrap around");
        std::ofstream(dir.path() / "seed.json") << R"({"seed": 42})";
        Check(Config::load_json(dir.path() / "seed.json").seed == 42, "a positive seed is read");

        std::ofstream(dir.path() / "broken.json") << "{ \"epochs\": ";
        CheckThrows<std::runtime_error>([&] { (void)Config::load_json(dir.path() / "broken.json"); }, "malformed JSON");
    }
}

int main()
{
    return Run("config", {
        {"defaults are valid", DefaultsAreValid},
        {"invalid values are rejected", InvalidValuesAreRejected},
        {"json overlays defaults", JsonOverlaysDefaults},
        {"json errors are reported", JsonErrorsAreReported},
    });
}
