#ifndef PASTICHE_TRAINING_FIT_HPP
#define PASTICHE_TRAINING_FIT_HPP

#include <cstdint>
#include <iostream>
#include <ostream>
#include <stdexcept>
#include <string>
#include <vector>

#include <torch/torch.h>

#include "../../checkpoint/checkpoint.hpp"
#include "../../common/types.hpp"
#include "../../metric/metric.hpp"
#include "../../report/report.hpp"
#include "../../utils/terminal.hpp"
#include "loop.hpp"

namespace Pastiche::Training::Details {

    struct FitOptions {
        std::int64_t epochs{2};
        std::int64_t report_interval{500};
        std::ostream* stream{&std::cout};
    };

    // Images attached to every report. Undefined tensors are skipped.
    struct SampleImages {
        torch::Tensor content{};
        torch::Tensor style{};
    };

    inline const torch::Tensor& batch_images(const torch::Tensor& batch) { return batch; }
    inline const torch::Tensor& batch_images(const torch::data::TensorExample& batch) { return batch.data; }

    inline std::vector<NamedImage> report_images(TrainingLoop& loop, const SampleImages& samples)
    {
        std::vector<NamedImage> images;
        if (samples.content.defined()) {
            images.push_back({"Content Image", samples.content});
        }
        if (samples.style.defined()) {
            images.push_back({"Style Image", samples.style});
        }
        if (samples.content.defined()) {
            images.push_back({"Styled Image", loop.stylize(samples.content)});
        }
        return images;
    }

    // Resumes from the latest checkpoint if any, then runs `epochs` passes over
    // `loader`. Every `report_interval` steps the state is checkpointed, the
    // window reported and the metrics reset. Returns the step counter after the run.
    template <class Loader>
    std::int64_t fit(TrainingLoop& loop,
                     Checkpoint::CheckpointManager& checkpoints,
                     Report::MetricsReporter& reporter,
                     Loader& loader,
                     const SampleImages& samples,
                     const FitOptions& options)
    {
        namespace Terminal = Utils::Terminal;
        if (options.epochs < 0) {
            throw std::invalid_argument("Epoch count must not be negative.");
        }
        if (options.report_interval <= 0) {
            throw std::invalid_argument("Report interval must be positive.");
        }

        std::int64_t step = 1;
        if (auto state = checkpoints.restore()) {
            loop.restore(*state);
            step = state->step;
            Terminal::Log(options.stream, "Restored from " + checkpoints.latest_checkpoint().value_or(""),
                          Terminal::Colors::kBrightGreen);
        } else {
            Terminal::Log(options.stream, "Initializing from scratch.", Terminal::Colors::kBrightYellow);
        }

        auto metrics = Metric::Training();
        for (std::int64_t epoch = 0; epoch < options.epochs; ++epoch) {
            Terminal::Log(options.stream, "Epoch " + std::to_string(epoch + 1) + "/" + std::to_string(options.epochs));
            for (auto& batch : loader) {
                loop.step(batch_images(batch), metrics);
                ++step;

                if (step % options.report_interval == 0) {
                    // The checkpoint commits before the report rows are appended.
                    const auto path = checkpoints.save(loop.capture(step));
                    reporter.emit(step, metrics, report_images(loop, samples));
                    Terminal::Log(options.stream, "Saved checkpoint for step " + std::to_string(step) + ": " + path,
                                  Terminal::Colors::kBrightGreen);
                    metrics.reset();
                }
            }
        }
        return step;
    }

}

#endif // PASTICHE_TRAINING_FIT_HPP
