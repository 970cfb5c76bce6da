#ifndef PASTICHE_METRIC_HPP
#define PASTICHE_METRIC_HPP
// This file is an factory, must exempt it from any logical-code. For functions look into "/details"
#include <string>
#include <vector>

#include "details/running.hpp"

namespace Pastiche::Metric {
    using RunningMetric = Details::RunningMetric;
    using MetricSet = Details::MetricSet;

    inline constexpr const char* kLoss = "loss";
    inline constexpr const char* kStyleLoss = "style_loss";
    inline constexpr const char* kContentLoss = "content_loss";
    inline constexpr const char* kTvLoss = "tv_loss";

    // The four windows tracked by the training loop, in console order.
    [[nodiscard]] inline auto Training() -> MetricSet {
        return MetricSet({
            RunningMetric{kLoss, "Loss"},
            RunningMetric{kStyleLoss, "Style Loss"},
            RunningMetric{kContentLoss, "Content Loss"},
            RunningMetric{kTvLoss, "TV Loss"},
        });
    }
}

#endif //PASTICHE_METRIC_HPP
