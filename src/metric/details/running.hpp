#ifndef PASTICHE_METRIC_RUNNING_HPP
#define PASTICHE_METRIC_RUNNING_HPP

#include <algorithm>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace Pastiche::Metric::Details {

    // Windowed mean: accumulates scalars until the owner resets it.
    class RunningMetric {
    public:
        explicit RunningMetric(std::string name, std::string label = {})
            : name_(std::move(name)), label_(label.empty() ? name_ : std::move(label)) {}

        void update(double value) {
            sum_ += value;
            ++count_;
        }

        [[nodiscard]] double value() const {
            if (count_ == 0) {
                throw std::logic_error("Running metric '" + name_ + "' was read before any value was accumulated.");
            }
            return sum_ / static_cast<double>(count_);
        }

        void reset() noexcept {
            sum_ = 0.0;
            count_ = 0;
        }

        [[nodiscard]] bool empty() const noexcept { return count_ == 0; }
        [[nodiscard]] double sum() const noexcept { return sum_; }
        [[nodiscard]] std::int64_t count() const noexcept { return count_; }
        [[nodiscard]] const std::string& name() const noexcept { return name_; }
        [[nodiscard]] const std::string& label() const noexcept { return label_; }

    private:
        std::string name_;
        std::string label_;
        double sum_{0.0};
        std::int64_t count_{0};
    };

    class MetricSet {
    public:
        MetricSet() = default;

        explicit MetricSet(std::vector<RunningMetric> metrics)
            : metrics_(std::move(metrics))
        {
            for (std::size_t index = 0; index < metrics_.size(); ++index) {
                for (std::size_t other = index + 1; other < metrics_.size(); ++other) {
                    if (metrics_[index].name() == metrics_[other].name()) {
                        throw std::invalid_argument("Duplicate metric name '" + metrics_[index].name() + "'.");
                    }
                }
            }
        }

        [[nodiscard]] RunningMetric& at(const std::string& name) {
            return const_cast<RunningMetric&>(std::as_const(*this).at(name));
        }

        [[nodiscard]] const RunningMetric& at(const std::string& name) const {
            auto it = std::find_if(metrics_.begin(), metrics_.end(),
                                   [&](const RunningMetric& metric) { return metric.name() == name; });
            if (it == metrics_.end()) {
                throw std::out_of_range("Unknown metric '" + name + "'.");
            }
            return *it;
        }

        void reset() noexcept {
            for (auto& metric : metrics_) {
                metric.reset();
            }
        }

        [[nodiscard]] bool empty() const noexcept {
            return std::all_of(metrics_.begin(), metrics_.end(), [](const RunningMetric& metric) { return metric.empty(); });
        }

        [[nodiscard]] const std::vector<RunningMetric>& metrics() const noexcept { return metrics_; }

        [[nodiscard]] std::vector<RunningMetric>::const_iterator begin() const noexcept { return metrics_.begin(); }
        [[nodiscard]] std::vector<RunningMetric>::const_iterator end() const noexcept { return metrics_.end(); }

    private:
        std::vector<RunningMetric> metrics_{};
    };

}

#endif // PASTICHE_METRIC_RUNNING_HPP
