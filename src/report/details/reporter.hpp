#ifndef PASTICHE_REPORT_REPORTER_HPP
#define PASTICHE_REPORT_REPORTER_HPP

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <limits>
#include <ostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <torch/torch.h>

#include "../../common/types.hpp"
#include "../../data/data.hpp"
#include "../../metric/metric.hpp"
#include "../../utils/terminal.hpp"

namespace Pastiche::Report::Details {

    inline constexpr const char* kScalarsFile = "scalars.csv";
    inline constexpr const char* kImagesDirectory = "images";
    inline constexpr std::int64_t kMaxImagesPerRecord = 3;

    struct ReportOptions {
        std::filesystem::path directory{};
        std::ostream* stream{&std::cout};
    };

    // Lower-case tag usable as a directory name: "Content Image" -> "content_image".
    [[nodiscard]] inline std::string sanitize_tag(const std::string& tag)
    {
        std::string out;
        out.reserve(tag.size());
        for (unsigned char c : tag) {
            if (std::isalnum(c) != 0) {
                out.push_back(static_cast<char>(std::tolower(c)));
            } else if (!out.empty() && out.back() != '_') {
                out.push_back('_');
            }
        }
        while (!out.empty() && out.back() == '_') {
            out.pop_back();
        }
        if (out.empty()) {
            throw std::invalid_argument("Image tag '" + tag + "' has no usable characters.");
        }
        return out;
    }

    // Writes step-indexed records under one directory:
    //   scalars.csv                      "step,name,value" rows, appended
    //   images/<tag>/step_<N>[_i].png    samples scaled into [0, 1]
    // and prints one summary line per emission.
    class MetricsReporter {
    public:
        explicit MetricsReporter(ReportOptions options)
            : options_(std::move(options))
        {
            if (options_.directory.empty()) {
                throw std::invalid_argument("Report directory must not be empty.");
            }
        }

        void emit(std::int64_t step, const Metric::MetricSet& metrics, const std::vector<NamedImage>& samples)
        {
            if (step < 1) {
                throw std::invalid_argument("Cannot report step " + std::to_string(step) + ".");
            }
            for (const auto& metric : metrics) {
                if (metric.empty()) {
                    throw std::logic_error("Metric '" + metric.name() + "' has no values for step " + std::to_string(step) + ".");
                }
            }

            std::filesystem::create_directories(options_.directory);
            write_scalars(step, metrics);
            for (const auto& sample : samples) {
                write_images(step, sample);
            }
            Utils::Terminal::Log(options_.stream, summary_line(step, metrics), Utils::Terminal::Colors::kBrightCyan);
        }

        // "Step 500, Loss: 1.2, Style Loss: 0.4, Content Loss: 0.7, TV Loss: 0.1"
        [[nodiscard]] static std::string summary_line(std::int64_t step, const Metric::MetricSet& metrics)
        {
            std::ostringstream line;
            line << "Step " << step;
            for (const auto& metric : metrics) {
                line << ", " << metric.label() << ": " << metric.value();
            }
            return line.str();
        }

        [[nodiscard]] std::filesystem::path scalars_path() const { return options_.directory / kScalarsFile; }
        [[nodiscard]] std::filesystem::path images_directory() const { return options_.directory / kImagesDirectory; }
        [[nodiscard]] const ReportOptions& options() const noexcept { return options_; }

    private:
        void write_scalars(std::int64_t step, const Metric::MetricSet& metrics) const
        {
            const auto path = scalars_path();
            const bool fresh = !std::filesystem::exists(path);
            std::ofstream stream(path, std::ios::app);
            if (!stream) {
                throw std::runtime_error("Failed to open '" + path.string() + "' for appending.");
            }
            if (fresh) {
                stream << "step,name,value\n";
            }
            stream << std::setprecision(std::numeric_limits<double>::max_digits10);
            for (const auto& metric : metrics) {
                stream << step << ',' << metric.name() << ',' << metric.value() << '\n';
            }
            stream.flush();
            if (!stream) {
                throw std::runtime_error("Failed to write '" + path.string() + "'.");
            }
        }

        void write_images(std::int64_t step, const NamedImage& sample) const
        {
            Common::check_image_batch(sample.image, "MetricsReporter");
            const auto directory = images_directory() / sanitize_tag(sample.name);
            const auto count = std::min<std::int64_t>(sample.image.size(0), kMaxImagesPerRecord);
            const auto scaled = sample.image.detach().to(torch::kCPU).div(255.0);
            for (std::int64_t index = 0; index < count; ++index) {
                auto filename = "step_" + std::to_string(step);
                if (count > 1) {
                    filename += "_" + std::to_string(index);
                }
                Data::write_image(directory / (filename + ".png"), scaled.slice(0, index, index + 1));
            }
        }

        ReportOptions options_;
    };

}

#endif // PASTICHE_REPORT_REPORTER_HPP
