#include <fstream>
#include <sstream>

#include "common.hpp"

namespace {
    using namespace PasticheTest;
    namespace Report = Pastiche::Report;
    namespace Metric = Pastiche::Metric;
    namespace fs = std::filesystem;

    Metric::MetricSet FilledMetrics(double loss, double style, double content, double tv)
    {
        auto metrics = Metric::Training();
        metrics.at(Metric::kLoss).update(loss);
        metrics.at(Metric::kStyleLoss).update(style);
        metrics.at(Metric::kContentLoss).update(content);
        metrics.at(Metric::kTvLoss).update(tv);
        return metrics;
    }

    std::vector<std::string> Lines(const fs::path& path)
    {
        std::ifstream stream(path);
        std::vector<std::string> lines;
        for (std::string line; std::getline(stream, line);) {
            lines.push_back(line);
        }
        return lines;
    }

    void SummaryLineListsFourMetrics()
    {
        const auto line = Report::MetricsReporter::summary_line(500, FilledMetrics(4.0, 1.5, 2.0, 0.5));
        Check(line == "Step 500, Loss: 4, Style Loss: 1.5, Content Loss: 2, TV Loss: 0.5", "summary line: " + line);
    }

    void EmitAppendsScalarRecords()
    {
        TempDir dir("report_scalars");
        std::ostringstream console;
        auto reporter = Report::Reporter({.directory = dir.path() / "train", .stream = &console});
        reporter.emit(500, FilledMetrics(4.0, 1.5, 2.0, 0.5), {});
        reporter.emit(1000, FilledMetrics(3.0, 1.0, 1.75, 0.25), {});

        const auto lines = Lines(reporter.scalars_path());
        Check(lines.size() == 9, "header plus four rows per emission");
        Check(lines[0] == "step,name,value", "header");
        Check(lines[1] == "500,loss,4", "first record: " + lines[1]);
        Check(lines[8] == "1000,tv_loss,0.25", "last record: " + lines[8]);
        Check(console.str().find("Step 1000, Loss: 3, Style Loss: 1, Content Loss: 1.75, TV Loss: 0.25") != std::string::npos,
              "console line is printed");
    }

    void EmitWritesScaledImages()
    {
        TempDir dir("report_images");
        auto reporter = Report::Reporter({.directory = dir.path(), .stream = nullptr});
        const auto single = torch::full({1, 6, 8, 3}, 255.0);
        const auto batch = torch::full({4, 6, 8, 3}, 51.0);
        reporter.emit(20, FilledMetrics(1.0, 1.0, 1.0, 1.0), {{"Styled Image", single}, {"Batch Preview", batch}});

        const auto styled = dir.path() / "images" / "styled_image" / "step_20.png";
        Check(fs::is_regular_file(styled), "single image record");
        const auto decoded = Pastiche::Data::load_image(styled);
        Check(decoded.min().item<float>() == 255.0f, "[0, 255] pixels are written as full intensity");

        for (int index = 0; index < 3; ++index) {
            Check(fs::is_regular_file(dir.path() / "images" / "batch_preview" / ("step_20_" + std::to_string(index) + ".png")),
                  "batch record " + std::to_string(index));
        }
        Check(!fs::exists(dir.path() / "images" / "batch_preview" / "step_20_3.png"), "at most three images per record");
        const auto preview = Pastiche::Data::load_image(dir.path() / "images" / "batch_preview" / "step_20_0.png");
        Check(preview.max().item<float>() == 51.0f, "pixels keep their intensity after scaling by 1/255");
    }

    void EmptyWindowsCannotBeReported()
    {
        TempDir dir("report_empty");
        auto reporter = Report::Reporter({.directory = dir.path(), .stream = nullptr});
        CheckThrows<std::logic_error>([&] { reporter.emit(5, Metric::Training(), {}); }, "an empty window must not be reported");
        CheckThrows<std::invalid_argument>([&] { reporter.emit(0, FilledMetrics(1, 1, 1, 1), {}); }, "step zero");
        CheckThrows<std::invalid_argument>([&] { (void)Report::sanitize_tag("  "); }, "blank tag");
        Check(Report::sanitize_tag("Content Image") == "content_image", "tags become directory names");
    }
}

int main()
{
    return Run("report", {
        {"summary line lists four metrics", SummaryLineListsFourMetrics},
        {"emit appends scalar records", EmitAppendsScalarRecords},
        {"emit writes scaled images", EmitWritesScaledImages},
        {"empty windows cannot be reported", EmptyWindowsCannotBeReported},
    });
}
