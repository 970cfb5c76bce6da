#ifndef PASTICHE_DATA_FOLDER_HPP
#define PASTICHE_DATA_FOLDER_HPP

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <torch/torch.h>

#include "image.hpp"

namespace Pastiche::Data::Details {

    struct ImageFolderOptions {
        std::int64_t image_size{256};
        bool recursive{true};
    };

    inline std::vector<std::filesystem::path> collect_image_files(const std::filesystem::path& directory, bool recursive)
    {
        namespace fs = std::filesystem;
        std::vector<fs::path> files;
        const auto add_if_supported = [&](const fs::path& candidate) {
            if (fs::is_regular_file(candidate) && has_image_extension(candidate)) {
                files.push_back(candidate);
            }
        };

        if (!fs::is_directory(directory)) {
            throw std::runtime_error("Image folder not found: " + directory.string());
        }

        if (recursive) {
            for (const auto& entry : fs::recursive_directory_iterator(directory)) {
                add_if_supported(entry.path());
            }
        } else {
            for (const auto& entry : fs::directory_iterator(directory)) {
                add_if_supported(entry.path());
            }
        }

        std::sort(files.begin(), files.end());
        return files;
    }

    // Lazily decoded images under a directory; every sample is a
    // (image_size, image_size, 3) float tensor in [0, 255].
    class ImageFolder : public torch::data::datasets::Dataset<ImageFolder, torch::data::TensorExample> {
    public:
        ImageFolder(const std::filesystem::path& root, ImageFolderOptions options)
            : options_(options), files_(collect_image_files(root, options.recursive))
        {
            if (options_.image_size <= 0) {
                throw std::invalid_argument("ImageFolder requires a positive image size.");
            }
            if (files_.empty()) {
                throw std::runtime_error("Image folder '" + root.string() + "' contains no supported files.");
            }
        }

        torch::data::TensorExample get(std::size_t index) override
        {
            const auto& path = files_.at(index);
            auto image = resize_with_crop_or_pad(load_image(path), options_.image_size, options_.image_size);
            return torch::data::TensorExample(image.squeeze(0));
        }

        [[nodiscard]] torch::optional<std::size_t> size() const override
        {
            return files_.size();
        }

        [[nodiscard]] const std::vector<std::filesystem::path>& files() const noexcept { return files_; }

    private:
        ImageFolderOptions options_;
        std::vector<std::filesystem::path> files_;
    };

    struct LoaderOptions {
        std::size_t batch_size{4};
        std::size_t workers{2};
    };

    // Random order reshuffled on every pass; the trailing partial batch is
    // dropped so each batch has exactly `batch_size` images.
    inline auto make_loader(ImageFolder dataset, const LoaderOptions& options)
    {
        if (options.batch_size == 0) {
            throw std::invalid_argument("Data loader requires a positive batch size.");
        }
        const auto samples = *dataset.size();
        if (samples < options.batch_size) {
            throw std::invalid_argument("Image folder holds " + std::to_string(samples)
                                        + " images, fewer than one batch of " + std::to_string(options.batch_size) + ".");
        }
        return torch::data::make_data_loader<torch::data::samplers::RandomSampler>(
            std::move(dataset).map(torch::data::transforms::Stack<torch::data::TensorExample>()),
            torch::data::DataLoaderOptions()
                .batch_size(options.batch_size)
                .workers(options.workers)
                .drop_last(true));
    }

}

#endif // PASTICHE_DATA_FOLDER_HPP
