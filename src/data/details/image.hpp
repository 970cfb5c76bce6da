#ifndef PASTICHE_DATA_IMAGE_HPP
#define PASTICHE_DATA_IMAGE_HPP

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>

#include <torch/torch.h>

#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

#include "../../common/types.hpp"

namespace Pastiche::Data::Details {

    inline bool has_image_extension(const std::filesystem::path& path)
    {
        auto extension = path.extension().string();
        std::transform(extension.begin(), extension.end(), extension.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return extension == ".jpg" || extension == ".jpeg" || extension == ".png" || extension == ".bmp";
    }

    // Decodes an image file into a (1, height, width, 3) RGB float tensor in [0, 255].
    inline torch::Tensor load_image(const std::filesystem::path& path)
    {
        if (!std::filesystem::is_regular_file(path)) {
            throw std::runtime_error("Image file not found: " + path.string());
        }
        cv::Mat image = cv::imread(path.string(), cv::IMREAD_COLOR);
        if (image.empty()) {
            throw std::runtime_error("Failed to decode image: " + path.string());
        }

        cv::Mat image_float;
        image.convertTo(image_float, CV_32F);
        cv::cvtColor(image_float, image_float, cv::COLOR_BGR2RGB);
        if (!image_float.isContinuous()) {
            image_float = image_float.clone();
        }

        auto options = torch::TensorOptions().dtype(torch::kFloat32);
        auto tensor = torch::from_blob(image_float.data, {image_float.rows, image_float.cols, 3}, options).clone();
        return tensor.unsqueeze(0);
    }

    // Writes a (height, width, 3) or (1, height, width, 3) RGB tensor with values in [0, 1] as an 8 bit image.
    inline void write_image(const std::filesystem::path& path, const torch::Tensor& image)
    {
        if (!image.defined()) {
            throw std::invalid_argument("Cannot write an undefined image tensor.");
        }
        auto pixels = image.detach();
        if (pixels.dim() == 4) {
            if (pixels.size(0) != 1) {
                throw std::invalid_argument("write_image expects a single image but received "
                                            + Common::format_shape(pixels) + ".");
            }
            pixels = pixels.squeeze(0);
        }
        if (pixels.dim() != 3 || pixels.size(2) != 3) {
            throw std::invalid_argument("write_image expects a (height, width, 3) tensor but received "
                                        + Common::format_shape(pixels) + ".");
        }
        pixels = pixels.to(torch::kCPU, torch::kFloat32)
                     .clamp(0.0, 1.0)
                     .mul(255.0)
                     .round()
                     .to(torch::kUInt8)
                     .contiguous();

        const auto rows = static_cast<int>(pixels.size(0));
        const auto cols = static_cast<int>(pixels.size(1));
        cv::Mat rgb(rows, cols, CV_8UC3, pixels.data_ptr<std::uint8_t>());
        cv::Mat bgr;
        cv::cvtColor(rgb, bgr, cv::COLOR_RGB2BGR);

        if (path.has_parent_path()) {
            std::filesystem::create_directories(path.parent_path());
        }
        if (!cv::imwrite(path.string(), bgr)) {
            throw std::runtime_error("Failed to encode image: " + path.string());
        }
    }

    // Centre-crops or zero-pads the spatial axes of an NHWC batch to
    // (target_height, target_width). Each axis is handled independently.
    inline torch::Tensor resize_with_crop_or_pad(const torch::Tensor& images,
                                                 std::int64_t target_height,
                                                 std::int64_t target_width)
    {
        using torch::indexing::Slice;
        Common::check_image_batch(images, "resize_with_crop_or_pad");
        if (target_height <= 0 || target_width <= 0) {
            throw std::invalid_argument("resize_with_crop_or_pad requires a positive target size.");
        }

        auto result = images;
        const auto height = result.size(1);
        const auto width = result.size(2);

        if (height > target_height) {
            const auto offset = (height - target_height) / 2;
            result = result.index({Slice(), Slice(offset, offset + target_height), Slice(), Slice()});
        }
        if (width > target_width) {
            const auto offset = (width - target_width) / 2;
            result = result.index({Slice(), Slice(), Slice(offset, offset + target_width), Slice()});
        }

        const auto pad_height = std::max<std::int64_t>(target_height - result.size(1), 0);
        const auto pad_width = std::max<std::int64_t>(target_width - result.size(2), 0);
        if (pad_height > 0 || pad_width > 0) {
            const auto top = pad_height / 2;
            const auto left = pad_width / 2;
            result = torch::constant_pad_nd(result, {0, 0, left, pad_width - left, top, pad_height - top}, 0.0);
        }
        return result.contiguous();
    }

}

#endif // PASTICHE_DATA_IMAGE_HPP
