#ifndef PASTICHE_COMMON_TYPES_HPP
#define PASTICHE_COMMON_TYPES_HPP

#include <map>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <torch/torch.h>

namespace Pastiche {
    // Layer name -> activation. Ordered so every reduction over a bundle
    // visits layers in the same sequence.
    using NamedTensors = std::map<std::string, torch::Tensor>;

    struct FeatureBundle {
        NamedTensors style{};
        NamedTensors content{};
    };

    struct NamedImage {
        std::string name{};
        torch::Tensor image{};
    };

    namespace Common {
        [[nodiscard]] inline std::vector<std::string> keys_of(const NamedTensors& tensors)
        {
            std::vector<std::string> keys;
            keys.reserve(tensors.size());
            for (const auto& [name, tensor] : tensors) {
                (void)tensor;
                keys.push_back(name);
            }
            return keys;
        }

        [[nodiscard]] inline std::string join(const std::vector<std::string>& values, const char* separator = ", ")
        {
            std::ostringstream stream;
            for (std::size_t index = 0; index < values.size(); ++index) {
                if (index > 0) {
                    stream << separator;
                }
                stream << values[index];
            }
            return stream.str();
        }

        [[nodiscard]] inline std::string format_shape(const torch::Tensor& tensor)
        {
            if (!tensor.defined()) {
                return "(undefined)";
            }
            std::ostringstream stream;
            stream << '(';
            const auto sizes = tensor.sizes();
            for (std::size_t index = 0; index < sizes.size(); ++index) {
                if (index > 0) {
                    stream << ", ";
                }
                stream << sizes[index];
            }
            stream << ')';
            return stream.str();
        }

        // Image batches are (batch, height, width, 3).
        inline void check_image_batch(const torch::Tensor& images, const char* context)
        {
            if (!images.defined()) {
                throw std::invalid_argument(std::string(context) + " requires a defined image tensor.");
            }
            if (images.dim() != 4 || images.size(3) != 3) {
                throw std::invalid_argument(std::string(context) + " expects a (batch, height, width, 3) tensor but received "
                                            + format_shape(images) + ".");
            }
            if (!images.is_floating_point()) {
                throw std::invalid_argument(std::string(context) + " expects floating point pixels.");
            }
        }
    }
}

#endif // PASTICHE_COMMON_TYPES_HPP
