#ifndef PASTICHE_NETWORK_TRANSFORMER_NET_HPP
#define PASTICHE_NETWORK_TRANSFORMER_NET_HPP

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

#include <torch/torch.h>

#include "base.hpp"

namespace Pastiche::Network::Details {

    // Reflection padded convolution.
    struct ConvLayerImpl : torch::nn::Module {
        ConvLayerImpl(std::int64_t in_channels, std::int64_t out_channels, std::int64_t kernel_size, std::int64_t stride)
            : pad(torch::nn::ReflectionPad2dOptions(kernel_size / 2)),
              conv(torch::nn::Conv2dOptions(in_channels, out_channels, kernel_size).stride(stride))
        {
            register_module("pad", pad);
            register_module("conv", conv);
        }

        torch::Tensor forward(const torch::Tensor& x) {
            return conv->forward(pad->forward(x));
        }

        torch::nn::ReflectionPad2d pad;
        torch::nn::Conv2d conv;
    };
    TORCH_MODULE(ConvLayer);

    struct ResidualBlockImpl : torch::nn::Module {
        explicit ResidualBlockImpl(std::int64_t channels)
            : conv1(channels, channels, 3, 1),
              in1(torch::nn::InstanceNorm2dOptions(channels).affine(true)),
              conv2(channels, channels, 3, 1),
              in2(torch::nn::InstanceNorm2dOptions(channels).affine(true))
        {
            register_module("conv1", conv1);
            register_module("in1", in1);
            register_module("conv2", conv2);
            register_module("in2", in2);
        }

        torch::Tensor forward(const torch::Tensor& x) {
            auto out = torch::relu(in1->forward(conv1->forward(x)));
            out = in2->forward(conv2->forward(out));
            return out + x;
        }

        ConvLayer conv1;
        torch::nn::InstanceNorm2d in1;
        ConvLayer conv2;
        torch::nn::InstanceNorm2d in2;
    };
    TORCH_MODULE(ResidualBlock);

    // Nearest upsampling to an explicit size, then convolution. Upsampling to
    // the encoder's recorded sizes keeps odd input sizes intact.
    struct UpsampleConvLayerImpl : torch::nn::Module {
        UpsampleConvLayerImpl(std::int64_t in_channels, std::int64_t out_channels, std::int64_t kernel_size)
            : conv(in_channels, out_channels, kernel_size, 1)
        {
            register_module("conv", conv);
        }

        torch::Tensor forward(const torch::Tensor& x, std::vector<std::int64_t> size) {
            namespace F = torch::nn::functional;
            auto upsampled = F::interpolate(x, F::InterpolateFuncOptions().size(size).mode(torch::kNearest));
            return conv->forward(upsampled);
        }

        ConvLayer conv;
    };
    TORCH_MODULE(UpsampleConvLayer);

    struct TransformerNetOptions {
        std::int64_t base_channels{32};
        std::int64_t residual_blocks{5};

        [[nodiscard]] const TransformerNetOptions& validated() const {
            if (base_channels <= 0 || residual_blocks < 0) {
                throw std::invalid_argument("TransformerNet requires positive channels and a non-negative block count.");
            }
            return *this;
        }
    };

    // Feed-forward stylization network: strided convolutional encoder,
    // residual trunk, upsampling decoder, instance normalisation throughout.
    class TransformerNet : public StyleTransformer {
    public:
        explicit TransformerNet(TransformerNetOptions options = {})
            : options_(options.validated()),
              conv1(3, options.base_channels, 9, 1),
              in1(torch::nn::InstanceNorm2dOptions(options.base_channels).affine(true)),
              conv2(options.base_channels, options.base_channels * 2, 3, 2),
              in2(torch::nn::InstanceNorm2dOptions(options.base_channels * 2).affine(true)),
              conv3(options.base_channels * 2, options.base_channels * 4, 3, 2),
              in3(torch::nn::InstanceNorm2dOptions(options.base_channels * 4).affine(true)),
              deconv1(options.base_channels * 4, options.base_channels * 2, 3),
              in4(torch::nn::InstanceNorm2dOptions(options.base_channels * 2).affine(true)),
              deconv2(options.base_channels * 2, options.base_channels, 3),
              in5(torch::nn::InstanceNorm2dOptions(options.base_channels).affine(true)),
              deconv3(options.base_channels, 3, 9, 1)
        {
            register_module("conv1", conv1);
            register_module("in1", in1);
            register_module("conv2", conv2);
            register_module("in2", in2);
            register_module("conv3", conv3);
            register_module("in3", in3);
            for (std::int64_t index = 0; index < options.residual_blocks; ++index) {
                residuals.push_back(register_module("res" + std::to_string(index + 1),
                                                    ResidualBlock(options.base_channels * 4)));
            }
            register_module("deconv1", deconv1);
            register_module("in4", in4);
            register_module("deconv2", deconv2);
            register_module("in5", in5);
            register_module("deconv3", deconv3);
        }

        torch::Tensor forward(const torch::Tensor& images) override {
            Common::check_image_batch(images, "TransformerNet");
            auto x = images.permute({0, 3, 1, 2}).div(255.0);

            const std::vector<std::int64_t> full_size{x.size(2), x.size(3)};
            x = torch::relu(in1->forward(conv1->forward(x)));
            x = torch::relu(in2->forward(conv2->forward(x)));
            const std::vector<std::int64_t> half_size{x.size(2), x.size(3)};
            x = torch::relu(in3->forward(conv3->forward(x)));

            for (auto& block : residuals) {
                x = block->forward(x);
            }

            x = torch::relu(in4->forward(deconv1->forward(x, half_size)));
            x = torch::relu(in5->forward(deconv2->forward(x, full_size)));
            x = deconv3->forward(x);

            x = (torch::tanh(x) + 1.0) * 127.5;
            return x.permute({0, 2, 3, 1}).contiguous();
        }

        [[nodiscard]] const TransformerNetOptions& options() const noexcept { return options_; }

    private:
        TransformerNetOptions options_;
        ConvLayer conv1;
        torch::nn::InstanceNorm2d in1;
        ConvLayer conv2;
        torch::nn::InstanceNorm2d in2;
        ConvLayer conv3;
        torch::nn::InstanceNorm2d in3;
        std::vector<ResidualBlock> residuals{};
        UpsampleConvLayer deconv1;
        torch::nn::InstanceNorm2d in4;
        UpsampleConvLayer deconv2;
        torch::nn::InstanceNorm2d in5;
        ConvLayer deconv3;
    };

}

#endif // PASTICHE_NETWORK_TRANSFORMER_NET_HPP
