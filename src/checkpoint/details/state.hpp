#ifndef PASTICHE_CHECKPOINT_STATE_HPP
#define PASTICHE_CHECKPOINT_STATE_HPP

#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>

#include <torch/torch.h>

#include "../../common/types.hpp"
#include "../../optimizer/optimizer.hpp"

namespace Pastiche::Checkpoint::Details {

    // Unit of checkpoint persistence. Tensors are detached CPU copies, so a
    // captured state stays frozen while training continues.
    struct TrainingState {
        std::int64_t step{1};
        std::string optimizer_state{};
        torch::OrderedDict<std::string, torch::Tensor> parameters{};
    };

    // Parameters followed by buffers, keyed by their module path.
    [[nodiscard]] inline torch::OrderedDict<std::string, torch::Tensor> named_state(const torch::nn::Module& module)
    {
        torch::OrderedDict<std::string, torch::Tensor> state;
        for (const auto& item : module.named_parameters(/*recurse=*/true)) {
            state.insert(item.key(), item.value());
        }
        for (const auto& item : module.named_buffers(/*recurse=*/true)) {
            if (item.value().defined()) {
                state.insert(item.key(), item.value());
            }
        }
        return state;
    }

    [[nodiscard]] inline TrainingState capture(std::int64_t step,
                                               const torch::nn::Module& transformer,
                                               const torch::optim::Optimizer& optimizer)
    {
        if (step < 1) {
            throw std::invalid_argument("Training step must start at 1.");
        }
        TrainingState state{};
        state.step = step;
        state.optimizer_state = Optimizer::save_state(optimizer);
        for (const auto& item : named_state(transformer)) {
            state.parameters.insert(item.key(), item.value().detach().to(torch::kCPU).clone());
        }
        return state;
    }

    // Loads `state` into the live transformer and optimizer. Either every piece
    // is applied or, on failure, both objects are left as they were.
    inline void apply(const TrainingState& state,
                      torch::nn::Module& transformer,
                      torch::optim::Optimizer& optimizer)
    {
        auto live = named_state(transformer);
        if (live.size() != state.parameters.size()) {
            throw std::runtime_error("Checkpoint holds " + std::to_string(state.parameters.size())
                                     + " tensors but the transformer exposes " + std::to_string(live.size()) + ".");
        }
        for (const auto& item : live) {
            const auto* stored = state.parameters.find(item.key());
            if (stored == nullptr) {
                throw std::runtime_error("Checkpoint is missing parameter '" + item.key() + "'.");
            }
            if (!stored->defined()) {
                throw std::runtime_error("Checkpoint parameter '" + item.key() + "' is undefined.");
            }
            if (stored->sizes() != item.value().sizes()) {
                throw std::runtime_error("Parameter '" + item.key() + "' shape mismatch: expected "
                                         + Common::format_shape(item.value()) + " but found "
                                         + Common::format_shape(*stored) + ".");
            }
        }

        const auto rollback = Optimizer::save_state(optimizer);
        try {
            Optimizer::load_state(optimizer, state.optimizer_state);
        } catch (const std::exception&) {
            Optimizer::load_state(optimizer, rollback);
            throw;
        }

        torch::NoGradGuard no_grad{};
        for (auto& item : live) {
            item.value().copy_(state.parameters[item.key()]);
        }
    }

}

#endif // PASTICHE_CHECKPOINT_STATE_HPP
