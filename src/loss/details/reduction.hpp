#ifndef PASTICHE_LOSS_REDUCTION_HPP
#define PASTICHE_LOSS_REDUCTION_HPP

#include <torch/torch.h>

namespace Pastiche::Loss::Details {

    namespace F = torch::nn::functional;

    enum class Reduction { Mean, Sum, None };

    inline torch::Tensor apply_reduction(torch::Tensor loss, Reduction reduction) {
        switch (reduction) {
            case Reduction::None:
                return loss;
            case Reduction::Sum:
                return loss.sum();
            case Reduction::Mean:
            default:
                return loss.mean();
        }
    }

    // Elementwise squared error; the target is expanded to the prediction's
    // shape, so a single-image target can be compared against a whole batch.
    inline torch::Tensor squared_error(const torch::Tensor& prediction,
                                       const torch::Tensor& target,
                                       Reduction reduction = Reduction::Mean) {
        auto target_tensor = target;
        if (target_tensor.device() != prediction.device() || target_tensor.scalar_type() != prediction.scalar_type()) {
            target_tensor = target_tensor.to(prediction.device(), prediction.scalar_type());
        }
        auto per_elem = F::mse_loss(
            prediction,
            target_tensor.expand_as(prediction),
            F::MSELossFuncOptions().reduction(torch::kNone));
        return apply_reduction(per_elem, reduction);
    }

}

#endif // PASTICHE_LOSS_REDUCTION_HPP
