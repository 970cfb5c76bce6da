#ifndef PASTICHE_OPTIMIZER_HPP
#define PASTICHE_OPTIMIZER_HPP

#include "registry.hpp"

#include "details/adam.hpp"
#include "details/state.hpp"


namespace Pastiche::Optimizer {
    using AdamOptions = Details::AdamOptions;
    using AdamDescriptor = Details::AdamDescriptor;

    using Descriptor = AdamDescriptor;

    using Details::build_optimizer;
    using Details::load_state;
    using Details::save_state;

    [[nodiscard]] constexpr auto Adam(const AdamOptions& options = {}) noexcept -> AdamDescriptor {
        return AdamDescriptor{.options = options};
    }

}

#endif //PASTICHE_OPTIMIZER_HPP
