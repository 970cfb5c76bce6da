#ifndef PASTICHE_CHECKPOINT_HPP
#define PASTICHE_CHECKPOINT_HPP
// This file is a factory, must exempt it from any logical-code. For functions look into "/details"

#include "details/state.hpp"
#include "details/manager.hpp"

namespace Pastiche::Checkpoint {
    using TrainingState = Details::TrainingState;
    using ManagerOptions = Details::ManagerOptions;
    using CheckpointManager = Details::CheckpointManager;

    using Details::apply;
    using Details::capture;

    [[nodiscard]] inline auto Manager(const ManagerOptions& options) -> CheckpointManager {
        return CheckpointManager(options);
    }
}

#endif // PASTICHE_CHECKPOINT_HPP
