#ifndef PASTICHE_OPTIMIZER_STATE_HPP
#define PASTICHE_OPTIMIZER_STATE_HPP

#include <sstream>
#include <stdexcept>
#include <string>

#include <torch/torch.h>
#include <torch/optim/serialize.h>

namespace Pastiche::Optimizer::Details {

    // Serialises the optimizer (param groups and moment buffers) into an opaque blob.
    [[nodiscard]] inline std::string save_state(const torch::optim::Optimizer& optimizer)
    {
        torch::serialize::OutputArchive archive;
        optimizer.save(archive);
        std::ostringstream stream(std::ios::out | std::ios::binary);
        archive.save_to(stream);
        return stream.str();
    }

    inline void load_state(torch::optim::Optimizer& optimizer, const std::string& blob)
    {
        if (blob.empty()) {
            throw std::runtime_error("Optimizer state blob is empty.");
        }
        std::istringstream stream(blob, std::ios::in | std::ios::binary);
        torch::serialize::InputArchive archive;
        try {
            archive.load_from(stream);
            // Loading only overwrites the moments it finds; start from none.
            optimizer.state().clear();
            optimizer.load(archive);
        } catch (const c10::Error& error) {
            throw std::runtime_error(std::string("Failed to load optimizer state: ") + error.what());
        }
    }

}

#endif // PASTICHE_OPTIMIZER_STATE_HPP
