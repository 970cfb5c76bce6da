#ifndef PASTICHE_CHECKPOINT_MANAGER_HPP
#define PASTICHE_CHECKPOINT_MANAGER_HPP

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <optional>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include <torch/torch.h>

#include "../../common/save_load.hpp"
#include "state.hpp"

namespace Pastiche::Checkpoint::Details {

    struct ManagerOptions {
        std::filesystem::path directory{};
        std::size_t max_to_keep{3};
    };

    inline constexpr const char* kPointerFile = "checkpoint";
    inline constexpr const char* kManifestFile = "manifest.json";
    inline constexpr const char* kParametersFile = "parameters.pt";
    inline constexpr const char* kOptimizerFile = "optimizer.bin";
    inline constexpr const char* kSnapshotPrefix = "ckpt-";
    inline constexpr const char* kStagingSuffix = ".partial";
    inline constexpr int kFormatVersion = 1;

    namespace IO {
        namespace SaveLoad = Common::SaveLoad;

        inline void write_bytes(const std::filesystem::path& path, const std::string& bytes)
        {
            std::ofstream stream(path, std::ios::binary | std::ios::trunc);
            if (!stream) {
                throw std::runtime_error("Failed to open '" + path.string() + "' for writing.");
            }
            stream.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
            stream.flush();
            if (!stream) {
                throw std::runtime_error("Failed to write '" + path.string() + "'.");
            }
        }

        inline std::string read_bytes(const std::filesystem::path& path)
        {
            std::ifstream stream(path, std::ios::binary);
            if (!stream) {
                throw std::runtime_error("Failed to open '" + path.string() + "' for reading.");
            }
            return std::string(std::istreambuf_iterator<char>(stream), std::istreambuf_iterator<char>());
        }

        inline std::uintmax_t file_size(const std::filesystem::path& path)
        {
            std::error_code error;
            const auto size = std::filesystem::file_size(path, error);
            if (error) {
                throw std::runtime_error("Cannot stat '" + path.string() + "': " + error.message());
            }
            return size;
        }

        [[nodiscard]] inline bool is_snapshot_name(const std::string& name)
        {
            const std::string prefix{kSnapshotPrefix};
            const std::string suffix{kStagingSuffix};
            if (name.rfind(prefix, 0) != 0 || name.size() == prefix.size()) {
                return false;
            }
            if (name.size() >= suffix.size() && name.compare(name.size() - suffix.size(), suffix.size(), suffix) == 0) {
                return false;
            }
            return std::all_of(name.begin() + static_cast<std::ptrdiff_t>(prefix.size()), name.end(),
                               [](unsigned char c) { return std::isdigit(c) != 0; });
        }

        [[nodiscard]] inline bool is_staging_name(const std::string& name)
        {
            const std::string suffix{kStagingSuffix};
            return name.size() > suffix.size()
                && name.compare(name.size() - suffix.size(), suffix.size(), suffix) == 0
                && is_snapshot_name(name.substr(0, name.size() - suffix.size()));
        }

        // Step encoded in a snapshot name; the name must pass is_snapshot_name.
        inline std::uint64_t snapshot_step(const std::string& name)
        {
            try {
                return std::stoull(name.substr(std::string(kSnapshotPrefix).size()));
            } catch (const std::out_of_range&) {
                throw std::runtime_error("Snapshot name '" + name + "' encodes an out of range step.");
            }
        }

        inline void write_snapshot(const std::filesystem::path& target, const TrainingState& state)
        {
            namespace fs = std::filesystem;
            fs::create_directories(target);

            std::vector<std::string> names;
            std::vector<torch::Tensor> tensors;
            names.reserve(state.parameters.size());
            tensors.reserve(state.parameters.size());
            for (const auto& item : state.parameters) {
                names.push_back(item.key());
                tensors.push_back(item.value().detach().to(torch::kCPU).contiguous());
            }

            const auto parameters_path = target / kParametersFile;
            try {
                torch::save(tensors, parameters_path.string());
            } catch (const c10::Error& error) {
                throw std::runtime_error("Failed to write parameter archive '" + parameters_path.string() + "': " + error.what());
            }

            const auto optimizer_path = target / kOptimizerFile;
            write_bytes(optimizer_path, state.optimizer_state);

            SaveLoad::PropertyTree manifest;
            manifest.put("format", kFormatVersion);
            manifest.put("step", state.step);
            manifest.add_child("parameters", SaveLoad::Detail::write_array(names));
            manifest.put("files.parameters.name", kParametersFile);
            manifest.put("files.parameters.bytes", file_size(parameters_path));
            manifest.put("files.optimizer.name", kOptimizerFile);
            manifest.put("files.optimizer.bytes", file_size(optimizer_path));
            SaveLoad::write_json_file(target / kManifestFile, manifest);
        }

        inline TrainingState read_snapshot(const std::filesystem::path& source)
        {
            namespace fs = std::filesystem;
            const auto context = "checkpoint '" + source.string() + "'";
            const auto manifest_path = source / kManifestFile;
            if (!fs::is_regular_file(manifest_path)) {
                throw std::runtime_error("Manifest not found for " + context + ".");
            }

            const auto manifest = SaveLoad::read_json_file(manifest_path);
            const auto format = SaveLoad::Detail::get_numeric<int>(manifest, "format", context);
            if (format != kFormatVersion) {
                throw std::runtime_error("Unsupported format " + std::to_string(format) + " in " + context + ".");
            }

            TrainingState state{};
            state.step = SaveLoad::Detail::get_numeric<std::int64_t>(manifest, "step", context);
            if (state.step < 1) {
                throw std::runtime_error("Invalid step " + std::to_string(state.step) + " in " + context + ".");
            }

            auto names_node = manifest.get_child_optional("parameters");
            if (!names_node) {
                throw std::runtime_error("Manifest of " + context + " is missing the 'parameters' entry.");
            }
            const auto names = SaveLoad::Detail::read_array<std::string>(*names_node, context);

            const auto parameters_path = source / SaveLoad::Detail::get_string(manifest, "files.parameters.name", context);
            const auto optimizer_path = source / SaveLoad::Detail::get_string(manifest, "files.optimizer.name", context);
            const auto expect_size = [&](const fs::path& path, const char* key) {
                const auto expected = SaveLoad::Detail::get_numeric<std::uintmax_t>(manifest, key, context);
                if (!fs::is_regular_file(path) || file_size(path) != expected) {
                    throw std::runtime_error("File '" + path.string() + "' of " + context + " is missing or truncated.");
                }
            };
            expect_size(parameters_path, "files.parameters.bytes");
            expect_size(optimizer_path, "files.optimizer.bytes");

            std::vector<torch::Tensor> tensors;
            try {
                torch::load(tensors, parameters_path.string());
            } catch (const c10::Error& error) {
                throw std::runtime_error("Failed to read parameter archive of " + context + ": " + error.what());
            }
            if (tensors.size() != names.size()) {
                throw std::runtime_error("Parameter archive of " + context + " holds " + std::to_string(tensors.size())
                                         + " tensors but the manifest lists " + std::to_string(names.size()) + ".");
            }
            for (std::size_t index = 0; index < names.size(); ++index) {
                state.parameters.insert(names[index], std::move(tensors[index]));
            }

            state.optimizer_state = read_bytes(optimizer_path);
            return state;
        }
    }

    // Persists TrainingState snapshots under one directory. A snapshot is staged
    // under "<name>.partial" and renamed into place once complete; the pointer
    // file is replaced last and is the commit record. Snapshot directories it
    // does not list are uncommitted: `restore` ignores them and `save` deletes them.
    class CheckpointManager {
    public:
        explicit CheckpointManager(ManagerOptions options)
            : options_(std::move(options))
        {
            if (options_.directory.empty()) {
                throw std::invalid_argument("Checkpoint directory must not be empty.");
            }
            if (options_.max_to_keep == 0) {
                throw std::invalid_argument("Checkpoint retention must keep at least one snapshot.");
            }
            if (auto pointer = read_pointer()) {
                checkpoints_ = std::move(pointer->second);
            }
        }

        // Latest committed snapshot, or nullopt when no pointer file exists.
        [[nodiscard]] std::optional<TrainingState> restore() const
        {
            auto pointer = read_pointer();
            if (!pointer) {
                return std::nullopt;
            }
            return IO::read_snapshot(options_.directory / pointer->first);
        }

        // Returns the path of the written snapshot.
        std::string save(const TrainingState& state)
        {
            namespace fs = std::filesystem;
            if (state.step < 1) {
                throw std::invalid_argument("Cannot checkpoint step " + std::to_string(state.step) + ".");
            }
            if (state.optimizer_state.empty()) {
                throw std::invalid_argument("Cannot checkpoint an empty optimizer state.");
            }

            fs::create_directories(options_.directory);
            const auto name = std::string(kSnapshotPrefix) + std::to_string(state.step);
            const auto target = options_.directory / name;
            auto staging = target;
            staging += kStagingSuffix;

            fs::remove_all(staging);
            IO::write_snapshot(staging, state);
            fs::remove_all(target);
            fs::rename(staging, target);

            auto retained = checkpoints_;
            retained.erase(std::remove(retained.begin(), retained.end(), name), retained.end());
            retained.push_back(name);
            std::vector<std::string> evicted;
            while (retained.size() > options_.max_to_keep) {
                evicted.push_back(retained.front());
                retained.erase(retained.begin());
            }

            write_pointer(name, retained);
            checkpoints_ = std::move(retained);

            for (const auto& old : evicted) {
                fs::remove_all(options_.directory / old);
            }
            remove_uncommitted();
            return target.string();
        }

        [[nodiscard]] std::optional<std::string> latest_checkpoint() const
        {
            if (checkpoints_.empty()) {
                return std::nullopt;
            }
            return (options_.directory / checkpoints_.back()).string();
        }

        // Retained snapshot names, oldest first.
        [[nodiscard]] const std::vector<std::string>& checkpoints() const noexcept { return checkpoints_; }
        [[nodiscard]] const ManagerOptions& options() const noexcept { return options_; }

    private:
        using Pointer = std::pair<std::string, std::vector<std::string>>;

        [[nodiscard]] std::optional<Pointer> read_pointer() const
        {
            namespace fs = std::filesystem;
            const auto path = options_.directory / kPointerFile;
            if (!fs::exists(path)) {
                return std::nullopt;
            }
            const auto context = "checkpoint pointer '" + path.string() + "'";
            const auto tree = Common::SaveLoad::read_json_file(path);
            auto latest = Common::SaveLoad::Detail::get_string(tree, "latest", context);
            auto all_node = tree.get_child_optional("all");
            if (!all_node) {
                throw std::runtime_error("The " + context + " is missing the 'all' entry.");
            }
            auto all = Common::SaveLoad::Detail::read_array<std::string>(*all_node, context);
            if (!IO::is_snapshot_name(latest) || all.empty() || all.back() != latest) {
                throw std::runtime_error("The " + context + " names an invalid latest snapshot '" + latest + "'.");
            }
            // Every entry is a snapshot name; steps strictly ascend.
            std::optional<std::uint64_t> previous;
            for (const auto& entry : all) {
                if (!IO::is_snapshot_name(entry)) {
                    throw std::runtime_error("The " + context + " lists an invalid snapshot '" + entry + "'.");
                }
                const auto step = IO::snapshot_step(entry);
                if (previous && step <= *previous) {
                    throw std::runtime_error("The " + context + " lists snapshot '" + entry
                                             + "' out of order or more than once.");
                }
                previous = step;
            }
            return Pointer{std::move(latest), std::move(all)};
        }

        void write_pointer(const std::string& latest, const std::vector<std::string>& all) const
        {
            Common::SaveLoad::PropertyTree tree;
            tree.put("latest", latest);
            tree.add_child("all", Common::SaveLoad::Detail::write_array(all));
            Common::SaveLoad::replace_json_file(options_.directory / kPointerFile, tree);
        }

        // Deletes snapshot and staging directories the pointer does not list.
        void remove_uncommitted() const
        {
            namespace fs = std::filesystem;
            std::vector<fs::path> stale;
            for (const auto& entry : fs::directory_iterator(options_.directory)) {
                const auto name = entry.path().filename().string();
                if (!entry.is_directory()) {
                    continue;
                }
                const bool listed = std::find(checkpoints_.begin(), checkpoints_.end(), name) != checkpoints_.end();
                if (IO::is_staging_name(name) || (IO::is_snapshot_name(name) && !listed)) {
                    stale.push_back(entry.path());
                }
            }
            for (const auto& path : stale) {
                fs::remove_all(path);
            }
        }

        ManagerOptions options_;
        std::vector<std::string> checkpoints_{};
    };

}

#endif // PASTICHE_CHECKPOINT_MANAGER_HPP
