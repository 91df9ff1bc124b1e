#ifndef STRATA_COMMON_CHECKPOINT_HPP
#define STRATA_COMMON_CHECKPOINT_HPP
/*
 * Stage checkpoints.
 * ---------------------------------------------------------------------------
 * One LibTorch archive per completed stage, `<dir>/stage<N>.pt`:
 *
 *   stage, resolution                 integers
 *   generator, generator_ema,         nested module archives
 *   discriminator
 *   optimizer_generator,              nested optimizer archives
 *   optimizer_discriminator
 *
 * Saving goes through a temporary file renamed into place, so a crash never
 * leaves a truncated stage<N>.pt behind. Loading rebuilds fresh networks at
 * the recorded stage, checks every parameter name and shape against the
 * archive, loads both optimizers, and only then returns the bundle; nothing
 * the caller owns is touched when any of that fails.
 */

#include <cstdint>
#include <filesystem>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <torch/torch.h>

#include "../ema/ema.hpp"
#include "../network/network.hpp"
#include "../optimizer/optimizer.hpp"
#include "../training/context.hpp"

namespace Strata::Common::Checkpoint {

    inline constexpr const char* kStage = "stage";
    inline constexpr const char* kResolution = "resolution";
    inline constexpr const char* kGenerator = "generator";
    inline constexpr const char* kGeneratorEMA = "generator_ema";
    inline constexpr const char* kDiscriminator = "discriminator";
    inline constexpr const char* kOptimizerGenerator = "optimizer_generator";
    inline constexpr const char* kOptimizerDiscriminator = "optimizer_discriminator";

    [[nodiscard]] inline std::filesystem::path path_for(const std::filesystem::path& directory, std::int64_t stage)
    {
        return directory / ("stage" + std::to_string(stage) + ".pt");
    }

    struct Blueprint {
        Network::GeneratorOptions generator{};
        Network::DiscriminatorOptions discriminator{};
        Optimizer::AdamOptions generator_optimizer{};
        Optimizer::AdamOptions discriminator_optimizer{};
        torch::Device device{torch::kCPU};
        torch::Device shadow_device{torch::kCPU};
    };

    // Everything a trainer needs to continue after `stage`. Move-only.
    struct Restored {
        std::int64_t stage{0};
        Network::Generator generator{nullptr};
        Network::Discriminator discriminator{nullptr};
        std::unique_ptr<EMA::Shadow> shadow{};
        std::unique_ptr<Optimizer::Binding> generator_optimizer{};
        std::unique_ptr<Optimizer::Binding> discriminator_optimizer{};
    };

    namespace Details {
        inline std::string format_shape(const torch::Tensor& tensor)
        {
            std::ostringstream stream;
            stream << tensor.sizes();
            return stream.str();
        }

        inline torch::serialize::InputArchive child(torch::serialize::InputArchive& parent,
                                                    const std::string& key,
                                                    const std::string& context)
        {
            torch::serialize::InputArchive nested;
            if (!parent.try_read(key, nested)) {
                throw std::runtime_error("Checkpoint " + context + " is missing '" + key + "'.");
            }
            return nested;
        }

        inline std::int64_t read_integer(torch::serialize::InputArchive& archive, const std::string& key, const std::string& context)
        {
            c10::IValue value;
            if (!archive.try_read(key, value) || !value.isInt()) {
                throw std::runtime_error("Checkpoint " + context + " has no integer '" + key + "'.");
            }
            return value.toInt();
        }

        // Module::save nests one archive per submodule, so a dotted parameter name is a path.
        inline torch::Tensor read_nested_tensor(torch::serialize::InputArchive& root, const std::string& dotted_key)
        {
            std::vector<std::string> parts;
            std::stringstream stream(dotted_key);
            std::string part;
            while (std::getline(stream, part, '.')) {
                parts.push_back(part);
            }
            if (parts.empty()) {
                return {};
            }

            std::vector<torch::serialize::InputArchive> trail;
            trail.reserve(parts.size());
            torch::serialize::InputArchive* current = &root;
            for (std::size_t i = 0; i + 1 < parts.size(); ++i) {
                trail.emplace_back();
                if (!current->try_read(parts[i], trail.back())) {
                    return {};
                }
                current = &trail.back();
            }
            torch::Tensor tensor;
            if (!current->try_read(parts.back(), tensor)) {
                return {};
            }
            return tensor;
        }

        inline void validate_module(torch::serialize::InputArchive& archive, torch::nn::Module& module, const std::string& label)
        {
            for (const auto& item : module.named_parameters(/*recurse=*/true)) {
                const auto stored = read_nested_tensor(archive, item.key());
                if (!stored.defined()) {
                    throw std::runtime_error("Checkpoint " + label + " is missing parameter '" + item.key() + "'.");
                }
                if (stored.sizes() != item.value().sizes()) {
                    throw std::runtime_error("Checkpoint " + label + " parameter '" + item.key() + "' shape mismatch: expected "
                                             + format_shape(item.value()) + " but found " + format_shape(stored) + ".");
                }
            }
        }

        inline void load_module(torch::serialize::InputArchive& root, const std::string& key, torch::nn::Module& module)
        {
            auto archive = child(root, key, "archive");
            validate_module(archive, module, "'" + key + "'");
            try {
                module.load(archive);
            } catch (const c10::Error& error) {
                throw std::runtime_error("Failed to load '" + key + "' from checkpoint: " + error.what_without_backtrace());
            }
        }

        inline void load_optimizer(torch::serialize::InputArchive& root, const std::string& key, Optimizer::Binding& binding)
        {
            auto archive = child(root, key, "archive");
            try {
                binding.load(archive);
            } catch (const c10::Error& error) {
                throw std::runtime_error("Failed to load '" + key + "' from checkpoint: " + error.what_without_backtrace());
            }
        }

        // Checkpoints are taken at stage boundaries, where every network is Base (stage 1) or Stable.
        template <typename Network>
        void rebuild_to(Network& network, std::int64_t stage)
        {
            while (network->stage() < stage) {
                network->grow_network();
                network->flush_network();
            }
        }
    }

    inline std::filesystem::path save(const std::filesystem::path& directory, std::int64_t stage, Training::Context& context)
    {
        namespace fs = std::filesystem;
        fs::create_directories(directory);
        const auto target = path_for(directory, stage);
        auto temporary = target;
        temporary += ".tmp";

        torch::serialize::OutputArchive root;
        root.write(kStage, c10::IValue(stage));
        root.write(kResolution, c10::IValue(context.generator->resolution()));

        torch::serialize::OutputArchive generator;
        context.generator->save(generator);
        root.write(kGenerator, generator);

        torch::serialize::OutputArchive shadow;
        context.shadow.network()->save(shadow);
        root.write(kGeneratorEMA, shadow);

        torch::serialize::OutputArchive discriminator;
        context.discriminator->save(discriminator);
        root.write(kDiscriminator, discriminator);

        torch::serialize::OutputArchive generator_optimizer;
        context.generator_optimizer.save(generator_optimizer);
        root.write(kOptimizerGenerator, generator_optimizer);

        torch::serialize::OutputArchive discriminator_optimizer;
        context.discriminator_optimizer.save(discriminator_optimizer);
        root.write(kOptimizerDiscriminator, discriminator_optimizer);

        try {
            root.save_to(temporary.string());
        } catch (const c10::Error& error) {
            throw std::runtime_error("Failed to write checkpoint '" + temporary.string() + "': " + error.what_without_backtrace());
        }
        fs::rename(temporary, target);
        return target;
    }

    [[nodiscard]] inline Restored load(const std::filesystem::path& path, const Blueprint& blueprint, std::int64_t total_stages)
    {
        if (!std::filesystem::exists(path)) {
            throw std::runtime_error("Checkpoint not found at '" + path.string() + "'.");
        }

        torch::serialize::InputArchive root;
        try {
            root.load_from(path.string(), blueprint.device);
        } catch (const c10::Error& error) {
            throw std::runtime_error("Failed to open checkpoint '" + path.string() + "': " + error.what_without_backtrace());
        }

        Restored restored{};
        restored.stage = Details::read_integer(root, kStage, "'" + path.string() + "'");
        if (restored.stage < 1 || restored.stage > total_stages) {
            throw std::runtime_error("Checkpoint '" + path.string() + "' records stage " + std::to_string(restored.stage)
                                     + ", outside 1.." + std::to_string(total_stages) + ".");
        }

        restored.generator = Network::Generator(blueprint.generator);
        restored.discriminator = Network::Discriminator(blueprint.discriminator);
        Details::rebuild_to(restored.generator, restored.stage);
        Details::rebuild_to(restored.discriminator, restored.stage);

        const auto resolution = Details::read_integer(root, kResolution, "'" + path.string() + "'");
        if (resolution != restored.generator->resolution()) {
            throw std::runtime_error("Checkpoint '" + path.string() + "' records resolution " + std::to_string(resolution)
                                     + " but stage " + std::to_string(restored.stage) + " runs at "
                                     + std::to_string(restored.generator->resolution()) + ".");
        }

        restored.generator->to(blueprint.device);
        restored.discriminator->to(blueprint.device);
        Details::load_module(root, kGenerator, *restored.generator);
        Details::load_module(root, kDiscriminator, *restored.discriminator);

        restored.shadow = std::make_unique<EMA::Shadow>(restored.generator, blueprint.shadow_device);
        Details::load_module(root, kGeneratorEMA, *restored.shadow->network());
        restored.shadow->to(blueprint.shadow_device);

        restored.generator_optimizer = std::make_unique<Optimizer::Binding>(restored.generator->parameters(),
                                                                            blueprint.generator_optimizer);
        restored.discriminator_optimizer = std::make_unique<Optimizer::Binding>(restored.discriminator->parameters(),
                                                                                blueprint.discriminator_optimizer);
        Details::load_optimizer(root, kOptimizerGenerator, *restored.generator_optimizer);
        Details::load_optimizer(root, kOptimizerDiscriminator, *restored.discriminator_optimizer);
        return restored;
    }
}

#endif // STRATA_COMMON_CHECKPOINT_HPP
