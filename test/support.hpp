#ifndef STRATA_TEST_SUPPORT_HPP
#define STRATA_TEST_SUPPORT_HPP

#include <cstdint>
#include <filesystem>
#include <map>
#include <ostream>
#include <memory>
#include <random>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include <torch/torch.h>

#include "../include/Strata.h"

namespace Strata::Testing {

    // 4 -> 8 -> 16 with a handful of channels: fast enough for the CPU.
    inline Network::GeneratorOptions tiny_generator(std::int64_t size = 16)
    {
        return Network::GeneratorOptions{.channels = 3, .latent_dim = 8, .init_size = 4, .size = size,
                                         .fmap_base = 32, .fmap_max = 8};
    }

    inline Network::DiscriminatorOptions tiny_discriminator(std::int64_t size = 16)
    {
        return Network::DiscriminatorOptions{.channels = 3, .init_size = 4, .size = size, .fmap_base = 32, .fmap_max = 8};
    }

    inline std::int64_t trainable_count(torch::nn::Module& module)
    {
        std::int64_t count = 0;
        for (const auto& parameter : module.parameters()) {
            if (parameter.requires_grad()) {
                count += parameter.numel();
            }
        }
        return count;
    }

    inline std::vector<std::string> parameter_names(torch::nn::Module& module)
    {
        std::vector<std::string> names;
        for (const auto& item : module.named_parameters(/*recurse=*/true)) {
            names.push_back(item.key());
        }
        return names;
    }

    // Two stages (4 -> 8) on the CPU, one epoch unit, no worker threads.
    inline Config::Options tiny_run(const std::filesystem::path& output_dir, std::ostream& stream)
    {
        Config::Options options{};
        options.latent_dim = 8;
        options.init_size = 4;
        options.size = 8;
        options.fmap_base = 32;
        options.fmap_max = 8;
        options.batch_size = 2;
        options.unit_epoch = 1;
        options.load_size = 8;
        options.workers = 0;
        options.device = "cpu";
        options.shadow_device = "cpu";
        options.log_every = 1;
        options.output_dir = output_dir.string();
        options.stream = &stream;
        return options;
    }

    // Owns what a Training::Context borrows.
    struct Rig {
        explicit Rig(std::int64_t size = 16)
            : generator(tiny_generator(size)),
              discriminator(tiny_discriminator(size)),
              shadow(std::make_unique<EMA::Shadow>(generator, torch::Device(torch::kCPU))),
              generator_optimizer(std::make_unique<Optimizer::Binding>(generator->parameters(), Optimizer::AdamOptions{})),
              discriminator_optimizer(std::make_unique<Optimizer::Binding>(discriminator->parameters(), Optimizer::AdamOptions{}))
        {
        }

        Training::Context context()
        {
            return Training::Context{generator, discriminator, *shadow, *generator_optimizer, *discriminator_optimizer,
                                     torch::Device(torch::kCPU), &log};
        }

        Network::Generator generator;
        Network::Discriminator discriminator;
        std::unique_ptr<EMA::Shadow> shadow;
        std::unique_ptr<Optimizer::Binding> generator_optimizer;
        std::unique_ptr<Optimizer::Binding> discriminator_optimizer;
        std::ostringstream log;
    };

    class RecordingSink final : public Monitor::Sink {
    public:
        void add_scalar(const std::string& tag, double value, std::int64_t step) override
        {
            history_[tag].emplace_back(step, value);
        }

        void add_image(const std::string& tag, const torch::Tensor& grid, std::int64_t step) override
        {
            images.emplace_back(tag + "@" + std::to_string(step), grid.sizes().vec());
        }

        [[nodiscard]] const Monitor::History& history() const override { return history_; }

        std::vector<std::pair<std::string, std::vector<std::int64_t>>> images{};

    private:
        Monitor::History history_{};
    };

    // Fresh directory under the system temp dir, removed on destruction.
    class ScratchDirectory {
    public:
        explicit ScratchDirectory(const std::string& stem)
        {
            std::random_device device;
            path_ = std::filesystem::temp_directory_path() / (stem + "_" + std::to_string(device()));
            std::filesystem::create_directories(path_);
        }

        ~ScratchDirectory()
        {
            std::error_code ignored;
            std::filesystem::remove_all(path_, ignored);
        }

        ScratchDirectory(const ScratchDirectory&) = delete;
        ScratchDirectory& operator=(const ScratchDirectory&) = delete;

        [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

    private:
        std::filesystem::path path_;
    };
}

#endif // STRATA_TEST_SUPPORT_HPP
