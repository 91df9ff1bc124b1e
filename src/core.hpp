#ifndef STRATA_CORE_HPP
#define STRATA_CORE_HPP
/*
 * Core orchestrator.
 * ---------------------------------------------------------------------------
 *  - Owns the live generator and discriminator, the EMA shadow, both Adam
 *    bindings, the batch source and the metric sink.
 *  - Walks the curriculum stage by stage; inside a stage every tick goes
 *    through the controller (growth, fade-in, flush), real-data blending,
 *    one adversarial update and one EMA update.
 *  - Checkpoints at the end of every stage and resumes from one at the stage
 *    that follows it.
 *  - Everything a stage mutates is handed to the collaborators as a
 *    `Training::Context`; nothing lives in globals.
 */

#include <cstdint>
#include <filesystem>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <torch/torch.h>

#include "common/checkpoint.hpp"
#include "config/config.hpp"
#include "data/data.hpp"
#include "ema/ema.hpp"
#include "monitor/monitor.hpp"
#include "network/network.hpp"
#include "optimizer/optimizer.hpp"
#include "schedule/schedule.hpp"
#include "training/adversarial.hpp"
#include "training/context.hpp"
#include "utils/terminal.hpp"

namespace Strata::Core {

    namespace Details {
        inline torch::Device resolve_device(const std::string& name)
        {
            if (name == "auto") {
                return torch::cuda::is_available() ? torch::Device(torch::kCUDA) : torch::Device(torch::kCPU);
            }
            try {
                return torch::Device(name);
            } catch (const c10::Error& error) {
                throw std::invalid_argument("Unknown device '" + name + "': " + error.what_without_backtrace());
            }
        }

        inline std::unique_ptr<Data::Source> make_source(const Config::Options& options)
        {
            std::vector<std::filesystem::path> files;
            if (!options.manifest.empty()) {
                Data::Type::Manifest manifest{options.manifest, {}};
                manifest.parameters.root = options.dataset_root;
                files = Data::Load::list_images(manifest);
            } else if (!options.dataset_root.empty()) {
                files = Data::Load::list_images(Data::Type::ImageFolder{options.dataset_root, {}});
            } else {
                throw std::invalid_argument("No training data: set dataset_root or manifest, or pass a batch source.");
            }

            Data::Transform::Augmentation::Options::PipelineOptions pipeline{};
            pipeline.load_size = static_cast<int>(options.load_size);
            pipeline.size = static_cast<int>(options.size);

            Data::PrefetchOptions prefetch{};
            prefetch.batch_size = options.batch_size;
            prefetch.workers = static_cast<std::size_t>(options.workers);
            prefetch.prefetch = static_cast<std::size_t>(options.prefetch);
            prefetch.seed = options.seed;
            return std::make_unique<Data::PrefetchLoader>(
                Data::Load::ImageDataset(std::move(files), pipeline, options.channels), prefetch);
        }

        inline Optimizer::AdamOptions adam_options(const Config::Options& options)
        {
            Optimizer::AdamOptions adam{};
            adam.learning_rate = options.learning_rate;
            adam.beta1 = 0.0;
            adam.beta2 = 0.99;
            adam.eps = 1e-8;
            return adam;
        }
    }

    class Trainer {
    public:
        explicit Trainer(Config::Options options,
                         std::unique_ptr<Data::Source> source = nullptr,
                         std::unique_ptr<Monitor::Sink> sink = nullptr)
            : options_(std::move(options))
        {
            Config::validate(options_);
            device_ = Details::resolve_device(options_.device);
            shadow_device_ = Details::resolve_device(options_.shadow_device);
            torch::manual_seed(options_.seed);

            generator_ = Network::Generator(blueprint().generator);
            discriminator_ = Network::Discriminator(blueprint().discriminator);
            generator_->to(device_);
            discriminator_->to(device_);
            shadow_ = std::make_unique<EMA::Shadow>(generator_, shadow_device_);
            generator_optimizer_ = std::make_unique<Optimizer::Binding>(generator_->parameters(), Details::adam_options(options_));
            discriminator_optimizer_ = std::make_unique<Optimizer::Binding>(discriminator_->parameters(), Details::adam_options(options_));

            source_ = source ? std::move(source) : Details::make_source(options_);
            sink_ = sink ? std::move(sink) : std::make_unique<Monitor::DirectorySink>(options_.output_dir, options_.plot_curves);

            batches_per_epoch_ = source_->batches_per_epoch();
            controller_ = std::make_unique<Schedule::Controller>(
                options_.init_size, options_.size,
                Schedule::ticks_per_stage(options_.unit_epoch, options_.num_aug, batches_per_epoch_));

            fixed_z_ = Training::sample_latent(options_.batch_size, options_.latent_dim, torch::kCPU);

            if (!options_.resume.empty()) {
                resume(options_.resume);
            }
        }

        void train()
        {
            std::filesystem::create_directories(options_.output_dir);
            Config::save_json(options_, std::filesystem::path(options_.output_dir) / "config.json");

            const auto total = controller_->total_stages();
            if (first_stage_ > total) {
                Utils::Terminal::Info(options_.stream, "all " + std::to_string(total) + " stages already trained.");
                return;
            }
            Utils::Terminal::Info(options_.stream, "training on " + device_.str() + ", EMA on " + shadow_device_.str()
                                                       + ", " + std::to_string(batches_per_epoch_) + " batches per epoch, "
                                                       + std::to_string(controller_->tickers()) + " fade-in ticks per stage");
            for (std::int64_t stage = first_stage_; stage <= total; ++stage) {
                run_stage(stage);
                save_checkpoint(stage);
                if (options_.plot_curves) {
                    plot_curves(stage);
                }
            }
        }

        // Continue after the stage stored in `path`. The current networks, shadow and optimizers are
        // replaced only once the whole checkpoint has been read and validated.
        void resume(const std::filesystem::path& path)
        {
            auto restored = Common::Checkpoint::load(path, blueprint(), controller_->total_stages());

            generator_ = std::move(restored.generator);
            discriminator_ = std::move(restored.discriminator);
            shadow_ = std::move(restored.shadow);
            generator_optimizer_ = std::move(restored.generator_optimizer);
            discriminator_optimizer_ = std::move(restored.discriminator_optimizer);

            first_stage_ = restored.stage + 1;
            global_step_ = 0;
            for (std::int64_t stage = 1; stage <= restored.stage; ++stage) {
                global_step_ += Schedule::epochs_for_stage(options_.unit_epoch, stage) * options_.num_aug * batches_per_epoch_;
            }
            Utils::Terminal::Info(options_.stream, "resumed from " + path.string() + " (stage " + std::to_string(restored.stage)
                                                       + ", " + std::to_string(generator_->resolution()) + "x"
                                                       + std::to_string(generator_->resolution()) + ")");
        }

        std::filesystem::path save_checkpoint(std::int64_t stage)
        {
            auto ctx = context();
            const auto path = Common::Checkpoint::save(options_.output_dir, stage, ctx);
            Utils::Terminal::Info(options_.stream, "saved checkpoint " + path.string());
            return path;
        }

        [[nodiscard]] Training::Context context()
        {
            return Training::Context{generator_, discriminator_, *shadow_,
                                     *generator_optimizer_, *discriminator_optimizer_,
                                     device_, options_.stream};
        }

        [[nodiscard]] Common::Checkpoint::Blueprint blueprint() const
        {
            Common::Checkpoint::Blueprint blueprint{};
            blueprint.generator = Network::GeneratorOptions{options_.channels, options_.latent_dim, options_.init_size,
                                                            options_.size, options_.fmap_base, options_.fmap_max};
            blueprint.discriminator = Network::DiscriminatorOptions{options_.channels, options_.init_size, options_.size,
                                                                    options_.fmap_base, options_.fmap_max};
            blueprint.generator_optimizer = Details::adam_options(options_);
            blueprint.discriminator_optimizer = Details::adam_options(options_);
            blueprint.device = device_;
            blueprint.shadow_device = shadow_device_;
            return blueprint;
        }

        [[nodiscard]] std::int64_t display_cadence() const noexcept
        {
            if (options_.display_every > 0) {
                return options_.display_every;
            }
            return options_.unit_epoch > 10 ? 10 : 1;
        }

        [[nodiscard]] const Config::Options& options() const noexcept { return options_; }
        [[nodiscard]] Network::Generator& generator() noexcept { return generator_; }
        [[nodiscard]] Network::Discriminator& discriminator() noexcept { return discriminator_; }
        [[nodiscard]] EMA::Shadow& shadow() noexcept { return *shadow_; }
        [[nodiscard]] Optimizer::Binding& generator_optimizer() noexcept { return *generator_optimizer_; }
        [[nodiscard]] Optimizer::Binding& discriminator_optimizer() noexcept { return *discriminator_optimizer_; }
        [[nodiscard]] const Schedule::Controller& controller() const noexcept { return *controller_; }
        [[nodiscard]] Monitor::Sink& sink() noexcept { return *sink_; }
        [[nodiscard]] std::int64_t first_stage() const noexcept { return first_stage_; }
        [[nodiscard]] std::int64_t global_step() const noexcept { return global_step_; }
        [[nodiscard]] const torch::Tensor& fixed_latent() const noexcept { return fixed_z_; }

    private:
        void run_stage(std::int64_t stage)
        {
            const auto total = controller_->total_stages();
            const auto epochs = Schedule::epochs_for_stage(options_.unit_epoch, stage);
            const auto resolution = Schedule::resolution_at(options_.init_size, stage);
            const auto cadence = display_cadence();
            Utils::Terminal::Banner(options_.stream, "stage " + std::to_string(stage) + "/" + std::to_string(total) + " ("
                                                         + std::to_string(resolution) + "x" + std::to_string(resolution) + ")");

            Training::AdversarialOptions adversarial{};
            adversarial.latent_dim = options_.latent_dim;
            adversarial.gradient_penalty.options.coefficient = options_.gp_coefficient;
            adversarial.drift.options.coefficient = options_.drift_coefficient;

            auto ctx = context();
            std::int64_t ticker = 0;
            torch::Tensor real;
            for (std::int64_t epoch = 0; epoch < epochs; ++epoch) {
                for (std::int64_t aug = 0; aug < options_.num_aug; ++aug) {
                    source_->reset();
                    for (std::int64_t i = 0; i < batches_per_epoch_; ++i) {
                        auto batch = source_->next();
                        const double alpha = controller_->update(ctx, stage, ticker);
                        sink_->add_scalar("archive/current_alpha", alpha, global_step_);

                        real = Data::Transform::Format::PrepareReal(batch, resolution, stage, alpha).to(device_);
                        const auto losses = Training::adversarial_step(ctx, real, adversarial);
                        shadow_->update(generator_, options_.ema_decay);

                        if (i % options_.log_every == 0) {
                            sink_->add_scalar("train/G_loss", losses.generator, global_step_);
                            sink_->add_scalar("train/D_loss", losses.discriminator, global_step_);
                            sink_->add_scalar("train/Wasserstein_Dist", losses.wasserstein, global_step_);
                            log_iteration(stage, total, epoch, epochs, aug, i, losses);
                        }
                        ++global_step_;
                        ++ticker;
                    }
                }
                if (epoch % cadence == cadence - 1) {
                    display(stage, epoch, real);
                }
            }
        }

        void log_iteration(std::int64_t stage, std::int64_t total, std::int64_t epoch, std::int64_t epochs,
                           std::int64_t aug, std::int64_t iteration, const Training::StepLosses& losses) const
        {
            if (options_.stream == nullptr) {
                return;
            }
            using Utils::Terminal::Fixed;
            (*options_.stream) << Utils::Terminal::Tag()
                               << "[stage " << stage << '/' << total << "]"
                               << "[epoch " << epoch + 1 << '/' << epochs << "]"
                               << "[aug " << aug + 1 << '/' << options_.num_aug << "]"
                               << "[iter " << iteration + 1 << '/' << batches_per_epoch_ << "] "
                               << "G_loss " << Fixed(losses.generator)
                               << " D_loss " << Fixed(losses.discriminator)
                               << " W_Dist " << Fixed(losses.wasserstein) << '\n';
        }

        void display(std::int64_t stage, std::int64_t epoch, const torch::Tensor& real)
        {
            if (!real.defined()) {
                return;
            }
            Utils::Terminal::Info(options_.stream, "logging images (stage " + std::to_string(stage) + ", epoch "
                                                       + std::to_string(epoch + 1) + ")");
            const auto prefix = "stage_" + std::to_string(stage);
            sink_->add_image(prefix + "/real", Monitor::make_grid(real), epoch);
            const auto fake = shadow_->forward(fixed_z_);
            sink_->add_image(prefix + "/fake", Monitor::make_grid(fake), epoch);
        }

        void plot_curves(std::int64_t stage)
        {
            const auto output = std::filesystem::path(options_.output_dir) / ("losses_stage" + std::to_string(stage) + ".png");
            try {
                Monitor::render_curves(sink_->history(),
                                       {"train/G_loss", "train/D_loss", "train/Wasserstein_Dist"},
                                       output);
            } catch (const std::runtime_error& error) {
                Utils::Terminal::Warn(options_.stream, std::string("loss curves not rendered: ") + error.what());
            }
        }

        Config::Options options_;
        torch::Device device_{torch::kCPU};
        torch::Device shadow_device_{torch::kCPU};

        Network::Generator generator_{nullptr};
        Network::Discriminator discriminator_{nullptr};
        std::unique_ptr<EMA::Shadow> shadow_{};
        std::unique_ptr<Optimizer::Binding> generator_optimizer_{};
        std::unique_ptr<Optimizer::Binding> discriminator_optimizer_{};

        std::unique_ptr<Data::Source> source_{};
        std::unique_ptr<Monitor::Sink> sink_{};
        std::unique_ptr<Schedule::Controller> controller_{};

        std::int64_t batches_per_epoch_{0};
        std::int64_t first_stage_{1};
        std::int64_t global_step_{0};
        torch::Tensor fixed_z_{};
    };
}

#endif // STRATA_CORE_HPP
