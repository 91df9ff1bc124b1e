#ifndef STRATA_CONFIG_HPP
#define STRATA_CONFIG_HPP
/*
 * Run configuration.
 * ---------------------------------------------------------------------------
 *  - `Options` is a plain aggregate: build it with designated initialisers in
 *    code, or read it from a JSON file through `load_json`.
 *  - JSON keys are the field names. Unknown keys are rejected so that a typo
 *    never silently falls back to a default.
 *  - `validate` is the single gate every entry point goes through before the
 *    networks, the controller and the loader are constructed.
 */

#include <cstdint>
#include <filesystem>
#include <iostream>
#include <ostream>
#include <set>
#include <sstream>
#include <stdexcept>
#include <string>
#include <type_traits>

#include "../common/save_load.hpp"

namespace Strata::Config {

    struct Options {
        // Model / curriculum
        std::int64_t channels{3};
        std::int64_t latent_dim{512};
        std::int64_t init_size{4};
        std::int64_t size{256};
        std::int64_t fmap_base{4096};
        std::int64_t fmap_max{256};

        // Optimisation
        std::int64_t batch_size{16};
        std::int64_t unit_epoch{10};
        std::int64_t num_aug{1};
        double learning_rate{1e-3};
        double ema_decay{0.999};
        double gp_coefficient{10.0};
        double drift_coefficient{0.001};

        // Data
        std::string dataset_root{};
        std::string manifest{};
        std::int64_t load_size{300};
        std::int64_t workers{8};
        std::int64_t prefetch{2};
        std::uint64_t seed{0};

        // Devices
        std::string device{"auto"};
        std::string shadow_device{"cpu"};

        // Output
        std::string output_dir{"logs"};
        std::int64_t log_every{10};
        std::int64_t display_every{0};  // 0: every 10 epochs when unit_epoch > 10, otherwise every epoch
        bool plot_curves{false};
        std::string resume{};

        std::ostream* stream{&std::cout};
    };

    namespace Details {
        [[nodiscard]] inline bool is_power_of_two(std::int64_t value) noexcept
        {
            return value > 0 && (value & (value - 1)) == 0;
        }

        inline void require(bool condition, const std::string& message)
        {
            if (!condition) {
                throw std::invalid_argument("Invalid configuration: " + message);
            }
        }

        inline const std::set<std::string>& known_keys()
        {
            static const std::set<std::string> keys{
                "channels", "latent_dim", "init_size", "size", "fmap_base", "fmap_max",
                "batch_size", "unit_epoch", "num_aug", "learning_rate", "ema_decay",
                "gp_coefficient", "drift_coefficient", "dataset_root", "manifest", "load_size",
                "workers", "prefetch", "seed", "device", "shadow_device", "output_dir",
                "log_every", "display_every", "plot_curves", "resume"};
            return keys;
        }
    }

    inline void validate(const Options& options)
    {
        using Details::require;
        using Details::is_power_of_two;

        require(options.channels > 0, "channels must be positive.");
        require(options.latent_dim > 0, "latent_dim must be positive.");
        require(options.init_size >= 4 && is_power_of_two(options.init_size),
                "init_size must be a power of two no smaller than 4.");
        require(is_power_of_two(options.size) && options.size >= options.init_size,
                "size must be a power of two no smaller than init_size.");
        require(options.fmap_base > 0 && options.fmap_max > 0, "fmap_base and fmap_max must be positive.");
        require(options.batch_size > 0, "batch_size must be positive.");
        require(options.unit_epoch > 0, "unit_epoch must be positive.");
        require(options.num_aug > 0, "num_aug must be positive.");
        require(options.learning_rate > 0.0, "learning_rate must be positive.");
        require(options.ema_decay >= 0.0 && options.ema_decay <= 1.0, "ema_decay must lie in [0, 1].");
        require(options.gp_coefficient >= 0.0, "gp_coefficient must be non-negative.");
        require(options.drift_coefficient >= 0.0, "drift_coefficient must be non-negative.");
        require(options.load_size >= options.size, "load_size must be at least size.");
        require(options.workers >= 0, "workers must be non-negative.");
        require(options.prefetch > 0, "prefetch must be positive.");
        require(options.log_every > 0, "log_every must be positive.");
        require(options.display_every >= 0, "display_every must be non-negative.");
        require(!options.output_dir.empty(), "output_dir must not be empty.");
    }

    inline Options load_json(const std::filesystem::path& path)
    {
        namespace SL = Common::SaveLoad;
        const auto tree = SL::read_json_file(path);
        const std::string context = "configuration '" + path.string() + "'";

        for (const auto& entry : tree) {
            if (!Details::known_keys().contains(entry.first)) {
                throw std::runtime_error("Unknown key '" + entry.first + "' in " + context + ".");
            }
        }

        Options options{};
        auto numeric = [&](const char* key, auto& field) {
            using Field = std::decay_t<decltype(field)>;
            if (auto value = SL::Detail::find_numeric<Field>(tree, key, context)) field = *value;
        };
        auto text = [&](const char* key, std::string& field) {
            if (auto value = SL::Detail::find_string(tree, key)) field = *value;
        };

        numeric("channels", options.channels);
        numeric("latent_dim", options.latent_dim);
        numeric("init_size", options.init_size);
        numeric("size", options.size);
        numeric("fmap_base", options.fmap_base);
        numeric("fmap_max", options.fmap_max);
        numeric("batch_size", options.batch_size);
        numeric("unit_epoch", options.unit_epoch);
        numeric("num_aug", options.num_aug);
        numeric("learning_rate", options.learning_rate);
        numeric("ema_decay", options.ema_decay);
        numeric("gp_coefficient", options.gp_coefficient);
        numeric("drift_coefficient", options.drift_coefficient);
        text("dataset_root", options.dataset_root);
        text("manifest", options.manifest);
        numeric("load_size", options.load_size);
        numeric("workers", options.workers);
        numeric("prefetch", options.prefetch);
        numeric("seed", options.seed);
        text("device", options.device);
        text("shadow_device", options.shadow_device);
        text("output_dir", options.output_dir);
        numeric("log_every", options.log_every);
        numeric("display_every", options.display_every);
        if (auto value = SL::Detail::find_boolean(tree, "plot_curves", context)) options.plot_curves = *value;
        text("resume", options.resume);

        validate(options);
        return options;
    }

    inline void save_json(const Options& options, const std::filesystem::path& path)
    {
        Common::SaveLoad::PropertyTree tree;
        tree.put("channels", options.channels);
        tree.put("latent_dim", options.latent_dim);
        tree.put("init_size", options.init_size);
        tree.put("size", options.size);
        tree.put("fmap_base", options.fmap_base);
        tree.put("fmap_max", options.fmap_max);
        tree.put("batch_size", options.batch_size);
        tree.put("unit_epoch", options.unit_epoch);
        tree.put("num_aug", options.num_aug);
        tree.put("learning_rate", options.learning_rate);
        tree.put("ema_decay", options.ema_decay);
        tree.put("gp_coefficient", options.gp_coefficient);
        tree.put("drift_coefficient", options.drift_coefficient);
        tree.put("dataset_root", options.dataset_root);
        tree.put("manifest", options.manifest);
        tree.put("load_size", options.load_size);
        tree.put("workers", options.workers);
        tree.put("prefetch", options.prefetch);
        tree.put("seed", options.seed);
        tree.put("device", options.device);
        tree.put("shadow_device", options.shadow_device);
        tree.put("output_dir", options.output_dir);
        tree.put("log_every", options.log_every);
        tree.put("display_every", options.display_every);
        tree.put("plot_curves", options.plot_curves);
        tree.put("resume", options.resume);
        Common::SaveLoad::write_json_file(path, tree);
    }
}

#endif // STRATA_CONFIG_HPP
