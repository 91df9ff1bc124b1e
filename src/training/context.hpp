#ifndef STRATA_TRAINING_CONTEXT_HPP
#define STRATA_TRAINING_CONTEXT_HPP

#include <iostream>
#include <ostream>

#include <torch/torch.h>

#include "../ema/ema.hpp"
#include "../network/network.hpp"
#include "../optimizer/optimizer.hpp"

namespace Strata::Training {

    // Everything one stage of the loop mutates, passed explicitly instead of living on a trainer
    // singleton. The context borrows; the trainer (or a test) owns.
    struct Context {
        Network::Generator& generator;
        Network::Discriminator& discriminator;
        EMA::Shadow& shadow;
        Optimizer::Binding& generator_optimizer;
        Optimizer::Binding& discriminator_optimizer;
        torch::Device device{torch::kCPU};
        std::ostream* stream{&std::cout};

        // Live networks on the training device, shadow on its own device. Module::to swaps
        // tensor data in place, so optimizer identities survive the move.
        void relocate()
        {
            generator->to(device);
            discriminator->to(device);
            shadow.to(shadow.device());
        }
    };
}

#endif // STRATA_TRAINING_CONTEXT_HPP
