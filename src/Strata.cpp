// strata_train <config.json>
// Loads a run configuration and trains every stage it describes, resuming first when the
// configuration names a checkpoint.

#include <exception>
#include <iostream>
#include <string>
#include <utility>

#include <torch/torch.h>

#include "../include/Strata.h"

int main(int argc, char** argv) {
    if (argc != 2) {
        std::cerr << "usage: " << (argc > 0 ? argv[0] : "strata_train") << " <config.json>" << std::endl;
        return 2;
    }

    try {
        auto options = Strata::Config::load_json(argv[1]);
        Strata::Core::Trainer trainer(std::move(options));
        trainer.train();
    } catch (const c10::Error& error) {
        std::cerr << Strata::Utils::Terminal::Tag() << "torch error: " << error.what_without_backtrace() << std::endl;
        return 1;
    } catch (const std::exception& error) {
        std::cerr << Strata::Utils::Terminal::Tag() << error.what() << std::endl;
        return 1;
    }
    return 0;
}
