#ifndef STRATA_INITIALIZATION_HPP
#define STRATA_INITIALIZATION_HPP
// This file is a factory, must exempt it from any logical-code. For functions look into "apply.hpp"

namespace Strata::Initialization {
    enum class Type {
        KaimingNormal,
        XavierNormal,
    };

    struct Descriptor {
        Type type{Type::KaimingNormal};
        double negative_slope{0.2};  // leaky ReLU slope the Kaiming gain is computed for
    };

    inline constexpr Descriptor KaimingLeaky{Type::KaimingNormal, 0.2};
    inline constexpr Descriptor XavierNormal{Type::XavierNormal};
}

#endif //STRATA_INITIALIZATION_HPP
