//
// Created by bffnt_kit contributors on 02/10/2026.
//
// Visitor built from a set of lambdas, for std::visit over section variants
//

#pragma once

namespace bffnt {
    template<class... Ts>
    struct overloaded : Ts... {
        using Ts::operator()...;
    };

    template<class... Ts>
    overloaded(Ts...) -> overloaded<Ts...>;
}
