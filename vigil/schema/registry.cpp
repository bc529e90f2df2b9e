/*
 * registry.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-6-4

Description: Sealable name-keyed tables of custom types, validators and
transformers

**************************************************/

#include "registry.hpp"

#include "vigil/schema/builtin.hpp"

namespace vigil::schema {

auto Registries::withDefaults() -> Registries {
    Registries registries;
    builtin::registerBuiltins(registries);
    return registries;
}

void Registries::seal() {
    customTypes.seal();
    validators.seal();
    transformers.seal();
    spdlog::info("Registries sealed: {} custom types, {} validators, {} "
                 "transformers",
                 customTypes.size(), validators.size(), transformers.size());
}

}  // namespace vigil::schema
