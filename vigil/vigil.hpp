/*
 * vigil.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-6-4

Description: Umbrella header of the vigil library

**************************************************/

#ifndef VIGIL_VIGIL_HPP
#define VIGIL_VIGIL_HPP

#include "vigil/error/exception.hpp"
#include "vigil/guard/entity_guards.hpp"
#include "vigil/guard/type_guards.hpp"
#include "vigil/sanitize/html.hpp"
#include "vigil/sanitize/sanitizer.hpp"
#include "vigil/schema/builtin.hpp"
#include "vigil/schema/diagnostic.hpp"
#include "vigil/schema/engine.hpp"
#include "vigil/schema/registry.hpp"
#include "vigil/schema/schema.hpp"
#include "vigil/schema/schema_loader.hpp"
#include "vigil/type/value.hpp"
#include "vigil/type/value_json.hpp"

#endif  // VIGIL_VIGIL_HPP
