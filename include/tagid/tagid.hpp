/*
 * AEVUMDB COMMUNITY LICENSE
 * Version 1.0, February 2026
 *
 * Copyright (c) 2026 Ananda Firmansyah.
 * Official Organization: AevumDB (https://github.com/aevumdb)
 *
 * This source code is licensed under the AevumDB Community License.
 * You may not use this file except in compliance with the License.
 */

/**
 * @file tagid.hpp
 * @brief Convenience header pulling in the identifier core and every built-in generator.
 */

#pragma once

#include "tagid/core/codec.hpp"
#include "tagid/core/entity.hpp"
#include "tagid/core/error.hpp"
#include "tagid/core/generator.hpp"
#include "tagid/core/id.hpp"
#include "tagid/core/label.hpp"
#include "tagid/gen/cuid.hpp"
#include "tagid/gen/pretty.hpp"
#include "tagid/gen/snowflake.hpp"
#include "tagid/gen/ulid.hpp"
#include "tagid/gen/uuid.hpp"
