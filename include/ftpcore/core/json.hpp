// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Ftpcore, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <nlohmann/json.hpp>

namespace ftpcore
{
namespace core
{
/// JSON document type used by the status and administration surface.
using Json = nlohmann::json;
} // namespace core
} // namespace ftpcore
