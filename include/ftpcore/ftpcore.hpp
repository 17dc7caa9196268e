// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Ftpcore, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include "ftpcore/core/blocking_queue.hpp"
#include "ftpcore/core/cancellation.hpp"
#include "ftpcore/core/config_loader.hpp"
#include "ftpcore/core/json.hpp"
#include "ftpcore/core/logger.hpp"
#include "ftpcore/core/thread_pool.hpp"
#include "ftpcore/crypto/secure_rng.hpp"
#include "ftpcore/ids/uuid.hpp"
#include "ftpcore/parsers/minimal_toml.hpp"

#include "ftpcore/network/multi_binding_listener.hpp"
#include "ftpcore/network/socket.hpp"
#include "ftpcore/network/transport_types.hpp"

#include "ftpcore/fs/file_system.hpp"
#include "ftpcore/fs/local_file_system.hpp"

#include "ftpcore/server/background_task.hpp"
#include "ftpcore/server/command_handler.hpp"
#include "ftpcore/server/connection_events.hpp"
#include "ftpcore/server/data_connection.hpp"
#include "ftpcore/server/ftp_connection.hpp"
#include "ftpcore/server/ftp_server.hpp"
#include "ftpcore/server/ftp_types.hpp"
#include "ftpcore/server/idle_check.hpp"
#include "ftpcore/server/server_command_executor.hpp"
#include "ftpcore/server/server_command_pipeline.hpp"
#include "ftpcore/server/server_commands.hpp"
#include "ftpcore/server/server_options.hpp"

#include "ftpcore/commands/basic_commands.hpp"
#include "ftpcore/commands/listing.hpp"
#include "ftpcore/commands/transfer.hpp"
