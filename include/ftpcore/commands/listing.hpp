// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Ftpcore, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <chrono>
#include <ctime>
#include <filesystem>
#include <sstream>
#include <string>

#include "ftpcore/fs/file_system.hpp"

namespace ftpcore
{
namespace commands
{

/// \brief "drwxr-xr-x" style mode string.
inline std::string formatPermissions(const fs::FileSystemEntry &entry)
{
  using std::filesystem::perms;
  auto has = [&entry](perms p) { return (entry.permissions & p) != perms::none; };
  std::string out;
  out += entry.isDirectory() ? 'd' : '-';
  out += has(perms::owner_read) ? 'r' : '-';
  out += has(perms::owner_write) ? 'w' : '-';
  out += has(perms::owner_exec) ? 'x' : '-';
  out += has(perms::group_read) ? 'r' : '-';
  out += has(perms::group_write) ? 'w' : '-';
  out += has(perms::group_exec) ? 'x' : '-';
  out += has(perms::others_read) ? 'r' : '-';
  out += has(perms::others_write) ? 'w' : '-';
  out += has(perms::others_exec) ? 'x' : '-';
  return out;
}

/// \brief "Mon dd HH:MM" within six months of \p now, "Mon dd  yyyy"
/// otherwise. UTC.
inline std::string formatListingTime(std::chrono::system_clock::time_point time,
                                     std::chrono::system_clock::time_point now)
{
  auto age = now - time;
  bool recent = age >= std::chrono::hours(0) ? age < std::chrono::hours(24 * 183)
                                             : -age < std::chrono::hours(24);
  std::time_t t = std::chrono::system_clock::to_time_t(time);
  std::tm tm{};
  ::gmtime_r(&t, &tm);
  char buf[32];
  std::strftime(buf, sizeof(buf), recent ? "%b %d %H:%M" : "%b %d  %Y", &tm);
  return buf;
}

/// \brief One LIST line in the Unix "ls -l" layout, without line ending.
inline std::string formatListLine(const fs::FileSystemEntry &entry,
                                  std::chrono::system_clock::time_point now)
{
  std::ostringstream ss;
  ss << formatPermissions(entry) << ' ' << entry.linkCount << ' '
     << (entry.owner.empty() ? "owner" : entry.owner) << ' '
     << (entry.group.empty() ? "group" : entry.group) << ' ' << entry.size << ' '
     << formatListingTime(entry.lastWriteTime, now) << ' ' << entry.name;
  return ss.str();
}

} // namespace commands
} // namespace ftpcore
