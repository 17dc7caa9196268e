// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Ftpcore, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <istream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "ftpcore/core/cancellation.hpp"

namespace ftpcore
{
namespace fs
{

enum class EntryType
{
  File,
  Directory
};

/// \brief Snapshot of a file or directory. \c path is the virtual path,
/// always absolute and '/'-separated.
struct FileSystemEntry
{
  std::string name;
  std::string path;
  EntryType type{EntryType::File};
  std::uint64_t size{0};
  std::chrono::system_clock::time_point lastWriteTime;
  std::optional<std::chrono::system_clock::time_point> createdTime;
  std::filesystem::perms permissions{std::filesystem::perms::none};
  std::string owner;
  std::string group;
  std::uint64_t linkCount{1};

  bool isDirectory() const { return type == EntryType::Directory; }
};

/// \brief Pulls upload data: fills at most \p capacity bytes of \p buffer
/// and returns how many were written, 0 at end of data.
using ByteSource = std::function<std::size_t(char *buffer, std::size_t capacity)>;

class FileSystemError : public std::runtime_error
{
public:
  enum class Kind
  {
    NotFound,
    AlreadyExists,
    InvalidName,
    NotEmpty,
    NotADirectory,
    NotAFile,
    Io
  };

  FileSystemError(Kind kind, const std::string &what) : std::runtime_error(what), _kind(kind) {}

  Kind kind() const { return _kind; }

private:
  Kind _kind;
};

/// \brief Storage backend seen by the command handlers. Directory arguments
/// are virtual paths; \c name arguments are single path components.
class UnixFileSystem
{
public:
  virtual ~UnixFileSystem() = default;

  virtual bool supportsNonEmptyDirectoryDelete() const = 0;

  virtual bool supportsAppend() const { return true; }

  /// \throws FileSystemError if \p directory does not exist
  virtual std::vector<FileSystemEntry> getEntries(const std::string &directory,
                                                  const core::CancellationToken &token) = 0;

  /// \return nullopt if there is no entry \p name in \p directory
  virtual std::optional<FileSystemEntry> getEntryByName(const std::string &directory,
                                                        const std::string &name,
                                                        const core::CancellationToken &token) = 0;

  /// \brief Entry for an absolute virtual path; "/" is the root directory.
  virtual std::optional<FileSystemEntry> getEntry(const std::string &path,
                                                  const core::CancellationToken &token) = 0;

  virtual FileSystemEntry move(const std::string &sourcePath, const std::string &targetDirectory,
                               const std::string &targetName,
                               const core::CancellationToken &token) = 0;

  /// \brief Delete a file, or a directory (non-empty ones only when
  /// supportsNonEmptyDirectoryDelete()).
  virtual void unlink(const std::string &path, const core::CancellationToken &token) = 0;

  virtual FileSystemEntry createDirectory(const std::string &directory, const std::string &name,
                                          const core::CancellationToken &token) = 0;

  /// \brief Open \p path for reading, positioned at \p startPosition.
  virtual std::unique_ptr<std::istream> openRead(const std::string &path,
                                                 std::uint64_t startPosition,
                                                 const core::CancellationToken &token) = 0;

  /// \brief Write \p data into an existing file from \p startPosition (end of
  /// file when unset) without truncating.
  /// \return bytes written
  virtual std::uint64_t append(const std::string &path, std::optional<std::uint64_t> startPosition,
                               const ByteSource &data, const core::CancellationToken &token) = 0;

  /// \brief Create (or truncate) \p name in \p directory and fill it.
  virtual FileSystemEntry create(const std::string &directory, const std::string &name,
                                 const ByteSource &data, const core::CancellationToken &token) = 0;

  /// \brief Overwrite the whole content of an existing file.
  /// \return bytes written
  virtual std::uint64_t replace(const std::string &path, const ByteSource &data,
                                const core::CancellationToken &token) = 0;

  /// \brief Set modification, access and creation time; unset values are
  /// left alone.
  virtual FileSystemEntry
  setMacTime(const std::string &path, std::optional<std::chrono::system_clock::time_point> modify,
             std::optional<std::chrono::system_clock::time_point> access,
             std::optional<std::chrono::system_clock::time_point> create,
             const core::CancellationToken &token) = 0;
};

/// \brief Join a virtual directory and a relative or absolute argument and
/// normalise "." and ".." without leaving "/".
inline std::string resolveVirtualPath(const std::string &current, const std::string &argument)
{
  std::string combined = (!argument.empty() && argument.front() == '/')
                           ? argument
                           : (current.empty() ? std::string("/") : current) + "/" + argument;
  std::vector<std::string> parts;
  std::string part;
  for (std::size_t i = 0; i <= combined.size(); ++i)
  {
    if (i == combined.size() || combined[i] == '/')
    {
      if (part == "..")
      {
        if (!parts.empty())
        {
          parts.pop_back();
        }
      }
      else if (!part.empty() && part != ".")
      {
        parts.push_back(part);
      }
      part.clear();
    }
    else
    {
      part += combined[i];
    }
  }
  std::string out;
  for (const auto &p : parts)
  {
    out += "/" + p;
  }
  return out.empty() ? "/" : out;
}

/// \brief Split a normalised virtual path into parent directory and name.
inline std::pair<std::string, std::string> splitVirtualPath(const std::string &path)
{
  auto slash = path.find_last_of('/');
  if (slash == std::string::npos)
  {
    return {"/", path};
  }
  return {slash == 0 ? "/" : path.substr(0, slash), path.substr(slash + 1)};
}

} // namespace fs
} // namespace ftpcore
