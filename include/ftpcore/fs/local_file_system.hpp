// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Ftpcore, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <fcntl.h>
#include <grp.h>
#include <pwd.h>
#include <sys/stat.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <vector>

#include "ftpcore/core/logger.hpp"
#include "ftpcore/fs/file_system.hpp"

namespace ftpcore
{
namespace fs
{

/// \brief UnixFileSystem over a directory of the local disk. Virtual "/"
/// maps to the root directory given at construction, which is created when
/// missing.
class LocalFileSystem : public UnixFileSystem
{
public:
  static constexpr std::size_t DefaultBufferSize = 4096;

  /// \throws FileSystemError if the root cannot be created
  explicit LocalFileSystem(const std::string &rootPath, bool allowNonEmptyDirectoryDelete = false,
                           std::size_t bufferSize = DefaultBufferSize, bool flushAfterWrite = false)
      : _allowNonEmptyDirectoryDelete(allowNonEmptyDirectoryDelete),
        _bufferSize(bufferSize == 0 ? DefaultBufferSize : bufferSize),
        _flushAfterWrite(flushAfterWrite)
  {
    std::error_code ec;
    std::filesystem::create_directories(rootPath, ec);
    if (ec)
    {
      throw FileSystemError(FileSystemError::Kind::Io,
                            "Cannot create root " + rootPath + ": " + ec.message());
    }
    _root = std::filesystem::canonical(rootPath, ec);
    if (ec)
    {
      throw FileSystemError(FileSystemError::Kind::Io,
                            "Cannot resolve root " + rootPath + ": " + ec.message());
    }
  }

  const std::filesystem::path &root() const { return _root; }

  bool supportsNonEmptyDirectoryDelete() const override { return _allowNonEmptyDirectoryDelete; }

  std::vector<FileSystemEntry> getEntries(const std::string &directory,
                                          const core::CancellationToken &token) override
  {
    auto dir = requireDirectory(directory);
    std::vector<FileSystemEntry> out;
    std::error_code ec;
    for (const auto &item : std::filesystem::directory_iterator(dir, ec))
    {
      token.throwIfCancellationRequested();
      auto virtualPath = resolveVirtualPath(directory, item.path().filename().string());
      if (auto entry = describe(item.path(), virtualPath))
      {
        out.push_back(std::move(*entry));
      }
    }
    if (ec)
    {
      throw FileSystemError(FileSystemError::Kind::Io,
                            "Cannot list " + directory + ": " + ec.message());
    }
    std::sort(out.begin(), out.end(),
              [](const FileSystemEntry &a, const FileSystemEntry &b) { return a.name < b.name; });
    return out;
  }

  std::optional<FileSystemEntry> getEntryByName(const std::string &directory,
                                                const std::string &name,
                                                const core::CancellationToken &) override
  {
    validateName(name);
    auto virtualPath = resolveVirtualPath(directory, name);
    return describe(toLocal(virtualPath), virtualPath);
  }

  std::optional<FileSystemEntry> getEntry(const std::string &path,
                                          const core::CancellationToken &) override
  {
    auto virtualPath = resolveVirtualPath("/", path);
    return describe(toLocal(virtualPath), virtualPath);
  }

  FileSystemEntry move(const std::string &sourcePath, const std::string &targetDirectory,
                       const std::string &targetName, const core::CancellationToken &) override
  {
    validateName(targetName);
    auto source = requireExisting(sourcePath);
    requireDirectory(targetDirectory);
    auto targetVirtual = resolveVirtualPath(targetDirectory, targetName);
    std::error_code ec;
    std::filesystem::rename(source, toLocal(targetVirtual), ec);
    if (ec)
    {
      throw FileSystemError(FileSystemError::Kind::Io,
                            "Cannot move " + sourcePath + " to " + targetVirtual + ": " +
                              ec.message());
    }
    return mustDescribe(targetVirtual);
  }

  void unlink(const std::string &path, const core::CancellationToken &) override
  {
    auto local = requireExisting(path);
    if (local == _root)
    {
      throw FileSystemError(FileSystemError::Kind::InvalidName, "Cannot delete the root");
    }
    std::error_code ec;
    if (std::filesystem::is_directory(local, ec))
    {
      if (!std::filesystem::is_empty(local, ec) && !_allowNonEmptyDirectoryDelete)
      {
        throw FileSystemError(FileSystemError::Kind::NotEmpty, "Directory not empty: " + path);
      }
      std::filesystem::remove_all(local, ec);
    }
    else
    {
      std::filesystem::remove(local, ec);
    }
    if (ec)
    {
      throw FileSystemError(FileSystemError::Kind::Io, "Cannot delete " + path + ": " + ec.message());
    }
  }

  FileSystemEntry createDirectory(const std::string &directory, const std::string &name,
                                  const core::CancellationToken &) override
  {
    validateName(name);
    requireDirectory(directory);
    auto virtualPath = resolveVirtualPath(directory, name);
    std::error_code ec;
    if (!std::filesystem::create_directory(toLocal(virtualPath), ec))
    {
      if (!ec)
      {
        throw FileSystemError(FileSystemError::Kind::AlreadyExists,
                              "Already exists: " + virtualPath);
      }
      throw FileSystemError(FileSystemError::Kind::Io,
                            "Cannot create " + virtualPath + ": " + ec.message());
    }
    return mustDescribe(virtualPath);
  }

  std::unique_ptr<std::istream> openRead(const std::string &path, std::uint64_t startPosition,
                                         const core::CancellationToken &) override
  {
    auto local = requireFile(path);
    auto in = std::make_unique<std::ifstream>(local, std::ios::binary);
    if (!in->is_open())
    {
      throw FileSystemError(FileSystemError::Kind::Io, "Cannot open " + path);
    }
    if (startPosition != 0)
    {
      in->seekg(static_cast<std::streamoff>(startPosition), std::ios::beg);
    }
    return in;
  }

  std::uint64_t append(const std::string &path, std::optional<std::uint64_t> startPosition,
                       const ByteSource &data, const core::CancellationToken &token) override
  {
    auto local = requireFile(path);
    std::fstream out(local, std::ios::binary | std::ios::in | std::ios::out);
    if (!out.is_open())
    {
      throw FileSystemError(FileSystemError::Kind::Io, "Cannot open " + path + " for writing");
    }
    if (startPosition)
    {
      out.seekp(static_cast<std::streamoff>(*startPosition), std::ios::beg);
    }
    else
    {
      out.seekp(0, std::ios::end);
    }
    return copy(data, out, path, token);
  }

  FileSystemEntry create(const std::string &directory, const std::string &name,
                         const ByteSource &data, const core::CancellationToken &token) override
  {
    validateName(name);
    requireDirectory(directory);
    auto virtualPath = resolveVirtualPath(directory, name);
    std::ofstream out(toLocal(virtualPath), std::ios::binary | std::ios::trunc);
    if (!out.is_open())
    {
      throw FileSystemError(FileSystemError::Kind::Io, "Cannot create " + virtualPath);
    }
    copy(data, out, virtualPath, token);
    out.close();
    return mustDescribe(virtualPath);
  }

  std::uint64_t replace(const std::string &path, const ByteSource &data,
                        const core::CancellationToken &token) override
  {
    auto local = requireFile(path);
    std::ofstream out(local, std::ios::binary | std::ios::trunc);
    if (!out.is_open())
    {
      throw FileSystemError(FileSystemError::Kind::Io, "Cannot open " + path + " for writing");
    }
    return copy(data, out, path, token);
  }

  FileSystemEntry setMacTime(const std::string &path,
                             std::optional<std::chrono::system_clock::time_point> modify,
                             std::optional<std::chrono::system_clock::time_point> access,
                             std::optional<std::chrono::system_clock::time_point> create,
                             const core::CancellationToken &) override
  {
    auto local = requireExisting(path);
    timespec times[2];
    times[0] = toTimespec(access);
    times[1] = toTimespec(modify);
    if (::utimensat(AT_FDCWD, local.c_str(), times, 0) != 0)
    {
      throw FileSystemError(FileSystemError::Kind::Io,
                            "Cannot set times of " + path + ": " + std::strerror(errno));
    }
    if (create)
    {
      FTPCORE_LOG_DEBUG("Creation time of " << path << " is not settable, ignored");
    }
    return mustDescribe(resolveVirtualPath("/", path));
  }

private:
  std::filesystem::path _root;
  bool _allowNonEmptyDirectoryDelete;
  std::size_t _bufferSize;
  bool _flushAfterWrite;

  static void validateName(const std::string &name)
  {
    if (name.empty() || name == "." || name == ".." || name.find('/') != std::string::npos ||
        name.find('\0') != std::string::npos)
    {
      throw FileSystemError(FileSystemError::Kind::InvalidName, "Invalid name '" + name + "'");
    }
  }

  std::filesystem::path toLocal(const std::string &virtualPath) const
  {
    auto normalized = resolveVirtualPath("/", virtualPath);
    if (normalized == "/")
    {
      return _root;
    }
    return _root / normalized.substr(1);
  }

  std::filesystem::path requireExisting(const std::string &virtualPath) const
  {
    auto local = toLocal(virtualPath);
    std::error_code ec;
    if (!std::filesystem::exists(std::filesystem::symlink_status(local, ec)))
    {
      throw FileSystemError(FileSystemError::Kind::NotFound, "Not found: " + virtualPath);
    }
    return local;
  }

  std::filesystem::path requireDirectory(const std::string &virtualPath) const
  {
    auto local = requireExisting(virtualPath);
    std::error_code ec;
    if (!std::filesystem::is_directory(local, ec))
    {
      throw FileSystemError(FileSystemError::Kind::NotADirectory,
                            "Not a directory: " + virtualPath);
    }
    return local;
  }

  std::filesystem::path requireFile(const std::string &virtualPath) const
  {
    auto local = requireExisting(virtualPath);
    std::error_code ec;
    if (!std::filesystem::is_regular_file(local, ec))
    {
      throw FileSystemError(FileSystemError::Kind::NotAFile, "Not a file: " + virtualPath);
    }
    return local;
  }

  FileSystemEntry mustDescribe(const std::string &virtualPath) const
  {
    auto entry = describe(toLocal(virtualPath), virtualPath);
    if (!entry)
    {
      throw FileSystemError(FileSystemError::Kind::NotFound, "Not found: " + virtualPath);
    }
    return *entry;
  }

  static std::optional<FileSystemEntry> describe(const std::filesystem::path &local,
                                                 const std::string &virtualPath)
  {
    struct stat st{};
    if (::stat(local.c_str(), &st) != 0)
    {
      return std::nullopt;
    }
    FileSystemEntry entry;
    entry.path = virtualPath;
    entry.name = splitVirtualPath(virtualPath).second;
    entry.type = S_ISDIR(st.st_mode) ? EntryType::Directory : EntryType::File;
    entry.size = entry.isDirectory() ? 0 : static_cast<std::uint64_t>(st.st_size);
    entry.lastWriteTime = std::chrono::system_clock::from_time_t(st.st_mtim.tv_sec) +
                          std::chrono::duration_cast<std::chrono::system_clock::duration>(
                            std::chrono::nanoseconds(st.st_mtim.tv_nsec));
    entry.permissions = static_cast<std::filesystem::perms>(st.st_mode & 07777);
    entry.linkCount = static_cast<std::uint64_t>(st.st_nlink);
    entry.owner = userName(st.st_uid);
    entry.group = groupName(st.st_gid);
    return entry;
  }

  static std::string userName(uid_t uid)
  {
    std::vector<char> buf(1024);
    passwd pw{};
    passwd *result = nullptr;
    if (::getpwuid_r(uid, &pw, buf.data(), buf.size(), &result) == 0 && result)
    {
      return result->pw_name;
    }
    return std::to_string(uid);
  }

  static std::string groupName(gid_t gid)
  {
    std::vector<char> buf(1024);
    group gr{};
    group *result = nullptr;
    if (::getgrgid_r(gid, &gr, buf.data(), buf.size(), &result) == 0 && result)
    {
      return result->gr_name;
    }
    return std::to_string(gid);
  }

  static timespec toTimespec(const std::optional<std::chrono::system_clock::time_point> &tp)
  {
    timespec ts{};
    if (!tp)
    {
      ts.tv_nsec = UTIME_OMIT;
      return ts;
    }
    auto ns = std::chrono::duration_cast<std::chrono::nanoseconds>(tp->time_since_epoch()).count();
    ts.tv_sec = static_cast<time_t>(ns / 1000000000LL);
    ts.tv_nsec = static_cast<long>(ns % 1000000000LL);
    return ts;
  }

  std::uint64_t copy(const ByteSource &data, std::ostream &out, const std::string &path,
                     const core::CancellationToken &token) const
  {
    std::vector<char> buffer(_bufferSize);
    std::uint64_t total = 0;
    while (true)
    {
      token.throwIfCancellationRequested();
      std::size_t n = data(buffer.data(), buffer.size());
      if (n == 0)
      {
        break;
      }
      out.write(buffer.data(), static_cast<std::streamsize>(n));
      if (_flushAfterWrite)
      {
        out.flush();
      }
      if (!out)
      {
        throw FileSystemError(FileSystemError::Kind::Io, "Write to " + path + " failed");
      }
      total += n;
    }
    out.flush();
    return total;
  }
};

} // namespace fs
} // namespace ftpcore
