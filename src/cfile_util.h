// Copyright (c) 2020 Bitcoin Association.
// Distributed under the Open BSV software license, see the accompanying file LICENSE.

#pragma once

#include "fs.h"

#include <cstdio>
#include <memory>

// Deleter so a std::unique_ptr can own a FILE*
struct CloseFileDeleter
{
    void operator()(FILE* file) const { ::fclose(file); }
};
using UniqueCFile = std::unique_ptr<FILE, CloseFileDeleter>;

/**
 * Owns a raw POSIX file-descriptor and closes it when destroyed.
 * Move-only.
 */
class UniqueFileDescriptor final
{
  public:
    UniqueFileDescriptor() = default;
    explicit UniqueFileDescriptor(int fd) : mFd{fd} {}
    UniqueFileDescriptor(UniqueFileDescriptor&& that) noexcept : mFd{that.Release()} {}
    UniqueFileDescriptor(const UniqueFileDescriptor&) = delete;
    UniqueFileDescriptor& operator=(UniqueFileDescriptor&& that) noexcept;
    UniqueFileDescriptor& operator=(const UniqueFileDescriptor&) = delete;
    ~UniqueFileDescriptor() noexcept;

    [[nodiscard]] int Get() const noexcept { return mFd; }
    [[nodiscard]] bool IsValid() const noexcept { return mFd >= 0; }
    [[nodiscard]] int Release() noexcept;
    void Reset() noexcept;

  private:
    int mFd {-1};
};

/**
 * Make a rename or file creation inside the directory durable by syncing
 * the directory itself. Returns false if the directory could not be opened
 * or synced.
 */
bool SyncDirectory(const fs::path& dir);
