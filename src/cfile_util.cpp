// Copyright (c) 2021 Bitcoin Association
// Distributed under the Open BSV software license, see the accompanying file LICENSE.

#include "cfile_util.h"

#include <fcntl.h>
#include <unistd.h>

UniqueFileDescriptor& UniqueFileDescriptor::operator=(UniqueFileDescriptor&& that) noexcept
{
    if(this != &that)
    {
        Reset();
        mFd = that.Release();
    }

    return *this;
}

UniqueFileDescriptor::~UniqueFileDescriptor() noexcept
{
    Reset();
}

int UniqueFileDescriptor::Release() noexcept
{
    int fd { mFd };
    mFd = -1;
    return fd;
}

void UniqueFileDescriptor::Reset() noexcept
{
    if(mFd >= 0)
    {
        ::close(mFd);
        mFd = -1;
    }
}

bool SyncDirectory(const fs::path& dir)
{
    UniqueFileDescriptor fd { ::open(dir.string().c_str(), O_RDONLY | O_DIRECTORY) };
    if(!fd.IsValid())
    {
        return false;
    }
    return ::fsync(fd.Get()) == 0;
}
