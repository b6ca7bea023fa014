// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2016 The Bitcoin Core developers
// Copyright (c) 2020 Bitcoin Association
// Distributed under the Open BSV software license, see the accompanying file LICENSE.

#ifndef TXPERSIST_UTILTIME_H
#define TXPERSIST_UTILTIME_H

#include <cstdint>
#include <locale>
#include <sstream>

/**
 * GetTime() returns the system time in seconds, or the mocked time if one
 * has been set with SetMockTime(). All pool admission and expiry decisions
 * are made against GetTime().
 */
int64_t GetTime();
int64_t GetTimeMicros();
int64_t GetLogTimeMicros();
void SetMockTime(int64_t nMockTimeIn);

// Reusable formatter; constructing the time facet is expensive
class DateTimeFormatter
{
  public:
    explicit DateTimeFormatter(const char* format);

    std::ostringstream operator()(int64_t nTime) const;

  private:
    std::locale locale_;
};

#endif // TXPERSIST_UTILTIME_H
