// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2016 The Bitcoin Core developers
// Copyright (c) 2020 Bitcoin Association
// Distributed under the Open BSV software license, see the accompanying file LICENSE.

#include "utiltime.h"

#include <atomic>
#include <ctime>

#include <boost/date_time/posix_time/posix_time.hpp>

namespace
{
    // For unit testing
    std::atomic_int64_t nMockTime = 0;

    int64_t MicrosSinceEpoch()
    {
        return (boost::posix_time::microsec_clock::universal_time() -
                boost::posix_time::ptime(boost::gregorian::date(1970, 1, 1)))
            .total_microseconds();
    }
}

int64_t GetTime() {
    if (nMockTime) return nMockTime;

    return static_cast<int64_t>(time(nullptr));
}

void SetMockTime(int64_t nMockTimeIn) {
    nMockTime = nMockTimeIn;
}

int64_t GetTimeMicros() {
    return MicrosSinceEpoch();
}

/** Return a time useful for the debug log */
int64_t GetLogTimeMicros() {
    if (nMockTime) return nMockTime * 1000000;

    return GetTimeMicros();
}

DateTimeFormatter::DateTimeFormatter(const char* format)
    : locale_{std::locale::classic(), new boost::posix_time::time_facet(format)}
{
}

std::ostringstream DateTimeFormatter::operator()(const int64_t nTime) const
{
    std::ostringstream ss;
    ss.imbue(locale_);
    ss << boost::posix_time::from_time_t(nTime);
    return ss;
}
