// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2016 The Bitcoin Core developers
// Copyright (c) 2020 Bitcoin Association
// Distributed under the Open BSV software license, see the accompanying file LICENSE.

#include "amount.h"

#include <tinyformat.h>

const std::string CURRENCY_UNIT = "BSV";

std::string Amount::ToString() const {
    return strprintf("%d.%08d %s", amount / COIN.GetSatoshis(),
                     amount % COIN.GetSatoshis(), CURRENCY_UNIT);
}
