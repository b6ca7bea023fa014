// Copyright (c) 2019 Bitcoin Association.
// Distributed under the Open BSV software license, see the accompanying file LICENSE.

/*
 * Casting between enumerations and their string names.
 *
 * An enumeration opts in by providing an overload of enumTable() that
 * returns the mapping:
 *
 * const enumTableT<PoolKind>& enumTable(PoolKind)
 * {
 *   static enumTableT<PoolKind> table
 *   {
 *      {PoolKind::mempool, "mempool"}, {PoolKind::orphanpool, "orphanpool"}
 *   };
 *   return table;
 * }
 *
 * after which enum_cast<std::string>(PoolKind::mempool) and
 * enum_cast<PoolKind>("mempool") both work. Unknown values map to the first
 * table entry.
 */

#pragma once

#include <initializer_list>
#include <string>
#include <unordered_map>
#include <utility>

template <typename From>
class enumTableT
{
  public:

    // Requires a non-empty table
    enumTableT(std::initializer_list<std::pair<const From, std::string>> table)
    : mLookupTable{table}, mDefaultValue{*table.begin()}
    {
        for(const auto& item : mLookupTable)
        {
            mReverseLookupTable[item.second] = item.first;
        }
    }

    const std::string& castToString(const From& from) const
    {
        auto it { mLookupTable.find(from) };
        return it != mLookupTable.end() ? it->second : mDefaultValue.second;
    }

    const From& castToEnum(const std::string& to) const
    {
        auto it { mReverseLookupTable.find(to) };
        return it != mReverseLookupTable.end() ? it->second : mDefaultValue.first;
    }

  private:

    std::unordered_map<From, std::string> mLookupTable {};
    std::unordered_map<std::string, From> mReverseLookupTable {};
    std::pair<From, std::string> mDefaultValue {};
};

// Enum to string
template<typename ToType = std::string, typename FromType>
std::string enum_cast(const FromType& value)
{
    return enumTable(FromType{}).castToString(value);
}

// String to enum
template<typename ToType>
ToType enum_cast(const std::string& value)
{
    return enumTable(ToType{}).castToEnum(value);
}

template<typename ToType>
ToType enum_cast(const char* value)
{
    return enumTable(ToType{}).castToEnum(std::string{value});
}
