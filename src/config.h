// Copyright (c) 2017 Amaury SÉCHET
// Copyright (c) 2020 Bitcoin Association
// Distributed under the Open BSV software license, see the accompanying file LICENSE.

#ifndef TXPERSIST_CONFIG_H
#define TXPERSIST_CONFIG_H

#include <boost/noncopyable.hpp>

#include <cstdint>
#include <memory>
#include <string>

/**
 * Read access to the pool and persistence settings.
 */
class Config : public boost::noncopyable {
public:
    virtual ~Config() = default;

    virtual uint64_t GetMaxTxSize() const = 0;
    virtual uint64_t GetLimitAncestorCount() const = 0;
    // In seconds
    virtual int64_t GetMemPoolExpiry() const = 0;
    virtual uint64_t GetMaxOrphanTxns() const = 0;
    // In seconds
    virtual int64_t GetOrphanTxnsExpiry() const = 0;
    virtual bool GetOrphanOnAncestorLimit() const = 0;
    virtual bool GetPersistMempool() const = 0;
};

class ConfigInit : public Config {
public:
    virtual bool SetMaxTxSize(int64_t value, std::string* err = nullptr) = 0;
    virtual bool SetLimitAncestorCount(int64_t limitAncestorCount, std::string* err = nullptr) = 0;
    virtual bool SetMemPoolExpiry(int64_t memPoolExpiryHours, std::string* err = nullptr) = 0;
    virtual bool SetMaxOrphanTxns(int64_t maxOrphanTxns, std::string* err = nullptr) = 0;
    virtual bool SetOrphanTxnsExpiry(int64_t expirySeconds, std::string* err = nullptr) = 0;
    virtual void SetOrphanOnAncestorLimit(bool orphanOnAncestorLimit) = 0;
    virtual void SetPersistMempool(bool persistMempool) = 0;

    // Reset state of this object to match a newly constructed one.
    // Used in constructor and for unit testing to always start with a clean state
    virtual void Reset() = 0;
};

class GlobalConfig final : public ConfigInit {
public:
    GlobalConfig();

    bool SetMaxTxSize(int64_t value, std::string* err = nullptr) override;
    uint64_t GetMaxTxSize() const override;

    bool SetLimitAncestorCount(int64_t limitAncestorCount, std::string* err = nullptr) override;
    uint64_t GetLimitAncestorCount() const override;

    bool SetMemPoolExpiry(int64_t memPoolExpiryHours, std::string* err = nullptr) override;
    int64_t GetMemPoolExpiry() const override;

    bool SetMaxOrphanTxns(int64_t maxOrphanTxns, std::string* err = nullptr) override;
    uint64_t GetMaxOrphanTxns() const override;

    bool SetOrphanTxnsExpiry(int64_t expirySeconds, std::string* err = nullptr) override;
    int64_t GetOrphanTxnsExpiry() const override;

    void SetOrphanOnAncestorLimit(bool orphanOnAncestorLimit) override;
    bool GetOrphanOnAncestorLimit() const override;

    void SetPersistMempool(bool persistMempool) override;
    bool GetPersistMempool() const override;

    void Reset() override;

    // GetConfig() is used where read-only access to global Config is needed.
    static Config& GetConfig();
    // GetModifiableGlobalConfig() should only be used in init and tests
    static ConfigInit& GetModifiableGlobalConfig();

private:
    struct GlobalConfigData {
        // All fields are initialized in Reset()
        uint64_t maxTxSize;
        uint64_t limitAncestorCount;
        int64_t memPoolExpiry;
        uint64_t maxOrphanTxns;
        int64_t orphanTxnsExpiry;
        bool orphanOnAncestorLimit;
        bool persistMempool;
    };

    std::unique_ptr<GlobalConfigData> data = std::make_unique<GlobalConfigData>();
};

#endif // TXPERSIST_CONFIG_H
