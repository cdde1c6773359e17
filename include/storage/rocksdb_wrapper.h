#pragma once

#include "utils/config.h"

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace rocksdb {
    class DB;
    class WriteBatch;
    class Options;
    class ReadOptions;
    class WriteOptions;
}

namespace trivium {

/// Thin wrapper around a plain rocksdb::DB for the reference backend.
/// All reads are const and thread-safe; writes go through put/del or a WriteBatchWrapper.
class RocksDBWrapper {
public:
    using Config = StorageConfig;

    explicit RocksDBWrapper(const Config& config);
    ~RocksDBWrapper();

    RocksDBWrapper(const RocksDBWrapper&) = delete;
    RocksDBWrapper& operator=(const RocksDBWrapper&) = delete;

    /// Open (and create) the database; false on failure (logged)
    bool open();
    void close();
    bool isOpen() const;

    // ===== CRUD =====

    std::optional<std::string> get(std::string_view key) const;
    bool put(std::string_view key, std::string_view value);
    bool del(std::string_view key);

    /// Batch read, one slot per key (nullopt = missing)
    std::vector<std::optional<std::string>> multiGet(const std::vector<std::string>& keys) const;

    // ===== Atomic batches =====

    class WriteBatchWrapper {
    public:
        explicit WriteBatchWrapper(RocksDBWrapper* db);
        ~WriteBatchWrapper();

        void put(std::string_view key, std::string_view value);
        void del(std::string_view key);

        /// Commit the batch atomically
        bool commit();
        void rollback();

    private:
        RocksDBWrapper* db_;
        std::unique_ptr<rocksdb::WriteBatch> batch_;
    };

    std::unique_ptr<WriteBatchWrapper> createWriteBatch();

    // ===== Scans =====

    /// Callback returns false to stop the scan.
    /// Returns false if the database is closed or the iterator reported an error;
    /// the callback may then have seen only part of the range.
    using ScanCallback = std::function<bool(std::string_view key, std::string_view value)>;
    bool scanPrefix(std::string_view prefix, const ScanCallback& callback) const;

    const Config& getConfig() const { return config_; }

private:
    Config config_;
    std::unique_ptr<rocksdb::DB> db_;
    std::unique_ptr<rocksdb::Options> options_;
    std::unique_ptr<rocksdb::ReadOptions> read_options_;
    std::unique_ptr<rocksdb::WriteOptions> write_options_;

    void configureOptions();
    bool commitBatch(rocksdb::WriteBatch* batch);
};

} // namespace trivium
