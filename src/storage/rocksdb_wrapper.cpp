#include "storage/rocksdb_wrapper.h"
#include "utils/logger.h"

#include <rocksdb/cache.h>
#include <rocksdb/db.h>
#include <rocksdb/filter_policy.h>
#include <rocksdb/iterator.h>
#include <rocksdb/options.h>
#include <rocksdb/table.h>
#include <rocksdb/write_batch.h>

#include <algorithm>
#include <cctype>
#include <filesystem>

namespace trivium {

namespace {

rocksdb::CompressionType toCompression(const std::string& s) {
    std::string v = s;
    std::transform(v.begin(), v.end(), v.begin(), [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
    if (v == "lz4") return rocksdb::kLZ4Compression;
    if (v == "zstd") return rocksdb::kZSTD;
    if (v == "snappy") return rocksdb::kSnappyCompression;
    if (v == "zlib") return rocksdb::kZlibCompression;
    return rocksdb::kNoCompression;
}

} // namespace

RocksDBWrapper::RocksDBWrapper(const Config& config) : config_(config) {
    options_ = std::make_unique<rocksdb::Options>();
    read_options_ = std::make_unique<rocksdb::ReadOptions>();
    write_options_ = std::make_unique<rocksdb::WriteOptions>();
    configureOptions();
}

RocksDBWrapper::~RocksDBWrapper() {
    close();
}

void RocksDBWrapper::configureOptions() {
    options_->create_if_missing = true;

    // Memtable
    options_->write_buffer_size = config_.memtable_size_mb * 1024 * 1024;

    // Block cache + Bloom-Filter für Punktabfragen (obj:<type>:<id>)
    rocksdb::BlockBasedTableOptions table_options;
    table_options.block_cache = rocksdb::NewLRUCache(config_.block_cache_size_mb * 1024 * 1024);
    table_options.filter_policy.reset(rocksdb::NewBloomFilterPolicy(config_.bloom_bits_per_key, false));
    options_->table_factory.reset(rocksdb::NewBlockBasedTableFactory(table_options));

    options_->compression = toCompression(config_.compression);

    // WAL
    write_options_->disableWAL = !config_.enable_wal;
}

bool RocksDBWrapper::open() {
    if (db_) return true;

    std::error_code ec;
    std::filesystem::create_directories(config_.db_path, ec);
    if (ec) {
        TRIVIUM_ERROR("Failed to create DB directory '{}': {}", config_.db_path, ec.message());
        return false;
    }

    rocksdb::DB* raw = nullptr;
    rocksdb::Status status = rocksdb::DB::Open(*options_, config_.db_path, &raw);
    if (!status.ok()) {
        TRIVIUM_ERROR("Failed to open RocksDB at {}: {}", config_.db_path, status.ToString());
        return false;
    }
    db_.reset(raw);
    TRIVIUM_INFO("Opened RocksDB at: {}", config_.db_path);
    return true;
}

void RocksDBWrapper::close() {
    if (db_) {
        TRIVIUM_INFO("Closing RocksDB");
        db_.reset();
    }
}

bool RocksDBWrapper::isOpen() const {
    return db_ != nullptr;
}

std::optional<std::string> RocksDBWrapper::get(std::string_view key) const {
    if (!db_) return std::nullopt;

    std::string value;
    rocksdb::Status status = db_->Get(*read_options_, rocksdb::Slice(key.data(), key.size()), &value);
    if (status.ok()) return value;
    if (!status.IsNotFound()) {
        TRIVIUM_ERROR("RocksDB get failed: {}", status.ToString());
    }
    return std::nullopt;
}

bool RocksDBWrapper::put(std::string_view key, std::string_view value) {
    if (!db_) return false;
    rocksdb::Status status = db_->Put(*write_options_,
                                      rocksdb::Slice(key.data(), key.size()),
                                      rocksdb::Slice(value.data(), value.size()));
    return status.ok();
}

bool RocksDBWrapper::del(std::string_view key) {
    if (!db_) return false;
    rocksdb::Status status = db_->Delete(*write_options_, rocksdb::Slice(key.data(), key.size()));
    return status.ok();
}

std::vector<std::optional<std::string>> RocksDBWrapper::multiGet(const std::vector<std::string>& keys) const {
    std::vector<std::optional<std::string>> results(keys.size());
    if (!db_ || keys.empty()) return results;

    std::vector<rocksdb::Slice> slices;
    slices.reserve(keys.size());
    for (const auto& k : keys) slices.emplace_back(k);

    std::vector<std::string> values;
    auto statuses = db_->MultiGet(*read_options_, slices, &values);
    for (size_t i = 0; i < keys.size(); ++i) {
        if (statuses[i].ok()) {
            results[i] = std::move(values[i]);
        } else if (!statuses[i].IsNotFound()) {
            TRIVIUM_ERROR("RocksDB multiGet failed for {}: {}", keys[i], statuses[i].ToString());
        }
    }
    return results;
}

// WriteBatchWrapper

RocksDBWrapper::WriteBatchWrapper::WriteBatchWrapper(RocksDBWrapper* db)
    : db_(db), batch_(std::make_unique<rocksdb::WriteBatch>()) {}

RocksDBWrapper::WriteBatchWrapper::~WriteBatchWrapper() = default;

void RocksDBWrapper::WriteBatchWrapper::put(std::string_view key, std::string_view value) {
    batch_->Put(rocksdb::Slice(key.data(), key.size()), rocksdb::Slice(value.data(), value.size()));
}

void RocksDBWrapper::WriteBatchWrapper::del(std::string_view key) {
    batch_->Delete(rocksdb::Slice(key.data(), key.size()));
}

bool RocksDBWrapper::WriteBatchWrapper::commit() {
    return db_->commitBatch(batch_.get());
}

void RocksDBWrapper::WriteBatchWrapper::rollback() {
    batch_->Clear();
}

std::unique_ptr<RocksDBWrapper::WriteBatchWrapper> RocksDBWrapper::createWriteBatch() {
    return std::make_unique<WriteBatchWrapper>(this);
}

bool RocksDBWrapper::commitBatch(rocksdb::WriteBatch* batch) {
    if (!db_) return false;
    rocksdb::Status status = db_->Write(*write_options_, batch);
    if (!status.ok()) {
        TRIVIUM_ERROR("RocksDB batch commit failed: {}", status.ToString());
    }
    return status.ok();
}

bool RocksDBWrapper::scanPrefix(std::string_view prefix, const ScanCallback& callback) const {
    if (!db_) return false;

    std::unique_ptr<rocksdb::Iterator> it(db_->NewIterator(*read_options_));
    rocksdb::Slice prefix_slice(prefix.data(), prefix.size());
    for (it->Seek(prefix_slice); it->Valid() && it->key().starts_with(prefix_slice); it->Next()) {
        std::string_view key(it->key().data(), it->key().size());
        std::string_view value(it->value().data(), it->value().size());
        if (!callback(key, value)) {
            return true;
        }
    }
    // Iterator endet auch bei I/O-Fehlern oder Korruption
    if (!it->status().ok()) {
        TRIVIUM_ERROR("RocksDB scan of '{}' failed: {}", prefix, it->status().ToString());
        return false;
    }
    return true;
}

} // namespace trivium
