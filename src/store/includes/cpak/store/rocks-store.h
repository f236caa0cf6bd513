#pragma once

#include "cpak/core/logger.h"
#include "cpak/store/store.h"

#include <memory>
#include <rocksdb/db.h>
#include <string>

namespace cpak::store {

/**
 * Store backed by a RocksDB database directory.
 *
 * The database is opened by the constructor and closed by close() or the
 * destructor, whichever comes first. Every non-OK rocksdb::Status is
 * reported as a StoreError.
 */
class RocksStore : public Store
{
public:
    struct Options
    {
        // Create the database if the directory holds none
        bool create_if_missing = true;

        // Refuse to open (instead of creating) when nothing is there
        bool error_if_missing = false;
    };

    RocksStore(const std::string& path, const Options& options);

    ~RocksStore() override;

    RocksStore(const RocksStore&) = delete;
    RocksStore&
    operator=(const RocksStore&) = delete;

    std::optional<std::string>
    get_raw(std::string_view key) override;

    void
    scan(const ScanOptions& options, const ScanCallback& callback) override;

    void
    write(const WriteBatch& batch) override;

    void
    compact_range(std::string_view first, std::string_view last) override;

    // Flush and close the database; further calls throw StoreError
    void
    close();

    bool
    is_open() const
    {
        return db_ != nullptr;
    }

    const std::string&
    path() const
    {
        return path_;
    }

    static LogPartition&
    get_log_partition()
    {
        return log_partition_;
    }

private:
    ::rocksdb::DB&
    db();

    inline static LogPartition log_partition_{"ROCKS", LogLevel::INHERIT};

    std::string path_;
    std::unique_ptr<::rocksdb::DB> db_;
};

}  // namespace cpak::store
