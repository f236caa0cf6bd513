#include "cpak/store/rocks-store.h"
#include "cpak/core/errors.h"

#include <rocksdb/options.h>
#include <rocksdb/write_batch.h>

namespace cpak::store {

namespace {

::rocksdb::Slice
to_slice(std::string_view s)
{
    return ::rocksdb::Slice(s.data(), s.size());
}

void
check(const ::rocksdb::Status& status, const std::string& what)
{
    if (!status.ok())
        throw StoreError(what + ": " + status.ToString());
}

// Smallest key greater than every key starting with `prefix`, or empty if
// there is none
std::string
prefix_successor(std::string prefix)
{
    while (!prefix.empty())
    {
        auto& last = reinterpret_cast<unsigned char&>(prefix.back());
        if (last != 0xff)
        {
            ++last;
            return prefix;
        }
        prefix.pop_back();
    }
    return prefix;
}

}  // namespace

RocksStore::RocksStore(const std::string& path, const Options& options)
    : path_(path)
{
    ::rocksdb::Options db_options;
    db_options.create_if_missing = options.create_if_missing;
    db_options.error_if_exists = false;

    if (options.error_if_missing)
        db_options.create_if_missing = false;

    ::rocksdb::DB* db_raw = nullptr;
    ::rocksdb::Status status = ::rocksdb::DB::Open(db_options, path_, &db_raw);
    if (!status.ok())
    {
        PLOGE(log_partition_, "Failed to open ", path_, ": ", status.ToString());
        throw StoreError("failed to open " + path_ + ": " + status.ToString());
    }

    db_.reset(db_raw);
    PLOGD(log_partition_, "Opened ", path_);
}

RocksStore::~RocksStore()
{
    if (!db_)
        return;

    ::rocksdb::Status status = db_->Close();
    if (!status.ok())
    {
        PLOGW(
            log_partition_,
            "Failed to close ",
            path_,
            " cleanly: ",
            status.ToString());
    }
}

::rocksdb::DB&
RocksStore::db()
{
    if (!db_)
        throw StoreError(path_ + " is closed");
    return *db_;
}

void
RocksStore::close()
{
    if (!db_)
        return;

    ::rocksdb::Status status = db_->Close();
    db_.reset();
    check(status, "failed to close " + path_);
    PLOGD(log_partition_, "Closed ", path_);
}

std::optional<std::string>
RocksStore::get_raw(std::string_view key)
{
    std::string value;
    ::rocksdb::Status status =
        db().Get(::rocksdb::ReadOptions(), to_slice(key), &value);
    if (status.IsNotFound())
        return std::nullopt;
    check(status, "get " + std::string(key));
    return value;
}

void
RocksStore::scan(const ScanOptions& options, const ScanCallback& callback)
{
    ::rocksdb::ReadOptions read_options;
    read_options.fill_cache = options.fill_cache;

    std::unique_ptr<::rocksdb::Iterator> it(db().NewIterator(read_options));

    if (!options.reverse)
    {
        it->Seek(to_slice(options.prefix));
    }
    else
    {
        std::string upper = prefix_successor(options.prefix);
        if (upper.empty())
        {
            it->SeekToLast();
        }
        else
        {
            // SeekForPrev lands on `upper` itself when present
            it->SeekForPrev(to_slice(upper));
            if (it->Valid() && it->key() == to_slice(upper))
                it->Prev();
        }
    }

    std::size_t visited = 0;
    const ::rocksdb::Slice prefix = to_slice(options.prefix);
    for (; it->Valid(); options.reverse ? it->Prev() : it->Next())
    {
        if (!it->key().starts_with(prefix))
            break;
        if (options.limit && visited >= *options.limit)
            break;
        ++visited;

        auto key = it->key();
        auto value = it->value();
        if (!callback(
                std::string_view(key.data(), key.size()),
                std::string_view(value.data(), value.size())))
            break;
    }
    check(it->status(), "iterate " + path_);
}

void
RocksStore::write(const WriteBatch& batch)
{
    ::rocksdb::WriteBatch rocks_batch;
    for (const auto& op : batch.operations())
    {
        ::rocksdb::Status status = op.type == WriteBatch::OpType::PUT
            ? rocks_batch.Put(to_slice(op.key), to_slice(op.value))
            : rocks_batch.Delete(to_slice(op.key));
        check(status, "stage " + op.key);
    }

    check(
        db().Write(::rocksdb::WriteOptions(), &rocks_batch),
        "write batch to " + path_);
    PLOGD(
        log_partition_,
        "Committed ",
        batch.size(),
        " operations to ",
        path_);
}

void
RocksStore::compact_range(std::string_view first, std::string_view last)
{
    ::rocksdb::Slice begin = to_slice(first);
    ::rocksdb::Slice end = to_slice(last);
    check(
        db().CompactRange(::rocksdb::CompactRangeOptions(), &begin, &end),
        "compact " + path_);
}

}  // namespace cpak::store
