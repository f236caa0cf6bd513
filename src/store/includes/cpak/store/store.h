#pragma once

#include <boost/json.hpp>
#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace cpak::store {

/**
 * Ordered list of puts and deletes applied atomically by Store::write().
 * Values are encoded to the store's JSON text encoding when staged.
 */
class WriteBatch
{
public:
    enum class OpType { PUT, DEL };

    struct Operation
    {
        OpType type;
        std::string key;
        std::string value;  // empty for deletes
    };

    void
    put(std::string key, const boost::json::value& value);

    void
    del(std::string key);

    const std::vector<Operation>&
    operations() const
    {
        return operations_;
    }

    std::size_t
    size() const
    {
        return operations_.size();
    }

    bool
    empty() const
    {
        return operations_.empty();
    }

    void
    clear()
    {
        operations_.clear();
    }

private:
    std::vector<Operation> operations_;
};

/**
 * Bounds of an ordered scan. Forward scans start at the first key with
 * `prefix`; reverse scans at the last one. Either stops after `limit`
 * entries.
 */
struct ScanOptions
{
    std::string prefix;
    bool reverse = false;
    std::optional<std::size_t> limit;
    bool fill_cache = true;
};

/**
 * Return false to stop the scan early.
 */
using ScanCallback =
    std::function<bool(std::string_view key, std::string_view value)>;

/**
 * Ordered key-value store holding composite keys and JSON documents.
 * Implementations can wrap RocksDB or keep everything in memory.
 */
class Store
{
public:
    virtual ~Store() = default;

    /**
     * Fetch the raw encoded value of a key.
     * @return std::nullopt if the key is not present
     */
    virtual std::optional<std::string>
    get_raw(std::string_view key) = 0;

    /**
     * Visit entries in key order (or reverse key order).
     */
    virtual void
    scan(const ScanOptions& options, const ScanCallback& callback) = 0;

    /**
     * Apply every operation of the batch atomically.
     */
    virtual void
    write(const WriteBatch& batch) = 0;

    /**
     * Compact the inclusive key range [first, last].
     */
    virtual void
    compact_range(std::string_view first, std::string_view last) = 0;

    /**
     * Fetch and decode a document.
     * @throws ParseError if the stored value is not valid JSON
     */
    std::optional<boost::json::value>
    get(std::string_view key);

    /**
     * Visit every decoded entry in key order, optionally restricted to a
     * key prefix.
     */
    void
    for_each(
        const std::function<void(const std::string& key, boost::json::value)>&
            fn,
        std::string_view prefix = {});

    std::vector<std::string>
    keys();

    std::optional<std::string>
    first_key();

    std::optional<std::string>
    last_key();

    /**
     * Decode a raw stored value.
     * @throws ParseError naming the key if the value is not valid JSON
     */
    static boost::json::value
    decode(std::string_view key, std::string_view raw);
};

}  // namespace cpak::store
