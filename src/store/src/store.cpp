#include "cpak/store/store.h"
#include "cpak/core/errors.h"

#include <utility>

namespace cpak::store {

void
WriteBatch::put(std::string key, const boost::json::value& value)
{
    operations_.push_back(
        {OpType::PUT, std::move(key), boost::json::serialize(value)});
}

void
WriteBatch::del(std::string key)
{
    operations_.push_back({OpType::DEL, std::move(key), {}});
}

namespace {

std::optional<std::string>
edge_key(Store& store, bool reverse)
{
    std::optional<std::string> found;
    ScanOptions options;
    options.reverse = reverse;
    options.limit = 1;
    options.fill_cache = false;
    store.scan(options, [&](std::string_view key, std::string_view) {
        found = std::string(key);
        return false;
    });
    return found;
}

}  // namespace

boost::json::value
Store::decode(std::string_view key, std::string_view raw)
{
    boost::system::error_code ec;
    boost::json::value jv = boost::json::parse(raw, ec);
    if (ec)
    {
        throw ParseError(
            "stored value of " + std::string(key) + ": " + ec.message());
    }
    return jv;
}

std::optional<boost::json::value>
Store::get(std::string_view key)
{
    auto raw = get_raw(key);
    if (!raw)
        return std::nullopt;
    return decode(key, *raw);
}

void
Store::for_each(
    const std::function<void(const std::string& key, boost::json::value)>& fn,
    std::string_view prefix)
{
    ScanOptions options;
    options.prefix = std::string(prefix);
    scan(options, [&](std::string_view key, std::string_view raw) {
        std::string k(key);
        fn(k, decode(key, raw));
        return true;
    });
}

std::vector<std::string>
Store::keys()
{
    std::vector<std::string> result;
    scan({}, [&](std::string_view key, std::string_view) {
        result.emplace_back(key);
        return true;
    });
    return result;
}

std::optional<std::string>
Store::first_key()
{
    return edge_key(*this, false);
}

std::optional<std::string>
Store::last_key()
{
    return edge_key(*this, true);
}

}  // namespace cpak::store
