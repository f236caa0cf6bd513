#include "cpak/store/memory-store.h"

namespace cpak::store {

std::optional<std::string>
MemoryStore::get_raw(std::string_view key)
{
    auto it = entries_.find(key);
    if (it == entries_.end())
        return std::nullopt;
    return it->second;
}

void
MemoryStore::scan(const ScanOptions& options, const ScanCallback& callback)
{
    std::size_t visited = 0;
    auto accept = [&](const std::string& key, const std::string& value) {
        if (options.limit && visited >= *options.limit)
            return false;
        ++visited;
        return callback(key, value);
    };
    auto matches = [&](const std::string& key) {
        return key.compare(0, options.prefix.size(), options.prefix) == 0;
    };

    if (!options.reverse)
    {
        for (auto it = entries_.lower_bound(options.prefix);
             it != entries_.end() && matches(it->first);
             ++it)
        {
            if (!accept(it->first, it->second))
                return;
        }
        return;
    }

    for (auto it = entries_.rbegin(); it != entries_.rend(); ++it)
    {
        if (!matches(it->first))
        {
            // Past the prefix range on the low side
            if (it->first < options.prefix)
                return;
            continue;
        }
        if (!accept(it->first, it->second))
            return;
    }
}

void
MemoryStore::write(const WriteBatch& batch)
{
    for (const auto& op : batch.operations())
    {
        if (op.type == WriteBatch::OpType::PUT)
            entries_[op.key] = op.value;
        else
            entries_.erase(op.key);
    }
    ++write_count_;
}

void
MemoryStore::compact_range(std::string_view first, std::string_view last)
{
    compactions_.emplace_back(std::string(first), std::string(last));
}

void
MemoryStore::put_raw(std::string key, std::string value)
{
    entries_[std::move(key)] = std::move(value);
}

}  // namespace cpak::store
