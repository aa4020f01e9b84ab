#include "wireload/core/filter/address_pool.hpp"

#include <cstdio>
#include <string_view>
#include <unordered_set>
#include <utility>

#include "simdjson.h"

#include "lcr/log/logger.hpp"


namespace wireload::core::filter {

AddressPool::AddressPool(std::vector<std::string> values) {
    std::unordered_set<std::string_view> seen;
    seen.reserve(values.size());
    values_.reserve(values.size());
    for (auto& v : values) {
        if (seen.count(v) != 0) {
            continue;
        }
        values_.push_back(std::move(v));
        seen.insert(values_.back());
    }
    if (values_.size() != values.size()) {
        WL_DEBUG("[POOL] Dropped " << (values.size() - values_.size()) << " duplicate value(s)");
    }
}

config::Error AddressPool::load_file(const std::string& path, AddressPool& out) {
    simdjson::padded_string json;
    if (auto err = simdjson::padded_string::load(path).get(json); err) {
        WL_ERROR("[POOL] Cannot read token file '" << path << "': " << simdjson::error_message(err));
        return config::Error::PoolUnreadable;
    }

    simdjson::dom::parser parser;
    simdjson::dom::array arr;
    if (auto err = parser.parse(json).get(arr); err) {
        WL_ERROR("[POOL] Token file '" << path << "' is not a JSON array: " << simdjson::error_message(err));
        return config::Error::PoolMalformed;
    }

    std::vector<std::string> values;
    values.reserve(arr.size());
    for (auto el : arr) {
        std::string_view sv;
        if (el.get(sv)) {
            WL_ERROR("[POOL] Token file '" << path << "' contains a non-string element");
            return config::Error::PoolMalformed;
        }
        values.emplace_back(sv);
    }

    out = AddressPool(std::move(values));
    WL_INFO("[POOL] Loaded " << out.size() << " token addresses from " << path);
    return config::Error::None;
}

AddressPool AddressPool::make_synthetic(std::size_t count) {
    std::vector<std::string> values;
    values.reserve(count);
    char buf[32];
    for (std::size_t i = 0; i < count; ++i) {
        std::snprintf(buf, sizeof(buf), "token_%08zx", i);
        values.emplace_back(buf);
    }
    return AddressPool(std::move(values));
}

} // namespace wireload::core::filter
