#include "osync/store/json_file_store.hpp"
#include "osync/store/codec.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <fstream>
#include <sstream>
#include <system_error>

namespace osync::store {
namespace fs = std::filesystem;
namespace {

constexpr int kFormatVersion = 1;

json empty_document() {
    return json{{"format", kFormatVersion}, {"items", json::object()}, {"vectors", json::array()}};
}

} // namespace

Result<std::unique_ptr<JsonFileSyncStore>> JsonFileSyncStore::open(fs::path path) {
    using StorePtr = std::unique_ptr<JsonFileSyncStore>;

    std::error_code ec;
    if (!fs::exists(path, ec)) {
        if (path.has_parent_path()) {
            fs::create_directories(path.parent_path(), ec);
            if (ec) {
                return Fail<StorePtr>(ErrorCode::StorageFailure,
                                      "Cannot create " + path.parent_path().string() + ": " + ec.message());
            }
        }
        spdlog::info("Creating sync store at {}", path.string());
        StorePtr store(new JsonFileSyncStore(std::move(path), empty_document()));
        std::lock_guard lock(store->mutex_);
        auto flushed = store->flush_locked();
        if (flushed.is_error()) {
            return Err<StorePtr>(flushed.error());
        }
        return Ok(std::move(store));
    }

    std::ifstream input(path);
    if (!input) {
        return Fail<StorePtr>(ErrorCode::StorageFailure, "Cannot read " + path.string());
    }
    std::ostringstream buffer;
    buffer << input.rdbuf();

    auto document = json::parse(buffer.str(), nullptr, false);
    if (document.is_discarded() || !document.is_object() ||
        !document.contains("items") || !document.at("items").is_object() ||
        !document.contains("vectors") || !document.at("vectors").is_array()) {
        return Fail<StorePtr>(ErrorCode::StorageFailure, "Malformed sync store " + path.string());
    }
    const auto& format = document.value("format", json());
    if (!format.is_number_integer() || format.get<int>() != kFormatVersion) {
        return Fail<StorePtr>(ErrorCode::StorageFailure,
                              "Unsupported sync store format in " + path.string());
    }

    spdlog::info("Opened sync store at {} ({} items)", path.string(), document.at("items").size());
    return Ok(StorePtr(new JsonFileSyncStore(std::move(path), std::move(document))));
}

JsonFileSyncStore::JsonFileSyncStore(fs::path path, json document)
    : path_(std::move(path)), document_(std::move(document)) {}

Result<void> JsonFileSyncStore::save_item(const sync::SyncItem& item) {
    std::lock_guard lock(mutex_);
    document_["items"][item.id()] = item_to_json(item);
    return flush_locked();
}

Result<void> JsonFileSyncStore::remove_item(const std::string& item_id) {
    std::lock_guard lock(mutex_);
    document_["items"].erase(item_id);
    return flush_locked();
}

Result<void> JsonFileSyncStore::save_vector(const sync::EntityRef& entity, const sync::VersionVector& vector) {
    std::lock_guard lock(mutex_);
    auto& vectors = document_["vectors"];
    const auto entity_json = entity_to_json(entity);
    auto it = std::find_if(vectors.begin(), vectors.end(), [&](const json& row) {
        return row.value("entity", json()) == entity_json;
    });
    if (it != vectors.end()) {
        (*it)["vector"] = vector_to_json(vector);
    } else {
        vectors.push_back(json{{"entity", entity_json}, {"vector", vector_to_json(vector)}});
    }
    return flush_locked();
}

Result<void> JsonFileSyncStore::save_counters(const QueueCounters& counters) {
    std::lock_guard lock(mutex_);
    document_["counters"] = json{{"item", counters.item}, {"sequence", counters.sequence}};
    return flush_locked();
}

Result<std::vector<sync::SyncItem>> JsonFileSyncStore::load_items() const {
    std::lock_guard lock(mutex_);
    std::vector<sync::SyncItem> items;
    for (const auto& [id, row] : document_.at("items").items()) {
        auto item = item_from_json(row);
        if (item.is_error()) {
            return Err<std::vector<sync::SyncItem>>(
                make_error(ErrorCode::StorageFailure, "Item " + id + ": " + item.error().message));
        }
        items.push_back(std::move(item.value()));
    }
    std::sort(items.begin(), items.end(), [](const auto& lhs, const auto& rhs) {
        return lhs.sequence() < rhs.sequence();
    });
    return Ok(std::move(items));
}

Result<VectorTable> JsonFileSyncStore::load_vectors() const {
    std::lock_guard lock(mutex_);
    VectorTable table;
    for (const auto& row : document_.at("vectors")) {
        auto entity = entity_from_json(row.value("entity", json()));
        if (entity.is_error()) {
            return Err<VectorTable>(entity.error());
        }
        auto vector = vector_from_json(row.value("vector", json::object()));
        if (vector.is_error()) {
            return Err<VectorTable>(vector.error());
        }
        table.insert_or_assign(entity.value(), vector.value());
    }
    return Ok(std::move(table));
}

Result<QueueCounters> JsonFileSyncStore::load_counters() const {
    std::lock_guard lock(mutex_);
    QueueCounters counters;
    if (!document_.contains("counters")) {
        return Ok(counters);
    }
    const auto& row = document_.at("counters");
    if (!row.is_object()) {
        return Fail<QueueCounters>(ErrorCode::StorageFailure, "Counters must be an object");
    }
    for (const auto* key : {"item", "sequence"}) {
        if (row.contains(key) && !row.at(key).is_number_unsigned()) {
            return Fail<QueueCounters>(ErrorCode::StorageFailure,
                                       std::string("Counter '") + key + "' must be unsigned");
        }
    }
    counters.item = row.value("item", std::uint64_t{0});
    counters.sequence = row.value("sequence", std::uint64_t{0});
    return Ok(counters);
}

Result<void> JsonFileSyncStore::flush_locked() const {
    const fs::path temp = path_.string() + ".tmp";
    {
        std::ofstream output(temp, std::ios::binary | std::ios::trunc);
        if (!output) {
            return Err<void>(make_error(ErrorCode::StorageFailure, "Cannot write " + temp.string()));
        }
        output << document_.dump(2);
        if (!output) {
            return Err<void>(make_error(ErrorCode::StorageFailure, "Short write to " + temp.string()));
        }
    }

    std::error_code ec;
    fs::rename(temp, path_, ec);
    if (ec) {
        return Err<void>(make_error(ErrorCode::StorageFailure,
                                    "Cannot replace " + path_.string() + ": " + ec.message()));
    }
    return Ok();
}

} // namespace osync::store
