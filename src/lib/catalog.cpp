#include "tilemosaic/catalog.h"
#include "tilemosaic/geometry.h"

#include "aixlog.hpp"

#include <algorithm>
#include <cstdint>

namespace tilemosaic {

namespace {

const char *const kStacVersion = "1.0.0";

nlohmann::json conforms_to() {
    return {
        "https://api.stacspec.org/v1.0.0/core",
        "https://api.stacspec.org/v1.0.0/collections",
        "https://api.stacspec.org/v1.0.0/item-search",
        "http://www.opengis.net/spec/ogcapi-features-1/1.0/conf/core",
        "http://www.opengis.net/spec/ogcapi-features-1/1.0/conf/geojson",
    };
}

nlohmann::json link(const std::string &rel, const std::string &type, const std::string &href) {
    return {{"rel", rel}, {"type", type}, {"href", href}};
}

std::string collection_href(const std::string &id) {
    return "/stac/collections/" + id;
}

std::string string_field(const nlohmann::json &value, const char *key, const std::string &fallback) {
    const auto it = value.find(key);
    if (it != value.end() && it->is_string()) {
        return it->get<std::string>();
    }
    return fallback;
}

std::string collection_id_from_href(std::string href) {
    if (starts_with(href, "./")) {
        href.erase(0, 2);
    }
    if (!href.empty() && href.back() == '/') {
        href.pop_back();
    }
    return href;
}

// JSON text cells decode to objects; anything unreadable becomes `fallback`.
nlohmann::json json_cell(const nlohmann::json &cell, const nlohmann::json &fallback) {
    if (cell.is_string()) {
        nlohmann::json parsed = nlohmann::json::parse(cell.get<std::string>(), nullptr, false);
        return parsed.is_discarded() ? fallback : parsed;
    }
    if (cell.is_object()) {
        return cell;
    }
    return fallback;
}

nlohmann::json geometry_cell(const nlohmann::json &cell, std::size_t row_index) {
    if (cell.is_string()) {
        nlohmann::json parsed = nlohmann::json::parse(cell.get<std::string>(), nullptr, false);
        if (parsed.is_discarded()) {
            LOG(WARNING) << "Failed to parse geometry for row " << row_index << "\n";
            return nullptr;
        }
        return parsed;
    }
    if (cell.is_binary()) {
        const auto &bytes = cell.get_binary();
        try {
            return wkb_to_geojson(bytes.data(), bytes.size());
        } catch (const malformed_input_error &ex) {
            LOG(WARNING) << "Failed to decode geometry for row " << row_index << ": " << ex.what() << "\n";
            return nullptr;
        }
    }
    if (cell.is_object()) {
        return cell;
    }
    return nullptr;
}

nlohmann::json bbox_cell(const nlohmann::json &cell) {
    if (cell.is_string()) {
        nlohmann::json parsed = nlohmann::json::parse(cell.get<std::string>(), nullptr, false);
        return parsed.is_discarded() ? nlohmann::json() : parsed;
    }
    if (cell.is_array()) {
        return cell;
    }
    if (cell.is_object() && cell.contains("xmin") && cell.contains("ymin") && cell.contains("xmax") &&
        cell.contains("ymax")) {
        return {cell["xmin"], cell["ymin"], cell["xmax"], cell["ymax"]};
    }
    return nullptr;
}

std::optional<LonLatBox> extent_of(const nlohmann::json &bbox) {
    if (!bbox.is_array() || (bbox.size() != 4 && bbox.size() != 6)) {
        return std::nullopt;
    }
    for (const auto &value : bbox) {
        if (!value.is_number()) {
            return std::nullopt;
        }
    }
    const std::size_t hi = bbox.size() / 2;
    return LonLatBox{bbox[0].get<double>(), bbox[1].get<double>(), bbox[hi].get<double>(),
                     bbox[hi + 1].get<double>()};
}

bool matches(const FeatureRecord &record, const std::optional<LonLatBox> &bbox) {
    if (!bbox) {
        return true;
    }
    return record.extent && record.extent->intersects(*bbox);
}

std::size_t parse_limit(const std::string &text) {
    const std::optional<int> value = parse_int(text);
    if (!value || *value < 0) {
        throw bad_request_error("Invalid limit: " + text);
    }
    return static_cast<std::size_t>(*value);
}

std::vector<std::string> collection_list(const nlohmann::json &value) {
    std::vector<std::string> names;
    if (value.is_string()) {
        for (const std::string &name : split(value.get<std::string>(), ',')) {
            if (!name.empty()) {
                names.push_back(name);
            }
        }
    } else if (value.is_array()) {
        for (const auto &name : value) {
            if (name.is_string()) {
                names.push_back(name.get<std::string>());
            }
        }
    } else if (!value.is_null()) {
        throw bad_request_error("collections must be a string or an array");
    }
    return names;
}

}  // namespace

nlohmann::json FeatureRecord::toJson() const {
    nlohmann::json out;
    out["type"] = "Feature";
    out["stac_version"] = stac_version;
    out["id"] = id;
    out["geometry"] = geometry;
    out["properties"] = properties;
    out["assets"] = assets;
    out["collection"] = collection;
    out["links"] = nlohmann::json::array();
    if (!bbox.is_null()) {
        out["bbox"] = bbox;
    }
    return out;
}

FeatureRecord record_from_row(const nlohmann::json &row, std::size_t row_index) {
    static const nlohmann::json kNull;
    const auto cell = [&](const char *name) -> const nlohmann::json & {
        const auto it = row.find(name);
        return it == row.end() ? kNull : *it;
    };

    FeatureRecord record;
    const nlohmann::json &id = cell("id");
    if (id.is_string() && !id.get<std::string>().empty()) {
        record.id = id.get<std::string>();
    } else if (id.is_number()) {
        record.id = id.dump();
    } else {
        record.id = "item-" + std::to_string(row_index);
    }

    record.geometry = geometry_cell(cell("geometry"), row_index);
    record.properties = json_cell(cell("properties"), nlohmann::json::object());
    record.assets = json_cell(cell("assets"), nlohmann::json::object());
    record.bbox = bbox_cell(cell("bbox"));

    const nlohmann::json &collection = cell("collection");
    record.collection = collection.is_string() ? collection : nlohmann::json();
    const nlohmann::json &version = cell("stac_version");
    if (version.is_string() && !version.get<std::string>().empty()) {
        record.stac_version = version.get<std::string>();
    }

    record.extent = extent_of(record.bbox);
    if (!record.extent) {
        record.extent = geometry_envelope(record.geometry);
    }
    return record;
}

SearchParams SearchParams::fromQuery(const std::map<std::string, std::string> &query) {
    SearchParams params;
    const auto collections = query.find("collections");
    if (collections != query.end()) {
        params.collections = collection_list(collections->second);
    }
    const auto bbox = query.find("bbox");
    if (bbox != query.end() && !bbox->second.empty()) {
        params.bbox = parse_bbox(bbox->second);
    }
    const auto limit = query.find("limit");
    if (limit != query.end() && !limit->second.empty()) {
        params.limit = parse_limit(limit->second);
    }
    return params;
}

SearchParams SearchParams::fromJson(const nlohmann::json &body) {
    SearchParams params;
    if (body.is_null()) {
        return params;
    }
    if (!body.is_object()) {
        throw bad_request_error("Search body must be a JSON object");
    }
    if (body.contains("collections")) {
        params.collections = collection_list(body["collections"]);
    }
    if (body.contains("bbox") && !body["bbox"].is_null()) {
        params.bbox = parse_bbox(body["bbox"]);
    }
    if (body.contains("limit")) {
        const nlohmann::json &limit = body["limit"];
        if (limit.is_number_integer() && limit.get<std::int64_t>() >= 0) {
            params.limit = limit.get<std::size_t>();
        } else if (limit.is_string()) {
            params.limit = parse_limit(limit.get<std::string>());
        } else if (!limit.is_null()) {
            throw bad_request_error("limit must be a non-negative integer");
        }
    }
    return params;
}

CollectionCatalog::CollectionCatalog(std::string locator, std::shared_ptr<Fetcher> fetcher,
                                     std::shared_ptr<FeatureTableReader> reader)
    : _locator(std::move(locator)), _fetcher(std::move(fetcher)), _reader(std::move(reader)) {
    if (!_reader) {
        _reader = std::make_shared<ParquetTableReader>(_fetcher);
    }
}

void CollectionCatalog::ensureLoaded() {
    _init.ensure([this]() { load(); });
}

void CollectionCatalog::load() {
    const std::string text = _fetcher->fetch(_locator);
    nlohmann::json catalog;
    try {
        catalog = nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error &ex) {
        throw malformed_input_error("Invalid catalog " + _locator + ": " + ex.what());
    }
    if (!catalog.is_object()) {
        throw malformed_input_error("Catalog " + _locator + " is not a JSON object");
    }

    std::vector<CollectionDescriptor> collections;
    const auto links = catalog.find("links");
    if (links != catalog.end() && links->is_array()) {
        for (const auto &entry : *links) {
            if (!entry.is_object() || string_field(entry, "rel", "") != "child") {
                continue;
            }
            const std::string parquet = string_field(entry, "geoparquet", "");
            if (parquet.empty()) {
                continue;
            }
            CollectionDescriptor collection;
            collection.id = collection_id_from_href(string_field(entry, "href", ""));
            if (collection.id.empty()) {
                LOG(WARNING) << "Skipping catalog link without href for " << parquet << "\n";
                continue;
            }
            collection.title = string_field(entry, "title", collection.id);
            collection.locator = resolve_locator(_locator, parquet);
            collections.push_back(std::move(collection));
        }
    }

    _catalog = std::move(catalog);
    _collections = std::move(collections);
    LOG(INFO) << "Loaded catalog " << _locator << " with " << _collections.size() << " collections\n";
}

std::vector<CollectionDescriptor> CollectionCatalog::collections() {
    ensureLoaded();
    return _collections;
}

const CollectionDescriptor *CollectionCatalog::find(const std::string &id) const {
    for (const CollectionDescriptor &collection : _collections) {
        if (collection.id == id) {
            return &collection;
        }
    }
    return nullptr;
}

const std::vector<FeatureRecord> &CollectionCatalog::records(const CollectionDescriptor &collection) {
    std::shared_ptr<RecordSet> set;
    {
        std::lock_guard<std::mutex> lock(_sets_mutex);
        std::shared_ptr<RecordSet> &slot = _sets[collection.locator];
        if (!slot) {
            slot = std::make_shared<RecordSet>();
        }
        set = slot;
    }

    set->init.ensure([&]() {
        const std::vector<nlohmann::json> rows = _reader->readRows(collection.locator);
        std::vector<FeatureRecord> records;
        records.reserve(rows.size());
        for (std::size_t i = 0; i < rows.size(); ++i) {
            records.push_back(record_from_row(rows[i], i));
        }
        set->records = std::move(records);
        LOG(INFO) << "Loaded " << set->records.size() << " items from " << collection.locator << "\n";
    });
    return set->records;
}

nlohmann::json CollectionCatalog::landingPage() {
    ensureLoaded();
    nlohmann::json landing;
    landing["stac_version"] = kStacVersion;
    landing["type"] = "Catalog";
    landing["id"] = string_field(_catalog, "id", "stac-api");
    landing["title"] = string_field(_catalog, "title", "STAC API");
    landing["description"] =
        string_field(_catalog, "description", "A STAC API serving collections from geoparquet files");
    landing["conformsTo"] = conforms_to();

    nlohmann::json links = nlohmann::json::array();
    links.push_back(link("self", "application/json", "/stac"));
    links.push_back(link("root", "application/json", "/stac"));
    links.push_back(link("data", "application/json", "/stac/collections"));
    links.push_back(link("conformance", "application/json", "/stac/conformance"));
    for (const char *method : {"GET", "POST"}) {
        nlohmann::json search = link("search", "application/json", "/stac/search");
        search["method"] = method;
        links.push_back(search);
    }
    for (const CollectionDescriptor &collection : _collections) {
        links.push_back(link("child", "application/json", collection_href(collection.id)));
    }
    landing["links"] = links;
    return landing;
}

nlohmann::json CollectionCatalog::conformance() const {
    return {{"conformsTo", conforms_to()}};
}

nlohmann::json CollectionCatalog::describeCollection(const CollectionDescriptor &collection) const {
    nlohmann::json out;
    out["stac_version"] = kStacVersion;
    out["type"] = "Collection";
    out["id"] = collection.id;
    out["title"] = collection.title;
    out["description"] = "Collection " + collection.id;
    out["license"] = "proprietary";
    out["extent"]["spatial"]["bbox"] = nlohmann::json::array({nlohmann::json::array({-180, -90, 180, 90})});
    out["extent"]["temporal"]["interval"] = nlohmann::json::array({nlohmann::json::array({nullptr, nullptr})});
    out["links"] = {
        link("self", "application/json", collection_href(collection.id)),
        link("root", "application/json", "/stac"),
        link("items", "application/geo+json", collection_href(collection.id) + "/items"),
    };
    return out;
}

nlohmann::json CollectionCatalog::listCollections(std::size_t limit, std::size_t offset) {
    ensureLoaded();
    nlohmann::json collections = nlohmann::json::array();
    for (std::size_t i = offset; i < _collections.size() && collections.size() < limit; ++i) {
        collections.push_back(describeCollection(_collections[i]));
    }
    nlohmann::json out;
    out["collections"] = collections;
    out["links"] = {
        link("self", "application/json", "/stac/collections"),
        link("root", "application/json", "/stac"),
    };
    return out;
}

std::optional<nlohmann::json> CollectionCatalog::getCollection(const std::string &id) {
    ensureLoaded();
    const CollectionDescriptor *collection = find(id);
    if (collection == nullptr) {
        return std::nullopt;
    }
    return describeCollection(*collection);
}

std::optional<nlohmann::json> CollectionCatalog::getItems(const std::string &id, std::size_t limit,
                                                          std::size_t offset, const std::optional<LonLatBox> &bbox) {
    ensureLoaded();
    const CollectionDescriptor *collection = find(id);
    if (collection == nullptr) {
        return std::nullopt;
    }

    nlohmann::json features = nlohmann::json::array();
    std::size_t skipped = 0;
    for (const FeatureRecord &record : records(*collection)) {
        if (features.size() >= limit) {
            break;
        }
        if (!matches(record, bbox)) {
            continue;
        }
        if (skipped < offset) {
            ++skipped;
            continue;
        }
        features.push_back(record.toJson());
    }

    nlohmann::json out;
    out["type"] = "FeatureCollection";
    out["features"] = features;
    out["links"] = {
        link("self", "application/geo+json", collection_href(id) + "/items"),
        link("root", "application/json", "/stac"),
        link("collection", "application/json", collection_href(id)),
    };
    out["context"] = {{"returned", features.size()}, {"limit", limit}};
    return out;
}

std::optional<nlohmann::json> CollectionCatalog::getItem(const std::string &id, const std::string &item_id) {
    ensureLoaded();
    const CollectionDescriptor *collection = find(id);
    if (collection == nullptr) {
        return std::nullopt;
    }

    const std::vector<FeatureRecord> &items = records(*collection);
    const auto found = std::find_if(items.begin(), items.end(),
                                    [&](const FeatureRecord &record) { return record.id == item_id; });
    if (found == items.end()) {
        return std::nullopt;
    }

    nlohmann::json item = found->toJson();
    item["links"] = {
        link("self", "application/geo+json", collection_href(id) + "/items/" + item_id),
        link("root", "application/json", "/stac"),
        link("collection", "application/json", collection_href(id)),
        link("parent", "application/json", collection_href(id)),
    };
    return item;
}

nlohmann::json CollectionCatalog::search(const SearchParams &params) {
    ensureLoaded();

    std::vector<const CollectionDescriptor *> targets;
    if (params.collections.empty()) {
        for (const CollectionDescriptor &collection : _collections) {
            targets.push_back(&collection);
        }
    } else {
        for (const std::string &name : params.collections) {
            const CollectionDescriptor *collection = find(name);
            if (collection != nullptr) {
                targets.push_back(collection);
            }
        }
    }

    nlohmann::json features = nlohmann::json::array();
    for (const CollectionDescriptor *collection : targets) {
        if (features.size() >= params.limit) {
            break;
        }
        try {
            for (const FeatureRecord &record : records(*collection)) {
                if (features.size() >= params.limit) {
                    break;
                }
                if (matches(record, params.bbox)) {
                    features.push_back(record.toJson());
                }
            }
        } catch (const tilemosaic_error &ex) {
            LOG(ERROR) << "Skipping collection " << collection->id << " in search: " << ex.what() << "\n";
        }
    }

    nlohmann::json out;
    out["type"] = "FeatureCollection";
    out["features"] = features;
    out["links"] = {
        link("self", "application/geo+json", "/stac/search"),
        link("root", "application/json", "/stac"),
    };
    out["context"] = {{"returned", features.size()}, {"limit", params.limit}};
    return out;
}

}  // namespace tilemosaic
