#ifndef TILEMOSAIC_CATALOG_H
#define TILEMOSAIC_CATALOG_H
#pragma once

#include "tilemosaic/common.h"
#include "tilemosaic/fetch.h"
#include "tilemosaic/lazy_init.h"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace tilemosaic {

struct CollectionDescriptor {
    std::string id;
    std::string title;
    std::string locator;
};

struct FeatureRecord {
    std::string id;
    nlohmann::json geometry;    // GeoJSON geometry or null
    nlohmann::json bbox;        // as stored, null when absent
    nlohmann::json properties;
    nlohmann::json assets;
    nlohmann::json collection;  // string or null
    std::string stac_version = "1.0.0";
    // Stored bbox, else the geometry envelope.
    std::optional<LonLatBox> extent;

    nlohmann::json toJson() const;
};

// Maps one decoded row (column name -> cell) to a feature. `row_index` names
// rows that carry no id.
FeatureRecord record_from_row(const nlohmann::json &row, std::size_t row_index);

// Decodes a whole backing file into rows of column name -> cell. Binary cells
// come back as nlohmann::json binary values.
class FeatureTableReader {
public:
    virtual ~FeatureTableReader() = default;
    virtual std::vector<nlohmann::json> readRows(const std::string &locator) = 0;
};

// GeoParquet through Apache Arrow, with the file bytes pulled by a Fetcher.
class ParquetTableReader : public FeatureTableReader {
public:
    explicit ParquetTableReader(std::shared_ptr<Fetcher> fetcher = default_fetcher());

    std::vector<nlohmann::json> readRows(const std::string &locator) override;

    // Decodes an in-memory parquet file.
    static std::vector<nlohmann::json> decode(const std::string &bytes);

private:
    std::shared_ptr<Fetcher> _fetcher;
};

struct SearchParams {
    std::vector<std::string> collections;  // empty searches every collection
    std::optional<LonLatBox> bbox;
    std::size_t limit = 10;

    // Query string parameters or a POST body; both take `collections` and
    // `bbox` as comma text or arrays.
    static SearchParams fromQuery(const std::map<std::string, std::string> &query);
    static SearchParams fromJson(const nlohmann::json &body);
};

class CollectionCatalog {
  public:
    explicit CollectionCatalog(std::string locator, std::shared_ptr<Fetcher> fetcher = default_fetcher(),
                               std::shared_ptr<FeatureTableReader> reader = nullptr);

    nlohmann::json landingPage();
    nlohmann::json conformance() const;
    nlohmann::json listCollections(std::size_t limit = 100, std::size_t offset = 0);
    std::optional<nlohmann::json> getCollection(const std::string &id);
    std::optional<nlohmann::json> getItems(const std::string &id, std::size_t limit = 10, std::size_t offset = 0,
                                           const std::optional<LonLatBox> &bbox = std::nullopt);
    std::optional<nlohmann::json> getItem(const std::string &id, const std::string &item_id);
    nlohmann::json search(const SearchParams &params);

    std::vector<CollectionDescriptor> collections();

  private:
    struct RecordSet {
        LazyInit init;
        std::vector<FeatureRecord> records;
    };

    void ensureLoaded();
    void load();
    const CollectionDescriptor *find(const std::string &id) const;
    nlohmann::json describeCollection(const CollectionDescriptor &collection) const;
    const std::vector<FeatureRecord> &records(const CollectionDescriptor &collection);

    std::string _locator;
    std::shared_ptr<Fetcher> _fetcher;
    std::shared_ptr<FeatureTableReader> _reader;
    LazyInit _init;

    nlohmann::json _catalog;
    std::vector<CollectionDescriptor> _collections;

    std::mutex _sets_mutex;
    std::map<std::string, std::shared_ptr<RecordSet>> _sets;
};

}  // namespace tilemosaic

#endif // TILEMOSAIC_CATALOG_H
