#ifndef TILEMOSAIC_SERVER_H
#define TILEMOSAIC_SERVER_H
#pragma once

#include "tilemosaic/archive.h"
#include "tilemosaic/catalog.h"
#include "tilemosaic/cog.h"
#include "tilemosaic/fetch.h"
#include "tilemosaic/mosaic.h"

#include <nlohmann/json.hpp>

#include <map>
#include <memory>
#include <string>
#include <vector>

namespace httplib {
class Server;
}

namespace tilemosaic {

enum class HandlerType {
    Mosaic,
    Archive,
};

enum class SourceKind {
    Vector,
    Raster,
};

// One entry of the route table, keyed by its URL prefix ("/roads/").
struct RouteEntry {
    std::string prefix;
    std::string url;
    HandlerType handler = HandlerType::Mosaic;
    SourceKind kind = SourceKind::Vector;
    std::string tile_suffix = "pbf";
    bool community_attribution = true;
    std::string name;
    nlohmann::ordered_json raw;
};

// Entries keep file order. Throws malformed_input_error for a table that is
// not an object of objects or an entry without `url`.
std::vector<RouteEntry> parse_route_table(const std::string &text);

class SourceRegistry {
public:
    struct Source {
        RouteEntry route;
        std::shared_ptr<TileSource> resolver;
    };

    void add(RouteEntry route, std::shared_ptr<TileSource> resolver);

    // `name` is the prefix without its slashes.
    const Source *find(const std::string &name) const;
    const std::vector<Source> &sources() const { return _sources; }
    std::size_t size() const { return _sources.size(); }

    nlohmann::ordered_json routeTable() const;

    // Builds one resolver per route. Relative urls resolve against `table_locator`.
    static SourceRegistry fromRoutes(const std::vector<RouteEntry> &routes, const std::string &table_locator,
                                     std::shared_ptr<Fetcher> fetcher = default_fetcher(),
                                     MosaicOptions mosaic_options = {});

private:
    std::vector<Source> _sources;
    std::map<std::string, std::size_t> _by_name;
};

struct ServerOptions {
    std::string host = "0.0.0.0";
    int port = 3000;
    std::string public_url = "http://localhost:3000";
};

// Transport-independent response.
struct Reply {
    int status = 200;
    std::string body;
    std::string content_type = "text/plain";
    std::map<std::string, std::string> headers;
};

class TileService {
  public:
    // `catalog` may be null, in which case the /stac routes are not mounted.
    TileService(SourceRegistry registry, std::shared_ptr<CogCompositor> compositor,
                std::shared_ptr<CollectionCatalog> catalog, ServerOptions options = {});

    // `extension` is the requested file suffix without the dot.
    Reply tile(const std::string &source, const std::string &z, const std::string &x, const std::string &y,
               const std::string &extension);
    Reply tileJson(const std::string &source);
    Reply title(const std::string &source);
    Reply routes() const;

    Reply cogTile(const std::string &z, const std::string &x, const std::string &y,
                  const std::map<std::string, std::string> &query);
    Reply cogInfo(const std::map<std::string, std::string> &query);

    Reply stacLanding();
    Reply stacConformance();
    Reply stacCollections(const std::map<std::string, std::string> &query);
    Reply stacCollection(const std::string &id);
    Reply stacItems(const std::string &id, const std::map<std::string, std::string> &query);
    Reply stacItem(const std::string &id, const std::string &item_id);
    Reply stacSearch(const std::map<std::string, std::string> &query);
    Reply stacSearchPost(const std::string &body);

    bool hasCatalog() const { return _catalog != nullptr; }
    const SourceRegistry &registry() const { return _registry; }
    const ServerOptions &options() const { return _options; }

  private:
    SourceRegistry _registry;
    std::shared_ptr<CogCompositor> _compositor;
    std::shared_ptr<CollectionCatalog> _catalog;
    ServerOptions _options;
};

void mount_routes(httplib::Server &server, TileService &service);

// Blocks until the server stops. Throws when the port cannot be bound.
void serve(TileService &service);

}  // namespace tilemosaic

#endif // TILEMOSAIC_SERVER_H
