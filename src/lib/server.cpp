#include "tilemosaic/server.h"
#include "tilemosaic/geometry.h"

#include "aixlog.hpp"
#include "httplib.h"

#include <functional>
#include <utility>

namespace tilemosaic {

namespace {

const char *const kLongCache = "max-age=86400000";
const char *const kInfoCache = "max-age=86400";
const char *const kJson = "application/json";
const char *const kGeoJson = "application/geo+json";

Reply json_reply(const nlohmann::json &value, const char *content_type = kJson) {
    Reply reply;
    reply.body = value.dump();
    reply.content_type = content_type;
    return reply;
}

Reply error_reply(int status, const std::string &message) {
    Reply reply = json_reply({{"error", message}});
    reply.status = status;
    return reply;
}

Reply empty_reply(int status) {
    Reply reply;
    reply.status = status;
    return reply;
}

// Runs `handler`, turning thrown errors into {error} replies with the mapped status.
Reply guarded(const char *what, const std::function<Reply()> &handler) {
    try {
        return handler();
    } catch (const tilemosaic_error &ex) {
        LOG(ERROR) << what << ": " << ex.what() << "\n";
        return error_reply(http_status(ex.kind()), ex.what());
    } catch (const std::exception &ex) {
        LOG(ERROR) << what << ": " << ex.what() << "\n";
        return error_reply(500, ex.what());
    }
}

std::string query_value(const std::map<std::string, std::string> &query, const std::string &key) {
    const auto it = query.find(key);
    return it == query.end() ? std::string() : it->second;
}

std::size_t query_count(const std::map<std::string, std::string> &query, const std::string &key,
                        std::size_t fallback) {
    const std::string text = query_value(query, key);
    if (text.empty()) {
        return fallback;
    }
    const std::optional<int> value = parse_int(text);
    if (!value || *value < 0) {
        throw bad_request_error("Invalid " + key + ": " + text);
    }
    return static_cast<std::size_t>(*value);
}

int tile_index(const std::string &text) {
    const std::optional<int> value = parse_int(text);
    if (!value) {
        throw bad_request_error("non integer values in tile url");
    }
    return *value;
}

std::string source_name(const std::string &prefix) {
    std::string name = prefix;
    while (!name.empty() && name.front() == '/') {
        name.erase(0, 1);
    }
    while (!name.empty() && name.back() == '/') {
        name.pop_back();
    }
    return name;
}

std::map<std::string, std::string> query_map(const httplib::Request &req) {
    std::map<std::string, std::string> query;
    for (const auto &param : req.params) {
        query.emplace(param.first, param.second);
    }
    return query;
}

void send(httplib::Response &res, const Reply &reply) {
    res.status = reply.status;
    res.set_header("Access-Control-Allow-Origin", "*");
    for (const auto &header : reply.headers) {
        res.set_header(header.first, header.second);
    }
    res.set_content(reply.body, reply.content_type);
}

}  // namespace

std::vector<RouteEntry> parse_route_table(const std::string &text) {
    nlohmann::ordered_json table;
    try {
        table = nlohmann::ordered_json::parse(text);
    } catch (const nlohmann::json::parse_error &ex) {
        throw malformed_input_error(std::string("Invalid route table: ") + ex.what());
    }
    if (!table.is_object()) {
        throw malformed_input_error("Route table must be a JSON object");
    }

    std::vector<RouteEntry> routes;
    for (auto it = table.begin(); it != table.end(); ++it) {
        const nlohmann::ordered_json &info = it.value();
        if (!info.is_object() || !info.contains("url") || !info["url"].is_string()) {
            throw malformed_input_error("Route " + it.key() + " has no url");
        }

        RouteEntry route;
        route.prefix = it.key();
        route.url = info["url"].get<std::string>();
        route.raw = info;

        const std::string handler = info.value("handlertype", std::string("archive"));
        route.handler = handler == "mosaic" ? HandlerType::Mosaic : HandlerType::Archive;
        route.kind = info.value("type", std::string("vector")) == "raster" ? SourceKind::Raster : SourceKind::Vector;
        if (route.kind == SourceKind::Raster) {
            route.tile_suffix = info.value("tilesuffix", std::string("webp"));
        } else {
            route.tile_suffix = "pbf";
        }
        route.community_attribution = info.value("datameet_attribution", true);
        route.name = info.value("name", std::string());

        if (source_name(route.prefix).empty()) {
            throw malformed_input_error("Route prefix " + route.prefix + " names no source");
        }
        routes.push_back(std::move(route));
    }
    return routes;
}

void SourceRegistry::add(RouteEntry route, std::shared_ptr<TileSource> resolver) {
    const std::string name = source_name(route.prefix);
    if (_by_name.count(name) > 0) {
        throw malformed_input_error("Duplicate route " + route.prefix);
    }
    _by_name.emplace(name, _sources.size());
    _sources.push_back({std::move(route), std::move(resolver)});
}

const SourceRegistry::Source *SourceRegistry::find(const std::string &name) const {
    const auto it = _by_name.find(source_name(name));
    if (it == _by_name.end()) {
        return nullptr;
    }
    return &_sources[it->second];
}

nlohmann::ordered_json SourceRegistry::routeTable() const {
    nlohmann::ordered_json table = nlohmann::ordered_json::object();
    for (const Source &source : _sources) {
        table[source.route.prefix] = source.route.raw;
    }
    return table;
}

SourceRegistry SourceRegistry::fromRoutes(const std::vector<RouteEntry> &routes, const std::string &table_locator,
                                          std::shared_ptr<Fetcher> fetcher, MosaicOptions mosaic_options) {
    SourceRegistry registry;
    for (const RouteEntry &route : routes) {
        const std::string locator = resolve_locator(table_locator, route.url);
        std::shared_ptr<TileSource> resolver;
        if (route.handler == HandlerType::Mosaic) {
            MosaicOptions options = mosaic_options;
            options.community_attribution = route.community_attribution;
            resolver = std::make_shared<MosaicResolver>(locator, fetcher, options);
        } else {
            ArchiveOptions options;
            options.community_attribution = route.community_attribution;
            options.cache_dir = mosaic_options.archive_cache_dir;
            resolver = std::make_shared<ArchiveResolver>(locator, options, fetcher);
        }
        LOG(DEBUG) << "Registered " << route.prefix << " -> " << locator << "\n";
        registry.add(route, std::move(resolver));
    }
    LOG(INFO) << "Registered " << registry.size() << " tile sources\n";
    return registry;
}

TileService::TileService(SourceRegistry registry, std::shared_ptr<CogCompositor> compositor,
                         std::shared_ptr<CollectionCatalog> catalog, ServerOptions options)
    : _registry(std::move(registry)),
      _compositor(std::move(compositor)),
      _catalog(std::move(catalog)),
      _options(std::move(options)) {
    while (!_options.public_url.empty() && _options.public_url.back() == '/') {
        _options.public_url.pop_back();
    }
}

Reply TileService::tile(const std::string &source, const std::string &z, const std::string &x, const std::string &y,
                        const std::string &extension) {
    const SourceRegistry::Source *entry = _registry.find(source);
    if (entry == nullptr) {
        return empty_reply(404);
    }

    const bool to_png = extension == "png" && entry->route.kind == SourceKind::Raster &&
                        entry->route.tile_suffix == "webp";
    if (extension != entry->route.tile_suffix && !to_png) {
        return empty_reply(404);
    }

    int zoom = 0;
    int column = 0;
    int row = 0;
    try {
        zoom = tile_index(z);
        column = tile_index(x);
        row = tile_index(y);
    } catch (const bad_request_error &ex) {
        Reply reply;
        reply.status = 400;
        reply.body = ex.what();
        return reply;
    }

    try {
        std::optional<TileData> data = entry->resolver->getTile(zoom, column, row);
        if (!data) {
            return empty_reply(404);
        }

        Reply reply;
        reply.headers["Cache-Control"] = kLongCache;
        if (to_png) {
            const RGBAImage image(reinterpret_cast<const unsigned char *>(data->bytes.data()),
                                  static_cast<int>(data->bytes.size()));
            reply.body = image.encodePng();
            reply.content_type = "image/png";
        } else {
            reply.body = std::move(data->bytes);
            reply.content_type = data->media_type;
        }
        return reply;
    } catch (const std::exception &ex) {
        LOG(ERROR) << "Tile " << source << "/" << zoom << "/" << column << "/" << row << " failed: " << ex.what()
                   << "\n";
        return empty_reply(404);
    }
}

Reply TileService::tileJson(const std::string &source) {
    const SourceRegistry::Source *entry = _registry.find(source);
    if (entry == nullptr) {
        return error_reply(404, "Source not found");
    }
    return guarded("tiles.json", [&]() {
        nlohmann::json config = to_tilejson(entry->resolver->getMetadata());
        const std::string prefix = "/" + source_name(entry->route.prefix) + "/";
        config["tiles"] = {_options.public_url + prefix + "{z}/{x}/{y}." + entry->route.tile_suffix};
        Reply reply = json_reply(config);
        reply.headers["Cache-Control"] = kLongCache;
        return reply;
    });
}

Reply TileService::title(const std::string &source) {
    const SourceRegistry::Source *entry = _registry.find(source);
    if (entry == nullptr) {
        return error_reply(404, "Source not found");
    }
    Reply reply = json_reply({{"title", entry->route.name}});
    reply.headers["Cache-Control"] = kLongCache;
    return reply;
}

Reply TileService::routes() const {
    return json_reply(_registry.routeTable());
}

Reply TileService::cogTile(const std::string &z, const std::string &x, const std::string &y,
                           const std::map<std::string, std::string> &query) {
    const std::string url = query_value(query, "url");
    if (url.empty()) {
        return error_reply(400, "URL parameter is required");
    }

    try {
        const ImageFormat format = parse_image_format(query_value(query, "format"));
        std::optional<TileData> data = _compositor->getTile(url, tile_index(z), tile_index(x), tile_index(y), format);
        if (!data) {
            return empty_reply(404);
        }
        Reply reply;
        reply.body = std::move(data->bytes);
        reply.content_type = data->media_type;
        reply.headers["Cache-Control"] = kLongCache;
        return reply;
    } catch (const tilemosaic_error &ex) {
        LOG(ERROR) << "Error processing COG tile " << url << ": " << ex.what() << "\n";
        return empty_reply(http_status(ex.kind()));
    } catch (const std::exception &ex) {
        LOG(ERROR) << "Error processing COG tile " << url << ": " << ex.what() << "\n";
        return empty_reply(500);
    }
}

Reply TileService::cogInfo(const std::map<std::string, std::string> &query) {
    const std::string url = query_value(query, "url");
    if (url.empty()) {
        return error_reply(400, "URL parameter is required");
    }
    return guarded("cog-info", [&]() {
        Reply reply = json_reply(_compositor->getInfo(url).toJson());
        reply.headers["Cache-Control"] = kInfoCache;
        return reply;
    });
}

Reply TileService::stacLanding() {
    return guarded("stac", [&]() { return json_reply(_catalog->landingPage()); });
}

Reply TileService::stacConformance() {
    return json_reply(_catalog->conformance());
}

Reply TileService::stacCollections(const std::map<std::string, std::string> &query) {
    return guarded("stac collections", [&]() {
        const std::size_t limit = query_count(query, "limit", 100);
        const std::size_t offset = query_count(query, "offset", 0);
        return json_reply(_catalog->listCollections(limit, offset));
    });
}

Reply TileService::stacCollection(const std::string &id) {
    return guarded("stac collection", [&]() {
        const std::optional<nlohmann::json> collection = _catalog->getCollection(id);
        if (!collection) {
            return error_reply(404, "Collection not found");
        }
        return json_reply(*collection);
    });
}

Reply TileService::stacItems(const std::string &id, const std::map<std::string, std::string> &query) {
    return guarded("stac items", [&]() {
        const std::size_t limit = query_count(query, "limit", 10);
        const std::size_t offset = query_count(query, "offset", 0);
        std::optional<LonLatBox> bbox;
        const std::string bbox_text = query_value(query, "bbox");
        if (!bbox_text.empty()) {
            bbox = parse_bbox(bbox_text);
        }
        const std::optional<nlohmann::json> items = _catalog->getItems(id, limit, offset, bbox);
        if (!items) {
            return error_reply(404, "Collection not found");
        }
        return json_reply(*items, kGeoJson);
    });
}

Reply TileService::stacItem(const std::string &id, const std::string &item_id) {
    return guarded("stac item", [&]() {
        const std::optional<nlohmann::json> item = _catalog->getItem(id, item_id);
        if (!item) {
            return error_reply(404, "Item not found");
        }
        return json_reply(*item, kGeoJson);
    });
}

Reply TileService::stacSearch(const std::map<std::string, std::string> &query) {
    return guarded("stac search", [&]() {
        return json_reply(_catalog->search(SearchParams::fromQuery(query)), kGeoJson);
    });
}

Reply TileService::stacSearchPost(const std::string &body) {
    return guarded("stac search", [&]() {
        nlohmann::json params;
        if (!trim(body).empty()) {
            params = nlohmann::json::parse(body, nullptr, false);
            if (params.is_discarded()) {
                throw bad_request_error("Search body is not valid JSON");
            }
        }
        return json_reply(_catalog->search(SearchParams::fromJson(params)), kGeoJson);
    });
}

void mount_routes(httplib::Server &server, TileService &service) {
    server.Get("/api/routes", [&service](const httplib::Request &, httplib::Response &res) {
        send(res, service.routes());
    });

    server.Get("/cog-info", [&service](const httplib::Request &req, httplib::Response &res) {
        send(res, service.cogInfo(query_map(req)));
    });

    server.Get(R"(/cog-tiles/([^/]+)/([^/]+)/([^/]+))", [&service](const httplib::Request &req, httplib::Response &res) {
        send(res, service.cogTile(req.matches[1].str(), req.matches[2].str(), req.matches[3].str(), query_map(req)));
    });

    if (service.hasCatalog()) {
        server.Get("/stac", [&service](const httplib::Request &, httplib::Response &res) {
            send(res, service.stacLanding());
        });
        server.Get("/stac/conformance", [&service](const httplib::Request &, httplib::Response &res) {
            send(res, service.stacConformance());
        });
        server.Get("/stac/collections", [&service](const httplib::Request &req, httplib::Response &res) {
            send(res, service.stacCollections(query_map(req)));
        });
        server.Get(R"(/stac/collections/([^/]+))", [&service](const httplib::Request &req, httplib::Response &res) {
            send(res, service.stacCollection(req.matches[1].str()));
        });
        server.Get(R"(/stac/collections/([^/]+)/items)",
                   [&service](const httplib::Request &req, httplib::Response &res) {
                       send(res, service.stacItems(req.matches[1].str(), query_map(req)));
                   });
        server.Get(R"(/stac/collections/([^/]+)/items/([^/]+))",
                   [&service](const httplib::Request &req, httplib::Response &res) {
                       send(res, service.stacItem(req.matches[1].str(), req.matches[2].str()));
                   });
        server.Get("/stac/search", [&service](const httplib::Request &req, httplib::Response &res) {
            send(res, service.stacSearch(query_map(req)));
        });
        server.Post("/stac/search", [&service](const httplib::Request &req, httplib::Response &res) {
            send(res, service.stacSearchPost(req.body));
        });
    }

    server.Get(R"(/(.+)/tiles\.json)", [&service](const httplib::Request &req, httplib::Response &res) {
        send(res, service.tileJson(req.matches[1].str()));
    });

    server.Get(R"(/(.+)/title)", [&service](const httplib::Request &req, httplib::Response &res) {
        send(res, service.title(req.matches[1].str()));
    });

    server.Get(R"(/(.+)/([^/]+)/([^/]+)/([^/.]+)\.(\w+))",
               [&service](const httplib::Request &req, httplib::Response &res) {
                   send(res, service.tile(req.matches[1].str(), req.matches[2].str(), req.matches[3].str(),
                                          req.matches[4].str(), req.matches[5].str()));
               });
}

void serve(TileService &service) {
    httplib::Server server;
    mount_routes(server, service);

    const ServerOptions &options = service.options();
    LOG(INFO) << "Serving " << service.registry().size() << " tile sources on http://" << options.host << ":"
              << options.port << " (public url " << options.public_url << ")\n";

    if (!server.listen(options.host.c_str(), options.port)) {
        throw std::runtime_error("Failed to start HTTP server. Ensure the port is available.");
    }
}

}  // namespace tilemosaic
