#include "CLI11.hpp"
#include "tilemosaic/catalog.h"
#include "tilemosaic/cog.h"
#include "tilemosaic/mosaic.h"
#include "tilemosaic/server.h"

#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

int main(int argc, char **argv) {
    CLI::App app{"tilemosaic map tile server"};
    app.require_subcommand(1);

    int verbosity = 0;
    auto add_logging_flags = [&](CLI::App *cmd) {
        cmd->add_flag("-v,--verbose", verbosity, "Increase logging verbosity");
        cmd->add_flag_function("--verbose-extra", [&](int count) { verbosity += count * 2; },
                               "Enable extra verbose logging");
    };

    long timeout_seconds = 40;
    auto add_timeout_option = [&](CLI::App *cmd) {
        cmd->add_option("--timeout", timeout_seconds, "Total timeout in seconds for remote fetches")
            ->default_val(40)
            ->check(CLI::PositiveNumber);
    };

    tilemosaic::MosaicOptions mosaic_options;
    auto add_mosaic_options = [&](CLI::App *cmd) {
        cmd->add_option("--index-threshold", mosaic_options.index_threshold,
                        "Shard count per zoom level at which mosaics build a spatial index")
            ->default_val(8);
        cmd->add_option("--archive-cache", mosaic_options.archive_cache_dir,
                        "Directory remote MBTiles archives are downloaded into");
    };

    auto serve_cmd = app.add_subcommand("serve", "Serve tile sources, dynamic COG tiles and a STAC catalog");
    add_logging_flags(serve_cmd);
    add_timeout_option(serve_cmd);
    add_mosaic_options(serve_cmd);

    std::string routes_path;
    std::string catalog_locator;
    tilemosaic::ServerOptions server_options;
    std::vector<std::string> allow_prefixes;
    std::size_t tiff_cache = 100;

    serve_cmd->add_option("--routes", routes_path, "Route table JSON mapping URL prefixes to sources")
        ->required()
        ->check(CLI::ExistingFile);
    serve_cmd->add_option("--catalog", catalog_locator,
                          "STAC catalog description (path or URL); the /stac routes are disabled without it");
    serve_cmd->add_option("--host", server_options.host, "Host/IP address to bind the server")
        ->default_val("0.0.0.0");
    serve_cmd->add_option("-p,--port", server_options.port, "Port to bind the server")
        ->default_val(3000)
        ->check(CLI::Range(1, 65535));
    serve_cmd->add_option("--public-url", server_options.public_url, "Base URL written into tiles.json templates")
        ->default_val("http://localhost:3000");
    serve_cmd->add_option("--allow-prefix", allow_prefixes,
                          "Additional URL prefix COG files may be read from (repeatable)");
    serve_cmd->add_option("--tiff-cache", tiff_cache, "Number of parsed GeoTIFF handles to keep")
        ->default_val(100)
        ->check(CLI::PositiveNumber);

    auto resolve_cmd = app.add_subcommand("resolve", "Print the shard a mosaic serves a tile from");
    add_logging_flags(resolve_cmd);
    add_timeout_option(resolve_cmd);
    add_mosaic_options(resolve_cmd);

    std::string resolve_locator;
    int resolve_z = 0;
    int resolve_x = 0;
    int resolve_y = 0;
    resolve_cmd->add_option("mosaic", resolve_locator, "Mosaic descriptor path or URL")->required();
    resolve_cmd->add_option("z", resolve_z, "Zoom level")->required()->check(CLI::NonNegativeNumber);
    resolve_cmd->add_option("x", resolve_x, "Tile column")->required()->check(CLI::NonNegativeNumber);
    resolve_cmd->add_option("y", resolve_y, "Tile row (XYZ scheme)")->required()->check(CLI::NonNegativeNumber);

    CLI11_PARSE(app, argc, argv);

    if (verbosity >= 2) {
        tilemosaic::Logger::set_level(tilemosaic::LogLevel::DEBUG);
    } else if (verbosity == 1) {
        tilemosaic::Logger::set_level(tilemosaic::LogLevel::INFO);
    } else {
        tilemosaic::Logger::set_level(tilemosaic::LogLevel::WARNING);
    }

    tilemosaic::FetchOptions fetch_options;
    fetch_options.timeout_seconds = timeout_seconds;
    auto fetcher = std::make_shared<tilemosaic::UrlFetcher>(fetch_options);

    try {
        if (*serve_cmd) {
            const auto routes = tilemosaic::parse_route_table(fetcher->fetch(routes_path));
            auto registry = tilemosaic::SourceRegistry::fromRoutes(routes, routes_path, fetcher, mosaic_options);

            tilemosaic::UrlPolicy policy = tilemosaic::UrlPolicy::defaults();
            for (const auto &prefix : allow_prefixes) {
                policy.add(prefix);
            }
            tilemosaic::CogOptions cog_options;
            cog_options.cache_capacity = tiff_cache;
            auto compositor = std::make_shared<tilemosaic::CogCompositor>(policy, fetcher, cog_options);

            std::shared_ptr<tilemosaic::CollectionCatalog> catalog;
            if (!catalog_locator.empty()) {
                catalog = std::make_shared<tilemosaic::CollectionCatalog>(catalog_locator, fetcher);
                catalog->collections();
            } else {
                std::cerr << "No catalog given, STAC API will not be available" << std::endl;
            }

            tilemosaic::TileService service(std::move(registry), compositor, catalog, server_options);
            std::cout << "Serving " << service.registry().size() << " sources on http://" << server_options.host
                      << ":" << server_options.port << std::endl;
            std::cout << "Press Ctrl+C to stop the server." << std::endl;
            tilemosaic::serve(service);
            return EXIT_SUCCESS;
        }

        if (*resolve_cmd) {
            tilemosaic::MosaicResolver mosaic(resolve_locator, fetcher, mosaic_options);
            const auto shard = mosaic.resolveShard(resolve_z, resolve_x, resolve_y);
            if (!shard) {
                std::cerr << "No shard covers " << resolve_z << "/" << resolve_x << "/" << resolve_y << std::endl;
                return EXIT_FAILURE;
            }
            std::cout << *shard << std::endl;
            return EXIT_SUCCESS;
        }
    } catch (const std::exception &ex) {
        std::cerr << ex.what() << std::endl;
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
