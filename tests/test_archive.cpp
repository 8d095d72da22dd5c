#include "tilemosaic/archive.h"
#include "test_support.h"

#include <gtest/gtest.h>

#include <fstream>
#include <iterator>
#include <memory>
#include <string>

using namespace tilemosaic;
using tilemosaic::test::MemoryFetcher;
using tilemosaic::test::StoredTile;
using tilemosaic::test::TempDir;
using tilemosaic::test::write_mbtiles;

namespace {

const std::string kPng("\x89PNG\r\n\x1a\n-tile-", 14);
const std::string kPbf("\x1a\x0c\x0a\x05roads\x78\x02", 10);

std::string read_file(const std::string &path) {
    std::ifstream stream(path, std::ios::binary);
    return std::string((std::istreambuf_iterator<char>(stream)), std::istreambuf_iterator<char>());
}

}  // namespace

TEST(MBTiles, ReadsTilesWithRowFlip) {
    TempDir dir;
    const std::string path = dir.path("roads.mbtiles");
    write_mbtiles(path, {{"name", "roads"}, {"format", "png"}},
                  {{3, 2, 1, kPng + "a"}, {3, 2, 6, kPng + "b"}});

    MBTiles archive(path);
    EXPECT_EQ(archive.tile(3, 2, 1).value_or(""), kPng + "a");
    EXPECT_EQ(archive.tile(3, 2, 6).value_or(""), kPng + "b");
    EXPECT_FALSE(archive.tile(3, 2, 2).has_value());
    EXPECT_FALSE(archive.tile(3, 8, 1).has_value());
    EXPECT_EQ(archive.metadata().at("name"), "roads");
}

TEST(MBTiles, MissingFileIsUnavailable) {
    TempDir dir;
    EXPECT_THROW(MBTiles archive(dir.path("missing.mbtiles")), resource_unavailable_error);
}

TEST(MBTiles, HeaderFromMetadata) {
    TempDir dir;
    const std::string path = dir.path("meta.mbtiles");
    write_mbtiles(path,
                  {{"name", "districts"},
                   {"format", "pbf"},
                   {"minzoom", "2"},
                   {"maxzoom", "9"},
                   {"bounds", "68.1,6.5,97.4,35.7"},
                   {"center", "78.9,22.5,5"},
                   {"json", R"({"vector_layers":[{"id":"districts","fields":{}}]})"}},
                  {{2, 2, 1, std::string("\x1F\x8B\x08\x00rest", 8)}});

    MBTiles archive(path);
    const ArchiveHeader header = archive.header();
    EXPECT_EQ(header.min_zoom, 2);
    EXPECT_EQ(header.max_zoom, 9);
    EXPECT_EQ(header.center_zoom, 5);
    EXPECT_EQ(header.bounds.min_lon, to_fixed(68.1));
    EXPECT_EQ(header.bounds.max_lat, to_fixed(35.7));
    EXPECT_EQ(header.center_lon, to_fixed(78.9));
    EXPECT_EQ(header.tile_format, TileFormat::Mvt);
    EXPECT_EQ(header.tile_compression, TileCompression::Gzip);

    const ArchiveMetadata meta = archive.describe();
    ASSERT_TRUE(meta.vector_layers.is_array());
    EXPECT_EQ(meta.vector_layers[0]["id"], "districts");
}

TEST(MBTiles, HeaderFallsBackToTileTable) {
    TempDir dir;
    const std::string path = dir.path("bare.mbtiles");
    write_mbtiles(path, {}, {{4, 1, 1, kPng}, {7, 10, 10, kPng}});

    const ArchiveHeader header = MBTiles(path).header();
    EXPECT_EQ(header.min_zoom, 4);
    EXPECT_EQ(header.max_zoom, 7);
    EXPECT_EQ(header.center_zoom, 4);
    EXPECT_EQ(header.tile_format, TileFormat::Png);
    EXPECT_EQ(header.bounds.min_lon, to_fixed(-180.0));
    EXPECT_EQ(header.center_lon, 0);
}

TEST(ArchiveResolver, ServesTilesWithMediaType) {
    TempDir dir;
    const std::string path = dir.path("raster.mbtiles");
    write_mbtiles(path, {{"format", "png"}}, {{5, 10, 12, kPng}});

    ArchiveResolver resolver(path);
    const auto tile = resolver.getTile(5, 10, 12);
    ASSERT_TRUE(tile.has_value());
    EXPECT_EQ(tile->bytes, kPng);
    EXPECT_EQ(tile->media_type, "image/png");

    EXPECT_FALSE(resolver.getTile(5, 10, 13).has_value());
    EXPECT_FALSE(resolver.getTile(5, 40, 12).has_value());
    EXPECT_FALSE(resolver.getTile(-1, 0, 0).has_value());
}

TEST(ArchiveResolver, AcceptsFileScheme) {
    TempDir dir;
    const std::string path = dir.path("scheme.mbtiles");
    write_mbtiles(path, {{"format", "png"}}, {{0, 0, 0, kPng}});

    ArchiveResolver resolver("file://" + path);
    EXPECT_TRUE(resolver.getTile(0, 0, 0).has_value());
}

TEST(ArchiveResolver, InflatesGzippedVectorTiles) {
    TempDir dir;
    const std::string path = dir.path("vector.mbtiles");
    write_mbtiles(path, {{"format", "pbf"}}, {{2, 2, 1, test::gzip(kPbf)}, {2, 1, 1, kPbf}});

    ArchiveResolver resolver(path);
    EXPECT_EQ(resolver.getMetadata().header.tile_compression, TileCompression::Gzip);

    const auto tile = resolver.getTile(2, 2, 1);
    ASSERT_TRUE(tile.has_value());
    EXPECT_EQ(tile->bytes, kPbf);
    EXPECT_EQ(tile->media_type, "application/vnd.mapbox-vector-tile");
    EXPECT_EQ(resolver.getTile(2, 1, 1)->bytes, kPbf);
}

TEST(ArchiveResolver, DownloadsRemoteArchivesOnce) {
    TempDir dir;
    const std::string source = dir.path("source.mbtiles");
    write_mbtiles(source, {{"format", "png"}, {"name", "remote"}}, {{3, 2, 1, kPng}});

    const std::string url = "https://tiles.example.org/parts/remote.mbtiles";
    auto fetcher = std::make_shared<MemoryFetcher>();
    fetcher->put(url, read_file(source));

    ArchiveOptions options;
    options.cache_dir = dir.path("cache");
    ArchiveResolver first(url, options, fetcher);
    EXPECT_EQ(first.getTile(3, 2, 1).value_or(TileData{}).bytes, kPng);
    EXPECT_EQ(first.getMetadata().metadata.name, "remote");

    ArchiveResolver second(url, options, fetcher);
    EXPECT_TRUE(second.getTile(3, 2, 1).has_value());
    EXPECT_EQ(fetcher->fetchCount(url), 1);
}

TEST(ArchiveResolver, MissingRemoteArchiveIsUnavailable) {
    TempDir dir;
    auto fetcher = std::make_shared<MemoryFetcher>();
    ArchiveOptions options;
    options.cache_dir = dir.path("cache");

    const std::string url = "https://tiles.example.org/absent.mbtiles";
    ArchiveResolver resolver(url, options, fetcher);
    EXPECT_THROW(resolver.getTile(0, 0, 0), resource_unavailable_error);

    const std::string source = dir.path("late.mbtiles");
    write_mbtiles(source, {{"format", "png"}}, {{0, 0, 0, kPng}});
    fetcher->put(url, read_file(source));
    EXPECT_TRUE(resolver.getTile(0, 0, 0).has_value());
    EXPECT_EQ(fetcher->fetchCount(url), 2);
}

TEST(ArchiveResolver, AttributionCredit) {
    TempDir dir;
    const std::string credited = dir.path("credited.mbtiles");
    write_mbtiles(credited, {{"attribution", "OSM"}}, {{0, 0, 0, kPng}});
    EXPECT_EQ(ArchiveResolver(credited).getMetadata().metadata.attribution,
              std::string("OSM | ") + kCommunityCredit);

    ArchiveOptions plain;
    plain.community_attribution = false;
    EXPECT_EQ(ArchiveResolver(credited, plain).getMetadata().metadata.attribution, "OSM");

    EXPECT_EQ(extend_attribution("", true), kCommunityCredit);
}

TEST(TileJson, DocumentFields) {
    TempDir dir;
    const std::string path = dir.path("tj.mbtiles");
    write_mbtiles(path, {{"name", "tj"}, {"version", "2"}, {"minzoom", "1"}, {"maxzoom", "3"}, {"bounds", "0,0,10,10"}},
                  {{1, 1, 0, kPng}});

    ArchiveOptions options;
    options.community_attribution = false;
    const auto doc = to_tilejson(ArchiveResolver(path, options).getMetadata());
    EXPECT_EQ(doc["tilejson"], "3.0.0");
    EXPECT_EQ(doc["scheme"], "xyz");
    EXPECT_EQ(doc["name"], "tj");
    EXPECT_EQ(doc["version"], "2");
    EXPECT_EQ(doc["minzoom"], 1);
    EXPECT_EQ(doc["maxzoom"], 3);
    EXPECT_DOUBLE_EQ(doc["bounds"][2].get<double>(), 10.0);
    EXPECT_DOUBLE_EQ(doc["center"][0].get<double>(), 5.0);
    EXPECT_EQ(doc["center"][2], 1);
    EXPECT_FALSE(doc.contains("vector_layers"));
}
