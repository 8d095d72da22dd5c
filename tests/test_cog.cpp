#include "tilemosaic/cog.h"
#include "test_support.h"

#include <gtest/gtest.h>

#include <array>
#include <fstream>
#include <iterator>
#include <memory>
#include <string>
#include <vector>

using namespace tilemosaic;
using tilemosaic::test::GeoTiffSpec;
using tilemosaic::test::MemoryFetcher;
using tilemosaic::test::TempDir;
using tilemosaic::test::write_geotiff;

namespace {

std::array<int, 4> pixel_at(const RGBAImage &image, int x, int y) {
    const std::size_t at = (static_cast<std::size_t>(y) * image.width + x) * 4;
    return {image.pixels[at], image.pixels[at + 1], image.pixels[at + 2], image.pixels[at + 3]};
}

RGBAImage decode(const TileData &tile) {
    return RGBAImage(reinterpret_cast<const unsigned char *>(tile.bytes.data()), static_cast<int>(tile.bytes.size()));
}

std::string read_file(const std::string &path) {
    std::ifstream stream(path, std::ios::binary);
    return std::string((std::istreambuf_iterator<char>(stream)), std::istreambuf_iterator<char>());
}

TiffPlane plane_with_resolution(double resolution, std::uint32_t size) {
    TiffPlane plane;
    plane.width = size;
    plane.height = size;
    plane.resolution_x = resolution;
    plane.resolution_y = resolution;
    return plane;
}

class CogFixture : public ::testing::Test {
  protected:
    CogCompositor compositor() const { return CogCompositor(UrlPolicy({dir.root().string()})); }

    std::string write(const std::string &name, const GeoTiffSpec &spec) const {
        const std::string path = dir.path(name);
        write_geotiff(path, spec);
        return path;
    }

    TempDir dir;
};

}  // namespace

TEST(MaskBits, ExpandsMostSignificantBitFirst) {
    const unsigned char data[] = {0xB0};
    EXPECT_EQ(expand_mask_bits(data, 1, 8, 1, 1, 1),
              (std::vector<unsigned char>{255, 0, 255, 255, 0, 0, 0, 0}));
}

TEST(MaskBits, RowsStartOnByteBoundaries) {
    const unsigned char data[] = {0xA0, 0x40};
    EXPECT_EQ(expand_mask_bits(data, 2, 3, 2, 1, 1), (std::vector<unsigned char>{255, 0, 255, 0, 255, 0}));
}

TEST(MaskBits, EightBitMasksPassThrough) {
    const unsigned char data[] = {0, 17, 255, 128};
    EXPECT_EQ(expand_mask_bits(data, 4, 2, 2, 8, 1), (std::vector<unsigned char>{0, 17, 255, 128}));
}

TEST(MaskBits, RejectsUnsupportedLayouts) {
    const unsigned char data[] = {0xFF, 0xFF};
    EXPECT_THROW(expand_mask_bits(data, 2, 1, 1, 8, 2), malformed_input_error);
    EXPECT_THROW(expand_mask_bits(data, 2, 4, 1, 4, 1), malformed_input_error);
    EXPECT_THROW(expand_mask_bits(data, 2, 1, 1, 16, 1), malformed_input_error);
}

TEST(FoldAlpha, CopiesMaskAlphaOnly) {
    RGBAImage color(2, 1);
    color.pixels = {10, 20, 30, 255, 40, 50, 60, 255};
    RGBAImage mask(2, 1);
    mask.pixels = {0, 0, 0, 0, 0, 0, 0, 255};

    fold_alpha(color, mask);
    EXPECT_EQ(color.pixels, (std::vector<unsigned char>{10, 20, 30, 0, 40, 50, 60, 255}));

    RGBAImage wrong(1, 1);
    EXPECT_THROW(fold_alpha(color, wrong), malformed_input_error);
}

TEST(GeoTransform, FromScaleAndTiepoint) {
    const double scale[] = {10.0, 10.0, 0.0};
    const double tiepoint[] = {0.0, 0.0, 0.0, 100.0, 200.0, 0.0};
    const GeoTransform transform = geotransform_from_tags(scale, 3, tiepoint, 6, nullptr, 0);
    EXPECT_EQ(transform, (GeoTransform{100.0, 10.0, 0.0, 200.0, 0.0, -10.0}));
}

TEST(GeoTransform, FromTransformationMatrix) {
    const double matrix[16] = {5.0, 0.0, 0.0, 1000.0, 0.0, -5.0, 0.0, 2000.0,
                               0.0, 0.0, 0.0, 0.0,    0.0, 0.0,  0.0, 1.0};
    const GeoTransform transform = geotransform_from_tags(nullptr, 0, nullptr, 0, matrix, 16);
    EXPECT_EQ(transform, (GeoTransform{1000.0, 5.0, 0.0, 2000.0, 0.0, -5.0}));
}

TEST(GeoTransform, MissingTagsAreMalformed) {
    EXPECT_THROW(geotransform_from_tags(nullptr, 0, nullptr, 0, nullptr, 0), malformed_input_error);
}

TEST(Overviews, PicksCoarsestPlaneWithinTolerance) {
    const std::vector<TiffPlane> planes = {plane_with_resolution(1.0, 1024), plane_with_resolution(2.0, 512),
                                           plane_with_resolution(4.0, 256)};
    EXPECT_EQ(select_overview(planes, 0.5), 0u);
    EXPECT_EQ(select_overview(planes, 1.0), 0u);
    EXPECT_EQ(select_overview(planes, 1.995), 1u);
    EXPECT_EQ(select_overview(planes, 3.0), 1u);
    EXPECT_EQ(select_overview(planes, 4.0), 2u);
    EXPECT_EQ(select_overview(planes, 100.0), 2u);
}

TEST(Overviews, OverZoomedFragmentStaysWithinTheTile) {
    const std::vector<TiffPlane> planes = {plane_with_resolution(1.0, 4096)};
    const int half = 1 << 29;
    const auto fragment = plan_fragment(planes, TileCoordinate{30, half, half});
    ASSERT_TRUE(fragment.has_value());
    EXPECT_EQ(fragment->src_x0, 0);
    EXPECT_EQ(fragment->src_x1, 1);
    EXPECT_EQ(fragment->src_y0, 0);
    EXPECT_EQ(fragment->src_y1, 1);
    EXPECT_EQ(fragment->dst_x, 0);
    EXPECT_EQ(fragment->dst_y, 0);
    EXPECT_EQ(fragment->dst_width, 256);
    EXPECT_EQ(fragment->dst_height, 256);
    EXPECT_DOUBLE_EQ(fragment->window_x0, 0.0);
    EXPECT_LT(fragment->window_x1, 0.1);

    const std::vector<TiffPlane> coarse = {plane_with_resolution(30.0, 4096)};
    for (const int z : {24, 26, 30}) {
        const int index = 1 << (z - 1);
        const auto part = plan_fragment(coarse, TileCoordinate{z, index, index});
        ASSERT_TRUE(part.has_value()) << z;
        EXPECT_LE(part->dst_x + part->dst_width, 256) << z;
        EXPECT_LE(part->dst_y + part->dst_height, 256) << z;
        EXPECT_LE(part->src_x1 - part->src_x0, 1) << z;
    }
}

TEST(UrlPolicyTest, PrefixMatching) {
    const UrlPolicy defaults = UrlPolicy::defaults();
    EXPECT_TRUE(defaults.allows("https://github.com/ramSeraph/indian_cogs/releases/a.tif"));
    EXPECT_TRUE(defaults.allows("http://127.0.0.1:8080/local.tif"));
    EXPECT_FALSE(defaults.allows("https://github.com/other/a.tif"));
    EXPECT_FALSE(defaults.allows("http://127.0.0.1:8081/local.tif"));
    EXPECT_THROW(defaults.check("https://example.com/a.tif"), forbidden_error);
    EXPECT_NO_THROW(defaults.check("http://127.0.0.1:8080/x"));
}

TEST(UrlPolicyTest, ForbiddenUrlsAreNeverFetched) {
    auto fetcher = std::make_shared<MemoryFetcher>();
    CogCompositor compositor(UrlPolicy({"https://allowed.example/"}), fetcher);

    EXPECT_THROW(compositor.getTile("https://evil.example/a.tif", 2, 2, 1), forbidden_error);
    EXPECT_THROW(compositor.getTile("https://evil.example/a.tif", 2, 9, 9), forbidden_error);
    EXPECT_THROW(compositor.getInfo("https://evil.example/a.tif"), forbidden_error);
    EXPECT_FALSE(compositor.getTile("https://allowed.example/a.tif", 2, 9, 9).has_value());
    EXPECT_EQ(fetcher->totalCalls(), 0);
    EXPECT_EQ(compositor.cachedFiles(), 0u);
}

TEST(UrlPolicyTest, UnavailableFileIsNotCached) {
    auto fetcher = std::make_shared<MemoryFetcher>();
    CogCompositor compositor(UrlPolicy({"https://allowed.example/"}), fetcher);
    EXPECT_THROW(compositor.getTile("https://allowed.example/missing.tif", 2, 2, 1), resource_unavailable_error);
    EXPECT_FALSE(compositor.isCached("https://allowed.example/missing.tif"));
}

TEST_F(CogFixture, FullResolutionTile) {
    const std::string path = write("plain.tif", GeoTiffSpec());
    CogCompositor cog = compositor();

    const auto tile = cog.getTile(path, 2, 2, 1);
    ASSERT_TRUE(tile.has_value());
    EXPECT_EQ(tile->media_type, "image/png");
    const RGBAImage image = decode(*tile);
    ASSERT_EQ(image.width, 256);
    ASSERT_EQ(image.height, 256);
    EXPECT_EQ(pixel_at(image, 10, 10), (std::array<int, 4>{200, 100, 50, 255}));
    EXPECT_EQ(pixel_at(image, 250, 250), (std::array<int, 4>{200, 100, 50, 255}));
    EXPECT_TRUE(cog.isCached(path));
}

TEST_F(CogFixture, ZoomedInTileReadsQuarterWindow) {
    const std::string path = write("zoom.tif", GeoTiffSpec());
    const auto tile = compositor().getTile(path, 3, 4, 2);
    ASSERT_TRUE(tile.has_value());
    const RGBAImage image = decode(*tile);
    EXPECT_EQ(pixel_at(image, 128, 128), (std::array<int, 4>{200, 100, 50, 255}));
}

TEST_F(CogFixture, TilesOutsideTheImageAreAbsent) {
    const std::string path = write("outside.tif", GeoTiffSpec());
    CogCompositor cog = compositor();
    EXPECT_FALSE(cog.getTile(path, 2, 0, 0).has_value());
    EXPECT_FALSE(cog.getTile(path, 2, 4, 0).has_value());
}

TEST_F(CogFixture, OverZoomedTilesSampleOnePixel) {
    const std::string path = write("deep.tif", GeoTiffSpec());
    CogCompositor cog = compositor();

    const auto z24 = cog.getTile(path, 24, 10485700, 6291500);
    ASSERT_TRUE(z24.has_value());
    const RGBAImage image = decode(*z24);
    EXPECT_EQ(image.width, 256);
    EXPECT_EQ(image.height, 256);
    EXPECT_EQ(pixel_at(image, 0, 0), (std::array<int, 4>{200, 100, 50, 255}));
    EXPECT_EQ(pixel_at(image, 255, 255), (std::array<int, 4>{200, 100, 50, 255}));

    const auto z30 = cog.getTile(path, 30, 671088000, 402653300);
    ASSERT_TRUE(z30.has_value());
    EXPECT_EQ(pixel_at(decode(*z30), 128, 128), (std::array<int, 4>{200, 100, 50, 255}));
}

TEST_F(CogFixture, OverviewPlacement) {
    GeoTiffSpec spec;
    spec.overview = true;
    const std::string path = write("overview.tif", spec);

    GeoTiff tiff(path, default_fetcher());
    const std::vector<TiffPlane> colors = tiff.planes(PlaneKind::Color);
    ASSERT_EQ(colors.size(), 2u);
    EXPECT_EQ(colors[1].width, 128u);
    EXPECT_DOUBLE_EQ(colors[1].resolution_x, 2.0 * colors[0].resolution_x);

    const auto fragment = plan_fragment(colors, TileCoordinate{1, 1, 0});
    ASSERT_TRUE(fragment.has_value());
    EXPECT_EQ(fragment->plane, 1u);
    EXPECT_EQ(fragment->src_x0, 0);
    EXPECT_EQ(fragment->src_y0, 0);
    EXPECT_EQ(fragment->src_x1, 128);
    EXPECT_EQ(fragment->src_y1, 128);
    EXPECT_EQ(fragment->dst_x, 0);
    EXPECT_EQ(fragment->dst_y, 128);
    EXPECT_EQ(fragment->dst_width, 128);
    EXPECT_EQ(fragment->dst_height, 128);

    const auto tile = compositor().getTile(path, 1, 1, 0);
    ASSERT_TRUE(tile.has_value());
    const RGBAImage image = decode(*tile);
    EXPECT_EQ(pixel_at(image, 10, 10)[3], 0);
    EXPECT_EQ(pixel_at(image, 64, 192), (std::array<int, 4>{200, 100, 50, 255}));
    EXPECT_EQ(pixel_at(image, 200, 64)[3], 0);
}

TEST_F(CogFixture, OneBitMaskBecomesAlpha) {
    GeoTiffSpec spec;
    spec.mask = true;
    const std::string path = write("masked.tif", spec);

    const auto tile = compositor().getTile(path, 2, 2, 1);
    ASSERT_TRUE(tile.has_value());
    const RGBAImage image = decode(*tile);
    EXPECT_EQ(pixel_at(image, 10, 10), (std::array<int, 4>{200, 100, 50, 255}));
    EXPECT_EQ(pixel_at(image, 200, 10)[3], 0);
    EXPECT_EQ(pixel_at(image, 200, 200)[3], 0);
}

TEST_F(CogFixture, MasksTakeGeoreferenceFromPairedColorImage) {
    GeoTiffSpec spec;
    spec.mask = true;
    spec.overview = true;
    const std::string path = write("paired.tif", spec);

    GeoTiff tiff(path, default_fetcher());
    const std::vector<TiffPlane> colors = tiff.planes(PlaneKind::Color);
    const std::vector<TiffPlane> masks = tiff.planes(PlaneKind::Mask);
    ASSERT_EQ(colors.size(), 2u);
    ASSERT_EQ(masks.size(), 1u);
    EXPECT_EQ(masks[0].paired_color.value_or(99), 0u);
    EXPECT_DOUBLE_EQ(masks[0].resolution_x, colors[0].resolution_x);
    EXPECT_DOUBLE_EQ(masks[0].origin_x, colors[0].origin_x);
    EXPECT_DOUBLE_EQ(masks[0].origin_y, colors[0].origin_y);

    const RGBAImage image = decode(*compositor().getTile(path, 1, 1, 0));
    EXPECT_EQ(pixel_at(image, 32, 192)[3], 255);
    EXPECT_EQ(pixel_at(image, 100, 192)[3], 0);
}

TEST_F(CogFixture, EightBitMaskBecomesAlpha) {
    GeoTiffSpec spec;
    spec.mask = true;
    spec.mask_bits = 8;
    const std::string path = write("masked8.tif", spec);

    const RGBAImage image = decode(*compositor().getTile(path, 2, 2, 1));
    EXPECT_EQ(pixel_at(image, 10, 10)[3], 255);
    EXPECT_EQ(pixel_at(image, 200, 10)[3], 0);
}

TEST_F(CogFixture, MultiChannelMaskIsMalformed) {
    GeoTiffSpec spec;
    spec.mask = true;
    spec.mask_bits = 8;
    spec.mask_samples = 2;
    const std::string path = write("badmask.tif", spec);
    EXPECT_THROW(compositor().getTile(path, 2, 2, 1), malformed_input_error);
}

TEST_F(CogFixture, MissingGeoreferencingIsMalformed) {
    GeoTiffSpec spec;
    spec.geotags = false;
    const std::string path = write("nogeo.tif", spec);
    CogCompositor cog = compositor();
    EXPECT_THROW(cog.getTile(path, 2, 2, 1), malformed_input_error);
    EXPECT_FALSE(cog.isCached(path));
}

TEST_F(CogFixture, WebpOutput) {
    const std::string path = write("webp.tif", GeoTiffSpec());
    const auto tile = compositor().getTile(path, 2, 2, 1, ImageFormat::WEBP);
    ASSERT_TRUE(tile.has_value());
    EXPECT_EQ(tile->media_type, "image/webp");
    EXPECT_EQ(tile->bytes.compare(0, 4, "RIFF"), 0);
    const RGBAImage image = decode(*tile);
    EXPECT_EQ(image.width, 256);
    EXPECT_EQ(pixel_at(image, 10, 10)[3], 255);
}

TEST_F(CogFixture, InfoDescribesFullResolutionImage) {
    GeoTiffSpec spec;
    spec.mask = true;
    spec.overview = true;
    const std::string path = write("info.tif", spec);

    const CogInfo info = compositor().getInfo(path);
    EXPECT_NEAR(info.bbox.min_lon, 0.0, 1e-9);
    EXPECT_NEAR(info.bbox.max_lon, 90.0, 1e-9);
    EXPECT_NEAR(info.bbox.min_lat, 0.0, 1e-9);
    EXPECT_NEAR(info.bbox.max_lat, 66.51326044311186, 1e-9);
    EXPECT_NEAR(info.center.lon, 45.0, 1e-9);
    EXPECT_EQ(info.width, 256u);
    EXPECT_EQ(info.height, 256u);
    EXPECT_EQ(info.tile_width, 128u);
    EXPECT_EQ(info.image_count, 3u);
    EXPECT_EQ(info.compression, 1);
    EXPECT_EQ(info.photometric, 2);
    EXPECT_NEAR(info.resolution_x, test::kTestExtent / 256.0, 1e-6);

    const auto doc = info.toJson();
    EXPECT_EQ(doc["size"]["width"], 256);
    EXPECT_EQ(doc["tileSize"]["height"], 128);
    EXPECT_EQ(doc["imageCount"], 3);
    EXPECT_EQ(doc["bbox"].size(), 4u);
    EXPECT_NEAR(doc["bounds"]["east"].get<double>(), 90.0, 1e-9);
}

TEST_F(CogFixture, ReadsThroughRangeRequests) {
    const std::string bytes = read_file(write("remote.tif", GeoTiffSpec()));
    auto fetcher = std::make_shared<MemoryFetcher>();
    const std::string url = "http://127.0.0.1:8080/remote.tif";
    fetcher->put(url, bytes);

    CogOptions options;
    options.block_size = 4096;
    options.max_blocks = 4;
    CogCompositor cog(UrlPolicy::defaults(), fetcher, options);

    const RGBAImage image = decode(*cog.getTile(url, 2, 2, 1));
    EXPECT_EQ(pixel_at(image, 100, 100), (std::array<int, 4>{200, 100, 50, 255}));
    EXPECT_EQ(fetcher->fetchCount(url), 0);
    EXPECT_GT(fetcher->totalCalls(), 1);
}

TEST_F(CogFixture, HandleCacheEvictsOldestFile) {
    const std::string first = write("first.tif", GeoTiffSpec());
    const std::string second = write("second.tif", GeoTiffSpec());

    CogOptions options;
    options.cache_capacity = 1;
    CogCompositor cog(UrlPolicy({dir.root().string()}), default_fetcher(), options);

    cog.getInfo(first);
    EXPECT_TRUE(cog.isCached(first));
    cog.getInfo(second);
    EXPECT_FALSE(cog.isCached(first));
    EXPECT_TRUE(cog.isCached(second));
    EXPECT_EQ(cog.cachedFiles(), 1u);
}
