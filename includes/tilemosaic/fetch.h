#ifndef TILEMOSAIC_FETCH_H
#define TILEMOSAIC_FETCH_H
#pragma once

#include <cstdint>
#include <memory>
#include <string>

namespace tilemosaic {

struct FetchOptions {
    long timeout_seconds = 40;
    long connect_timeout_seconds = 20;
    std::string user_agent = "tilemosaic/1.0";
};

// Byte source for descriptors, GeoTIFFs and feature tables.
// Implementations throw resource_unavailable_error when the target cannot be read.
class Fetcher {
public:
    virtual ~Fetcher() = default;

    virtual std::string fetch(const std::string &locator) = 0;
    virtual std::string fetchRange(const std::string &locator, std::uint64_t offset, std::uint64_t length) = 0;
    virtual std::uint64_t contentLength(const std::string &locator) = 0;
};

// http(s) through libcurl, everything else from the local filesystem.
class UrlFetcher : public Fetcher {
public:
    explicit UrlFetcher(FetchOptions options = {});

    std::string fetch(const std::string &locator) override;
    std::string fetchRange(const std::string &locator, std::uint64_t offset, std::uint64_t length) override;
    std::uint64_t contentLength(const std::string &locator) override;

private:
    FetchOptions _options;
};

std::shared_ptr<Fetcher> default_fetcher();

bool is_remote(const std::string &locator);
std::string local_path(const std::string &locator);

// Resolves `reference` against the directory holding `base`; "." and ".." segments are folded.
std::string resolve_locator(const std::string &base, const std::string &reference);

// Drops leading "../" and "./" segments.
std::string strip_parent_prefix(const std::string &key);

}  // namespace tilemosaic

#endif // TILEMOSAIC_FETCH_H
