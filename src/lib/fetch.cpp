#include "tilemosaic/fetch.h"
#include "tilemosaic/common.h"

#include "aixlog.hpp"

#include <curl/curl.h>

#include <atomic>
#include <filesystem>
#include <fstream>
#include <memory>
#include <string>
#include <system_error>
#include <vector>

namespace tilemosaic {
namespace {

struct curl_deleter {
    void operator()(CURL *curl) const noexcept {
        if (curl != nullptr) {
            curl_easy_cleanup(curl);
        }
    }
};

struct CurlGlobal {
    CurlGlobal() { curl_global_init(CURL_GLOBAL_DEFAULT); }
    ~CurlGlobal() { curl_global_cleanup(); }
    CurlGlobal(const CurlGlobal &) = delete;
    CurlGlobal &operator=(const CurlGlobal &) = delete;
};

std::unique_ptr<CURL, curl_deleter> make_curl(const std::string &url, const FetchOptions &options) {
    static CurlGlobal global;
    std::unique_ptr<CURL, curl_deleter> curl(curl_easy_init());
    if (!curl) {
        throw resource_unavailable_error("Failed to initialize CURL for " + url);
    }
    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_MAXREDIRS, 10L);
    curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, options.user_agent.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, options.timeout_seconds);
    curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT, options.connect_timeout_seconds);
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    return curl;
}

size_t write_callback(void *contents, size_t size, size_t nmemb, void *userp) {
    const size_t realsize = size * nmemb;
    auto *buffer = static_cast<std::string *>(userp);
    buffer->append(static_cast<const char *>(contents), realsize);
    return realsize;
}

long perform(CURL *curl, const std::string &url) {
    const CURLcode res = curl_easy_perform(curl);
    if (res != CURLE_OK) {
        throw resource_unavailable_error("Request for " + url + " failed: " + curl_easy_strerror(res));
    }
    long http_code = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);
    if (http_code < 200 || http_code >= 300) {
        throw resource_unavailable_error("Request for " + url + " returned HTTP " + std::to_string(http_code));
    }
    return http_code;
}

std::ifstream open_local(const std::string &locator) {
    const std::string path = local_path(locator);
    std::ifstream stream(path, std::ios::binary);
    if (!stream) {
        throw resource_unavailable_error("Unable to open '" + path + "'");
    }
    return stream;
}

std::string normalize_path(const std::string &path) {
    const bool absolute = !path.empty() && path.front() == '/';
    const bool trailing = path.size() > 1 && path.back() == '/';

    std::vector<std::string> segments;
    std::string segment;
    for (std::size_t i = 0; i <= path.size(); ++i) {
        if (i < path.size() && path[i] != '/') {
            segment.push_back(path[i]);
            continue;
        }
        if (segment == "..") {
            if (!segments.empty() && segments.back() != "..") {
                segments.pop_back();
            } else if (!absolute) {
                segments.push_back(segment);
            }
        } else if (!segment.empty() && segment != ".") {
            segments.push_back(segment);
        }
        segment.clear();
    }

    std::string result = absolute ? "/" : "";
    for (std::size_t i = 0; i < segments.size(); ++i) {
        if (i > 0) {
            result += '/';
        }
        result += segments[i];
    }
    if (trailing && !segments.empty()) {
        result += '/';
    }
    return result;
}

}  // namespace

UrlFetcher::UrlFetcher(FetchOptions options) : _options(std::move(options)) {}

std::string UrlFetcher::fetch(const std::string &locator) {
    if (!is_remote(locator)) {
        auto stream = open_local(locator);
        std::string data((std::istreambuf_iterator<char>(stream)), std::istreambuf_iterator<char>());
        if (stream.bad()) {
            throw resource_unavailable_error("Failed to read '" + locator + "'");
        }
        return data;
    }

    auto curl = make_curl(locator, _options);
    std::string body;
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &body);
    perform(curl.get(), locator);
    LOG(DEBUG) << "Fetched " << body.size() << " bytes from " << locator << "\n";
    return body;
}

std::string UrlFetcher::fetchRange(const std::string &locator, std::uint64_t offset, std::uint64_t length) {
    if (length == 0) {
        return {};
    }

    if (!is_remote(locator)) {
        auto stream = open_local(locator);
        stream.seekg(static_cast<std::streamoff>(offset));
        if (!stream) {
            throw resource_unavailable_error("Failed to seek to " + std::to_string(offset) + " in '" + locator + "'");
        }
        std::string data(static_cast<std::size_t>(length), '\0');
        stream.read(&data[0], static_cast<std::streamsize>(length));
        data.resize(static_cast<std::size_t>(stream.gcount()));
        return data;
    }

    auto curl = make_curl(locator, _options);
    const std::string range = std::to_string(offset) + "-" + std::to_string(offset + length - 1);
    std::string body;
    curl_easy_setopt(curl.get(), CURLOPT_HTTPGET, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_RANGE, range.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &body);
    const long http_code = perform(curl.get(), locator);

    // server ignored the range header and sent the whole object
    if (http_code == 200) {
        if (offset >= body.size()) {
            return {};
        }
        return body.substr(static_cast<std::size_t>(offset), static_cast<std::size_t>(length));
    }
    return body;
}

std::uint64_t UrlFetcher::contentLength(const std::string &locator) {
    if (!is_remote(locator)) {
        std::error_code ec;
        const auto size = std::filesystem::file_size(local_path(locator), ec);
        if (ec) {
            throw resource_unavailable_error("Unable to stat '" + locator + "': " + ec.message());
        }
        return static_cast<std::uint64_t>(size);
    }

    auto curl = make_curl(locator, _options);
    curl_easy_setopt(curl.get(), CURLOPT_NOBODY, 1L);
    perform(curl.get(), locator);
    curl_off_t length = -1;
    curl_easy_getinfo(curl.get(), CURLINFO_CONTENT_LENGTH_DOWNLOAD_T, &length);
    if (length < 0) {
        throw resource_unavailable_error("Server did not report a content length for " + locator);
    }
    return static_cast<std::uint64_t>(length);
}

std::shared_ptr<Fetcher> default_fetcher() {
    static std::shared_ptr<Fetcher> instance = std::make_shared<UrlFetcher>();
    return instance;
}

bool is_remote(const std::string &locator) {
    const std::string lowered = to_lower(locator.substr(0, 8));
    return starts_with(lowered, "http://") || starts_with(lowered, "https://");
}

std::string local_path(const std::string &locator) {
    if (starts_with(locator, "file://")) {
        return locator.substr(7);
    }
    return locator;
}

std::string resolve_locator(const std::string &base, const std::string &reference) {
    if (reference.find("://") != std::string::npos) {
        return reference;
    }

    std::string prefix;
    std::string path = base;
    const auto scheme_end = base.find("://");
    if (scheme_end != std::string::npos) {
        const auto path_start = base.find('/', scheme_end + 3);
        if (path_start == std::string::npos) {
            prefix = base;
            path = "/";
        } else {
            prefix = base.substr(0, path_start);
            path = base.substr(path_start);
        }
    }

    if (!reference.empty() && reference.front() == '/') {
        return prefix + normalize_path(reference);
    }

    const auto slash = path.rfind('/');
    const std::string directory = slash == std::string::npos ? "" : path.substr(0, slash + 1);
    return prefix + normalize_path(directory + reference);
}

std::string strip_parent_prefix(const std::string &key) {
    std::size_t pos = 0;
    while (true) {
        if (key.compare(pos, 3, "../") == 0) {
            pos += 3;
        } else if (key.compare(pos, 2, "./") == 0) {
            pos += 2;
        } else {
            break;
        }
    }
    return key.substr(pos);
}

}  // namespace tilemosaic
