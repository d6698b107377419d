#pragma once

#include <convey/downloader/downloader.hpp>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <map>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace convey::tests {

/**
 * In-memory HTTP adapter. Resources are served from strings; faults are scripted per URL
 * and consumed one per fetch. Safe for concurrent downloads of different URLs.
 */
class FakeHttpAdapter final : public downloader::IHttpAdapter {
public:
    struct Resource {
        std::string body;
        bool acceptsRanges{true};
        bool declareLength{true};
        std::optional<std::string> etag;
        std::optional<std::string> lastModified;
        std::optional<std::string> contentType;
        std::optional<std::string> declaredFilename;
        // Answer ranged requests with the full body this many times
        int ignoreRanges{0};
    };

    // Deliver bytes up to atOffset, then fail with `code`
    struct Fault {
        std::uint64_t atOffset{0};
        downloader::ErrorCode code{downloader::ErrorCode::TransientNetwork};
        std::string message{"connection reset by peer"};
    };

    std::size_t deliverySize{4096};

    void add(const std::string& url, Resource resource) {
        std::lock_guard<std::mutex> lock(mutex_);
        resources_[url] = std::move(resource);
    }

    void addFault(const std::string& url, Fault fault) {
        std::lock_guard<std::mutex> lock(mutex_);
        faults_[url].push_back(std::move(fault));
    }

    // Serve `next` (body, length, validators) from fetch number `afterFetches + 1` on
    void replaceAfter(const std::string& url, int afterFetches, Resource next) {
        std::lock_guard<std::mutex> lock(mutex_);
        replacements_[url] = Replacement{afterFetches, std::move(next)};
    }

    void failProbe(const std::string& url, downloader::Error error) {
        std::lock_guard<std::mutex> lock(mutex_);
        probeErrors_[url] = std::move(error);
    }

    std::vector<std::uint64_t> offsets(const std::string& url) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = offsets_.find(url);
        return it == offsets_.end() ? std::vector<std::uint64_t>{} : it->second;
    }

    std::vector<std::optional<std::string>> ifRanges(const std::string& url) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = ifRanges_.find(url);
        return it == ifRanges_.end() ? std::vector<std::optional<std::string>>{} : it->second;
    }

    int probeCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return probes_;
    }

    downloader::Expected<downloader::RemoteResource>
    probe(std::string_view url, const downloader::HttpOptions&) override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++probes_;
        const std::string key(url);
        if (auto e = probeErrors_.find(key); e != probeErrors_.end())
            return e->second;
        auto it = resources_.find(key);
        if (it == resources_.end()) {
            return downloader::Error{downloader::ErrorCode::Unreachable, "HTTP 404 for " + key};
        }
        const auto& r = it->second;
        downloader::RemoteResource out;
        out.url = key;
        if (r.declareLength)
            out.contentLength = r.body.size();
        out.declaredFilename = r.declaredFilename;
        out.contentType = r.contentType;
        out.etag = r.etag;
        out.lastModified = r.lastModified;
        out.acceptsRanges = r.acceptsRanges;
        out.httpStatus = 200;
        return out;
    }

    downloader::Expected<void> fetchRange(std::string_view url, const downloader::HttpOptions&,
                                          std::uint64_t offset,
                                          const std::optional<std::string>& ifRange,
                                          const downloader::ByteSink& sink) override {
        std::string body;
        std::optional<Fault> fault;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            const std::string key(url);
            offsets_[key].push_back(offset);
            ifRanges_[key].push_back(ifRange);
            const auto fetches = offsets_[key].size();
            if (auto rep = replacements_.find(key);
                rep != replacements_.end() &&
                fetches > static_cast<std::size_t>(rep->second.afterFetches)) {
                resources_[key] = std::move(rep->second.next);
                replacements_.erase(rep);
            }
            auto it = resources_.find(key);
            if (it == resources_.end()) {
                return downloader::Error{downloader::ErrorCode::ServerError, "HTTP 404"};
            }
            auto& r = it->second;
            // If-Range that no longer matches: the full current body (HTTP 200)
            const bool stale = offset > 0 && ifRange && !matchesValidator(r, *ifRange);
            if (offset > 0 && (!r.acceptsRanges || r.ignoreRanges > 0 || stale)) {
                if (!stale && r.ignoreRanges > 0)
                    --r.ignoreRanges;
                return downloader::Error{downloader::ErrorCode::RangeNotHonored,
                                         "Server ignored range request (HTTP 200)"};
            }
            body = r.body;
            auto& queue = faults_[key];
            if (!queue.empty()) {
                fault = queue.front();
                queue.pop_front();
            }
        }

        const std::uint64_t end =
            fault ? std::min<std::uint64_t>(fault->atOffset, body.size()) : body.size();
        std::uint64_t pos = offset;
        while (pos < end) {
            const auto n = std::min<std::uint64_t>(deliverySize, end - pos);
            auto r = sink(std::span<const std::byte>(
                reinterpret_cast<const std::byte*>(body.data() + pos), static_cast<std::size_t>(n)));
            if (!r.ok())
                return r;
            pos += n;
        }
        if (fault) {
            return downloader::Error{fault->code, fault->message};
        }
        return downloader::Expected<void>{};
    }

private:
    struct Replacement {
        int afterFetches{0};
        Resource next;
    };

    static bool matchesValidator(const Resource& r, const std::string& ifRange) {
        if (r.etag && ifRange == "\"" + *r.etag + "\"")
            return true;
        return r.lastModified && ifRange == *r.lastModified;
    }

    mutable std::mutex mutex_;
    std::map<std::string, Resource> resources_;
    std::map<std::string, std::deque<Fault>> faults_;
    std::map<std::string, downloader::Error> probeErrors_;
    std::map<std::string, Replacement> replacements_;
    std::map<std::string, std::vector<std::uint64_t>> offsets_;
    std::map<std::string, std::vector<std::optional<std::string>>> ifRanges_;
    int probes_{0};
};

} // namespace convey::tests
