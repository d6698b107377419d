/*
 * convey/src/downloader/resume_store.cpp
 *
 * JSON resume sidecar, one per staging file ("<destination>.part.json"):
 * {
 *   "url": "https://example.com/file.bin",
 *   "etag": "abc123",
 *   "last_modified": "Tue, 19 Aug 2025 09:00:00 GMT",
 *   "total_bytes": 1048576,
 *   "updated_at": 1755594000
 * }
 *
 * The sidecar records which version of the resource the staging bytes belong to. An
 * unreadable or corrupt sidecar loads as "no state", which makes the orchestrator
 * restart from zero instead of appending to bytes of unknown origin.
 */

#include <convey/downloader/downloader.hpp>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>
#include <system_error>

namespace convey::downloader {

namespace fs = std::filesystem;
using nlohmann::json;

class JsonResumeStore final : public IResumeStore {
public:
    JsonResumeStore() = default;
    ~JsonResumeStore() override = default;

    Expected<std::optional<State>> load(const fs::path& stagingFile) override {
        const auto path = sidecarPathFor(stagingFile);
        std::error_code ec;
        if (!fs::exists(path, ec))
            return std::optional<State>{std::nullopt};

        std::ifstream in(path);
        if (!in) {
            return Error{ErrorCode::DestinationError,
                         "Failed to open resume sidecar for read: " + path.string()};
        }

        json root;
        try {
            in >> root;
        } catch (const json::exception& e) {
            spdlog::warn("Ignoring corrupt resume sidecar {}: {}", path.string(), e.what());
            return std::optional<State>{std::nullopt};
        }
        if (!root.is_object() || !root.contains("url") || !root["url"].is_string()) {
            spdlog::warn("Ignoring malformed resume sidecar {}", path.string());
            return std::optional<State>{std::nullopt};
        }

        State st;
        st.url = root["url"].get<std::string>();
        if (root.contains("etag") && root["etag"].is_string()) {
            st.etag = root["etag"].get<std::string>();
        }
        if (root.contains("last_modified") && root["last_modified"].is_string()) {
            st.lastModified = root["last_modified"].get<std::string>();
        }
        if (root.contains("total_bytes") && root["total_bytes"].is_number_unsigned()) {
            st.totalBytes = root["total_bytes"].get<std::uint64_t>();
        }
        return std::optional<State>{st};
    }

    Expected<void> save(const fs::path& stagingFile, const State& state) override {
        json root = json::object();
        root["url"] = state.url;
        if (state.etag)
            root["etag"] = *state.etag;
        if (state.lastModified)
            root["last_modified"] = *state.lastModified;
        root["total_bytes"] = state.totalBytes;
        root["updated_at"] = std::chrono::duration_cast<std::chrono::seconds>(
                                 std::chrono::system_clock::now().time_since_epoch())
                                 .count();

        const auto path = sidecarPathFor(stagingFile);
        auto tmp = path;
        tmp += ".tmp";
        {
            std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
            if (!out) {
                return Error{ErrorCode::DestinationError,
                             "Failed to open resume sidecar for write: " + tmp.string()};
            }
            out << root.dump(2);
            if (!out.good()) {
                return Error{ErrorCode::DestinationError,
                             "Failed to write resume sidecar: " + tmp.string()};
            }
        }

        std::error_code ec;
        fs::rename(tmp, path, ec);
        if (ec) {
            fs::remove(tmp, ec);
            return Error{ErrorCode::DestinationError,
                         "Failed to publish resume sidecar: " + path.string()};
        }

        spdlog::debug("Resume sidecar saved for url='{}' (totalBytes={}, etag={}, lastModified={})",
                      state.url, state.totalBytes, state.etag.value_or(""),
                      state.lastModified.value_or(""));
        return Expected<void>{};
    }

    void remove(const fs::path& stagingFile) noexcept override {
        std::error_code ec;
        fs::remove(sidecarPathFor(stagingFile), ec);
        if (ec) {
            spdlog::debug("Failed to remove resume sidecar for {}: {}", stagingFile.string(),
                          ec.message());
        }
    }
};

std::unique_ptr<IResumeStore> makeJsonResumeStore() {
    return std::make_unique<JsonResumeStore>();
}

} // namespace convey::downloader
