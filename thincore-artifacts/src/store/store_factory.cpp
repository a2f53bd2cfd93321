#include "store/store_factory.hpp"
#include "store/filesystem_store.hpp"
#include "store/http_store.hpp"
#include "store/memory_store.hpp"
#include "errors.hpp"

namespace thincore {
namespace artifacts {

namespace {

bool starts_with(const std::string& value, const std::string& prefix) {
    return value.compare(0, prefix.size(), prefix) == 0;
}

} // namespace

std::shared_ptr<ArtifactStore> open_artifact_store(const std::string& url) {
    if (url.empty()) {
        throw ConfigurationError("Artifact store URL is empty");
    }

    if (url == "memory:" || url == "memory") {
        return std::make_shared<MemoryArtifactStore>();
    }

    if (starts_with(url, "file://")) {
        std::string path = url.substr(7);
        if (path.empty()) {
            throw ConfigurationError("Artifact store URL has no path: " + url);
        }
        return std::make_shared<FilesystemArtifactStore>(path);
    }

    if (starts_with(url, "http://") || starts_with(url, "https://")) {
        return std::make_shared<HttpArtifactStore>(url);
    }

    auto scheme_end = url.find("://");
    if (scheme_end != std::string::npos) {
        throw ConfigurationError("Unsupported artifact store scheme: " + url.substr(0, scheme_end));
    }

    return std::make_shared<FilesystemArtifactStore>(url);
}

} // namespace artifacts
} // namespace thincore
