#pragma once

#include "store/artifact_store.hpp"
#include <memory>
#include <string>

namespace thincore {
namespace artifacts {

/**
 * Open an artifact store from a connection string
 *
 * Supported forms:
 *   memory:                 MemoryArtifactStore
 *   file:///var/thincore    FilesystemArtifactStore
 *   /var/thincore, ./store  FilesystemArtifactStore (bare path)
 *   http://host:port        HttpArtifactStore (https as well)
 *
 * @throws ConfigurationError for an empty URL or an unknown scheme
 */
std::shared_ptr<ArtifactStore> open_artifact_store(const std::string& url);

} // namespace artifacts
} // namespace thincore
