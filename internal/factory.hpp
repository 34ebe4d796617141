#pragma once

#include <memory>

#include "docman/config/v1/config.pb.h"
#include "internal/core/document_catalog.hpp"
#include "internal/core/document_processor.hpp"
#include "internal/core/organization_applier.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/extraction/content_extractor.hpp"
#include "internal/storage/content_hasher.hpp"
#include "internal/storage/document_discovery.hpp"

namespace docman::factory {

/*
  Runtime

  Owns every long-lived collaborator used by the command tool.
*/
struct Runtime {
  std::shared_ptr<db::Repository> repository;

  std::shared_ptr<storage::ContentHasher>       hasher;
  std::shared_ptr<extraction::ContentExtractor> extractor;

  std::shared_ptr<core::DocumentProcessor>   processor;
  std::shared_ptr<core::DocumentCatalog>     catalog;
  std::shared_ptr<core::OrganizationApplier> applier;

  storage::DiscoveryOptions discovery;
};

/*
  BuildRuntime

  Composition root. It is the ONLY place allowed to know concrete DB types.
  Expects a config with defaults applied (ConfigLoader does this).
*/
Runtime BuildRuntime(const docman::config::v1::AppConfig& config);

// Repository only; exposed for tests that need a specific backend.
std::shared_ptr<db::Repository> BuildRepository(const docman::config::v1::AppConfig& config);

} // namespace docman::factory
