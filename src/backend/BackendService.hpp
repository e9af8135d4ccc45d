// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>

#include <cstdint>
#include <set>
#include <string_view>
#include <vector>

namespace modelmatch
{

/// @brief The remote service holding tenants, folders and models.
///
/// All calls are synchronous. Failures are reported as errors and never throw.
class BackendService
{
  public:
    virtual ~BackendService() = default;

    /// @brief Lists the folders visible in the current session.
    [[nodiscard]] virtual auto listFolders() -> Result<std::vector<Folder>> = 0;

    /// @brief Lists the models contained in the given folders.
    [[nodiscard]] virtual auto listModels(std::set<std::int64_t> const& folderIds) -> Result<std::vector<Model>> = 0;

    /// @brief Opens a session for @p tenant, invalidating any cached credential for it first.
    [[nodiscard]] virtual auto establishSession(std::string_view tenant) -> VoidResult = 0;

    /// @brief Submits a search query.
    [[nodiscard]] virtual auto submitSearch(std::string_view query) -> VoidResult = 0;
};

} // namespace modelmatch
