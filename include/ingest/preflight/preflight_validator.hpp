#pragma once

#include "ingest/core/config.hpp"
#include "ingest/core/result.hpp"
#include "ingest/core/types.hpp"
#include "ingest/path/path_resolver.hpp"

#include <cstdint>
#include <filesystem>
#include <functional>

namespace ingest::preflight {

/**
 * @brief Read-only checks run before a transfer may start
 *
 * Check order, short-circuiting on the structural ones:
 *   1. same source and destination root
 *   2. destination nested in source, or source nested in destination
 *   3. per-file destination conflicts
 *   4. free space (required + margin)
 *
 * Conflicts never invalidate a request; they only ask for confirmation
 * under the ask policy. The validator holds no mutable state and can be
 * shared between threads.
 */
class PreflightValidator {
public:
    /// Free bytes available for writing at (or above) the given path.
    using SpaceQuery = std::function<Result<std::uint64_t>(const std::filesystem::path&)>;

    explicit PreflightValidator(path::PathResolver resolver,
                                double space_margin = 0.10,
                                std::size_t max_files = kMaxFilesPerTransfer,
                                SpaceQuery space_query = {});

    static PreflightValidator from_config(const IngestConfig& config);

    /**
     * @brief Validates @p request without writing anything
     *
     * Returns an error only for hard failures: a destination root that is
     * not a readable directory, or a free-space query that fails.
     */
    [[nodiscard]] Result<ValidationResult> validate(const TransferRequest& request) const;

    [[nodiscard]] const path::PathResolver& resolver() const noexcept { return resolver_; }

private:
    /// Fills conflicts and space_required_bytes; returns the unreadable count.
    std::size_t inspect_files(const TransferRequest& request, ValidationResult& result) const;

    path::PathResolver resolver_;
    double space_margin_;
    std::size_t max_files_;
    SpaceQuery space_query_;
};

/// std::filesystem::space on the nearest existing ancestor of @p path.
Result<std::uint64_t> available_space(const std::filesystem::path& path);

} // namespace ingest::preflight
