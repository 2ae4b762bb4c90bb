// =============================================================================
// refcache - Ensure Command
// =============================================================================
// Command handler that prepares a single catalog entry and prints its
// published paths as JSON.
// =============================================================================

#ifndef REFCACHE_COMMANDS_ENSURE_COMMAND_H
#define REFCACHE_COMMANDS_ENSURE_COMMAND_H

#include <filesystem>

#include "refcache/common/config.h"
#include "refcache/common/types.h"

namespace refcache::commands {

/// @brief Configuration options for the ensure command.
struct EnsureOptions {
    CacheConfig config;
    std::filesystem::path catalogPath;

    /// @brief Entry to prepare; must be declared in the catalog.
    GenomeKey key;
};

/// @brief Command handler for ensuring one entry.
class EnsureCommand {
public:
    explicit EnsureCommand(EnsureOptions options);

    ~EnsureCommand();

    EnsureCommand(const EnsureCommand&) = delete;
    EnsureCommand& operator=(const EnsureCommand&) = delete;

    /// @brief Execute the ensure command.
    /// @return Exit code (0 = success).
    [[nodiscard]] int execute();

private:
    EnsureOptions options_;
};

}  // namespace refcache::commands

#endif  // REFCACHE_COMMANDS_ENSURE_COMMAND_H
