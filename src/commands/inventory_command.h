// =============================================================================
// refcache - Inventory Commands
// =============================================================================
// Read-only views of the inventory:
// - list:   published genomes (text table or JSON)
// - status: every record with its state and last error
// - paths:  published paths of one genome, resolved for a consumer
// =============================================================================

#ifndef REFCACHE_COMMANDS_INVENTORY_COMMAND_H
#define REFCACHE_COMMANDS_INVENTORY_COMMAND_H

#include <cstdint>
#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

#include "refcache/common/config.h"
#include "refcache/common/types.h"

namespace refcache::commands {

// =============================================================================
// Options
// =============================================================================

/// @brief Which view the command renders.
enum class InventoryView : std::uint8_t {
    kList = 0,
    kStatus = 1,
    kPaths = 2
};

/// @brief Configuration options for the inventory commands.
struct InventoryOptions {
    CacheConfig config;
    InventoryView view = InventoryView::kList;

    /// @brief JSON output (always on for the paths view).
    bool jsonOutput = false;

    /// @brief Lookup key for the paths view.
    std::string provider;
    std::string species;
    std::optional<std::string> assembly;
};

// =============================================================================
// InventoryCommand Class
// =============================================================================

/// @brief Command handler for list, status and paths.
class InventoryCommand {
public:
    explicit InventoryCommand(InventoryOptions options);

    ~InventoryCommand();

    InventoryCommand(const InventoryCommand&) = delete;
    InventoryCommand& operator=(const InventoryCommand&) = delete;

    /// @brief Execute the selected view.
    /// @return Exit code (0 = success, 2 when the requested genome is not published).
    [[nodiscard]] int execute();

private:
    int runList();
    int runStatus();
    int runPaths();

    InventoryOptions options_;
};

/// @brief Render published records as an aligned text table.
void printRecordTable(const std::vector<GenomeRecord>& records, std::ostream& out);

/// @brief Render every record with state and last error.
void printStatusTable(const std::vector<GenomeRecord>& records, std::ostream& out);

}  // namespace refcache::commands

#endif  // REFCACHE_COMMANDS_INVENTORY_COMMAND_H
