/**
 * @file Redistributor.hpp
 * @brief Inventory classification, surplus/shortage matching and transfer execution.
 */

#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include "domain/inventory/InventoryCell.hpp"
#include "domain/inventory/InventoryRepository.hpp"
#include "domain/inventory/RedistributionOpportunity.hpp"

namespace hemoflow::application {

struct RedistributorOptions {
    int newCellMinRequired = 10;    ///< Bounds given to a destination cell created by a transfer.
    int newCellMaxCapacity = 100;
};

/**
 * @class Redistributor
 * @brief Matches surplus cells against shortage cells and executes transfers.
 *
 * executeRedistribution() and setCurrentUnits() are the only operations that
 * write inventory. Both take the per-cell locks of the cells they touch.
 */
class Redistributor {
public:
    explicit Redistributor(std::shared_ptr<domain::InventoryRepository> inventory,
                           RedistributorOptions options = {});

    static domain::InventoryStatus classifyInventory(const domain::InventoryCell& cell);

    /** @brief Every cell matching @p filter with its status band, shortage and surplus. */
    std::vector<domain::CellAssessment> inventoryStatus(const domain::InventoryFilter& filter = {});

    /**
     * @brief Proposes a transfer for every (shortage, surplus) pair of the same blood type.
     *
     * Proposals are sorted by priority, highest first, and do not reserve
     * the source surplus: two proposals may draw on the same cell.
     * @param bloodType Restricts matching to one blood type; empty means all.
     */
    std::vector<domain::RedistributionOpportunity> identifyOpportunities(const std::string& bloodType = "");

    /**
     * @brief Moves @p units from one hospital's cell to another's, all or nothing.
     *
     * A missing destination cell is created with the configured default bounds.
     * @throws domain::InvalidArgument for non-positive units, identical hospitals or an unknown blood type.
     * @throws domain::InsufficientInventory if the source holds fewer than @p units (or does not exist).
     * @throws domain::CapacityExceeded if the destination would exceed its capacity.
     * @throws domain::TransferConflict if the store changed the cells concurrently.
     */
    domain::TransferResult executeRedistribution(int fromHospitalId,
                                                 int toHospitalId,
                                                 const std::string& bloodType,
                                                 int units);

    /**
     * @brief Sets the stock of one cell, creating it with default bounds when missing.
     * @throws domain::InvalidArgument if @p units is outside [0, maxCapacity].
     */
    domain::InventoryCell setCurrentUnits(int hospitalId,
                                          const std::string& bloodType,
                                          int units,
                                          const std::string& hospitalName = "",
                                          const std::string& region = "");

    domain::RedistributionSummary summary();

private:
    std::mutex& cellLock(int hospitalId, const std::string& bloodType);

    std::shared_ptr<domain::InventoryRepository> m_inventory;
    RedistributorOptions m_options;

    std::mutex m_lockTableMutex;
    std::map<std::pair<int, std::string>, std::unique_ptr<std::mutex>> m_cellLocks;
};

} // namespace hemoflow::application
