/**
 * @file InventoryRepository.hpp
 * @brief Interface for reading and mutating inventory cells.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>
#include "domain/inventory/InventoryCell.hpp"

namespace hemoflow::domain {

/**
 * @struct TransferCommit
 * @brief Both sides of a transfer plus the levels they were validated against.
 */
struct TransferCommit {
    InventoryCell source;               ///< New state of the source cell.
    int expectedSourceUnits = 0;        ///< Source level observed during validation.
    InventoryCell destination;          ///< New state of the destination cell.
    bool destinationExisted = true;     ///< False when the destination cell is being created.
    int expectedDestinationUnits = 0;
};

/**
 * @class InventoryRepository
 * @brief Abstract storage of InventoryCell records, keyed by (hospital id, blood type).
 */
class InventoryRepository {
public:
    virtual ~InventoryRepository() = default;

    /** @brief Fetches all cells matching the filter. */
    virtual std::vector<InventoryCell> findAll(const InventoryFilter& filter) = 0;

    /** @brief Fetches one cell, if present. */
    virtual std::optional<InventoryCell> find(int hospitalId, const std::string& bloodType) = 0;

    /** @brief Inserts or replaces a cell. */
    virtual void save(const InventoryCell& cell) = 0;

    /**
     * @brief Writes both cells of a transfer as one unit.
     *
     * Compare-and-swap on (source.current, destination.current): if the stored
     * levels no longer equal the expected ones, nothing is written.
     * @return True when both cells were written.
     */
    virtual bool applyTransfer(const TransferCommit& commit) = 0;
};

} // namespace hemoflow::domain
