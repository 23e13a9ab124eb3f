/**
 * @file JsonInventoryRepository.hpp
 * @brief Inventory store kept in memory and snapshotted to a JSON file.
 */

#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include "domain/inventory/InventoryRepository.hpp"
#include "infrastructure/PersistenceService.hpp"

namespace hemoflow::infrastructure {

/**
 * @class JsonInventoryRepository
 * @brief InventoryRepository whose in-memory map is authoritative.
 *
 * Every mutation queues a full snapshot through PersistenceService, so the
 * file always holds a state that existed as a whole. An empty path keeps the
 * store in memory only.
 */
class JsonInventoryRepository : public domain::InventoryRepository {
public:
    JsonInventoryRepository(std::string path, std::shared_ptr<PersistenceService> persistence);

    std::vector<domain::InventoryCell> findAll(const domain::InventoryFilter& filter) override;
    std::optional<domain::InventoryCell> find(int hospitalId, const std::string& bloodType) override;
    void save(const domain::InventoryCell& cell) override;
    bool applyTransfer(const domain::TransferCommit& commit) override;

    /** @brief Re-reads the snapshot file, replacing the in-memory state. Returns false if unreadable. */
    bool reload();

    /** @brief Waits until queued snapshots reached the file. */
    void flush();

    size_t size();

private:
    using Key = std::pair<int, std::string>;

    void persistLocked();

    std::string m_path;
    std::shared_ptr<PersistenceService> m_persistence;
    std::map<Key, domain::InventoryCell> m_cells;
    std::mutex m_mutex;
};

} // namespace hemoflow::infrastructure
