/**
 * @file JsonInventoryRepository.cpp
 * @brief Implementation of JsonInventoryRepository.
 */

#include "infrastructure/JsonInventoryRepository.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

namespace hemoflow::infrastructure {

using json = nlohmann::json;
namespace fs = std::filesystem;
using domain::InventoryCell;

namespace {

json CellToJson(const InventoryCell& cell) {
    return {
        {"hospital_id", cell.hospitalId},
        {"hospital_name", cell.hospitalName},
        {"region", cell.region},
        {"blood_type", cell.bloodType},
        {"current_units", cell.currentUnits},
        {"min_required", cell.minRequired},
        {"max_capacity", cell.maxCapacity}
    };
}

InventoryCell CellFromJson(const json& j) {
    InventoryCell cell;
    cell.hospitalId = j.at("hospital_id").get<int>();
    cell.hospitalName = j.value("hospital_name", std::string());
    cell.region = j.value("region", std::string());
    cell.bloodType = j.at("blood_type").get<std::string>();
    cell.currentUnits = j.at("current_units").get<int>();
    cell.minRequired = j.value("min_required", 10);
    cell.maxCapacity = j.value("max_capacity", 100);
    return cell;
}

} // namespace

JsonInventoryRepository::JsonInventoryRepository(std::string path, std::shared_ptr<PersistenceService> persistence)
    : m_path(std::move(path)), m_persistence(std::move(persistence)) {
    if (!m_path.empty()) {
        reload();
    }
}

bool JsonInventoryRepository::reload() {
    std::error_code ec;
    if (m_path.empty() || !fs::exists(m_path, ec)) {
        return false;
    }

    std::map<Key, InventoryCell> loaded;
    try {
        std::ifstream f(m_path);
        json j = json::parse(f);
        for (const auto& item : j.at("cells")) {
            InventoryCell cell = CellFromJson(item);
            loaded[{cell.hospitalId, cell.bloodType}] = cell;
        }
    } catch (const json::exception& e) {
        std::cerr << "[JsonInventoryRepository] Error reading " << m_path << ": " << e.what() << std::endl;
        return false;
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    m_cells = std::move(loaded);
    return true;
}

std::vector<InventoryCell> JsonInventoryRepository::findAll(const domain::InventoryFilter& filter) {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<InventoryCell> out;
    for (const auto& [key, cell] : m_cells) {
        if (filter.matches(cell)) {
            out.push_back(cell);
        }
    }
    return out;
}

std::optional<InventoryCell> JsonInventoryRepository::find(int hospitalId, const std::string& bloodType) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_cells.find({hospitalId, bloodType});
    if (it == m_cells.end()) return std::nullopt;
    return it->second;
}

void JsonInventoryRepository::save(const InventoryCell& cell) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_cells[{cell.hospitalId, cell.bloodType}] = cell;
    persistLocked();
}

bool JsonInventoryRepository::applyTransfer(const domain::TransferCommit& commit) {
    std::lock_guard<std::mutex> lock(m_mutex);

    const Key sourceKey{commit.source.hospitalId, commit.source.bloodType};
    const Key destKey{commit.destination.hospitalId, commit.destination.bloodType};

    auto src = m_cells.find(sourceKey);
    if (src == m_cells.end() || src->second.currentUnits != commit.expectedSourceUnits) {
        return false;
    }

    auto dst = m_cells.find(destKey);
    if (commit.destinationExisted) {
        if (dst == m_cells.end() || dst->second.currentUnits != commit.expectedDestinationUnits) {
            return false;
        }
    } else if (dst != m_cells.end()) {
        return false;
    }

    m_cells[sourceKey] = commit.source;
    m_cells[destKey] = commit.destination;
    persistLocked();
    return true;
}

void JsonInventoryRepository::flush() {
    if (m_persistence) {
        m_persistence->flush();
    }
}

size_t JsonInventoryRepository::size() {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_cells.size();
}

void JsonInventoryRepository::persistLocked() {
    if (m_path.empty() || !m_persistence) return;

    json cells = json::array();
    for (const auto& [key, cell] : m_cells) {
        cells.push_back(CellToJson(cell));
    }
    json j = {{"cells", cells}};
    m_persistence->saveTextAsync(m_path, j.dump(2));
}

} // namespace hemoflow::infrastructure
