#include "application/Redistributor.hpp"
#include "domain/BloodTypes.hpp"
#include "domain/EngineErrors.hpp"
#include "domain/inventory/InventoryClassifier.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <set>

namespace hemoflow::application {

using namespace hemoflow::domain;

Redistributor::Redistributor(std::shared_ptr<InventoryRepository> inventory, RedistributorOptions options)
    : m_inventory(std::move(inventory)), m_options(options) {
    if (!m_inventory) {
        throw InvalidArgument("Redistributor requires an inventory repository");
    }
}

InventoryStatus Redistributor::classifyInventory(const InventoryCell& cell) {
    return InventoryClassifier::status(cell);
}

std::vector<CellAssessment> Redistributor::inventoryStatus(const InventoryFilter& filter) {
    std::vector<CellAssessment> result;
    for (const auto& cell : m_inventory->findAll(filter)) {
        result.push_back(InventoryClassifier::assess(cell));
    }
    return result;
}

std::vector<RedistributionOpportunity> Redistributor::identifyOpportunities(const std::string& bloodType) {
    InventoryFilter filter;
    filter.bloodType = bloodType;
    const auto cells = inventoryStatus(filter);

    std::vector<const CellAssessment*> shortages;
    std::vector<const CellAssessment*> surpluses;
    for (const auto& a : cells) {
        if (a.shortage > 0.0) shortages.push_back(&a);
        if (a.surplus > 0.0) surpluses.push_back(&a);
    }

    std::vector<RedistributionOpportunity> opportunities;
    for (const auto* destination : shortages) {
        for (const auto* source : surpluses) {
            if (destination->cell.bloodType != source->cell.bloodType) continue;

            // Whole units only; a fractional surplus below one unit proposes nothing.
            const int units = static_cast<int>(std::floor(std::min(destination->shortage, source->surplus)));
            if (units < 1) continue;

            RedistributionOpportunity op;
            op.fromHospitalId = source->cell.hospitalId;
            op.fromHospitalName = InventoryClassifier::displayName(source->cell);
            op.toHospitalId = destination->cell.hospitalId;
            op.toHospitalName = InventoryClassifier::displayName(destination->cell);
            op.bloodType = destination->cell.bloodType;
            op.transferUnits = units;
            op.priority = InventoryClassifier::priority(*destination, *source);
            op.reason = InventoryClassifier::reason(*destination, *source);
            opportunities.push_back(std::move(op));
        }
    }

    std::stable_sort(opportunities.begin(), opportunities.end(),
        [](const RedistributionOpportunity& a, const RedistributionOpportunity& b) {
            return a.priority > b.priority;
        });
    return opportunities;
}

std::mutex& Redistributor::cellLock(int hospitalId, const std::string& bloodType) {
    std::lock_guard<std::mutex> lock(m_lockTableMutex);
    auto& slot = m_cellLocks[{hospitalId, bloodType}];
    if (!slot) {
        slot = std::make_unique<std::mutex>();
    }
    return *slot;
}

TransferResult Redistributor::executeRedistribution(int fromHospitalId,
                                                    int toHospitalId,
                                                    const std::string& bloodType,
                                                    int units) {
    if (units <= 0) {
        throw InvalidArgument("Transfer units must be positive");
    }
    if (fromHospitalId == toHospitalId) {
        throw InvalidArgument("Source and destination hospital must differ");
    }
    if (!IsKnownBloodType(bloodType)) {
        throw InvalidArgument("Unknown blood type: " + bloodType);
    }

    // std::scoped_lock orders the two acquisitions, so opposite transfers cannot deadlock.
    std::scoped_lock cellsLock(cellLock(fromHospitalId, bloodType), cellLock(toHospitalId, bloodType));

    const auto source = m_inventory->find(fromHospitalId, bloodType);
    if (!source || source->currentUnits < units) {
        throw InsufficientInventory("Insufficient inventory at source hospital " + std::to_string(fromHospitalId) +
                                    ": requested " + std::to_string(units) + " units of " + bloodType +
                                    ", available " + std::to_string(source ? source->currentUnits : 0));
    }

    TransferCommit commit;
    const auto existing = m_inventory->find(toHospitalId, bloodType);
    if (existing) {
        commit.destination = *existing;
        commit.destinationExisted = true;
        commit.expectedDestinationUnits = existing->currentUnits;
    } else {
        commit.destination.hospitalId = toHospitalId;
        commit.destination.bloodType = bloodType;
        commit.destination.currentUnits = 0;
        commit.destination.minRequired = m_options.newCellMinRequired;
        commit.destination.maxCapacity = m_options.newCellMaxCapacity;
        commit.destinationExisted = false;
        commit.expectedDestinationUnits = 0;
    }

    if (commit.destination.currentUnits + units > commit.destination.maxCapacity) {
        throw CapacityExceeded("Destination hospital " + std::to_string(toHospitalId) + " at capacity: " +
                               std::to_string(commit.destination.currentUnits) + " + " + std::to_string(units) +
                               " exceeds " + std::to_string(commit.destination.maxCapacity));
    }

    commit.source = *source;
    commit.expectedSourceUnits = source->currentUnits;
    commit.source.currentUnits -= units;
    commit.destination.currentUnits += units;

    if (!m_inventory->applyTransfer(commit)) {
        throw TransferConflict("Inventory for " + bloodType + " changed during transfer from hospital " +
                               std::to_string(fromHospitalId) + " to " + std::to_string(toHospitalId));
    }

    std::cout << "[Redistributor] Transferred " << units << " units of " << bloodType
              << " from hospital " << fromHospitalId << " to hospital " << toHospitalId << std::endl;

    TransferResult result;
    result.fromHospitalId = fromHospitalId;
    result.toHospitalId = toHospitalId;
    result.bloodType = bloodType;
    result.unitsTransferred = units;
    result.sourceRemaining = commit.source.currentUnits;
    result.destinationLevel = commit.destination.currentUnits;
    return result;
}

InventoryCell Redistributor::setCurrentUnits(int hospitalId,
                                             const std::string& bloodType,
                                             int units,
                                             const std::string& hospitalName,
                                             const std::string& region) {
    if (!IsKnownBloodType(bloodType)) {
        throw InvalidArgument("Unknown blood type: " + bloodType);
    }

    std::lock_guard<std::mutex> lock(cellLock(hospitalId, bloodType));

    InventoryCell cell;
    if (auto existing = m_inventory->find(hospitalId, bloodType)) {
        cell = *existing;
    } else {
        cell.hospitalId = hospitalId;
        cell.bloodType = bloodType;
        cell.minRequired = m_options.newCellMinRequired;
        cell.maxCapacity = m_options.newCellMaxCapacity;
    }
    if (!hospitalName.empty()) cell.hospitalName = hospitalName;
    if (!region.empty()) cell.region = region;

    if (units < 0 || units > cell.maxCapacity) {
        throw InvalidArgument("Units must be between 0 and " + std::to_string(cell.maxCapacity) +
                              ", got " + std::to_string(units));
    }
    cell.currentUnits = units;
    m_inventory->save(cell);
    return cell;
}

RedistributionSummary Redistributor::summary() {
    const auto all = inventoryStatus();

    RedistributionSummary s;
    std::set<int> hospitals;
    std::set<std::string> bloodTypes;
    for (const auto& a : all) {
        hospitals.insert(a.cell.hospitalId);
        bloodTypes.insert(a.cell.bloodType);
        switch (a.status) {
            case InventoryStatus::Critical: s.criticalCount++; break;
            case InventoryStatus::Low: s.lowCount++; break;
            case InventoryStatus::Adequate: s.adequateCount++; break;
            case InventoryStatus::Excess: s.excessCount++; break;
        }
        s.totalShortageUnits += a.shortage;
        s.totalSurplusUnits += a.surplus;
    }
    s.totalHospitals = hospitals.size();
    s.totalInventoryRecords = all.size();
    s.bloodTypesTracked = bloodTypes.size();
    s.redistributionPotential = std::min(s.totalShortageUnits, s.totalSurplusUnits);
    return s;
}

} // namespace hemoflow::application
