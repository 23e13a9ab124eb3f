/**
 * @file InventoryClassifier.hpp
 * @brief Domain service for status bands and transfer scoring.
 */

#pragma once

#include <algorithm>
#include <string>
#include "domain/inventory/InventoryCell.hpp"

namespace hemoflow::domain {

class InventoryClassifier {
public:
    static constexpr double kCriticalFraction = 0.5;
    static constexpr double kExcessFraction = 0.9;
    static constexpr double kSurplusFactor = 1.5;

    static InventoryStatus status(const InventoryCell& cell) {
        if (cell.currentUnits < cell.minRequired * kCriticalFraction) return InventoryStatus::Critical;
        if (cell.currentUnits < cell.minRequired) return InventoryStatus::Low;
        if (cell.currentUnits > cell.maxCapacity * kExcessFraction) return InventoryStatus::Excess;
        return InventoryStatus::Adequate;
    }

    static double shortage(const InventoryCell& cell) {
        return std::max(0.0, static_cast<double>(cell.minRequired - cell.currentUnits));
    }

    static double surplus(const InventoryCell& cell) {
        return std::max(0.0, cell.currentUnits - cell.minRequired * kSurplusFactor);
    }

    static CellAssessment assess(const InventoryCell& cell) {
        CellAssessment a;
        a.cell = cell;
        a.status = status(cell);
        a.shortage = shortage(cell);
        a.surplus = surplus(cell);
        return a;
    }

    /**
     * @brief Score of moving units from @p source to @p destination; higher is more urgent.
     *
     * 100 for a Critical destination, 50 for Low, plus twice the shortage and half the surplus.
     */
    static double priority(const CellAssessment& destination, const CellAssessment& source) {
        double score = 0.0;
        if (destination.status == InventoryStatus::Critical) score += 100.0;
        else if (destination.status == InventoryStatus::Low) score += 50.0;
        score += destination.shortage * 2.0;
        score += source.surplus * 0.5;
        return score;
    }

    static std::string reason(const CellAssessment& destination, const CellAssessment& source) {
        return displayName(destination.cell) + " has " + std::to_string(static_cast<int>(destination.shortage)) +
               " unit shortage while " + displayName(source.cell) + " has " +
               std::to_string(static_cast<int>(source.surplus)) + " unit surplus";
    }

    static std::string displayName(const InventoryCell& cell) {
        if (!cell.hospitalName.empty()) return cell.hospitalName;
        return "Hospital " + std::to_string(cell.hospitalId);
    }
};

} // namespace hemoflow::domain
