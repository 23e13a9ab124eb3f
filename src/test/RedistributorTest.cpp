#include <cassert>
#include <iostream>
#include <memory>
#include <string>

#include "application/Redistributor.hpp"
#include "domain/EngineErrors.hpp"
#include "infrastructure/JsonInventoryRepository.hpp"
#include "infrastructure/PersistenceService.hpp"

using namespace hemoflow::domain;
using namespace hemoflow::application;
using namespace hemoflow::infrastructure;

namespace {

InventoryCell Cell(int hospitalId, const std::string& name, const std::string& bloodType,
                   int current, int minRequired = 10, int maxCapacity = 100) {
    InventoryCell cell;
    cell.hospitalId = hospitalId;
    cell.hospitalName = name;
    cell.region = "South Delhi";
    cell.bloodType = bloodType;
    cell.currentUnits = current;
    cell.minRequired = minRequired;
    cell.maxCapacity = maxCapacity;
    return cell;
}

int UnitsAt(InventoryRepository& repo, int hospitalId, const std::string& bloodType) {
    auto cell = repo.find(hospitalId, bloodType);
    assert(cell.has_value());
    return cell->currentUnits;
}

/** Repository whose stored levels move between the redistributor's read and its commit. */
class RacingRepository : public JsonInventoryRepository {
public:
    using JsonInventoryRepository::JsonInventoryRepository;

    bool applyTransfer(const TransferCommit& commit) override {
        auto source = find(commit.source.hospitalId, commit.source.bloodType);
        source->currentUnits -= 1;
        save(*source);
        return JsonInventoryRepository::applyTransfer(commit);
    }
};

} // namespace

int main() {
    std::cout << "[Test] Starting Redistributor Test..." << std::endl;

    auto persistence = std::make_shared<PersistenceService>();

    // Classification bands
    assert(Redistributor::classifyInventory(Cell(1, "", "O+", 4)) == InventoryStatus::Critical);
    assert(Redistributor::classifyInventory(Cell(1, "", "O+", 5)) == InventoryStatus::Low);
    assert(Redistributor::classifyInventory(Cell(1, "", "O+", 9)) == InventoryStatus::Low);
    assert(Redistributor::classifyInventory(Cell(1, "", "O+", 10)) == InventoryStatus::Adequate);
    assert(Redistributor::classifyInventory(Cell(1, "", "O+", 90)) == InventoryStatus::Adequate);
    assert(Redistributor::classifyInventory(Cell(1, "", "O+", 91)) == InventoryStatus::Excess);
    std::cout << "[PASS] Status bands." << std::endl;

    {
        // One hospital short, one with surplus.
        auto repo = std::make_shared<JsonInventoryRepository>("", persistence);
        repo->save(Cell(1, "Hospital A", "O+", 2));
        repo->save(Cell(2, "Hospital B", "O+", 60));
        Redistributor redistributor(repo);

        auto ops = redistributor.identifyOpportunities();
        assert(ops.size() == 1);
        assert(ops[0].fromHospitalId == 2);
        assert(ops[0].toHospitalId == 1);
        assert(ops[0].bloodType == "O+");
        assert(ops[0].transferUnits == 8);
        // Critical destination: 100 + 2 * 8 + 0.5 * 45
        assert(ops[0].priority == 138.5);
        assert(ops[0].reason == "Hospital A has 8 unit shortage while Hospital B has 45 unit surplus");
        assert(!ops[0].forecastBased);
        std::cout << "[PASS] Single shortage matched against single surplus." << std::endl;

        auto result = redistributor.executeRedistribution(2, 1, "O+", ops[0].transferUnits);
        assert(result.unitsTransferred == 8);
        assert(result.sourceRemaining == 52);
        assert(result.destinationLevel == 10);
        assert(UnitsAt(*repo, 1, "O+") == 10);
        assert(UnitsAt(*repo, 2, "O+") == 52);
        assert(redistributor.identifyOpportunities().empty());
        std::cout << "[PASS] Executed transfer closes the gap." << std::endl;
    }

    {
        // Source holds fewer units than requested.
        auto repo = std::make_shared<JsonInventoryRepository>("", persistence);
        repo->save(Cell(1, "Hospital A", "A+", 20));
        repo->save(Cell(2, "Hospital B", "A+", 30));
        Redistributor redistributor(repo);

        bool threw = false;
        try {
            redistributor.executeRedistribution(1, 2, "A+", 50);
        } catch (const InsufficientInventory&) {
            threw = true;
        }
        assert(threw);
        assert(UnitsAt(*repo, 1, "A+") == 20);
        assert(UnitsAt(*repo, 2, "A+") == 30);

        threw = false;
        try {
            redistributor.executeRedistribution(7, 2, "A+", 1);
        } catch (const InsufficientInventory&) {
            threw = true;
        }
        assert(threw);
        assert(!repo->find(7, "A+"));
        std::cout << "[PASS] Insufficient inventory leaves both cells untouched." << std::endl;

        // Destination over capacity.
        repo->save(Cell(3, "Hospital C", "A+", 95));
        threw = false;
        try {
            redistributor.executeRedistribution(1, 3, "A+", 6);
        } catch (const CapacityExceeded&) {
            threw = true;
        }
        assert(threw);
        assert(UnitsAt(*repo, 1, "A+") == 20);
        assert(UnitsAt(*repo, 3, "A+") == 95);

        auto exact = redistributor.executeRedistribution(1, 3, "A+", 5);
        assert(exact.destinationLevel == 100);
        assert(UnitsAt(*repo, 1, "A+") == 15);
        std::cout << "[PASS] Capacity is enforced and can be filled exactly." << std::endl;

        // Argument validation
        threw = false;
        try { redistributor.executeRedistribution(1, 2, "A+", 0); } catch (const InvalidArgument&) { threw = true; }
        assert(threw);
        threw = false;
        try { redistributor.executeRedistribution(1, 1, "A+", 1); } catch (const InvalidArgument&) { threw = true; }
        assert(threw);
        threw = false;
        try { redistributor.executeRedistribution(1, 2, "C+", 1); } catch (const InvalidArgument&) { threw = true; }
        assert(threw);
        assert(UnitsAt(*repo, 1, "A+") == 15);
        std::cout << "[PASS] Invalid transfers rejected." << std::endl;
    }

    {
        // Missing destination cell is created with default bounds.
        auto repo = std::make_shared<JsonInventoryRepository>("", persistence);
        repo->save(Cell(1, "Hospital A", "B-", 40));
        RedistributorOptions options;
        options.newCellMinRequired = 12;
        options.newCellMaxCapacity = 80;
        Redistributor redistributor(repo, options);

        auto result = redistributor.executeRedistribution(1, 9, "B-", 15);
        assert(result.destinationLevel == 15);
        auto created = repo->find(9, "B-");
        assert(created);
        assert(created->minRequired == 12);
        assert(created->maxCapacity == 80);
        assert(UnitsAt(*repo, 1, "B-") == 25);

        bool threw = false;
        try {
            redistributor.executeRedistribution(1, 10, "B-", 81);
        } catch (const InsufficientInventory&) {
            threw = true;
        }
        assert(threw);
        assert(!repo->find(10, "B-"));
        std::cout << "[PASS] Destination cell created on first transfer." << std::endl;
    }

    {
        // Concurrent modification between read and commit is reported, not applied.
        auto repo = std::make_shared<RacingRepository>("", persistence);
        repo->save(Cell(1, "Hospital A", "O-", 50));
        repo->save(Cell(2, "Hospital B", "O-", 5));
        Redistributor redistributor(repo);

        bool threw = false;
        try {
            redistributor.executeRedistribution(1, 2, "O-", 10);
        } catch (const TransferConflict&) {
            threw = true;
        }
        assert(threw);
        assert(UnitsAt(*repo, 1, "O-") == 49);
        assert(UnitsAt(*repo, 2, "O-") == 5);
        std::cout << "[PASS] Compare-and-swap conflict surfaces as TransferConflict." << std::endl;
    }

    {
        // Ordering, blood type filter, status listing and summary.
        auto repo = std::make_shared<JsonInventoryRepository>("", persistence);
        repo->save(Cell(1, "Hospital A", "O+", 2));     // Critical, shortage 8
        repo->save(Cell(2, "Hospital B", "O+", 7));     // Low, shortage 3
        repo->save(Cell(3, "Hospital C", "O+", 40));    // surplus 25
        repo->save(Cell(4, "Hospital D", "O+", 95));    // Excess, surplus 80
        repo->save(Cell(1, "Hospital A", "AB-", 0));    // Critical, shortage 10
        repo->save(Cell(2, "Hospital B", "AB-", 30));   // surplus 15
        repo->save(Cell(3, "Hospital C", "A-", 15));    // Adequate, nothing to give
        Redistributor redistributor(repo);

        auto ops = redistributor.identifyOpportunities();
        assert(ops.size() == 5);
        for (size_t i = 1; i < ops.size(); ++i) {
            assert(ops[i - 1].priority >= ops[i].priority);
        }
        for (const auto& op : ops) {
            assert(op.transferUnits > 0);
            assert(op.fromHospitalId != op.toHospitalId);
        }
        // O+ from the Excess cell: 100 + 2 * 8 + 0.5 * 80
        assert(ops[0].bloodType == "O+" && ops[0].toHospitalId == 1 && ops[0].fromHospitalId == 4);
        assert(ops[0].priority == 156.0);

        auto onlyAbNeg = redistributor.identifyOpportunities("AB-");
        assert(onlyAbNeg.size() == 1);
        assert(onlyAbNeg[0].transferUnits == 10);
        assert(onlyAbNeg[0].priority == 127.5);
        std::cout << "[PASS] Proposals sorted by priority and filtered by blood type." << std::endl;

        InventoryFilter filter;
        filter.hospitalId = 3;
        auto listing = redistributor.inventoryStatus(filter);
        assert(listing.size() == 2);
        filter = {};
        filter.region = "Delhi";
        assert(redistributor.inventoryStatus(filter).size() == 7);

        auto s = redistributor.summary();
        assert(s.totalHospitals == 4);
        assert(s.totalInventoryRecords == 7);
        assert(s.criticalCount == 2);
        assert(s.lowCount == 1);
        assert(s.excessCount == 1);
        assert(s.adequateCount == 3);
        assert(s.totalShortageUnits == 21.0);
        assert(s.totalSurplusUnits == 120.0);
        assert(s.redistributionPotential == 21.0);
        assert(s.bloodTypesTracked == 3);
        std::cout << "[PASS] Status listing and summary." << std::endl;

        // Administrative level changes
        auto updated = redistributor.setCurrentUnits(3, "A-", 60, "", "");
        assert(updated.currentUnits == 60);
        assert(updated.hospitalName == "Hospital C");
        bool threw = false;
        try { redistributor.setCurrentUnits(3, "A-", 101); } catch (const InvalidArgument&) { threw = true; }
        assert(threw);
        assert(UnitsAt(*repo, 3, "A-") == 60);
        auto fresh = redistributor.setCurrentUnits(11, "O+", 0, "New Clinic", "Dwarka");
        assert(fresh.minRequired == 10 && fresh.maxCapacity == 100);
        assert(fresh.region == "Dwarka");
    }

    persistence->flush();
    std::cout << "[PASS] Redistributor Test." << std::endl;
    return 0;
}
