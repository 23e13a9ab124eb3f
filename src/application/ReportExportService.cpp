#include "application/ReportExportService.hpp"
#include <iomanip>
#include <nlohmann/json.hpp>
#include <sstream>

namespace hemoflow::application {

using json = nlohmann::json;
using namespace hemoflow::domain;

namespace {

json ForecastToJson(const DemandForecast& f) {
    return {
        {"blood_type", f.bloodType},
        {"region", f.region},
        {"forecast_date", FormatTimestamp(f.forecastDate)},
        {"predicted_demand", f.predictedDemand},
        {"confidence", f.confidence},
        {"current_inventory", f.currentInventory},
        {"shortage_risk", RiskToString(f.shortageRisk)},
        {"alert_sent", f.alertSent}
    };
}

json OpportunityToJson(const RedistributionOpportunity& op) {
    json j = {
        {"from_hospital_id", op.fromHospitalId},
        {"from_hospital_name", op.fromHospitalName},
        {"to_hospital_id", op.toHospitalId},
        {"to_hospital_name", op.toHospitalName},
        {"blood_type", op.bloodType},
        {"transfer_units", op.transferUnits},
        {"priority", op.priority},
        {"reason", op.reason},
        {"forecast_based", op.forecastBased}
    };
    if (op.forecastBased) {
        j["predicted_shortage_regions"] = op.predictedShortageRegions;
    }
    return j;
}

} // namespace

std::string ReportExportService::ToJson(const EngineReport& report) {
    json j;
    j["generated_at"] = FormatTimestamp(report.generatedAt);
    j["horizon_hours"] = report.horizonHours;
    j["risk_threshold"] = RiskToString(report.threshold);

    json forecasts = json::array();
    for (const auto& f : report.forecasts) {
        forecasts.push_back(ForecastToJson(f));
    }
    j["forecasts"] = forecasts;

    json riskDistribution = json::object();
    for (const auto& [level, count] : report.forecastSummary.riskCounts) {
        riskDistribution[RiskToString(level)] = count;
    }
    j["forecast_summary"] = {
        {"total_forecasts", report.forecastSummary.totalForecasts},
        {"risk_distribution", riskDistribution},
        {"regions_covered", report.forecastSummary.regionsCovered},
        {"blood_types_covered", report.forecastSummary.bloodTypesCovered}
    };

    json alerts = json::array();
    for (const auto& a : report.alerts) {
        alerts.push_back({
            {"type", a.alertType},
            {"blood_type", a.bloodType},
            {"region", a.region},
            {"predicted_demand", a.predictedDemand},
            {"shortage_risk", RiskToString(a.shortageRisk)},
            {"forecast_date", FormatTimestamp(a.forecastDate)},
            {"message", a.message},
            {"call_to_action", a.callToAction}
        });
    }
    j["alerts"] = alerts;

    json plan = json::array();
    for (const auto& op : report.plan) {
        plan.push_back(OpportunityToJson(op));
    }
    j["redistribution_plan"] = plan;

    json transfers = json::array();
    for (const auto& t : report.transfers) {
        transfers.push_back({
            {"from_hospital_id", t.fromHospitalId},
            {"to_hospital_id", t.toHospitalId},
            {"blood_type", t.bloodType},
            {"units_transferred", t.unitsTransferred},
            {"source_remaining", t.sourceRemaining},
            {"dest_new_level", t.destinationLevel}
        });
    }
    j["transfers"] = transfers;

    const auto& s = report.inventorySummary;
    j["inventory_summary"] = {
        {"total_hospitals", s.totalHospitals},
        {"total_inventory_records", s.totalInventoryRecords},
        {"critical_count", s.criticalCount},
        {"low_count", s.lowCount},
        {"adequate_count", s.adequateCount},
        {"excess_count", s.excessCount},
        {"total_shortage_units", s.totalShortageUnits},
        {"total_surplus_units", s.totalSurplusUnits},
        {"redistribution_potential", s.redistributionPotential},
        {"blood_types_tracked", s.bloodTypesTracked}
    };

    return j.dump(2);
}

std::string ReportExportService::ToText(const EngineReport& report, size_t maxProposals) {
    std::stringstream ss;
    ss << "HemoFlow report, " << FormatTimestamp(report.generatedAt) << " UTC\n";
    ss << "Forecasts: " << report.forecastSummary.totalForecasts << " cells, "
       << report.horizonHours << "h ahead\n";
    for (RiskLevel level : {RiskLevel::Critical, RiskLevel::High, RiskLevel::Medium, RiskLevel::Low}) {
        ss << "  " << std::left << std::setw(9) << RiskToString(level)
           << report.forecastSummary.countFor(level) << "\n";
    }
    ss << "Alerts: " << report.alerts.size() << "\n";

    const auto& s = report.inventorySummary;
    ss << "Inventory: " << s.totalInventoryRecords << " cells at " << s.totalHospitals << " hospitals ("
       << s.criticalCount << " critical, " << s.lowCount << " low, "
       << s.adequateCount << " adequate, " << s.excessCount << " excess)\n";
    ss << "Shortage " << s.totalShortageUnits << " units, surplus " << s.totalSurplusUnits
       << " units, potential " << s.redistributionPotential << "\n";

    ss << "Plan (" << RiskToString(report.threshold) << "+): " << report.plan.size() << " proposals\n";
    for (size_t i = 0; i < report.plan.size() && i < maxProposals; ++i) {
        const auto& op = report.plan[i];
        ss << "  [" << std::fixed << std::setprecision(1) << op.priority << "] "
           << op.transferUnits << " x " << op.bloodType << " " << op.fromHospitalName
           << " -> " << op.toHospitalName << "\n";
    }
    if (report.plan.size() > maxProposals) {
        ss << "  ... " << (report.plan.size() - maxProposals) << " more\n";
    }

    for (const auto& t : report.transfers) {
        ss << "Executed: " << t.unitsTransferred << " x " << t.bloodType << " hospital "
           << t.fromHospitalId << " (" << t.sourceRemaining << " left) -> hospital "
           << t.toHospitalId << " (now " << t.destinationLevel << ")\n";
    }
    return ss.str();
}

} // namespace hemoflow::application
