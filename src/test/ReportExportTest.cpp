#include <cassert>
#include <chrono>
#include <iostream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "application/ReportExportService.hpp"
#include "domain/Calendar.hpp"

using json = nlohmann::json;
using namespace hemoflow::domain;
using namespace hemoflow::application;

int main() {
    std::cout << "[Test] Starting ReportExport Test..." << std::endl;

    EngineReport report;
    report.generatedAt = FromCalendarDate(2026, 10, 20) + std::chrono::hours(8);
    report.horizonHours = 48;
    report.threshold = RiskLevel::High;

    DemandForecast forecast;
    forecast.bloodType = "O-";
    forecast.region = "Noida";
    forecast.forecastDate = report.generatedAt + std::chrono::hours(48);
    forecast.predictedDemand = 12.5;
    forecast.confidence = 0.8;
    forecast.currentInventory = 4;
    forecast.shortageRisk = RiskLevel::Critical;
    forecast.alertSent = true;
    report.forecasts.push_back(forecast);

    report.forecastSummary.totalForecasts = 1;
    report.forecastSummary.riskCounts[RiskLevel::Critical] = 1;
    report.forecastSummary.regionsCovered.insert("Noida");
    report.forecastSummary.bloodTypesCovered.insert("O-");

    ShortageAlert alert;
    alert.bloodType = "O-";
    alert.region = "Noida";
    alert.predictedDemand = 12.5;
    alert.shortageRisk = RiskLevel::Critical;
    alert.forecastDate = forecast.forecastDate;
    alert.message = "Critical risk of O- shortage in Noida";
    alert.callToAction = "Please donate";
    report.alerts.push_back(alert);

    RedistributionOpportunity planned;
    planned.fromHospitalId = 2;
    planned.fromHospitalName = "Max Hospital";
    planned.toHospitalId = 1;
    planned.toHospitalName = "Apollo Hospital";
    planned.bloodType = "O-";
    planned.transferUnits = 6;
    planned.priority = 140.0;
    planned.reason = "shortage";
    planned.forecastBased = true;
    planned.predictedShortageRegions = {"Noida", "Dwarka"};
    report.plan.push_back(planned);

    RedistributionOpportunity manual = planned;
    manual.forecastBased = false;
    manual.predictedShortageRegions.clear();
    manual.priority = 60.0;
    report.plan.push_back(manual);

    TransferResult transfer;
    transfer.fromHospitalId = 2;
    transfer.toHospitalId = 1;
    transfer.bloodType = "O-";
    transfer.unitsTransferred = 6;
    transfer.sourceRemaining = 30;
    transfer.destinationLevel = 10;
    report.transfers.push_back(transfer);

    report.inventorySummary.totalHospitals = 2;
    report.inventorySummary.totalInventoryRecords = 2;
    report.inventorySummary.criticalCount = 1;

    const json j = json::parse(ReportExportService::ToJson(report));
    for (const char* key : {"generated_at", "horizon_hours", "risk_threshold", "forecasts", "forecast_summary",
                            "alerts", "redistribution_plan", "transfers", "inventory_summary"}) {
        assert(j.contains(key));
    }
    assert(j["generated_at"].get<std::string>().rfind("2026-10-20 08:00", 0) == 0);
    assert(j["horizon_hours"] == 48);
    assert(j["risk_threshold"] == "High");

    const json& f = j["forecasts"][0];
    assert(f["blood_type"] == "O-");
    assert(f["shortage_risk"] == "Critical");
    assert(f["current_inventory"] == 4);
    assert(f["alert_sent"] == true);
    assert(j["forecast_summary"]["total_forecasts"] == 1);
    assert(j["forecast_summary"]["risk_distribution"]["Critical"] == 1);
    assert(j["alerts"][0]["type"] == "blood_shortage_prediction");
    assert(j["alerts"][0]["call_to_action"] == "Please donate");
    std::cout << "[PASS] Forecasts, summary and alerts serialized." << std::endl;

    const json& plan = j["redistribution_plan"];
    assert(plan.size() == 2);
    assert(plan[0]["forecast_based"] == true);
    assert(plan[0]["predicted_shortage_regions"] == json::array({"Noida", "Dwarka"}));
    assert(plan[0]["transfer_units"] == 6);
    assert(plan[0]["priority"] == 140.0);
    assert(plan[1]["forecast_based"] == false);
    assert(!plan[1].contains("predicted_shortage_regions"));
    std::cout << "[PASS] Shortage regions emitted only for forecast-based proposals." << std::endl;

    assert(j["transfers"][0]["units_transferred"] == 6);
    assert(j["transfers"][0]["dest_new_level"] == 10);
    assert(j["inventory_summary"]["total_hospitals"] == 2);
    assert(j["inventory_summary"]["critical_count"] == 1);

    const std::string text = ReportExportService::ToText(report, 1);
    assert(text.find("Plan (High+): 2 proposals") != std::string::npos);
    assert(text.find("[140.0] 6 x O- Max Hospital -> Apollo Hospital") != std::string::npos);
    assert(text.find("[60.0]") == std::string::npos);
    assert(text.find("... 1 more") != std::string::npos);
    std::cout << "[PASS] Text overview lists the plan in order and elides the rest." << std::endl;

    std::cout << "[PASS] ReportExport Test." << std::endl;
    return 0;
}
