#include "infrastructure/logging/logger.hpp"
#include "infrastructure/system/command_error.hpp"
#include "report/result_serializer.hpp"
#include "scan/validation_orchestrator.hpp"

#include <iostream>
#include <string>

int main() {
    auto& logger = DQS::Logger::getInstance();

    logger.setLogLevel(DQS::LogLevel::DEBUG);
    logger.setCorrelationId(logger.generateCorrelationId());
    logger.addGlobalMetadata("example", "validation");

    const std::string ddl =
        "CREATE TABLE orders (\n"
        "    id BIGINT PRIMARY KEY,\n"
        "    customer VARCHAR(64) NOT NULL,\n"
        "    amount DECIMAL(10,2),\n"
        "    ratio DOUBLE PRECISION\n"
        ");";

    const std::string records = R"([
        {"id": 1, "customer": "acme", "amount": "12.50", "ratio": 0.5},
        {"id": "two", "customer": "", "amount": null, "ratio": "1e-3"},
        {"id": 3, "customer": "   ", "amount": true, "ratio": "n/a"}
    ])";

    DQS::Scan::ValidationOrchestrator orchestrator;

    try {
        auto empty = orchestrator.findEmptyValues(records);
        std::cout << DQS::Report::ResultSerializer::toTextReport(empty, true) << "\n";

        auto numeric = orchestrator.findInvalidNumericValues(records, ddl);
        std::cout << DQS::Report::ResultSerializer::toTextReport(numeric, true) << "\n";
        std::cout << DQS::Report::ResultSerializer::render(DQS::Report::ResultSerializer::toJson(numeric)) << "\n";

        // EN: Only the first statement counts, so this fails
        // FR: Seule la première déclaration compte, donc ceci échoue
        orchestrator.findInvalidNumericValues(records, "SELECT * FROM orders; " + ddl);
    } catch (const DQS::CommandError& e) {
        std::cout << DQS::Report::ResultSerializer::render(DQS::Report::ResultSerializer::errorToJson(e), -1) << "\n";
    }

    logger.flush();

    return 0;
}
