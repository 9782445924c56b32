#include "fingrid/FinGrid.hpp"
#include <iostream>

using fingrid::core::CellValue;

namespace {

bool check(const fingrid::core::VoidResult& result, const char* step) {
    if (!result) {
        FINGRID_LOG_ERROR("{} failed: {}", step, result.error().fullMessage());
        return false;
    }
    return true;
}

void printValue(fingrid::api::GridApi& api, const std::string& address) {
    auto value = api.readValue(address);
    if (value) {
        std::cout << address << " = " << value->toDisplayString() << std::endl;
    } else {
        std::cout << address << " : " << value.error().fullMessage() << std::endl;
    }
}

} // namespace

int main() {
    // 初始化FinGrid库
    if (!fingrid::initialize("logs/model_demo.log", true)) {
        std::cerr << "Failed to initialize FinGrid library" << std::endl;
        return 1;
    }

    FINGRID_LOG_INFO("FinGrid model demo started, version {}", fingrid::getVersion());

    try {
        auto workbook = fingrid::createWorkbook();
        fingrid::api::GridApi api(*workbook);

        // 输入表
        if (!check(workbook->renameSheet(workbook->getActiveSheetId(), "Inputs"), "rename")) {
            return 1;
        }
        bool ok = check(api.write("A1", CellValue("Pre-money")), "write") &&
                  check(api.write("B1", CellValue(8000000.0)), "write") &&
                  check(api.write("A2", CellValue("Investment")), "write") &&
                  check(api.write("B2", CellValue(2000000.0)), "write") &&
                  check(api.write("A3", CellValue("Exit value")), "write") &&
                  check(api.write("B3", CellValue(60000000.0)), "write") &&
                  check(api.defineName("ExitValue", "B3"), "define name");

        // 股权与回报
        auto cap_table = workbook->createSheet("Cap Table");
        if (!cap_table) {
            FINGRID_LOG_ERROR("Failed to create sheet: {}", cap_table.error().fullMessage());
            return 1;
        }
        ok = ok &&
             check(api.setFormula("'Cap Table'!B1", "=Inputs!B1+Inputs!B2"), "post-money") &&
             check(api.setFormula("'Cap Table'!B2", "=Inputs!B2/B1"), "ownership") &&
             check(api.setFormula("'Cap Table'!B3", "=MAX(LIQUIDPREF(Inputs!B2, 1), B2*ExitValue)"), "proceeds") &&
             check(api.setFormula("'Cap Table'!B4", "=MOIC(B3, Inputs!B2)"), "moic") &&
             check(api.setFormula("'Cap Table'!B5", "=CAGR(Inputs!B2, B3, 5)"), "cagr");
        if (!ok) {
            return 1;
        }

        std::cout << "== Base case ==" << std::endl;
        for (const char* address : {"'Cap Table'!B1", "'Cap Table'!B2", "'Cap Table'!B3",
                                    "'Cap Table'!B4", "'Cap Table'!B5"}) {
            printValue(api, address);
        }

        // 下行情景：退出估值降低后优先清算权生效
        if (!check(api.write("Inputs!B3", CellValue(6000000.0)), "downside")) {
            return 1;
        }
        std::cout << "== Downside ==" << std::endl;
        printValue(api, "'Cap Table'!B3");
        printValue(api, "'Cap Table'!B4");

        if (workbook->undo()) {
            std::cout << "== After undo ==" << std::endl;
            printValue(api, "'Cap Table'!B4");
        }

        std::cout << "Ad-hoc NPV: "
                  << api.evaluate("=NPV(0.1, 300000, 600000, 900000)").toDisplayString() << std::endl;

        // 导出
        auto csv = api.exportCsv("Cap Table");
        if (csv) {
            std::cout << "== Cap Table CSV ==" << std::endl << csv.value() << std::endl;
        }
        auto saved = fingrid::xml::StateSerializer::saveToFile(api.exportState(), "model_demo.xml");
        if (!check(saved, "save state")) {
            return 1;
        }
        FINGRID_LOG_INFO("Saved model state to model_demo.xml");

    } catch (const std::exception& e) {
        FINGRID_LOG_ERROR("Exception occurred: {}", e.what());
        fingrid::cleanup();
        return 1;
    }

    FINGRID_LOG_INFO("FinGrid model demo finished");
    fingrid::cleanup();
    return 0;
}
