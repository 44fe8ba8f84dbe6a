#include <exception>
#include <iostream>
#include <string>

#include "config/ConfigLoader.hpp"
#include "engine/ConfluenceEngine.hpp"
#include "market/CandleCsvReader.hpp"
#include "report/SnapshotJson.hpp"

using namespace Confluence;

static std::string symbol_from_path(const std::string& path) {
    const size_t slash = path.find_last_of("/\\");
    std::string name = slash == std::string::npos ? path : path.substr(slash + 1);
    const size_t dot = name.find_last_of('.');
    if (dot != std::string::npos && dot > 0)
        name = name.substr(0, dot);
    return name;
}

int main(int argc, char** argv) {
    if (argc < 3) {
        std::cerr << "usage: confluence_scan <config.json|-> <candles.csv> [symbol]\n";
        return 2;
    }

    const std::string config_path = argv[1];
    const std::string csv_path = argv[2];
    const std::string symbol = argc > 3 ? argv[3] : symbol_from_path(csv_path);

    try {
        const EngineConfig cfg = config_path == "-" ? EngineConfig()
                                                    : ConfigLoader::load_file(config_path);
        const CandleSeries series = CandleCsvReader::read_file(csv_path);

        const ConfluenceEngine engine(cfg);
        const SymbolAnalysis analysis = engine.analyze(symbol, series);

        std::cout << emit_snapshot(analysis, 2) << "\n";
    } catch (const std::exception& e) {
        std::cerr << "[SCAN] FATAL: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
