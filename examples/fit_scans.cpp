#include "zscan/config.hpp"
#include "zscan/zscan.hpp"
#include <glog/logging.h>
#include <iostream>
#include <string>
#include <vector>

int main(int argc, char* argv[]) {
    google::InitGoogleLogging(argv[0]);
    FLAGS_logtostderr = true;

    if (argc < 3) {
        std::cerr << "Usage: " << argv[0] << " <config.json> <scan.txt> [scan.txt ...]" << std::endl;
        return 1;
    }

    zscan::RunConfiguration config;
    try {
        config = zscan::loadRunConfiguration(argv[1]);
    } catch (const zscan::ConfigError& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    const std::vector<std::string> sources(argv + 2, argv + argc);
    LOG(INFO) << "Fitting " << sources.size() << " scans";

    zscan::BatchResult batch;
    try {
        batch = zscan::analysis::runBatch(sources, &zscan::analysis::loadFileText, config.constants, config.analysis);
    } catch (const zscan::InvalidConstantsError& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    LOG(INFO) << batch.results.size() << " fitted, " << batch.unreliableCount() << " unreliable, "
              << batch.errors.size() << " failed";

    const nlohmann::json output = batch;
    std::cout << output.dump(2) << std::endl;
    return 0;
}
