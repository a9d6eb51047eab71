#include "AcmConfig.h"
#include "AcmPipeline.h"
#include "AcMapExceptions.h"

#include <iostream>

int main(int argc, char* argv[]) {
    try {
        const AcmConfig config = AcmConfig::fromArgs(argc, argv);
        if (config.showHelp) {
            std::cout << AcmConfig::usage() << "\n";
            return 0;
        }
        AcmPipeline pipeline;
        return pipeline.run(config);
    } catch (const AcMap::AcMapException& e) {
        std::cerr << "[AcMap][Error] " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "[AcMap][Exception] " << e.what() << "\n";
        return 1;
    }
}
