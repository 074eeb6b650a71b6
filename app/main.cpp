#include <iostream>
#include <string>
#include <stdexcept>
#include <pt_api/framework.hpp>

namespace {
    void printUsage(const char* program) {
        std::cerr << "Usage: " << program << " <scene.json> [output.ppm] [threads]" << std::endl;
    }
}

int main(int argc, char** argv) {
    if (argc < 2 || argc > 4) {
        printUsage(argv[0]);
        return 2;
    }

    try {
        const std::string scenePath = argv[1];
        const std::string outputPath = argc >= 3 ? argv[2] : "";
        size_t threads = 0;
        if (argc == 4) {
            const long value = std::stol(argv[3]);
            if (value < 0)
                throw std::invalid_argument("thread count must be non-negative");
            threads = static_cast<size_t>(value);
        }

        pt_api::Framework framework;
        framework.Init(scenePath, threads);
        framework.Run(outputPath);
    } catch(const std::exception& e){
        std::cerr << "Exception: " << e.what() << std::endl;
        return -1;
    }

    return 0;
}
