#include "app/ID3App.hpp"
#include <iostream>
#include <string>
#include <exception>

void printUsage(const char* programName) {
    std::cout << "Usage: " << programName
              << " [dataPath] [testMethod] [truthLabel] [trainRatio] [maxDepth] [outputPath]\n\n";
    std::cout << "Test methods:\n";
    std::cout << "  boolean       - attribute value != 0 (default)\n";
    std::cout << "  mean          - attribute value > training mean\n";
    std::cout << "  median        - attribute value > training median\n";
    std::cout << "  threshold:<t> - attribute value > t\n\n";
    std::cout << "Examples:\n";
    std::cout << "  " << programName << " ../data/sample_dataset.csv boolean 1\n";
    std::cout << "  " << programName << " data.csv median 1 0.8 20 predictions.txt\n";
}

int main(int argc, char** argv) {
    ProgramOptions opts;

    try {
        if (argc >= 2) {
            std::string first = argv[1];
            if (first == "-h" || first == "--help") {
                printUsage(argv[0]);
                return 0;
            }
            opts.dataPath = first;
        }
        if (argc >= 3) opts.testMethod = argv[2];
        if (argc >= 4) opts.truthLabel = std::stoi(argv[3]);
        if (argc >= 5) opts.trainRatio = std::stod(argv[4]);
        if (argc >= 6) opts.maxDepth   = std::stoi(argv[5]);
        if (argc >= 7) opts.outputPath = argv[6];
        if (argc >= 8) {
            printUsage(argv[0]);
            return 1;
        }
    } catch (const std::exception& e) {
        std::cerr << "Invalid argument: " << e.what() << std::endl;
        printUsage(argv[0]);
        return 1;
    }

    try {
        runID3App(opts);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
