/**
 * @file main.cpp
 * @brief orca_prepare - index, split and extract features for the orca detector
 *
 * Pipeline:
 *   Phase 1: Index & split  (label = thư mục class, 70/20/10 theo từng label)
 *   Phase 2: Quantize       (segment 5s, bỏ segment cuối)
 *   Phase 3: Features       (log-mel 64 bands, 496 frames / example)
 *   Phase 4: Persist        (TRAIN/VALIDATE/TEST.features, label encoder)
 *
 * Usage:
 *   ./orca_prepare                          # Tạo features (bỏ qua nếu đã có)
 *   ./orca_prepare --overwrite              # Tạo lại features
 *   ./orca_prepare --encode --other Seal    # Fit + lưu label encoder
 *   ./orca_prepare --stats --path data      # Chỉ in thống kê
 */

#include "Common.h"
#include "DatasetIndex.hpp"
#include "Pipeline.hpp"

#include <cstdlib>
#include <exception>
#include <iostream>
#include <string>

using namespace orca;

void printUsage(const char* programName) {
    std::cout << "\n";
    std::cout << "╔══════════════════════════════════════════════════════════════╗\n";
    std::cout << "║     Orca Detector - Dataset Preparation                      ║\n";
    std::cout << "╚══════════════════════════════════════════════════════════════╝\n";
    std::cout << "\n";
    std::cout << "Usage: " << programName << " [options]\n";
    std::cout << "\n";
    std::cout << "Options:\n";
    std::cout << "  --help, -h         Show this help message\n";
    std::cout << "  --path <dir>       Audio dataset root (default: " << DEFAULT_DATA_PATH << ")\n";
    std::cout << "  --output <dir>     Output directory (default: " << DEFAULT_OUTPUT_PATH << ")\n";
    std::cout << "  --overwrite        Regenerate features, overwriting existing feature files\n";
    std::cout << "  --seed <n>         Shuffle seed (default: " << DEFAULT_SHUFFLE_SEED << ")\n";
    std::cout << "  --train <f>        Train fraction (default: " << TRAIN_PERCENTAGE << ")\n";
    std::cout << "  --validate <f>     Validate fraction (default: " << VALIDATE_PERCENTAGE << ")\n";
    std::cout << "  --remove <label>   Drop a class when loading (repeatable)\n";
    std::cout << "  --other <label>    Relabel a class as '" << OTHER_CLASS << "' when loading (repeatable)\n";
    std::cout << "  --stats            Index the dataset and show statistics only\n";
    std::cout << "  --encode           Fit and save the label encoder from saved features\n";
    std::cout << "\n";
    std::cout << "Input layout:\n";
    std::cout << "  <path>/<ClassFolder>/<YearOrSubfolder>/*.wav\n";
    std::cout << "\n";
}

/**
 * @brief Đọc giá trị số của option; throw ConfigurationError nếu sai định dạng
 */
double parseNumber(const std::string& option, const std::string& value) {
    size_t consumed = 0;
    double result = 0.0;
    try {
        result = std::stod(value, &consumed);
    } catch (const std::logic_error&) {
        consumed = 0;
    }
    if (consumed == 0 || consumed != value.size()) {
        throw ConfigurationError(option + " expects a number, got '" + value + "'");
    }
    return result;
}

/**
 * @brief Chỉ index và in thống kê
 */
int showStatistics(const PipelineConfig& config) {
    std::cout << "\n[Mode] Statistics Only\n";
    std::cout << "Path: " << config.dataPath << "\n\n";

    AudioIndexer indexer;
    indexer.index(config.dataPath);
    indexer.getStatistics().print();
    return 0;
}

int runPipeline(const PipelineConfig& config, bool encode) {
    DatasetBuilder builder(config);

    std::cout << "\n[Mode] Extract Features\n";
    std::cout << "Path:   " << config.dataPath << "\n";
    std::cout << "Output: " << config.outputPath << "\n\n";
    builder.run();

    if (encode) {
        std::cout << "\n[Mode] Label Encoding\n";
        LabelEncoder encoder = builder.buildLabelEncoding(DatasetBuilder::makeRunTimestamp());
        for (int i = 0; i < encoder.numClasses(); ++i) {
            std::cout << "  " << i << " -> " << encoder.inverseTransform(i) << "\n";
        }
    }
    return 0;
}

/**
 * @brief Main function
 */
int main(int argc, char* argv[]) {
    PipelineConfig config;
    bool showStats = false;
    bool encode = false;

    try {
        // Parse arguments
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            bool hasValue = i + 1 < argc;

            if (arg == "--help" || arg == "-h") {
                printUsage(argv[0]);
                return 0;
            }
            else if (arg == "--overwrite") {
                config.overwrite = true;
            }
            else if (arg == "--stats") {
                showStats = true;
            }
            else if (arg == "--encode") {
                encode = true;
            }
            else if (arg == "--path" && hasValue) {
                config.dataPath = argv[++i];
            }
            else if (arg == "--output" && hasValue) {
                config.outputPath = argv[++i];
            }
            else if (arg == "--seed" && hasValue) {
                config.seed = parseSeed(argv[++i]);
            }
            else if (arg == "--train" && hasValue) {
                config.trainFraction = parseNumber(arg, argv[++i]);
            }
            else if (arg == "--validate" && hasValue) {
                config.validateFraction = parseNumber(arg, argv[++i]);
            }
            else if (arg == "--remove" && hasValue) {
                config.removeClasses.insert(argv[++i]);
            }
            else if (arg == "--other" && hasValue) {
                config.otherClasses.insert(argv[++i]);
            }
            else {
                std::cerr << "Error: Unknown or incomplete option '" << arg << "'\n";
                printUsage(argv[0]);
                return 1;
            }
        }

        if (showStats) {
            return showStatistics(config);
        }
        return runPipeline(config, encode);
    }
    catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
