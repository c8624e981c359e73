/**
 * @file Pipeline.cpp
 * @brief Implementation of DatasetBuilder
 *
 * @author Research Team
 * @date 2026
 */

#include "Pipeline.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <random>
#include <sstream>
#include <vector>

namespace orca {

DatasetBuilder::DatasetBuilder(const PipelineConfig& config)
    : m_config(config)
    , m_store(config.outputPath)
{
}

bool DatasetBuilder::featuresCached() const {
    for (DatasetType type : ALL_DATASET_TYPES) {
        if (!m_store.exists(type)) {
            return false;
        }
    }
    return true;
}

bool DatasetBuilder::run() {
    if (!m_config.overwrite && featuresCached()) {
        std::cout << "[DatasetBuilder] All feature files exist in " << m_config.outputPath
                  << ", skipping extraction (use --overwrite to regenerate)" << std::endl;
        return false;
    }

    auto startTime = std::chrono::high_resolution_clock::now();

    // ----- BƯỚC 1: Index -----
    SampleCollection allSamples = m_indexer.index(m_config.dataPath);
    m_indexer.getStatistics().print();

    // ----- BƯỚC 2: Stratified split -----
    std::mt19937 rng(m_config.seed);
    DatasetSplitter splitter(rng);
    DatasetSplits splits = splitter.split(allSamples, m_config.trainFraction,
                                          m_config.validateFraction);

    // ----- BƯỚC 3: Quantize, extract, save từng split -----
    SegmentQuantizer quantizer(m_config.segmentSeconds, m_config.maxSeconds);
    FeatureExtractor extractor;

    for (DatasetType type : ALL_DATASET_TYPES) {
        std::cout << "\n[DatasetBuilder] ===== " << datasetTypeName(type) << " =====" << std::endl;

        std::vector<SegmentRef> segments = quantizer.flattenAndQuantize(splits[type]);
        std::vector<LabeledExample> examples = extractor.extractBatch(segments);
        m_store.save(type, examples);
    }

    auto endTime = std::chrono::high_resolution_clock::now();
    auto duration = std::chrono::duration_cast<std::chrono::seconds>(endTime - startTime);

    std::cout << "\n[DatasetBuilder] Done extracting features! ("
              << duration.count() << " seconds)" << std::endl;
    return true;
}

LabelEncoder DatasetBuilder::buildLabelEncoding(const std::string& runTimestamp) const {
    std::vector<std::string> observed;
    for (DatasetType type : ALL_DATASET_TYPES) {
        LoadedFeatures loaded = m_store.load(type, m_config.removeClasses, m_config.otherClasses);
        observed.insert(observed.end(), loaded.labels.begin(), loaded.labels.end());
    }

    LabelEncoder encoder;
    encoder.fit(observed);
    std::cout << "[DatasetBuilder] Fitted label encoder on " << encoder.numClasses()
              << " classes from " << observed.size() << " examples" << std::endl;

    encoder.save(m_config.outputPath, runTimestamp);
    return encoder;
}

std::string DatasetBuilder::makeRunTimestamp() {
    std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm local{};
    localtime_r(&now, &local);

    std::ostringstream oss;
    oss << std::put_time(&local, "%Y%m%d-%H%M%S");
    return oss.str();
}

} // namespace orca
