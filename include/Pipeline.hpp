/**
 * @file Pipeline.hpp
 * @brief End-to-end dataset preparation
 *
 * Write path (một lần, trừ khi đã có cache):
 *   AudioIndexer -> DatasetSplitter -> SegmentQuantizer
 *       -> FeatureExtractor -> FeatureStore (TRAIN, VALIDATE, TEST)
 *
 * Label encoding (chạy độc lập sau đó):
 *   FeatureStore::load (remove / Other) -> LabelEncoder::fit -> save
 *
 * @author Research Team
 * @date 2026
 */

#ifndef PIPELINE_HPP
#define PIPELINE_HPP

#include "Common.h"
#include "DatasetIndex.hpp"
#include "FeatureExtraction.h"
#include "FeatureStore.hpp"
#include "LabelEncoder.hpp"

#include <cstdint>
#include <set>
#include <string>

namespace orca {

/**
 * @struct PipelineConfig
 * @brief Thiết lập cho một lần chạy
 */
struct PipelineConfig {
    std::string dataPath = DEFAULT_DATA_PATH;           ///< Thư mục audio gốc
    std::string outputPath = DEFAULT_OUTPUT_PATH;       ///< Thư mục chứa *.features và encoder
    double trainFraction = TRAIN_PERCENTAGE;
    double validateFraction = VALIDATE_PERCENTAGE;
    double segmentSeconds = FILE_SAMPLING_SIZE_SECONDS;
    double maxSeconds = FILE_MAX_SIZE_SECONDS;
    uint32_t seed = DEFAULT_SHUFFLE_SEED;
    bool overwrite = false;                             ///< Bỏ qua cache
    std::set<std::string> removeClasses;                ///< Bị loại khi load
    std::set<std::string> otherClasses;                 ///< Đổi thành OTHER_CLASS khi load
};

/**
 * @class DatasetBuilder
 * @brief Điều phối toàn bộ pipeline chuẩn bị dữ liệu
 */
class DatasetBuilder {
public:
    explicit DatasetBuilder(const PipelineConfig& config);

    /**
     * @brief true nếu cả ba file <SPLIT>.features đã tồn tại
     */
    bool featuresCached() const;

    /**
     * @brief Chạy write path
     *
     * @return false nếu bỏ qua vì cache (và overwrite == false)
     */
    bool run();

    /**
     * @brief Load ba split, fit encoder trên các label quan sát được và lưu
     */
    LabelEncoder buildLabelEncoding(const std::string& runTimestamp) const;

    /**
     * @brief Timestamp dạng YYYYmmdd-HHMMSS (giờ địa phương)
     */
    static std::string makeRunTimestamp();

    const PipelineConfig& getConfig() const { return m_config; }
    const FeatureStore& getStore() const { return m_store; }
    const IndexStatistics& getIndexStatistics() const { return m_indexer.getStatistics(); }

private:
    PipelineConfig m_config;
    AudioIndexer m_indexer;
    FeatureStore m_store;
};

} // namespace orca

#endif // PIPELINE_HPP
