/**
 * @file test_pipeline.cpp
 * @brief Unit tests for the dataset preparation pipeline
 *
 * Kiểm tra các chức năng của:
 * - AudioIndexer / DatasetSplitter / SegmentQuantizer
 * - SignalProcessor (downmix, resample)
 * - MelSpectrogram / frameRows / FeatureExtractor
 * - FeatureStore / LabelEncoder / DatasetBuilder
 *
 * File WAV test được tạo tại chỗ bằng dr_wav writer trong thư mục tạm.
 */

#include "BinaryIO.hpp"
#include "Common.h"
#include "DatasetIndex.hpp"
#include "FeatureExtraction.h"
#include "FeatureStore.hpp"
#include "LabelEncoder.hpp"
#include "MelSpectrogram.h"
#include "Pipeline.hpp"
#include "SignalPrep.hpp"

#include "dr_wav.h"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <random>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using namespace orca;

// ============================================================================
// TEST HELPER FUNCTIONS
// ============================================================================

/**
 * @brief Tạo thư mục tạm rỗng cho một test
 */
fs::path makeTempDir(const std::string& name) {
    fs::path dir = fs::temp_directory_path() / ("orca_test_" + name);
    fs::remove_all(dir);
    fs::create_directories(dir);
    return dir;
}

/**
 * @brief Ghi file WAV 16-bit PCM chứa sine wave (giống nhau trên mọi kênh)
 */
bool writeSineWav(const fs::path& path, uint32_t sampleRate, uint16_t channels,
                  double durationSeconds, float frequency = 440.0f, float amplitude = 0.5f) {
    fs::create_directories(path.parent_path());

    const uint64_t numFrames = static_cast<uint64_t>(durationSeconds * sampleRate);
    std::vector<int16_t> samples(static_cast<size_t>(numFrames) * channels);
    for (uint64_t i = 0; i < numFrames; ++i) {
        float t = static_cast<float>(i) / sampleRate;
        int16_t value = static_cast<int16_t>(amplitude * 32767.0f *
                                             std::sin(2.0f * static_cast<float>(M_PI) * frequency * t));
        for (uint16_t ch = 0; ch < channels; ++ch) {
            samples[static_cast<size_t>(i) * channels + ch] = value;
        }
    }

    drwav_data_format format;
    format.container = drwav_container_riff;
    format.format = DR_WAVE_FORMAT_PCM;
    format.channels = channels;
    format.sampleRate = sampleRate;
    format.bitsPerSample = 16;

    drwav wav;
    if (!drwav_init_file_write(&wav, path.string().c_str(), &format, nullptr)) {
        std::cerr << "  Cannot create " << path << std::endl;
        return false;
    }
    drwav_uint64 written = drwav_write_pcm_frames(&wav, numFrames, samples.data());
    drwav_uninit(&wav);

    return written == numFrames;
}

/**
 * @brief Tạo file rỗng (chỉ dùng khi test indexing)
 */
void touch(const fs::path& path) {
    fs::create_directories(path.parent_path());
    std::ofstream ofs(path);
}

/**
 * @brief Tạo SampleCollection giả: label -> n đường dẫn
 */
std::vector<std::string> fakeFiles(const std::string& label, size_t n) {
    std::vector<std::string> files;
    for (size_t i = 0; i < n; ++i) {
        files.push_back("/data/" + label + "/2000/" + std::to_string(i) + ".wav");
    }
    return files;
}

/**
 * @brief Tính giá trị tuyệt đối tối đa trong vector
 */
float findMaxAbsValue(const std::vector<float>& samples) {
    float maxVal = 0.0f;
    for (float s : samples) {
        maxVal = std::max(maxVal, std::abs(s));
    }
    return maxVal;
}

/**
 * @brief Example nhỏ có giá trị phân biệt được
 */
FeatureExample makeExample(int frames, int bands, float seed) {
    FeatureExample example;
    example.allocate(frames, bands, 1);
    for (int t = 0; t < frames; ++t) {
        for (int b = 0; b < bands; ++b) {
            example.set(t, b, seed + 0.25f * t - 0.5f * b);
        }
    }
    return example;
}

int argmax(const std::vector<float>& row) {
    return static_cast<int>(std::max_element(row.begin(), row.end()) - row.begin());
}

/**
 * @brief Extractor throw cho segment có label "Throw", còn lại như bình thường
 */
class ThrowingExtractor : public FeatureExtractor {
public:
    bool extract(const SegmentRef& segment, FeatureExample& example) const override {
        if (segment.label == "Throw") {
            throw std::runtime_error("decoder failure");
        }
        return FeatureExtractor::extract(segment, example);
    }
};

// ============================================================================
// DATASET INDEX TESTS
// ============================================================================

/**
 * Test 1: Sanitize label và nhận dạng file audio
 */
bool testSanitizeLabel() {
    std::cout << "\n[TEST] Sanitize Label..." << std::endl;

    bool labelsCorrect =
        AudioIndexer::sanitizeLabel("Killer Whale") == "KillerWhale" &&
        AudioIndexer::sanitizeLabel("Sperm_Whale-2 (old)") == "SpermWhale2old" &&
        AudioIndexer::sanitizeLabel("__") == "";

    bool extensionsCorrect =
        AudioIndexer::isAudioFile("/data/a/b/x.wav") &&
        AudioIndexer::isAudioFile("/data/a/b/X.WAV") &&
        !AudioIndexer::isAudioFile("/data/a/b/x.mp3") &&
        !AudioIndexer::isAudioFile("/data/a/b/wav");

    std::cout << "  Labels: " << (labelsCorrect ? "PASS" : "FAIL") << std::endl;
    std::cout << "  Extensions: " << (extensionsCorrect ? "PASS" : "FAIL") << std::endl;

    return labelsCorrect && extensionsCorrect;
}

/**
 * Test 2: Label = thư mục class (ông của file)
 */
bool testIndexLayout() {
    std::cout << "\n[TEST] Index Layout..." << std::endl;

    fs::path root = makeTempDir("index");
    touch(root / "Killer Whale" / "1975" / "a.wav");
    touch(root / "Killer Whale" / "1975" / "b.wav");
    touch(root / "Killer Whale" / "1980" / "c.wav");
    touch(root / "Seal" / "2001" / "d.wav");
    touch(root / "Seal" / "2001" / "notes.txt");
    fs::create_directories(root / "Empty" / "2000");

    AudioIndexer indexer;
    SampleCollection samples = indexer.index(root.string());

    std::cout << "  Labels: " << samples.size() << " (expected: 2)" << std::endl;

    bool labelsCorrect = samples.size() == 2 &&
                         samples.count("KillerWhale") == 1 &&
                         samples.count("Seal") == 1;
    bool countsCorrect = labelsCorrect &&
                         samples["KillerWhale"].size() == 3 &&
                         samples["Seal"].size() == 1;

    const IndexStatistics& stats = indexer.getStatistics();
    bool statsCorrect = stats.totalFiles == 4 && stats.filesPerLabel.size() == 2;
    stats.print();

    // Đường dẫn không tồn tại -> rỗng, không lỗi
    bool missingEmpty = indexer.index((root / "does_not_exist").string()).empty();

    fs::remove_all(root);

    bool allPassed = labelsCorrect && countsCorrect && statsCorrect && missingEmpty;
    std::cout << "  Index layout: " << (allPassed ? "PASS" : "FAIL") << std::endl;
    return allPassed;
}

/**
 * Test 3: Thư mục không đọc được không làm dừng việc duyệt các nhánh khác
 */
bool testIndexSkipsUnreadable() {
    std::cout << "\n[TEST] Index Skips Unreadable..." << std::endl;

    fs::path root = makeTempDir("unreadable");
    touch(root / "Alpha" / "2000" / "a.wav");
    touch(root / "Locked" / "2000" / "b.wav");
    touch(root / "Zulu" / "2000" / "c.wav");
    fs::permissions(root / "Locked", fs::perms::none);

    AudioIndexer indexer;
    SampleCollection samples = indexer.index(root.string());

    // Chạy với quyền root thì "Locked" vẫn đọc được, nên chỉ kiểm tra các nhánh còn lại
    bool othersIndexed = samples.count("Alpha") == 1 && samples["Alpha"].size() == 1 &&
                         samples.count("Zulu") == 1 && samples["Zulu"].size() == 1;
    bool statsCorrect = indexer.getStatistics().totalFiles >= 2;

    fs::permissions(root / "Locked", fs::perms::owner_all);
    fs::remove_all(root);

    std::cout << "  Labels: " << samples.size() << " (expected: >= 2)" << std::endl;
    bool allPassed = othersIndexed && statsCorrect;
    std::cout << "  Unreadable subtree: " << (allPassed ? "PASS" : "FAIL") << std::endl;
    return allPassed;
}

/**
 * Test 4: Split theo từng label - disjoint, đủ, đúng số lượng
 */
bool testSplitPartition() {
    std::cout << "\n[TEST] Split Partition..." << std::endl;

    SampleCollection samples;
    samples["A"] = fakeFiles("A", 10);
    samples["B"] = fakeFiles("B", 25);
    samples["C"] = fakeFiles("C", 9);
    const SampleCollection original = samples;

    std::mt19937 rng(DEFAULT_SHUFFLE_SEED);
    DatasetSplitter splitter(rng);
    DatasetSplits splits = splitter.split(samples);

    SampleCollection& train = splits[DatasetType::TRAIN];
    SampleCollection& validate = splits[DatasetType::VALIDATE];
    SampleCollection& test = splits[DatasetType::TEST];

    // n = 10 -> floor(11 * 0.7) = 7, floor(11 * 0.2) = 2, còn lại 1
    bool countsA = train["A"].size() == 7 && validate["A"].size() == 2 && test["A"].size() == 1;
    // n = 25 -> floor(26 * 0.7) = 18, floor(26 * 0.2) = 5, còn lại 2
    bool countsB = train["B"].size() == 18 && validate["B"].size() == 5 && test["B"].size() == 2;

    std::cout << "  A: " << train["A"].size() << "/" << validate["A"].size() << "/"
              << test["A"].size() << " (expected: 7/2/1)" << std::endl;
    std::cout << "  B: " << train["B"].size() << "/" << validate["B"].size() << "/"
              << test["B"].size() << " (expected: 18/5/2)" << std::endl;

    bool partitionCorrect = true;
    for (const std::string label : {"A", "B"}) {
        std::set<std::string> seen;
        size_t total = 0;
        for (DatasetType type : ALL_DATASET_TYPES) {
            for (const auto& f : splits[type][label]) {
                seen.insert(f);
                total++;
            }
        }
        std::set<std::string> expected(original.at(label).begin(), original.at(label).end());
        // Không trùng lặp (seen.size() == total) và hợp đúng bằng tập gốc
        if (seen.size() != total || seen != expected) {
            partitionCorrect = false;
        }
    }

    bool sparseExcluded = train.count("C") == 0 && validate.count("C") == 0 && test.count("C") == 0;

    std::cout << "  Partition: " << (partitionCorrect ? "PASS" : "FAIL") << std::endl;
    std::cout << "  Sparse label excluded: " << (sparseExcluded ? "PASS" : "FAIL") << std::endl;

    return countsA && countsB && partitionCorrect && sparseExcluded;
}

/**
 * Test 5: Cùng seed -> cùng kết quả; tỷ lệ sai -> ConfigurationError
 */
bool testSplitDeterministic() {
    std::cout << "\n[TEST] Split Deterministic..." << std::endl;

    SampleCollection first;
    first["KillerWhale"] = fakeFiles("KillerWhale", 30);
    SampleCollection second = first;

    std::mt19937 rng1(DEFAULT_SHUFFLE_SEED);
    std::mt19937 rng2(DEFAULT_SHUFFLE_SEED);
    DatasetSplits a = DatasetSplitter(rng1).split(first);
    DatasetSplits b = DatasetSplitter(rng2).split(second);

    bool identical = a == b;

    bool rejected = false;
    try {
        std::mt19937 rng3(1);
        DatasetSplitter(rng3).split(first, 0.8, 0.5);
    } catch (const ConfigurationError&) {
        rejected = true;
    }

    std::cout << "  Identical: " << (identical ? "PASS" : "FAIL") << std::endl;
    std::cout << "  Invalid fractions rejected: " << (rejected ? "PASS" : "FAIL") << std::endl;
    return identical && rejected;
}

/**
 * Test 6: --seed chỉ nhận số nguyên không dấu 32-bit
 */
bool testParseSeed() {
    std::cout << "\n[TEST] Parse Seed..." << std::endl;

    bool validCorrect = parseSeed("251") == 251u &&
                        parseSeed("0") == 0u &&
                        parseSeed("4294967295") == 4294967295u;

    int rejected = 0;
    const std::vector<std::string> invalid = {
        "4294967296", "5000000000", "99999999999999999999999", "1.5", "-3", "+7", "abc", "12x", ""
    };
    for (const auto& value : invalid) {
        try {
            parseSeed(value);
            std::cout << "  Accepted invalid seed '" << value << "'" << std::endl;
        } catch (const ConfigurationError&) {
            rejected++;
        }
    }
    bool invalidCorrect = rejected == static_cast<int>(invalid.size());

    std::cout << "  Valid seeds: " << (validCorrect ? "PASS" : "FAIL") << std::endl;
    std::cout << "  Invalid seeds rejected: " << rejected << "/" << invalid.size() << std::endl;
    return validCorrect && invalidCorrect;
}

/**
 * Test 7: Quantize - luôn bỏ segment cuối theo vị trí
 */
bool testQuantizeCounts() {
    std::cout << "\n[TEST] Quantize Counts..." << std::endl;

    SegmentQuantizer quantizer(5.0, 60.0);
    AudioInfo info;
    info.sampleRate = 16000;
    info.channels = 1;

    // 20s -> offsets 0,5,10,15 -> bỏ 15 -> 3
    info.totalFrames = 20 * 16000;
    size_t exact = quantizer.quantize("A", "a.wav", info).size();

    // Đúng 5s -> không đủ một segment
    info.totalFrames = 5 * 16000;
    size_t single = quantizer.quantize("A", "a.wav", info).size();

    // 12s -> offsets 0,5,10 -> bỏ 10 -> 2
    info.totalFrames = 12 * 16000;
    std::vector<SegmentRef> partial = quantizer.quantize("A", "a.wav", info);

    // 120s: maxSeconds không lọc file dài
    info.totalFrames = 120 * 16000;
    size_t longFile = quantizer.quantize("A", "a.wav", info).size();

    bool boundsCorrect = true;
    for (const auto& seg : partial) {
        if (seg.frameCount != 80000 || seg.startFrame + seg.frameCount > 12 * 16000) {
            boundsCorrect = false;
        }
    }

    std::cout << "  20s: " << exact << " (expected: 3)" << std::endl;
    std::cout << "  5s: " << single << " (expected: 0)" << std::endl;
    std::cout << "  12s: " << partial.size() << " (expected: 2)" << std::endl;
    std::cout << "  120s: " << longFile << " (expected: 23)" << std::endl;

    return exact == 3 && single == 0 && partial.size() == 2 && boundsCorrect && longFile == 23;
}

/**
 * Test 8: Quantize từ file WAV thật (chỉ đọc header)
 */
bool testQuantizeFromFile() {
    std::cout << "\n[TEST] Quantize From File..." << std::endl;

    fs::path dir = makeTempDir("quantize");
    fs::path longWav = dir / "long.wav";
    fs::path shortWav = dir / "short.wav";
    bool written = writeSineWav(longWav, 16000, 1, 15.0) &&
                   writeSineWav(shortWav, 16000, 1, 3.0);

    SegmentQuantizer quantizer;
    std::vector<LabeledFile> files;
    files.emplace_back("KillerWhale", longWav.string());
    files.emplace_back("KillerWhale", shortWav.string());
    files.emplace_back("KillerWhale", (dir / "missing.wav").string());

    std::vector<SegmentRef> segments = quantizer.quantizeAll(files);

    bool correct = segments.size() == 2 &&
                   segments[0].startFrame == 0 && segments[1].startFrame == 80000 &&
                   segments[0].source == longWav.string() &&
                   segments[1].label == "KillerWhale";

    std::cout << "  Segments: " << segments.size() << " (expected: 2)" << std::endl;

    SampleCollection split;
    split["KillerWhale"] = {longWav.string(), shortWav.string()};
    bool flattened = quantizer.flattenAndQuantize(split).size() == 2;

    fs::remove_all(dir);

    bool allPassed = written && correct && flattened;
    std::cout << "  Quantize from file: " << (allPassed ? "PASS" : "FAIL") << std::endl;
    return allPassed;
}

// ============================================================================
// SIGNAL PROCESSOR TESTS
// ============================================================================

/**
 * Test 9: Downmix mono và resample
 */
bool testMonoAndResample() {
    std::cout << "\n[TEST] Mono Downmix & Resample..." << std::endl;

    SignalProcessor processor;

    std::vector<float> stereo = {1.0f, 3.0f, 2.0f, 4.0f, -1.0f, 1.0f};
    std::vector<float> mono;
    processor.convertToMono(stereo, mono, 2);
    bool monoCorrect = mono.size() == 3 && mono[0] == 2.0f && mono[1] == 3.0f && mono[2] == 0.0f;

    std::vector<float> input(8000, 0.5f);
    std::vector<float> upsampled;
    processor.resample(input, 8000, upsampled, 16000);
    bool lengthCorrect = upsampled.size() == 16000;
    bool valuesCorrect = std::abs(findMaxAbsValue(upsampled) - 0.5f) < 1e-5f;

    std::vector<float> same;
    processor.resample(input, 16000, same, 16000);
    bool identity = same == input;

    std::cout << "  Mono: " << (monoCorrect ? "PASS" : "FAIL") << std::endl;
    std::cout << "  Upsampled: " << upsampled.size() << " (expected: 16000)" << std::endl;

    return monoCorrect && lengthCorrect && valuesCorrect && identity;
}

// ============================================================================
// FEATURE TESTS
// ============================================================================

/**
 * Test 10: Số frame của log-mel và framing
 */
bool testSpectrogramFraming() {
    std::cout << "\n[TEST] Spectrogram & Framing..." << std::endl;

    MelSpectrogram mel;
    std::vector<float> oneSecond(16000);
    for (size_t i = 0; i < oneSecond.size(); ++i) {
        oneSecond[i] = 0.5f * std::sin(2.0f * static_cast<float>(M_PI) * 1000.0f * i / 16000.0f);
    }

    FeatureMatrix logMel;
    mel.compute(oneSecond, logMel);
    // 1 + (16000 - 400) / 160 = 98
    bool framesCorrect = logMel.size() == 98 && logMel[0].size() == 64;
    bool fftCorrect = mel.getWindowLength() == 400 && mel.getHopLength() == 160 &&
                      mel.getFftLength() == 512;

    bool dcZero = true;
    for (float w : mel.getMelMatrix()[0]) {
        if (w != 0.0f) dcZero = false;
    }

    bool finite = true;
    for (const auto& row : logMel) {
        for (float v : row) {
            if (!std::isfinite(v)) finite = false;
        }
    }

    FeatureMatrix tooShort;
    mel.compute(std::vector<float>(399, 0.1f), tooShort);

    FeatureMatrix matrix(10, std::vector<float>(2, 1.0f));
    bool windowsCorrect = frameRows(matrix, 4, 3).size() == 3 &&
                          frameRows(matrix, 10, 10).size() == 1 &&
                          frameRows(matrix, 11, 1).empty() &&
                          frameRows(matrix, 4, 3)[2].size() == 4;

    bool rejected = false;
    try {
        frameRows(matrix, 0, 1);
    } catch (const ConfigurationError&) {
        rejected = true;
    }

    std::cout << "  Frames: " << logMel.size() << " (expected: 98)" << std::endl;
    std::cout << "  Framing: " << (windowsCorrect ? "PASS" : "FAIL") << std::endl;

    return framesCorrect && fftCorrect && dcZero && finite && tooShort.empty() &&
           windowsCorrect && rejected;
}

/**
 * Test 11: Segment ngắn -> toàn 0; segment đủ dài -> khác 0, cùng shape
 */
bool testExtractShortAndLong() {
    std::cout << "\n[TEST] Extract Short & Long Segments..." << std::endl;

    fs::path dir = makeTempDir("extract");
    fs::path mono16k = dir / "mono16k.wav";
    fs::path stereo8k = dir / "stereo8k.wav";
    bool written = writeSineWav(mono16k, 16000, 1, 6.0) &&
                   writeSineWav(stereo8k, 8000, 2, 6.0);

    FeatureExtractor extractor;
    bool minimumCorrect = extractor.getMinimumSamples() == 79600 &&
                          extractor.getExampleWindowFrames() == NUM_FRAMES;

    FeatureExample shortExample;
    bool shortRead = extractor.extract(SegmentRef("A", mono16k.string(), 0, 32000), shortExample);

    FeatureExample longExample;
    bool longRead = extractor.extract(SegmentRef("A", mono16k.string(), 0, 80000), longExample);

    // 40000 frames @ 8kHz stereo -> mono -> 80000 samples @ 16kHz
    FeatureExample resampledExample;
    bool resampledRead = extractor.extract(SegmentRef("A", stereo8k.string(), 0, 40000),
                                           resampledExample);

    bool shapeCorrect = shortExample.frames == NUM_FRAMES && shortExample.bands == NUM_BANDS &&
                        shortExample.channels == 1 &&
                        shortExample.sameShape(longExample) &&
                        shortExample.sameShape(resampledExample);

    std::cout << "  Short all zero: " << (shortExample.isAllZero() ? "YES" : "NO") << std::endl;
    std::cout << "  Long all zero: " << (longExample.isAllZero() ? "YES" : "NO") << std::endl;

    fs::remove_all(dir);

    bool allPassed = written && minimumCorrect && shortRead && longRead && resampledRead &&
                     shapeCorrect && shortExample.isAllZero() &&
                     !longExample.isAllZero() && !resampledExample.isAllZero();
    std::cout << "  Extract: " << (allPassed ? "PASS" : "FAIL") << std::endl;
    return allPassed;
}

/**
 * Test 12: extractBatch giữ thứ tự và bỏ segment không đọc được
 */
bool testExtractBatchOrder() {
    std::cout << "\n[TEST] Extract Batch Order..." << std::endl;

    fs::path dir = makeTempDir("batch");
    fs::path wav = dir / "a.wav";
    bool written = writeSineWav(wav, 16000, 1, 6.0);

    std::vector<SegmentRef> segments;
    segments.emplace_back("First", wav.string(), 0, 80000);
    segments.emplace_back("Short", wav.string(), 0, 1000);
    segments.emplace_back("Missing", (dir / "missing.wav").string(), 0, 80000);
    segments.emplace_back("Last", wav.string(), 16000, 80000);

    FeatureExtractor extractor;
    std::vector<LabeledExample> results = extractor.extractBatch(segments, false);

    bool orderCorrect = results.size() == 3 &&
                        results[0].label == "First" &&
                        results[1].label == "Short" &&
                        results[2].label == "Last";
    bool contentCorrect = orderCorrect &&
                          !results[0].features.isAllZero() &&
                          results[1].features.isAllZero() &&
                          !results[2].features.isAllZero();

    fs::remove_all(dir);

    std::cout << "  Results: " << results.size() << " (expected: 3)" << std::endl;
    bool allPassed = written && orderCorrect && contentCorrect;
    std::cout << "  Batch order: " << (allPassed ? "PASS" : "FAIL") << std::endl;
    return allPassed;
}

/**
 * Test 13: Exception trong extract chỉ làm mất segment đó, batch vẫn hoàn tất
 */
bool testExtractBatchSurvivesErrors() {
    std::cout << "\n[TEST] Extract Batch Survives Errors..." << std::endl;

    fs::path dir = makeTempDir("batch_errors");
    fs::path wav = dir / "a.wav";
    bool written = writeSineWav(wav, 16000, 1, 6.0);

    std::vector<SegmentRef> segments;
    segments.emplace_back("First", wav.string(), 0, 80000);
    segments.emplace_back("Throw", wav.string(), 0, 80000);
    segments.emplace_back("Last", wav.string(), 16000, 80000);

    ThrowingExtractor extractor;
    std::vector<LabeledExample> results;
    bool escaped = false;
    try {
        results = extractor.extractBatch(segments, false);
    } catch (const std::exception& e) {
        std::cout << "  Exception escaped: " << e.what() << std::endl;
        escaped = true;
    }

    bool orderCorrect = results.size() == 2 &&
                        results[0].label == "First" &&
                        results[1].label == "Last";

    fs::remove_all(dir);

    std::cout << "  Results: " << results.size() << " (expected: 2)" << std::endl;
    bool allPassed = written && !escaped && orderCorrect;
    std::cout << "  Batch errors: " << (allPassed ? "PASS" : "FAIL") << std::endl;
    return allPassed;
}

// ============================================================================
// PERSISTENCE TESTS
// ============================================================================

/**
 * Test 14: save -> load trả lại đúng dữ liệu và thứ tự
 */
bool testFeatureStoreRoundTrip() {
    std::cout << "\n[TEST] Feature Store Round Trip..." << std::endl;

    fs::path dir = makeTempDir("store");
    FeatureStore store(dir.string());

    std::vector<LabeledExample> data;
    data.emplace_back("KillerWhale", makeExample(4, 3, 1.0f));
    data.emplace_back("Seal", makeExample(4, 3, -2.0f));
    data.emplace_back("KillerWhale", makeExample(4, 3, 7.5f));

    bool existsBefore = store.exists(DatasetType::TRAIN);
    store.save(DatasetType::TRAIN, data);
    bool existsAfter = store.exists(DatasetType::TRAIN);
    bool pathCorrect = fs::path(store.featurePath(DatasetType::TRAIN)).filename() == "TRAIN.features";

    LoadedFeatures loaded = store.load(DatasetType::TRAIN);

    bool equal = loaded.size() == data.size();
    for (size_t i = 0; equal && i < data.size(); ++i) {
        equal = loaded.labels[i] == data[i].label && loaded.features[i] == data[i].features;
    }

    fs::remove_all(dir);

    bool allPassed = !existsBefore && existsAfter && pathCorrect && equal;
    std::cout << "  Round trip: " << (allPassed ? "PASS" : "FAIL") << std::endl;
    return allPassed;
}

/**
 * Test 15: Lưu hai lần -> backup giữ nội dung lần đầu
 */
bool testFeatureStoreBackup() {
    std::cout << "\n[TEST] Feature Store Backup..." << std::endl;

    fs::path dir = makeTempDir("backup");
    FeatureStore store(dir.string());

    std::vector<LabeledExample> first;
    first.emplace_back("KillerWhale", makeExample(2, 2, 1.0f));
    std::vector<LabeledExample> second;
    second.emplace_back("Seal", makeExample(2, 2, 2.0f));
    second.emplace_back("Seal", makeExample(2, 2, 3.0f));

    store.save("VALIDATE", first);
    store.save("VALIDATE", second);

    std::string primary = store.featurePath(DatasetType::VALIDATE);
    std::string backup = primary + BACKUP_SUFFIX;
    bool backupExists = fs::exists(backup);

    LoadedFeatures current = store.load(DatasetType::VALIDATE);
    bool primaryCorrect = current.size() == 2 && current.labels[0] == "Seal" &&
                          current.features[1] == second[1].features;

    // Đọc backup qua một store khác
    fs::path restoreDir = dir / "restore";
    fs::create_directories(restoreDir);
    fs::copy_file(backup, restoreDir / "VALIDATE.features");
    LoadedFeatures previous = FeatureStore(restoreDir.string()).load(DatasetType::VALIDATE);
    bool backupCorrect = previous.size() == 1 && previous.labels[0] == "KillerWhale" &&
                         previous.features[0] == first[0].features;

    fs::remove_all(dir);

    bool allPassed = backupExists && primaryCorrect && backupCorrect;
    std::cout << "  Backup: " << (allPassed ? "PASS" : "FAIL") << std::endl;
    return allPassed;
}

/**
 * Test 16: Lọc removeLabels và đổi tên sang Other khi load
 */
bool testLoadRemoveAndRename() {
    std::cout << "\n[TEST] Load Remove & Rename..." << std::endl;

    fs::path dir = makeTempDir("filter");
    FeatureStore store(dir.string());

    std::vector<LabeledExample> data;
    data.emplace_back("Noise", makeExample(2, 2, 0.0f));
    data.emplace_back("Seal", makeExample(2, 2, 5.0f));
    data.emplace_back("KillerWhale", makeExample(2, 2, 9.0f));
    data.emplace_back("Noise", makeExample(2, 2, 1.0f));
    store.save(DatasetType::TEST, data);

    LoadedFeatures loaded = store.load("TEST", {"Noise"}, {"Seal"});

    bool noNoise = std::find(loaded.labels.begin(), loaded.labels.end(), "Noise") == loaded.labels.end();
    bool renamed = loaded.size() == 2 &&
                   loaded.labels[0] == OTHER_CLASS &&
                   loaded.labels[1] == "KillerWhale" &&
                   loaded.features[0] == data[1].features &&
                   loaded.features[1] == data[2].features;

    LoadedFeatures unfiltered = store.load(DatasetType::TEST);
    bool untouched = unfiltered.size() == 4;

    fs::remove_all(dir);

    bool allPassed = noNoise && renamed && untouched;
    std::cout << "  Remove/rename: " << (allPassed ? "PASS" : "FAIL") << std::endl;
    return allPassed;
}

/**
 * Test 17: MissingArtifactError, ConfigurationError, ArtifactFormatError
 * (kể cả shape lớn hơn dữ liệu thực có trong file)
 */
bool testStoreErrors() {
    std::cout << "\n[TEST] Store Errors..." << std::endl;

    fs::path dir = makeTempDir("errors");
    FeatureStore store(dir.string());

    bool missing = false;
    try {
        store.load(DatasetType::TRAIN);
    } catch (const MissingArtifactError& e) {
        missing = std::string(e.what()).find("generate") != std::string::npos;
    }

    bool badSave = false;
    try {
        store.save("TRAINING", {});
    } catch (const ConfigurationError&) {
        badSave = true;
    }

    bool badLoad = false;
    try {
        store.load("validation");
    } catch (const ConfigurationError&) {
        badLoad = true;
    }

    {
        std::ofstream garbage(store.featurePath(DatasetType::TEST), std::ios::binary);
        garbage << "definitely not a features file";
    }
    bool corrupt = false;
    try {
        store.load(DatasetType::TEST);
    } catch (const ArtifactFormatError&) {
        corrupt = true;
    }

    // Header hợp lệ nhưng shape vượt quá dữ liệu còn lại trong file
    {
        std::ofstream oversized(store.featurePath(DatasetType::VALIDATE), std::ios::binary);
        const char magic[9] = "ORCAFEAT";
        binary::writeMagic(oversized, magic);
        binary::writeValue(oversized, FeatureStore::FORMAT_VERSION);
        binary::writeValue(oversized, static_cast<uint64_t>(1));
        binary::writeString(oversized, "Orca");
        binary::writeValue(oversized, static_cast<int32_t>(1 << 16));
        binary::writeValue(oversized, static_cast<int32_t>(1 << 16));
        binary::writeValue(oversized, static_cast<int32_t>(1 << 16));
        binary::writeValue(oversized, 1.0f);
    }
    bool oversizedShape = false;
    try {
        store.load(DatasetType::VALIDATE);
    } catch (const ArtifactFormatError& e) {
        oversizedShape = std::string(e.what()).find("exceeds file size") != std::string::npos;
    }

    bool parseCorrect = parseDatasetType("VALIDATE") == DatasetType::VALIDATE &&
                        datasetTypeName(DatasetType::TEST) == "TEST";

    fs::remove_all(dir);

    std::cout << "  Missing artifact: " << (missing ? "PASS" : "FAIL") << std::endl;
    std::cout << "  Bad split name: " << (badSave && badLoad ? "PASS" : "FAIL") << std::endl;
    std::cout << "  Corrupt artifact: " << (corrupt ? "PASS" : "FAIL") << std::endl;
    std::cout << "  Oversized shape: " << (oversizedShape ? "PASS" : "FAIL") << std::endl;

    return missing && badSave && badLoad && corrupt && oversizedShape && parseCorrect;
}

// ============================================================================
// LABEL ENCODER TESTS
// ============================================================================

/**
 * Test 18: Thứ tự từ điển và one-hot
 */
bool testLabelEncoderOrdering() {
    std::cout << "\n[TEST] Label Encoder Ordering..." << std::endl;

    LabelEncoder encoder;
    encoder.fit({"B", "A", "C", "A"});

    bool classesCorrect = encoder.numClasses() == 3 &&
                          encoder.classes() == std::vector<std::string>({"A", "B", "C"});

    OneHotMatrix onehot = encoder.encode({"A", "B", "C"});
    bool onehotCorrect = onehot.size() == 3 &&
                         onehot[0].size() == 3 &&
                         argmax(onehot[0]) == 0 && argmax(onehot[1]) == 1 && argmax(onehot[2]) == 2;

    float rowSum = 0.0f;
    for (float v : onehot[1]) rowSum += v;

    bool inverseCorrect = encoder.inverseTransform(1) == "B" &&
                          encoder.transform(std::vector<std::string>({"C", "A"})) ==
                              std::vector<int>({2, 0});

    bool unknownRejected = false;
    try {
        encoder.transform("Z");
    } catch (const std::out_of_range&) {
        unknownRejected = true;
    }

    std::cout << "  Classes: " << (classesCorrect ? "PASS" : "FAIL") << std::endl;
    std::cout << "  One-hot: " << (onehotCorrect ? "PASS" : "FAIL") << std::endl;

    return classesCorrect && onehotCorrect && rowSum == 1.0f && inverseCorrect && unknownRejected;
}

/**
 * Test 19: save -> load, CSV và symlink "latest"
 */
bool testLabelEncoderPersistence() {
    std::cout << "\n[TEST] Label Encoder Persistence..." << std::endl;

    fs::path dir = makeTempDir("encoder");

    LabelEncoder encoder;
    encoder.fit({"Seal", "KillerWhale", "Other"});
    LabelEncoderFiles files = encoder.save(dir.string(), "20240101-000000");

    bool filesExist = fs::exists(files.encoderPath) && fs::exists(files.csvPath);
    bool linksCorrect = fs::is_symlink(files.latestEncoderLink) && fs::is_symlink(files.latestCsvLink);

    LabelEncoder restored = LabelEncoder::load(files.latestEncoderLink);
    bool restoredCorrect = restored.classes() == encoder.classes();

    std::ifstream csv(files.csvPath);
    std::vector<std::string> lines;
    for (std::string line; std::getline(csv, line);) {
        lines.push_back(line);
    }
    bool csvCorrect = lines.size() == 4 &&
                      lines[0] == "encoded_id,label" &&
                      lines[1] == "0,KillerWhale" &&
                      lines[2] == "1,Other" &&
                      lines[3] == "2,Seal";

    // Lần chạy sau thay thế symlink
    LabelEncoder next;
    next.fit({"A", "B"});
    LabelEncoderFiles nextFiles = next.save(dir.string(), "20240102-000000");
    bool relinked = fs::read_symlink(nextFiles.latestEncoderLink).filename() ==
                        LabelEncoder::encoderFileName("20240102-000000") &&
                    LabelEncoder::load(nextFiles.latestEncoderLink).numClasses() == 2 &&
                    fs::exists(files.encoderPath);

    bool missingRejected = false;
    try {
        LabelEncoder::load((dir / "nope.p").string());
    } catch (const MissingArtifactError&) {
        missingRejected = true;
    }

    fs::remove_all(dir);

    std::cout << "  Files: " << (filesExist && linksCorrect ? "PASS" : "FAIL") << std::endl;
    std::cout << "  CSV: " << (csvCorrect ? "PASS" : "FAIL") << std::endl;
    std::cout << "  Relinked: " << (relinked ? "PASS" : "FAIL") << std::endl;

    return filesExist && linksCorrect && restoredCorrect && csvCorrect && relinked && missingRejected;
}

// ============================================================================
// PIPELINE TEST
// ============================================================================

/**
 * Test 20: Chạy toàn bộ pipeline trên dataset nhỏ
 */
bool testPipelineEndToEnd() {
    std::cout << "\n[TEST] Pipeline End To End..." << std::endl;

    fs::path root = makeTempDir("pipeline");
    fs::path data = root / "data";
    fs::path output = root / "output";

    // 10 file x 11s -> 2 segment / file; Seal chỉ có 3 file -> bị loại
    bool written = true;
    for (int i = 0; i < 10; ++i) {
        written = written && writeSineWav(data / "Killer Whale" / "1990" / ("kw" + std::to_string(i) + ".wav"),
                                          16000, 1, 11.0, 300.0f + 50.0f * i);
    }
    for (int i = 0; i < 3; ++i) {
        written = written && writeSineWav(data / "Seal" / "2000" / ("s" + std::to_string(i) + ".wav"),
                                          16000, 1, 11.0);
    }

    PipelineConfig config;
    config.dataPath = data.string();
    config.outputPath = output.string();
    config.otherClasses = {"KillerWhale"};

    DatasetBuilder builder(config);
    bool ran = builder.run();
    bool cached = builder.featuresCached();

    FeatureStore store(output.string());
    // 7 / 2 / 1 file -> 14 / 4 / 2 segment
    size_t trainSize = store.load(DatasetType::TRAIN).size();
    size_t validateSize = store.load(DatasetType::VALIDATE).size();
    size_t testSize = store.load(DatasetType::TEST).size();

    // Lần hai: có cache -> bỏ qua
    DatasetBuilder again(config);
    bool skipped = !again.run();

    LabelEncoder encoder = builder.buildLabelEncoding("20240101-000000");
    bool encoderCorrect = encoder.numClasses() == 1 && encoder.inverseTransform(0) == OTHER_CLASS &&
                          fs::is_symlink(output / LabelEncoder::encoderFileName(LabelEncoder::LATEST_TAG));

    std::cout << "  Sizes: " << trainSize << "/" << validateSize << "/" << testSize
              << " (expected: 14/4/2)" << std::endl;

    fs::remove_all(root);

    bool allPassed = written && ran && cached && skipped &&
                     trainSize == 14 && validateSize == 4 && testSize == 2 && encoderCorrect;
    std::cout << "  Pipeline: " << (allPassed ? "PASS" : "FAIL") << std::endl;
    return allPassed;
}

// ============================================================================
// MAIN
// ============================================================================

int main() {
    std::cout << "========================================" << std::endl;
    std::cout << "Orca Dataset Pipeline Unit Tests" << std::endl;
    std::cout << "========================================" << std::endl;

    int passed = 0;
    int total = 20;

    std::cout << "\n--- Dataset Index Tests ---" << std::endl;
    if (testSanitizeLabel()) passed++;
    if (testIndexLayout()) passed++;
    if (testIndexSkipsUnreadable()) passed++;
    if (testSplitPartition()) passed++;
    if (testSplitDeterministic()) passed++;
    if (testParseSeed()) passed++;
    if (testQuantizeCounts()) passed++;
    if (testQuantizeFromFile()) passed++;

    std::cout << "\n--- SignalProcessor Tests ---" << std::endl;
    if (testMonoAndResample()) passed++;

    std::cout << "\n--- Feature Tests ---" << std::endl;
    if (testSpectrogramFraming()) passed++;
    if (testExtractShortAndLong()) passed++;
    if (testExtractBatchOrder()) passed++;
    if (testExtractBatchSurvivesErrors()) passed++;

    std::cout << "\n--- Persistence Tests ---" << std::endl;
    if (testFeatureStoreRoundTrip()) passed++;
    if (testFeatureStoreBackup()) passed++;
    if (testLoadRemoveAndRename()) passed++;
    if (testStoreErrors()) passed++;

    std::cout << "\n--- LabelEncoder Tests ---" << std::endl;
    if (testLabelEncoderOrdering()) passed++;
    if (testLabelEncoderPersistence()) passed++;

    std::cout << "\n--- Pipeline Tests ---" << std::endl;
    if (testPipelineEndToEnd()) passed++;

    std::cout << "\n========================================" << std::endl;
    std::cout << "Results: " << passed << "/" << total << " tests passed" << std::endl;
    std::cout << "========================================" << std::endl;

    return (passed == total) ? 0 : 1;
}
