/**
 * @file FeatureExtraction.cpp
 * @brief Implementation of segment feature extraction
 *
 * @author Research Team
 * @date 2026
 */

#include "FeatureExtraction.h"

#include <cmath>
#include <exception>
#include <iostream>

#ifdef USE_OPENMP
#include <omp.h>
#endif

namespace orca {

// ============================================================================
// CONSTRUCTOR
// ============================================================================

FeatureExtractor::FeatureExtractor(const MelConfig& melConfig,
                                   double exampleWindowSeconds,
                                   double exampleHopSeconds)
    : m_melSpectrogram(melConfig)
    , m_exampleWindowFrames(0)
    , m_exampleHopFrames(0)
{
    // Tần số frame của log-mel = 1 / hop (100 Hz với hop 10ms)
    const double featuresSampleRate = 1.0 / melConfig.hopSeconds;
    m_exampleWindowFrames = static_cast<int>(std::lround(exampleWindowSeconds * featuresSampleRate));
    m_exampleHopFrames = static_cast<int>(std::lround(exampleHopSeconds * featuresSampleRate));

    if (m_exampleWindowFrames <= 0 || m_exampleHopFrames <= 0) {
        throw ConfigurationError("example window and hop must span at least one frame");
    }
}

size_t FeatureExtractor::getMinimumSamples() const {
    // 400 + 495 * 160 = 79600 @ 16kHz
    return static_cast<size_t>(m_melSpectrogram.getWindowLength()) +
           static_cast<size_t>(m_exampleWindowFrames - 1) * m_melSpectrogram.getHopLength();
}

// ============================================================================
// MAIN EXTRACTION METHODS
// ============================================================================

bool FeatureExtractor::extractFromWaveform(const std::vector<float>& waveform,
                                           FeatureExample& example) const {
    const int numBands = getNumBands();
    example.allocate(m_exampleWindowFrames, numBands, 1);

    // ----- BƯỚC 1: Log-mel -----
    FeatureMatrix logMel;
    m_melSpectrogram.compute(waveform, logMel);

    // ----- BƯỚC 2: Framing -----
    std::vector<FeatureMatrix> windows = frameRows(logMel, m_exampleWindowFrames, m_exampleHopFrames);
    if (windows.empty()) {
        return false;
    }

    // ----- BƯỚC 3: Giữ cửa sổ đầu tiên -----
    const FeatureMatrix& first = windows.front();
    for (int t = 0; t < m_exampleWindowFrames; ++t) {
        for (int b = 0; b < numBands; ++b) {
            example.set(t, b, first[t][b]);
        }
    }
    return true;
}

bool FeatureExtractor::extract(const SegmentRef& segment, FeatureExample& example) const {
    std::vector<float> waveform;
    if (!m_signalProcessor.loadSegment(segment.source, segment.startFrame,
                                       segment.frameCount, waveform,
                                       static_cast<uint32_t>(m_melSpectrogram.getConfig().sampleRate))) {
        std::cerr << "[FeatureExtractor] Error: Failed to read segment "
                  << segment.toString() << std::endl;
        return false;
    }

    if (!extractFromWaveform(waveform, example)) {
        std::cerr << "[FeatureExtractor] Warning: audio segment too short ("
                  << waveform.size() << " < " << getMinimumSamples()
                  << " samples), using all zeros: " << segment.toString() << std::endl;
    }
    return true;
}

std::vector<LabeledExample> FeatureExtractor::extractBatch(const std::vector<SegmentRef>& segments,
                                                           bool verbose) const {
    const size_t total = segments.size();
    std::vector<LabeledExample> results(total);
    std::vector<char> succeeded(total, 0);
    size_t completed = 0;

    if (verbose) {
#ifdef USE_OPENMP
        std::cout << "[FeatureExtractor] Extracting " << total << " segments using "
                  << omp_get_max_threads() << " threads" << std::endl;
#else
        std::cout << "[FeatureExtractor] Extracting " << total << " segments" << std::endl;
#endif
    }

    // Mỗi thread ghi vào slot riêng -> thứ tự đầu ra khớp thứ tự đầu vào
    #ifdef USE_OPENMP
    #pragma omp parallel for schedule(dynamic)
    #endif
    for (long long i = 0; i < static_cast<long long>(total); ++i) {
        const SegmentRef& segment = segments[static_cast<size_t>(i)];
        LabeledExample& slot = results[static_cast<size_t>(i)];
        slot.label = segment.label;

        // Exception không được thoát khỏi vùng parallel
        try {
            succeeded[static_cast<size_t>(i)] = extract(segment, slot.features) ? 1 : 0;
        } catch (const std::exception& e) {
            succeeded[static_cast<size_t>(i)] = 0;
            #ifdef USE_OPENMP
            #pragma omp critical(extract_progress)
            #endif
            {
                std::cerr << "[FeatureExtractor] Error: " << e.what()
                          << " while extracting " << segment.toString() << std::endl;
            }
        }

        size_t done;
        #ifdef USE_OPENMP
        #pragma omp atomic capture
        #endif
        done = ++completed;

        if (verbose && done % PROGRESS_INTERVAL == 0) {
            #ifdef USE_OPENMP
            #pragma omp critical(extract_progress)
            #endif
            {
                std::cout << "[FeatureExtractor] "
                          << static_cast<int>(100.0 * done / total) << "% ("
                          << done << "/" << total << ")" << std::endl;
            }
        }
    }

    // Bỏ các segment không đọc được, giữ nguyên thứ tự còn lại
    std::vector<LabeledExample> extracted;
    extracted.reserve(total);
    size_t failed = 0;
    for (size_t i = 0; i < total; ++i) {
        if (succeeded[i]) {
            extracted.push_back(std::move(results[i]));
        } else {
            failed++;
        }
    }

    if (failed > 0) {
        std::cerr << "[FeatureExtractor] Warning: " << failed
                  << " segments could not be extracted and were skipped" << std::endl;
    }
    if (verbose) {
        std::cout << "[FeatureExtractor] Extracted " << extracted.size() << " examples" << std::endl;
    }

    return extracted;
}

} // namespace orca
