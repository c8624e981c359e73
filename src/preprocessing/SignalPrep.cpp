/**
 * @file SignalPrep.cpp
 * @brief Implementation of audio reading and waveform preparation
 *
 * Bao gồm:
 * - Đọc metadata / segment WAV bằng dr_wav
 * - Downmix mono
 * - Resampling tuyến tính về SAMPLE_RATE
 *
 * @author Research Team
 * @date 2026
 */

// ============================================================================
// INCLUDES
// ============================================================================

#include "SignalPrep.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>

// ----------------------------------------------------------------------------
// dr_wav - Single-header WAV file library
// Định nghĩa DR_WAV_IMPLEMENTATION chỉ trong một file .cpp
// ----------------------------------------------------------------------------
#define DR_WAV_IMPLEMENTATION
#include "dr_wav.h"

namespace orca {

// ============================================================================
// WAV FILE ACCESS
// ============================================================================

bool SignalProcessor::readInfo(const std::string& filePath, AudioInfo& info) const {
    /**
     * Chỉ đọc header - không decode samples.
     * Dùng cho SegmentQuantizer để tính số segment của mỗi file.
     */

    drwav wav;
    if (!drwav_init_file(&wav, filePath.c_str(), nullptr)) {
        std::cerr << "[SignalProcessor] Failed to open file: " << filePath << std::endl;
        return false;
    }

    info.sampleRate = wav.sampleRate;
    info.channels = wav.channels;
    info.totalFrames = wav.totalPCMFrameCount;

    drwav_uninit(&wav);

    if (info.sampleRate == 0 || info.channels == 0) {
        std::cerr << "[SignalProcessor] Invalid WAV file parameters: " << filePath << std::endl;
        return false;
    }

    return true;
}

bool SignalProcessor::readSegment(const std::string& filePath,
                                  uint64_t startFrame,
                                  uint64_t frameCount,
                                  AudioData& audioData) const {
    /**
     * dr_wav tự động xử lý:
     * - Các định dạng bit depth khác nhau (8, 16, 24, 32-bit)
     * - PCM và IEEE float
     *
     * Output luôn là float normalized [-1.0, 1.0], interleaved
     */

    audioData = AudioData();

    drwav wav;
    if (!drwav_init_file(&wav, filePath.c_str(), nullptr)) {
        std::cerr << "[SignalProcessor] Failed to open file: " << filePath << std::endl;
        return false;
    }

    audioData.sampleRate = wav.sampleRate;
    audioData.channels = wav.channels;

    if (audioData.sampleRate == 0 || audioData.channels == 0) {
        std::cerr << "[SignalProcessor] Invalid WAV file parameters: " << filePath << std::endl;
        drwav_uninit(&wav);
        return false;
    }

    // Seek tới frame bắt đầu
    if (startFrame > wav.totalPCMFrameCount ||
        !drwav_seek_to_pcm_frame(&wav, startFrame)) {
        std::cerr << "[SignalProcessor] Cannot seek to frame " << startFrame
                  << " in " << filePath << std::endl;
        drwav_uninit(&wav);
        return false;
    }

    // Không đọc quá cuối file
    uint64_t available = wav.totalPCMFrameCount - startFrame;
    uint64_t toRead = std::min(frameCount, available);

    audioData.samples.resize(static_cast<size_t>(toRead * audioData.channels));
    uint64_t framesRead = drwav_read_pcm_frames_f32(&wav, toRead, audioData.samples.data());

    if (framesRead != toRead) {
        std::cerr << "[SignalProcessor] Warning: Read " << framesRead
                  << " frames, expected " << toRead << " from " << filePath << std::endl;
        audioData.samples.resize(static_cast<size_t>(framesRead * audioData.channels));
    }
    audioData.frames = framesRead;

    drwav_uninit(&wav);
    return true;
}

bool SignalProcessor::loadSegment(const std::string& filePath,
                                  uint64_t startFrame,
                                  uint64_t frameCount,
                                  std::vector<float>& output,
                                  uint32_t targetRate) const {
    output.clear();

    // ----- BƯỚC 1: Đọc segment -----
    AudioData audioData;
    if (!readSegment(filePath, startFrame, frameCount, audioData)) {
        return false;
    }

    // ----- BƯỚC 2: Chuyển sang mono (nếu cần) -----
    std::vector<float> monoSamples;
    if (audioData.channels > 1) {
        convertToMono(audioData.samples, monoSamples, audioData.channels);
    } else {
        monoSamples = std::move(audioData.samples);
    }

    // ----- BƯỚC 3: Resampling về targetRate -----
    if (audioData.sampleRate != targetRate) {
        resample(monoSamples, audioData.sampleRate, output, targetRate);
    } else {
        output = std::move(monoSamples);
    }

    return true;
}

// ============================================================================
// MONO DOWNMIX
// ============================================================================

void SignalProcessor::convertToMono(const std::vector<float>& input,
                                    std::vector<float>& output,
                                    uint16_t channels) const {
    /**
     * Input được giả định là interleaved:
     * [L0, R0, L1, R1, L2, R2, ...]
     */

    if (channels <= 1) {
        output = input;
        return;
    }

    size_t numFrames = input.size() / channels;
    output.resize(numFrames);

    float invChannels = 1.0f / channels;

    for (size_t i = 0; i < numFrames; ++i) {
        float sum = 0.0f;

        for (uint16_t ch = 0; ch < channels; ++ch) {
            sum += input[i * channels + ch];
        }

        output[i] = sum * invChannels;
    }
}

// ============================================================================
// RESAMPLING
// ============================================================================

void SignalProcessor::resample(const std::vector<float>& input,
                               uint32_t inputRate,
                               std::vector<float>& output,
                               uint32_t targetRate) const {
    /**
     * Resampling sử dụng Linear Interpolation
     *
     * 1. ratio = inputRate / targetRate
     * 2. Với mỗi sample đầu ra tại vị trí n:
     *    - pos = n * ratio
     *    - Nội suy tuyến tính giữa input[floor(pos)] và input[floor(pos) + 1]
     */

    if (input.empty() || inputRate == 0 || targetRate == 0) {
        output.clear();
        return;
    }

    if (inputRate == targetRate) {
        output = input;
        return;
    }

    double ratio = static_cast<double>(inputRate) / static_cast<double>(targetRate);
    size_t outputLength = static_cast<size_t>(
        static_cast<uint64_t>(input.size()) * targetRate / inputRate);

    output.resize(outputLength);

    for (size_t i = 0; i < outputLength; ++i) {
        double srcPos = i * ratio;

        size_t idx0 = static_cast<size_t>(srcPos);
        if (idx0 >= input.size()) {
            idx0 = input.size() - 1;
        }
        size_t idx1 = idx0 + 1;
        double frac = srcPos - idx0;

        if (idx1 >= input.size()) {
            idx1 = input.size() - 1;
        }

        // y = y0 + (y1 - y0) * frac
        output[i] = static_cast<float>(
            input[idx0] * (1.0 - frac) + input[idx1] * frac
        );
    }
}

} // namespace orca
