#pragma once

#include "sga/voice/Collaborators.h"

#include <chrono>
#include <mutex>
#include <optional>
#include <string>

namespace sga::voice {

/**
 * @brief OpenCV 相机：拍照写 photos/photo_YYYYmmdd_HHMMSS.jpg，录像写 videos/video_YYYYmmdd_HHMMSS.avi
 */
class OpenCvCamera : public Camera {
public:
    struct Config {
        int deviceIndex{0};
        std::string mediaDir{"media"};
        double fps{20.0};
    };

    explicit OpenCvCamera(Config cfg);

    std::optional<std::string> takePhoto(ErrorInfo* err) override;
    std::optional<std::string> recordVideo(std::chrono::seconds duration, ErrorInfo* err) override;

    // 形如 photo_20240101_120000.jpg
    static std::string timestampedName(const std::string& prefix, const std::string& extension,
                                       std::chrono::system_clock::time_point when);

private:
    std::optional<std::string> prepareDir(const std::string& sub, ErrorInfo* err) const;

    Config m_cfg;
    // 拍照与录像不能同时占用设备
    std::mutex m_deviceMutex;
};

} // namespace sga::voice
