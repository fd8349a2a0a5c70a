#include "sga/voice/OpenCvCamera.h"

#include "sga/voice/ErrorHandler.h"

#include <ctime>
#include <filesystem>
#include <iomanip>
#include <sstream>

#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/videoio.hpp>

namespace sga::voice {

OpenCvCamera::OpenCvCamera(Config cfg)
    : m_cfg(std::move(cfg))
{
}

std::string OpenCvCamera::timestampedName(const std::string& prefix, const std::string& extension,
                                          std::chrono::system_clock::time_point when) {
    const std::time_t t = std::chrono::system_clock::to_time_t(when);
    std::tm tm{};
    localtime_r(&t, &tm);
    std::ostringstream oss;
    oss << prefix << '_' << std::put_time(&tm, "%Y%m%d_%H%M%S") << '.' << extension;
    return oss.str();
}

std::optional<std::string> OpenCvCamera::prepareDir(const std::string& sub, ErrorInfo* err) const {
    std::filesystem::path dir = std::filesystem::path(m_cfg.mediaDir) / sub;
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) {
        setError(err, ErrorType::UnknownError, "Cannot create media directory " + dir.string() + ": " + ec.message());
        return std::nullopt;
    }
    return dir.string();
}

std::optional<std::string> OpenCvCamera::takePhoto(ErrorInfo* err) {
    std::lock_guard<std::mutex> lock(m_deviceMutex);
    auto dir = prepareDir("photos", err);
    if (!dir) return std::nullopt;

    cv::VideoCapture cap(m_cfg.deviceIndex);
    if (!cap.isOpened()) {
        setError(err, ErrorType::BackendUnavailable, "Cannot open camera " + std::to_string(m_cfg.deviceIndex));
        return std::nullopt;
    }

    cv::Mat frame;
    // 前几帧通常曝光未稳定
    for (int i = 0; i < 5; ++i) {
        cap.read(frame);
    }
    if (frame.empty()) {
        setError(err, ErrorType::UnknownError, "Camera returned an empty frame");
        return std::nullopt;
    }

    const auto path =
        (std::filesystem::path(*dir) / timestampedName("photo", "jpg", std::chrono::system_clock::now())).string();
    if (!cv::imwrite(path, frame)) {
        setError(err, ErrorType::UnknownError, "Failed to write " + path);
        return std::nullopt;
    }
    ErrorHandler::shared().log(ErrorHandler::LogLevel::Info, "Photo saved: " + path);
    return path;
}

std::optional<std::string> OpenCvCamera::recordVideo(std::chrono::seconds duration, ErrorInfo* err) {
    std::lock_guard<std::mutex> lock(m_deviceMutex);
    auto dir = prepareDir("videos", err);
    if (!dir) return std::nullopt;

    cv::VideoCapture cap(m_cfg.deviceIndex);
    if (!cap.isOpened()) {
        setError(err, ErrorType::BackendUnavailable, "Cannot open camera " + std::to_string(m_cfg.deviceIndex));
        return std::nullopt;
    }

    cv::Mat frame;
    if (!cap.read(frame) || frame.empty()) {
        setError(err, ErrorType::UnknownError, "Camera returned an empty frame");
        return std::nullopt;
    }

    const auto path =
        (std::filesystem::path(*dir) / timestampedName("video", "avi", std::chrono::system_clock::now())).string();
    cv::VideoWriter writer(path, cv::VideoWriter::fourcc('M', 'J', 'P', 'G'), m_cfg.fps, frame.size());
    if (!writer.isOpened()) {
        setError(err, ErrorType::UnknownError, "Failed to open video writer " + path);
        return std::nullopt;
    }

    ErrorHandler::shared().log(ErrorHandler::LogLevel::Info,
                               "Recording video: " + path + " (" + std::to_string(duration.count()) + "s)");
    const auto deadline = std::chrono::steady_clock::now() + duration;
    std::size_t frames = 0;
    do {
        writer.write(frame);
        ++frames;
    } while (std::chrono::steady_clock::now() < deadline && cap.read(frame) && !frame.empty());
    writer.release();

    ErrorHandler::shared().log(ErrorHandler::LogLevel::Info,
                               "Video saved: " + path + " (" + std::to_string(frames) + " frames)");
    return path;
}

} // namespace sga::voice
