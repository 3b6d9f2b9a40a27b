#include "BTR/PcmAnchorFactory.h"
#include "BTR/CommandRunner.hpp"
#include "BTR/Error.h"
#include <spdlog/spdlog.h>
#include <atomic>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <sstream>
#include <thread>
#include <vector>
#include <sys/wait.h>
#include <unistd.h>

namespace BTR {

namespace {

bool isExecutableOnPath(const std::string& program) {
    if (program.find('/') != std::string::npos) {
        return access(program.c_str(), X_OK) == 0;
    }
    const char* path = std::getenv("PATH");
    if (!path) {
        return false;
    }
    std::stringstream dirs(path);
    std::string dir;
    while (std::getline(dirs, dir, ':')) {
        if (dir.empty()) {
            continue;
        }
        auto candidate = std::filesystem::path(dir) / program;
        if (access(candidate.c_str(), X_OK) == 0) {
            return true;
        }
    }
    return false;
}

class PcmAnchorStream : public IAnchorStream {
public:
    PcmAnchorStream(FILE* pipe, int16_t amplitude, std::shared_ptr<spdlog::logger> logger)
        : pipe_(pipe)
        , logger_(std::move(logger)) {
        frames_.resize(PcmAnchorFactory::kFramesPerWrite * PcmAnchorFactory::kChannels);
        // Alternating sign keeps the DC level at zero.
        for (size_t i = 0; i < frames_.size(); ++i) {
            frames_[i] = ((i / PcmAnchorFactory::kChannels) % 2 == 0) ? amplitude : static_cast<int16_t>(-amplitude);
        }
    }

    ~PcmAnchorStream() override { close(); }

    bool start() {
        try {
            running_.store(true);
            writer_ = std::thread(&PcmAnchorStream::writeLoop, this);
        } catch (const std::system_error& e) {
            running_.store(false);
            logger_->error("PcmAnchorStream: failed to start writer: {}", e.what());
            return false;
        }
        return true;
    }

    void stop() override {
        running_.store(false);
        if (writer_.joinable()) {
            writer_.join();
            logger_->debug("PcmAnchorStream: writer stopped");
        }
    }

    void close() override {
        stop();
        if (pipe_) {
            int status = pclose(pipe_);
            pipe_ = nullptr;
            if (status == -1 || !WIFEXITED(status)) {
                logger_->warn("PcmAnchorStream: aplay did not exit cleanly");
            } else {
                logger_->debug("PcmAnchorStream: closed (aplay exit {})", WEXITSTATUS(status));
            }
        }
    }

    bool isRunning() const override { return running_.load(); }

private:
    void writeLoop() {
        const size_t count = frames_.size();
        while (running_.load()) {
            if (fwrite(frames_.data(), sizeof(int16_t), count, pipe_) != count) {
                logger_->warn("PcmAnchorStream: write to aplay failed, anchor stopped");
                running_.store(false);
                return;
            }
            fflush(pipe_);
        }
    }

    FILE* pipe_;
    std::shared_ptr<spdlog::logger> logger_;
    std::vector<int16_t> frames_;
    std::thread writer_;
    std::atomic<bool> running_{false};
};

} // namespace

PcmAnchorFactory::PcmAnchorFactory(AnchorSettings settings,
                                   std::string aplay,
                                   std::shared_ptr<spdlog::logger> logger)
    : settings_(std::move(settings))
    , aplay_(std::move(aplay))
    , logger_(logger ? std::move(logger) : spdlog::default_logger()) {
}

int16_t PcmAnchorFactory::amplitudeForGain(double gain) {
    if (gain <= 0.0) {
        return 0;
    }
    if (gain >= 1.0) {
        return 32767;
    }
    long value = std::lround(gain * 32767.0);
    return static_cast<int16_t>(value < 1 ? 1 : value);
}

unsigned PcmAnchorFactory::bufferTimeUs(AnchorQuality quality) {
    switch (quality) {
        case AnchorQuality::LowestLatency: return 20000;
        case AnchorQuality::Default: return 100000;
    }
    return 100000;
}

std::expected<std::unique_ptr<IAnchorStream>, std::error_code>
PcmAnchorFactory::create(AnchorQuality quality) {
    if (!isExecutableOnPath(aplay_)) {
        logger_->error("PcmAnchorFactory: {} not found", aplay_);
        return std::unexpected(make_error_code(PlatformError::CommandFailed));
    }

    const unsigned bufferTime = bufferTimeUs(quality);
    std::string cmd = PopenCommandRunner::quote(aplay_) +
        " -q -t raw -f S16_LE" +
        " -r " + std::to_string(kSampleRate) +
        " -c " + std::to_string(kChannels) +
        " -D " + PopenCommandRunner::quote(settings_.device) +
        " --buffer-time=" + std::to_string(bufferTime) +
        " --period-time=" + std::to_string(bufferTime / 4) +
        " -";

    FILE* pipe = popen(cmd.c_str(), "w");
    if (!pipe) {
        logger_->error("PcmAnchorFactory: popen failed for {}", cmd);
        return std::unexpected(make_error_code(PlatformError::CommandFailed));
    }

    auto stream = std::make_unique<PcmAnchorStream>(pipe, amplitudeForGain(settings_.gain), logger_);
    if (!stream->start()) {
        return std::unexpected(make_error_code(PlatformError::CommandFailed));
    }

    // aplay exits at once on a busy or missing device; the writer then
    // hits EPIPE and stops.
    std::this_thread::sleep_for(kStartupCheck);
    if (!stream->isRunning()) {
        logger_->error("PcmAnchorFactory: aplay on '{}' exited during startup", settings_.device);
        stream->close();
        return std::unexpected(make_error_code(PlatformError::CommandFailed));
    }
    logger_->info("Anchor stream started on '{}' (gain {}, buffer {} us)",
                  settings_.device, settings_.gain, bufferTime);
    return stream;
}

} // namespace BTR
