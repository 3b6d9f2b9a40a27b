#ifndef BTR_UI_LOG_SINK_HPP
#define BTR_UI_LOG_SINK_HPP

#include <spdlog/sinks/base_sink.h>
#include <spdlog/details/log_msg.h>
#include <spdlog/details/null_mutex.h>
#include <deque>
#include <mutex>
#include <string>
#include <vector>

namespace BTR {

// UiLogSink: keeps the most recent warnings and errors so the console
// menu can show them next to the connection status.
template<typename Mutex = std::mutex>
class UiLogSink : public spdlog::sinks::base_sink<Mutex> {
public:
    explicit UiLogSink(std::size_t maxLines = 3) : maxLines_(maxLines == 0 ? 1 : maxLines) {
        this->set_level(spdlog::level::warn);
    }

    UiLogSink(const UiLogSink&) = delete;
    UiLogSink& operator=(const UiLogSink&) = delete;

    std::vector<std::string> recent() {
        std::lock_guard<std::mutex> lock(linesMutex_);
        return {lines_.begin(), lines_.end()};
    }

protected:
    void sink_it_(const spdlog::details::log_msg& msg) override {
        auto levelName = spdlog::level::to_string_view(msg.level);
        std::string line(levelName.data(), levelName.size());
        line += ": ";
        line.append(msg.payload.data(), msg.payload.size());
        std::lock_guard<std::mutex> lock(linesMutex_);
        lines_.push_back(std::move(line));
        while (lines_.size() > maxLines_) {
            lines_.pop_front();
        }
    }

    void flush_() override {}

private:
    const std::size_t maxLines_;
    std::mutex linesMutex_;
    std::deque<std::string> lines_;
};

using ui_log_sink_mt = UiLogSink<std::mutex>;
using ui_log_sink_st = UiLogSink<spdlog::details::null_mutex>;

} // namespace BTR

#endif // BTR_UI_LOG_SINK_HPP
