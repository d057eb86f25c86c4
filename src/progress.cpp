#include "progress.hpp"
#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <regex>

namespace gitsight {

void ProgressChannel::publish(ProgressEvent event) {
    {
        std::lock_guard<std::mutex> lk(mtx_);
        if (closed_)
            return;
        queue_.push_back(std::move(event));
    }
    cv_.notify_one();
}

std::optional<ProgressEvent> ProgressChannel::receive() {
    std::unique_lock<std::mutex> lk(mtx_);
    cv_.wait(lk, [this] { return !queue_.empty() || closed_; });
    if (queue_.empty())
        return std::nullopt;
    ProgressEvent ev = std::move(queue_.front());
    queue_.pop_front();
    return ev;
}

void ProgressChannel::close() {
    {
        std::lock_guard<std::mutex> lk(mtx_);
        closed_ = true;
    }
    cv_.notify_all();
}

bool ProgressChannel::closed() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return closed_;
}

namespace {

// Counters wider than size_t read as zero.
std::size_t counter_value(const std::string& digits) {
    errno = 0;
    unsigned long long v = std::strtoull(digits.c_str(), nullptr, 10);
    if (errno == ERANGE || v > static_cast<unsigned long long>(SIZE_MAX))
        return 0;
    return static_cast<std::size_t>(v);
}

} // namespace

std::optional<ProgressEvent> parse_sideband(const std::string& text) {
    static const std::regex re(
        R"((Counting|Compressing|Resolving) [A-Za-z]+:[ ]+[0-9]+% \(([0-9]+)/([0-9]+)\))");
    std::smatch m;
    if (!std::regex_search(text, m, re))
        return std::nullopt;
    ProgressEvent ev;
    const std::string stage = m[1].str();
    if (stage == "Counting")
        ev.stage = ProgressStage::Counting;
    else if (stage == "Compressing")
        ev.stage = ProgressStage::Compressing;
    else
        ev.stage = ProgressStage::Resolving;
    ev.current = counter_value(m[2].str());
    ev.total = counter_value(m[3].str());
    ev.message = m[0].str();
    return ev;
}

std::string describe(const ProgressEvent& event) {
    const char* label = "";
    switch (event.stage) {
    case ProgressStage::Counting:
        label = "Counting objects";
        break;
    case ProgressStage::Compressing:
        label = "Compressing objects";
        break;
    case ProgressStage::Resolving:
        label = "Resolving deltas";
        break;
    case ProgressStage::Receiving:
        label = "Receiving objects";
        break;
    case ProgressStage::Pushing:
        label = "Writing objects";
        break;
    case ProgressStage::Message:
    case ProgressStage::Done:
        return event.message;
    }
    std::string out = label;
    out += ": ";
    if (event.total > 0)
        out += std::to_string(event.current * 100 / event.total) + "% ";
    out += "(" + std::to_string(event.current) + "/" + std::to_string(event.total) + ")";
    return out;
}

} // namespace gitsight
