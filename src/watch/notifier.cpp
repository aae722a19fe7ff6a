/// @file notifier.cpp
/// @brief Event normalizer implementation.

#include "fwr/watch/notifier.hpp"

#include <algorithm>
#include <utility>

#include "fwr/foundation/file_probe.hpp"
#include "fwr/foundation/watch_logger.hpp"
#include "fwr/watch/directory_resolver.hpp"
#include "fwr/watch/inotify_watch_source.hpp"

namespace fwr::watch {

using foundation::ErrorCode;
using foundation::LogCategory;
using foundation::WatchError;
using foundation::WatchResult;

namespace {

constexpr int64_t kNanosPerMilli = 1'000'000;

}  // namespace

WatchResult<std::unique_ptr<Notifier>>
Notifier::create(const std::vector<std::string>& patterns, std::size_t maxWatchDirs) {
    auto source = InotifyWatchSource::create();
    if (!source) {
        FWR_LOG_ERROR(LogCategory::Watch, std::string(source.error().message()));
        return WatchResult<std::unique_ptr<Notifier>>::err(source.error());
    }
    return create(patterns, maxWatchDirs, std::move(source).value());
}

WatchResult<std::unique_ptr<Notifier>>
Notifier::create(const std::vector<std::string>& patterns, std::size_t maxWatchDirs,
                 std::unique_ptr<WatchSource> source) {
    using ResultType = WatchResult<std::unique_ptr<Notifier>>;

    if (!source) {
        return ResultType::err(
            WatchError(ErrorCode::InvalidArgument, "watch source must not be null"));
    }

    auto watchDirs = resolveWatchDirectories(patterns, maxWatchDirs);
    if (watchDirs.size() > maxWatchDirs) {
        std::string listing;
        for (std::size_t i = 0; i < maxWatchDirs; ++i) {
            listing += watchDirs[i];
            listing += '\n';
        }
        listing += "...";
        FWR_LOG_ERROR(LogCategory::Watch, listing);
        return ResultType::err(WatchError(
            ErrorCode::TooManyTargets,
            "too many watch directories (limit " + std::to_string(maxWatchDirs) + ")"));
    }

    auto notifier = std::make_unique<Notifier>(Token{}, std::move(source));
    for (const auto& dir : watchDirs) {
        notifier->addWatch(dir);
    }
    notifier->feedThread_ = std::thread([raw = notifier.get()] { raw->feedLoop(); });
    return ResultType::ok(std::move(notifier));
}

Notifier::Notifier(Token, std::unique_ptr<WatchSource> source)
    : source_(std::move(source)) {}

Notifier::~Notifier() {
    close();
}

void Notifier::setPendingPeriod(int64_t ms) noexcept {
    pendingPeriodMs_.store(ms, std::memory_order_relaxed);
}

int64_t Notifier::pendingPeriod() const noexcept {
    return pendingPeriodMs_.load(std::memory_order_relaxed);
}

void Notifier::setDetectCreate(bool enabled) noexcept {
    detectCreate_.store(enabled, std::memory_order_relaxed);
}

void Notifier::requeue(Event event) {
    auto name = event.name;
    if (!events_.post(std::move(event))) {
        FWR_LOG_DEBUG(LogCategory::Notify, "requeue dropped (closed): " + name);
    }
}

std::vector<std::string> Notifier::watchedDirectories() const {
    std::lock_guard lock(dirsMutex_);
    return watchDirs_;
}

void Notifier::close() {
    if (closed_.exchange(true)) {
        return;
    }
    source_->close();
    events_.close();
    errors_.close();
    if (feedThread_.joinable()) {
        feedThread_.join();
    }
}

bool Notifier::isClosed() const noexcept {
    return closed_.load();
}

void Notifier::addWatch(const std::string& dir) {
    {
        std::lock_guard lock(dirsMutex_);
        if (std::find(watchDirs_.begin(), watchDirs_.end(), dir) != watchDirs_.end()) {
            return;
        }
    }
    auto added = source_->add(dir);
    if (!added) {
        FWR_LOG_ERROR(LogCategory::Watch,
                      dir + ": " + std::string(added.error().message()));
        return;
    }
    FWR_LOG_INFO(LogCategory::Watch, "gazing at: " + dir);

    std::lock_guard lock(dirsMutex_);
    watchDirs_.push_back(dir);
}

void Notifier::feedLoop() {
    while (auto next = source_->next()) {
        if (next->hasError()) {
            if (!errors_.send(next->error())) {
                return;
            }
            continue;
        }
        if (!handle(next->value())) {
            return;
        }
    }
}

bool Notifier::handle(const RawEvent& raw) {
    auto name = foundation::cleanPath(raw.name);

    // A directory created in, or moved into, the tree joins the watch set.
    if ((hasOp(raw.op, Op::Create) || hasOp(raw.op, Op::Rename)) && foundation::isDir(name)) {
        addWatch(name);
    }

    if (!shouldExecute(name, raw.op)) {
        return true;
    }
    FWR_LOG_DEBUG(LogCategory::Notify, "notified: " + name + ": " + opName(raw.op));

    auto& last = times_[name];
    auto now = std::max(foundation::nowNanos(), last);
    last = now;
    return events_.send(Event{name, now});
}

bool Notifier::shouldExecute(const std::string& path, Op op) {
    bool detectCreate = detectCreate_.load(std::memory_order_relaxed);
    if (op != Op::Write && op != Op::Rename && !(detectCreate && op == Op::Create)) {
        FWR_LOG_DEBUG(LogCategory::Notify,
                      "skipped: " + path + ": " + opName(op) + " (Op is not applicable)");
        return false;
    }

    if (!foundation::isFile(path)) {
        FWR_LOG_DEBUG(LogCategory::Notify,
                      "skipped: " + path + ": " + opName(op) + " (not a file)");
        return false;
    }

    int64_t lastExecutionTime = 0;
    if (auto it = times_.find(path); it != times_.end()) {
        lastExecutionTime = it->second;
    }
    int64_t modified = foundation::modifiedTime(path);

    if (op == Op::Write || op == Op::Create) {
        int64_t elapsed = modified - lastExecutionTime;
        FWR_LOG_DEBUG(LogCategory::Notify,
                      "lastExecutionTime(" + opName(op) + "): " +
                          std::to_string(lastExecutionTime) + ", " + std::to_string(elapsed));
        if (elapsed < pendingPeriod() * kNanosPerMilli) {
            FWR_LOG_DEBUG(LogCategory::Notify,
                          "skipped: " + path + ": " + opName(op) + " (too frequent)");
            return false;
        }
    }
    if (op == Op::Rename) {
        int64_t elapsed = foundation::nowNanos() - modified;
        FWR_LOG_DEBUG(LogCategory::Notify,
                      "lastExecutionTime(" + opName(op) + "): " +
                          std::to_string(lastExecutionTime) + ", " + std::to_string(elapsed));
        if (elapsed > kRegardRenameAsModPeriodMs * kNanosPerMilli) {
            FWR_LOG_DEBUG(LogCategory::Notify,
                          "skipped: " + path + ": " + opName(op) + " (unnatural rename)");
            return false;
        }
    }
    return true;
}

} // namespace fwr::watch
