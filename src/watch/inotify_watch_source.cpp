/// @file inotify_watch_source.cpp
/// @brief inotify-backed WatchSource.

#include "fwr/watch/inotify_watch_source.hpp"

#include <array>
#include <cerrno>
#include <cstring>

#include <fcntl.h>
#include <poll.h>
#include <sys/inotify.h>
#include <unistd.h>

#include "fwr/foundation/watch_logger.hpp"

namespace fwr::watch {

using foundation::ErrorCode;
using foundation::LogCategory;
using foundation::WatchError;
using foundation::WatchResult;

namespace {

constexpr uint32_t kWatchMask = IN_CREATE | IN_MODIFY | IN_MOVED_FROM | IN_MOVED_TO |
                                IN_DELETE | IN_DELETE_SELF | IN_MOVE_SELF | IN_ATTRIB |
                                IN_ONLYDIR;

Op translateMask(uint32_t mask) {
    Op op = Op::None;
    if ((mask & IN_CREATE) != 0) {
        op = op | Op::Create;
    }
    if ((mask & IN_MODIFY) != 0) {
        op = op | Op::Write;
    }
    if ((mask & (IN_MOVED_TO | IN_MOVED_FROM | IN_MOVE_SELF)) != 0) {
        op = op | Op::Rename;
    }
    if ((mask & (IN_DELETE | IN_DELETE_SELF)) != 0) {
        op = op | Op::Remove;
    }
    if ((mask & IN_ATTRIB) != 0) {
        op = op | Op::Chmod;
    }
    return op;
}

WatchError sysError(ErrorCode code, const std::string& what) {
    int err = errno;
    return WatchError(code, what + ": " + std::strerror(err), err);
}

}  // namespace

WatchResult<std::unique_ptr<InotifyWatchSource>> InotifyWatchSource::create() {
    using ResultType = WatchResult<std::unique_ptr<InotifyWatchSource>>;

    int fd = ::inotify_init1(IN_NONBLOCK | IN_CLOEXEC);
    if (fd < 0) {
        return ResultType::err(sysError(ErrorCode::WatchInitFailed, "inotify_init1"));
    }

    std::array<int, 2> pipeFds{-1, -1};
    if (::pipe2(pipeFds.data(), O_NONBLOCK | O_CLOEXEC) != 0) {
        auto error = sysError(ErrorCode::WatchInitFailed, "pipe2");
        ::close(fd);
        return ResultType::err(std::move(error));
    }

    return ResultType::ok(
        std::make_unique<InotifyWatchSource>(Token{}, fd, pipeFds[0], pipeFds[1]));
}

InotifyWatchSource::InotifyWatchSource(Token, int inotifyFd, int wakeReadFd, int wakeWriteFd)
    : inotifyFd_(inotifyFd), wakeReadFd_(wakeReadFd), wakeWriteFd_(wakeWriteFd) {}

InotifyWatchSource::~InotifyWatchSource() {
    close();
    ::close(inotifyFd_);
    ::close(wakeReadFd_);
    ::close(wakeWriteFd_);
}

WatchResult<void> InotifyWatchSource::add(const std::filesystem::path& dir) {
    if (closed_.load(std::memory_order_acquire)) {
        return WatchResult<void>::err(
            WatchError(ErrorCode::WatchClosed, "watch source is closed"));
    }

    int wd = ::inotify_add_watch(inotifyFd_, dir.c_str(), kWatchMask);
    if (wd < 0) {
        return WatchResult<void>::err(sysError(ErrorCode::WatchAddFailed, dir.string()));
    }

    std::lock_guard lock(mutex_);
    wdToPath_[wd] = dir.string();
    return WatchResult<void>::ok();
}

std::optional<WatchResult<RawEvent>> InotifyWatchSource::next() {
    while (!closed_.load(std::memory_order_acquire)) {
        if (!pending_.empty()) {
            auto front = std::move(pending_.front());
            pending_.pop_front();
            return front;
        }

        std::array<pollfd, 2> fds{{{inotifyFd_, POLLIN, 0}, {wakeReadFd_, POLLIN, 0}}};
        int rc = ::poll(fds.data(), fds.size(), -1);
        if (rc < 0) {
            if (errno == EINTR) {
                continue;
            }
            return WatchResult<RawEvent>::err(sysError(ErrorCode::WatchSourceError, "poll"));
        }
        if (fds[1].revents != 0) {
            break;
        }
        if ((fds[0].revents & POLLIN) != 0) {
            readBatch();
        }
    }
    return std::nullopt;
}

void InotifyWatchSource::close() {
    if (closed_.exchange(true, std::memory_order_acq_rel)) {
        return;
    }
    char byte = 1;
    if (::write(wakeWriteFd_, &byte, 1) < 0) {
        FWR_LOG_WARN(LogCategory::Watch,
                     std::string("failed to wake inotify reader: ") + std::strerror(errno));
    }
}

std::size_t InotifyWatchSource::watchCount() const {
    std::lock_guard lock(mutex_);
    return wdToPath_.size();
}

void InotifyWatchSource::readBatch() {
    alignas(inotify_event) std::array<char, 16 * 1024> buffer{};

    ssize_t len = ::read(inotifyFd_, buffer.data(), buffer.size());
    if (len < 0) {
        if (errno != EAGAIN && errno != EINTR) {
            pending_.push_back(
                WatchResult<RawEvent>::err(sysError(ErrorCode::WatchSourceError, "read")));
        }
        return;
    }

    std::size_t offset = 0;
    while (offset + sizeof(inotify_event) <= static_cast<std::size_t>(len)) {
        const auto* record = reinterpret_cast<const inotify_event*>(buffer.data() + offset);  // NOLINT(cppcoreguidelines-pro-type-reinterpret-cast)
        offset += sizeof(inotify_event) + record->len;

        if ((record->mask & IN_Q_OVERFLOW) != 0) {
            pending_.push_back(WatchResult<RawEvent>::err(
                WatchError(ErrorCode::WatchSourceError, "inotify event queue overflow")));
            continue;
        }

        std::string dir;
        {
            std::lock_guard lock(mutex_);
            auto it = wdToPath_.find(record->wd);
            if (it == wdToPath_.end()) {
                continue;
            }
            if ((record->mask & IN_IGNORED) != 0) {
                wdToPath_.erase(it);
                continue;
            }
            dir = it->second;
        }

        auto op = translateMask(record->mask);
        if (op == Op::None) {
            continue;
        }

        RawEvent event;
        event.name = record->len > 0 ? dir + "/" + record->name : dir;
        event.op = op;
        pending_.push_back(WatchResult<RawEvent>::ok(std::move(event)));
    }
}

} // namespace fwr::watch
