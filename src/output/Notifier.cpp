// SPDX-License-Identifier: Apache-2.0
#include "Notifier.hpp"

#include <core/Log.hpp>

#include <chrono>
#include <utility>

namespace dictum
{

namespace
{
    constexpr auto NotifyTimeout = std::chrono::milliseconds { 2000 };

    auto urgencyFor(NotificationKind kind) -> std::string_view
    {
        switch (kind)
        {
            case NotificationKind::Success: return "low";
            case NotificationKind::Warning: return "normal";
            case NotificationKind::Error: return "critical";
        }
        return "normal";
    }
} // namespace

DesktopNotifier::DesktopNotifier(ProcessRunner* runner, std::string command):
    _runner(runner), _command(std::move(command))
{
    if (_runner && !_command.empty())
        _worker = std::jthread([this](const std::stop_token& token) { run(token); });
}

DesktopNotifier::~DesktopNotifier()
{
    flush();
}

void DesktopNotifier::notify(std::string_view message, NotificationKind kind)
{
    switch (kind)
    {
        case NotificationKind::Success: log::info("Notification: {}", message); break;
        case NotificationKind::Warning: log::warning("Notification: {}", message); break;
        case NotificationKind::Error: log::error("Notification: {}", message); break;
    }

    if (!_worker.joinable())
        return;

    {
        auto const lock = std::lock_guard(_mutex);
        _queue.push_back(Pending { .message = std::string(message), .kind = kind });
    }
    _cv.notify_all();
}

void DesktopNotifier::flush()
{
    auto lock = std::unique_lock(_mutex);
    _cv.wait(lock, [this] { return _queue.empty() && !_busy; });
}

void DesktopNotifier::run(const std::stop_token& stopToken)
{
    while (true)
    {
        auto pending = Pending {};
        {
            auto lock = std::unique_lock(_mutex);
            _cv.wait(lock, stopToken, [this] { return !_queue.empty(); });
            if (_queue.empty())
                return;
            pending = std::move(_queue.front());
            _queue.pop_front();
            _busy = true;
        }

        show(pending);

        {
            auto const lock = std::lock_guard(_mutex);
            _busy = false;
        }
        _cv.notify_all();
    }
}

void DesktopNotifier::show(const Pending& pending)
{
    auto const spec = ProcessSpec {
        .command = _command,
        .args = { "-a", "dictum", "-u", std::string(urgencyFor(pending.kind)), "Dictum", pending.message },
        .sensitiveArgs = { 5 },
    };
    auto const output = _runner->run(spec, NotifyTimeout);
    if (!output)
        log::debug("Desktop notification failed: {}", output.error());
    else if (output->exitCode != 0)
        log::debug("{} exited with code {}", _command, output->exitCode);
}

} // namespace dictum
