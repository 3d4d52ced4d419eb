// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Types.hpp>
#include <process/ProcessRunner.hpp>

#include <condition_variable>
#include <deque>
#include <mutex>
#include <stop_token>
#include <string>
#include <string_view>
#include <thread>

namespace dictum
{

[[nodiscard]] constexpr auto notificationKindName(NotificationKind kind) -> std::string_view
{
    switch (kind)
    {
        case NotificationKind::Success: return "Success";
        case NotificationKind::Warning: return "Warning";
        case NotificationKind::Error: return "Error";
    }
    return "Unknown";
}

/// @brief Abstract interface for operator-facing notifications. Fire-and-forget.
class Notifier
{
  public:
    virtual ~Notifier() = default;

    virtual void notify(std::string_view message, NotificationKind kind) = 0;
};

/// @brief Logs every notification and optionally shows it on the desktop via notify-send.
///
/// notify() logs on the calling thread and returns immediately. The notification command runs
/// on a worker thread, one at a time in submission order. Pending notifications are still shown
/// when the notifier is destroyed.
class DesktopNotifier: public Notifier
{
  public:
    /// @param runner Used to run the notification command; nullptr disables desktop notifications.
    /// @param command Program receiving "-a dictum -u <urgency> <title> <message>".
    explicit DesktopNotifier(ProcessRunner* runner, std::string command = "notify-send");
    ~DesktopNotifier() override;

    DesktopNotifier(const DesktopNotifier&) = delete;
    DesktopNotifier& operator=(const DesktopNotifier&) = delete;

    void notify(std::string_view message, NotificationKind kind) override;

    /// @brief Blocks until every queued notification command has finished.
    void flush();

  private:
    struct Pending
    {
        std::string message;
        NotificationKind kind;
    };

    void run(const std::stop_token& stopToken);
    void show(const Pending& pending);

    ProcessRunner* _runner;
    std::string _command;

    std::mutex _mutex;
    std::condition_variable_any _cv;
    std::deque<Pending> _queue;
    bool _busy = false;
    std::jthread _worker; ///< Last member: joined before the queue is destroyed.
};

} // namespace dictum
