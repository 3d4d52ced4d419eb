// SPDX-License-Identifier: Apache-2.0
#include "ProcessRunner.hpp"

#include <core/Log.hpp>

#include <algorithm>
#include <array>
#include <cstring>
#include <format>
#include <string_view>

#ifdef _WIN32
    #define WIN32_LEAN_AND_MEAN
    #include <windows.h>

    #include <thread>
#else
    #include <sys/wait.h>

    #include <cerrno>
    #include <mutex>

    #include <fcntl.h>
    #include <poll.h>
    #include <signal.h>
    #include <spawn.h>
    #include <unistd.h>

extern char** environ;
#endif

namespace dictum
{

using namespace std::chrono_literals;

auto describe(const ProcessSpec& spec, bool redact) -> std::string
{
    auto line = spec.command;
    for (auto i = std::size_t { 0 }; i < spec.args.size(); ++i)
    {
        auto const& arg = spec.args[i];
        line += ' ';
        if (redact && spec.sensitiveArgs.contains(i))
            line += std::format("<{} chars>", arg.size());
        else if (arg.empty() || arg.find_first_of(" \t\n\"'") != std::string::npos)
            line += std::format("\"{}\"", arg);
        else
            line += arg;
    }
    return line;
}

#ifdef _WIN32

namespace
{

    auto quoteArgument(std::string_view arg) -> std::string
    {
        if (!arg.empty() && arg.find_first_of(" \t\n\"") == std::string_view::npos)
            return std::string(arg);

        auto quoted = std::string { "\"" };
        auto backslashes = std::size_t { 0 };
        for (auto const ch: arg)
        {
            if (ch == '\\')
            {
                ++backslashes;
                continue;
            }
            if (ch == '"')
                quoted.append(backslashes * 2 + 1, '\\');
            else
                quoted.append(backslashes, '\\');
            backslashes = 0;
            quoted += ch;
        }
        quoted.append(backslashes * 2, '\\');
        quoted += '"';
        return quoted;
    }

    void readAll(HANDLE handle, std::string& out)
    {
        auto buf = std::array<char, 4096> {};
        DWORD bytesRead = 0;
        while (ReadFile(handle, buf.data(), static_cast<DWORD>(buf.size()), &bytesRead, nullptr) && bytesRead > 0)
            out.append(buf.data(), bytesRead);
    }

    void closeHandle(HANDLE& handle)
    {
        if (handle != nullptr && handle != INVALID_HANDLE_VALUE)
        {
            CloseHandle(handle);
            handle = INVALID_HANDLE_VALUE;
        }
    }

} // namespace

auto SubprocessRunner::run(const ProcessSpec& spec, std::chrono::milliseconds timeout) -> Result<ProcessOutput>
{
    auto const started = std::chrono::steady_clock::now();

    SECURITY_ATTRIBUTES sa {};
    sa.nLength = sizeof(sa);
    sa.bInheritHandle = TRUE;

    HANDLE stdinRead = INVALID_HANDLE_VALUE, stdinWrite = INVALID_HANDLE_VALUE;
    HANDLE stdoutRead = INVALID_HANDLE_VALUE, stdoutWrite = INVALID_HANDLE_VALUE;
    HANDLE stderrRead = INVALID_HANDLE_VALUE, stderrWrite = INVALID_HANDLE_VALUE;

    if (!CreatePipe(&stdinRead, &stdinWrite, &sa, 0) || !CreatePipe(&stdoutRead, &stdoutWrite, &sa, 0)
        || !CreatePipe(&stderrRead, &stderrWrite, &sa, 0))
    {
        for (auto* h: { &stdinRead, &stdinWrite, &stdoutRead, &stdoutWrite, &stderrRead, &stderrWrite })
            closeHandle(*h);
        return makeError(ErrorCode::ProcessError, "Failed to create process pipes");
    }

    SetHandleInformation(stdinWrite, HANDLE_FLAG_INHERIT, 0);
    SetHandleInformation(stdoutRead, HANDLE_FLAG_INHERIT, 0);
    SetHandleInformation(stderrRead, HANDLE_FLAG_INHERIT, 0);

    auto cmdLine = quoteArgument(spec.command);
    for (const auto& arg: spec.args)
        cmdLine += " " + quoteArgument(arg);

    // Environment block: inherited variables followed by overrides, each NUL terminated.
    auto envBlock = std::string {};
    if (!spec.env.empty())
    {
        if (auto* inherited = GetEnvironmentStringsA())
        {
            for (auto const* e = inherited; *e; e += std::strlen(e) + 1)
            {
                envBlock.append(e);
                envBlock.push_back('\0');
            }
            FreeEnvironmentStringsA(inherited);
        }
        for (const auto& [key, value]: spec.env)
        {
            envBlock.append(std::format("{}={}", key, value));
            envBlock.push_back('\0');
        }
        envBlock.push_back('\0');
    }

    // Every process the backend spawns joins the job and dies with it.
    auto job = CreateJobObjectA(nullptr, nullptr);
    JOBOBJECT_EXTENDED_LIMIT_INFORMATION limits {};
    limits.BasicLimitInformation.LimitFlags = JOB_OBJECT_LIMIT_KILL_ON_JOB_CLOSE;
    SetInformationJobObject(job, JobObjectExtendedLimitInformation, &limits, sizeof(limits));

    STARTUPINFOA si {};
    si.cb = sizeof(si);
    si.hStdInput = stdinRead;
    si.hStdOutput = stdoutWrite;
    si.hStdError = stderrWrite;
    si.dwFlags |= STARTF_USESTDHANDLES;

    PROCESS_INFORMATION pi {};
    if (!CreateProcessA(nullptr,
                        cmdLine.data(),
                        nullptr,
                        nullptr,
                        TRUE,
                        CREATE_SUSPENDED | CREATE_NO_WINDOW,
                        envBlock.empty() ? nullptr : envBlock.data(),
                        nullptr,
                        &si,
                        &pi))
    {
        for (auto* h: { &stdinRead, &stdinWrite, &stdoutRead, &stdoutWrite, &stderrRead, &stderrWrite, &job })
            closeHandle(*h);
        return makeError(ErrorCode::ProcessError, std::format("Failed to start process: {}", spec.command));
    }

    AssignProcessToJobObject(job, pi.hProcess);
    ResumeThread(pi.hThread);
    CloseHandle(pi.hThread);

    closeHandle(stdinRead);
    closeHandle(stdoutWrite);
    closeHandle(stderrWrite);

    auto output = ProcessOutput {};
    auto stdoutReader = std::thread([&] { readAll(stdoutRead, output.stdoutText); });
    auto stderrReader = std::thread([&] { readAll(stderrRead, output.stderrText); });
    auto stdinWriter = std::thread([&] {
        if (spec.stdinData)
        {
            DWORD written = 0;
            WriteFile(stdinWrite, spec.stdinData->data(), static_cast<DWORD>(spec.stdinData->size()), &written, nullptr);
        }
        closeHandle(stdinWrite);
    });

    auto const waitResult = WaitForSingleObject(pi.hProcess, static_cast<DWORD>(timeout.count()));
    auto const timedOut = waitResult == WAIT_TIMEOUT;
    if (timedOut || spec.killDescendantsOnExit)
        TerminateJobObject(job, timedOut ? 1 : 0);
    WaitForSingleObject(pi.hProcess, INFINITE);

    stdinWriter.join();
    stdoutReader.join();
    stderrReader.join();

    DWORD exitCode = 0;
    GetExitCodeProcess(pi.hProcess, &exitCode);

    CloseHandle(pi.hProcess);
    closeHandle(stdoutRead);
    closeHandle(stderrRead);
    closeHandle(job);

    output.duration =
        std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started);

    if (timedOut)
    {
        log::warning("Process '{}' timed out after {} ms, job terminated", spec.command, timeout.count());
        return makeError(ErrorCode::Timeout,
                         std::format("'{}' did not finish within {} ms", spec.command, timeout.count()));
    }

    output.exitCode = static_cast<int>(exitCode);
    return output;
}

#else

namespace
{

    constexpr auto PollInterval = 20ms;

    /// @brief Owning file descriptor.
    struct Fd
    {
        int value = -1;

        Fd() = default;
        Fd(const Fd&) = delete;
        Fd& operator=(const Fd&) = delete;
        ~Fd() { reset(); }

        [[nodiscard]] auto valid() const -> bool { return value >= 0; }

        void reset()
        {
            if (value >= 0)
            {
                ::close(value);
                value = -1;
            }
        }
    };

    struct Pipe
    {
        Fd readEnd;
        Fd writeEnd;
    };

    auto makePipe(Pipe& pipe) -> bool
    {
        int fds[2];
        if (::pipe2(fds, O_CLOEXEC) != 0)
            return false;
        pipe.readEnd.value = fds[0];
        pipe.writeEnd.value = fds[1];
        return true;
    }

    void setNonBlocking(const Fd& fd)
    {
        auto const flags = ::fcntl(fd.value, F_GETFL, 0);
        ::fcntl(fd.value, F_SETFL, flags | O_NONBLOCK);
    }

    /// @brief Ignores SIGPIPE in this process so a backend closing stdin early cannot kill us.
    void ignoreSigpipe()
    {
        static auto once = std::once_flag {};
        std::call_once(once, [] { ::signal(SIGPIPE, SIG_IGN); });
    }

    /// @brief Reads whatever is currently available; closes the descriptor on EOF or error.
    void drain(Fd& fd, std::string& out)
    {
        if (!fd.valid())
            return;

        auto buf = std::array<char, 4096> {};
        while (true)
        {
            auto const n = ::read(fd.value, buf.data(), buf.size());
            if (n > 0)
            {
                out.append(buf.data(), static_cast<std::size_t>(n));
                continue;
            }
            if (n < 0 && errno == EINTR)
                continue;
            if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK))
                return;
            fd.reset();
            return;
        }
    }

    auto decodeWaitStatus(int status) -> int
    {
        if (WIFEXITED(status))
            return WEXITSTATUS(status);
        if (WIFSIGNALED(status))
            return 128 + WTERMSIG(status);
        return -1;
    }

    void reap(pid_t pid, int& status)
    {
        while (::waitpid(pid, &status, 0) < 0 && errno == EINTR)
            ;
    }

} // namespace

auto SubprocessRunner::run(const ProcessSpec& spec, std::chrono::milliseconds timeout) -> Result<ProcessOutput>
{
    ignoreSigpipe();

    auto const started = std::chrono::steady_clock::now();
    auto const deadline = started + timeout;

    auto stdinPipe = Pipe {};
    auto stdoutPipe = Pipe {};
    auto stderrPipe = Pipe {};
    if (!makePipe(stdinPipe) || !makePipe(stdoutPipe) || !makePipe(stderrPipe))
        return makeError(ErrorCode::ProcessError, std::format("Failed to create pipes: {}", strerror(errno)));

    posix_spawn_file_actions_t actions;
    posix_spawn_file_actions_init(&actions);
    posix_spawn_file_actions_adddup2(&actions, stdinPipe.readEnd.value, STDIN_FILENO);
    posix_spawn_file_actions_adddup2(&actions, stdoutPipe.writeEnd.value, STDOUT_FILENO);
    posix_spawn_file_actions_adddup2(&actions, stderrPipe.writeEnd.value, STDERR_FILENO);

    // The child leads a new process group so a timeout can kill it together with its workers.
    posix_spawnattr_t attr;
    posix_spawnattr_init(&attr);
    sigset_t defaultSignals;
    sigemptyset(&defaultSignals);
    sigaddset(&defaultSignals, SIGPIPE);
    posix_spawnattr_setsigdefault(&attr, &defaultSignals);
    sigset_t noMask;
    sigemptyset(&noMask);
    posix_spawnattr_setsigmask(&attr, &noMask);
    posix_spawnattr_setpgroup(&attr, 0);
    posix_spawnattr_setflags(&attr, POSIX_SPAWN_SETPGROUP | POSIX_SPAWN_SETSIGDEF | POSIX_SPAWN_SETSIGMASK);

    auto argv = std::vector<char*> {};
    auto cmdCopy = spec.command;
    argv.push_back(cmdCopy.data());
    auto argCopies = std::vector<std::string>(spec.args);
    for (auto& arg: argCopies)
        argv.push_back(arg.data());
    argv.push_back(nullptr);

    // Build environment (inherit + spec overrides)
    auto envStrings = std::vector<std::string> {};
    if (environ)
    {
        for (auto** e = environ; *e; ++e)
        {
            auto entry = std::string_view(*e);
            auto const key = entry.substr(0, entry.find('='));
            if (!spec.env.contains(std::string(key)))
                envStrings.emplace_back(entry);
        }
    }
    for (const auto& [key, value]: spec.env)
        envStrings.push_back(std::format("{}={}", key, value));

    auto envp = std::vector<char*> {};
    for (auto& s: envStrings)
        envp.push_back(s.data());
    envp.push_back(nullptr);

    pid_t pid = -1;
    auto const status = posix_spawnp(&pid, spec.command.c_str(), &actions, &attr, argv.data(), envp.data());
    posix_spawn_file_actions_destroy(&actions);
    posix_spawnattr_destroy(&attr);

    stdinPipe.readEnd.reset();
    stdoutPipe.writeEnd.reset();
    stderrPipe.writeEnd.reset();

    if (status != 0)
        return makeError(ErrorCode::ProcessError,
                         std::format("Failed to spawn process '{}': {}", spec.command, strerror(status)));

    log::debug("Spawned '{}' (pid {})", spec.command, pid);

    auto& stdinFd = stdinPipe.writeEnd;
    auto& stdoutFd = stdoutPipe.readEnd;
    auto& stderrFd = stderrPipe.readEnd;

    auto const payload = spec.stdinData ? std::string_view(*spec.stdinData) : std::string_view {};
    auto written = std::size_t { 0 };
    if (payload.empty())
        stdinFd.reset();
    else
        setNonBlocking(stdinFd);
    setNonBlocking(stdoutFd);
    setNonBlocking(stderrFd);

    auto output = ProcessOutput {};
    auto waitStatus = 0;
    auto exited = false;
    auto timedOut = false;

    while (true)
    {
        if (::waitpid(pid, &waitStatus, WNOHANG) == pid)
        {
            // The child is gone. Its output is already in the pipes; descendants that still
            // hold the write ends must not keep us waiting.
            exited = true;
            drain(stdoutFd, output.stdoutText);
            drain(stderrFd, output.stderrText);
            break;
        }

        auto const now = std::chrono::steady_clock::now();
        if (now >= deadline)
        {
            timedOut = true;
            break;
        }

        auto fds = std::array<struct pollfd, 3> {};
        auto nfds = nfds_t { 0 };
        if (stdoutFd.valid())
            fds[nfds++] = { .fd = stdoutFd.value, .events = POLLIN, .revents = 0 };
        if (stderrFd.valid())
            fds[nfds++] = { .fd = stderrFd.value, .events = POLLIN, .revents = 0 };
        if (stdinFd.valid())
            fds[nfds++] = { .fd = stdinFd.value, .events = POLLOUT, .revents = 0 };

        auto const remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        auto const waitMs = static_cast<int>(std::min(remaining, std::chrono::milliseconds(PollInterval)).count());
        if (::poll(fds.data(), nfds, waitMs) <= 0)
            continue;

        for (auto i = nfds_t { 0 }; i < nfds; ++i)
        {
            if (fds[i].revents == 0)
                continue;

            if (fds[i].fd == stdoutFd.value)
                drain(stdoutFd, output.stdoutText);
            else if (fds[i].fd == stderrFd.value)
                drain(stderrFd, output.stderrText);
            else if (fds[i].fd == stdinFd.value)
            {
                if ((fds[i].revents & (POLLERR | POLLHUP)) != 0)
                {
                    stdinFd.reset();
                    continue;
                }
                auto const n = ::write(stdinFd.value, payload.data() + written, payload.size() - written);
                if (n > 0)
                    written += static_cast<std::size_t>(n);
                else if (n < 0 && errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR)
                    stdinFd.reset();
                if (written >= payload.size())
                    stdinFd.reset();
            }
        }
    }

    // Kill the whole group: on timeout this stops the backend, otherwise it clears leftover workers.
    auto const groupKilled = (timedOut || spec.killDescendantsOnExit) && ::kill(-pid, SIGKILL) == 0;
    if (!exited)
        reap(pid, waitStatus);

    output.duration =
        std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started);

    if (timedOut)
    {
        log::warning("Process '{}' (pid {}) timed out after {} ms, process group killed",
                     spec.command,
                     pid,
                     timeout.count());
        return makeError(ErrorCode::Timeout,
                         std::format("'{}' did not finish within {} ms", spec.command, timeout.count()));
    }

    if (groupKilled)
        log::debug("Terminated leftover descendants of pid {}", pid);

    output.exitCode = decodeWaitStatus(waitStatus);
    return output;
}

#endif

} // namespace dictum
