// SPDX-License-Identifier: Apache-2.0
#include "ProcessCommandRunner.hpp"

#include <core/Log.hpp>
#include <core/StringUtils.hpp>

#include <array>
#include <format>

#ifdef _WIN32
    #define WIN32_LEAN_AND_MEAN
    #include <windows.h>

    #include <thread>
#else
    #include <sys/wait.h>

    #include <cerrno>
    #include <cstring>
    #include <fcntl.h>
    #include <poll.h>
    #include <spawn.h>
    #include <unistd.h>
#endif

namespace mcpman
{

namespace
{

#ifdef _WIN32
    auto quoteArgument(const std::string& arg) -> std::string
    {
        if (!arg.empty() && arg.find_first_of(" \t\"") == std::string::npos)
            return arg;

        auto quoted = std::string("\"");
        auto backslashes = size_t { 0 };
        for (auto ch: arg)
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

    auto buildCommandLine(const std::vector<std::string>& argv) -> std::string
    {
        auto cmdLine = std::string {};
        for (const auto& arg: argv)
        {
            if (!cmdLine.empty())
                cmdLine += ' ';
            cmdLine += quoteArgument(arg);
        }
        return cmdLine;
    }

    // CreateProcess expects "K=V\0K=V\0\0".
    auto buildEnvironmentBlock(const std::map<std::string, std::string>& env) -> std::string
    {
        auto block = std::string {};
        for (const auto& [key, value]: env)
        {
            block += std::format("{}={}", key, value);
            block += '\0';
        }
        block += '\0';
        return block;
    }

    void drain(HANDLE handle, std::string& sink)
    {
        auto buf = std::array<char, 4096> {};
        DWORD bytesRead = 0;
        while (ReadFile(handle, buf.data(), static_cast<DWORD>(buf.size()), &bytesRead, nullptr) && bytesRead > 0)
            sink.append(buf.data(), bytesRead);
    }
#else
    struct SpawnArguments
    {
        std::vector<std::string> strings;
        std::vector<char*> argv;
        std::vector<std::string> envStrings;
        std::vector<char*> envp;
    };

    auto prepareSpawnArguments(std::vector<std::string> argvStrings, const std::map<std::string, std::string>& env)
        -> SpawnArguments
    {
        auto spawnArgs = SpawnArguments { .strings = std::move(argvStrings) };
        for (auto& arg: spawnArgs.strings)
            spawnArgs.argv.push_back(arg.data());
        spawnArgs.argv.push_back(nullptr);

        for (const auto& [key, value]: env)
            spawnArgs.envStrings.push_back(std::format("{}={}", key, value));
        for (auto& s: spawnArgs.envStrings)
            spawnArgs.envp.push_back(s.data());
        spawnArgs.envp.push_back(nullptr);
        return spawnArgs;
    }

    auto addWorkingDirectory(posix_spawn_file_actions_t& actions, const std::optional<std::string>& dir)
        -> VoidResult
    {
        if (!dir)
            return {};
    #if defined(__GLIBC__) || defined(__APPLE__)
        if (auto const rc = posix_spawn_file_actions_addchdir_np(&actions, dir->c_str()); rc != 0)
            return makeError(ErrorCode::ProcessError,
                             std::format("Cannot use working directory '{}': {}", *dir, strerror(rc)));
        return {};
    #else
        return makeError(ErrorCode::Unsupported, "Setting the working directory is not supported on this platform");
    #endif
    }

    auto waitForExit(pid_t pid) -> int
    {
        int status = 0;
        while (waitpid(pid, &status, 0) < 0)
        {
            if (errno != EINTR)
                return -1;
        }
        if (WIFEXITED(status))
            return WEXITSTATUS(status);
        if (WIFSIGNALED(status))
            return 128 + WTERMSIG(status);
        return -1;
    }
#endif

} // namespace

ProcessCommandRunner::ProcessCommandRunner(ProcessCommandRunnerConfig config): _config(std::move(config))
{
}

ProcessCommandRunner::~ProcessCommandRunner()
{
    if (auto const running = reapDetachedChildren(); running > 0)
        log::debug("{} detached process(es) still running", running);
}

auto ProcessCommandRunner::reapDetachedChildren() -> std::size_t
{
#ifdef _WIN32
    // Process handles are closed right after CreateProcess; nothing is left to collect.
    return 0;
#else
    auto const lock = std::lock_guard(_childrenMutex);
    std::erase_if(_detachedChildren, [](pid_t pid) {
        int status = 0;
        auto const rc = waitpid(pid, &status, WNOHANG);
        if (rc == pid)
            log::debug("Detached process {} exited", pid);
        // 0 means still running; an error means it is no longer our child.
        return rc != 0;
    });
    return _detachedChildren.size();
#endif
}

auto ProcessCommandRunner::fullArgs(const std::vector<std::string>& args) const -> std::vector<std::string>
{
    auto argv = std::vector<std::string> { _config.binary };
    argv.insert(argv.end(), _config.baseArgs.begin(), _config.baseArgs.end());
    argv.insert(argv.end(), args.begin(), args.end());
    return argv;
}

auto ProcessCommandRunner::run(const std::vector<std::string>& args,
                               const std::optional<std::string>& workingDirectory) -> Result<CommandOutput>
{
    reapDetachedChildren();

    auto const argvStrings = fullArgs(args);
    auto const& cwd = workingDirectory ? workingDirectory : _config.workingDirectory;
    log::info("Executing: {}", strings::join(argvStrings, " "));

    auto output = CommandOutput {};

#ifdef _WIN32
    SECURITY_ATTRIBUTES sa {};
    sa.nLength = sizeof(sa);
    sa.bInheritHandle = TRUE;

    HANDLE stdoutRead, stdoutWrite, stderrRead, stderrWrite;
    if (!CreatePipe(&stdoutRead, &stdoutWrite, &sa, 0))
        return makeError(ErrorCode::ProcessError, "Failed to create stdout pipe");
    if (!CreatePipe(&stderrRead, &stderrWrite, &sa, 0))
    {
        CloseHandle(stdoutRead);
        CloseHandle(stdoutWrite);
        return makeError(ErrorCode::ProcessError, "Failed to create stderr pipe");
    }

    SetHandleInformation(stdoutRead, HANDLE_FLAG_INHERIT, 0);
    SetHandleInformation(stderrRead, HANDLE_FLAG_INHERIT, 0);

    auto const nullInput =
        CreateFileA("NUL", GENERIC_READ, FILE_SHARE_READ | FILE_SHARE_WRITE, &sa, OPEN_EXISTING, 0, nullptr);
    if (nullInput == INVALID_HANDLE_VALUE)
    {
        for (auto handle: { stdoutRead, stdoutWrite, stderrRead, stderrWrite })
            CloseHandle(handle);
        return makeError(ErrorCode::ProcessError, "Failed to open NUL for the child's stdin");
    }

    auto cmdLine = buildCommandLine(argvStrings);
    auto envBlock = buildEnvironmentBlock(_config.env);

    STARTUPINFOA si {};
    si.cb = sizeof(si);
    si.hStdInput = nullInput;
    si.hStdOutput = stdoutWrite;
    si.hStdError = stderrWrite;
    si.dwFlags |= STARTF_USESTDHANDLES;

    PROCESS_INFORMATION pi {};
    auto const started = CreateProcessA(nullptr,
                                        cmdLine.data(),
                                        nullptr,
                                        nullptr,
                                        TRUE,
                                        CREATE_NO_WINDOW,
                                        envBlock.data(),
                                        cwd ? cwd->c_str() : nullptr,
                                        &si,
                                        &pi);
    CloseHandle(nullInput);
    CloseHandle(stdoutWrite);
    CloseHandle(stderrWrite);

    if (!started)
    {
        CloseHandle(stdoutRead);
        CloseHandle(stderrRead);
        return makeError(ErrorCode::ProcessError, std::format("Failed to start process: {}", _config.binary));
    }
    CloseHandle(pi.hThread);

    auto stderrReader = std::thread([&] { drain(stderrRead, output.stderrText); });
    drain(stdoutRead, output.stdoutText);
    stderrReader.join();

    CloseHandle(stdoutRead);
    CloseHandle(stderrRead);

    WaitForSingleObject(pi.hProcess, INFINITE);
    DWORD exitCode = 0;
    GetExitCodeProcess(pi.hProcess, &exitCode);
    CloseHandle(pi.hProcess);
    output.exitCode = static_cast<int>(exitCode);
#else
    int stdoutPipe[2];
    int stderrPipe[2];

    if (pipe(stdoutPipe) != 0)
        return makeError(ErrorCode::ProcessError, "Failed to create stdout pipe");
    if (pipe(stderrPipe) != 0)
    {
        ::close(stdoutPipe[0]);
        ::close(stdoutPipe[1]);
        return makeError(ErrorCode::ProcessError, "Failed to create stderr pipe");
    }

    auto const closeAll = [&] {
        for (auto fd: { stdoutPipe[0], stdoutPipe[1], stderrPipe[0], stderrPipe[1] })
            ::close(fd);
    };

    posix_spawn_file_actions_t actions;
    posix_spawn_file_actions_init(&actions);
    posix_spawn_file_actions_addopen(&actions, STDIN_FILENO, "/dev/null", O_RDONLY, 0);
    posix_spawn_file_actions_adddup2(&actions, stdoutPipe[1], STDOUT_FILENO);
    posix_spawn_file_actions_adddup2(&actions, stderrPipe[1], STDERR_FILENO);
    posix_spawn_file_actions_addclose(&actions, stdoutPipe[0]);
    posix_spawn_file_actions_addclose(&actions, stderrPipe[0]);
    posix_spawn_file_actions_addclose(&actions, stdoutPipe[1]);
    posix_spawn_file_actions_addclose(&actions, stderrPipe[1]);

    if (auto chdirResult = addWorkingDirectory(actions, cwd); !chdirResult)
    {
        posix_spawn_file_actions_destroy(&actions);
        closeAll();
        return std::unexpected(chdirResult.error());
    }

    auto spawnArgs = prepareSpawnArguments(argvStrings, _config.env);

    pid_t pid;
    auto const status =
        posix_spawnp(&pid, spawnArgs.argv[0], &actions, nullptr, spawnArgs.argv.data(), spawnArgs.envp.data());
    posix_spawn_file_actions_destroy(&actions);

    ::close(stdoutPipe[1]);
    ::close(stderrPipe[1]);

    if (status != 0)
    {
        ::close(stdoutPipe[0]);
        ::close(stderrPipe[0]);
        return makeError(ErrorCode::ProcessError,
                         std::format("Failed to spawn process '{}': {}", _config.binary, strerror(status)));
    }

    auto fds = std::array<pollfd, 2> { {
        { .fd = stdoutPipe[0], .events = POLLIN, .revents = 0 },
        { .fd = stderrPipe[0], .events = POLLIN, .revents = 0 },
    } };
    auto sinks = std::array<std::string*, 2> { &output.stdoutText, &output.stderrText };
    auto openCount = 2;
    auto buf = std::array<char, 4096> {};
    auto pollError = 0;

    while (openCount > 0)
    {
        if (::poll(fds.data(), fds.size(), -1) < 0)
        {
            if (errno == EINTR)
                continue;
            pollError = errno;
            break;
        }

        for (size_t i = 0; i < fds.size(); ++i)
        {
            if (fds[i].fd < 0 || fds[i].revents == 0)
                continue;

            auto const bytesRead = ::read(fds[i].fd, buf.data(), buf.size());
            if (bytesRead > 0)
            {
                sinks[i]->append(buf.data(), static_cast<size_t>(bytesRead));
                continue;
            }
            if (bytesRead < 0 && errno == EINTR)
                continue;

            ::close(fds[i].fd);
            fds[i].fd = -1;
            --openCount;
        }
    }

    for (auto& fd: fds)
    {
        if (fd.fd >= 0)
            ::close(fd.fd);
    }

    output.exitCode = waitForExit(pid);

    if (pollError != 0)
        return makeError(ErrorCode::ProcessError,
                         std::format("Failed to read output of '{}': {}", _config.binary, strerror(pollError)));
#endif

    log::debug("Process exited with code {} ({} bytes stdout, {} bytes stderr)",
               output.exitCode,
               output.stdoutText.size(),
               output.stderrText.size());
    return output;
}

auto ProcessCommandRunner::spawnDetached(const std::vector<std::string>& args) -> VoidResult
{
    reapDetachedChildren();

    auto const argvStrings = fullArgs(args);
    log::info("Starting detached: {}", strings::join(argvStrings, " "));

#ifdef _WIN32
    auto cmdLine = buildCommandLine(argvStrings);
    auto envBlock = buildEnvironmentBlock(_config.env);

    STARTUPINFOA si {};
    si.cb = sizeof(si);
    PROCESS_INFORMATION pi {};
    if (!CreateProcessA(nullptr,
                        cmdLine.data(),
                        nullptr,
                        nullptr,
                        FALSE,
                        DETACHED_PROCESS | CREATE_NO_WINDOW,
                        envBlock.data(),
                        _config.workingDirectory ? _config.workingDirectory->c_str() : nullptr,
                        &si,
                        &pi))
        return makeError(ErrorCode::ProcessError, std::format("Failed to start process: {}", _config.binary));

    CloseHandle(pi.hThread);
    CloseHandle(pi.hProcess);
#else
    posix_spawn_file_actions_t actions;
    posix_spawn_file_actions_init(&actions);
    posix_spawn_file_actions_addopen(&actions, STDIN_FILENO, "/dev/null", O_RDONLY, 0);
    posix_spawn_file_actions_addopen(&actions, STDOUT_FILENO, "/dev/null", O_WRONLY, 0);
    posix_spawn_file_actions_addopen(&actions, STDERR_FILENO, "/dev/null", O_WRONLY, 0);

    if (auto chdirResult = addWorkingDirectory(actions, _config.workingDirectory); !chdirResult)
    {
        posix_spawn_file_actions_destroy(&actions);
        return std::unexpected(chdirResult.error());
    }

    auto spawnArgs = prepareSpawnArguments(argvStrings, _config.env);

    pid_t pid;
    auto const status =
        posix_spawnp(&pid, spawnArgs.argv[0], &actions, nullptr, spawnArgs.argv.data(), spawnArgs.envp.data());
    posix_spawn_file_actions_destroy(&actions);

    if (status != 0)
        return makeError(ErrorCode::ProcessError,
                         std::format("Failed to spawn process '{}': {}", _config.binary, strerror(status)));
    log::debug("Detached process started with pid {}", pid);

    auto const lock = std::lock_guard(_childrenMutex);
    _detachedChildren.push_back(pid);
#endif

    return {};
}

} // namespace mcpman
