#include "CommandRunner.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <stdexcept>
#include <sys/types.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

namespace netsweep::common
{
    namespace
    {
        using Clock = std::chrono::steady_clock;

        int RemainingMs(Clock::time_point deadline)
        {
            auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now()).count();
            return left > 0 ? static_cast<int>(left) : 0;
        }

        void CloseFd(int &fd)
        {
            if (fd != -1)
            {
                close(fd);
                fd = -1;
            }
        }

        // Blocks until the child has exited. Kills it first if the deadline has passed.
        int ReapChild(pid_t pid, Clock::time_point deadline, bool &timedOut)
        {
            int status = 0;
            while (true)
            {
                pid_t ret = waitpid(pid, &status, WNOHANG);
                if (ret == pid)
                    break;
                if (ret == -1 && errno != EINTR)
                    return -1;

                if (Clock::now() >= deadline)
                {
                    timedOut = true;
                    kill(pid, SIGKILL);
                    while (waitpid(pid, &status, 0) == -1 && errno == EINTR)
                    {
                    }
                    return -1;
                }
                std::this_thread::sleep_for(std::chrono::milliseconds(5));
            }

            if (WIFEXITED(status))
                return WEXITSTATUS(status);
            return -1;
        }
    }

    CommandResult CommandRunner::Run(const std::vector<std::string> &argv, std::chrono::milliseconds deadline)
    {
        CommandResult result;
        if (argv.empty())
            return result;

        std::vector<char *> args;
        args.reserve(argv.size() + 1);
        for (const auto &arg : argv)
            args.push_back(const_cast<char *>(arg.c_str()));
        args.push_back(nullptr);

        // O_CLOEXEC keeps children forked by other scanning threads from holding our pipe ends open.
        int outPipe[2];
        if (pipe2(outPipe, O_CLOEXEC) == -1)
            throw std::runtime_error("Failed to create output pipe: " + std::string(std::strerror(errno)));

        int errPipe[2];
        if (pipe2(errPipe, O_CLOEXEC) == -1)
        {
            close(outPipe[0]);
            close(outPipe[1]);
            throw std::runtime_error("Failed to create exec status pipe: " + std::string(std::strerror(errno)));
        }

        int devNull = open("/dev/null", O_RDONLY | O_CLOEXEC);

        auto endAt = Clock::now() + deadline;
        pid_t pid = fork();
        if (pid == -1)
        {
            int err = errno;
            close(outPipe[0]);
            close(outPipe[1]);
            close(errPipe[0]);
            close(errPipe[1]);
            if (devNull != -1)
                close(devNull);
            throw std::runtime_error("Failed to fork: " + std::string(std::strerror(err)));
        }

        if (pid == 0)
        {
            // Only async-signal-safe calls past this point.
            if (devNull != -1)
                dup2(devNull, STDIN_FILENO);
            dup2(outPipe[1], STDOUT_FILENO);
            dup2(outPipe[1], STDERR_FILENO);
            execvp(args[0], args.data());

            int err = errno;
            ssize_t ignored = write(errPipe[1], &err, sizeof(err));
            (void)ignored;
            _exit(127);
        }

        int readFd = outPipe[0];
        int statusFd = errPipe[0];
        close(outPipe[1]);
        close(errPipe[1]);
        if (devNull != -1)
            close(devNull);

        int execErrno = 0;
        ssize_t n;
        while ((n = read(statusFd, &execErrno, sizeof(execErrno))) == -1 && errno == EINTR)
        {
        }
        CloseFd(statusFd);

        if (n == static_cast<ssize_t>(sizeof(execErrno)))
        {
            CloseFd(readFd);
            bool unused = false;
            ReapChild(pid, Clock::now() + std::chrono::seconds(1), unused);
            result.launched = false;
            result.output = std::strerror(execErrno);
            return result;
        }
        result.launched = true;

        char buffer[4096];
        while (readFd != -1)
        {
            int wait = RemainingMs(endAt);
            if (wait == 0)
                break;

            struct pollfd pfd;
            pfd.fd = readFd;
            pfd.events = POLLIN;
            pfd.revents = 0;

            int ret = poll(&pfd, 1, wait);
            if (ret == -1)
            {
                if (errno == EINTR)
                    continue;
                break;
            }
            if (ret == 0)
                break;

            ssize_t bytes = read(readFd, buffer, sizeof(buffer));
            if (bytes > 0)
            {
                result.output.append(buffer, static_cast<size_t>(bytes));
            }
            else if (bytes == 0)
            {
                CloseFd(readFd);
            }
            else if (errno != EINTR && errno != EAGAIN)
            {
                CloseFd(readFd);
            }
        }
        CloseFd(readFd);

        result.exit_code = ReapChild(pid, endAt, result.timed_out);
        return result;
    }
}
