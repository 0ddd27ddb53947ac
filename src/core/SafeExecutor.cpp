// © 2026 Beatrix Zselezny. All rights reserved.
// BlueBerry Session Cycler

#include "core/SafeExecutor.hpp"
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>
#include <vector>

namespace Berry::Core {

    pid_t SafeExecutor::spawn(const Command& cmd, int stdoutFd, int closeInChild) {
        // Argumentumok előkészítése a fork ELŐTT (a gyerekben nincs allokáció)
        std::vector<char*> c_args;
        c_args.push_back(const_cast<char*>(cmd.program.c_str()));
        for (const auto& arg : cmd.args) {
            c_args.push_back(const_cast<char*>(arg.c_str()));
        }
        c_args.push_back(nullptr);

        int errPipe[2];
        if (pipe2(errPipe, O_CLOEXEC) != 0) {
            throw CommandError("pipe failed for " + cmd.program + ": " + std::strerror(errno));
        }

        pid_t pid = fork();
        if (pid == -1) {
            int e = errno;
            close(errPipe[0]);
            close(errPipe[1]);
            throw CommandError("fork failed for " + cmd.program + ": " + std::strerror(e));
        }

        if (pid == 0) { // Gyerek folyamat
            if (closeInChild >= 0) close(closeInChild);
            if (stdoutFd >= 0) dup2(stdoutFd, STDOUT_FILENO);

            execvp(c_args[0], c_args.data());

            // Ha az execvp visszatér, hiba történt: errno a szülőnek
            int e = errno;
            ssize_t ignored = write(errPipe[1], &e, sizeof(e));
            (void)ignored;
            _exit(127);
        }

        // Szülő: sikeres exec esetén a pipe EOF-fal zárul
        close(errPipe[1]);
        int childErrno = 0;
        ssize_t n;
        do {
            n = read(errPipe[0], &childErrno, sizeof(childErrno));
        } while (n < 0 && errno == EINTR);
        close(errPipe[0]);

        if (n == static_cast<ssize_t>(sizeof(childErrno))) {
            waitFor(pid);
            throw CommandError("cannot execute " + cmd.program + ": " + std::strerror(childErrno));
        }
        return pid;
    }

    int SafeExecutor::waitFor(pid_t pid) {
        int status = 0;
        while (waitpid(pid, &status, 0) < 0) {
            if (errno != EINTR) {
                return -1;
            }
        }
        if (WIFEXITED(status)) return WEXITSTATUS(status);
        if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
        return -1;
    }

    int SafeExecutor::run(const Command& cmd) {
        pid_t pid = spawn(cmd, -1, -1);
        return waitFor(pid);
    }

    std::string SafeExecutor::capture(const Command& cmd) {
        int out[2];
        if (pipe2(out, O_CLOEXEC) != 0) {
            throw CommandError("pipe failed for " + cmd.program + ": " + std::strerror(errno));
        }

        pid_t pid;
        try {
            pid = spawn(cmd, out[1], out[0]);
        } catch (const CommandError&) {
            close(out[0]);
            close(out[1]);
            throw;
        }
        close(out[1]);

        std::string s;
        char buf[4096];
        bool truncated = false;
        for (;;) {
            ssize_t r = read(out[0], buf, sizeof(buf));
            if (r < 0 && errno == EINTR) continue;
            if (r <= 0) break;
            if (truncated) continue; // kiürítjük a pipe-ot, hogy a gyerek ne akadjon el
            if (s.size() + static_cast<size_t>(r) > MAX_CAPTURE) {
                s.append(buf, MAX_CAPTURE - s.size());
                truncated = true;
                continue;
            }
            s.append(buf, static_cast<size_t>(r));
        }
        close(out[0]);

        int code = waitFor(pid);
        if (code != 0) {
            throw CommandError(cmd.program + " exited with code " + std::to_string(code));
        }
        return s;
    }
}
