// © 2026 Beatrix Zselezny. All rights reserved.
// BlueBerry Session Cycler

#ifndef SAFE_EXECUTOR_HPP
#define SAFE_EXECUTOR_HPP

#include "core/CommandExecutor.hpp"
#include <cstddef>
#include <sys/types.h>

namespace Berry::Core {
    /**
     * @brief Valódi végrehajtó: fork + execvp, shell nélkül, a PATH alapján.
     * Az exec hibáját egy O_CLOEXEC pipe-on kapjuk vissza, így az indítási hiba
     * CommandError, nem pedig egy 127-es kilépési kód.
     */
    class SafeExecutor : public ICommandExecutor {
    public:
        static constexpr std::size_t MAX_CAPTURE = 1024 * 1024; // 1 MB plafon

        int run(const Command& cmd) override;
        std::string capture(const Command& cmd) override;

    private:
        static pid_t spawn(const Command& cmd, int stdoutFd, int closeInChild);
        static int waitFor(pid_t pid);
    };
}

#endif
