// © 2026 Beatrix Zselezny. All rights reserved.
// BlueBerry Session Cycler

#ifndef COMMAND_EXECUTOR_HPP
#define COMMAND_EXECUTOR_HPP

#include <stdexcept>
#include <string>
#include <vector>

namespace Berry::Core {

    /**
     * @brief "Prepared Statement": bináris és argumentum vektor szétválasztva, shell nélkül.
     */
    struct Command {
        std::string program;
        std::vector<std::string> args;
        bool sensitive = false; // az utolsó argumentum titok (xdotool type <secret>)

        // "<program> <args...>", sensitive esetén az utolsó argumentum helyett ********
        std::string render() const;
    };

    class CommandError : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

    /**
     * @brief Command Executor határfelület.
     */
    class ICommandExecutor {
    public:
        virtual ~ICommandExecutor() = default;

        /**
         * @brief Futtat és megvárja a kilépést.
         * @return a kilépési kód
         * @throws CommandError ha a program nem indítható
         */
        virtual int run(const Command& cmd) = 0;

        /**
         * @brief Futtat és visszaadja a standard kimenetet.
         * @throws CommandError indítási hiba vagy nem nulla kilépési kód esetén
         */
        virtual std::string capture(const Command& cmd) = 0;
    };
}

#endif
