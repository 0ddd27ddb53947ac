// © 2026 Beatrix Zselezny. All rights reserved.
// BlueBerry Session Cycler

#include "core/CommandExecutor.hpp"

namespace Berry::Core {

    std::string Command::render() const {
        std::string out = program;
        for (size_t i = 0; i < args.size(); ++i) {
            out += " ";
            out += (sensitive && i + 1 == args.size()) ? "********" : args[i];
        }
        return out;
    }
}
