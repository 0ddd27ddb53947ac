// © 2026 Beatrix Zselezny. All rights reserved.
// BlueBerry Session Cycler

#include "core/SecretStore.hpp"
#include "utils/BerryInitializer.hpp"
#include "utils/HardeningUtils.hpp"
#include "utils/Logger.hpp"
#include "utils/StringUtils.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sodium.h>
#include <sys/stat.h>
#include <unistd.h>

namespace Berry::Core {

    FileSecretStore::FileSecretStore(std::string p) : path(std::move(p)) {}

    std::optional<std::string> FileSecretStore::get() {
        struct stat st{};
        if (lstat(path.c_str(), &st) != 0) {
            if (errno == ENOENT) return std::nullopt;
            throw SecretStoreError("cannot stat " + path + ": " + std::strerror(errno));
        }
        if (!BerryUtils::checkOwnershipAndPerms(path, false)) {
            throw SecretStoreError("refusing to read " + path + ": unsafe owner or permissions");
        }

        int fd = open(path.c_str(), O_RDONLY | O_CLOEXEC | O_NOFOLLOW);
        if (fd < 0) {
            throw SecretStoreError("cannot open " + path + ": " + std::strerror(errno));
        }

        std::string value;
        char buf[256];
        for (;;) {
            ssize_t n = read(fd, buf, sizeof(buf));
            if (n < 0) {
                if (errno == EINTR) continue;
                int err = errno;
                sodium_memzero(buf, sizeof(buf));
                close(fd);
                wipeSecret(value);
                throw SecretStoreError("read failed on " + path + ": " + std::strerror(err));
            }
            if (n == 0) break;
            value.append(buf, static_cast<size_t>(n));
        }
        sodium_memzero(buf, sizeof(buf));
        close(fd);

        if (value.empty()) return std::nullopt;
        return value;
    }

    void FileSecretStore::set(const std::string& value) {
        if (!BerryUtils::atomicWriteFile(path, value, 0600)) {
            throw SecretStoreError("cannot write " + path);
        }
    }

    void FileSecretStore::clear() {
        if (access(path.c_str(), F_OK) != 0) return;
        if (!BerryUtils::secureDeleteFile(path)) {
            throw SecretStoreError("cannot delete " + path);
        }
    }

    std::optional<std::string> resolveSecret(ISecretStore& store, BerryUtils::ILogger& log) {
        std::optional<std::string> raw;
        try {
            raw = store.get();
        } catch (const SecretStoreError& e) {
            log.error(std::string("[Secret] ") + e.what());
            return std::nullopt;
        }
        if (!raw) return std::nullopt;

        std::string value = BerryUtils::trim(*raw);
        wipeSecret(*raw);
        if (value.empty()) return std::nullopt;
        return value;
    }

    void wipeSecret(std::string& value) {
        if (!value.empty()) {
            sodium_memzero(&value[0], value.size());
        }
        value.clear();
    }

    std::string defaultSecretPath() {
        return Berry::Init::stateDirectory() + "/secret";
    }
}
