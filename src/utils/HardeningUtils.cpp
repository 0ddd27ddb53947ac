// © 2026 Beatrix Zselezny. All rights reserved.
// BlueBerry Session Cycler

#include "utils/HardeningUtils.hpp"
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fcntl.h>
#include <iostream>
#include <sys/stat.h>
#include <unistd.h>

namespace BerryUtils {

    bool atomicWriteFile(const std::string& path, const std::string& data, mode_t mode) {
        std::string tmpl = path + ".tmpXXXXXX";
        std::vector<char> temp(tmpl.begin(), tmpl.end());
        temp.push_back('\0');

        int fd = mkostemp(temp.data(), O_CLOEXEC);
        if (fd < 0) {
            std::cerr << "[Files] mkostemp failed for " << path << ": " << std::strerror(errno) << std::endl;
            return false;
        }
        if (fchmod(fd, mode) != 0) {
            close(fd);
            unlink(temp.data());
            return false;
        }

        const char* ptr = data.data();
        size_t remaining = data.size();
        while (remaining > 0) {
            ssize_t w = write(fd, ptr, remaining);
            if (w < 0) {
                if (errno == EINTR) continue;
                close(fd);
                unlink(temp.data());
                return false;
            }
            ptr += w;
            remaining -= static_cast<size_t>(w);
        }

        if (fsync(fd) != 0) {
            std::cerr << "[Files] fsync failed for " << path << std::endl;
        }
        if (close(fd) != 0) {
            unlink(temp.data());
            return false;
        }
        if (rename(temp.data(), path.c_str()) != 0) {
            unlink(temp.data());
            return false;
        }
        return true;
    }

    bool writeProtectedFile(const std::string& path, const std::vector<std::string>& content) {
        struct stat st;
        if (lstat(path.c_str(), &st) == 0) {
            std::cerr << "[Files] Refusing to overwrite existing file: " << path << std::endl;
            return false;
        }

        std::string data;
        for (const auto& l : content) {
            data += l;
            data += "\n";
        }
        return atomicWriteFile(path, data, S_IRUSR | S_IWUSR);
    }

    bool checkOwnershipAndPerms(const std::string& path, bool allowMissing) {
        struct stat st;
        if (stat(path.c_str(), &st) != 0) {
            return errno == ENOENT && allowMissing;
        }
        if (st.st_uid != geteuid()) {
            std::cerr << "[Files] Ownership violation: " << path << std::endl;
            return false;
        }
        // group/other hozzáférés tiltva
        if ((st.st_mode & 0077) != 0) {
            std::cerr << "[Files] Insecure permissions on: " << path << std::endl;
            return false;
        }
        return true;
    }

    bool secureDeleteFile(const std::string& path) {
        struct stat st;
        if (lstat(path.c_str(), &st) != 0) {
            return errno == ENOENT;
        }
        if (S_ISLNK(st.st_mode) || st.st_uid != geteuid()) {
            std::cerr << "[Files] Refusing to delete " << path << std::endl;
            return false;
        }

        FILE* f = std::fopen(path.c_str(), "r+");
        if (f) {
            if (st.st_size > 0) {
                std::vector<char> zeros(static_cast<size_t>(st.st_size), 0);
                if (std::fwrite(zeros.data(), 1, zeros.size(), f) != zeros.size()) {
                    std::cerr << "[Files] Overwrite failed for " << path << std::endl;
                }
                std::fflush(f);
                fsync(fileno(f));
            }
            std::fclose(f);
        }
        return std::remove(path.c_str()) == 0;
    }
}
