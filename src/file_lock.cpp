#include "file_lock.hpp"
#include <cerrno>
#include <chrono>
#include <filesystem>
#include <thread>
#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

namespace hookcache {

FileLock::FileLock(const std::string& path, uint32_t timeout_ms) {
    std::filesystem::path lock_path(path);
    if (lock_path.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(lock_path.parent_path(), ec);
    }

    fd_ = ::open(path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
    if (fd_ < 0) return;

    auto deadline = std::chrono::steady_clock::now() +
                    std::chrono::milliseconds(timeout_ms);
    while (true) {
        if (::flock(fd_, LOCK_EX | LOCK_NB) == 0) {
            locked_ = true;
            return;
        }
        if (errno != EWOULDBLOCK && errno != EINTR) return;
        if (std::chrono::steady_clock::now() >= deadline) return;
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
}

FileLock::~FileLock() {
    if (fd_ < 0) return;
    if (locked_) ::flock(fd_, LOCK_UN);
    ::close(fd_);
}

} // namespace hookcache
