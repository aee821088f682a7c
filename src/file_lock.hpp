#pragma once
#include <cstdint>
#include <string>

namespace hookcache {

// Advisory exclusive flock() held for the lifetime of the object.
// Acquisition polls for up to timeout_ms and then gives up; callers check
// locked() and carry on either way.
class FileLock {
public:
    FileLock(const std::string& path, uint32_t timeout_ms);
    ~FileLock();

    FileLock(const FileLock&) = delete;
    FileLock& operator=(const FileLock&) = delete;

    bool locked() const { return locked_; }

private:
    int fd_ = -1;
    bool locked_ = false;
};

} // namespace hookcache
