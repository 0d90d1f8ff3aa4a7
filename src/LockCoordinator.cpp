#include "LockCoordinator.hpp"
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>
#include <spdlog/spdlog.h>

const char* toString(Role role) {
    return role == Role::Writer ? "writer" : "reader";
}

FlockInstanceLock::FlockInstanceLock(fs::path lockFile) : lockFile(std::move(lockFile)) {}

FlockInstanceLock::~FlockInstanceLock() {
    // 关闭描述符即释放锁，锁文件本身保留，内容从不读取
    if (fd >= 0) ::close(fd);
}

LockOutcome FlockInstanceLock::tryAcquire() {
    if (fd >= 0) return {Role::Writer, false, "already held"};

    std::error_code ec;
    if (lockFile.has_parent_path()) fs::create_directories(lockFile.parent_path(), ec);

    int handle = ::open(lockFile.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
    if (handle < 0) {
        return {Role::Reader, true, "cannot open " + lockFile.string() + ": " + std::strerror(errno)};
    }

    if (::flock(handle, LOCK_EX | LOCK_NB) == 0) {
        fd = handle;
        return {Role::Writer, false, ""};
    }

    int err = errno;
    ::close(handle);
    if (err == EWOULDBLOCK) return {Role::Reader, false, "held by another process"};
    if (err == ENOLCK || err == EOPNOTSUPP || err == EINVAL) {
        // 文件系统不支持 flock，无法保证互斥，只能照常写入
        return {Role::Writer, true, std::string("locking unsupported: ") + std::strerror(err)};
    }
    return {Role::Reader, true, std::string("cannot lock: ") + std::strerror(err)};
}

LockCoordinator::LockCoordinator(std::unique_ptr<InstanceLock> strategy) : strategy(std::move(strategy)) {}

const LockOutcome& LockCoordinator::acquire() {
    if (outcome) return *outcome;

    outcome = strategy->tryAcquire();
    if (outcome->degraded) {
        spdlog::warn("instance lock degraded ({}), running as {}", outcome->reason, toString(outcome->role));
    } else if (outcome->role == Role::Reader) {
        spdlog::info("another instance holds the state lock, running read-only");
    } else {
        spdlog::info("acquired state lock, running as writer");
    }
    return *outcome;
}
