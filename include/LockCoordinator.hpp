#ifndef LOCK_COORDINATOR_HPP
#define LOCK_COORDINATOR_HPP

#include <filesystem>
#include <memory>
#include <optional>
#include <string>

namespace fs = std::filesystem;

enum class Role { Writer, Reader };

const char* toString(Role role);

struct LockOutcome {
    Role role = Role::Reader;
    bool degraded = false; // 锁机制不可用，结果不是真正互斥得来的
    std::string reason;
};

// 进程级互斥的平台策略。进程退出 (包括崩溃) 时锁必须自动释放。
class InstanceLock {
public:
    virtual ~InstanceLock() = default;
    virtual LockOutcome tryAcquire() = 0;
};

// POSIX: flock(LOCK_EX | LOCK_NB)，文件描述符一直持有到析构或进程退出
class FlockInstanceLock : public InstanceLock {
public:
    explicit FlockInstanceLock(fs::path lockFile);
    ~FlockInstanceLock() override;

    FlockInstanceLock(const FlockInstanceLock&) = delete;
    FlockInstanceLock& operator=(const FlockInstanceLock&) = delete;

    LockOutcome tryAcquire() override;

private:
    fs::path lockFile;
    int fd = -1;
};

// 启动时决定一次本进程是 Writer 还是 Reader，之后不再改变
class LockCoordinator {
public:
    explicit LockCoordinator(std::unique_ptr<InstanceLock> strategy);

    const LockOutcome& acquire();

    bool isDecided() const { return outcome.has_value(); }
    Role getRole() const { return outcome ? outcome->role : Role::Reader; }
    bool isWriter() const { return getRole() == Role::Writer; }

private:
    std::unique_ptr<InstanceLock> strategy;
    std::optional<LockOutcome> outcome;
};

#endif
