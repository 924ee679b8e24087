#pragma once

#include <cstdint>
#include <exception>
#include <string>

struct cgroup;
struct cgroup_controller;

namespace coexec::runguard {

/**
 * @brief libcgroup 调用失败
 */
struct cgroup_error : public std::exception {
    cgroup_error(const std::string &operation, int err);

    const char *what() const noexcept override;

    /**
     * @brief 返回值不为 0 时抛出 cgroup_error
     */
    static void check(const std::string &operation, int err);

private:
    std::string message;
};

/**
 * @brief cgroup 中的一个资源管控器，如 memory、cpu、pids、cpuacct
 * 不持有资源，生命周期跟随所属的 control_group
 */
struct controller_ref {
    struct cgroup_controller *ctrl;

    void set(const std::string &name, int64_t value);
    void set(const std::string &name, const std::string &value);
    int64_t get_int64(const std::string &name) const;
};

/**
 * @brief libcgroup 中 struct cgroup 的所有者
 *
 * 构造时只在内存中记录 cgroup 的描述，create 才会在内核中创建。
 * 析构时释放 libcgroup 分配的内存，不会删除内核中的 cgroup。
 */
struct control_group {
    explicit control_group(const std::string &name);
    control_group(const control_group &) = delete;
    control_group &operator=(const control_group &) = delete;
    ~control_group();

    /**
     * @throw cgroup_error 管控器不可用时
     */
    controller_ref add_controller(const std::string &name);

    /**
     * @brief 获得 add_controller 或 load 得到的管控器
     * @throw cgroup_error 管控器不存在时
     */
    controller_ref controller(const std::string &name);

    /**
     * @brief 在内核中创建 cgroup，并写入所有管控器的设置
     */
    void create();

    /**
     * @brief 从内核中读入 cgroup 的管控器和参数
     */
    void load();

    /**
     * @brief 把当前进程移入这个 cgroup
     */
    void attach_current();

    /**
     * @brief 从内核中删除 cgroup，剩余的进程被移入上一层
     */
    void remove();

    /**
     * @brief 初始化 libcgroup，每个进程调用一次
     */
    static void init();

private:
    struct cgroup *cg;
};

}  // namespace coexec::runguard
