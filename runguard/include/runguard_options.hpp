#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace coexec::runguard {

struct time_limit {
    double soft = 0, hard = 0;
};

/**
 * @brief 将宿主机上的目录绑定到 chroot 内的某个位置
 */
struct bind_mount {
    std::string source;

    /**
     * @brief chroot 内的路径，必须事先存在于 chroot 镜像中
     */
    std::string target;
};

struct runguard_options {
    std::string cgroup_name;
    std::string chroot_dir;

    /**
     * @brief 用户程序的工作目录，有 chroot 时是 chroot 内的路径
     */
    std::string work_dir;
    std::vector<bind_mount> binds;

    int user_id = -1;
    int group_id = -1;

    bool use_wall_limit = false;
    time_limit wall_limit;  // 时钟时间，单位为秒
    bool use_cpu_limit = false;
    time_limit cpu_limit;  // CPU 时间，单位为秒

    /**
     * @brief 能使用的 CPU 核数，0.5 表示半个核心，不大于 0 时不限制
     */
    double cpu_quota = 0;

    int64_t memory_limit = -1;  // 单位为字节
    int64_t file_limit = -1;    // 单位为字节
    int64_t stream_size = -1;   // 单位为字节
    int64_t nproc = -1;
    int64_t nofile = -1;
    bool no_core_dumps = false;

    std::vector<std::string> env;

    std::string metafile_path;
    std::vector<std::string> command;
};

}  // namespace coexec::runguard
