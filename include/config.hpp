#pragma once

#include <chrono>
#include <filesystem>
#include <string>

namespace coderun {

/**
 * @brief 执行引擎的工作目录，每次执行都会在这里创建一个随机 uuid 命名的工作区
 *
 * RUN_DIR
 * ├── 0f8fad5b-d9cb-469f-a165-70867728950e // 一次执行的工作区
 * │   ├── main.py // 用户代码（或者测试用例拼接后的代码）
 * │   └── stdin.txt // 标准输入数据，仅当请求携带 stdin 时存在
 * └── ...
 *
 * 工作区以只读方式挂载到沙箱的 /workspace 中，执行结束后删除。
 */
extern std::filesystem::path RUN_DIR;

/**
 * @brief Docker Engine 的 unix socket 路径
 * @defaultValue /var/run/docker.sock
 */
extern std::string DOCKER_SOCKET;

/**
 * @brief Docker Engine API 版本前缀，比如 v1.41
 * 为空时不带版本前缀，由 Docker Engine 选择默认版本
 */
extern std::string DOCKER_API_VERSION;

/**
 * @brief 沙箱内运行用户程序的用户，必须是非特权用户
 */
extern std::string SANDBOX_USER;

/**
 * @brief 同时运行的执行数上限，也就是 dispatcher 的 worker 数量
 * 超出上限的执行将在队列中等待，而不是直接失败
 */
extern std::size_t WORKER_COUNT;

/**
 * @brief 强制停止沙箱后，回收沙箱资源的宽限期
 */
extern std::chrono::seconds STOP_GRACE_PERIOD;

/**
 * @brief 等待沙箱结束时检查取消标记的间隔
 */
extern std::chrono::milliseconds WAIT_SLICE;

/**
 * @brief 沙箱内允许的最大进程数，防止 fork 炸弹
 */
extern int PIDS_LIMIT;

/**
 * @brief 保存的标准输出和标准错误各自的最大字节数，超出部分被截断
 * 容器日志文件的上限为该值的两倍
 * @defaultValue 1 MiB
 */
extern std::size_t MAX_OUTPUT;

/**
 * @brief 当前执行节点的名字，会记录到 CodeExecution 的 worker_node 中
 */
extern std::string WORKER_NODE;

/**
 * @brief 是否开启 DEBUG 模式
 * 如果开启 DEBUG 模式，执行结束后不会删除工作区，以便手动检查生成的文件内容是否符合预期。
 */
extern bool DEBUG;

}  // namespace coderun
