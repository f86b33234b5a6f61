#pragma once

#include <string>
#include "engine/environment_registry.hpp"
#include "model/environment.hpp"
#include "model/quota.hpp"
#include "test/fake_runtime.hpp"

/**
 * 测试用的公共数据
 * 用法：
 * 1. 在 SetUpTestCase 中调用 setup_test_environment()
 * 2. 通过 python_environment() 等函数构造运行环境，按需修改后放入 environment_registry
 */
namespace coderun::test {

/**
 * @brief 设置测试使用的工作目录和等待间隔
 */
void setup_test_environment();

/**
 * @brief python/3.11，禁止导入 os、subprocess、socket，禁止调用 eval、exec
 */
execution_environment python_environment();

/**
 * @brief cpp/11，使用 g++ 编译
 */
execution_environment cpp_environment();

/**
 * @brief 假沙箱中的“python 解释器”，只认识测试中用到的几种程序：
 * 1. print("...")：输出字符串
 * 2. print(input())：原样输出标准输入
 * 3. while True：死循环，同时有 print("...") 时先输出字符串
 * 4. raise：退出码为 1，stderr 中有 Traceback
 * 5. ALLOCATE_FOREVER：被 OOM kill
 * 6. FORBIDDEN_SYSCALL：被 seccomp 以 SIGSYS 杀死
 * 程序默认运行 50ms，源代码中出现 time.sleep 时运行 150ms
 */
fake_program fake_python(const fake_invocation &in);

execution_quota make_quota(const std::string &user_id, quota_type type, int max_executions);

}  // namespace coderun::test
