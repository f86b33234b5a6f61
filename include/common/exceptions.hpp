#pragma once

#include <boost/lexical_cast.hpp>
#include <boost/stacktrace.hpp>
#include <memory>
#include <sstream>
#include <stdexcept>

namespace coderun {

/**
 * @brief 执行引擎内部抛出的异常的基类
 * 构造时会记录调用栈，写日志时通过 operator<< 输出调用栈方便排查。
 * 这些异常只在组件内部传递，组件边界上会被转换为 result<T> 或者执行记录的终止状态。
 */
struct engine_exception : std::exception {
    engine_exception();
    explicit engine_exception(const std::string &message);

    friend std::ostream &operator<<(std::ostream &os, const engine_exception &ex);

    template <typename T>
    engine_exception operator<<(const T &t) const {
        return engine_exception(message + boost::lexical_cast<std::string>(t));
    }

    const char *what() const noexcept override;

private:
    std::string message;
    std::shared_ptr<boost::stacktrace::stacktrace> stacktrace;
};

/**
 * @brief 表示执行引擎的内部错误
 * 一般是编排逻辑本身的问题，对应 InternalError
 */
struct internal_error : public engine_exception {
    internal_error();
    explicit internal_error(const std::string &message);
};

/**
 * @brief 表示容器运行时返回了错误，通常由 Docker Engine API 或者 CURL 产生
 */
struct container_error : public engine_exception {
    container_error();
    explicit container_error(const std::string &message);

    /**
     * @brief 容器运行时返回的 HTTP 状态码，如果没有拿到响应则为 0
     */
    long http_status = 0;
};

/**
 * @brief 表示数据库查询错误
 */
struct database_error : public engine_exception {
    database_error();
    explicit database_error(const std::string &message);
};

/**
 * @brief 表示配置文件格式不正确
 */
struct config_error : public engine_exception {
    config_error();
    explicit config_error(const std::string &message);
};

}  // namespace coderun
