#pragma once

#include <boost/lexical_cast.hpp>
#include <chrono>
#include <filesystem>
#include <string>
#include <type_traits>
#include <vector>

template <typename T>
struct to_string_cont {
    template <typename ContainerT>
    static void to_string(ContainerT &cont, const T &element) {
        cont.push_back(boost::lexical_cast<std::string>(element));
    }
};

template <>
struct to_string_cont<std::filesystem::path> {
    template <typename ContainerT>
    static void to_string(ContainerT &cont, const std::filesystem::path &element) {
        cont.push_back(element.string());
    }
};

template <typename T>
struct to_string_cont<std::vector<T>> {
    template <typename ContainerT>
    static void to_string(ContainerT &cont, const std::vector<T> &vec) {
        for (const T &value : vec)
            to_string_cont<T>::to_string(cont, value);
    }
};

/**
 * @brief 将参数 args 的内容通过 to_string 转换为字符串并装入容器中
 * @param cont 字符串容器
 * @param args 按顺序 to_string 转换为字符串并装入容器（如果 arg 本身为容器，则遍历这个容器将各个元素加入结果容器中）
 */
template <typename ContainerT, typename Head, typename... Args>
void to_string_list(ContainerT &cont, Head &head, Args &... args) {
    to_string_cont<std::decay_t<Head>>::to_string(cont, head);
    if constexpr (sizeof...(args) > 0)
        to_string_list(cont, args...);
}

/**
 * @brief 构造外部命令的参数列表
 * @note 与拼接字符串再调用 system(cmd) 不同，参数不会经过 shell 解释，避免了转义导致的安全问题
 * @code{.cpp}
 *     std::filesystem::path dir("/tmp/run");
 *     // {"docker", "run", "-v", "/tmp/run:/code:ro", "--memory", "128m"}
 *     auto argv = make_command("docker", "run", "-v", dir.string() + ":/code:ro", "--memory", "128m");
 * @endcode
 */
template <typename... Args>
std::vector<std::string> make_command(const Args &... args) {
    std::vector<std::string> list;
    to_string_list(list, args...);
    return list;
}

/**
 * @brief 根据 key 来查找环境变量
 * @param key 环境变量的键
 * @param def_value 如果键不存在，返回该参数
 * @return 环境变量的值，或者不存在时返回 def_value
 */
std::string get_env(const std::string &key, const std::string &def_value);

/**
 * @brief 设置环境变量
 * @param key 环境变量的键
 * @param value 环境变量的值
 * @param replace 若为真，则覆盖已有的环境变量值
 */
void set_env(const std::string &key, const std::string &value, bool replace = true);

/**
 * @brief 在 PATH 环境变量中查找可执行文件
 * @param program 程序名，如果包含 '/' 则直接检查该路径
 * @return 找到的可执行文件路径，找不到时返回空路径
 */
std::filesystem::path find_executable(const std::string &program);

struct elapsed_time {

    elapsed_time();

    template <typename DurationT>
    DurationT duration() const {
        return std::chrono::duration_cast<DurationT>(std::chrono::steady_clock::now() - start);
    }

    /**
     * @brief 经过的时间，单位为毫秒，保留小数部分
     */
    double milliseconds() const;

private:
    std::chrono::steady_clock::time_point start;
};
