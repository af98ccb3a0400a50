#pragma once

#include <istream>
#include <nlohmann/json.hpp>
#include <ostream>
#include <string>
#include <vector>
#include "config.hpp"
#include "judge/dispatcher.hpp"

namespace codejudge {

/**
 * @brief codejudge 命令行的退出码，一批提交取其中最大的
 */
enum exit_codes {
    E_SUCCESS = 0,
    E_FAILURE = 1,
    E_INVALID_SUBMISSION = 2,
    E_OVERLOADED = 3
};

/**
 * @brief 一个提交的评测结果，输出为一行 JSON
 */
struct submission_output {
    nlohmann::json line;
    int exitcode = E_SUCCESS;
};

/**
 * @brief 评测被拒绝时输出的 JSON，如 {"error": "Overloaded", "message": "..."}
 */
nlohmann::json error_line(const std::string &kind, const std::string &message);

/**
 * @brief 解析并评测一个提交
 * 提交不合法或者评测系统过载时不抛出异常，而是返回对应的错误行和退出码
 */
submission_output judge_submission(dispatcher &dispatcher, const engine_config &config, const nlohmann::json &j);

/**
 * @brief 读取提交，输入可以是单个提交对象，也可以是提交对象的数组
 * @throws nlohmann::json::exception 若输入不是合法的 JSON
 */
std::vector<nlohmann::json> read_submissions(std::istream &in);

/**
 * @brief 每个提交一个线程并发评测，按提交的顺序每行输出一个结果
 * @return 所有提交中最大的退出码
 */
int judge_batch(dispatcher &dispatcher, const engine_config &config, const std::vector<nlohmann::json> &submissions,
                std::ostream &out);

}  // namespace codejudge
