#include "judge/languages/php.hpp"
#include <boost/algorithm/string.hpp>
#include "common/io_utils.hpp"
#include "common/utils.hpp"

namespace codejudge {
using namespace std;

// @FUNCTION@ 和 @TEST_CASES@ 在生成时被替换
static const char *PHP_HARNESS = R"__(<?php
require __DIR__ . '/solution.php';

function codejudge_is_list($value) {
    if (!is_array($value)) return false;
    $i = 0;
    foreach ($value as $key => $_) {
        if ($key !== $i++) return false;
    }
    return true;
}

function codejudge_equals($a, $b) {
    if (is_array($a) && is_array($b)) {
        if (count($a) !== count($b)) return false;
        if (codejudge_is_list($a) !== codejudge_is_list($b)) return false;
        foreach ($a as $key => $value) {
            if (!array_key_exists($key, $b) || !codejudge_equals($value, $b[$key])) return false;
        }
        return true;
    }
    if ((is_int($a) || is_float($a)) && (is_int($b) || is_float($b))) return $a == $b;
    return $a === $b;
}

function codejudge_normalize($value) {
    $encoded = json_encode($value, JSON_PARTIAL_OUTPUT_ON_ERROR | JSON_INVALID_UTF8_SUBSTITUTE | JSON_PRESERVE_ZERO_FRACTION);
    return $encoded === false ? null : json_decode($encoded, true);
}

$codejudge_cases = json_decode(@TEST_CASES@, true);
$codejudge_results = [];
foreach ($codejudge_cases as $codejudge_case) {
    $start = microtime(true);
    $result = [
        'passed' => false,
        'expected' => $codejudge_case['expected'],
        'actual' => null,
        'description' => $codejudge_case['description'],
    ];
    try {
        if (!function_exists('@FUNCTION@')) {
            throw new Error('Function @FUNCTION@ is not defined');
        }
        $input = $codejudge_case['input'];
        $actual = codejudge_is_list($input)
            ? call_user_func_array('@FUNCTION@', $input)
            : call_user_func('@FUNCTION@', $input);
        $actual = codejudge_normalize($actual);
        $result['actual'] = $actual;
        $result['passed'] = codejudge_equals($actual, $codejudge_case['expected']);
    } catch (Throwable $e) {
        $result['error'] = $e->getMessage();
    }
    $result['executionTimeMs'] = (microtime(true) - $start) * 1000;
    $codejudge_results[] = $result;
}

echo "\n", json_encode($codejudge_results, JSON_PARTIAL_OUTPUT_ON_ERROR | JSON_INVALID_UTF8_SUBSTITUTE | JSON_PRESERVE_ZERO_FRACTION), "\n";
)__";

php_adapter::php_adapter(const language_config &config)
    : language_adapter(config) {}

language php_adapter::lang() const {
    return language::PHP;
}

string php_quote(const string &text) {
    string result = "'";
    for (char c : text) {
        if (c == '\\' || c == '\'') result += '\\';
        result += c;
    }
    return result + "'";
}

string php_adapter::generate_harness(const submission &submit) const {
    // 测试数据最后替换，避免其中的文本被当作占位符
    string harness = boost::algorithm::replace_all_copy(string(PHP_HARNESS), "@FUNCTION@", submit.function_name);
    boost::algorithm::replace_all(harness, "@TEST_CASES@", php_quote(ascii_json(test_cases_to_json(submit.test_cases))));
    return harness;
}

runnable_artifact php_adapter::prepare(const submission &submit, const filesystem::path &dir) const {
    string source = submit.source_code;
    // 没有 <?php 开头标记的代码会被当作普通文本原样输出
    if (!boost::algorithm::starts_with(boost::algorithm::trim_left_copy(source), "<?"))
        source = "<?php\n" + source;
    write_file_content(dir / "solution.php", source);
    write_file_content(dir / "runner.php", generate_harness(submit));

    runnable_artifact artifact;
    artifact.dir = dir;
    artifact.command = make_command("php", "-d", "display_errors=stderr", "-d", "log_errors=0",
                                    "-d", "memory_limit=" + to_string(submit.memory_limit_mb) + "M", "runner.php");
    artifact.image = lang_config.image;
    artifact.toolchain = "php";
    return artifact;
}

vector<string> php_adapter::compile_error_markers() const {
    return {"Parse error", "syntax error", "ParseError"};
}

}  // namespace codejudge
