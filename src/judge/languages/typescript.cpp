#include "judge/languages/typescript.hpp"
#include <algorithm>
#include <boost/algorithm/string/replace.hpp>
#include "common/io_utils.hpp"
#include "common/utils.hpp"

namespace codejudge {
using namespace std;

static const char *TS_COMPILER_OPTIONS =
    R"({"module":"CommonJS","moduleResolution":"node","target":"ES2020","strict":false,"esModuleInterop":true,"allowSyntheticDefaultImports":true})";

// @FUNCTION@ 和 @TEST_CASES@ 在生成时被替换
static const char *TS_HARNESS = R"__(

// ---- codejudge harness ----
const __codejudgeTestCases: any[] = @TEST_CASES@;

function __codejudgeDeepEqual(a: any, b: any): boolean {
    if (a === b) return true;
    if (typeof a === "number" && typeof b === "number") return Number.isNaN(a) && Number.isNaN(b);
    if (a === null || b === null || typeof a !== "object" || typeof b !== "object") return false;
    if (Array.isArray(a) !== Array.isArray(b)) return false;
    if (Array.isArray(a)) {
        if (a.length !== b.length) return false;
        for (let i = 0; i < a.length; i++)
            if (!__codejudgeDeepEqual(a[i], b[i])) return false;
        return true;
    }
    const keysA = Object.keys(a), keysB = Object.keys(b);
    if (keysA.length !== keysB.length) return false;
    for (const key of keysA)
        if (!Object.prototype.hasOwnProperty.call(b, key) || !__codejudgeDeepEqual(a[key], b[key])) return false;
    return true;
}

function __codejudgeNormalize(value: any): any {
    if (value === undefined) return null;
    try {
        const text = JSON.stringify(value);
        return text === undefined ? null : JSON.parse(text);
    } catch (e) {
        return String(value);
    }
}

function __codejudgeNow(): number {
    return typeof performance !== "undefined" ? performance.now() : Date.now();
}

(async () => {
    const __codejudgeResults: any[] = [];
    for (const testCase of __codejudgeTestCases) {
        const start = __codejudgeNow();
        try {
            const fn: any = typeof @FUNCTION@ === "function" ? @FUNCTION@ : undefined;
            if (fn === undefined) throw new Error("Function @FUNCTION@ is not defined");
            const args = Array.isArray(testCase.input) ? testCase.input : [testCase.input];
            let actual = fn(...args);
            if (actual !== null && typeof actual === "object" && typeof actual.then === "function")
                actual = await actual;
            const elapsed = __codejudgeNow() - start;
            const normalized = __codejudgeNormalize(actual);
            __codejudgeResults.push({
                passed: __codejudgeDeepEqual(normalized, testCase.expected),
                expected: testCase.expected,
                actual: normalized,
                description: testCase.description,
                executionTimeMs: elapsed
            });
        } catch (error: any) {
            __codejudgeResults.push({
                passed: false,
                expected: testCase.expected,
                actual: null,
                error: error instanceof Error ? error.message : String(error),
                description: testCase.description,
                executionTimeMs: __codejudgeNow() - start
            });
        }
    }
    process.stdout.write("\n" + JSON.stringify(__codejudgeResults) + "\n");
})();
)__";

typescript_adapter::typescript_adapter(const language_config &config)
    : language_adapter(config) {}

language typescript_adapter::lang() const {
    return language::TYPESCRIPT;
}

string typescript_adapter::generate_harness(const submission &submit) const {
    // 测试数据最后替换，避免其中的文本被当作占位符
    string harness = boost::algorithm::replace_all_copy(string(TS_HARNESS), "@FUNCTION@", submit.function_name);
    boost::algorithm::replace_all(harness, "@TEST_CASES@", ascii_json(test_cases_to_json(submit.test_cases)));
    return "/// <reference types=\"node\" />\n" + submit.source_code + "\n" + harness;
}

runnable_artifact typescript_adapter::prepare(const submission &submit, const filesystem::path &dir) const {
    write_file_content(dir / "solution.ts", generate_harness(submit));

    runnable_artifact artifact;
    artifact.dir = dir;
    artifact.command = make_command("ts-node", "--transpile-only", "--compiler-options", TS_COMPILER_OPTIONS, "solution.ts");
    artifact.env = {{"HOME", "${SCRATCH}"}, {"NODE_OPTIONS", "--max-old-space-size=" + to_string(max(32, submit.memory_limit_mb))}};
    artifact.image = lang_config.image;
    artifact.toolchain = "ts-node";
    return artifact;
}

vector<string> typescript_adapter::compile_error_markers() const {
    return {"SyntaxError", "TSError", "error TS"};
}

}  // namespace codejudge
