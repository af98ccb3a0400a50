#include "judge/languages/go.hpp"
#include <boost/algorithm/string.hpp>
#include <sstream>
#include "common/io_utils.hpp"
#include "common/utils.hpp"

namespace codejudge {
using namespace std;

// @FUNCTION@ 和 @TEST_CASES@ 在生成时被替换
static const char *GO_HARNESS = R"__(package main

import (
	"encoding/json"
	"fmt"
	"os"
	"reflect"
	"time"
)

const codejudgeTestCases = @TEST_CASES@

type codejudgeCase struct {
	Input       json.RawMessage `json:"input"`
	Expected    json.RawMessage `json:"expected"`
	Description string          `json:"description"`
}

type codejudgeResult struct {
	Passed          bool        `json:"passed"`
	Expected        interface{} `json:"expected"`
	Actual          interface{} `json:"actual"`
	Error           string      `json:"error,omitempty"`
	Description     string      `json:"description"`
	ExecutionTimeMs float64     `json:"executionTimeMs"`
}

var codejudgeErrorType = reflect.TypeOf((*error)(nil)).Elem()

func codejudgeDecode(fn reflect.Type, items []json.RawMessage) ([]reflect.Value, error) {
	if fn.IsVariadic() {
		if len(items) < fn.NumIn()-1 {
			return nil, fmt.Errorf("expected at least %d arguments, got %d", fn.NumIn()-1, len(items))
		}
	} else if len(items) != fn.NumIn() {
		return nil, fmt.Errorf("expected %d arguments, got %d", fn.NumIn(), len(items))
	}
	args := make([]reflect.Value, len(items))
	for i, item := range items {
		var t reflect.Type
		if fn.IsVariadic() && i >= fn.NumIn()-1 {
			t = fn.In(fn.NumIn() - 1).Elem()
		} else {
			t = fn.In(i)
		}
		v := reflect.New(t)
		if err := json.Unmarshal(item, v.Interface()); err != nil {
			return nil, fmt.Errorf("argument %d: %v", i+1, err)
		}
		args[i] = v.Elem()
	}
	return args, nil
}

// codejudgeArgs spreads an array input into positional arguments. A single-parameter
// function receives the whole input when spreading does not fit its signature.
func codejudgeArgs(fn reflect.Type, raw json.RawMessage) ([]reflect.Value, error) {
	var items []json.RawMessage
	if json.Unmarshal(raw, &items) == nil {
		args, err := codejudgeDecode(fn, items)
		if err == nil || fn.NumIn() != 1 || fn.IsVariadic() {
			return args, err
		}
	}
	return codejudgeDecode(fn, []json.RawMessage{raw})
}

func codejudgeCall(fn reflect.Value, args []reflect.Value) (result interface{}, err error) {
	defer func() {
		if r := recover(); r != nil {
			err = fmt.Errorf("panic: %v", r)
		}
	}()
	out := fn.Call(args)
	if n := len(out); n > 0 && out[n-1].Type().Implements(codejudgeErrorType) {
		if !out[n-1].IsNil() {
			return nil, out[n-1].Interface().(error)
		}
		out = out[:n-1]
	}
	switch len(out) {
	case 0:
		return nil, nil
	case 1:
		v := out[0]
		if (v.Kind() == reflect.Slice || v.Kind() == reflect.Map) && v.IsNil() {
			if v.Kind() == reflect.Slice {
				return reflect.MakeSlice(v.Type(), 0, 0).Interface(), nil
			}
			return reflect.MakeMap(v.Type()).Interface(), nil
		}
		return v.Interface(), nil
	default:
		values := make([]interface{}, len(out))
		for i, v := range out {
			values[i] = v.Interface()
		}
		return values, nil
	}
}

func codejudgeNormalize(value interface{}) (interface{}, error) {
	data, err := json.Marshal(value)
	if err != nil {
		return nil, err
	}
	var normalized interface{}
	if err := json.Unmarshal(data, &normalized); err != nil {
		return nil, err
	}
	return normalized, nil
}

func main() {
	var cases []codejudgeCase
	if err := json.Unmarshal([]byte(codejudgeTestCases), &cases); err != nil {
		fmt.Fprintln(os.Stderr, "invalid test cases:", err)
		os.Exit(3)
	}

	fn := reflect.ValueOf(@FUNCTION@)
	results := make([]codejudgeResult, 0, len(cases))
	for _, c := range cases {
		var expected interface{}
		json.Unmarshal(c.Expected, &expected)
		result := codejudgeResult{Expected: expected, Description: c.Description}

		start := time.Now()
		args, err := codejudgeArgs(fn.Type(), c.Input)
		var actual interface{}
		if err == nil {
			actual, err = codejudgeCall(fn, args)
		}
		result.ExecutionTimeMs = float64(time.Since(start).Microseconds()) / 1000

		if err == nil {
			actual, err = codejudgeNormalize(actual)
		}
		if err != nil {
			result.Error = err.Error()
		} else {
			result.Actual = actual
			result.Passed = reflect.DeepEqual(actual, expected)
		}
		results = append(results, result)
	}

	output, err := json.Marshal(results)
	if err != nil {
		fmt.Fprintln(os.Stderr, "unable to encode results:", err)
		os.Exit(3)
	}
	fmt.Println()
	fmt.Println(string(output))
}
)__";

go_adapter::go_adapter(const language_config &config)
    : language_adapter(config) {}

language go_adapter::lang() const {
    return language::GO;
}

string go_quote(const string &text) {
    string result = "\"";
    for (char c : text) {
        switch (c) {
            case '\\':
                result += "\\\\";
                break;
            case '"':
                result += "\\\"";
                break;
            case '\n':
                result += "\\n";
                break;
            case '\r':
                result += "\\r";
                break;
            case '\t':
                result += "\\t";
                break;
            default:
                result += c;
        }
    }
    return result + "\"";
}

string clean_go_source(const string &source) {
    istringstream in(source);
    ostringstream out;

    string line;
    bool has_package = false, in_main = false, main_opened = false;
    int brace_count = 0;
    while (getline(in, line)) {
        string trimmed = boost::algorithm::trim_copy(line);
        if (!in_main && !has_package && boost::algorithm::starts_with(trimmed, "package ")) {
            // 原地替换，编译错误的行号才能对应选手代码
            has_package = true;
            out << "package main" << endl;
            continue;
        }
        if (!in_main && boost::algorithm::starts_with(trimmed, "func main(")) {
            in_main = true;
            main_opened = false;
            brace_count = 0;
        }
        if (in_main) {
            for (char c : line) {
                if (c == '{') {
                    ++brace_count;
                    main_opened = true;
                } else if (c == '}') {
                    --brace_count;
                }
            }
            if (main_opened && brace_count <= 0) in_main = false;
            out << endl;
            continue;
        }
        out << line << endl;
    }
    return has_package ? out.str() : "package main\n\n" + out.str();
}

string go_adapter::generate_harness(const submission &submit) const {
    // 测试数据最后替换，避免其中的文本被当作占位符
    string harness = boost::algorithm::replace_all_copy(string(GO_HARNESS), "@FUNCTION@", submit.function_name);
    boost::algorithm::replace_all(harness, "@TEST_CASES@", go_quote(ascii_json(test_cases_to_json(submit.test_cases))));
    return harness;
}

runnable_artifact go_adapter::prepare(const submission &submit, const filesystem::path &dir) const {
    write_file_content(dir / "solution.go", clean_go_source(submit.source_code));
    write_file_content(dir / "main.go", generate_harness(submit));

    runnable_artifact artifact;
    artifact.dir = dir;
    artifact.command = make_command("go", "run", "main.go", "solution.go");
    artifact.env = {{"HOME", "${SCRATCH}"},
                    {"GOCACHE", "${SCRATCH}/gocache"},
                    {"GOPATH", "${SCRATCH}/gopath"},
                    {"GOTMPDIR", "${SCRATCH}"},
                    {"GOFLAGS", ""},
                    {"CGO_ENABLED", "0"}};
    artifact.image = lang_config.image;
    artifact.toolchain = "go";
    return artifact;
}

vector<string> go_adapter::compile_error_markers() const {
    return {"# command-line-arguments", "syntax error", "undefined:", "missing return",
            "cannot use", "declared and not used", "imported and not used"};
}

string go_adapter::describe_compile_error(const string &diagnostics) const {
    string hint;
    if (diagnostics.find("missing return") != string::npos)
        hint = "Function is missing return statement. Make sure your function returns a value.";
    else if (diagnostics.find("syntax error") != string::npos)
        hint = "Syntax error in your Go code. Please check your code for errors.";
    else
        hint = "Go compilation failed. Please check your code for errors.";
    return hint + "\n" + diagnostics;
}

}  // namespace codejudge
