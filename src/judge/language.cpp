#include "judge/language.hpp"
#include "judge/languages/go.hpp"
#include "judge/languages/php.hpp"
#include "judge/languages/typescript.hpp"

namespace codejudge {
using namespace std;

language_adapter::language_adapter(const language_config &config)
    : lang_config(config) {}

language_adapter::~language_adapter() {}

runner_strategy language_adapter::strategy() const {
    return lang_config.strategy;
}

string language_adapter::describe_compile_error(const string &diagnostics) const {
    return diagnostics;
}

const language_config &language_adapter::config() const {
    return lang_config;
}

adapter_table make_adapters(const engine_config &config) {
    adapter_table adapters;
    adapters[language::TYPESCRIPT] = make_unique<typescript_adapter>(config.for_language(language::TYPESCRIPT));
    adapters[language::GO] = make_unique<go_adapter>(config.for_language(language::GO));
    adapters[language::PHP] = make_unique<php_adapter>(config.for_language(language::PHP));
    return adapters;
}

string ascii_json(const nlohmann::json &value) {
    return value.dump(-1, ' ', true, nlohmann::json::error_handler_t::replace);
}

}  // namespace codejudge
