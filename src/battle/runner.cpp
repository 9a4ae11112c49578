#include "battle/runner.hpp"
#include <boost/algorithm/string.hpp>
#include "common/exceptions.hpp"
#include "common/status.hpp"
#include "sandbox/language.hpp"

namespace arena::battle {
using namespace std;
using namespace nlohmann;

solution_runner::~solution_runner() = default;

in_process_runner::in_process_runner(const evaluator::python_evaluator &evaluator)
    : evaluator(evaluator) {}

json in_process_runner::call(const string &language, const string &code,
                             const string &entry_point, const json &args) {
    if (language != "python")
        BOOST_THROW_EXCEPTION(validation_error("Language " + language + " is not supported"));
    return evaluator.run(code, entry_point, args);
}

sandbox_runner::sandbox_runner(sandbox::sandbox &box)
    : box(box) {}

json sandbox_runner::call(const string &language, const string &code,
                          const string &entry_point, const json &args) {
    const sandbox::language *lang = sandbox::find_language(language);
    if (!lang || lang->harness.empty())
        BOOST_THROW_EXCEPTION(validation_error("Language " + language + " is not supported"));

    sandbox::execution_request request;
    request.language = language;
    request.code = code;
    request.input = args.dump();
    request.harness = sandbox::build_harness(*lang, entry_point);
    request.limits = box.default_limits();

    sandbox::execution_result result = box.execute(request);
    if (result.error == error_type::VALIDATION_ERROR)
        BOOST_THROW_EXCEPTION(validation_error(result.error_message));
    if (result.error == error_type::TIME_LIMIT_EXCEEDED)
        BOOST_THROW_EXCEPTION(evaluation_timeout(result.error_message));
    if (!result.success()) {
        string message = boost::algorithm::trim_copy(result.stderr_data);
        if (message.empty()) message = result.error_message;
        // 只保留最后一行，通常是异常信息
        auto pos = message.find_last_of('\n');
        if (pos != string::npos) message = message.substr(pos + 1);
        BOOST_THROW_EXCEPTION(evaluation_error(string(get_display_message(result.error)) + ": " + message));
    }

    vector<string> lines;
    boost::algorithm::split(lines, result.stdout_data, boost::is_any_of("\n"));
    for (auto it = lines.rbegin(); it != lines.rend(); ++it) {
        string line = boost::algorithm::trim_copy(*it);
        if (line.empty()) continue;
        json value = json::parse(line, nullptr, false);
        if (value.is_discarded()) break;
        return value;
    }
    BOOST_THROW_EXCEPTION(evaluation_error("Unable to read the result of " + entry_point));
}

}  // namespace arena::battle
