#include "sandbox/validator.hpp"
#include <fmt/core.h>
#include <algorithm>
#include "common/io_utils.hpp"
#include "sandbox/language.hpp"

namespace arena::sandbox {
using namespace std;

validator::validator(size_t max_code_size)
    : max_code_size(max_code_size) {}

size_t validator::max_size() const {
    return max_code_size;
}

static bool is_forbidden_control(unsigned char c) {
    return c == 0 || (c < 0x20 && c != '\t' && c != '\n' && c != '\r') || c == 0x7f;
}

validation_result validator::validate(const string &code, const string &language) const {
    validation_result result;
    auto violate = [&result](const string &message) {
        result.ok = false;
        if (find(result.violations.begin(), result.violations.end(), message) == result.violations.end())
            result.violations.push_back(message);
    };

    const struct language *lang = find_language(language);
    if (!lang || lang->denylist.empty()) {
        violate(fmt::format("unsupported language: {}", language));
        return result;
    }

    if (code.empty())
        violate("code is empty");

    // 过长的代码不再做正则匹配
    if (code.size() > max_code_size) {
        violate(fmt::format("code exceeds {} bytes", max_code_size));
        return result;
    }

    for (unsigned char c : code) {
        if (is_forbidden_control(c)) {
            violate(c == 0 ? "code contains null bytes" : "code contains control characters");
            break;
        }
    }

    if (!utf8_check_is_valid(code))
        violate("code is not valid UTF-8");

    for (auto &entry : lang->denylist) {
        if (regex_search(code, entry.pattern))
            violate(entry.description);
    }
    return result;
}

}  // namespace arena::sandbox
