#include "battle/problem.hpp"
#include <glog/logging.h>
#include <random>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/json_utils.hpp"

namespace arena::battle {
using namespace std;
using namespace nlohmann;

// clang-format off
static const char *BUILTIN_PROBLEMS = R"([
  {"id": "two-sum", "title": "Two Sum", "difficulty": "Easy", "entryPoint": "twoSum", "tests": [
    {"args": [[2,7,11,15], 9], "expected": [0,1]},
    {"args": [[3,2,4], 6], "expected": [1,2]},
    {"args": [[3,3], 6], "expected": [0,1], "hidden": true}]},
  {"id": "reverse-string", "title": "Reverse String", "difficulty": "Easy", "entryPoint": "reverseString", "tests": [
    {"args": [["h","e","l","l","o"]], "expected": ["o","l","l","e","h"]},
    {"args": [["H","a","n","n","a","h"]], "expected": ["h","a","n","n","a","H"]}]},
  {"id": "palindrome-number", "title": "Palindrome Number", "difficulty": "Easy", "entryPoint": "isPalindrome", "tests": [
    {"args": [121], "expected": true},
    {"args": [-121], "expected": false},
    {"args": [10], "expected": false, "hidden": true}]},
  {"id": "roman-to-integer", "title": "Roman to Integer", "difficulty": "Easy", "entryPoint": "romanToInt", "tests": [
    {"args": ["III"], "expected": 3},
    {"args": ["LVIII"], "expected": 58},
    {"args": ["MCMXC"], "expected": 1994, "hidden": true}]},
  {"id": "valid-parentheses", "title": "Valid Parentheses", "difficulty": "Easy", "entryPoint": "isValid", "tests": [
    {"args": ["()"], "expected": true},
    {"args": ["()[]{}"], "expected": true},
    {"args": ["(]"], "expected": false, "hidden": true}]},
  {"id": "product-except-self", "title": "Product of Array Except Self", "difficulty": "Medium", "entryPoint": "productExceptSelf", "tests": [
    {"args": [[1,2,3,4]], "expected": [24,12,8,6]},
    {"args": [[-1,1,0,-3,3]], "expected": [0,0,9,0,0]}]},
  {"id": "group-anagrams", "title": "Group Anagrams", "difficulty": "Medium", "entryPoint": "groupAnagrams", "tests": [
    {"args": [["eat","tea","tan","ate","nat","bat"]], "expected": [["bat"],["nat","tan"],["ate","eat","tea"]]},
    {"args": [[""]], "expected": [[""]]},
    {"args": [["a"]], "expected": [["a"]], "hidden": true}]},
  {"id": "top-k-frequent", "title": "Top K Frequent Elements", "difficulty": "Medium", "entryPoint": "topKFrequent", "tests": [
    {"args": [[1,1,1,2,2,3], 2], "expected": [1,2]},
    {"args": [[1], 1], "expected": [1]}]},
  {"id": "spiral-matrix", "title": "Spiral Matrix", "difficulty": "Medium", "entryPoint": "spiralOrder", "tests": [
    {"args": [[[1,2,3],[4,5,6],[7,8,9]]], "expected": [1,2,3,6,9,8,7,4,5]},
    {"args": [[[1,2,3,4],[5,6,7,8],[9,10,11,12]]], "expected": [1,2,3,4,8,12,11,10,9,5,6,7]}]},
  {"id": "longest-consecutive", "title": "Longest Consecutive Sequence", "difficulty": "Hard", "entryPoint": "longestConsecutive", "tests": [
    {"args": [[100,4,200,1,3,2]], "expected": 4},
    {"args": [[0,3,7,2,5,8,4,6,0,1]], "expected": 9}]},
  {"id": "merge-k-sorted", "title": "Merge k Sorted Lists", "difficulty": "Hard", "entryPoint": "mergeKLists", "tests": [
    {"args": [[[1,4,5],[1,3,4],[2,6]]], "expected": [1,1,2,3,4,4,5,6]},
    {"args": [[]], "expected": []},
    {"args": [[[]]], "expected": [], "hidden": true}]},
  {"id": "sliding-window-max", "title": "Sliding Window Maximum", "difficulty": "Hard", "entryPoint": "maxSlidingWindow", "tests": [
    {"args": [[1,3,-1,-3,5,3,6,7], 3], "expected": [3,3,5,5,6,7]},
    {"args": [[1], 1], "expected": [1]}]},
  {"id": "word-ladder", "title": "Word Ladder", "difficulty": "Hard", "entryPoint": "ladderLength", "tests": [
    {"args": ["hit", "cog", ["hot","dot","dog","lot","log","cog"]], "expected": 5},
    {"args": ["hit", "cog", ["hot","dot","dog","lot","log"]], "expected": 0}]}
])";
// clang-format on

void from_json(const json &j, test_case &tc) {
    j.at("args").get_to(tc.args);
    if (!tc.args.is_array())
        throw invalid_argument("test case args must be an array");
    tc.expected = access_optional(j, "expected");
    tc.hidden = get_value_def(j, false, "hidden");
}

void from_json(const json &j, problem &p) {
    j.at("id").get_to(p.id);
    j.at("title").get_to(p.title);
    p.difficulty = sanitize_difficulty(get_value_def<string>(j, "Easy", "difficulty"));
    j.at("entryPoint").get_to(p.entry_point);
    j.at("tests").get_to(p.tests);
}

string sanitize_difficulty(const string &difficulty) {
    if (difficulty == "Medium" || difficulty == "Hard") return difficulty;
    return "Easy";
}

problem_registry::problem_registry() {
    for (auto &p : json::parse(BUILTIN_PROBLEMS).get<vector<problem>>())
        add(p);
}

void problem_registry::load_file(const filesystem::path &path) {
    if (!filesystem::exists(path))
        BOOST_THROW_EXCEPTION(arena_exception("Unable to find problem set ") << path.string());
    json j = json::parse(read_file_content(path));
    auto loaded = j.get<vector<problem>>();
    for (auto &p : loaded) add(p);
    LOG(INFO) << "Loaded " << loaded.size() << " problems from " << path;
}

void problem_registry::add(const problem &p) {
    problems[p.id] = p;
}

const problem *problem_registry::find(const string &id) const {
    auto it = problems.find(id);
    return it == problems.end() ? nullptr : &it->second;
}

vector<const problem *> problem_registry::list(const string &difficulty) const {
    vector<const problem *> result;
    for (auto &[id, p] : problems)
        if (difficulty.empty() || p.difficulty == difficulty)
            result.push_back(&p);
    return result;
}

const problem *problem_registry::random(const string &difficulty) const {
    auto candidates = list(difficulty);
    if (candidates.empty()) return nullptr;
    static thread_local mt19937 rng(random_device{}());
    uniform_int_distribution<size_t> dist(0, candidates.size() - 1);
    return candidates[dist(rng)];
}

}  // namespace arena::battle
