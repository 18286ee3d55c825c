#include "toolchain/language.hpp"
#include <glog/logging.h>
#include <algorithm>
#include <stdexcept>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/json_utils.hpp"

namespace arbiter {
using namespace std;
using namespace nlohmann;

const chrono::milliseconds MAX_ADJUSTED_TIME = chrono::hours(24);
const uint64_t MAX_ADJUSTED_MEMORY = 1ull << 40;  // 1T

static void replace_all(string &str, const string &from, const string &to) {
    for (size_t pos = str.find(from); pos != string::npos; pos = str.find(from, pos + to.size()))
        str.replace(pos, from.size(), to);
}

vector<string> expand_command(const vector<string> &command, const command_paths &paths) {
    vector<string> args;
    for (string arg : command) {
        replace_all(arg, "{source}", paths.source);
        replace_all(arg, "{artifact}", paths.artifact);
        replace_all(arg, "{workdir}", paths.workdir);
        args.push_back(move(arg));
    }
    return args;
}

bool language::compiled() const {
    return !compile_command.empty();
}

vector<string> language::compile_args(const string &workdir) const {
    return expand_command(compile_command, {source_name, artifact_name, workdir});
}

vector<string> language::run_args(const string &workdir) const {
    return expand_command(run_command, {source_name, artifact_name, workdir});
}

// 按倍数和偏移调整后饱和到 [0, ceiling]，不会溢出
static double saturate(double value, double ceiling) {
    if (!(value > 0)) return 0;
    return min(value, ceiling);
}

chrono::milliseconds language::adjust_time(chrono::milliseconds limit) const {
    double adjusted = static_cast<double>(limit.count()) * time_multiplier + static_cast<double>(time_offset.count());
    return chrono::milliseconds(static_cast<int64_t>(saturate(adjusted, static_cast<double>(MAX_ADJUSTED_TIME.count()))));
}

uint64_t language::adjust_memory(uint64_t limit) const {
    double adjusted = static_cast<double>(limit) * memory_multiplier + static_cast<double>(memory_offset);
    return static_cast<uint64_t>(saturate(adjusted, static_cast<double>(MAX_ADJUSTED_MEMORY)));
}

void apply_override(const json &j, language &lang) {
    if (!j.is_object()) throw invalid_argument("language override of " + lang.id + " must be an object");

    assign_optional(j, lang.source_name, "source");
    assign_optional(j, lang.artifact_name, "artifact");
    assign_optional(j, lang.compile_command, "compile");
    assign_optional(j, lang.run_command, "run");
    assign_optional(j, lang.env, "env");
    assign_optional(j, lang.compile_memory_limit, "compile_memory_limit");
    assign_optional(j, lang.time_multiplier, "time_multiplier");
    assign_optional(j, lang.memory_multiplier, "memory_multiplier");
    assign_optional(j, lang.memory_offset, "memory_offset");

    int64_t millis;
    if (j.contains("compile_time_limit")) {
        millis = get_value<int64_t>(j, "compile_time_limit");
        lang.compile_time_limit = chrono::milliseconds(millis);
    }
    if (j.contains("time_offset")) {
        millis = get_value<int64_t>(j, "time_offset");
        lang.time_offset = chrono::milliseconds(millis);
    }
}

static void verify(const language &lang) {
    if (lang.run_command.empty())
        throw invalid_argument("language " + lang.id + " has no run command");
    assert_safe_path(lang.source_name);
    if (lang.compiled()) assert_safe_path(lang.artifact_name);
    if (lang.compile_time_limit.count() <= 0)
        throw invalid_argument("language " + lang.id + " has a non-positive compile time limit");
    if (lang.time_multiplier <= 0 || lang.memory_multiplier <= 0)
        throw invalid_argument("language " + lang.id + " has a non-positive limit multiplier");
}

language_registry::language_registry(map<string, language> languages)
    : languages(move(languages)) {
    for (auto &[id, lang] : this->languages) {
        if (lang.id != id) throw invalid_argument("language entry " + id + " is registered as " + lang.id);
        verify(lang);
    }
}

map<string, language> language_registry::builtin_languages() {
    const vector<string> env = {"PATH=/usr/local/bin:/usr/bin:/bin"};
    map<string, language> table;

    {
        language c;
        c.id = "c";
        c.source_name = "main.c";
        c.artifact_name = "main";
        c.compile_command = {"/usr/bin/gcc", "-O2", "-std=c11", "-DONLINE_JUDGE", "-o", "{artifact}", "{source}", "-lm"};
        c.run_command = {"{workdir}/{artifact}"};
        c.env = env;
        table.emplace(c.id, c);
    }

    {
        language cpp;
        cpp.id = "cpp";
        cpp.source_name = "main.cpp";
        cpp.artifact_name = "main";
        cpp.compile_command = {"/usr/bin/g++", "-O2", "-std=c++17", "-DONLINE_JUDGE", "-o", "{artifact}", "{source}", "-lm"};
        cpp.run_command = {"{workdir}/{artifact}"};
        cpp.env = env;
        table.emplace(cpp.id, cpp);
    }

    {
        language python;
        python.id = "python3";
        python.source_name = "main.py";
        python.run_command = {"/usr/bin/python3", "{source}"};
        python.env = env;
        python.memory_offset = 32ull << 20;  // 解释器本身
        table.emplace(python.id, python);
    }

    {
        language java;
        java.id = "java";
        java.source_name = "Main.java";
        java.artifact_name = "Main.jar";
        // 内部类会生成多个 class 文件，打包成一个 jar 以便作为单个文件缓存
        java.compile_command = {"/bin/sh", "-c", "javac -encoding UTF-8 -d . {source} && jar -cf {artifact} *.class"};
        java.run_command = {"/usr/bin/java", "-Xss64m", "-cp", "{artifact}", "Main"};
        java.env = env;
        java.time_multiplier = 2;
        java.memory_offset = 256ull << 20;  // JVM 堆外内存与 JIT
        table.emplace(java.id, java);
    }

    {
        language javascript;
        javascript.id = "javascript";
        javascript.source_name = "main.js";
        javascript.run_command = {"/usr/bin/node", "{source}"};
        javascript.env = env;
        javascript.memory_offset = 64ull << 20;  // V8 运行时
        table.emplace(javascript.id, javascript);
    }

    return table;
}

language_registry language_registry::builtin() {
    return language_registry(builtin_languages());
}

language_registry language_registry::load(const json &overrides) {
    auto table = builtin_languages();
    if (overrides.is_null()) return language_registry(move(table));
    if (!overrides.is_object()) throw invalid_argument("language overrides must be an object keyed by language id");

    for (auto &[id, value] : overrides.items()) {
        auto it = table.find(id);
        if (it == table.end()) {
            LOG(INFO) << "Registering language " << id << " from configuration";
            language lang;
            lang.id = id;
            apply_override(value, lang);
            table.emplace(id, move(lang));
        } else {
            LOG(INFO) << "Overriding toolchain of language " << id;
            apply_override(value, it->second);
        }
    }
    return language_registry(move(table));
}

const language &language_registry::find(const string &id) const {
    auto it = languages.find(id);
    if (it == languages.end()) throw client_error("unknown language " + id);
    return it->second;
}

bool language_registry::contains(const string &id) const {
    return languages.count(id) > 0;
}

vector<string> language_registry::ids() const {
    vector<string> result;
    for (auto &[id, lang] : languages) result.push_back(id);
    return result;
}

}  // namespace arbiter
