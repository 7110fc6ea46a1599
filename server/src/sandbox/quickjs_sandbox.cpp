#include "sluice/sandbox/script_sandbox.hpp"
#include <spdlog/spdlog.h>
#include <chrono>
#include <memory>

extern "C" {
#include "quickjs.h"
}

namespace sluice {

namespace {

using Clock = std::chrono::steady_clock;

// Per-call state reachable from the interrupt handler and the console functions
struct SandboxRun {
    Clock::time_point deadline;
    bool timed_out = false;

    std::vector<std::string> logs;
    std::vector<std::string> errors;

    bool settled = false;
    bool rejected = false;
    std::string rejection;
};

struct RuntimeDeleter {
    void operator()(JSRuntime* rt) const {
        if (rt) JS_FreeRuntime(rt);
    }
};
using RuntimePtr = std::unique_ptr<JSRuntime, RuntimeDeleter>;

struct ContextDeleter {
    void operator()(JSContext* ctx) const {
        if (ctx) JS_FreeContext(ctx);
    }
};
using ContextPtr = std::unique_ptr<JSContext, ContextDeleter>;

int interrupt_handler(JSRuntime*, void* opaque) {
    auto* run = static_cast<SandboxRun*>(opaque);
    if (Clock::now() >= run->deadline) {
        run->timed_out = true;
        return 1;
    }
    return 0;
}

std::string to_std_string(JSContext* ctx, JSValueConst value) {
    const char* str = JS_ToCString(ctx, value);
    if (!str) {
        JSValue ignored = JS_GetException(ctx);
        JS_FreeValue(ctx, ignored);
        return "[unprintable]";
    }
    std::string result(str);
    JS_FreeCString(ctx, str);
    return result;
}

// Strings print verbatim, everything else as JSON
std::string format_value(JSContext* ctx, JSValueConst value) {
    if (JS_IsString(value) || JS_IsUndefined(value) || JS_IsFunction(ctx, value)) {
        return to_std_string(ctx, value);
    }

    JSValue json = JS_JSONStringify(ctx, value, JS_UNDEFINED, JS_UNDEFINED);
    if (JS_IsException(json)) {
        JSValue ignored = JS_GetException(ctx);
        JS_FreeValue(ctx, ignored);
        return to_std_string(ctx, value);
    }
    std::string result = JS_IsUndefined(json) ? to_std_string(ctx, value) : to_std_string(ctx, json);
    JS_FreeValue(ctx, json);
    return result;
}

std::string format_arguments(JSContext* ctx, int argc, JSValueConst* argv) {
    std::string line;
    for (int i = 0; i < argc; ++i) {
        if (i > 0) line += ' ';
        line += format_value(ctx, argv[i]);
    }
    return line;
}

// Error objects report their message; thrown primitives their string form
std::string error_message(JSContext* ctx, JSValueConst error) {
    if (JS_IsObject(error)) {
        JSValue message = JS_GetPropertyStr(ctx, error, "message");
        if (!JS_IsException(message) && !JS_IsUndefined(message)) {
            std::string text = to_std_string(ctx, message);
            JS_FreeValue(ctx, message);
            return text;
        }
        JS_FreeValue(ctx, message);
    }
    return to_std_string(ctx, error);
}

JSValue js_console_log(JSContext* ctx, JSValueConst, int argc, JSValueConst* argv) {
    auto* run = static_cast<SandboxRun*>(JS_GetContextOpaque(ctx));
    run->logs.push_back(format_arguments(ctx, argc, argv));
    return JS_UNDEFINED;
}

JSValue js_console_error(JSContext* ctx, JSValueConst, int argc, JSValueConst* argv) {
    auto* run = static_cast<SandboxRun*>(JS_GetContextOpaque(ctx));
    run->errors.push_back(format_arguments(ctx, argc, argv));
    return JS_UNDEFINED;
}

// Called once by the wrapper when the script's promise settles
JSValue js_settle(JSContext* ctx, JSValueConst, int argc, JSValueConst* argv) {
    auto* run = static_cast<SandboxRun*>(JS_GetContextOpaque(ctx));
    if (run->settled) {
        return JS_UNDEFINED;
    }
    run->settled = true;
    run->rejected = argc > 0 && JS_ToBool(ctx, argv[0]) == 0;
    if (run->rejected && argc > 1) {
        run->rejection = error_message(ctx, argv[1]);
    }
    return JS_UNDEFINED;
}

void install_globals(JSContext* ctx, const ScriptEnvironment& environment) {
    JSValue global = JS_GetGlobalObject(ctx);

    JSValue console = JS_NewObject(ctx);
    JS_SetPropertyStr(ctx, console, "log", JS_NewCFunction(ctx, js_console_log, "log", 1));
    JS_SetPropertyStr(ctx, console, "error", JS_NewCFunction(ctx, js_console_error, "error", 1));
    JS_SetPropertyStr(ctx, global, "console", console);

    std::string db_config = script_db_config(environment).dump();
    JSValue config_value = JS_ParseJSON(ctx, db_config.c_str(), db_config.size(), "<DB_CONFIG>");
    if (JS_IsException(config_value)) {
        JSValue ignored = JS_GetException(ctx);
        JS_FreeValue(ctx, ignored);
        config_value = JS_NULL;
    }
    JS_SetPropertyStr(ctx, global, "DB_CONFIG", config_value);
    JS_SetPropertyStr(ctx, global, "DATABASE_NAME", JS_NewString(ctx, environment.database_name.c_str()));

    JS_SetPropertyStr(ctx, global, "__sluice_settle", JS_NewCFunction(ctx, js_settle, "__sluice_settle", 2));

    JS_FreeValue(ctx, global);
}

// Async wrapper: top-level await works and uncaught errors reach console.error first
std::string wrap_script(const std::string& script) {
    return "(async function () {\n"
           "try {\n" + script + "\n} catch (e) {\n"
           "  console.error(e && e.stack ? e.stack : String(e));\n"
           "  throw e;\n"
           "}\n"
           "})().then(function () { __sluice_settle(true); },"
           " function (e) { __sluice_settle(false, e); });\n";
}

bool is_out_of_memory(const std::string& message) {
    return message.find("out of memory") != std::string::npos;
}

std::string combine_output(const SandboxRun& run) {
    std::string output;
    for (size_t i = 0; i < run.logs.size(); ++i) {
        if (i > 0) output += '\n';
        output += run.logs[i];
    }
    if (!run.errors.empty()) {
        output += "\n\n--- STDERR ---\n";
        for (size_t i = 0; i < run.errors.size(); ++i) {
            if (i > 0) output += '\n';
            output += run.errors[i];
        }
    }
    return output;
}

} // anonymous namespace

nlohmann::json script_db_config(const ScriptEnvironment& environment) {
    if (environment.connections.empty()) {
        return nullptr;
    }
    if (environment.connections.size() == 1) {
        return environment.connections.front().to_json();
    }
    nlohmann::json all = nlohmann::json::array();
    for (const auto& connection : environment.connections) {
        all.push_back(connection.to_json());
    }
    return all;
}

ExecutionOutcome QuickJsSandbox::execute(const std::string& script, const ScriptEnvironment& environment) {
    auto start = Clock::now();
    SandboxRun run;
    run.deadline = start + std::chrono::milliseconds(config_.timeout_ms);

    std::string failure;
    bool out_of_memory = false;

    {
        // Context is declared after the runtime so it is freed first
        RuntimePtr rt(JS_NewRuntime());
        if (!rt) {
            spdlog::error("[Sandbox] Failed to create JS runtime");
            return ExecutionOutcome::failed(ErrorCategory::internal, "Failed to create script runtime");
        }
        JS_SetMemoryLimit(rt.get(), static_cast<size_t>(config_.max_memory_mb) * 1024 * 1024);
        JS_SetMaxStackSize(rt.get(), static_cast<size_t>(config_.max_stack_kb) * 1024);
        JS_SetInterruptHandler(rt.get(), interrupt_handler, &run);

        ContextPtr ctx(JS_NewContext(rt.get()));
        if (!ctx) {
            spdlog::error("[Sandbox] Failed to create JS context");
            return ExecutionOutcome::failed(ErrorCategory::resource_limit,
                "Script exceeded memory limit of " + std::to_string(config_.max_memory_mb) + " MB");
        }
        JS_SetContextOpaque(ctx.get(), &run);
        install_globals(ctx.get(), environment);

        std::string wrapped = wrap_script(script);
        JSValue result = JS_Eval(ctx.get(), wrapped.c_str(), wrapped.size(), "<script>", JS_EVAL_TYPE_GLOBAL);
        if (JS_IsException(result)) {
            JSValue exception = JS_GetException(ctx.get());
            failure = error_message(ctx.get(), exception);
            JS_FreeValue(ctx.get(), exception);
        }
        JS_FreeValue(ctx.get(), result);

        // Drain promise jobs; the interrupt handler bounds this loop as well
        while (failure.empty() && !run.settled && !run.timed_out) {
            JSContext* job_ctx = nullptr;
            int status = JS_ExecutePendingJob(rt.get(), &job_ctx);
            if (status == 0) {
                break;
            }
            if (status < 0) {
                JSValue exception = JS_GetException(job_ctx);
                failure = error_message(job_ctx, exception);
                JS_FreeValue(job_ctx, exception);
            }
        }

        if (failure.empty() && run.rejected) {
            failure = run.rejection;
        }
        if (failure.empty() && !run.settled && !run.timed_out) {
            failure = "Script finished with a promise that never settled";
        }
        out_of_memory = is_out_of_memory(failure);
    }

    auto duration_ms = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start).count();

    if (run.timed_out) {
        spdlog::warn("[Sandbox] Script timed out after {}ms", config_.timeout_ms);
        auto outcome = ExecutionOutcome::failed(ErrorCategory::timeout,
            "Script execution timed out after " + std::to_string(config_.timeout_ms) + "ms");
        outcome.output = combine_output(run);
        return outcome;
    }
    if (out_of_memory) {
        spdlog::warn("[Sandbox] Script exceeded memory limit of {} MB", config_.max_memory_mb);
        auto outcome = ExecutionOutcome::failed(ErrorCategory::resource_limit,
            "Script exceeded memory limit of " + std::to_string(config_.max_memory_mb) + " MB");
        outcome.output = combine_output(run);
        return outcome;
    }
    if (!failure.empty()) {
        spdlog::info("[Sandbox] Script failed after {}ms: {}", duration_ms, failure);
        auto outcome = ExecutionOutcome::failed(ErrorCategory::execution, "Script error: " + failure);
        outcome.output = combine_output(run);
        return outcome;
    }

    spdlog::info("[Sandbox] Script completed in {}ms ({} log lines)", duration_ms, run.logs.size());
    return ExecutionOutcome::succeeded(combine_output(run), static_cast<int64_t>(run.logs.size()));
}

} // namespace sluice
