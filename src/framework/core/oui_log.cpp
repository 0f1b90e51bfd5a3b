#include <atomic>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <string>
#include <string_view>
#include <vector>

#include <strings.h>

#include "core/oui_log.h"

namespace oui::log {

static std::atomic<int> log_level{OUI_LOG_WARNING};

static constexpr std::string_view log_level_names[] = {
    "none", "critical", "error", "warning", "info", "debug", "trace"};

static constexpr std::string_view long_level_option = "--core.log.level";
static constexpr std::string_view short_level_option = "-l";

static std::string_view to_string(enum oui_log_level level)
{
    if (level <= OUI_LOG_NONE || level >= OUI_LOG_MAX) { return ("unknown"); }
    return (log_level_names[level]);
}

/* ISO-8601 UTC timestamp with millisecond resolution */
static std::string timestamp()
{
    struct timespec now;
    clock_gettime(CLOCK_REALTIME, &now);

    struct tm utc;
    gmtime_r(&now.tv_sec, &utc);

    char buffer[32];
    auto len = strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%S", &utc);
    snprintf(buffer + len,
             sizeof(buffer) - len,
             ".%03ldZ",
             static_cast<long>(now.tv_nsec / 1000000));
    return (std::string(buffer));
}

static std::string format_message(const char* format, va_list argp)
{
    va_list copy;
    va_copy(copy, argp);
    auto length = vsnprintf(nullptr, 0, format, copy);
    va_end(copy);
    if (length < 0) { return (std::string()); }

    auto buffer = std::vector<char>(length + 1);
    vsnprintf(buffer.data(), buffer.size(), format, argp);

    /* Most callers end their messages with a newline; we add our own. */
    auto message = std::string(buffer.data(), length);
    while (!message.empty() && message.back() == '\n') { message.pop_back(); }
    return (message);
}

/*
 * Find the position of the '(' that opens the argument list of the
 * function in the signature.  Trailing template parameter descriptions
 * ("[T = int]") and cv-qualifiers are skipped.
 */
static size_t find_argument_list(std::string_view signature)
{
    auto end = signature.size();
    if (end && signature[end - 1] == ']') {
        int depth = 0;
        while (end--) {
            if (signature[end] == ']') {
                depth++;
            } else if (signature[end] == '[' && --depth == 0) {
                break;
            }
        }
    }

    auto cursor = signature.rfind(')', end == 0 ? 0 : end - 1);
    if (cursor == std::string_view::npos) { return (signature.size()); }

    int depth = 0;
    do {
        if (signature[cursor] == ')') {
            depth++;
        } else if (signature[cursor] == '(' && --depth == 0) {
            return (cursor);
        }
    } while (cursor--);

    return (signature.size());
}

} // namespace oui::log

using namespace oui::log;

extern "C" {

enum oui_log_level oui_log_level_get(void)
{
    return (static_cast<enum oui_log_level>(
        log_level.load(std::memory_order_relaxed)));
}

void oui_log_level_set(enum oui_log_level level)
{
    log_level.store(level, std::memory_order_relaxed);
}

enum oui_log_level parse_log_optarg(const char* arg)
{
    if (arg == nullptr || *arg == '\0'
        || strlen(arg) > OUI_LOG_MAX_LEVEL_LENGTH) {
        return (OUI_LOG_NONE);
    }

    char* end = nullptr;
    auto value = strtol(arg, &end, 10);
    if (*end == '\0') {
        return (value > OUI_LOG_NONE && value < OUI_LOG_MAX
                    ? static_cast<enum oui_log_level>(value)
                    : OUI_LOG_NONE);
    }

    for (int level = OUI_LOG_CRITICAL; level < OUI_LOG_MAX; level++) {
        if (strcasecmp(arg, log_level_names[level].data()) == 0) {
            return (static_cast<enum oui_log_level>(level));
        }
    }

    return (OUI_LOG_NONE);
}

enum oui_log_level oui_log_level_find(int argc, char* const argv[])
{
    for (int idx = 0; idx < argc - 1; idx++) {
        if (long_level_option == argv[idx] || short_level_option == argv[idx]) {
            return (parse_log_optarg(argv[idx + 1]));
        }
    }

    return (OUI_LOG_NONE);
}

void oui_log_function_name(const char* signature, char* function)
{
    auto sig = std::string_view(signature);
    auto name_end = find_argument_list(sig);

    /* Walk backwards to the first space outside of template brackets */
    auto name_start = name_end;
    int depth = 0;
    while (name_start > 0) {
        auto c = sig[name_start - 1];
        if (c == '>') {
            depth++;
        } else if (c == '<') {
            depth--;
        } else if (c == ' ' && depth == 0) {
            break;
        }
        name_start--;
    }

    /* Return and pointer/reference decorations belong to the type */
    while (name_start < name_end
           && (sig[name_start] == '*' || sig[name_start] == '&')) {
        name_start++;
    }

    auto length = name_end - name_start;
    memcpy(function, signature + name_start, length);
    function[length] = '\0';
}

int oui_vlog(enum oui_log_level level,
             const char* tag,
             const char* format,
             va_list argp)
{
    if (level <= OUI_LOG_NONE || level >= OUI_LOG_MAX) { return (-EINVAL); }

    auto message = format_message(format, argp);
    auto now = timestamp();
    auto name = to_string(level);

    /* A single call keeps concurrent messages from interleaving */
    auto error = fprintf(stderr,
                         "[%s] %.*s %s: %s\n",
                         now.c_str(),
                         static_cast<int>(name.size()),
                         name.data(),
                         tag ? tag : "",
                         message.c_str());

    return (error < 0 ? -EIO : 0);
}

int oui_log(enum oui_log_level level, const char* tag, const char* format, ...)
{
    va_list argp;
    va_start(argp, format);
    auto error = oui_vlog(level, tag, format, argp);
    va_end(argp);
    return (error);
}
}
