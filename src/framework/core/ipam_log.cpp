#include <atomic>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <string_view>

#include <strings.h>

#include "core/ipam_log.h"

static std::atomic<ipam_log_level> log_level{IPAM_LOG_INFO};

static constexpr std::string_view operator_token = "operator";

/* Indexed by enum ipam_log_level */
static const char* const level_names[] = {
    "none", "critical", "error", "warning", "info", "debug", "trace"};

static_assert(sizeof(level_names) / sizeof(level_names[0]) == IPAM_LOG_MAX);

extern "C" {

enum ipam_log_level ipam_log_level_get(void)
{
    return (log_level.load(std::memory_order_relaxed));
}

void ipam_log_level_set(enum ipam_log_level level)
{
    log_level.store(level, std::memory_order_relaxed);
}

const char* ipam_log_level_string(enum ipam_log_level level)
{
    if (level < IPAM_LOG_NONE || level >= IPAM_LOG_MAX) { return ("unknown"); }
    return (level_names[level]);
}

enum ipam_log_level parse_log_optarg(const char* arg)
{
    if (arg == nullptr || *arg == '\0') { return (IPAM_LOG_NONE); }

    char* end = nullptr;
    auto value = std::strtol(arg, &end, 10);
    if (*end == '\0') {
        return (value > IPAM_LOG_NONE && value < IPAM_LOG_MAX
                    ? static_cast<ipam_log_level>(value)
                    : IPAM_LOG_NONE);
    }

    for (int level = IPAM_LOG_CRITICAL; level < IPAM_LOG_MAX; level++) {
        if (strcasecmp(arg, level_names[level]) == 0) {
            return (static_cast<ipam_log_level>(level));
        }
    }

    return (IPAM_LOG_NONE);
}

static bool is_identifier_char(char c)
{
    return (isalnum(static_cast<unsigned char>(c)) || c == '_');
}

/*
 * If cursor starts an operator function name, return the position just
 * past the operator symbol or, for a conversion operator, past the space
 * before the target type.  Otherwise return cursor.
 */
static const char* skip_operator_token(const char* signature,
                                       const char* cursor)
{
    if (cursor != signature && is_identifier_char(cursor[-1])) {
        return (cursor);
    }
    if (strncmp(cursor, operator_token.data(), operator_token.size()) != 0) {
        return (cursor);
    }

    const char* next = cursor + operator_token.size();
    if (is_identifier_char(*next)) { return (cursor); }

    if (strncmp(next, "()", 2) == 0) { return (next + 2); }
    while (*next != '\0' && strchr(" <>=!+-*/%^&|~[],", *next)) { next++; }
    return (next);
}

void ipam_log_function_name(const char* signature, char* function)
{
    /*
     * The name starts after the last space outside of any template
     * brackets and ends at the first '(' outside of them.  Anything
     * after that is the argument list or a [with T = ...] clause.
     * Operator symbols are part of the name and never nest.
     */
    const char* start = signature;
    const char* end = nullptr;
    int depth = 0;

    const char* cursor = signature;
    while (*cursor != '\0' && !end) {
        if (depth == 0) {
            if (auto next = skip_operator_token(signature, cursor);
                next != cursor) {
                cursor = next;
                continue;
            }
        }

        switch (*cursor) {
        case '<':
            depth++;
            break;
        case '>':
            depth--;
            break;
        case ' ':
            if (depth == 0) { start = cursor + 1; }
            break;
        case '(':
            if (depth == 0) { end = cursor; }
            break;
        default:
            break;
        }
        cursor++;
    }

    if (!end) { end = signature + strlen(signature); }

    auto length = static_cast<size_t>(end - start);
    memcpy(function, start, length);
    function[length] = '\0';
}

static int write_log(enum ipam_log_level level,
                     const char* tag,
                     const char* format,
                     va_list argp)
{
    auto now = std::chrono::system_clock::now();
    auto usecs = std::chrono::duration_cast<std::chrono::microseconds>(
                     now.time_since_epoch())
                 % std::chrono::seconds(1);
    auto secs = std::chrono::system_clock::to_time_t(now);

    struct tm tm;
    gmtime_r(&secs, &tm);
    char timestamp[32];
    strftime(timestamp, sizeof(timestamp), "%Y-%m-%dT%H:%M:%S", &tm);

    flockfile(stderr);
    int error = fprintf(stderr,
                        "%s.%06ldZ [%s] %s: ",
                        timestamp,
                        static_cast<long>(usecs.count()),
                        ipam_log_level_string(level),
                        tag ? tag : "");
    if (error >= 0) { error = vfprintf(stderr, format, argp); }
    funlockfile(stderr);

    return (error < 0 ? -1 : 0);
}

int ipam_log(enum ipam_log_level level, const char* tag, const char* format, ...)
{
    va_list argp;
    va_start(argp, format);
    int error = write_log(level, tag, format, argp);
    va_end(argp);

    return (error);
}
}
