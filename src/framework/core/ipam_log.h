#ifndef _IPAM_LOG_H_
#define _IPAM_LOG_H_

#ifdef __cplusplus
extern "C" {
#endif

#include <stdarg.h>
#include <string.h>

enum ipam_log_level {
    IPAM_LOG_NONE = 0,
    IPAM_LOG_CRITICAL,
    IPAM_LOG_ERROR,
    IPAM_LOG_WARNING,
    IPAM_LOG_INFO,
    IPAM_LOG_DEBUG, /**< parse failures are reported here */
    IPAM_LOG_TRACE,
    IPAM_LOG_MAX,
};

/* Process-wide threshold; messages above it are dropped. Default INFO. */
enum ipam_log_level ipam_log_level_get(void);
void ipam_log_level_set(enum ipam_log_level level);

/**
 * Map a level number (1-6) or case insensitive level name to its level.
 *
 * @return
 *   the level, or IPAM_LOG_NONE if arg names none
 */
enum ipam_log_level parse_log_optarg(const char* arg);

const char* ipam_log_level_string(enum ipam_log_level level);

/**
 * Reduce a __PRETTY_FUNCTION__ string to the qualified function name,
 * e.g. "ipam::net::parse_cidr".  function must hold strlen(signature) + 1
 * chars.
 */
void ipam_log_function_name(const char* signature, char* function);

/**
 * Write a message to stderr if level is at or below the current threshold.
 * Arguments are not evaluated otherwise.  The message is tagged with the
 * name of the calling function.
 */
#define IPAM_LOG(level, format, ...)                                           \
    do {                                                                       \
        if (level <= ipam_log_level_get()) {                                   \
            char function_[strlen(__PRETTY_FUNCTION__) + 1];                   \
            ipam_log_function_name(__PRETTY_FUNCTION__, function_);            \
            ipam_log(level, function_, format, ##__VA_ARGS__);                 \
        }                                                                      \
    } while (0)

/**
 * Write one timestamped, tagged line to stderr, regardless of the current
 * threshold.
 *
 * @return
 *   0 on success, -1 on write error
 */
int ipam_log(enum ipam_log_level level, const char* tag, const char* format, ...)
    __attribute__((format(printf, 3, 4)));

#ifdef __cplusplus
}
#endif

#endif /* _IPAM_LOG_H_ */
