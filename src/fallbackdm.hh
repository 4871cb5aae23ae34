/* shared fallbackdm header
 *
 * Copyright 2024 q66 <q66@chimera-linux.org>
 * License: BSD-2-Clause
 */

#ifndef FALLBACKDM_HH
#define FALLBACKDM_HH

#include <cstdio>
#include <ctime>
#include <string>

#include <syslog.h>

/* how the session gives the terminal back */
enum class release_mode {
    input,
    timer,
};

/* process exit codes, one per failing stage */
enum run_status {
    RUN_OK = 0,
    RUN_ERR_STARTUP = 1,
    RUN_ERR_AUTH = 2,
    RUN_ERR_SESSION = 3,
    RUN_ERR_CONTROL = 4,
    RUN_ERR_TRIGGER = 5,
};

struct cfg_data {
    time_t release_timeout = 120;
    unsigned long vtnr = 0;
    bool debug = false;
    bool debug_stderr = false;
    bool close_session = true;
    release_mode release = release_mode::input;
    std::string service = "fallbackdm";
    std::string login_user = "root";
    std::string tty{};
    std::string seat = "seat0";
    std::string session_type{};
    std::string session_class{};
    std::string vt_device = "/dev/tty1";
};

extern cfg_data *cdata;

/* config file related utilities */
void cfg_read(char const *cfgpath);
/* fills unset vtnr/tty from the terminal we run on (0 if none) */
void cfg_apply_vt(unsigned long detected);

/* these are macros for a simple reason; making them functions will trigger
 * format-security warnings (even though it's technically always safe for
 * us, there is no way to bypass that portably) and making it a C-style
 * vararg function is not possible (because vsyslog is not standard)
 *
 * in a macro we just pass things through, so it's completely safe
 */

#define print_dbg(...) \
    if (cdata->debug) { \
        if (cdata->debug_stderr) { \
            fprintf(stderr, __VA_ARGS__); \
            fputc('\n', stderr); \
        } \
        syslog(LOG_DEBUG, __VA_ARGS__); \
    }

#define print_info(...) \
    if (cdata->debug_stderr) { \
        fprintf(stderr, __VA_ARGS__); \
        fputc('\n', stderr); \
    } \
    syslog(LOG_INFO, __VA_ARGS__);

#define print_warn(...) \
    if (cdata->debug_stderr) { \
        fprintf(stderr, __VA_ARGS__); \
        fputc('\n', stderr); \
    } \
    syslog(LOG_WARNING, __VA_ARGS__);

#define print_err(...) \
    if (cdata->debug_stderr) { \
        fprintf(stderr, __VA_ARGS__); \
        fputc('\n', stderr); \
    } \
    syslog(LOG_ERR, __VA_ARGS__);

#endif
