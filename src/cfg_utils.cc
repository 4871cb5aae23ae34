/* configuration file handling
 *
 * Copyright 2024 q66 <q66@chimera-linux.org>
 * License: BSD-2-Clause
 */

#include <cctype>
#include <cstring>
#include <cstdlib>
#include <climits>
#include <limits>
#include <utility>

#include "fallbackdm.hh"

/* global */
cfg_data *cdata = nullptr;

static void read_bool(char const *name, char const *value, bool &val) {
    if (!std::strcmp(value, "yes")) {
        val = true;
    } else if (!std::strcmp(value, "no")) {
        val = false;
    } else {
        syslog(
            LOG_WARNING,
            "Invalid configuration value '%s' for '%s' (expected yes/no)",
            value, name
        );
    }
}

static void read_str(char const *name, char const *value, std::string &val) {
    if (!std::strlen(value)) {
        syslog(
            LOG_WARNING,
            "Invalid config value for '%s' (must be non-empty)", name
        );
        return;
    }
    val = value;
}

static bool read_ulong(char const *name, char const *value, unsigned long &val) {
    char *endp = nullptr;
    auto v = std::strtoul(value, &endp, 10);
    if (*endp || (endp == value) || (v == ULONG_MAX)) {
        syslog(
            LOG_WARNING,
            "Invalid config value '%s' for '%s' (expected integer)",
            value, name
        );
        return false;
    }
    val = v;
    return true;
}

void cfg_read(char const *cfgpath) {
    char buf[1024];

    auto *f = std::fopen(cfgpath, "r");
    if (!f) {
        syslog(
            LOG_NOTICE, "No configuration file '%s', using defaults", cfgpath
        );
        return;
    }

    while (std::fgets(buf, sizeof(buf), f)) {
        auto slen = strlen(buf);
        /* ditch the rest of the line if needed */
        if (slen && (buf[slen - 1] != '\n')) {
            for (;;) {
                auto c = std::fgetc(f);
                if ((c == '\n') || (c == EOF)) {
                    break;
                }
            }
        }
        char *bufp = buf;
        /* drop trailing whitespace */
        while (slen && std::isspace((unsigned char)bufp[slen - 1])) {
            bufp[--slen] = '\0';
        }
        /* drop leading whitespace */
        while (std::isspace((unsigned char)*bufp)) {
            ++bufp;
        }
        /* comment or empty line */
        if (!*bufp || (*bufp == '#')) {
            continue;
        }
        /* find the assignment */
        char *ass = strchr(bufp, '=');
        /* invalid */
        if (!ass || (ass == bufp)) {
            syslog(LOG_WARNING, "Malformed configuration line: %s", bufp);
            continue;
        }
        *ass = '\0';
        /* find the name */
        char *preass = (ass - 1);
        while ((preass > bufp) && std::isspace((unsigned char)*preass)) {
            *preass-- = '\0';
        }
        /* empty name */
        if (!*bufp || std::isspace((unsigned char)*bufp)) {
            syslog(LOG_WARNING, "Invalid configuration line name: %s", bufp);
            continue;
        }
        /* find the value */
        while (std::isspace((unsigned char)*++ass)) {
            continue;
        }
        /* supported config lines */
        if (!std::strcmp(bufp, "debug")) {
            read_bool("debug", ass, cdata->debug);
        } else if (!std::strcmp(bufp, "debug_stderr")) {
            read_bool("debug_stderr", ass, cdata->debug_stderr);
        } else if (!std::strcmp(bufp, "close_session")) {
            read_bool("close_session", ass, cdata->close_session);
        } else if (!std::strcmp(bufp, "service")) {
            read_str("service", ass, cdata->service);
        } else if (!std::strcmp(bufp, "login_user")) {
            read_str("login_user", ass, cdata->login_user);
        } else if (!std::strcmp(bufp, "seat")) {
            read_str("seat", ass, cdata->seat);
        } else if (!std::strcmp(bufp, "tty")) {
            /* may be empty, in which case no hint is passed */
            cdata->tty = ass;
        } else if (!std::strcmp(bufp, "session_type")) {
            cdata->session_type = ass;
        } else if (!std::strcmp(bufp, "session_class")) {
            cdata->session_class = ass;
        } else if (!std::strcmp(bufp, "vt_device")) {
            std::string vp = ass;
            if (vp.empty() || (vp.front() != '/')) {
                syslog(
                    LOG_WARNING,
                    "Invalid config value for '%s' (%s)", bufp, vp.data()
                );
            } else {
                cdata->vt_device = std::move(vp);
            }
        } else if (!std::strcmp(bufp, "vtnr")) {
            read_ulong("vtnr", ass, cdata->vtnr);
        } else if (!std::strcmp(bufp, "release")) {
            if (!std::strcmp(ass, "input")) {
                cdata->release = release_mode::input;
            } else if (!std::strcmp(ass, "timer")) {
                cdata->release = release_mode::timer;
            } else {
                syslog(
                    LOG_WARNING,
                    "Invalid config value '%s' for '%s' (expected input/timer)",
                    ass, bufp
                );
            }
        } else if (!std::strcmp(bufp, "release_timeout")) {
            unsigned long tout;
            if (!read_ulong("release_timeout", ass, tout)) {
                continue;
            }
            /* must survive the conversion to a positive time_t */
            if (tout > (unsigned long)std::numeric_limits<time_t>::max()) {
                syslog(
                    LOG_WARNING,
                    "Invalid config value '%s' for '%s' (too large)",
                    ass, bufp
                );
                continue;
            }
            cdata->release_timeout = time_t(tout);
        } else {
            syslog(LOG_WARNING, "Unknown configuration key '%s'", bufp);
        }
    }

    std::fclose(f);
}

void cfg_apply_vt(unsigned long detected) {
    /* no explicit terminal, so use the one we were started on */
    if (!cdata->vtnr) {
        cdata->vtnr = detected;
    }
    if (cdata->tty.empty() && cdata->vtnr) {
        cdata->tty = "tty" + std::to_string(cdata->vtnr);
    }
}
