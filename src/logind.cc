/* logind session control over the system bus
 *
 * the session object is addressed by the escaped session id; each call
 * is a blocking method call bounded by control_timeout_usec, nothing is
 * ever retried
 *
 * Copyright 2024 q66 <q66@chimera-linux.org>
 * License: BSD-2-Clause
 */

#include <cstdarg>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <cerrno>
#include <cinttypes>

#include "fallbackdm.hh"
#include "logind.hh"

int logind_session_path(std::string const &sid, std::string &path) {
    char *ep = nullptr;
    int r = sd_bus_path_encode(LOGIND_SESSION_PREFIX, sid.data(), &ep);
    if (r < 0) {
        return r;
    }
    path = ep;
    std::free(ep);
    return 0;
}

std::unique_ptr<logind_channel> logind_channel::open(std::string const &sid) {
    std::string spath;
    int r = logind_session_path(sid, spath);
    if (r < 0) {
        print_err(
            "bus: failed to build path for session %s (%s)",
            sid.data(), strerror(-r)
        );
        return nullptr;
    }

    sd_bus *bus = nullptr;
    r = sd_bus_open_system(&bus);
    if (r < 0) {
        print_err("bus: failed to connect to system bus (%s)", strerror(-r));
        return nullptr;
    }
    print_dbg("bus: connected, session object %s", spath.data());
    return std::unique_ptr<logind_channel>{
        new logind_channel{bus, std::move(spath)}
    };
}

logind_channel::~logind_channel() {
    sd_bus_flush_close_unref(p_bus);
}

int logind_channel::call(
    char const *iface, char const *method, sd_bus_message **reply,
    char const *types, ...
) {
    sd_bus_message *m = nullptr;
    sd_bus_error err = SD_BUS_ERROR_NULL;
    int r = sd_bus_message_new_method_call(
        p_bus, &m, LOGIND_SERVICE, p_path.data(), iface, method
    );
    if (r < 0) {
        print_err("bus: failed to create %s call (%s)", method, strerror(-r));
        return r;
    }
    if (types) {
        va_list ap;
        va_start(ap, types);
        r = sd_bus_message_appendv(m, types, ap);
        va_end(ap);
        if (r < 0) {
            print_err(
                "bus: failed to append %s arguments (%s)", method, strerror(-r)
            );
            sd_bus_message_unref(m);
            return r;
        }
    }
    print_dbg("bus: call %s.%s on %s", iface, method, p_path.data());
    r = sd_bus_call(p_bus, m, control_timeout_usec, &err, reply);
    sd_bus_message_unref(m);
    if (r < 0) {
        if (r == -ETIMEDOUT) {
            print_err(
                "bus: %s timed out after %" PRIu64 " ms",
                method, control_timeout_usec / 1000
            );
        } else {
            print_err(
                "bus: %s failed: %s (%s)", method,
                err.name ? err.name : "unknown",
                err.message ? err.message : strerror(-r)
            );
        }
        sd_bus_error_free(&err);
        return r;
    }
    sd_bus_error_free(&err);
    return 0;
}

int logind_channel::introspect(std::string &xml) {
    sd_bus_message *reply = nullptr;
    int r = call(
        "org.freedesktop.DBus.Introspectable", "Introspect", &reply, nullptr
    );
    if (r < 0) {
        return r;
    }
    char const *data = nullptr;
    r = sd_bus_message_read(reply, "s", &data);
    if (r >= 0) {
        xml = data;
        r = 0;
    } else {
        print_err("bus: bad Introspect reply (%s)", strerror(-r));
    }
    sd_bus_message_unref(reply);
    return r;
}

/* renders the variant the message currently points at */
static int read_variant(
    sd_bus_message *m, char const *contents, std::string &out
) {
    char buf[64];
    int r = sd_bus_message_enter_container(m, 'v', contents);
    if (r < 0) {
        return r;
    }
    if (!contents[0] || contents[1]) {
        /* not a basic type, just say what it is */
        r = sd_bus_message_skip(m, contents);
        if (r < 0) {
            return r;
        }
        out = "<";
        out += contents;
        out += ">";
        return sd_bus_message_exit_container(m);
    }
    union {
        char const *s;
        int b;
        std::uint8_t y;
        std::int16_t n;
        std::uint16_t q;
        std::int32_t i;
        std::uint32_t u;
        std::int64_t x;
        std::uint64_t t;
        double d;
    } v;
    r = sd_bus_message_read_basic(m, contents[0], &v);
    if (r < 0) {
        return r;
    }
    switch (contents[0]) {
        case 's':
        case 'o':
        case 'g':
            out = v.s;
            break;
        case 'b':
            out = v.b ? "yes" : "no";
            break;
        case 'y':
            std::snprintf(buf, sizeof(buf), "%u", unsigned(v.y));
            out = buf;
            break;
        case 'n':
            std::snprintf(buf, sizeof(buf), "%d", int(v.n));
            out = buf;
            break;
        case 'q':
            std::snprintf(buf, sizeof(buf), "%u", unsigned(v.q));
            out = buf;
            break;
        case 'i':
        case 'h':
            std::snprintf(buf, sizeof(buf), "%" PRId32, v.i);
            out = buf;
            break;
        case 'u':
            std::snprintf(buf, sizeof(buf), "%" PRIu32, v.u);
            out = buf;
            break;
        case 'x':
            std::snprintf(buf, sizeof(buf), "%" PRId64, v.x);
            out = buf;
            break;
        case 't':
            std::snprintf(buf, sizeof(buf), "%" PRIu64, v.t);
            out = buf;
            break;
        case 'd':
            std::snprintf(buf, sizeof(buf), "%g", v.d);
            out = buf;
            break;
        default:
            out = "<?>";
            break;
    }
    return sd_bus_message_exit_container(m);
}

int logind_channel::describe(std::map<std::string, std::string> &props) {
    sd_bus_message *reply = nullptr;
    int r = call(
        "org.freedesktop.DBus.Properties", "GetAll", &reply, "s",
        LOGIND_SESSION_IFACE
    );
    if (r < 0) {
        return r;
    }
    r = sd_bus_message_enter_container(reply, 'a', "{sv}");
    if (r < 0) {
        goto bad_reply;
    }
    for (;;) {
        r = sd_bus_message_enter_container(reply, 'e', "sv");
        if (r < 0) {
            goto bad_reply;
        } else if (r == 0) {
            break;
        }
        char const *name = nullptr;
        char const *contents = nullptr;
        char vtype;
        std::string value;
        r = sd_bus_message_read(reply, "s", &name);
        if (r < 0) {
            goto bad_reply;
        }
        r = sd_bus_message_peek_type(reply, &vtype, &contents);
        if (r < 0) {
            goto bad_reply;
        }
        r = read_variant(reply, contents, value);
        if (r < 0) {
            goto bad_reply;
        }
        props[name] = std::move(value);
        r = sd_bus_message_exit_container(reply);
        if (r < 0) {
            goto bad_reply;
        }
    }
    r = sd_bus_message_exit_container(reply);
    if (r < 0) {
        goto bad_reply;
    }
    sd_bus_message_unref(reply);
    return 0;

bad_reply:
    print_err("bus: bad GetAll reply (%s)", strerror(-r));
    sd_bus_message_unref(reply);
    return r;
}

int logind_channel::take_control(bool force) {
    /* 'b' takes an int through varargs */
    return call(
        LOGIND_SESSION_IFACE, "TakeControl", nullptr, "b", int(force)
    );
}

int logind_channel::release_control() {
    return call(LOGIND_SESSION_IFACE, "ReleaseControl", nullptr, nullptr);
}
