/* the session control sequence
 *
 * authenticate, open a session, take control of it, wait for the release
 * trigger, release control and close the session again; the terminal
 * state is logged around every control transition
 *
 * Copyright 2024 q66 <q66@chimera-linux.org>
 * License: BSD-2-Clause
 */

#include <cstdio>
#include <cstring>

#include <security/pam_appl.h>

#include "fallbackdm.hh"
#include "session.hh"

namespace {

/* once control is taken, releasing it is attempted on every way out */
class control_guard {
public:
    explicit control_guard(control_channel &chan): p_chan{chan} {}

    control_guard(control_guard const &) = delete;
    control_guard &operator=(control_guard const &) = delete;

    ~control_guard() {
        if (!p_held) {
            return;
        }
        print_warn("session: releasing control on the way out");
        if (p_chan.release_control() < 0) {
            print_err("session: failed to release control, left asserted");
        }
    }

    void arm() {
        p_held = true;
    }

    /* the caller releases explicitly, never twice */
    int release() {
        p_held = false;
        return p_chan.release_control();
    }

private:
    control_channel &p_chan;
    bool p_held = false;
};

void log_vt(session_backend &be) {
    vt_log(cdata->vt_device.data(), be.probe_vt());
}

bool set_hints(auth_session &auth) {
    char buf[32];
    if (!cdata->tty.empty()) {
        print_dbg("session: tty hint %s", cdata->tty.data());
        if (auth.set_tty(cdata->tty.data()) != PAM_SUCCESS) {
            return false;
        }
    }
    auto put = [&auth](char const *key, std::string const &value) {
        if (value.empty()) {
            return true;
        }
        print_dbg("session: %s=%s", key, value.data());
        return auth.set_env(key, value.data()) == PAM_SUCCESS;
    };
    if (cdata->vtnr) {
        std::snprintf(buf, sizeof(buf), "%lu", cdata->vtnr);
    } else {
        buf[0] = '\0';
    }
    return (
        put(ENV_SEAT, cdata->seat) &&
        put(ENV_VTNR, buf) &&
        put(ENV_SESSION_TYPE, cdata->session_type) &&
        put(ENV_SESSION_CLASS, cdata->session_class)
    );
}

void log_session(control_channel &chan) {
    if (!cdata->debug) {
        return;
    }
    std::string xml;
    if (chan.introspect(xml) == 0) {
        print_dbg("session: introspection data:\n%s", xml.data());
    }
    std::map<std::string, std::string> props;
    if (chan.describe(props) == 0) {
        for (auto &p: props) {
            print_dbg(
                "session: property %s = %s", p.first.data(), p.second.data()
            );
        }
    }
}

} /* namespace */

int session_run(session_backend &be) {
    log_vt(be);

    print_info("session: starting login session with PAM");
    auto auth = be.make_auth();
    if (!auth) {
        return RUN_ERR_AUTH;
    }
    if (auth->authenticate() != PAM_SUCCESS) {
        print_err("session: authentication failed");
        return RUN_ERR_AUTH;
    }
    if (!set_hints(*auth)) {
        print_err("session: failed to set session hints");
        return RUN_ERR_SESSION;
    }
    if (auth->open_session() != PAM_SUCCESS) {
        print_err("session: failed to open session");
        return RUN_ERR_SESSION;
    }
    auto sid = auth->get_env(ENV_SESSION_ID);
    if (!sid) {
        print_err("session: no " ENV_SESSION_ID " after opening session");
        return RUN_ERR_SESSION;
    }
    print_info("session: opened session %s", sid->data());

    print_info("session: connecting to logind");
    auto chan = be.make_control(*sid);
    if (!chan) {
        return RUN_ERR_CONTROL;
    }
    log_session(*chan);

    control_guard guard{*chan};

    print_info("session: taking control of session %s", sid->data());
    if (chan->take_control(false) < 0) {
        print_err("session: failed to take control");
        return RUN_ERR_CONTROL;
    }
    guard.arm();

    log_vt(be);

    auto trigger = be.make_trigger();
    if (!trigger) {
        return RUN_ERR_TRIGGER;
    }
    print_info("session: waiting for %s release trigger", trigger->name());
    if (!trigger->wait()) {
        print_err("session: %s release trigger failed", trigger->name());
        return RUN_ERR_TRIGGER;
    }

    print_info("session: releasing control");
    if (guard.release() < 0) {
        print_err("session: failed to release control");
        return RUN_ERR_CONTROL;
    }

    log_vt(be);

    /* the session is closed as auth goes out of scope */
    print_info("session: closing session %s", sid->data());
    return RUN_OK;
}
