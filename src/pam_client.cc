/* the PAM side of the session
 *
 * Copyright 2024 q66 <q66@chimera-linux.org>
 * License: BSD-2-Clause
 */

#include <cstring>

#include "fallbackdm.hh"
#include "pam_client.hh"

std::unique_ptr<pam_client> pam_client::create(
    char const *service, char const *user,
    std::unique_ptr<conv_handler> handler
) {
    std::unique_ptr<pam_client> ret{new pam_client{std::move(handler)}};
    /* PAM keeps its own copy of the record, the handler lives in us */
    auto cnv = conv_make(*ret->p_handler);
    auto pst = pam_start(service, user, &cnv, &ret->p_pamh);
    if (pst != PAM_SUCCESS) {
        print_err("pam: pam_start: %s", pam_strerror(ret->p_pamh, pst));
        if (ret->p_pamh) {
            pam_end(ret->p_pamh, pst);
            ret->p_pamh = nullptr;
        }
        return nullptr;
    }
    print_dbg("pam: started service '%s'", service);
    return ret;
}

pam_client::~pam_client() {
    if (!p_pamh) {
        return;
    }
    if (p_opened && close_on_teardown) {
        print_dbg("pam: close session");
        p_last = pam_close_session(p_pamh, 0);
        if (p_last != PAM_SUCCESS) {
            print_err(
                "pam: pam_close_session: %s", pam_strerror(p_pamh, p_last)
            );
        }
        p_opened = false;
    }
    print_dbg("pam: end");
    pam_end(p_pamh, p_last);
    p_pamh = nullptr;
}

int pam_client::authenticate() {
    p_last = pam_authenticate(p_pamh, 0);
    if (p_last != PAM_SUCCESS) {
        print_err("pam: pam_authenticate: %s", pam_strerror(p_pamh, p_last));
        return p_last;
    }
    p_authed = true;
    return PAM_SUCCESS;
}

int pam_client::open_session() {
    if (!p_authed) {
        print_err("pam: refusing to open session without authentication");
        return PAM_PERM_DENIED;
    }
    p_last = pam_open_session(p_pamh, 0);
    if (p_last != PAM_SUCCESS) {
        print_err("pam: pam_open_session: %s", pam_strerror(p_pamh, p_last));
        return p_last;
    }
    p_opened = true;
    return PAM_SUCCESS;
}

int pam_client::set_tty(char const *tty) {
    auto pst = pam_set_item(p_pamh, PAM_TTY, tty);
    if (pst != PAM_SUCCESS) {
        print_err("pam: could not set PAM_TTY: %s", pam_strerror(p_pamh, pst));
    }
    return pst;
}

int pam_client::set_env(char const *key, char const *value) {
    std::string env = key;
    env.push_back('=');
    env += value;
    auto pst = pam_putenv(p_pamh, env.data());
    if (pst != PAM_SUCCESS) {
        print_err(
            "pam: could not set %s: %s", key, pam_strerror(p_pamh, pst)
        );
    }
    return pst;
}

std::optional<std::string> pam_client::get_env(char const *key) {
    auto *v = pam_getenv(p_pamh, key);
    if (!v || !*v) {
        return std::nullopt;
    }
    return std::string{v};
}
