/* the PAM side of the session
 *
 * Copyright 2024 q66 <q66@chimera-linux.org>
 * License: BSD-2-Clause
 */

#ifndef PAM_CLIENT_HH
#define PAM_CLIENT_HH

#include <memory>
#include <optional>
#include <string>

#include <security/pam_appl.h>

#include "pam_conv.hh"
#include "session.hh"

/* an authenticated PAM handle
 *
 * the handle is ended exactly once, in the destructor; if a session
 * was opened (and close_on_teardown is set), it is closed first
 */
class pam_client: public auth_session {
public:
    static std::unique_ptr<pam_client> create(
        char const *service, char const *user,
        std::unique_ptr<conv_handler> handler
    );

    pam_client(pam_client const &) = delete;
    pam_client &operator=(pam_client const &) = delete;

    ~pam_client() override;

    int authenticate() override;
    int open_session() override;
    int set_tty(char const *tty) override;
    int set_env(char const *key, char const *value) override;
    std::optional<std::string> get_env(char const *key) override;

    bool is_authenticated() const {
        return p_authed;
    }
    bool has_open_session() const {
        return p_opened;
    }
    int last_code() const {
        return p_last;
    }

    bool close_on_teardown = true;

private:
    pam_client(std::unique_ptr<conv_handler> handler):
        p_handler{std::move(handler)}
    {}

    std::unique_ptr<conv_handler> p_handler;
    pam_handle_t *p_pamh = nullptr;
    int p_last = PAM_SUCCESS;
    bool p_authed = false;
    bool p_opened = false;
};

#endif
