/* the session control sequence
 *
 * Copyright 2024 q66 <q66@chimera-linux.org>
 * License: BSD-2-Clause
 */

#ifndef SESSION_HH
#define SESSION_HH

#include <map>
#include <memory>
#include <optional>
#include <string>

#include "utils.hh"

/* session environment keys */
#define ENV_SESSION_ID "XDG_SESSION_ID"
#define ENV_SEAT "XDG_SEAT"
#define ENV_VTNR "XDG_VTNR"
#define ENV_SESSION_TYPE "XDG_SESSION_TYPE"
#define ENV_SESSION_CLASS "XDG_SESSION_CLASS"

/* authentication and session registration; calls return PAM codes */
struct auth_session {
    virtual ~auth_session() = default;

    virtual int authenticate() = 0;
    virtual int open_session() = 0;
    virtual int set_tty(char const *tty) = 0;
    virtual int set_env(char const *key, char const *value) = 0;
    virtual std::optional<std::string> get_env(char const *key) = 0;
};

/* control over a login session; calls return 0 or a negative errno */
struct control_channel {
    virtual ~control_channel() = default;

    virtual int introspect(std::string &xml) = 0;
    virtual int describe(std::map<std::string, std::string> &props) = 0;
    virtual int take_control(bool force) = 0;
    virtual int release_control() = 0;
};

/* blocks until the terminal should be given back; false if the wait
 * itself failed
 */
struct release_trigger {
    virtual ~release_trigger() = default;

    virtual char const *name() const = 0;
    virtual bool wait() = 0;
};

/* provides the collaborators for one run */
struct session_backend {
    virtual ~session_backend() = default;

    virtual std::unique_ptr<auth_session> make_auth() = 0;
    virtual std::unique_ptr<control_channel> make_control(
        std::string const &sid
    ) = 0;
    virtual std::unique_ptr<release_trigger> make_trigger() = 0;
    virtual vt_status probe_vt() = 0;
};

/* runs the whole sequence, returns the process exit status */
int session_run(session_backend &be);

#endif
