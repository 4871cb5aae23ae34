/* fallbackdm: a minimal session controller that takes a virtual
 *             terminal over from the console while the real display
 *             manager is unavailable, and hands it back afterwards
 *
 * Copyright 2024 q66 <q66@chimera-linux.org>
 * License: BSD-2-Clause
 */

#include <cstdlib>
#include <cstring>
#include <new>

#include <unistd.h>

#include "fallbackdm.hh"
#include "logind.hh"
#include "pam_client.hh"
#include "release.hh"
#include "session.hh"
#include "utils.hh"

#ifndef CONF_PATH
#error "No CONF_PATH is defined"
#endif

#define DEFAULT_CFG_PATH CONF_PATH "/fallbackdm.conf"

namespace {

/* the real collaborators: PAM, logind and libinput */
struct system_backend: session_backend {
    std::unique_ptr<auth_session> make_auth() override {
        auto cl = pam_client::create(
            cdata->service.data(), nullptr,
            std::make_unique<nopass_conv>(cdata->login_user)
        );
        if (cl) {
            cl->close_on_teardown = cdata->close_session;
        }
        return cl;
    }

    std::unique_ptr<control_channel> make_control(
        std::string const &sid
    ) override {
        return logind_channel::open(sid);
    }

    std::unique_ptr<release_trigger> make_trigger() override {
        if (cdata->release == release_mode::timer) {
            return std::make_unique<timer_trigger>(cdata->release_timeout);
        }
        auto src = libinput_source_open(cdata->seat.data());
        if (!src) {
            return nullptr;
        }
        return std::make_unique<input_trigger>(std::move(src));
    }

    vt_status probe_vt() override {
        return vt_probe(cdata->vt_device.data());
    }
};

} /* namespace */

int main(int argc, char **argv) {
    openlog("fallbackdm", LOG_CONS | LOG_NDELAY, LOG_DAEMON);

    syslog(LOG_INFO, "Initializing fallbackdm...");

    /* initialize configuration structure */
    cfg_data cdata_val;
    cdata = &cdata_val;

    try {
        if (argc >= 2) {
            cfg_read(argv[1]);
        } else {
            cfg_read(DEFAULT_CFG_PATH);
        }
        /* only look up our own terminal when none was configured */
        cfg_apply_vt(cdata->vtnr ? 0 : get_pid_vtnr(getpid()));
    } catch (std::bad_alloc const &) {
        print_err("fallbackdm: out of memory reading configuration");
        return RUN_ERR_STARTUP;
    }

    if (geteuid() != 0) {
        print_err("fallbackdm: must be run as root");
        return RUN_ERR_STARTUP;
    }

    if (cdata->vtnr) {
        print_dbg(
            "fallbackdm: vt %lu, tty '%s'", cdata->vtnr, cdata->tty.data()
        );
    }

    if (cdata->release == release_mode::timer) {
        print_info(
            "fallbackdm: control is released after %ld seconds",
            long(cdata->release_timeout)
        );
    } else {
        print_info("fallbackdm: control is released on the next key press");
    }

    int ret;
    try {
        system_backend be;
        ret = session_run(be);
    } catch (std::bad_alloc const &) {
        print_err("fallbackdm: out of memory");
        return RUN_ERR_STARTUP;
    }

    if (ret == RUN_OK) {
        print_info("fallbackdm: shutdown complete");
    } else {
        print_err("fallbackdm: exiting with status %d", ret);
    }
    return ret;
}
