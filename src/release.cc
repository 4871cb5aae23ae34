/* release triggers: when to hand the terminal back
 *
 * Copyright 2024 q66 <q66@chimera-linux.org>
 * License: BSD-2-Clause
 */

#include <cstring>
#include <cerrno>

#include <poll.h>

#include "fallbackdm.hh"
#include "release.hh"

char const *input_event_name(input_event_kind kind) {
    switch (kind) {
        case input_event_kind::keyboard:
            return "keyboard";
        case input_event_kind::pointer:
            return "pointer";
        case input_event_kind::touch:
            return "touch";
        case input_event_kind::tablet_tool:
            return "tablet tool";
        case input_event_kind::tablet_pad:
            return "tablet pad";
        case input_event_kind::gesture:
            return "gesture";
        case input_event_kind::switch_toggle:
            return "switch";
        case input_event_kind::device_added:
            return "device added";
        case input_event_kind::device_removed:
            return "device removed";
        case input_event_kind::other:
            return "other";
    }
    return "other";
}

bool timer_trigger::wait() {
    timespec ts{};
    ts.tv_sec = p_secs;
    print_dbg("release: sleep for %ld seconds", long(p_secs));
    while (nanosleep(&ts, &ts) < 0) {
        if (errno != EINTR) {
            print_err("release: nanosleep failed (%s)", strerror(errno));
            return false;
        }
    }
    return true;
}

bool input_trigger::wait() {
    pollfd pfd;
    pfd.fd = p_src->fd();
    pfd.events = POLLIN;
    pfd.revents = 0;
    for (;;) {
        /* sleep until the source has something for us */
        auto pret = poll(&pfd, 1, -1);
        if (pret < 0) {
            if (errno == EINTR) {
                continue;
            }
            print_err("release: poll failed (%s)", strerror(errno));
            return false;
        } else if (pret == 0) {
            continue;
        }
        if (!p_src->dispatch()) {
            print_err("release: dispatching input events failed");
            return false;
        }
        bool fired = false;
        input_event_kind kind;
        /* drain the whole queue, even past a keyboard event */
        while (p_src->next(kind)) {
            switch (kind) {
                case input_event_kind::keyboard:
                    print_dbg("release: got keyboard event");
                    fired = true;
                    break;
                case input_event_kind::pointer:
                case input_event_kind::touch:
                case input_event_kind::tablet_tool:
                case input_event_kind::tablet_pad:
                case input_event_kind::gesture:
                case input_event_kind::switch_toggle:
                case input_event_kind::device_added:
                case input_event_kind::device_removed:
                case input_event_kind::other:
                    print_dbg(
                        "release: ignoring %s event", input_event_name(kind)
                    );
                    break;
            }
        }
        if (fired) {
            return true;
        }
        /* nothing more will ever arrive, do not spin on it */
        if (pfd.revents & (POLLERR | POLLHUP | POLLNVAL)) {
            print_err(
                "release: input source failed (revents 0x%x)",
                unsigned(pfd.revents)
            );
            return false;
        }
    }
}
