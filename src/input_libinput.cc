/* libinput event source for the input release trigger
 *
 * Copyright 2024 q66 <q66@chimera-linux.org>
 * License: BSD-2-Clause
 */

#include <cstring>
#include <cerrno>

#include <fcntl.h>
#include <unistd.h>

#include <libinput.h>
#include <libudev.h>

#include "fallbackdm.hh"
#include "release.hh"

namespace {

int fd_open(char const *path, int flags, void *) {
    int fd = ::open(path, flags | O_CLOEXEC);
    if (fd < 0) {
        int err = errno;
        print_dbg("input: failed to open %s (%s)", path, strerror(err));
        return -err;
    }
    return fd;
}

void fd_close(int fd, void *) {
    ::close(fd);
}

libinput_interface const fd_ops = {fd_open, fd_close};

class libinput_source: public event_source {
public:
    libinput_source(udev *ud, libinput *li):
        p_udev{ud, udev_unref}, p_lib{li, libinput_unref}
    {}

    int fd() const override {
        return libinput_get_fd(p_lib.get());
    }

    bool dispatch() override {
        auto r = libinput_dispatch(p_lib.get());
        if (r < 0) {
            print_err("input: libinput_dispatch failed (%s)", strerror(-r));
            return false;
        }
        return true;
    }

    bool next(input_event_kind &kind) override {
        auto *ev = libinput_get_event(p_lib.get());
        if (!ev) {
            return false;
        }
        kind = libinput_event_classify(libinput_event_get_type(ev));
        libinput_event_destroy(ev);
        return true;
    }

private:
    std::unique_ptr<udev, udev *(*)(udev *)> p_udev;
    std::unique_ptr<libinput, libinput *(*)(libinput *)> p_lib;
};

} /* namespace */

input_event_kind libinput_event_classify(libinput_event_type type) {
    switch (type) {
        case LIBINPUT_EVENT_KEYBOARD_KEY:
            return input_event_kind::keyboard;
        case LIBINPUT_EVENT_POINTER_MOTION:
        case LIBINPUT_EVENT_POINTER_MOTION_ABSOLUTE:
        case LIBINPUT_EVENT_POINTER_BUTTON:
        case LIBINPUT_EVENT_POINTER_AXIS:
            return input_event_kind::pointer;
        case LIBINPUT_EVENT_TOUCH_DOWN:
        case LIBINPUT_EVENT_TOUCH_UP:
        case LIBINPUT_EVENT_TOUCH_MOTION:
        case LIBINPUT_EVENT_TOUCH_CANCEL:
        case LIBINPUT_EVENT_TOUCH_FRAME:
            return input_event_kind::touch;
        case LIBINPUT_EVENT_TABLET_TOOL_AXIS:
        case LIBINPUT_EVENT_TABLET_TOOL_PROXIMITY:
        case LIBINPUT_EVENT_TABLET_TOOL_TIP:
        case LIBINPUT_EVENT_TABLET_TOOL_BUTTON:
            return input_event_kind::tablet_tool;
        case LIBINPUT_EVENT_TABLET_PAD_BUTTON:
        case LIBINPUT_EVENT_TABLET_PAD_RING:
        case LIBINPUT_EVENT_TABLET_PAD_STRIP:
            return input_event_kind::tablet_pad;
        case LIBINPUT_EVENT_GESTURE_SWIPE_BEGIN:
        case LIBINPUT_EVENT_GESTURE_SWIPE_UPDATE:
        case LIBINPUT_EVENT_GESTURE_SWIPE_END:
        case LIBINPUT_EVENT_GESTURE_PINCH_BEGIN:
        case LIBINPUT_EVENT_GESTURE_PINCH_UPDATE:
        case LIBINPUT_EVENT_GESTURE_PINCH_END:
            return input_event_kind::gesture;
        case LIBINPUT_EVENT_SWITCH_TOGGLE:
            return input_event_kind::switch_toggle;
        case LIBINPUT_EVENT_DEVICE_ADDED:
            return input_event_kind::device_added;
        case LIBINPUT_EVENT_DEVICE_REMOVED:
            return input_event_kind::device_removed;
        default:
            /* newer event types this build does not know about */
            return input_event_kind::other;
    }
}

std::unique_ptr<event_source> libinput_source_open(char const *seat) {
    auto *ud = udev_new();
    if (!ud) {
        print_err("input: udev_new failed (%s)", strerror(errno));
        return nullptr;
    }
    auto *li = libinput_udev_create_context(&fd_ops, nullptr, ud);
    if (!li) {
        print_err("input: failed to create libinput context");
        udev_unref(ud);
        return nullptr;
    }
    /* the source owns both from here on */
    std::unique_ptr<event_source> ret{new libinput_source{ud, li}};
    if (libinput_udev_assign_seat(li, seat) < 0) {
        print_err("input: failed to assign seat %s", seat);
        return nullptr;
    }
    print_dbg("input: assigned seat %s", seat);
    return ret;
}
