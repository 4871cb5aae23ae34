/* release triggers: when to hand the terminal back
 *
 * Copyright 2024 q66 <q66@chimera-linux.org>
 * License: BSD-2-Clause
 */

#ifndef RELEASE_HH
#define RELEASE_HH

#include <ctime>
#include <memory>
#include <string>
#include <utility>

#include <libinput.h>

#include "session.hh"

/* the input event classes we can tell apart; only keyboard matters */
enum class input_event_kind {
    keyboard,
    pointer,
    touch,
    tablet_tool,
    tablet_pad,
    gesture,
    switch_toggle,
    device_added,
    device_removed,
    other,
};

char const *input_event_name(input_event_kind kind);

/* a pollable queue of input events */
struct event_source {
    virtual ~event_source() = default;

    /* the descriptor to wait on for readiness */
    virtual int fd() const = 0;
    /* read whatever is pending on the descriptor into the queue */
    virtual bool dispatch() = 0;
    /* pop the next queued event, false once the queue is empty */
    virtual bool next(input_event_kind &kind) = 0;
};

/* fires once the duration has passed */
class timer_trigger: public release_trigger {
public:
    explicit timer_trigger(std::time_t secs): p_secs{secs} {}

    char const *name() const override {
        return "timer";
    }
    bool wait() override;

private:
    std::time_t p_secs;
};

/* fires on the first keyboard event of the source */
class input_trigger: public release_trigger {
public:
    explicit input_trigger(std::unique_ptr<event_source> src):
        p_src{std::move(src)}
    {}

    char const *name() const override {
        return "input";
    }
    bool wait() override;

private:
    std::unique_ptr<event_source> p_src;
};

/* maps a libinput event type onto the classes above */
input_event_kind libinput_event_classify(libinput_event_type type);

/* libinput on the given seat, through udev */
std::unique_ptr<event_source> libinput_source_open(char const *seat);

#endif
