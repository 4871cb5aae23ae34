/* logind session control over the system bus
 *
 * Copyright 2024 q66 <q66@chimera-linux.org>
 * License: BSD-2-Clause
 */

#ifndef LOGIND_HH
#define LOGIND_HH

#include <cstdint>
#include <memory>
#include <string>
#include <utility>

#include <systemd/sd-bus.h>

#include "session.hh"

#define LOGIND_SERVICE "org.freedesktop.login1"
#define LOGIND_SESSION_PREFIX "/org/freedesktop/login1/session"
#define LOGIND_SESSION_IFACE "org.freedesktop.login1.Session"

/* the escaped object path of a session; 0 or a negative errno */
int logind_session_path(std::string const &sid, std::string &path);

/* every call on the channel gives up after this */
static constexpr std::uint64_t control_timeout_usec = 5000 * 1000;

class logind_channel: public control_channel {
public:
    static std::unique_ptr<logind_channel> open(std::string const &sid);

    ~logind_channel() override;

    logind_channel(logind_channel const &) = delete;
    logind_channel &operator=(logind_channel const &) = delete;

    int introspect(std::string &xml) override;
    int describe(std::map<std::string, std::string> &props) override;
    int take_control(bool force) override;
    int release_control() override;

    std::string const &path() const {
        return p_path;
    }

private:
    logind_channel(sd_bus *bus, std::string path):
        p_bus{bus}, p_path{std::move(path)}
    {}

    int call(
        char const *iface, char const *method, sd_bus_message **reply,
        char const *types, ...
    );

    sd_bus *p_bus;
    std::string p_path;
};

#endif
