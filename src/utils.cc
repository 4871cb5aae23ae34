/* shared non-portable utilities
 *
 * Copyright 2024 q66 <q66@chimera-linux.org>
 * License: BSD-2-Clause
 */

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <cerrno>

#include <fcntl.h>
#include <unistd.h>
#include <sys/ioctl.h>
#include <sys/sysmacros.h>
#include <linux/kd.h>

#include "fallbackdm.hh"
#include "utils.hh"

/* keyboard modes as returned by KDGKBMODE (see linux/kd.h) */
static struct {
    int mode;
    char const *name;
} const kbmodes[] = {
    {K_RAW, "K_RAW"},             /* raw scancodes */
    {K_XLATE, "K_XLATE"},         /* translated to ascii */
    {K_MEDIUMRAW, "K_MEDIUMRAW"}, /* raw keycodes */
    {K_UNICODE, "K_UNICODE"},     /* translated to utf-8 */
    {K_OFF, "K_OFF"},             /* the terminal takes no input at all */
};

char const *vt_mode_name(int mode) {
    for (auto &km: kbmodes) {
        if (km.mode == mode) {
            return km.name;
        }
    }
    return "unknown";
}

unsigned long get_pid_vtnr(pid_t pid) {
    unsigned long vtnr = 0;

#ifdef __linux__
    char buf[256];
    char tbuf[256];
    unsigned long cterm;
    std::snprintf(
        buf, sizeof(buf), "/proc/%lu/stat", static_cast<unsigned long>(pid)
    );
    FILE *f = std::fopen(buf, "rb");
    if (!f) {
        return 0;
    }
    if (!std::fgets(tbuf, sizeof(tbuf), f)) {
        fclose(f);
        return 0;
    }
    fclose(f);
    char *sp = std::strrchr(tbuf, ')');
    if (!sp) {
        return 0;
    }
    if (std::sscanf(sp + 2, "%*c %*d %*d %*d %lu", &cterm) != 1) {
        return 0;
    }
    if ((major(cterm) == 0) && (minor(cterm) == 0)) {
        return 0;
    }
    std::snprintf(
        buf, sizeof(buf), "/sys/dev/char/%d:%d", major(cterm), minor(cterm)
    );
    std::memset(tbuf, '\0', sizeof(tbuf));
    if (readlink(buf, tbuf, sizeof(tbuf) - 1) < 0) {
        return 0;
    }
    sp = strrchr(tbuf, '/');
    if (sp && !std::strncmp(sp + 1, "tty", 3)) {
        char *endp = nullptr;
        vtnr = std::strtoul(sp + 4, &endp, 10);
        if (endp && *endp) {
            vtnr = 0;
        }
    }
#else
#error Please add your implementation here
#endif

    return vtnr;
}

vt_status vt_probe(char const *dev) {
    vt_status st;
    int fd = open(dev, O_RDONLY | O_NOCTTY | O_CLOEXEC);
    if (fd < 0) {
        if (errno == ENOENT) {
            st.state = vt_state::absent;
        } else {
            st.state = vt_state::query_failed;
            st.error = errno;
        }
        return st;
    }
    int mode = 0;
    if (ioctl(fd, KDGKBMODE, &mode) < 0) {
        st.state = vt_state::query_failed;
        st.error = errno;
        close(fd);
        return st;
    }
    close(fd);
    st.mode = mode;
    st.state = (mode == K_OFF) ? vt_state::input_disabled : vt_state::input_active;
    return st;
}

void vt_log(char const *dev, vt_status const &st) {
    switch (st.state) {
        case vt_state::absent:
            print_info("vt: %s not present, no VT input to worry about", dev);
            break;
        case vt_state::query_failed:
            print_err(
                "vt: failed to query keyboard mode of %s (%s)",
                dev, strerror(st.error)
            );
            break;
        case vt_state::input_disabled:
            print_info("vt: %s keyboard mode is K_OFF, input is disabled", dev);
            break;
        case vt_state::input_active:
            print_warn(
                "vt: %s keyboard mode is %s (%d), VT may consume input",
                dev, vt_mode_name(st.mode), st.mode
            );
            break;
    }
}
