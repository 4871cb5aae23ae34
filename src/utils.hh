/* shared non-portable utilities
 *
 * Copyright 2024 q66 <q66@chimera-linux.org>
 * License: BSD-2-Clause
 */

#ifndef UTILS_HH
#define UTILS_HH

#include <sys/types.h>

/* what the keyboard mode of a virtual terminal says about its input */
enum class vt_state {
    absent,
    query_failed,
    input_disabled,
    input_active,
};

struct vt_status {
    vt_state state = vt_state::absent;
    /* errno for query_failed */
    int error = 0;
    /* keyboard mode for input_disabled/input_active */
    int mode = -1;
};

unsigned long get_pid_vtnr(pid_t pid);

vt_status vt_probe(char const *dev);
void vt_log(char const *dev, vt_status const &st);
char const *vt_mode_name(int mode);

#endif
