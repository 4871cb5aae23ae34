/* test runner; the library logs through the global configuration
 *
 * Copyright 2024 q66 <q66@chimera-linux.org>
 * License: BSD-2-Clause
 */

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "fallbackdm.hh"

int main(int argc, char **argv) {
    ::testing::InitGoogleMock(&argc, argv);

    cfg_data cdata_val;
    cdata = &cdata_val;

    return RUN_ALL_TESTS();
}
