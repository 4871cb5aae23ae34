/* Copyright 2024 q66 <q66@chimera-linux.org>
 * License: BSD-2-Clause
 */

#include "utils.hh"

#include <cerrno>
#include <cstdlib>
#include <string>

#include <unistd.h>
#include <linux/kd.h>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

namespace
{
struct VtProbe : public ::testing::Test
{
    void SetUp() override
    {
        char tmpl[] = "/tmp/fallbackdm-vt-XXXXXX";
        int fd = ::mkstemp(tmpl);
        ASSERT_GE(fd, 0);
        ::close(fd);
        regular_file = tmpl;
    }

    void TearDown() override
    {
        if (!regular_file.empty())
            ::unlink(regular_file.c_str());
    }

    std::string regular_file;
};
}

TEST_F(VtProbe, missing_device_is_absent)
{
    auto st = vt_probe("/dev/fallbackdm-no-such-tty");

    EXPECT_EQ(st.state, vt_state::absent);
    EXPECT_EQ(st.error, 0);
}

TEST_F(VtProbe, non_terminal_reports_query_failure)
{
    auto st = vt_probe(regular_file.c_str());

    EXPECT_EQ(st.state, vt_state::query_failed);
    EXPECT_EQ(st.error, ENOTTY);
}

TEST_F(VtProbe, logging_any_state_is_harmless)
{
    vt_status st;
    for (auto s : {vt_state::absent, vt_state::query_failed,
                   vt_state::input_disabled, vt_state::input_active})
    {
        st.state = s;
        st.error = EACCES;
        st.mode = K_XLATE;
        vt_log("/dev/tty1", st);
    }
}

TEST(VtModeName, names_known_modes)
{
    EXPECT_STREQ(vt_mode_name(K_OFF), "K_OFF");
    EXPECT_STREQ(vt_mode_name(K_UNICODE), "K_UNICODE");
    EXPECT_STREQ(vt_mode_name(K_RAW), "K_RAW");
}

TEST(VtModeName, unknown_mode_has_a_placeholder_name)
{
    EXPECT_STREQ(vt_mode_name(0x7f), "unknown");
}

TEST(PidVtnr, nonexistent_process_has_no_terminal)
{
    EXPECT_EQ(get_pid_vtnr(pid_t(-1)), 0ul);
}
