/* Copyright 2024 q66 <q66@chimera-linux.org>
 * License: BSD-2-Clause
 */

#include "pam_conv.hh"

#include <cstdlib>
#include <cstring>
#include <vector>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

namespace
{
struct MockConv : conv_handler
{
    MOCK_METHOD(bool, prompt_echo, (char const *, std::string &), (override));
    MOCK_METHOD(bool, prompt_blind, (char const *, std::string &), (override));
    MOCK_METHOD(void, info, (char const *), (override));
    MOCK_METHOD(void, error, (char const *), (override));
};

struct PamConv : public ::testing::Test
{
    void add(int style, char const *text)
    {
        pam_message m;
        m.msg_style = style;
        m.msg = text;
        messages.push_back(m);
    }

    int converse()
    {
        ptrs.clear();
        for (auto &m : messages)
            ptrs.push_back(&m);
        return conv_dispatch(int(ptrs.size()), ptrs.data(), &resp, &handler);
    }

    void TearDown() override
    {
        if (!resp)
            return;
        for (std::size_t i = 0; i < messages.size(); ++i)
            std::free(resp[i].resp);
        std::free(resp);
    }

    ::testing::StrictMock<MockConv> handler;
    std::vector<pam_message> messages;
    std::vector<pam_message const*> ptrs;
    pam_response *resp = nullptr;
};

auto answer(char const *text)
{
    using namespace ::testing;
    return DoAll(SetArgReferee<1>(std::string{text}), Return(true));
}
}

TEST_F(PamConv, answers_prompts_in_order_and_leaves_other_slots_empty)
{
    using namespace ::testing;
    add(PAM_TEXT_INFO, "welcome");
    add(PAM_PROMPT_ECHO_ON, "login:");
    add(PAM_PROMPT_ECHO_OFF, "Password:");

    InSequence seq;
    EXPECT_CALL(handler, info(StrEq("welcome")));
    EXPECT_CALL(handler, prompt_echo(StrEq("login:"), _)).WillOnce(answer("root"));
    EXPECT_CALL(handler, prompt_blind(StrEq("Password:"), _)).WillOnce(answer("secret"));

    ASSERT_THAT(converse(), Eq(PAM_SUCCESS));
    ASSERT_THAT(resp, NotNull());

    EXPECT_THAT(resp[0].resp, IsNull());
    EXPECT_THAT(resp[1].resp, StrEq("root"));
    EXPECT_THAT(resp[2].resp, StrEq("secret"));
}

TEST_F(PamConv, produces_one_response_per_prompt)
{
    using namespace ::testing;
    add(PAM_PROMPT_ECHO_ON, "a");
    add(PAM_TEXT_INFO, "b");
    add(PAM_PROMPT_ECHO_ON, "c");
    add(PAM_TEXT_INFO, "d");
    add(PAM_PROMPT_ECHO_OFF, "e");

    EXPECT_CALL(handler, prompt_echo(_, _)).Times(2).WillRepeatedly(answer("x"));
    EXPECT_CALL(handler, prompt_blind(_, _)).WillOnce(answer("y"));
    EXPECT_CALL(handler, info(_)).Times(2);

    ASSERT_THAT(converse(), Eq(PAM_SUCCESS));

    int filled = 0;
    for (std::size_t i = 0; i < messages.size(); ++i)
    {
        if (resp[i].resp)
            ++filled;
    }
    EXPECT_THAT(filled, Eq(3));
}

TEST_F(PamConv, error_message_fails_batch_without_handing_out_responses)
{
    using namespace ::testing;
    add(PAM_PROMPT_ECHO_ON, "login:");
    add(PAM_PROMPT_ECHO_OFF, "Password:");
    add(PAM_ERROR_MSG, "nope");

    EXPECT_CALL(handler, prompt_echo(_, _)).WillOnce(answer("root"));
    EXPECT_CALL(handler, prompt_blind(_, _)).WillOnce(answer("secret"));
    EXPECT_CALL(handler, error(StrEq("nope")));

    EXPECT_THAT(converse(), Eq(PAM_CONV_ERR));
    EXPECT_THAT(resp, IsNull());
}

TEST_F(PamConv, error_message_stops_processing_the_batch)
{
    using namespace ::testing;
    add(PAM_ERROR_MSG, "nope");
    add(PAM_PROMPT_ECHO_ON, "login:");

    EXPECT_CALL(handler, error(_));
    EXPECT_CALL(handler, prompt_echo(_, _)).Times(0);

    EXPECT_THAT(converse(), Eq(PAM_CONV_ERR));
    EXPECT_THAT(resp, IsNull());
}

TEST_F(PamConv, failed_prompt_stops_processing_the_batch)
{
    using namespace ::testing;
    add(PAM_PROMPT_ECHO_ON, "login:");
    add(PAM_PROMPT_ECHO_OFF, "Password:");
    add(PAM_TEXT_INFO, "never seen");

    EXPECT_CALL(handler, prompt_echo(_, _)).WillOnce(answer("root"));
    EXPECT_CALL(handler, prompt_blind(_, _)).WillOnce(Return(false));
    EXPECT_CALL(handler, info(_)).Times(0);

    EXPECT_THAT(converse(), Eq(PAM_CONV_ERR));
    EXPECT_THAT(resp, IsNull());
}

TEST_F(PamConv, unknown_message_style_fails_batch)
{
    using namespace ::testing;
    add(0x7f, "binary");

    EXPECT_THAT(converse(), Eq(PAM_CONV_ERR));
    EXPECT_THAT(resp, IsNull());
}

TEST_F(PamConv, rejects_empty_batch)
{
    using namespace ::testing;
    EXPECT_THAT(conv_dispatch(0, nullptr, &resp, &handler), Eq(PAM_CONV_ERR));
    EXPECT_THAT(resp, IsNull());
}

TEST_F(PamConv, conv_record_points_at_handler)
{
    using namespace ::testing;
    auto cnv = conv_make(handler);

    EXPECT_THAT(cnv.appdata_ptr, Eq(static_cast<void*>(&handler)));

    add(PAM_PROMPT_ECHO_ON, "login:");
    ptrs.push_back(&messages[0]);
    EXPECT_CALL(handler, prompt_echo(_, _)).WillOnce(answer("root"));

    ASSERT_THAT(cnv.conv(1, ptrs.data(), &resp, cnv.appdata_ptr), Eq(PAM_SUCCESS));
    EXPECT_THAT(resp[0].resp, StrEq("root"));
}

TEST(NoPassConv, answers_login_name_and_placeholder)
{
    using namespace ::testing;
    nopass_conv conv{"operator"};
    std::string resp;

    EXPECT_TRUE(conv.prompt_echo("login:", resp));
    EXPECT_THAT(resp, Eq("operator"));

    EXPECT_TRUE(conv.prompt_blind("Password:", resp));
    EXPECT_THAT(resp, StrEq(nopass_secret));
}
