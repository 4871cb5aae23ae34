/* PAM conversation bridge
 *
 * Copyright 2024 q66 <q66@chimera-linux.org>
 * License: BSD-2-Clause
 */

#ifndef PAM_CONV_HH
#define PAM_CONV_HH

#include <string>
#include <utility>

#include <security/pam_appl.h>

/* answers the messages of a single conversation batch
 *
 * the prompts return false to fail the whole batch; info and error
 * messages have no response (an error message always fails the batch)
 */
struct conv_handler {
    virtual ~conv_handler() = default;

    virtual bool prompt_echo(char const *msg, std::string &resp) = 0;
    virtual bool prompt_blind(char const *msg, std::string &resp) = 0;
    virtual void info(char const *msg) = 0;
    virtual void error(char const *msg) = 0;
};

/* the passwordless handler; the login name goes to visible prompts and
 * a placeholder to hidden ones, the PAM stack is expected to not ask for
 * anything real (e.g. pam_rootok)
 */
class nopass_conv: public conv_handler {
public:
    explicit nopass_conv(std::string user): p_user{std::move(user)} {}

    bool prompt_echo(char const *msg, std::string &resp) override;
    bool prompt_blind(char const *msg, std::string &resp) override;
    void info(char const *msg) override;
    void error(char const *msg) override;

private:
    std::string p_user;
};

/* the placeholder secret given to hidden prompts */
inline constexpr char const nopass_secret[] = "no password";

/* the conversation function handed to PAM; appdata is a conv_handler */
extern "C" int conv_dispatch(
    int num_msg, pam_message const **msg, pam_response **resp, void *appdata
);

pam_conv conv_make(conv_handler &handler);

#endif
