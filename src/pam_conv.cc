/* PAM conversation bridge
 *
 * PAM calls us with a batch of messages and expects back one contiguous
 * response array sized to the whole batch; only the prompts get a string,
 * and on failure nothing may be handed back
 *
 * Copyright 2024 q66 <q66@chimera-linux.org>
 * License: BSD-2-Clause
 */

#include <cstdlib>
#include <cstring>
#include <new>

#include "fallbackdm.hh"
#include "pam_conv.hh"

namespace {

/* owns the response array until it is handed over to PAM */
class resp_buf {
public:
    explicit resp_buf(int n): p_num{n} {
        p_resp = static_cast<pam_response *>(
            std::calloc(std::size_t(n), sizeof(pam_response))
        );
    }

    resp_buf(resp_buf const &) = delete;
    resp_buf &operator=(resp_buf const &) = delete;

    ~resp_buf() {
        if (!p_resp) {
            return;
        }
        for (int i = 0; i < p_num; ++i) {
            if (p_resp[i].resp) {
                /* scrub whatever we were going to hand out */
                std::memset(p_resp[i].resp, 0, std::strlen(p_resp[i].resp));
                std::free(p_resp[i].resp);
            }
        }
        std::free(p_resp);
    }

    bool valid() const {
        return p_resp != nullptr;
    }

    bool set(int i, std::string const &str) {
        p_resp[i].resp = strdup(str.data());
        p_resp[i].resp_retcode = 0;
        return p_resp[i].resp != nullptr;
    }

    pam_response *release() {
        auto *ret = p_resp;
        p_resp = nullptr;
        return ret;
    }

private:
    pam_response *p_resp;
    int p_num;
};

} /* namespace */

static int conv_batch(
    conv_handler &handler, int num_msg, pam_message const **msg,
    pam_response **resp
) {
    resp_buf rbuf{num_msg};
    if (!rbuf.valid()) {
        return PAM_BUF_ERR;
    }

    std::string rstr;
    for (int i = 0; i < num_msg; ++i) {
        auto *m = msg[i];
        char const *text = m->msg ? m->msg : "";
        switch (m->msg_style) {
            case PAM_PROMPT_ECHO_ON:
                rstr.clear();
                if (!handler.prompt_echo(text, rstr)) {
                    return PAM_CONV_ERR;
                }
                if (!rbuf.set(i, rstr)) {
                    return PAM_BUF_ERR;
                }
                break;
            case PAM_PROMPT_ECHO_OFF:
                rstr.clear();
                if (!handler.prompt_blind(text, rstr)) {
                    return PAM_CONV_ERR;
                }
                if (!rbuf.set(i, rstr)) {
                    return PAM_BUF_ERR;
                }
                break;
            case PAM_TEXT_INFO:
                handler.info(text);
                break;
            case PAM_ERROR_MSG:
                handler.error(text);
                return PAM_CONV_ERR;
            default:
                print_err("pam: unknown message style %d", m->msg_style);
                return PAM_CONV_ERR;
        }
    }

    *resp = rbuf.release();
    return PAM_SUCCESS;
}

extern "C" int conv_dispatch(
    int num_msg, pam_message const **msg, pam_response **resp, void *appdata
) {
    if ((num_msg <= 0) || (num_msg > PAM_MAX_NUM_MSG) || !msg || !resp) {
        return PAM_CONV_ERR;
    }
    if (!appdata) {
        return PAM_CONV_ERR;
    }
    /* nothing may propagate into the C caller */
    try {
        return conv_batch(
            *static_cast<conv_handler *>(appdata), num_msg, msg, resp
        );
    } catch (std::bad_alloc const &) {
        return PAM_BUF_ERR;
    }
}

pam_conv conv_make(conv_handler &handler) {
    pam_conv ret;
    ret.conv = conv_dispatch;
    ret.appdata_ptr = &handler;
    return ret;
}

bool nopass_conv::prompt_echo(char const *msg, std::string &resp) {
    print_dbg("pam: prompt '%s', answering '%s'", msg, p_user.data());
    resp = p_user;
    return true;
}

bool nopass_conv::prompt_blind(char const *msg, std::string &resp) {
    print_dbg("pam: hidden prompt '%s'", msg);
    resp = nopass_secret;
    return true;
}

void nopass_conv::info(char const *msg) {
    print_dbg("pam: %s", msg);
}

void nopass_conv::error(char const *msg) {
    print_err("pam: %s", msg);
}
