#pragma once

#include "ports/output/IMailer.hpp"
#include "settings/MailerSettings.hpp"
#include "settings/WebAuthSettings.hpp"
#include <memory>
#include <sstream>
#include <string>

namespace webauth::application {

/**
 * @brief Тексты транзакционного письма
 */
struct EmailTexts {
    std::string heroText;
    std::string introText;
    std::string buttonText;
    std::string disclaimerText;
};

/**
 * @brief Письма со ссылкой на действие (активация, сброс пароля)
 *
 * Рендерит простой текстовый шаблон и отправляет через IMailer.
 */
class TransactionalEmailSender {
public:
    TransactionalEmailSender(
        std::shared_ptr<ports::output::IMailer> mailer,
        std::shared_ptr<settings::MailerSettings> mailerSettings,
        std::shared_ptr<settings::WebAuthSettings> authSettings
    ) : mailer_(std::move(mailer))
      , mailerSettings_(std::move(mailerSettings))
      , appName_(authSettings->getAppName())
    {}

    bool sendActivation(
        const std::string& email,
        const std::string& displayName,
        const std::string& activationCode
    ) {
        return send(email, displayName, actionUrl("activate-account", activationCode), {
            "Welcome to " + appName_ + "!",
            "You're almost there! Just follow the link below to activate your account.",
            "Activate My Account",
            "You received this email because your email address was used to register on "
                + appName_ + ". If this wasn't you, you can safely ignore this email."
        });
    }

    bool sendPasswordReset(
        const std::string& email,
        const std::string& displayName,
        const std::string& resetCode
    ) {
        return send(email, displayName, actionUrl("reset-password", resetCode), {
            "Reset your password",
            "Follow the link below to choose a new password.",
            "Reset My Password",
            "You received this email because a password reset was requested for your account on "
                + appName_ + ". If you did not request this, you can safely ignore this email."
        });
    }

    bool send(
        const std::string& email,
        const std::string& displayName,
        const std::string& url,
        const EmailTexts& texts
    ) {
        std::ostringstream body;
        body << texts.heroText << "\n\n"
             << "Hello " << displayName << ",\n\n"
             << texts.introText << "\n\n"
             << texts.buttonText << ": " << url << "\n\n"
             << "--\n"
             << texts.disclaimerText << "\n";

        return mailer_->send({email, texts.heroText, body.str()});
    }

private:
    std::shared_ptr<ports::output::IMailer> mailer_;
    std::shared_ptr<settings::MailerSettings> mailerSettings_;
    std::string appName_;

    std::string actionUrl(const std::string& page, const std::string& code) const {
        auto base = mailerSettings_->getBaseUrl();
        if (!base.empty() && base.back() == '/') {
            base.pop_back();
        }
        return base + "/" + page + "/" + code;
    }
};

} // namespace webauth::application
